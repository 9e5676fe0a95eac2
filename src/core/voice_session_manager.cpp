#include "core/voice_session_manager.hpp"
#include "dialogue/quote_tools.hpp"
#include "tts/speech_synthesis_streamer.hpp"
#include "utils/error_handler.hpp"
#include "utils/logging.hpp"

namespace printvoice {
namespace core {

VoiceSessionManager::VoiceSessionManager(const utils::Config& config, Collaborators collaborators)
    : settings_(config.session),
      scheduler_(std::make_unique<TimerScheduler>()),
      taskQueue_(std::make_shared<TaskQueue>()),
      threadPool_(std::make_unique<ThreadPool>(config.server.workerThreads)),
      supervisor_(std::make_unique<SessionTimeoutSupervisor>(*scheduler_, settings_.idleTimeout)),
      tools_(std::make_shared<dialogue::ToolRegistry>()),
      shutdown_(false) {
    if (!collaborators.transcriber || !collaborators.languageModel ||
        !collaborators.synthesizer || !collaborators.business) {
        throw utils::ConfigurationException("Voice session manager is missing a collaborator");
    }

    dialogue::registerQuoteTools(*tools_, collaborators.business);
    orchestrator_ = std::make_shared<dialogue::DialogueOrchestrator>(collaborators.languageModel, tools_);

    pipeline_ = std::make_unique<VoicePipeline>(
        collaborators.transcriber,
        orchestrator_,
        std::make_shared<tts::SpeechSynthesisStreamer>(collaborators.synthesizer),
        taskQueue_,
        *scheduler_,
        *supervisor_,
        settings_.processingTimeout);

    supervisor_->setExpiryCallback([this](const std::string& sessionId) {
        cleanupSession(sessionId, "idle timeout");
    });

    threadPool_->start(taskQueue_);
    utils::Logger::info("Voice session manager ready with " + std::to_string(tools_->size()) + " tools");
}

VoiceSessionManager::~VoiceSessionManager() {
    shutdown();
}

std::shared_ptr<VoiceSession> VoiceSessionManager::openSession(const std::string& sessionId,
                                                               std::shared_ptr<SessionTransport> transport) {
    if (shutdown_) {
        transport->close(1001, "Server shutting down");
        return nullptr;
    }

    auto session = std::make_shared<VoiceSession>(sessionId, std::move(transport), settings_);
    if (!store_.add(session)) {
        throw utils::WebSocketException("Duplicate session id", sessionId);
    }
    utils::Logger::info("Client connected: " + sessionId + " (active sessions: " +
                        std::to_string(store_.size()) + ")");

    supervisor_->arm(session);

    if (!session->send(ConnectedMessage())) {
        utils::Logger::error("Error sending welcome message to " + sessionId);
        cleanupSession(sessionId, "welcome not delivered");
        return nullptr;
    }
    return session;
}

std::shared_ptr<VoiceSession> VoiceSessionManager::findSession(const std::string& sessionId) const {
    return store_.find(sessionId);
}

void VoiceSessionManager::handleFrame(const std::string& sessionId, std::string_view frame) {
    auto session = store_.find(sessionId);
    if (!session) {
        utils::Logger::warn("Frame for unknown session: " + sessionId);
        return;
    }

    utils::ErrorContext context("message_handling", sessionId);
    try {
        supervisor_->arm(session);

        FrameClassification classification = MessageProtocol::classifyFrame(frame);
        switch (classification.kind) {
            case FrameKind::AUDIO:
                session->acceptAudio(frame);
                break;

            case FrameKind::INVALID:
                utils::Logger::warn("Invalid control message format from " + sessionId + ": " +
                                    classification.reason);
                session->sendError(kInvalidMessageFormat);
                break;

            case FrameKind::CONTROL:
                handleControl(session, classification.controlType);
                break;
        }
    } catch (const std::exception& e) {
        utils::ErrorHandler::getInstance().reportError(e, "message_handling", sessionId);
        if (!session->sendError(e.what())) {
            utils::Logger::error("Error sending error message to " + sessionId);
        }
    }
}

void VoiceSessionManager::handleControl(const std::shared_ptr<VoiceSession>& session, MessageType type) {
    switch (type) {
        case MessageType::START_RECORDING:
            if (session->isProcessing()) {
                session->sendError(kCannotStartWhileProcessing);
                return;
            }
            session->getAudioBuffer().clear();
            session->send(RecordingStartedMessage());
            break;

        case MessageType::STOP_RECORDING:
            // A busy session is turned away by runTurn itself
            if (!session->isProcessing() && session->getAudioBuffer().empty()) {
                session->sendError(VoicePipeline::kNoAudioRecorded);
                return;
            }
            pipeline_->runTurn(session);
            break;

        case MessageType::RESET:
            pipeline_->abandonTurn(*session);
            session->reset();
            session->send(ResetCompleteMessage());
            break;

        default:
            throw utils::ProtocolException("Unsupported control message",
                                           MessageProtocol::messageTypeToString(type));
    }
}

void VoiceSessionManager::closeSession(const std::string& sessionId) {
    utils::Logger::info("Client disconnected: " + sessionId);
    cleanupSession(sessionId, "client disconnected");
}

void VoiceSessionManager::handleTransportError(const std::string& sessionId, const std::string& what) {
    utils::ErrorHandler::getInstance().reportError(utils::WebSocketException(what, sessionId));

    auto session = store_.find(sessionId);
    if (!session) {
        return;
    }
    if (!session->sendError("Internal error")) {
        utils::Logger::debug("Error notice not delivered to " + sessionId);
    }
    session->close(1011, "Internal error");
    cleanupSession(sessionId, "transport error");
}

bool VoiceSessionManager::cleanupSession(const std::string& sessionId, const std::string& reason) {
    auto session = store_.remove(sessionId);
    if (!session) {
        return false;
    }

    supervisor_->disarm(*session);
    pipeline_->abandonTurn(*session);
    session->release();

    utils::Logger::info("Session cleaned up (" + reason + "): " + sessionId + ", remaining sessions: " +
                        std::to_string(store_.size()));
    return true;
}

void VoiceSessionManager::shutdown() {
    bool expected = false;
    if (!shutdown_.compare_exchange_strong(expected, true)) {
        return;
    }

    utils::Logger::info("Shutting down voice session manager");
    for (const auto& session : store_.clear()) {
        supervisor_->disarm(*session);
        pipeline_->abandonTurn(*session);
        session->close(1001, "Server shutting down");
        session->release();
    }

    threadPool_->stop();
    scheduler_->stop();
}

} // namespace core
} // namespace printvoice
