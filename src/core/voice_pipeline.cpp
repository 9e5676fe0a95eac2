#include "core/voice_pipeline.hpp"
#include "utils/error_handler.hpp"
#include "utils/logging.hpp"

namespace printvoice {
namespace core {

namespace {

bool isBlank(const std::string& text) {
    return text.find_first_not_of(" \t\r\n") == std::string::npos;
}

TurnState::Emitter emitterFor(const std::shared_ptr<VoiceSession>& session) {
    return [session](const Message& message) { return session->send(message); };
}

} // namespace

VoicePipeline::VoicePipeline(std::shared_ptr<stt::TranscriptionClient> transcriber,
                             std::shared_ptr<dialogue::DialogueOrchestrator> dialogue,
                             std::shared_ptr<tts::SpeechSynthesisStreamer> streamer,
                             std::shared_ptr<TaskQueue> taskQueue,
                             TimerScheduler& scheduler,
                             SessionTimeoutSupervisor& supervisor,
                             std::chrono::milliseconds processingTimeout)
    : transcriber_(std::move(transcriber)),
      dialogue_(std::move(dialogue)),
      streamer_(std::move(streamer)),
      taskQueue_(std::move(taskQueue)),
      scheduler_(scheduler),
      supervisor_(supervisor),
      processingTimeout_(processingTimeout) {
}

VoicePipeline::StartResult VoicePipeline::runTurn(const std::shared_ptr<VoiceSession>& session) {
    if (!session->tryBeginProcessing()) {
        utils::Logger::warn("Already processing, ignoring duplicate request (session " +
                            session->getSessionId() + ")");
        if (!session->sendError(kAlreadyProcessing)) {
            utils::Logger::debug("Busy notice not delivered to " + session->getSessionId());
        }
        return StartResult::ALREADY_PROCESSING;
    }

    auto turn = std::make_shared<TurnState>(++nextTurnId_);
    session->setActiveTurn(turn);
    auto emit = emitterFor(session);

    if (!turn->emitIfActive(emit, ProcessingStartedMessage())) {
        utils::Logger::error("Could not send processing_started to session " + session->getSessionId());
        turn->abandon();
        session->clearActiveTurn(turn);
        session->endProcessing();
        return StartResult::NOT_STARTED;
    }

    started_++;
    utils::Logger::info("Turn " + std::to_string(turn->getTurnId()) + " started for session " +
                        session->getSessionId());

    std::vector<uint8_t> audio = session->getAudioBuffer().drain();
    if (audio.empty()) {
        failTurn(session, turn, kNoAudioRecorded);
        return StartResult::STARTED;
    }

    std::weak_ptr<VoiceSession> weakSession = session;
    turn->setDeadlineTimer(scheduler_.schedule(processingTimeout_, [this, weakSession, turn]() {
        onDeadline(weakSession, turn);
    }));

    bool queued = taskQueue_->enqueue([this, session, turn, audio]() {
        executeStages(session, turn, audio);
    }, "voice_turn_" + std::to_string(turn->getTurnId()));

    if (!queued) {
        failTurn(session, turn, "Server is shutting down");
        return StartResult::NOT_STARTED;
    }
    return StartResult::STARTED;
}

void VoicePipeline::executeStages(const std::shared_ptr<VoiceSession>& session,
                                  const std::shared_ptr<TurnState>& turn,
                                  const std::vector<uint8_t>& audio) {
    utils::ErrorContext context("voice_pipeline", session->getSessionId());
    const utils::CancellationToken& cancel = turn->getCancelToken();
    auto emit = emitterFor(session);

    try {
        std::string transcript = transcriber_->transcribe(audio, cancel);
        if (isBlank(transcript)) {
            throw utils::PipelineException(kNoSpeechDetected, "transcription");
        }
        turn->emitIfActive(emit, TranscriptMessage(transcript));
        rearmIfActive(session, turn);

        std::string response = dialogue_->respond(session->getHistory(), transcript, cancel);
        if (isBlank(response)) {
            throw utils::PipelineException(kNoResponseGenerated, "dialogue");
        }
        turn->emitIfActive(emit, ResponseTextMessage(response));
        rearmIfActive(session, turn);

        size_t chunks = streamer_->stream(response, [turn, emit](const Message& message) {
            return turn->emitIfActive(emit, message);
        }, cancel);
        utils::Logger::debug("Streamed " + std::to_string(chunks) + " audio chunks");

        if (turn->finishWith(emit, ProcessingCompleteMessage())) {
            completed_++;
            utils::Logger::info("Turn " + std::to_string(turn->getTurnId()) + " completed for session " +
                                session->getSessionId());
            completeTurn(session, turn);
        }
    } catch (const utils::PrintVoiceException& e) {
        if (turn->isFinished()) {
            utils::Logger::debug("Discarding error from finished turn: " + std::string(e.what()));
            return;
        }
        utils::ErrorHandler::getInstance().reportError(e, "voice_pipeline", session->getSessionId());
        failTurn(session, turn, e.what());
    } catch (const std::exception& e) {
        if (turn->isFinished()) {
            utils::Logger::debug("Discarding error from finished turn: " + std::string(e.what()));
            return;
        }
        utils::ErrorHandler::getInstance().reportError(
            utils::PipelineException(e.what(), "voice_pipeline"), "voice_pipeline", session->getSessionId());
        failTurn(session, turn, e.what());
    }
}

void VoicePipeline::onDeadline(const std::weak_ptr<VoiceSession>& weakSession,
                               const std::shared_ptr<TurnState>& turn) {
    auto session = weakSession.lock();
    if (!session) {
        turn->abandon();
        return;
    }

    if (!turn->finishWith(emitterFor(session), ErrorMessage(kProcessingTimeout))) {
        return;
    }
    turn->cancel();
    timedOut_++;

    utils::ErrorHandler::getInstance().reportError(
        utils::PipelineException(kProcessingTimeout, "deadline"), "voice_pipeline", session->getSessionId());
    utils::Logger::warn("Turn " + std::to_string(turn->getTurnId()) + " timed out after " +
                        std::to_string(processingTimeout_.count()) + " ms (session " +
                        session->getSessionId() + ")");
    completeTurn(session, turn);
}

void VoicePipeline::failTurn(const std::shared_ptr<VoiceSession>& session,
                             const std::shared_ptr<TurnState>& turn,
                             const std::string& message) {
    if (!turn->finishWith(emitterFor(session), ErrorMessage(message))) {
        return;
    }
    failed_++;
    utils::Logger::error("Processing error (session " + session->getSessionId() + "): " + message);
    completeTurn(session, turn);
}

void VoicePipeline::completeTurn(const std::shared_ptr<VoiceSession>& session,
                                 const std::shared_ptr<TurnState>& turn) {
    TimerScheduler::TimerId deadline = turn->takeDeadlineTimer();
    if (deadline != TimerScheduler::kInvalidTimer) {
        scheduler_.cancel(deadline);
    }

    // Audio accepted once the flag drops belongs to the next recording
    session->getAudioBuffer().clear();
    session->clearActiveTurn(turn);
    session->endProcessing();
    supervisor_.arm(session);
}

void VoicePipeline::rearmIfActive(const std::shared_ptr<VoiceSession>& session,
                                  const std::shared_ptr<TurnState>& turn) {
    if (!turn->isFinished()) {
        supervisor_.arm(session);
    }
}

void VoicePipeline::abandonTurn(VoiceSession& session) {
    auto turn = session.getActiveTurn();
    if (!turn || !turn->abandon()) {
        return;
    }

    TimerScheduler::TimerId deadline = turn->takeDeadlineTimer();
    if (deadline != TimerScheduler::kInvalidTimer) {
        scheduler_.cancel(deadline);
    }
    session.clearActiveTurn(turn);
    abandoned_++;
    utils::Logger::info("Turn " + std::to_string(turn->getTurnId()) + " abandoned for session " +
                        session.getSessionId());
}

VoicePipeline::Statistics VoicePipeline::getStatistics() const {
    Statistics stats;
    stats.started = started_.load();
    stats.completed = completed_.load();
    stats.failed = failed_.load();
    stats.timedOut = timedOut_.load();
    stats.abandoned = abandoned_.load();
    return stats;
}

} // namespace core
} // namespace printvoice
