#include "core/voice_session.hpp"
#include "utils/logging.hpp"

namespace printvoice {
namespace core {

VoiceSession::VoiceSession(const std::string& sessionId,
                           std::shared_ptr<SessionTransport> transport,
                           const utils::SessionSettings& settings)
    : sessionId_(sessionId),
      transport_(std::move(transport)),
      audioBuffer_(settings.maxAudioChunks),
      history_(settings.maxHistoryTurns, settings.historyTrimSlack),
      processing_(false),
      closed_(false),
      idleTimer_(TimerScheduler::kInvalidTimer),
      lastActivity_(Clock::now().time_since_epoch().count()) {
    utils::Logger::debug("Voice session created: " + sessionId_);
}

VoiceSession::~VoiceSession() {
    utils::Logger::debug("Voice session destroyed: " + sessionId_);
}

bool VoiceSession::acceptAudio(std::string_view chunk) {
    if (processing_.load()) {
        utils::Logger::warn("Received audio chunk while processing, ignoring (session " + sessionId_ + ")");
        return false;
    }
    audioBuffer_.accept(chunk);
    return true;
}

bool VoiceSession::tryBeginProcessing() {
    bool expected = false;
    return processing_.compare_exchange_strong(expected, true);
}

void VoiceSession::endProcessing() {
    processing_.store(false);
}

void VoiceSession::setActiveTurn(std::shared_ptr<TurnState> turn) {
    std::lock_guard<std::mutex> lock(turnMutex_);
    activeTurn_ = std::move(turn);
}

std::shared_ptr<TurnState> VoiceSession::getActiveTurn() const {
    std::lock_guard<std::mutex> lock(turnMutex_);
    return activeTurn_;
}

void VoiceSession::clearActiveTurn(const std::shared_ptr<TurnState>& turn) {
    std::lock_guard<std::mutex> lock(turnMutex_);
    if (activeTurn_ == turn) {
        activeTurn_.reset();
    }
}

void VoiceSession::touch() {
    lastActivity_.store(Clock::now().time_since_epoch().count());
}

VoiceSession::Clock::time_point VoiceSession::getLastActivity() const {
    return Clock::time_point(Clock::duration(lastActivity_.load()));
}

void VoiceSession::reset() {
    audioBuffer_.clear();
    history_.clear();
    processing_.store(false);
}

void VoiceSession::release() {
    audioBuffer_.clear();
    history_.clear();
}

bool VoiceSession::send(const Message& message) {
    if (closed_.load() || !transport_) {
        return false;
    }

    std::string payload = message.serialize();
    Delivery delivery = MessageProtocol::isBestEffort(message.getType()) ? Delivery::BEST_EFFORT
                                                                         : Delivery::RELIABLE;
    if (!transport_->send(payload, delivery)) {
        utils::Logger::debug("Dropped " + MessageProtocol::messageTypeToString(message.getType()) +
                             " for session " + sessionId_ + ": transport closed");
        return false;
    }
    return true;
}

bool VoiceSession::sendError(const std::string& message) {
    return send(ErrorMessage(message));
}

void VoiceSession::close(int code, const std::string& reason) {
    bool expected = false;
    if (!closed_.compare_exchange_strong(expected, true)) {
        return;
    }
    utils::Logger::info("Closing session " + sessionId_ + " (" + std::to_string(code) + " " + reason + ")");
    if (transport_) {
        transport_->close(code, reason);
    }
}

TimerScheduler::TimerId VoiceSession::exchangeIdleTimer(TimerScheduler::TimerId timer) {
    return idleTimer_.exchange(timer);
}

bool VoiceSession::releaseIdleTimer(TimerScheduler::TimerId timer) {
    return idleTimer_.compare_exchange_strong(timer, TimerScheduler::kInvalidTimer);
}

} // namespace core
} // namespace printvoice
