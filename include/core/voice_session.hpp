#pragma once

#include "audio/audio_buffer_manager.hpp"
#include "core/message_protocol.hpp"
#include "core/session_transport.hpp"
#include "core/timer_scheduler.hpp"
#include "core/turn_state.hpp"
#include "dialogue/conversation_history.hpp"
#include "utils/config.hpp"

#include <atomic>
#include <chrono>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>

namespace printvoice {
namespace core {

/**
 * State of one connected client: transport, audio buffer, conversation
 * history, the single-slot processing flag and the idle timer handle.
 *
 * The processing flag is the only mutual exclusion between turns. While it
 * is set, inbound audio is dropped so a running turn never sees its buffer
 * change underneath it.
 */
class VoiceSession {
public:
    using Clock = std::chrono::steady_clock;

    VoiceSession(const std::string& sessionId,
                 std::shared_ptr<SessionTransport> transport,
                 const utils::SessionSettings& settings);
    ~VoiceSession();

    VoiceSession(const VoiceSession&) = delete;
    VoiceSession& operator=(const VoiceSession&) = delete;

    const std::string& getSessionId() const { return sessionId_; }

    // Returns false if the chunk was dropped because a turn is running
    bool acceptAudio(std::string_view chunk);

    audio::AudioBufferManager& getAudioBuffer() { return audioBuffer_; }
    dialogue::ConversationHistory& getHistory() { return history_; }

    bool tryBeginProcessing();
    void endProcessing();
    bool isProcessing() const { return processing_.load(); }

    // Current turn, null when idle
    void setActiveTurn(std::shared_ptr<TurnState> turn);
    std::shared_ptr<TurnState> getActiveTurn() const;
    // Clears the active turn only if it is still the given one
    void clearActiveTurn(const std::shared_ptr<TurnState>& turn);

    void touch();
    Clock::time_point getLastActivity() const;

    /**
     * Clear buffer and history and drop the processing flag. Safe to call
     * any number of times.
     */
    void reset();

    // Drop all buffered data; used when the session goes away
    void release();

    bool send(const Message& message);
    bool sendError(const std::string& message);

    // Close the transport; only the first call has an effect
    void close(int code, const std::string& reason);
    bool isClosed() const { return closed_.load(); }

    // Swap the idle timer handle, returning the previous one
    TimerScheduler::TimerId exchangeIdleTimer(TimerScheduler::TimerId timer);
    // Clear the handle only if it still refers to timer
    bool releaseIdleTimer(TimerScheduler::TimerId timer);
    TimerScheduler::TimerId getIdleTimer() const { return idleTimer_.load(); }

private:
    const std::string sessionId_;
    std::shared_ptr<SessionTransport> transport_;

    audio::AudioBufferManager audioBuffer_;
    dialogue::ConversationHistory history_;

    std::atomic<bool> processing_;
    std::atomic<bool> closed_;
    std::atomic<TimerScheduler::TimerId> idleTimer_;
    std::atomic<Clock::rep> lastActivity_;

    mutable std::mutex turnMutex_;
    std::shared_ptr<TurnState> activeTurn_;
};

} // namespace core
} // namespace printvoice
