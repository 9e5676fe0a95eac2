#pragma once

#include "core/session_timeout_supervisor.hpp"
#include "core/task_queue.hpp"
#include "core/timer_scheduler.hpp"
#include "core/turn_state.hpp"
#include "core/voice_session.hpp"
#include "dialogue/dialogue_orchestrator.hpp"
#include "stt/transcription_client.hpp"
#include "tts/speech_synthesis_streamer.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <string>

namespace printvoice {
namespace core {

/**
 * Runs speech-to-text, dialogue and speech synthesis for one recording.
 *
 * Stages execute on the worker pool and race a processing deadline on the
 * timer scheduler. Whichever finishes first emits the final event
 * (processing_complete or an error) and runs the cleanup: processing flag
 * cleared, audio buffer cleared, idle timer re-armed. On timeout the turn's
 * cancellation token is set so outstanding service calls abort, and
 * anything the stages still produce is discarded.
 */
class VoicePipeline {
public:
    static constexpr const char* kAlreadyProcessing = "Already processing";
    static constexpr const char* kNoAudioRecorded = "No audio recorded";
    static constexpr const char* kNoSpeechDetected = "No speech detected in audio";
    static constexpr const char* kNoResponseGenerated = "No response generated";
    static constexpr const char* kProcessingTimeout = "Processing timeout";

    enum class StartResult {
        STARTED,
        ALREADY_PROCESSING,
        NOT_STARTED
    };

    struct Statistics {
        uint64_t started = 0;
        uint64_t completed = 0;
        uint64_t failed = 0;
        uint64_t timedOut = 0;
        uint64_t abandoned = 0;
    };

    VoicePipeline(std::shared_ptr<stt::TranscriptionClient> transcriber,
                  std::shared_ptr<dialogue::DialogueOrchestrator> dialogue,
                  std::shared_ptr<tts::SpeechSynthesisStreamer> streamer,
                  std::shared_ptr<TaskQueue> taskQueue,
                  TimerScheduler& scheduler,
                  SessionTimeoutSupervisor& supervisor,
                  std::chrono::milliseconds processingTimeout);

    /**
     * Start a turn for the session's buffered audio. Returns
     * ALREADY_PROCESSING (after sending an error event) if a turn is in
     * flight, and NOT_STARTED if processing_started could not be delivered
     * or the worker pool refused the job.
     */
    StartResult runTurn(const std::shared_ptr<VoiceSession>& session);

    /**
     * Silently end the session's running turn, if any, and cancel its
     * outstanding work. Used on reset and disconnect.
     */
    void abandonTurn(VoiceSession& session);

    std::chrono::milliseconds getProcessingTimeout() const { return processingTimeout_; }
    Statistics getStatistics() const;

private:
    void executeStages(const std::shared_ptr<VoiceSession>& session,
                       const std::shared_ptr<TurnState>& turn,
                       const std::vector<uint8_t>& audio);
    void onDeadline(const std::weak_ptr<VoiceSession>& weakSession,
                    const std::shared_ptr<TurnState>& turn);
    void failTurn(const std::shared_ptr<VoiceSession>& session,
                  const std::shared_ptr<TurnState>& turn,
                  const std::string& message);
    void completeTurn(const std::shared_ptr<VoiceSession>& session,
                      const std::shared_ptr<TurnState>& turn);
    void rearmIfActive(const std::shared_ptr<VoiceSession>& session,
                       const std::shared_ptr<TurnState>& turn);

    std::shared_ptr<stt::TranscriptionClient> transcriber_;
    std::shared_ptr<dialogue::DialogueOrchestrator> dialogue_;
    std::shared_ptr<tts::SpeechSynthesisStreamer> streamer_;
    std::shared_ptr<TaskQueue> taskQueue_;
    TimerScheduler& scheduler_;
    SessionTimeoutSupervisor& supervisor_;
    const std::chrono::milliseconds processingTimeout_;

    std::atomic<uint64_t> nextTurnId_{0};
    std::atomic<uint64_t> started_{0};
    std::atomic<uint64_t> completed_{0};
    std::atomic<uint64_t> failed_{0};
    std::atomic<uint64_t> timedOut_{0};
    std::atomic<uint64_t> abandoned_{0};
};

} // namespace core
} // namespace printvoice
