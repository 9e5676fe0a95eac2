#pragma once

#include "business/business_layer.hpp"
#include "core/session_store.hpp"
#include "core/session_timeout_supervisor.hpp"
#include "core/task_queue.hpp"
#include "core/timer_scheduler.hpp"
#include "core/voice_pipeline.hpp"
#include "dialogue/dialogue_orchestrator.hpp"
#include "dialogue/language_model_client.hpp"
#include "dialogue/tool_registry.hpp"
#include "stt/transcription_client.hpp"
#include "tts/speech_synthesis_client.hpp"
#include "utils/config.hpp"

#include <atomic>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace printvoice {
namespace core {

/**
 * Transport-independent session lifecycle and frame routing.
 *
 * The WebSocket server forwards open, message, close and error events
 * here. Disconnect, transport error and idle timeout all converge on the
 * same idempotent cleanup: cancel the idle timer, abandon any running
 * turn, release buffers and drop the session from the store.
 */
class VoiceSessionManager {
public:
    struct Collaborators {
        std::shared_ptr<stt::TranscriptionClient> transcriber;
        std::shared_ptr<dialogue::LanguageModelClient> languageModel;
        std::shared_ptr<tts::SpeechSynthesisClient> synthesizer;
        std::shared_ptr<business::BusinessLayer> business;
    };

    static constexpr const char* kInvalidMessageFormat = "Invalid message format";
    static constexpr const char* kCannotStartWhileProcessing = "Cannot start recording while processing";

    VoiceSessionManager(const utils::Config& config, Collaborators collaborators);
    ~VoiceSessionManager();

    VoiceSessionManager(const VoiceSessionManager&) = delete;
    VoiceSessionManager& operator=(const VoiceSessionManager&) = delete;

    /**
     * Register a new connection and greet it. Returns null if the greeting
     * could not be delivered, in which case the session is already gone.
     */
    std::shared_ptr<VoiceSession> openSession(const std::string& sessionId,
                                              std::shared_ptr<SessionTransport> transport);

    // One inbound frame, text or binary
    void handleFrame(const std::string& sessionId, std::string_view frame);

    // The client went away
    void closeSession(const std::string& sessionId);

    void handleTransportError(const std::string& sessionId, const std::string& what);

    // Close every session and stop the worker pool and timers
    void shutdown();

    size_t getActiveSessionCount() const { return store_.size(); }
    std::shared_ptr<VoiceSession> findSession(const std::string& sessionId) const;
    std::vector<std::string> getToolNames() const { return tools_->getToolNames(); }

    VoicePipeline& getPipeline() { return *pipeline_; }
    const SessionTimeoutSupervisor& getSupervisor() const { return *supervisor_; }

private:
    void handleControl(const std::shared_ptr<VoiceSession>& session, MessageType type);
    bool cleanupSession(const std::string& sessionId, const std::string& reason);

    const utils::SessionSettings settings_;
    SessionStore store_;

    std::unique_ptr<TimerScheduler> scheduler_;
    std::shared_ptr<TaskQueue> taskQueue_;
    std::unique_ptr<ThreadPool> threadPool_;
    std::unique_ptr<SessionTimeoutSupervisor> supervisor_;

    std::shared_ptr<dialogue::ToolRegistry> tools_;
    std::shared_ptr<dialogue::DialogueOrchestrator> orchestrator_;
    std::unique_ptr<VoicePipeline> pipeline_;

    std::atomic<bool> shutdown_;
};

} // namespace core
} // namespace printvoice
