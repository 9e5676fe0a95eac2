#pragma once

#include "dialogue/conversation_history.hpp"
#include "dialogue/language_model_client.hpp"
#include "dialogue/tool_call_parser.hpp"
#include "dialogue/tool_registry.hpp"
#include "utils/cancellation.hpp"

#include <atomic>
#include <cstdint>
#include <memory>
#include <string>

namespace printvoice {
namespace dialogue {

/**
 * Runs one conversational turn: user utterance in, assistant text out.
 *
 * A reply that is a tool call is executed through the registry, its result
 * is appended to the history as "Tool executed: <json>" and the model is
 * asked once more for the spoken summary. There is never a second tool
 * round; a tool call in the follow-up reply is returned as text.
 */
class DialogueOrchestrator {
public:
    static constexpr const char* kMalformedToolCallReply =
        "Sorry, I tried to look that up but got my request mixed up. Could you say that again?";
    static constexpr const char* kFollowUpFailedReply =
        "I finished that action, but I had trouble putting the result into words. "
        "Please check the system for the details.";

    struct Statistics {
        uint64_t turns = 0;
        uint64_t toolCalls = 0;
        uint64_t failedToolCalls = 0;
        uint64_t malformedToolCalls = 0;
    };

    DialogueOrchestrator(std::shared_ptr<LanguageModelClient> model,
                         std::shared_ptr<ToolRegistry> tools);

    /**
     * Append the utterance, consult the model (and at most one tool) and
     * append the final reply to the history.
     * @return the assistant reply, possibly empty if the model said nothing
     * @throws utils::LanguageModelException if the first model call fails
     * @throws utils::PipelineException if the turn is cancelled
     */
    std::string respond(ConversationHistory& history,
                        const std::string& userUtterance,
                        const utils::CancellationToken& cancel);

    const std::string& getSystemPrompt() const { return systemPrompt_; }
    static std::string buildSystemPrompt(const ToolRegistry& tools);

    Statistics getStatistics() const;

private:
    std::string handleToolCall(ConversationHistory& history,
                               const ModelReply& reply,
                               const utils::CancellationToken& cancel);
    void throwIfCancelled(const utils::CancellationToken& cancel) const;
    static void appendReply(ConversationHistory& history, const std::string& text);

    std::shared_ptr<LanguageModelClient> model_;
    std::shared_ptr<ToolRegistry> tools_;
    std::string systemPrompt_;

    std::atomic<uint64_t> turns_{0};
    std::atomic<uint64_t> toolCalls_{0};
    std::atomic<uint64_t> failedToolCalls_{0};
    std::atomic<uint64_t> malformedToolCalls_{0};
};

} // namespace dialogue
} // namespace printvoice
