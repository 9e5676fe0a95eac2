#include "dialogue/dialogue_orchestrator.hpp"
#include "utils/error_handler.hpp"
#include "utils/logging.hpp"

#include <sstream>

namespace printvoice {
namespace dialogue {

namespace {

const char* const kAssistantBrief = R"(You are Jarvis, an AI assistant for a print shop management system.

Your role is to help users create quotes for custom printing orders through natural conversation.

When a user describes an order, you should:
1. Listen carefully to all details (product, quantity, sizes, decoration method)
2. Ask clarifying questions if information is missing
3. Create the quote in the system
4. Confirm the quote was created and provide the quote number and total

Be professional, friendly, and efficient. Speak naturally and conversationally.
Your replies are read aloud, so keep them short and avoid lists or markdown.)";

bool isBlank(const std::string& text) {
    return text.find_first_not_of(" \t\r\n") == std::string::npos;
}

} // namespace

DialogueOrchestrator::DialogueOrchestrator(std::shared_ptr<LanguageModelClient> model,
                                           std::shared_ptr<ToolRegistry> tools)
    : model_(std::move(model)),
      tools_(std::move(tools)),
      systemPrompt_(buildSystemPrompt(*tools_)) {
}

std::string DialogueOrchestrator::buildSystemPrompt(const ToolRegistry& tools) {
    std::ostringstream prompt;
    prompt << kAssistantBrief << "\n\nYou have access to these tools:\n";

    nlohmann::json catalog = tools.catalog();
    for (const auto& tool : catalog) {
        prompt << "- " << tool["name"].get<std::string>() << ": "
               << tool["description"].get<std::string>() << "\n";
    }
    prompt << "\nTool parameter schemas:\n" << catalog.dump(2) << "\n\n"
           << "When you need to use a tool, respond with only a JSON object like:\n"
           << R"({"tool": "create_quote", "params": {"customer_name": "ABC Company", "line_items": [...]}})"
           << "\nOtherwise, respond with natural conversational text.";
    return prompt.str();
}

void DialogueOrchestrator::throwIfCancelled(const utils::CancellationToken& cancel) const {
    if (cancel.isCancelled()) {
        throw utils::PipelineException("Processing cancelled", "dialogue");
    }
}

void DialogueOrchestrator::appendReply(ConversationHistory& history, const std::string& text) {
    // Blank assistant turns are rejected by chat APIs on the next call
    if (!isBlank(text)) {
        history.append(Role::ASSISTANT, text);
    }
}

std::string DialogueOrchestrator::respond(ConversationHistory& history,
                                          const std::string& userUtterance,
                                          const utils::CancellationToken& cancel) {
    // A turn that timed out while transcribing must not leave its utterance behind
    throwIfCancelled(cancel);
    turns_++;
    history.append(Role::USER, userUtterance);

    std::string reply = model_->complete(systemPrompt_, history.snapshot(), cancel);
    throwIfCancelled(cancel);

    ModelReply parsed = ToolCallParser::parse(reply);
    switch (parsed.kind) {
        case ModelReply::Kind::TOOL_CALL:
            return handleToolCall(history, parsed, cancel);

        case ModelReply::Kind::MALFORMED_TOOL_CALL:
            malformedToolCalls_++;
            utils::Logger::warn("Malformed tool call from model: " + parsed.reason);
            appendReply(history, kMalformedToolCallReply);
            return kMalformedToolCallReply;

        case ModelReply::Kind::PLAIN_TEXT:
        default:
            appendReply(history, reply);
            return reply;
    }
}

std::string DialogueOrchestrator::handleToolCall(ConversationHistory& history,
                                                 const ModelReply& reply,
                                                 const utils::CancellationToken& cancel) {
    toolCalls_++;
    nlohmann::json result = tools_->execute(reply.toolName, reply.params);
    if (!result.value("success", false)) {
        failedToolCalls_++;
    }
    throwIfCancelled(cancel);

    history.append(Role::ASSISTANT, "Tool executed: " + result.dump());

    std::string followUp;
    try {
        followUp = model_->complete(systemPrompt_, history.snapshot(), cancel);
    } catch (const utils::LanguageModelException& e) {
        throwIfCancelled(cancel);
        utils::ErrorHandler::getInstance().reportError(
            e, "dialogue follow-up after " + reply.toolName,
            utils::ErrorContext::getCurrentSessionId());
        followUp = kFollowUpFailedReply;
    }
    throwIfCancelled(cancel);

    appendReply(history, followUp);
    return followUp;
}

DialogueOrchestrator::Statistics DialogueOrchestrator::getStatistics() const {
    Statistics stats;
    stats.turns = turns_.load();
    stats.toolCalls = toolCalls_.load();
    stats.failedToolCalls = failedToolCalls_.load();
    stats.malformedToolCalls = malformedToolCalls_.load();
    return stats;
}

} // namespace dialogue
} // namespace printvoice
