#include "dialogue/anthropic_client.hpp"
#include "utils/error_handler.hpp"
#include "utils/logging.hpp"

#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace printvoice {
namespace dialogue {

AnthropicClient::AnthropicClient(const utils::LanguageModelSettings& settings)
    : settings_(settings), http_(settings.timeoutMs) {
    if (settings_.apiKey.empty()) {
        utils::Logger::warn("ANTHROPIC_API_KEY is not set, language model calls will fail");
    }
}

std::string AnthropicClient::buildRequestBody(const std::string& systemPrompt,
                                              const std::vector<ConversationTurn>& history) const {
    json messages = json::array();
    for (const auto& turn : history) {
        messages.push_back({{"role", roleToString(turn.role)}, {"content", turn.text}});
    }

    json request;
    request["model"] = settings_.model;
    request["max_tokens"] = settings_.maxTokens;
    request["system"] = systemPrompt;
    request["messages"] = messages;
    return request.dump();
}

std::string AnthropicClient::extractReplyText(const std::string& responseBody) {
    json response = json::parse(responseBody, nullptr, false);
    if (response.is_discarded() || !response.is_object()) {
        throw utils::LanguageModelException("Invalid language model response", responseBody);
    }

    auto content = response.find("content");
    if (content == response.end() || !content->is_array() || content->empty()) {
        throw utils::LanguageModelException("Language model response has no content", responseBody);
    }

    // Only a leading text block counts as the reply
    const json& first = content->front();
    if (first.value("type", "") != "text") {
        return "";
    }
    return first.value("text", "");
}

std::string AnthropicClient::complete(const std::string& systemPrompt,
                                      const std::vector<ConversationTurn>& history,
                                      const utils::CancellationToken& cancel) {
    std::vector<std::string> headers = {
        "x-api-key: " + settings_.apiKey,
        "anthropic-version: " + settings_.apiVersion
    };

    utils::HttpResponse response;
    try {
        response = http_.postJson(settings_.endpoint, headers, buildRequestBody(systemPrompt, history), cancel);
    } catch (const utils::HttpTransferError& e) {
        throw utils::LanguageModelException("Language model request failed", e.what());
    }

    if (!response.ok()) {
        std::string details = "HTTP " + std::to_string(response.status) + ": " + response.body;
        json error = json::parse(response.body, nullptr, false);
        if (!error.is_discarded() && error.contains("error") && error["error"].is_object()) {
            details = error["error"].value("message", details);
        }
        throw utils::LanguageModelException("Language model request failed", details);
    }

    std::string reply = extractReplyText(response.body);
    utils::Logger::debug("Language model reply: " + reply);
    return reply;
}

} // namespace dialogue
} // namespace printvoice
