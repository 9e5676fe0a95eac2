#pragma once

#include "dialogue/language_model_client.hpp"
#include "utils/config.hpp"
#include "utils/http_client.hpp"

namespace printvoice {
namespace dialogue {

/**
 * LanguageModelClient backed by the Anthropic Messages API.
 */
class AnthropicClient : public LanguageModelClient {
public:
    explicit AnthropicClient(const utils::LanguageModelSettings& settings);

    std::string complete(const std::string& systemPrompt,
                         const std::vector<ConversationTurn>& history,
                         const utils::CancellationToken& cancel) override;

    // Exposed for tests
    std::string buildRequestBody(const std::string& systemPrompt,
                                 const std::vector<ConversationTurn>& history) const;
    static std::string extractReplyText(const std::string& responseBody);

private:
    utils::LanguageModelSettings settings_;
    utils::HttpClient http_;
};

} // namespace dialogue
} // namespace printvoice
