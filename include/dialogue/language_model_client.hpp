#pragma once

#include "dialogue/conversation_history.hpp"
#include "utils/cancellation.hpp"

#include <string>
#include <vector>

namespace printvoice {
namespace dialogue {

/**
 * Chat-completion style language model.
 */
class LanguageModelClient {
public:
    virtual ~LanguageModelClient() = default;

    /**
     * Produce the assistant reply to the given history.
     * @throws utils::LanguageModelException on service or protocol failure
     */
    virtual std::string complete(const std::string& systemPrompt,
                                 const std::vector<ConversationTurn>& history,
                                 const utils::CancellationToken& cancel) = 0;
};

} // namespace dialogue
} // namespace printvoice
