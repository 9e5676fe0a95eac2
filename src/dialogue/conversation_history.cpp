#include "dialogue/conversation_history.hpp"
#include "utils/logging.hpp"

#include <algorithm>

namespace printvoice {
namespace dialogue {

std::string roleToString(Role role) {
    return role == Role::USER ? "user" : "assistant";
}

ConversationHistory::ConversationHistory(size_t maxTurns, size_t trimSlack)
    : maxTurns_(maxTurns == 0 ? 1 : maxTurns),
      retainAfterTrim_(maxTurns_ - std::min(std::max<size_t>(trimSlack, 1), maxTurns_)) {
}

void ConversationHistory::append(Role role, const std::string& text) {
    std::lock_guard<std::mutex> lock(mutex_);
    trimForAppend();
    turns_.emplace_back(role, text);
}

void ConversationHistory::trimForAppend() {
    if (turns_.size() < maxTurns_) {
        return;
    }

    size_t dropped = turns_.size() - retainAfterTrim_;
    turns_.erase(turns_.begin(), turns_.begin() + static_cast<std::ptrdiff_t>(dropped));
    utils::Logger::debug("Conversation history trimmed, dropped " + std::to_string(dropped) +
                         " oldest turns");
}

void ConversationHistory::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    turns_.clear();
}

std::vector<ConversationTurn> ConversationHistory::snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return turns_;
}

size_t ConversationHistory::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return turns_.size();
}

bool ConversationHistory::empty() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return turns_.empty();
}

} // namespace dialogue
} // namespace printvoice
