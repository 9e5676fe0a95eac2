#pragma once

#include <cstddef>
#include <mutex>
#include <string>
#include <vector>

namespace printvoice {
namespace dialogue {

enum class Role {
    USER,
    ASSISTANT
};

std::string roleToString(Role role);

struct ConversationTurn {
    Role role;
    std::string text;

    ConversationTurn(Role r, std::string t) : role(r), text(std::move(t)) {}
};

/**
 * Bounded conversation history of one session.
 *
 * Before an append would exceed maxTurns, the oldest turns are dropped so
 * that maxTurns - trimSlack remain; recency wins over completeness and the
 * length never exceeds maxTurns.
 */
class ConversationHistory {
public:
    explicit ConversationHistory(size_t maxTurns = 20, size_t trimSlack = 2);

    void append(Role role, const std::string& text);
    void clear();

    std::vector<ConversationTurn> snapshot() const;
    size_t size() const;
    bool empty() const;

    size_t getMaxTurns() const { return maxTurns_; }

private:
    void trimForAppend();

    const size_t maxTurns_;
    const size_t retainAfterTrim_;

    mutable std::mutex mutex_;
    std::vector<ConversationTurn> turns_;
};

} // namespace dialogue
} // namespace printvoice
