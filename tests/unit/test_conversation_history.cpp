#include <gtest/gtest.h>
#include "dialogue/conversation_history.hpp"

using namespace printvoice::dialogue;

class ConversationHistoryTest : public ::testing::Test {
protected:
    ConversationHistory history_{20, 2};
};

TEST_F(ConversationHistoryTest, AppendKeepsOrderAndRoles) {
    history_.append(Role::USER, "Hello");
    history_.append(Role::ASSISTANT, "Hi, how can I help?");

    auto turns = history_.snapshot();
    ASSERT_EQ(turns.size(), 2u);
    EXPECT_EQ(turns[0].role, Role::USER);
    EXPECT_EQ(turns[0].text, "Hello");
    EXPECT_EQ(turns[1].role, Role::ASSISTANT);
    EXPECT_EQ(roleToString(turns[1].role), "assistant");
}

TEST_F(ConversationHistoryTest, TrimsToEighteenWhenFull) {
    for (int i = 0; i < 20; ++i) {
        history_.append(i % 2 == 0 ? Role::USER : Role::ASSISTANT, "turn " + std::to_string(i));
    }
    EXPECT_EQ(history_.size(), 20u);

    history_.append(Role::USER, "turn 20");

    auto turns = history_.snapshot();
    ASSERT_EQ(turns.size(), 19u);
    EXPECT_EQ(turns.front().text, "turn 2");
    EXPECT_EQ(turns.back().text, "turn 20");
}

TEST_F(ConversationHistoryTest, NeverExceedsMaximum) {
    for (int i = 0; i < 200; ++i) {
        history_.append(Role::USER, std::to_string(i));
        ASSERT_LE(history_.size(), history_.getMaxTurns());
    }
    EXPECT_EQ(history_.snapshot().back().text, "199");
}

TEST_F(ConversationHistoryTest, ClearIsIdempotent) {
    history_.append(Role::USER, "Hello");
    history_.clear();
    history_.clear();

    EXPECT_TRUE(history_.empty());
}

TEST_F(ConversationHistoryTest, ZeroSlackStillMakesRoom) {
    ConversationHistory tight(3, 0);
    tight.append(Role::USER, "a");
    tight.append(Role::USER, "b");
    tight.append(Role::USER, "c");
    tight.append(Role::USER, "d");

    auto turns = tight.snapshot();
    ASSERT_EQ(turns.size(), 3u);
    EXPECT_EQ(turns.front().text, "b");
}
