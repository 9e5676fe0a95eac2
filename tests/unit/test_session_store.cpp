#include <gtest/gtest.h>
#include "core/session_store.hpp"
#include "fixtures/pipeline_fixtures.hpp"
#include <algorithm>

using namespace printvoice;
using namespace printvoice::core;

class SessionStoreTest : public ::testing::Test {
protected:
    std::shared_ptr<VoiceSession> makeSession(const std::string& id) {
        return std::make_shared<VoiceSession>(id, std::make_shared<fixtures::RecordingTransport>(), settings_);
    }

    utils::SessionSettings settings_;
    SessionStore store_;
};

TEST_F(SessionStoreTest, AddFindRemove) {
    auto session = makeSession("a");

    EXPECT_TRUE(store_.add(session));
    EXPECT_EQ(store_.size(), 1u);
    EXPECT_EQ(store_.find("a"), session);
    EXPECT_EQ(store_.find("b"), nullptr);

    EXPECT_EQ(store_.remove("a"), session);
    EXPECT_EQ(store_.remove("a"), nullptr);
    EXPECT_EQ(store_.size(), 0u);
}

TEST_F(SessionStoreTest, RejectsDuplicateIdsAndNull) {
    EXPECT_TRUE(store_.add(makeSession("a")));
    EXPECT_FALSE(store_.add(makeSession("a")));
    EXPECT_FALSE(store_.add(nullptr));
    EXPECT_EQ(store_.size(), 1u);
}

TEST_F(SessionStoreTest, IdsAndClear) {
    store_.add(makeSession("a"));
    store_.add(makeSession("b"));

    auto ids = store_.ids();
    std::sort(ids.begin(), ids.end());
    EXPECT_EQ(ids, (std::vector<std::string>{"a", "b"}));

    auto removed = store_.clear();
    EXPECT_EQ(removed.size(), 2u);
    EXPECT_EQ(store_.size(), 0u);
}
