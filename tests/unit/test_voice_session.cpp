#include <gtest/gtest.h>
#include "core/voice_session.hpp"
#include "fixtures/pipeline_fixtures.hpp"

#include <thread>

using namespace printvoice;
using namespace printvoice::core;
using fixtures::RecordingTransport;

class VoiceSessionTest : public ::testing::Test {
protected:
    void SetUp() override {
        settings_.maxAudioChunks = 3;
        transport_ = std::make_shared<RecordingTransport>();
        session_ = std::make_shared<VoiceSession>("session-1", transport_, settings_);
    }

    utils::SessionSettings settings_;
    std::shared_ptr<RecordingTransport> transport_;
    std::shared_ptr<VoiceSession> session_;
};

TEST_F(VoiceSessionTest, InitialState) {
    EXPECT_EQ(session_->getSessionId(), "session-1");
    EXPECT_FALSE(session_->isProcessing());
    EXPECT_FALSE(session_->isClosed());
    EXPECT_TRUE(session_->getAudioBuffer().empty());
    EXPECT_TRUE(session_->getHistory().empty());
    EXPECT_EQ(session_->getActiveTurn(), nullptr);
    EXPECT_EQ(session_->getIdleTimer(), TimerScheduler::kInvalidTimer);
    EXPECT_EQ(session_->getAudioBuffer().getMaxChunks(), 3u);
}

TEST_F(VoiceSessionTest, AudioDroppedWhileProcessing) {
    EXPECT_TRUE(session_->acceptAudio("aa"));
    ASSERT_TRUE(session_->tryBeginProcessing());

    EXPECT_FALSE(session_->acceptAudio("bb"));
    EXPECT_EQ(session_->getAudioBuffer().chunkCount(), 1u);

    session_->endProcessing();
    EXPECT_TRUE(session_->acceptAudio("cc"));
    EXPECT_EQ(session_->getAudioBuffer().chunkCount(), 2u);
}

TEST_F(VoiceSessionTest, ProcessingFlagIsSingleSlot) {
    EXPECT_TRUE(session_->tryBeginProcessing());
    EXPECT_FALSE(session_->tryBeginProcessing());
    session_->endProcessing();
    EXPECT_TRUE(session_->tryBeginProcessing());
}

TEST_F(VoiceSessionTest, ResetClearsEverythingAndIsIdempotent) {
    session_->acceptAudio("aa");
    session_->getHistory().append(dialogue::Role::USER, "hello");
    session_->tryBeginProcessing();

    session_->reset();
    session_->reset();

    EXPECT_TRUE(session_->getAudioBuffer().empty());
    EXPECT_TRUE(session_->getHistory().empty());
    EXPECT_FALSE(session_->isProcessing());
}

TEST_F(VoiceSessionTest, SendSerializesToTransport) {
    EXPECT_TRUE(session_->send(TranscriptMessage("hello")));
    EXPECT_TRUE(session_->sendError("oops"));

    auto payloads = transport_->payloads();
    ASSERT_EQ(payloads.size(), 2u);
    EXPECT_EQ(nlohmann::json::parse(payloads[0])["text"], "hello");
    EXPECT_EQ(nlohmann::json::parse(payloads[1])["message"], "oops");
}

TEST_F(VoiceSessionTest, OnlyAudioChunksAreSentBestEffort) {
    EXPECT_TRUE(session_->send(TranscriptMessage("hello")));
    EXPECT_TRUE(session_->send(AudioChunkMessage({1, 2, 3})));
    EXPECT_TRUE(session_->send(AudioCompleteMessage()));
    EXPECT_TRUE(session_->send(ProcessingCompleteMessage()));

    EXPECT_EQ(transport_->bestEffortSends(), 1u);
    EXPECT_EQ(transport_->payloads().size(), 4u);
}

TEST_F(VoiceSessionTest, SendFailsQuietlyOnBrokenTransport) {
    transport_->setFailSends(true);
    EXPECT_FALSE(session_->send(ProcessingStartedMessage()));
}

TEST_F(VoiceSessionTest, CloseHappensOnce) {
    session_->close(1000, "Session timeout");
    session_->close(1011, "Internal error");

    EXPECT_TRUE(session_->isClosed());
    EXPECT_EQ(transport_->closeCount(), 1);
    EXPECT_EQ(transport_->closeCode(), 1000);
    EXPECT_EQ(transport_->closeReason(), "Session timeout");
    EXPECT_FALSE(session_->send(ProcessingCompleteMessage()));
}

TEST_F(VoiceSessionTest, ActiveTurnClearedOnlyByOwner) {
    auto first = std::make_shared<TurnState>(1);
    auto second = std::make_shared<TurnState>(2);

    session_->setActiveTurn(first);
    session_->clearActiveTurn(second);
    EXPECT_EQ(session_->getActiveTurn(), first);

    session_->clearActiveTurn(first);
    EXPECT_EQ(session_->getActiveTurn(), nullptr);
}

TEST_F(VoiceSessionTest, IdleTimerHandle) {
    EXPECT_EQ(session_->exchangeIdleTimer(5), TimerScheduler::kInvalidTimer);
    EXPECT_EQ(session_->exchangeIdleTimer(6), 5u);

    EXPECT_FALSE(session_->releaseIdleTimer(5));
    EXPECT_EQ(session_->getIdleTimer(), 6u);
    EXPECT_TRUE(session_->releaseIdleTimer(6));
    EXPECT_EQ(session_->getIdleTimer(), TimerScheduler::kInvalidTimer);
}

TEST_F(VoiceSessionTest, TouchAdvancesActivity) {
    auto before = session_->getLastActivity();
    std::this_thread::sleep_for(std::chrono::milliseconds(5));
    session_->touch();
    EXPECT_GT(session_->getLastActivity(), before);
}

class TurnStateTest : public ::testing::Test {
protected:
    TurnState::Emitter recorder() {
        return [this](const Message& message) {
            sent_.push_back(MessageProtocol::messageTypeToString(message.getType()));
            return true;
        };
    }

    std::vector<std::string> sent_;
};

TEST_F(TurnStateTest, OnlyFirstFinisherEmits) {
    TurnState turn(1);

    EXPECT_TRUE(turn.emitIfActive(recorder(), TranscriptMessage("hi")));
    EXPECT_TRUE(turn.finishWith(recorder(), ErrorMessage("Processing timeout")));
    EXPECT_FALSE(turn.finishWith(recorder(), ProcessingCompleteMessage()));
    EXPECT_FALSE(turn.emitIfActive(recorder(), AudioCompleteMessage()));

    EXPECT_EQ(sent_, (std::vector<std::string>{"transcript", "error"}));
}

TEST_F(TurnStateTest, AbandonIsSilentAndCancels) {
    TurnState turn(1);

    EXPECT_TRUE(turn.abandon());
    EXPECT_FALSE(turn.abandon());
    EXPECT_TRUE(turn.isFinished());
    EXPECT_TRUE(turn.getCancelToken().isCancelled());
    EXPECT_FALSE(turn.finishWith(recorder(), ProcessingCompleteMessage()));
    EXPECT_TRUE(sent_.empty());
}

TEST_F(TurnStateTest, DeadlineTimerIsTakenOnce) {
    TurnState turn(1);
    turn.setDeadlineTimer(9);

    EXPECT_EQ(turn.takeDeadlineTimer(), 9u);
    EXPECT_EQ(turn.takeDeadlineTimer(), TimerScheduler::kInvalidTimer);
}
