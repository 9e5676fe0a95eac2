#include <gtest/gtest.h>
#include "dialogue/anthropic_client.hpp"
#include "stt/whisper_api_client.hpp"
#include "tts/elevenlabs_client.hpp"
#include "utils/error_handler.hpp"

#include <nlohmann/json.hpp>

using namespace printvoice;
using json = nlohmann::json;

class AnthropicClientTest : public ::testing::Test {
protected:
    void SetUp() override {
        settings_.apiKey = "test-key";
        settings_.model = "claude-test";
        settings_.maxTokens = 512;
    }

    utils::LanguageModelSettings settings_;
};

TEST_F(AnthropicClientTest, RequestBodyCarriesSystemAndHistory) {
    dialogue::AnthropicClient client(settings_);
    std::vector<dialogue::ConversationTurn> history;
    history.emplace_back(dialogue::Role::USER, "I need 50 shirts");
    history.emplace_back(dialogue::Role::ASSISTANT, "Which color?");

    json body = json::parse(client.buildRequestBody("You are Jarvis.", history));

    EXPECT_EQ(body["model"], "claude-test");
    EXPECT_EQ(body["max_tokens"], 512);
    EXPECT_EQ(body["system"], "You are Jarvis.");
    ASSERT_EQ(body["messages"].size(), 2u);
    EXPECT_EQ(body["messages"][0]["role"], "user");
    EXPECT_EQ(body["messages"][0]["content"], "I need 50 shirts");
    EXPECT_EQ(body["messages"][1]["role"], "assistant");
}

TEST_F(AnthropicClientTest, ExtractsLeadingTextBlock) {
    std::string response = R"({
        "id": "msg_1", "role": "assistant",
        "content": [{"type": "text", "text": "Happy to help."}, {"type": "text", "text": "ignored"}]
    })";

    EXPECT_EQ(dialogue::AnthropicClient::extractReplyText(response), "Happy to help.");
}

TEST_F(AnthropicClientTest, NonTextLeadingBlockYieldsEmptyReply) {
    std::string response = R"({"content": [{"type": "tool_use", "id": "t1", "name": "x", "input": {}}]})";

    EXPECT_EQ(dialogue::AnthropicClient::extractReplyText(response), "");
}

TEST_F(AnthropicClientTest, MalformedResponsesThrow) {
    EXPECT_THROW(dialogue::AnthropicClient::extractReplyText("<html>"), utils::LanguageModelException);
    EXPECT_THROW(dialogue::AnthropicClient::extractReplyText(R"({"content": []})"),
                 utils::LanguageModelException);
    EXPECT_THROW(dialogue::AnthropicClient::extractReplyText(R"({"type": "error"})"),
                 utils::LanguageModelException);
}

TEST_F(AnthropicClientTest, CancelledCallNeverReachesTheNetwork) {
    settings_.endpoint = "http://127.0.0.1:9/v1/messages";
    dialogue::AnthropicClient client(settings_);
    utils::CancellationToken cancel;
    cancel.cancel();

    EXPECT_THROW(client.complete("system", {}, cancel), utils::LanguageModelException);
}

TEST(WhisperApiClientTest, ExtractsText) {
    EXPECT_EQ(stt::WhisperApiClient::extractText(R"({"text": "I need fifty shirts"})"),
              "I need fifty shirts");
    EXPECT_EQ(stt::WhisperApiClient::extractText(R"({"text": ""})"), "");
}

TEST(WhisperApiClientTest, MissingTextThrows) {
    EXPECT_THROW(stt::WhisperApiClient::extractText(R"({"error": {"message": "bad audio"}})"),
                 utils::TranscriptionException);
    EXPECT_THROW(stt::WhisperApiClient::extractText("not json"), utils::TranscriptionException);
}

TEST(WhisperApiClientTest, CancelledTranscriptionThrows) {
    utils::TranscriptionSettings settings;
    settings.endpoint = "http://127.0.0.1:9/v1/audio/transcriptions";
    stt::WhisperApiClient client(settings);
    utils::CancellationToken cancel;
    cancel.cancel();

    EXPECT_THROW(client.transcribe({0x1a, 0x45}, cancel), utils::TranscriptionException);
}

TEST(ElevenLabsClientTest, RequestShape) {
    utils::SynthesisSettings settings;
    settings.baseUrl = "https://tts.example/v1/text-to-speech";
    settings.voiceId = "voice123";
    settings.modelId = "turbo";
    settings.stability = 0.4;
    settings.similarityBoost = 0.9;
    tts::ElevenLabsClient client(settings);

    EXPECT_EQ(client.streamUrl(), "https://tts.example/v1/text-to-speech/voice123/stream");

    json body = json::parse(client.buildRequestBody("Your quote is ready."));
    EXPECT_EQ(body["text"], "Your quote is ready.");
    EXPECT_EQ(body["model_id"], "turbo");
    EXPECT_DOUBLE_EQ(body["voice_settings"]["stability"].get<double>(), 0.4);
    EXPECT_DOUBLE_EQ(body["voice_settings"]["similarity_boost"].get<double>(), 0.9);
}

TEST(ElevenLabsClientTest, CancelledSynthesisThrows) {
    utils::SynthesisSettings settings;
    settings.baseUrl = "http://127.0.0.1:9/v1/text-to-speech";
    tts::ElevenLabsClient client(settings);
    utils::CancellationToken cancel;
    cancel.cancel();
    bool chunkSeen = false;

    EXPECT_THROW(client.streamSynthesis("hello", [&](const uint8_t*, size_t) { chunkSeen = true; }, cancel),
                 utils::SynthesisException);
    EXPECT_FALSE(chunkSeen);
}
