#include <gtest/gtest.h>
#include "utils/config.hpp"
#include "utils/error_handler.hpp"
#include <cstdio>
#include <cstdlib>
#include <fstream>

using namespace printvoice::utils;

class ConfigTest : public ::testing::Test {
protected:
    void SetUp() override {
        unsetenv("PRINTVOICE_PORT");
        unsetenv("PRINTVOICE_LOG_LEVEL");
        unsetenv("ANTHROPIC_API_KEY");
        tempPath_ = ::testing::TempDir() + "printvoice_config_test.json";
    }

    void TearDown() override {
        unsetenv("PRINTVOICE_PORT");
        unsetenv("PRINTVOICE_LOG_LEVEL");
        unsetenv("ANTHROPIC_API_KEY");
        std::remove(tempPath_.c_str());
    }

    void writeConfig(const std::string& content) {
        std::ofstream file(tempPath_);
        file << content;
    }

    std::string tempPath_;
};

TEST_F(ConfigTest, DefaultValues) {
    auto config = Config::load("nonexistent.json");
    EXPECT_EQ(config.getPort(), 8080);
    EXPECT_EQ(config.getLogLevel(), "info");
    EXPECT_EQ(config.server.path, "/ws/voice-pipeline");
    EXPECT_EQ(config.session.maxAudioChunks, 1000u);
    EXPECT_EQ(config.session.maxHistoryTurns, 20u);
    EXPECT_EQ(config.session.idleTimeout, std::chrono::minutes(30));
    EXPECT_EQ(config.session.processingTimeout, std::chrono::seconds(60));
    EXPECT_DOUBLE_EQ(config.business.taxRate, 0.08);
    EXPECT_NO_THROW(config.validate());
}

TEST_F(ConfigTest, PartialJsonKeepsDefaults) {
    auto config = Config::fromJson(R"({
        "server": {"port": 9000},
        "session": {"idle_timeout_ms": 5000, "max_history_turns": 10},
        "language_model": {"model": "claude-test", "max_tokens": 256}
    })");

    EXPECT_EQ(config.getPort(), 9000);
    EXPECT_EQ(config.server.workerThreads, 4u);
    EXPECT_EQ(config.session.idleTimeout, std::chrono::milliseconds(5000));
    EXPECT_EQ(config.session.maxHistoryTurns, 10u);
    EXPECT_EQ(config.session.maxAudioChunks, 1000u);
    EXPECT_EQ(config.languageModel.model, "claude-test");
    EXPECT_EQ(config.languageModel.maxTokens, 256);
    EXPECT_EQ(config.languageModel.apiVersion, "2023-06-01");
}

TEST_F(ConfigTest, MalformedJsonThrows) {
    EXPECT_THROW(Config::fromJson("{ not json"), ConfigurationException);
    EXPECT_THROW(Config::fromJson("[1, 2]"), ConfigurationException);
}

TEST_F(ConfigTest, WrongValueTypeThrows) {
    EXPECT_THROW(Config::fromJson(R"({"server": {"port": "eighty"}})"), ConfigurationException);
}

TEST_F(ConfigTest, LoadFromFile) {
    writeConfig(R"({"server": {"port": 7070, "log_level": "debug"}, "business": {"tax_rate": 0.1}})");

    auto config = Config::load(tempPath_);
    EXPECT_EQ(config.getPort(), 7070);
    EXPECT_EQ(config.getLogLevel(), "debug");
    EXPECT_DOUBLE_EQ(config.business.taxRate, 0.1);
}

TEST_F(ConfigTest, EnvironmentOverridesFile) {
    writeConfig(R"({"server": {"port": 7070}, "language_model": {"api_key": "from-file"}})");
    setenv("PRINTVOICE_PORT", "6060", 1);
    setenv("ANTHROPIC_API_KEY", "from-env", 1);

    auto config = Config::load(tempPath_);
    EXPECT_EQ(config.getPort(), 6060);
    EXPECT_EQ(config.languageModel.apiKey, "from-env");
}

TEST_F(ConfigTest, NonNumericPortInEnvironmentThrows) {
    setenv("PRINTVOICE_PORT", "abc", 1);
    EXPECT_THROW(Config::load("nonexistent.json"), ConfigurationException);
}

TEST_F(ConfigTest, ValidateRejectsBadValues) {
    Config config;
    config.server.port = 0;
    EXPECT_THROW(config.validate(), ConfigurationException);

    config = Config();
    config.server.path = "ws";
    EXPECT_THROW(config.validate(), ConfigurationException);

    config = Config();
    config.session.historyTrimSlack = config.session.maxHistoryTurns;
    EXPECT_THROW(config.validate(), ConfigurationException);

    config = Config();
    config.session.processingTimeout = std::chrono::milliseconds(0);
    EXPECT_THROW(config.validate(), ConfigurationException);

    config = Config();
    config.business.taxRate = -0.01;
    EXPECT_THROW(config.validate(), ConfigurationException);

    config = Config();
    config.server.maxBackpressureBytes = 0;
    EXPECT_THROW(config.validate(), ConfigurationException);
}

TEST_F(ConfigTest, BackpressureLimitFitsStreamedAudio) {
    EXPECT_GE(Config().server.maxBackpressureBytes, 4u * 1024 * 1024);

    auto config = Config::fromJson(R"({"server": {"max_backpressure_bytes": 1048576}})");
    EXPECT_EQ(config.server.maxBackpressureBytes, 1048576u);
    EXPECT_NO_THROW(config.validate());
}
