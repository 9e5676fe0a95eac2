#pragma once

#include <chrono>
#include <cstddef>
#include <string>

namespace printvoice {
namespace utils {

struct ServerSettings {
    int port = 8080;
    std::string path = "/ws/voice-pipeline";
    size_t workerThreads = 4;
    std::string logLevel = "info";
    // Per-socket send buffer; beyond it audio frames are dropped
    size_t maxBackpressureBytes = 8 * 1024 * 1024;
};

struct SessionSettings {
    size_t maxAudioChunks = 1000;
    size_t maxHistoryTurns = 20;
    // History is cut to maxHistoryTurns - historyTrimSlack once full
    size_t historyTrimSlack = 2;
    std::chrono::milliseconds idleTimeout = std::chrono::minutes(30);
    std::chrono::milliseconds processingTimeout = std::chrono::seconds(60);
};

struct TranscriptionSettings {
    std::string endpoint = "https://api.openai.com/v1/audio/transcriptions";
    std::string apiKey;
    std::string model = "whisper-1";
    std::string language = "en";
    std::string fileName = "audio.webm";
    std::string mimeType = "audio/webm";
    long timeoutMs = 30000;
};

struct LanguageModelSettings {
    std::string endpoint = "https://api.anthropic.com/v1/messages";
    std::string apiKey;
    std::string apiVersion = "2023-06-01";
    std::string model = "claude-sonnet-4-20250514";
    int maxTokens = 1024;
    long timeoutMs = 30000;
};

struct SynthesisSettings {
    std::string baseUrl = "https://api.elevenlabs.io/v1/text-to-speech";
    std::string apiKey;
    std::string voiceId = "pNInz6obpgDQGcFmaJgB";
    std::string modelId = "eleven_turbo_v2_5";
    double stability = 0.5;
    double similarityBoost = 0.75;
    long timeoutMs = 30000;
};

struct BusinessSettings {
    double taxRate = 0.08;
};

class Config {
public:
    /**
     * Load configuration from a JSON file, then apply environment overrides.
     * A missing file yields defaults; a malformed one throws
     * ConfigurationException.
     */
    static Config load(const std::string& configPath);

    /**
     * Parse configuration from a JSON document. Keys that are absent keep
     * their defaults.
     */
    static Config fromJson(const std::string& json);

    /**
     * Override secrets and a few server settings from the environment:
     * OPENAI_API_KEY, ANTHROPIC_API_KEY, ELEVENLABS_API_KEY,
     * PRINTVOICE_PORT, PRINTVOICE_LOG_LEVEL.
     */
    void applyEnvironment();

    // Throws ConfigurationException describing the first invalid value
    void validate() const;

    int getPort() const { return server.port; }
    std::string getLogLevel() const { return server.logLevel; }

    ServerSettings server;
    SessionSettings session;
    TranscriptionSettings transcription;
    LanguageModelSettings languageModel;
    SynthesisSettings synthesis;
    BusinessSettings business;
};

} // namespace utils
} // namespace printvoice
