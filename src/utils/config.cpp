#include "utils/config.hpp"
#include "utils/error_handler.hpp"
#include "utils/logging.hpp"
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <limits>
#include <nlohmann/json.hpp>
#include <sstream>

namespace printvoice {
namespace utils {

namespace {

std::string envOrEmpty(const char* name) {
    const char* value = std::getenv(name);
    return value ? std::string(value) : std::string();
}

} // namespace

Config Config::load(const std::string& configPath) {
    Config config;

    if (!std::filesystem::exists(configPath)) {
        Logger::info("Configuration file not found: " + configPath + ", using defaults");
    } else {
        std::ifstream file(configPath);
        if (!file.is_open()) {
            throw ConfigurationException("Failed to open configuration file", configPath);
        }

        std::stringstream buffer;
        buffer << file.rdbuf();
        std::string json = buffer.str();

        if (json.empty()) {
            Logger::info("Empty configuration file, using defaults");
        } else {
            config = fromJson(json);
            Logger::info("Loaded configuration from " + configPath);
        }
    }

    config.applyEnvironment();
    return config;
}

Config Config::fromJson(const std::string& json) {
    nlohmann::json root;
    try {
        root = nlohmann::json::parse(json);
    } catch (const nlohmann::json::parse_error& e) {
        throw ConfigurationException("Malformed configuration JSON", e.what());
    }

    if (!root.is_object()) {
        throw ConfigurationException("Configuration root must be an object");
    }

    Config config;
    try {
        if (root.contains("server")) {
            const auto& s = root.at("server");
            config.server.port = s.value("port", config.server.port);
            config.server.path = s.value("path", config.server.path);
            config.server.workerThreads = s.value("worker_threads", config.server.workerThreads);
            config.server.logLevel = s.value("log_level", config.server.logLevel);
            config.server.maxBackpressureBytes =
                s.value("max_backpressure_bytes", config.server.maxBackpressureBytes);
        }

        if (root.contains("session")) {
            const auto& s = root.at("session");
            config.session.maxAudioChunks = s.value("max_audio_chunks", config.session.maxAudioChunks);
            config.session.maxHistoryTurns = s.value("max_history_turns", config.session.maxHistoryTurns);
            config.session.historyTrimSlack = s.value("history_trim_slack", config.session.historyTrimSlack);
            config.session.idleTimeout = std::chrono::milliseconds(
                s.value("idle_timeout_ms", static_cast<long long>(config.session.idleTimeout.count())));
            config.session.processingTimeout = std::chrono::milliseconds(
                s.value("processing_timeout_ms", static_cast<long long>(config.session.processingTimeout.count())));
        }

        if (root.contains("transcription")) {
            const auto& t = root.at("transcription");
            config.transcription.endpoint = t.value("endpoint", config.transcription.endpoint);
            config.transcription.apiKey = t.value("api_key", config.transcription.apiKey);
            config.transcription.model = t.value("model", config.transcription.model);
            config.transcription.language = t.value("language", config.transcription.language);
            config.transcription.fileName = t.value("file_name", config.transcription.fileName);
            config.transcription.mimeType = t.value("mime_type", config.transcription.mimeType);
            config.transcription.timeoutMs = t.value("timeout_ms", config.transcription.timeoutMs);
        }

        if (root.contains("language_model")) {
            const auto& l = root.at("language_model");
            config.languageModel.endpoint = l.value("endpoint", config.languageModel.endpoint);
            config.languageModel.apiKey = l.value("api_key", config.languageModel.apiKey);
            config.languageModel.apiVersion = l.value("api_version", config.languageModel.apiVersion);
            config.languageModel.model = l.value("model", config.languageModel.model);
            config.languageModel.maxTokens = l.value("max_tokens", config.languageModel.maxTokens);
            config.languageModel.timeoutMs = l.value("timeout_ms", config.languageModel.timeoutMs);
        }

        if (root.contains("synthesis")) {
            const auto& s = root.at("synthesis");
            config.synthesis.baseUrl = s.value("base_url", config.synthesis.baseUrl);
            config.synthesis.apiKey = s.value("api_key", config.synthesis.apiKey);
            config.synthesis.voiceId = s.value("voice_id", config.synthesis.voiceId);
            config.synthesis.modelId = s.value("model_id", config.synthesis.modelId);
            config.synthesis.stability = s.value("stability", config.synthesis.stability);
            config.synthesis.similarityBoost = s.value("similarity_boost", config.synthesis.similarityBoost);
            config.synthesis.timeoutMs = s.value("timeout_ms", config.synthesis.timeoutMs);
        }

        if (root.contains("business")) {
            const auto& b = root.at("business");
            config.business.taxRate = b.value("tax_rate", config.business.taxRate);
        }
    } catch (const nlohmann::json::exception& e) {
        throw ConfigurationException("Invalid configuration value", e.what());
    }

    return config;
}

void Config::applyEnvironment() {
    std::string openaiKey = envOrEmpty("OPENAI_API_KEY");
    if (!openaiKey.empty()) {
        transcription.apiKey = openaiKey;
    }

    std::string anthropicKey = envOrEmpty("ANTHROPIC_API_KEY");
    if (!anthropicKey.empty()) {
        languageModel.apiKey = anthropicKey;
    }

    std::string elevenlabsKey = envOrEmpty("ELEVENLABS_API_KEY");
    if (!elevenlabsKey.empty()) {
        synthesis.apiKey = elevenlabsKey;
    }

    std::string port = envOrEmpty("PRINTVOICE_PORT");
    if (!port.empty()) {
        try {
            server.port = std::stoi(port);
        } catch (const std::exception&) {
            throw ConfigurationException("PRINTVOICE_PORT is not a number", port);
        }
    }

    std::string logLevel = envOrEmpty("PRINTVOICE_LOG_LEVEL");
    if (!logLevel.empty()) {
        server.logLevel = logLevel;
    }
}

void Config::validate() const {
    if (server.port <= 0 || server.port > 65535) {
        throw ConfigurationException("Port out of range", std::to_string(server.port));
    }
    if (server.path.empty() || server.path.front() != '/') {
        throw ConfigurationException("WebSocket path must start with '/'", server.path);
    }
    if (server.workerThreads == 0) {
        throw ConfigurationException("worker_threads must be positive");
    }
    if (server.maxBackpressureBytes == 0 ||
        server.maxBackpressureBytes > std::numeric_limits<unsigned int>::max()) {
        throw ConfigurationException("max_backpressure_bytes out of range",
                                     std::to_string(server.maxBackpressureBytes));
    }
    if (session.maxAudioChunks == 0) {
        throw ConfigurationException("max_audio_chunks must be positive");
    }
    if (session.maxHistoryTurns == 0) {
        throw ConfigurationException("max_history_turns must be positive");
    }
    if (session.historyTrimSlack >= session.maxHistoryTurns) {
        throw ConfigurationException("history_trim_slack must be smaller than max_history_turns");
    }
    if (session.idleTimeout.count() <= 0) {
        throw ConfigurationException("idle_timeout_ms must be positive");
    }
    if (session.processingTimeout.count() <= 0) {
        throw ConfigurationException("processing_timeout_ms must be positive");
    }
    if (business.taxRate < 0.0) {
        throw ConfigurationException("tax_rate must not be negative");
    }
}

} // namespace utils
} // namespace printvoice
