#include <atomic>
#include <csignal>
#include <functional>
#include <iostream>
#include <memory>
#include <string>
#include <thread>

#include <pthread.h>

#include "business/in_memory_business_layer.hpp"
#include "core/voice_session_manager.hpp"
#include "core/websocket_server.hpp"
#include "dialogue/anthropic_client.hpp"
#include "stt/whisper_api_client.hpp"
#include "tts/elevenlabs_client.hpp"
#include "utils/config.hpp"
#include "utils/error_handler.hpp"
#include "utils/http_client.hpp"
#include "utils/logging.hpp"

using namespace printvoice;

namespace {

void printUsage(const char* program) {
    std::cout << "Usage: " << program << " [options]\n"
              << "Options:\n"
              << "  --config <path>     Configuration file (default: config/server.json)\n"
              << "  --port <port>       Set server port (default: 8080)\n"
              << "  --log-level <lvl>   debug, info, warn or error\n"
              << "  --help, -h          Show this help message\n";
}

/**
 * Waits for SIGINT/SIGTERM on its own thread. The destructor wakes and
 * joins the thread, so the callback never outlives what it captures.
 */
class SignalWatcher {
public:
    SignalWatcher(sigset_t signals, std::function<void()> onSignal)
        : signals_(signals), onSignal_(std::move(onSignal)), thread_([this]() { wait(); }) {}

    ~SignalWatcher() {
        done_ = true;
        pthread_kill(thread_.native_handle(), SIGTERM);
        thread_.join();
    }

private:
    void wait() {
        int received = 0;
        if (sigwait(&signals_, &received) == 0 && !done_) {
            utils::Logger::info("Received signal " + std::to_string(received) + ", shutting down");
            onSignal_();
        }
    }

    sigset_t signals_;
    std::function<void()> onSignal_;
    std::atomic<bool> done_{false};
    std::thread thread_;
};

} // namespace

int main(int argc, char* argv[]) {
    std::string configPath = "config/server.json";
    int portOverride = 0;
    std::string logLevelOverride;

    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];
        if (arg == "--config" && i + 1 < argc) {
            configPath = argv[++i];
        } else if (arg == "--port" && i + 1 < argc) {
            try {
                portOverride = std::stoi(argv[++i]);
            } catch (const std::exception&) {
                std::cerr << "Invalid port: " << argv[i] << std::endl;
                return 1;
            }
        } else if (arg == "--log-level" && i + 1 < argc) {
            logLevelOverride = argv[++i];
        } else if (arg == "--help" || arg == "-h") {
            printUsage(argv[0]);
            return 0;
        } else {
            std::cerr << "Unknown option: " << arg << std::endl;
            printUsage(argv[0]);
            return 1;
        }
    }

    // Signals are taken by a dedicated thread so the event loop can be
    // stopped through its thread-safe defer queue
    sigset_t signals;
    sigemptyset(&signals);
    sigaddset(&signals, SIGINT);
    sigaddset(&signals, SIGTERM);
    pthread_sigmask(SIG_BLOCK, &signals, nullptr);

    try {
        auto config = utils::Config::load(configPath);
        if (portOverride != 0) {
            config.server.port = portOverride;
        }
        if (!logLevelOverride.empty()) {
            config.server.logLevel = logLevelOverride;
        }
        config.validate();

        utils::Logger::initialize(utils::Logger::parseLevel(config.getLogLevel()));
        utils::HttpClient::globalInit();

        core::VoiceSessionManager::Collaborators collaborators;
        collaborators.transcriber = std::make_shared<stt::WhisperApiClient>(config.transcription);
        collaborators.languageModel = std::make_shared<dialogue::AnthropicClient>(config.languageModel);
        collaborators.synthesizer = std::make_shared<tts::ElevenLabsClient>(config.synthesis);
        collaborators.business = std::make_shared<business::InMemoryBusinessLayer>(config.business.taxRate);

        core::VoiceSessionManager manager(config, collaborators);
        core::WebSocketServer server(config.server, manager);

        SignalWatcher signalWatcher(signals, [&server]() { server.stop(); });

        utils::Logger::info("Starting PrintVoice server on port " + std::to_string(config.getPort()));
        server.run();

        manager.shutdown();
        utils::HttpClient::globalCleanup();
        utils::Logger::info("Shutdown complete, " +
                            std::to_string(utils::ErrorHandler::getInstance().getErrorCount()) +
                            " errors recorded");
    } catch (const utils::PrintVoiceException& e) {
        const auto& info = e.getErrorInfo();
        std::cerr << "Error: " << e.what();
        if (!info.details.empty()) {
            std::cerr << " (" << info.details << ")";
        }
        std::cerr << std::endl;
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }

    return 0;
}
