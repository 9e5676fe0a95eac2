#include "core/websocket_server.hpp"
#include "utils/error_handler.hpp"
#include "utils/logging.hpp"

#include <App.h>
#include <nlohmann/json.hpp>

#include <random>
#include <sstream>
#include <vector>

namespace printvoice {
namespace core {

namespace {

struct PerSocketData {
    std::string sessionId;
};

using VoiceSocket = uWS::WebSocket<false, true, PerSocketData>;

constexpr unsigned int kMaxPayloadLength = 16 * 1024 * 1024;

} // namespace

// Socket reference shared between the loop thread and session transports.
// ws is only read or written on the loop thread.
struct SocketHandle {
    uWS::Loop* loop = nullptr;
    std::string sessionId;
    std::atomic<bool> open{true};
    VoiceSocket* ws = nullptr;
    VoiceSessionManager* manager = nullptr;
    // Loop thread only
    size_t droppedFrames = 0;
};

namespace {

class WebSocketTransport : public SessionTransport {
public:
    explicit WebSocketTransport(std::shared_ptr<SocketHandle> handle) : handle_(std::move(handle)) {}

    bool send(const std::string& payload, Delivery delivery) override {
        if (!handle_->open.load()) {
            return false;
        }
        auto handle = handle_;
        handle_->loop->defer([handle, payload, delivery]() {
            if (!handle->ws) {
                return;
            }
            if (handle->ws->send(payload, uWS::OpCode::TEXT) != VoiceSocket::SendStatus::DROPPED) {
                return;
            }
            if (delivery == Delivery::BEST_EFFORT) {
                // Logged once per connection
                if (handle->droppedFrames++ == 0) {
                    utils::Logger::warn("Backpressure limit reached for session " + handle->sessionId +
                                        ", dropping audio frames");
                }
                return;
            }
            utils::Logger::warn("Send dropped for session " + handle->sessionId);
            handle->manager->handleTransportError(handle->sessionId, "Send dropped: backpressure limit exceeded");
        });
        return true;
    }

    void close(int code, const std::string& reason) override {
        bool expected = true;
        if (!handle_->open.compare_exchange_strong(expected, false)) {
            return;
        }
        auto handle = handle_;
        handle_->loop->defer([handle, code, reason]() {
            if (!handle->ws) {
                return;
            }
            VoiceSocket* ws = handle->ws;
            handle->ws = nullptr;
            ws->end(code, reason);
        });
    }

    bool isOpen() const override { return handle_->open.load(); }

private:
    std::shared_ptr<SocketHandle> handle_;
};

} // namespace

WebSocketServer::WebSocketServer(const utils::ServerSettings& settings, VoiceSessionManager& manager)
    : settings_(settings),
      manager_(manager),
      running_(false),
      stopRequested_(false),
      loop_(nullptr),
      listenSocket_(nullptr) {
}

WebSocketServer::~WebSocketServer() {
    stop();
}

std::string WebSocketServer::generateSessionId() {
    static thread_local std::mt19937 gen(std::random_device{}());
    std::uniform_int_distribution<> dis(0, 15);

    std::stringstream ss;
    for (int i = 0; i < 32; ++i) {
        if (i == 8 || i == 12 || i == 16 || i == 20) {
            ss << '-';
        }
        ss << std::hex << dis(gen);
    }
    return ss.str();
}

std::string WebSocketServer::buildHealthResponse() const {
    nlohmann::json health;
    health["status"] = "ok";
    health["service"] = "PrintVoice voice pipeline";
    health["active_sessions"] = manager_.getActiveSessionCount();
    health["tools"] = manager_.getToolNames();
    return health.dump();
}

void WebSocketServer::run() {
    uWS::App app;
    loop_.store(uWS::Loop::get());

    uWS::App::WebSocketBehavior<PerSocketData> behavior;
    behavior.maxPayloadLength = kMaxPayloadLength;
    behavior.maxBackpressure = static_cast<unsigned int>(settings_.maxBackpressureBytes);
    behavior.closeOnBackpressureLimit = false;

    behavior.upgrade = [](auto* res, auto* req, auto* context) {
        std::string sessionId = generateSessionId();
        utils::Logger::debug("WebSocket upgrade request, assigning session ID: " + sessionId);
        res->template upgrade<PerSocketData>(
            PerSocketData{sessionId},
            req->getHeader("sec-websocket-key"),
            req->getHeader("sec-websocket-protocol"),
            req->getHeader("sec-websocket-extensions"),
            context);
    };

    behavior.open = [this](auto* ws) {
        handleOpen(ws->getUserData()->sessionId, ws);
    };

    behavior.message = [this](auto* ws, std::string_view message, uWS::OpCode) {
        // Text and binary frames share one classification
        manager_.handleFrame(ws->getUserData()->sessionId, message);
    };

    behavior.close = [this](auto* ws, int code, std::string_view) {
        handleClose(ws->getUserData()->sessionId, code);
    };

    app.ws<PerSocketData>(settings_.path, std::move(behavior));

    app.get("/health", [this](auto* res, auto*) {
        try {
            res->writeStatus("200 OK")
               ->writeHeader("Content-Type", "application/json")
               ->writeHeader("Cache-Control", "no-cache")
               ->end(buildHealthResponse());
        } catch (const std::exception& e) {
            utils::Logger::error("Exception in health check endpoint: " + std::string(e.what()));
            res->writeStatus("500 Internal Server Error")
               ->writeHeader("Content-Type", "application/json")
               ->end("{\"status\":\"error\",\"message\":\"Internal server error\"}");
        }
    });

    app.listen(settings_.port, [this](auto* listenSocket) {
        if (listenSocket) {
            listenSocket_ = listenSocket;
            running_ = true;
            utils::Logger::info("WebSocket server listening on port " + std::to_string(settings_.port) +
                                ", voice channel at " + settings_.path);
        } else {
            utils::Logger::error("Failed to listen on port " + std::to_string(settings_.port));
        }
    });

    if (!running_) {
        loop_.store(nullptr);
        throw utils::WebSocketException("Failed to listen on port " + std::to_string(settings_.port));
    }
    if (stopRequested_) {
        closeAllSockets();
    }

    app.run();

    running_ = false;
    loop_.store(nullptr);
    utils::Logger::info("WebSocket server stopped");
}

void WebSocketServer::stop() {
    stopRequested_ = true;
    uWS::Loop* loop = loop_.load();
    if (!loop) {
        return;
    }
    loop->defer([this]() { closeAllSockets(); });
}

void WebSocketServer::closeAllSockets() {
    if (listenSocket_) {
        us_listen_socket_close(0, listenSocket_);
        listenSocket_ = nullptr;
    }

    // end() fires the close handler, which edits sockets_
    std::vector<std::shared_ptr<SocketHandle>> handles;
    for (const auto& entry : sockets_) {
        handles.push_back(entry.second);
    }
    for (const auto& handle : handles) {
        handle->open = false;
        if (handle->ws) {
            VoiceSocket* ws = handle->ws;
            handle->ws = nullptr;
            ws->end(1001, "Server shutting down");
        }
    }
}

void WebSocketServer::handleOpen(const std::string& sessionId, void* ws) {
    auto handle = std::make_shared<SocketHandle>();
    handle->loop = loop_.load();
    handle->sessionId = sessionId;
    handle->ws = static_cast<VoiceSocket*>(ws);
    handle->manager = &manager_;
    sockets_[sessionId] = handle;

    try {
        manager_.openSession(sessionId, std::make_shared<WebSocketTransport>(handle));
    } catch (const utils::PrintVoiceException& e) {
        utils::ErrorHandler::getInstance().reportError(e, "websocket_open", sessionId);
        handle->open = false;
        handle->ws = nullptr;
        static_cast<VoiceSocket*>(ws)->end(1011, "Internal error");
    }
}

void WebSocketServer::handleClose(const std::string& sessionId, int code) {
    auto it = sockets_.find(sessionId);
    if (it != sockets_.end()) {
        it->second->open = false;
        it->second->ws = nullptr;
        sockets_.erase(it);
    }

    if (code != 1000 && code != 1001 && code != 1005) {
        utils::Logger::warn("Connection " + sessionId + " closed abnormally with code " + std::to_string(code));
    }
    manager_.closeSession(sessionId);
}

} // namespace core
} // namespace printvoice
