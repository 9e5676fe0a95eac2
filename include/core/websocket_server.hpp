#pragma once

#include "core/voice_session_manager.hpp"
#include "utils/config.hpp"

#include <atomic>
#include <memory>
#include <string>
#include <unordered_map>

struct us_listen_socket_t;

namespace uWS {
struct Loop;
}

namespace printvoice {
namespace core {

struct SocketHandle;

/**
 * uWebSockets front end: one WebSocket route for the voice channel and a
 * GET /health endpoint. All socket operations happen on the event loop
 * thread; sessions on worker threads reach their socket through a handle
 * that defers each operation onto the loop.
 */
class WebSocketServer {
public:
    WebSocketServer(const utils::ServerSettings& settings, VoiceSessionManager& manager);
    ~WebSocketServer();

    WebSocketServer(const WebSocketServer&) = delete;
    WebSocketServer& operator=(const WebSocketServer&) = delete;

    // Blocks running the event loop until stop() is called
    void run();

    // Safe to call from any thread
    void stop();

    bool isRunning() const { return running_.load(); }

    std::string buildHealthResponse() const;
    static std::string generateSessionId();

private:
    void handleOpen(const std::string& sessionId, void* ws);
    void handleClose(const std::string& sessionId, int code);
    void closeAllSockets();

    utils::ServerSettings settings_;
    VoiceSessionManager& manager_;

    std::atomic<bool> running_;
    std::atomic<bool> stopRequested_;
    std::atomic<uWS::Loop*> loop_;
    us_listen_socket_t* listenSocket_;

    // Loop thread only
    std::unordered_map<std::string, std::shared_ptr<SocketHandle>> sockets_;
};

} // namespace core
} // namespace printvoice
