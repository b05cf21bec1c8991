#pragma once
#include <atomic>
#include <chrono>
#include <memory>
#include <string>
#include <thread>

#include "core/Config.hpp"

namespace wmn {

class SnapshotProtocol;

// Query channel for dashboards and tools. Accepts WebSocket clients on
// cfg.port, answers their RPC requests and pushes a fleet_update to every
// client each broadcast interval.
class WebSocketServer {
public:
    WebSocketServer(ServerConfig cfg, SnapshotProtocol& protocol);
    ~WebSocketServer();

    // Throws std::runtime_error when the port cannot be bound.
    void start();
    void stop();

    // Bound port (differs from the configured one when that was 0).
    int port() const { return bound_port_.load(); }
    std::size_t session_count() const;

private:
    struct Impl;

    void run_event_loop();
    void broadcast_loop();
    void rpc_loop();

    ServerConfig cfg_;
    SnapshotProtocol& protocol_;

    std::atomic<bool> running_{false};
    std::atomic<int> bound_port_{0};
    std::thread event_thread_;
    std::thread broadcast_thread_;
    std::thread rpc_thread_;
    std::shared_ptr<Impl> impl_;
};

} // namespace wmn
