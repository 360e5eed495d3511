#pragma once
#include <thread>
#include <atomic>
#include <mutex>
#include <string>
#include <memory>
#include "core/ServerConfig.hpp"

namespace extronctl {

class CommandDispatcher;
class RpcProtocol;

/**
 * @brief Serves the control calls over WebSocket.
 *
 * Each text frame carries one JSON rpc request; calls run on a worker pool
 * and their rpc_result is written back on the same session. Shutdown (from
 * stopServer, SIGINT/SIGTERM or stop()) stops accepting, drains in-flight
 * calls for the configured grace period, answers anything still outstanding
 * with ShutdownInProgress and closes every session.
 */
class WebSocketServer {
public:
    WebSocketServer(const ServerConfig& config, CommandDispatcher& dispatcher);
    ~WebSocketServer();

    // Bind and start serving; throws std::runtime_error if the listen
    // address cannot be used.
    void start();
    // Begin orderly shutdown and return immediately. Safe from any thread.
    void request_stop();
    // Block until shutdown has completed.
    void wait();
    void stop();

    // Bound port; differs from the configured one when that was 0.
    unsigned short port() const;
    bool running() const;

private:
    struct Impl;
    class Session;

    void run_event_loop();
    void do_accept();
    void shutdown_sequence();
    void handle_message(const std::shared_ptr<Session>& session, const std::string& data);
    void impl_remove_session(const std::shared_ptr<Session>& session);

    ServerConfig config;
    CommandDispatcher& dispatcher;
    std::unique_ptr<RpcProtocol> protocol;
    std::shared_ptr<Impl> impl;

    std::atomic<bool> is_running{false};
    std::atomic<unsigned short> bound_port{0};
    std::mutex lifecycle_m;
    bool stop_requested = false;
    std::thread event_thread;
    std::thread shutdown_thread;
};

} // namespace extronctl
