#include "WebSocketServer.hpp"
#include "CommandDispatcher.hpp"
#include "RpcProtocol.hpp"
#include "core/ControlError.hpp"
#include <iostream>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <set>
#include <unordered_map>
#include <utility>
// Boost.Beast / Asio for WebSocket
#include <boost/beast/core.hpp>
#include <boost/beast/websocket.hpp>
#include <boost/asio/dispatch.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/signal_set.hpp>
#include <boost/asio/strand.hpp>
#include <boost/asio/thread_pool.hpp>
#include <nlohmann/json.hpp>

namespace beast = boost::beast;         // from <boost/beast.hpp>
namespace websocket = beast::websocket; // from <boost/beast/websocket.hpp>
namespace asio = boost::asio;           // from <boost/asio.hpp>
using tcp = asio::ip::tcp;              // from <boost/asio/ip/tcp.hpp>
using json = nlohmann::json;

namespace extronctl {

// One client connection. All stream operations run on the session's strand.
class WebSocketServer::Session : public std::enable_shared_from_this<Session> {
public:
    Session(tcp::socket&& socket, WebSocketServer& owner)
    : ws(std::move(socket)), server(owner) {}

    void run() {
        asio::dispatch(ws.get_executor(), [self = shared_from_this()]() { self->on_run(); });
    }

    // Queue a text frame; safe from any thread.
    void send(std::string payload) {
        asio::post(ws.get_executor(), [self = shared_from_this(), p = std::move(payload)]() mutable {
            if (self->close_sent) return;
            self->outbox.push_back(std::move(p));
            if (self->outbox.size() == 1) self->do_write();
        });
    }

    // Close after pending replies have been written.
    void close() {
        asio::post(ws.get_executor(), [self = shared_from_this()]() {
            if (self->closing) return;
            self->closing = true;
            if (!self->accepted) {
                beast::error_code ec;
                beast::get_lowest_layer(self->ws).socket().close(ec);
                return;
            }
            if (self->outbox.empty()) self->do_close();
        });
    }

private:
    void on_run() {
        ws.set_option(websocket::stream_base::timeout::suggested(beast::role_type::server));
        ws.async_accept([self = shared_from_this()](beast::error_code ec) { self->on_accept(ec); });
    }

    void on_accept(beast::error_code ec) {
        if (ec) {
            std::cerr << "WebSocketServer: websocket accept failed: " << ec.message() << std::endl;
            server.impl_remove_session(shared_from_this());
            return;
        }
        accepted = true;
        ws.text(true);
        do_read();
    }

    void do_read() {
        ws.async_read(buffer, [self = shared_from_this()](beast::error_code ec, std::size_t) {
            self->on_read(ec);
        });
    }

    void on_read(beast::error_code ec) {
        if (ec) {
            if (ec != websocket::error::closed && !closing) {
                std::cerr << "WebSocketServer: " << errors::MSG_E2410_SESSION_DROPPED << " (" << ec.message() << ")" << std::endl;
            }
            server.impl_remove_session(shared_from_this());
            return;
        }
        auto data = beast::buffers_to_string(buffer.data());
        buffer.consume(buffer.size());
        server.handle_message(shared_from_this(), data);
        do_read();
    }

    void do_write() {
        ws.async_write(asio::buffer(outbox.front()), [self = shared_from_this()](beast::error_code ec, std::size_t) {
            self->on_write(ec);
        });
    }

    void on_write(beast::error_code ec) {
        if (ec) {
            // the read loop notices the broken stream and drops the session
            outbox.clear();
            return;
        }
        outbox.pop_front();
        if (!outbox.empty()) {
            do_write();
        } else if (closing) {
            do_close();
        }
    }

    void do_close() {
        close_sent = true;
        ws.async_close(websocket::close_code::going_away, [self = shared_from_this()](beast::error_code) {});
    }

    websocket::stream<beast::tcp_stream> ws;
    beast::flat_buffer buffer;
    std::deque<std::string> outbox;
    bool accepted = false;
    bool closing = false;
    bool close_sent = false;
    WebSocketServer& server;
};

// Implementation details hidden behind PIMPL
struct WebSocketServer::Impl {
    // A call handed to the worker pool. Answered exactly once: by the worker,
    // or by shutdown if the grace period ran out first.
    struct Call {
        std::weak_ptr<Session> session;
        std::string id;
        Method method = Method::ListDevices;
        std::atomic<bool> answered{false};
    };

    asio::io_context ioc;
    tcp::acceptor acceptor;
    asio::signal_set signals;
    asio::thread_pool workers;

    std::mutex sessions_m;
    std::set<std::shared_ptr<Session>> sessions;

    std::mutex calls_m;
    std::condition_variable calls_cv;
    std::unordered_map<std::uint64_t, std::shared_ptr<Call>> calls;
    std::uint64_t next_call = 0;

    explicit Impl(unsigned int threads)
    : ioc(), acceptor(ioc), signals(ioc, SIGINT, SIGTERM), workers(threads) {}

    void add_session(std::shared_ptr<Session> s) {
        std::lock_guard<std::mutex> lk(sessions_m);
        sessions.insert(s);
        std::cerr << "WebSocketServer: client connected (count=" << sessions.size() << ")" << std::endl;
    }
    void remove_session(const std::shared_ptr<Session>& s) {
        std::lock_guard<std::mutex> lk(sessions_m);
        if (sessions.erase(s) == 0) return;
        std::cerr << "WebSocketServer: client disconnected (count=" << sessions.size() << ")" << std::endl;
    }
    std::size_t session_count() {
        std::lock_guard<std::mutex> lk(sessions_m);
        return sessions.size();
    }
    template<typename Fn>
    void for_each_session(Fn&& fn) {
        std::lock_guard<std::mutex> lk(sessions_m);
        for (auto &s : sessions) fn(s);
    }

    std::pair<std::uint64_t, std::shared_ptr<Call>> track(const std::shared_ptr<Session>& s, const RpcRequest& req) {
        auto call = std::make_shared<Call>();
        call->session = s;
        call->id = req.id;
        call->method = req.method;
        std::lock_guard<std::mutex> lk(calls_m);
        auto key = next_call++;
        calls.emplace(key, call);
        return { key, call };
    }

    // The reply is queued before the call leaves `calls`, so a drain that sees
    // the map empty never closes a session ahead of it.
    void complete(std::uint64_t key, const std::shared_ptr<Call>& call, const json& reply) {
        if (!call->answered.exchange(true)) {
            if (auto s = call->session.lock()) s->send(reply.dump());
        }
        {
            std::lock_guard<std::mutex> lk(calls_m);
            calls.erase(key);
        }
        calls_cv.notify_all();
    }

    // Block until every call other than stopServer has been answered, or the
    // grace period ends. Returns the number still outstanding.
    std::size_t wait_drained(std::chrono::milliseconds grace) {
        auto outstanding = [this]() {
            std::size_t n = 0;
            for (auto& [key, call] : calls) {
                if (call->method != Method::StopServer) ++n;
            }
            return n;
        };
        std::unique_lock<std::mutex> lk(calls_m);
        calls_cv.wait_for(lk, grace, [&]() { return outstanding() == 0; });
        return outstanding();
    }

    // Answer every call the grace period left behind.
    std::size_t abandon_pending() {
        std::unordered_map<std::uint64_t, std::shared_ptr<Call>> left;
        {
            std::lock_guard<std::mutex> lk(calls_m);
            left.swap(calls);
        }
        std::size_t n = 0;
        const ShutdownInProgressError err;
        for (auto& [key, call] : left) {
            // stopServer finishes on its own; its reply goes out if the session is still open
            if (call->method == Method::StopServer) continue;
            if (call->answered.exchange(true)) continue;
            if (auto s = call->session.lock()) s->send(RpcProtocol::build_error(call->id, err).dump());
            ++n;
        }
        return n;
    }
};

WebSocketServer::WebSocketServer(const ServerConfig& cfg, CommandDispatcher& d)
: config(cfg), dispatcher(d), protocol(std::make_unique<RpcProtocol>(d)) {}

WebSocketServer::~WebSocketServer() {
    stop();
}

void WebSocketServer::impl_remove_session(const std::shared_ptr<Session>& s) {
    if (impl) impl->remove_session(s);
}

void WebSocketServer::start() {
    if (is_running) return;

    impl = std::make_shared<Impl>(config.worker_threads);

    boost::system::error_code ec;
    tcp::resolver resolver(impl->ioc);
    auto results = resolver.resolve(config.listen_host, std::to_string(config.listen_port), ec);
    if (ec || results.empty()) {
        throw std::runtime_error("WebSocketServer: cannot resolve " + config.listen_address() + ": " + ec.message());
    }
    tcp::endpoint endpoint = results.begin()->endpoint();

    auto& acceptor = impl->acceptor;
    acceptor.open(endpoint.protocol(), ec);
    if (ec) throw std::runtime_error("WebSocketServer: acceptor.open failed: " + ec.message());
    acceptor.set_option(asio::socket_base::reuse_address(true), ec);
    if (ec) throw std::runtime_error("WebSocketServer: set_option failed: " + ec.message());
    acceptor.bind(endpoint, ec);
    if (ec) throw std::runtime_error("WebSocketServer: bind to " + config.listen_address() + " failed: " + ec.message());
    acceptor.listen(asio::socket_base::max_listen_connections, ec);
    if (ec) throw std::runtime_error("WebSocketServer: listen failed: " + ec.message());
    bound_port = acceptor.local_endpoint().port();

    impl->signals.async_wait([this](const boost::system::error_code& sec, int signo) {
        if (sec) return;
        std::cout << "WebSocketServer: signal " << signo << " received" << std::endl;
        request_stop();
    });

    do_accept();

    is_running = true;
    event_thread = std::thread([this](){ run_event_loop(); });
}

void WebSocketServer::do_accept() {
    impl->acceptor.async_accept(asio::make_strand(impl->ioc), [this](beast::error_code ec, tcp::socket socket) {
        if (ec) {
            if (ec == asio::error::operation_aborted || !impl->acceptor.is_open()) return;
            std::cerr << "WebSocketServer: accept error: " << ec.message() << std::endl;
        } else {
            auto s = std::make_shared<Session>(std::move(socket), *this);
            impl->add_session(s);
            s->run();
        }
        do_accept();
    });
}

void WebSocketServer::run_event_loop() {
    while (!impl->ioc.stopped()) {
        try {
            impl->ioc.run();
        } catch (const std::exception& e) {
            std::cerr << "WebSocketServer: I/O context error: " << e.what() << std::endl;
        }
    }
}

void WebSocketServer::handle_message(const std::shared_ptr<Session>& session, const std::string& data) {
    json msg = json::parse(data, nullptr, false);
    RpcRequest req;
    try {
        if (msg.is_discarded()) throw ControlRejectedError(errors::D2400_NOT_JSON);
        req = RpcProtocol::parse_request(msg);
    } catch (const ControlError& e) {
        std::string id;
        if (msg.is_object() && msg.contains("id") && msg["id"].is_string()) id = msg["id"].get<std::string>();
        std::cerr << "WebSocketServer: " << e.what() << std::endl;
        session->send(RpcProtocol::build_error(id, e).dump());
        return;
    }

    if (config.debug) {
        std::cerr << "WebSocketServer: call " << RpcProtocol::method_name(req.method) << " id=" << req.id << std::endl;
    }

    auto [key, call] = impl->track(session, req);
    asio::post(impl->workers, [this, key = key, call = call, req = std::move(req)]() {
        json reply = protocol->execute(req);
        impl->complete(key, call, reply);
    });
}

void WebSocketServer::request_stop() {
    std::lock_guard<std::mutex> lk(lifecycle_m);
    if (!is_running || stop_requested) return;
    stop_requested = true;
    shutdown_thread = std::thread([this](){ shutdown_sequence(); });
}

void WebSocketServer::shutdown_sequence() {
    std::cout << "WebSocketServer: shutting down (grace " << config.grace.count() << " ms)" << std::endl;
    dispatcher.begin_shutdown();

    asio::post(impl->ioc, [impl = impl]() {
        boost::system::error_code ec;
        impl->acceptor.close(ec);
        impl->signals.cancel(ec);
    });

    auto outstanding = impl->wait_drained(config.grace);
    if (outstanding > 0) {
        std::cerr << "WebSocketServer: grace period expired with " << outstanding
                  << " call(s) in flight" << std::endl;
    }
    auto abandoned = impl->abandon_pending();
    if (abandoned > 0) {
        std::cerr << "WebSocketServer: " << abandoned << " call(s) answered with ShutdownInProgress" << std::endl;
    }

    // cleanly close sessions
    impl->for_each_session([](const std::shared_ptr<Session>& s) { s->close(); });
    auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(1);
    while (impl->session_count() > 0 && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    impl->ioc.stop();
}

void WebSocketServer::wait() {
    if (event_thread.joinable()) event_thread.join();
    std::thread t;
    {
        std::lock_guard<std::mutex> lk(lifecycle_m);
        t = std::move(shutdown_thread);
    }
    if (t.joinable()) t.join();
    if (impl) impl->workers.join();
    is_running = false;
}

void WebSocketServer::stop() {
    request_stop();
    wait();
}

unsigned short WebSocketServer::port() const {
    return bound_port;
}

bool WebSocketServer::running() const {
    return is_running;
}

} // namespace extronctl
