#pragma once

// extronctl client helpers.
//
// Dependencies:
// - Boost (Asio + Beast WebSocket)
// - nlohmann::json (header-only)
//
// Every call opens its own connection, sends one rpc request and waits for
// the matching rpc_result.

#include <boost/asio/ip/tcp.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/websocket.hpp>

#include <nlohmann/json.hpp>

#include <chrono>
#include <random>
#include <stdexcept>
#include <string>
#include <vector>

namespace extronctl {

namespace beast = boost::beast;
namespace websocket = beast::websocket;
namespace net = boost::asio;
using tcp = net::ip::tcp;
using json = nlohmann::json;

struct WsUrl {
  std::string host;
  std::string port;
  std::string target;
};

// Accepts ws://host:port/path or plain host:port.
inline bool parse_ws_url(const std::string& url, WsUrl& out) {
  std::string s = url;
  const std::string prefix = "ws://";
  if (s.rfind(prefix, 0) == 0) s = s.substr(prefix.size());

  std::string hostport;
  auto slash = s.find('/');
  if (slash == std::string::npos) {
    hostport = s;
    out.target = "/";
  } else {
    hostport = s.substr(0, slash);
    out.target = s.substr(slash);
    if (out.target.empty()) out.target = "/";
  }

  auto colon = hostport.rfind(':');
  if (colon == std::string::npos) {
    out.host = hostport;
    out.port = "14000";
  } else {
    out.host = hostport.substr(0, colon);
    out.port = hostport.substr(colon + 1);
    if (out.port.empty()) out.port = "14000";
  }
  if (out.host.size() > 2 && out.host.front() == '[' && out.host.back() == ']') {
    out.host = out.host.substr(1, out.host.size() - 2);
  }

  return !out.host.empty();
}

inline std::string random_id() {
  static thread_local std::mt19937_64 rng{std::random_device{}()};
  static const char* hex = "0123456789abcdef";
  std::string out;
  out.reserve(32);
  for (int i = 0; i < 32; ++i) out.push_back(hex[(rng() >> ((i % 8) * 8)) & 0xF]);
  return out;
}

// Failed remote call. code/kind mirror the server's error catalog.
class RpcError : public std::runtime_error {
 public:
  RpcError(int code, std::string kind, const std::string& message)
      : std::runtime_error(message), code_(code), kind_(std::move(kind)) {}

  int code() const noexcept { return code_; }
  const std::string& kind() const noexcept { return kind_; }

 private:
  int code_;
  std::string kind_;
};

struct RemoteDevice {
  std::string name;
  std::string path;
};

class Client {
 public:
  explicit Client(std::string address = "localhost:14000") : address_(std::move(address)) {
    if (!parse_ws_url(address_, url_)) {
      throw std::runtime_error("'" + address_ + "' does not contain a valid address");
    }
  }

  const std::string& address() const { return address_; }

  // timeout_ms bounds the whole call: connect, handshake, request and reply.
  json rpc(const std::string& method, const json& params = json::object(), int timeout_ms = 10000) const {
    net::io_context ioc;
    tcp::resolver resolver{ioc};
    websocket::stream<beast::tcp_stream> ws{ioc};
    const auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(timeout_ms);

    beast::error_code ec;
    auto finish = [&](const char* what) {
      ioc.restart();
      ioc.run();
      if (ec == beast::error::timeout) throw std::runtime_error("rpc timeout: " + method);
      if (ec) throw beast::system_error(ec, what);
    };

    auto const results = resolver.resolve(url_.host, url_.port);
    beast::get_lowest_layer(ws).expires_at(deadline);
    beast::get_lowest_layer(ws).async_connect(results, [&](beast::error_code e, const tcp::endpoint&) { ec = e; });
    finish("connect");

    ws.async_handshake(url_.host + ":" + url_.port, url_.target, [&](beast::error_code e) { ec = e; });
    finish("handshake");

    const std::string id = std::string("cpp_") + random_id();
    json req = {{"type", "rpc"}, {"id", id}, {"method", method}, {"params", params}};
    const std::string payload = req.dump();
    ws.async_write(net::buffer(payload), [&](beast::error_code e, std::size_t) { ec = e; });
    finish("write");

    beast::flat_buffer buffer;
    for (;;) {
      buffer.consume(buffer.size());
      ws.async_read(buffer, [&](beast::error_code e, std::size_t) { ec = e; });
      finish("read");
      std::string data = beast::buffers_to_string(buffer.data());

      json msg = json::parse(data, nullptr, false);
      if (!msg.is_object()) continue;
      if (msg.value("type", std::string{}) == "rpc_result" && msg.value("id", std::string{}) == id) {
        ws.async_close(websocket::close_code::normal, [&](beast::error_code e) { ec = e; });
        ioc.restart();
        ioc.run();
        if (!msg.value("ok", false)) {
          json err = msg.value("error", json::object());
          throw RpcError(err.value("code", 0), err.value("kind", std::string{"Unknown"}),
                         err.value("message", err.dump()));
        }
        return msg.value("result", json::object());
      }
    }
  }

  std::vector<RemoteDevice> list_devices() const {
    json r = rpc("listDevices");
    std::vector<RemoteDevice> out;
    const json reply = r.value("reply", json::array());
    if (!reply.is_array()) return out;
    for (const auto& d : reply) {
      if (!d.is_object()) continue;
      out.push_back({d.value("name", std::string{}), d.value("path", std::string{})});
    }
    return out;
  }

  void select_input(const std::string& name, const std::string& input) const {
    (void)rpc("selectInput", json{{"name", name}, {"input", input}}, 20000);
  }

  void rescan() const {
    (void)rpc("rescan", json::object(), 20000);
  }

  // The server may close the connection before its reply is written.
  void stop_server() const {
    try {
      (void)rpc("stopServer");
    } catch (const beast::system_error& e) {
      if (e.code() != websocket::error::closed && e.code() != net::error::eof &&
          e.code() != net::error::connection_reset) {
        throw;
      }
    }
  }

 private:
  std::string address_;
  WsUrl url_;
};

}  // namespace extronctl
