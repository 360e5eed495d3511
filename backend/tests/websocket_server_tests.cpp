#include <gtest/gtest.h>
#include "CommandDispatcher.hpp"
#include "DeviceRegistry.hpp"
#include "FakeDriver.hpp"
#include "WebSocketServer.hpp"
#include "core/ErrorCatalog.hpp"
#include "extronctl_api.hpp"
#include <boost/asio/connect.hpp>
#include <chrono>
#include <future>
#include <thread>

using namespace std::chrono_literals;
using nlohmann::json;

namespace {

struct ServerFixture : public ::testing::Test {
    FakeDriver driver;
    extronctl::DeviceRegistry registry{driver};
    extronctl::CommandDispatcher dispatcher{registry, driver};
    std::unique_ptr<extronctl::WebSocketServer> server;

    void start(std::chrono::milliseconds grace = 500ms) {
        extronctl::ServerConfig cfg;
        cfg.set_listen("127.0.0.1:0");
        cfg.grace = grace;
        cfg.worker_threads = 2;
        server = std::make_unique<extronctl::WebSocketServer>(cfg, dispatcher);
        dispatcher.set_stop_handler([this]() { server->request_stop(); });
        server->start();
    }

    std::string address() const {
        return "127.0.0.1:" + std::to_string(server->port());
    }

    void TearDown() override {
        if (server) server->stop();
    }
};

// Sends one raw text frame and returns the first reply.
json raw_exchange(unsigned short port, const std::string& frame) {
    namespace net = boost::asio;
    namespace websocket = boost::beast::websocket;
    net::io_context ioc;
    net::ip::tcp::resolver resolver{ioc};
    websocket::stream<net::ip::tcp::socket> ws{ioc};
    net::connect(ws.next_layer(), resolver.resolve("127.0.0.1", std::to_string(port)));
    ws.handshake("127.0.0.1", "/");
    ws.text(true);
    ws.write(net::buffer(frame));
    boost::beast::flat_buffer buffer;
    ws.read(buffer);
    boost::beast::error_code ec;
    ws.close(websocket::close_code::normal, ec);
    return json::parse(boost::beast::buffers_to_string(buffer.data()));
}

} // namespace

TEST_F(ServerFixture, BindsEphemeralPort) {
    start();
    EXPECT_TRUE(server->running());
    EXPECT_NE(server->port(), 0);
}

TEST_F(ServerFixture, ServesControlCalls) {
    start();
    extronctl::Client client(address());

    EXPECT_TRUE(client.list_devices().empty());

    driver.set_discovery({ {"Matrix1", "/dev/ext0"}, {"Scaler", "/dev/ext1"} });
    client.rescan();
    auto devices = client.list_devices();
    ASSERT_EQ(devices.size(), 2u);
    EXPECT_EQ(devices[0].name, "Matrix1");
    EXPECT_EQ(devices[0].path, "/dev/ext0");
    EXPECT_EQ(devices[1].name, "Scaler");

    client.select_input("Matrix1", "HDMI2");
    auto switched = driver.switched_inputs();
    ASSERT_EQ(switched.size(), 1u);
    EXPECT_EQ(switched[0].second, "HDMI2");

    try {
        client.select_input("Matrix2", "1");
        FAIL() << "select_input should have failed";
    } catch (const extronctl::RpcError& e) {
        EXPECT_EQ(e.code(), extronctl::errors::E3004_DEVICE_NOT_FOUND);
        EXPECT_EQ(e.kind(), "NotFound");
    }

    try {
        client.select_input("Matrix1", "2;3");
        FAIL() << "select_input should have failed";
    } catch (const extronctl::RpcError& e) {
        EXPECT_EQ(e.code(), extronctl::errors::E3022_INVALID_INPUT);
    }
    EXPECT_EQ(driver.switch_calls.load(), 1);
}

TEST_F(ServerFixture, MalformedFramesAreRejected) {
    start();

    auto not_json = raw_exchange(server->port(), "select Matrix1 2");
    EXPECT_EQ(not_json["type"], "rpc_result");
    EXPECT_FALSE(not_json["ok"].get<bool>());
    EXPECT_EQ(not_json["error"]["code"], extronctl::errors::E2400_CONTROL_REJECTED);

    auto unknown = raw_exchange(server->port(), R"({"type":"rpc","id":"u1","method":"reboot"})");
    EXPECT_EQ(unknown["id"], "u1");
    EXPECT_EQ(unknown["error"]["kind"], "ControlRejected");

    // the server keeps serving after bad frames
    auto by_index = raw_exchange(server->port(), R"({"type":"rpc","id":"i1","method":0})");
    EXPECT_TRUE(by_index["ok"].get<bool>());
    EXPECT_TRUE(by_index["result"]["reply"].is_array());
}

TEST_F(ServerFixture, StopServerDrainsInFlightCalls) {
    driver.set_discovery({ {"Matrix1", "/dev/ext0"} });
    registry.rescan();
    driver.set_switch_delay(300ms);
    start(2000ms);
    extronctl::Client client(address());

    auto pending = std::async(std::launch::async, [&]() { client.select_input("Matrix1", "3"); });
    while (dispatcher.in_flight() == 0) std::this_thread::sleep_for(1ms);

    client.stop_server();
    server->wait();

    EXPECT_NO_THROW(pending.get());
    EXPECT_FALSE(server->running());
    EXPECT_EQ(driver.switched_inputs().size(), 1u);
    EXPECT_THROW(client.list_devices(), boost::system::system_error);
}

// The success reply must win over the shutdown answer every time, not just
// when the worker happens to be scheduled first.
TEST(WebSocketServerShutdown, FinishedCallIsNeverReportedAsAbandoned) {
    for (int round = 0; round < 25; ++round) {
        FakeDriver driver;
        extronctl::DeviceRegistry registry(driver);
        extronctl::CommandDispatcher dispatcher(registry, driver);
        driver.set_discovery({ {"Matrix1", "/dev/ext0"} });
        registry.rescan();
        driver.set_switch_delay(30ms);

        extronctl::ServerConfig cfg;
        cfg.set_listen("127.0.0.1:0");
        cfg.grace = 2000ms;
        extronctl::WebSocketServer server(cfg, dispatcher);
        server.start();
        extronctl::Client client("127.0.0.1:" + std::to_string(server.port()));

        auto pending = std::async(std::launch::async, [&]() { client.select_input("Matrix1", "3"); });
        while (dispatcher.in_flight() == 0) std::this_thread::sleep_for(1ms);
        server.request_stop();

        try {
            pending.get();
        } catch (const extronctl::RpcError& e) {
            ADD_FAILURE() << "round " << round << ": switched call answered with " << e.code();
        }
        server.wait();
        EXPECT_EQ(driver.switched_inputs().size(), 1u) << "round " << round;
    }
}

TEST_F(ServerFixture, ExpiredGraceAnswersShutdownInProgress) {
    driver.set_discovery({ {"Matrix1", "/dev/ext0"} });
    registry.rescan();
    driver.set_switch_delay(1000ms);
    start(50ms);
    extronctl::Client client(address());

    auto pending = std::async(std::launch::async, [&]() { client.select_input("Matrix1", "3"); });
    while (dispatcher.in_flight() == 0) std::this_thread::sleep_for(1ms);

    server->request_stop();
    try {
        pending.get();
        FAIL() << "select_input should have been abandoned";
    } catch (const extronctl::RpcError& e) {
        EXPECT_EQ(e.code(), extronctl::errors::E2420_SHUTDOWN_IN_PROGRESS);
        EXPECT_EQ(e.kind(), "ShutdownInProgress");
    }
    server->wait();
    EXPECT_FALSE(server->running());
}

TEST_F(ServerFixture, BusyPortFailsToStart) {
    start();
    extronctl::ServerConfig cfg;
    cfg.set_listen(address());
    extronctl::WebSocketServer second(cfg, dispatcher);
    EXPECT_THROW(second.start(), std::runtime_error);
    EXPECT_FALSE(second.running());
}

TEST(Client, SilentServerTimesOut) {
    namespace net = boost::asio;
    namespace websocket = boost::beast::websocket;
    net::io_context ioc;
    net::ip::tcp::acceptor acceptor(ioc, net::ip::tcp::endpoint(net::ip::make_address("127.0.0.1"), 0));
    const auto port = acceptor.local_endpoint().port();

    // Accepts the handshake and the request, then never answers.
    std::thread silent([&]() {
        websocket::stream<net::ip::tcp::socket> ws(acceptor.accept());
        ws.accept();
        boost::beast::flat_buffer buffer;
        boost::beast::error_code ec;
        ws.read(buffer, ec);
        ws.read(buffer, ec);
    });

    extronctl::Client client("127.0.0.1:" + std::to_string(port));
    auto begin = std::chrono::steady_clock::now();
    try {
        client.rpc("listDevices", json::object(), 300);
        FAIL() << "rpc should have timed out";
    } catch (const extronctl::RpcError&) {
        FAIL() << "a silent server cannot produce an error reply";
    } catch (const std::runtime_error& e) {
        EXPECT_NE(std::string(e.what()).find("timeout"), std::string::npos) << e.what();
    }
    EXPECT_LT(std::chrono::steady_clock::now() - begin, 5s);
    silent.join();
}

int main(int argc, char** argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
