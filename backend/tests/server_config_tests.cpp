#include <gtest/gtest.h>
#include "core/ServerConfig.hpp"
#include <nlohmann/json.hpp>
#include <cstdlib>
#include <fstream>
#include <filesystem>

using nlohmann::json;
using extronctl::ServerConfig;

static std::string write_temp_file(const std::string& name, const std::string& contents) {
    std::filesystem::path p = std::filesystem::temp_directory_path() / name;
    std::ofstream f(p);
    f << contents;
    f.close();
    return p.string();
}

TEST(ServerConfig, Defaults) {
    ServerConfig cfg;
    EXPECT_EQ(cfg.listen_address(), "0.0.0.0:14000");
    EXPECT_EQ(cfg.grace.count(), 2000);
    EXPECT_EQ(cfg.serial.baud_rate, 115200u);
    EXPECT_EQ(cfg.serial.timeout.count(), 100);
    EXPECT_EQ(cfg.discovery.vendor_id, 0x1ce2);
    EXPECT_EQ(cfg.discovery.manufacturer, "Extron");
    EXPECT_FALSE(cfg.debug);
    EXPECT_TRUE(cfg.log_dir.empty());
}

TEST(ServerConfig, ParsesHostPort) {
    std::string host;
    unsigned short port = 0;
    EXPECT_TRUE(extronctl::parse_host_port("127.0.0.1:15000", host, port));
    EXPECT_EQ(host, "127.0.0.1");
    EXPECT_EQ(port, 15000);
    EXPECT_TRUE(extronctl::parse_host_port("[::1]:0", host, port));
    EXPECT_EQ(host, "::1");
    EXPECT_EQ(port, 0);

    EXPECT_FALSE(extronctl::parse_host_port("localhost", host, port));
    EXPECT_FALSE(extronctl::parse_host_port(":14000", host, port));
    EXPECT_FALSE(extronctl::parse_host_port("host:", host, port));
    EXPECT_FALSE(extronctl::parse_host_port("host:http", host, port));
    EXPECT_FALSE(extronctl::parse_host_port("host:70000", host, port));
}

TEST(ServerConfig, AppliesJsonOverDefaults) {
    ServerConfig cfg;
    cfg.apply_json({
        {"listen", "127.0.0.1:15001"},
        {"grace_ms", 500},
        {"worker_threads", 2},
        {"debug", true},
        {"log_dir", "/var/log/extronctl"},
        {"serial", { {"baud_rate", 9600}, {"timeout_ms", 250} }},
        {"discovery", { {"vendor_id", "0403"}, {"manufacturer", "FTDI"}, {"sysfs_root", "/tmp/sys"} }}
    });
    EXPECT_EQ(cfg.listen_host, "127.0.0.1");
    EXPECT_EQ(cfg.listen_port, 15001);
    EXPECT_EQ(cfg.grace.count(), 500);
    EXPECT_EQ(cfg.worker_threads, 2u);
    EXPECT_TRUE(cfg.debug);
    EXPECT_EQ(cfg.log_dir, "/var/log/extronctl");
    EXPECT_EQ(cfg.serial.baud_rate, 9600u);
    EXPECT_EQ(cfg.serial.timeout.count(), 250);
    EXPECT_EQ(cfg.discovery.vendor_id, 0x0403);
    EXPECT_EQ(cfg.discovery.manufacturer, "FTDI");
    EXPECT_EQ(cfg.discovery.sysfs_root, "/tmp/sys");
    EXPECT_EQ(cfg.discovery.dev_root, "/dev");
}

TEST(ServerConfig, RejectsBadValues) {
    ServerConfig cfg;
    EXPECT_THROW(cfg.apply_json(json::array()), std::runtime_error);
    EXPECT_THROW(cfg.apply_json({ {"listen", "nowhere"} }), std::runtime_error);
    EXPECT_THROW(cfg.apply_json({ {"grace_ms", -1} }), std::runtime_error);
    EXPECT_THROW(cfg.apply_json({ {"grace_ms", "soon"} }), std::runtime_error);
    EXPECT_THROW(cfg.apply_json({ {"worker_threads", 0} }), std::runtime_error);
    EXPECT_THROW(cfg.apply_json({ {"log_dir", 5} }), std::runtime_error);
    EXPECT_THROW(cfg.apply_json({ {"serial", { {"baud_rate", 0} }} }), std::runtime_error);
    EXPECT_THROW(cfg.apply_json({ {"discovery", { {"vendor_id", "xyz"} }} }), std::runtime_error);
    EXPECT_THROW(cfg.apply_json({ {"discovery", { {"vendor_id", "12345"} }} }), std::runtime_error);

    try {
        cfg.apply_json({ {"debug", "yes"} });
        FAIL() << "expected runtime_error";
    } catch (const std::runtime_error& e) {
        EXPECT_NE(std::string(e.what()).find("debug"), std::string::npos);
    }
}

TEST(ServerConfig, LoadsFile) {
    auto path = write_temp_file("extronctl_config_test.json", R"({"listen": "0.0.0.0:15002", "grace_ms": 100})");
    ServerConfig cfg;
    cfg.apply_file(path);
    EXPECT_EQ(cfg.listen_port, 15002);
    EXPECT_EQ(cfg.grace.count(), 100);

    auto broken = write_temp_file("extronctl_config_broken.json", "{ listen: ");
    EXPECT_THROW(cfg.apply_file(broken), std::runtime_error);
    EXPECT_THROW(cfg.apply_file("/nonexistent/extronctl.json"), std::runtime_error);
}

TEST(ServerConfig, EnvironmentOverridesFile) {
    ::setenv("EXTRONCTL_LISTEN", "127.0.0.1:15003", 1);
    ::setenv("EXTRONCTL_GRACE_MS", "750", 1);
    ServerConfig cfg;
    cfg.apply_json({ {"listen", "0.0.0.0:1"}, {"grace_ms", 10} });
    cfg.apply_env();
    EXPECT_EQ(cfg.listen_address(), "127.0.0.1:15003");
    EXPECT_EQ(cfg.grace.count(), 750);

    ::setenv("EXTRONCTL_GRACE_MS", "later", 1);
    EXPECT_THROW(cfg.apply_env(), std::runtime_error);

    ::unsetenv("EXTRONCTL_LISTEN");
    ::unsetenv("EXTRONCTL_GRACE_MS");
}

int main(int argc, char** argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
