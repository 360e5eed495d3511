#pragma once

#include <chrono>
#include <cstdint>
#include <string>

#include <nlohmann/json.hpp>

namespace extronctl {

struct SerialSettings {
    unsigned int baud_rate = 115200;
    std::chrono::milliseconds timeout{100};
};

struct DiscoverySettings {
    uint16_t vendor_id = 0x1ce2;
    std::string manufacturer = "Extron";
    std::string sysfs_root = "/sys/class/tty";
    std::string dev_root = "/dev";
};

/**
 * @brief Everything the server and the local tool need to start.
 *
 * Sources are applied in order, later ones winning: defaults, JSON file,
 * environment, command line. Every apply_* throws std::runtime_error naming
 * the offending key.
 */
struct ServerConfig {
    std::string listen_host = "0.0.0.0";
    unsigned short listen_port = 14000;
    std::chrono::milliseconds grace{2000};
    unsigned int worker_threads = 4;
    bool debug = false;
    // Server log file directory (extronctl.log); empty for none.
    std::string log_dir;

    SerialSettings serial;
    DiscoverySettings discovery;

    void apply_json(const nlohmann::json& j);
    void apply_file(const std::string& path);
    // EXTRONCTL_LISTEN, EXTRONCTL_GRACE_MS
    void apply_env();
    void set_listen(const std::string& address);

    std::string listen_address() const;
};

// Split "host:port". Returns false if either part is missing or the port is
// not a number in 0..65535.
bool parse_host_port(const std::string& address, std::string& host, unsigned short& port);

// Path named by EXTRONCTL_CONFIG, or empty.
std::string config_path_from_env();

} // namespace extronctl
