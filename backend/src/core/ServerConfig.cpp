/*
src/core/ServerConfig.cpp
Layered configuration for the server: defaults, JSON file, environment,
then command line flags applied by main.
*/
#include "core/ServerConfig.hpp"

#include <cstdlib>
#include <fstream>
#include <stdexcept>

using json = nlohmann::json;

namespace extronctl {

static std::string bad_value(const std::string& key) {
    return "config: invalid value for '" + key + "'";
}

static long long parse_integer(const std::string& text, const std::string& key) {
    if (text.empty()) throw std::runtime_error(bad_value(key));
    for (char c : text) {
        if (c < '0' || c > '9') throw std::runtime_error(bad_value(key));
    }
    try {
        return std::stoll(text);
    } catch (const std::exception&) {
        throw std::runtime_error(bad_value(key));
    }
}

static long long positive_number(const json& v, const std::string& key) {
    if (!v.is_number_integer() || v.get<long long>() < 0) throw std::runtime_error(bad_value(key));
    return v.get<long long>();
}

bool parse_host_port(const std::string& address, std::string& host, unsigned short& port) {
    auto colon = address.rfind(':');
    if (colon == std::string::npos || colon == 0 || colon + 1 >= address.size()) return false;
    std::string h = address.substr(0, colon);
    std::string p = address.substr(colon + 1);
    // [::1]:14000
    if (h.size() > 2 && h.front() == '[' && h.back() == ']') h = h.substr(1, h.size() - 2);
    for (char c : p) {
        if (c < '0' || c > '9') return false;
    }
    if (p.size() > 5) return false;
    unsigned long value = std::stoul(p);
    if (value > 65535) return false;
    host = h;
    port = static_cast<unsigned short>(value);
    return true;
}

std::string config_path_from_env() {
    const char* env = std::getenv("EXTRONCTL_CONFIG");
    if (env && *env) return std::string(env);
    return {};
}

void ServerConfig::set_listen(const std::string& address) {
    std::string host;
    unsigned short port = 0;
    if (!parse_host_port(address, host, port)) {
        throw std::runtime_error("config: '" + address + "' does not contain a valid address");
    }
    listen_host = host;
    listen_port = port;
}

std::string ServerConfig::listen_address() const {
    return listen_host + ":" + std::to_string(listen_port);
}

void ServerConfig::apply_json(const json& j) {
    if (!j.is_object()) throw std::runtime_error("config: top level must be an object");

    if (j.contains("listen")) {
        if (!j["listen"].is_string()) throw std::runtime_error(bad_value("listen"));
        set_listen(j["listen"].get<std::string>());
    }
    if (j.contains("grace_ms")) grace = std::chrono::milliseconds(positive_number(j["grace_ms"], "grace_ms"));
    if (j.contains("worker_threads")) {
        auto n = positive_number(j["worker_threads"], "worker_threads");
        if (n == 0) throw std::runtime_error(bad_value("worker_threads"));
        worker_threads = static_cast<unsigned int>(n);
    }
    if (j.contains("debug")) {
        if (!j["debug"].is_boolean()) throw std::runtime_error(bad_value("debug"));
        debug = j["debug"].get<bool>();
    }
    if (j.contains("log_dir")) {
        if (!j["log_dir"].is_string()) throw std::runtime_error(bad_value("log_dir"));
        log_dir = j["log_dir"].get<std::string>();
    }

    if (j.contains("serial")) {
        const auto& s = j["serial"];
        if (!s.is_object()) throw std::runtime_error(bad_value("serial"));
        if (s.contains("baud_rate")) {
            auto baud = positive_number(s["baud_rate"], "serial.baud_rate");
            if (baud == 0) throw std::runtime_error(bad_value("serial.baud_rate"));
            serial.baud_rate = static_cast<unsigned int>(baud);
        }
        if (s.contains("timeout_ms")) {
            serial.timeout = std::chrono::milliseconds(positive_number(s["timeout_ms"], "serial.timeout_ms"));
        }
    }

    if (j.contains("discovery")) {
        const auto& d = j["discovery"];
        if (!d.is_object()) throw std::runtime_error(bad_value("discovery"));
        if (d.contains("vendor_id")) {
            if (!d["vendor_id"].is_string()) throw std::runtime_error(bad_value("discovery.vendor_id"));
            try {
                std::size_t used = 0;
                std::string text = d["vendor_id"].get<std::string>();
                unsigned long vid = std::stoul(text, &used, 16);
                if (used != text.size() || vid > 0xffff) throw std::runtime_error(bad_value("discovery.vendor_id"));
                discovery.vendor_id = static_cast<uint16_t>(vid);
            } catch (const std::logic_error&) {
                throw std::runtime_error(bad_value("discovery.vendor_id"));
            }
        }
        if (d.contains("manufacturer")) discovery.manufacturer = d.value("manufacturer", discovery.manufacturer);
        if (d.contains("sysfs_root")) discovery.sysfs_root = d.value("sysfs_root", discovery.sysfs_root);
        if (d.contains("dev_root")) discovery.dev_root = d.value("dev_root", discovery.dev_root);
    }
}

void ServerConfig::apply_file(const std::string& path) {
    std::ifstream f(path);
    if (!f) throw std::runtime_error("config: cannot open '" + path + "'");
    json j = json::parse(f, nullptr, false);
    if (j.is_discarded()) throw std::runtime_error("config: '" + path + "' is not valid json");
    apply_json(j);
}

void ServerConfig::apply_env() {
    const char* listen = std::getenv("EXTRONCTL_LISTEN");
    if (listen && *listen) set_listen(listen);

    const char* grace_ms = std::getenv("EXTRONCTL_GRACE_MS");
    if (grace_ms && *grace_ms) grace = std::chrono::milliseconds(parse_integer(grace_ms, "EXTRONCTL_GRACE_MS"));
}

} // namespace extronctl
