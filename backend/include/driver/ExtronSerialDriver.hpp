#pragma once
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>
#include "driver/DeviceDriver.hpp"
#include "core/ServerConfig.hpp"

namespace extronctl {

/**
 * @brief Talks to Extron units over their USB serial port (SIS protocol).
 *
 * Discovery walks sysfs for tty devices whose USB parent matches the
 * configured vendor id and manufacturer, then asks each one for its name
 * (ESC CN CR). Input selection sends "<input>!" and expects "In<input> All".
 */
class ExtronSerialDriver : public DeviceDriver {
public:
    ExtronSerialDriver(SerialSettings serial, DiscoverySettings discovery, bool debug = false);

    std::string name() const override;
    std::vector<Device> discover() override;
    void switch_input(const std::string& path, const std::string& input) override;

    enum class Reply {
        Ok,
        InvalidInput,
        Unexpected,
    };

    // Serial ports (under dev_root) whose USB parent looks like an Extron unit.
    // Throws DiscoveryError if sysfs_root cannot be read.
    std::vector<std::string> candidate_ports() const;

    static Reply classify_select_reply(const std::string& line, const std::string& input);
    static std::string trim_reply(const std::string& line);

private:
    // Name reported by the unit on `path`; nullopt if the port cannot be opened.
    std::optional<std::string> query_name(const std::string& path);
    std::shared_ptr<std::mutex> port_lock(const std::string& path);

    SerialSettings serial_;
    DiscoverySettings discovery_;
    bool debug_;

    std::mutex locks_m_;
    std::unordered_map<std::string, std::shared_ptr<std::mutex>> port_locks_;
};

} // namespace extronctl
