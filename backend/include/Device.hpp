#pragma once
#include <string>
#include <nlohmann/json.hpp>

namespace extronctl {

/**
 * @brief A named, addressable Extron unit.
 *
 * `name` is what the unit reports for the name query and is unique within a
 * DeviceRegistry. `path` is the serial port it answers on (e.g. /dev/ttyACM0).
 */
struct Device {
    std::string name;
    std::string path;
};

inline bool operator==(const Device& a, const Device& b) {
    return a.name == b.name && a.path == b.path;
}

inline bool operator!=(const Device& a, const Device& b) {
    return !(a == b);
}

inline void to_json(nlohmann::json& j, const Device& d) {
    j = nlohmann::json{ {"name", d.name}, {"path", d.path} };
}

inline void from_json(const nlohmann::json& j, Device& d) {
    d.name = j.value("name", std::string{});
    d.path = j.value("path", std::string{});
}

} // namespace extronctl
