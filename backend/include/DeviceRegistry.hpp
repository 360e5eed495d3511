#pragma once
#include <cstddef>
#include <map>
#include <mutex>
#include <shared_mutex>
#include <string>
#include <vector>
#include "Device.hpp"

namespace extronctl {

class DeviceDriver;

class DeviceRegistry {
public:
    explicit DeviceRegistry(DeviceDriver& driver);

    // Snapshot of all known devices, sorted by name
    std::vector<Device> list() const;

    // Copy of the named device; throws NotFoundError
    Device lookup(const std::string& name) const;

    // Replace the device set with a fresh discovery. On DiscoveryError the
    // previous set is kept.
    void rescan();

    std::size_t size() const;

private:
    DeviceDriver& driver_;
    mutable std::shared_mutex devices_m_;
    std::map<std::string, Device> devices_;
    // serializes discovery so two rescans cannot interleave their swaps
    std::mutex rescan_m_;
};

} // namespace extronctl
