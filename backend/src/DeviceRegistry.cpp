#include "DeviceRegistry.hpp"
#include "core/ControlError.hpp"
#include "driver/DeviceDriver.hpp"
#include <iostream>

namespace extronctl {

DeviceRegistry::DeviceRegistry(DeviceDriver& driver) : driver_(driver) {}

std::vector<Device> DeviceRegistry::list() const {
    std::shared_lock<std::shared_mutex> lock(devices_m_);
    std::vector<Device> out;
    out.reserve(devices_.size());
    for (const auto& [name, dev] : devices_) out.push_back(dev);
    return out;
}

Device DeviceRegistry::lookup(const std::string& name) const {
    std::shared_lock<std::shared_mutex> lock(devices_m_);
    auto it = devices_.find(name);
    if (it == devices_.end()) throw NotFoundError(name);
    return it->second;
}

void DeviceRegistry::rescan() {
    std::lock_guard<std::mutex> serial(rescan_m_);

    // Discovery talks to hardware; keep readers running while it does.
    std::vector<Device> found;
    try {
        found = driver_.discover();
    } catch (const DiscoveryError& e) {
        std::cerr << "DeviceRegistry: rescan via " << driver_.name() << " failed: " << e.what() << std::endl;
        throw;
    } catch (const std::exception& e) {
        std::cerr << "DeviceRegistry: rescan via " << driver_.name() << " failed: " << e.what() << std::endl;
        throw DiscoveryError(e.what());
    }

    std::map<std::string, Device> next;
    for (auto& d : found) {
        // later duplicates win, as with a plain map insert
        next[d.name] = std::move(d);
    }

    std::cerr << "DeviceRegistry: rescan via " << driver_.name() << " found " << next.size() << " device(s)" << std::endl;
    std::unique_lock<std::shared_mutex> lock(devices_m_);
    devices_.swap(next);
}

std::size_t DeviceRegistry::size() const {
    std::shared_lock<std::shared_mutex> lock(devices_m_);
    return devices_.size();
}

} // namespace extronctl
