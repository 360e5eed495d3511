#pragma once
#include <string>
#include <vector>
#include "Device.hpp"

namespace extronctl {

/**
 * @brief Abstract interface to the hardware side of a switcher.
 *
 * The registry uses discover() for rescans; the dispatcher uses switch_input()
 * once a device has been resolved. Implementations must be safe to call from
 * several threads at once.
 */
class DeviceDriver {
public:
    virtual ~DeviceDriver() = default;
    /** @brief Driver name (for logging) */
    virtual std::string name() const = 0;
    /**
     * @brief Enumerate every reachable device.
     * @throws DiscoveryError when the set of devices cannot be determined.
     */
    virtual std::vector<Device> discover() = 0;
    /**
     * @brief Route `input` to the output of the device on `path`.
     * @throws InvalidInputError if the device rejects the input,
     *         DeviceCommunicationError if it cannot be reached or does not acknowledge.
     */
    virtual void switch_input(const std::string& path, const std::string& input) = 0;
};

} // namespace extronctl
