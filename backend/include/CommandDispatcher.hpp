#pragma once
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <functional>
#include <mutex>
#include <string>
#include <vector>
#include "Device.hpp"

namespace extronctl {

class DeviceDriver;
class DeviceRegistry;

/**
 * @brief Executes the four control calls against the registry and driver.
 *
 * Every call except stop_server() is counted as in flight while it runs, so
 * the transport can drain them on shutdown. Once shutdown has begun new calls
 * fail with ShutdownInProgressError.
 */
class CommandDispatcher {
public:
    CommandDispatcher(DeviceRegistry& registry, DeviceDriver& driver);

    std::vector<Device> list_devices();
    void select_input(const std::string& name, const std::string& input);
    void rescan();
    void stop_server();

    // Called once by stop_server(); the transport installs its own stop here.
    void set_stop_handler(std::function<void()> handler);

    void begin_shutdown();
    bool shutting_down() const;
    // Block until no call is in flight or the grace period ends. Returns
    // false if calls were still running when it gave up.
    bool wait_idle(std::chrono::milliseconds grace);
    std::size_t in_flight() const;

    // Local check before any device I/O: non-empty, letters and digits only.
    static void validate_input(const std::string& input);

private:
    class CallScope;

    DeviceRegistry& registry_;
    DeviceDriver& driver_;

    mutable std::mutex state_m_;
    std::condition_variable idle_cv_;
    std::size_t in_flight_ = 0;
    bool shutting_down_ = false;
    std::function<void()> on_stop_;
};

} // namespace extronctl
