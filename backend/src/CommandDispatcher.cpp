#include "CommandDispatcher.hpp"
#include "DeviceRegistry.hpp"
#include "core/ControlError.hpp"
#include "driver/DeviceDriver.hpp"
#include <cctype>
#include <iostream>

namespace extronctl {

// Counts a call as in flight for its whole lifetime.
class CommandDispatcher::CallScope {
public:
    explicit CallScope(CommandDispatcher& d) : d_(d) {
        std::lock_guard<std::mutex> lk(d_.state_m_);
        if (d_.shutting_down_) throw ShutdownInProgressError();
        ++d_.in_flight_;
    }
    ~CallScope() {
        std::lock_guard<std::mutex> lk(d_.state_m_);
        --d_.in_flight_;
        if (d_.in_flight_ == 0) d_.idle_cv_.notify_all();
    }
    CallScope(const CallScope&) = delete;
    CallScope& operator=(const CallScope&) = delete;

private:
    CommandDispatcher& d_;
};

CommandDispatcher::CommandDispatcher(DeviceRegistry& registry, DeviceDriver& driver)
: registry_(registry), driver_(driver) {}

std::vector<Device> CommandDispatcher::list_devices() {
    CallScope scope(*this);
    return registry_.list();
}

void CommandDispatcher::select_input(const std::string& name, const std::string& input) {
    CallScope scope(*this);
    // Copy out of the registry; the lock is not held during device I/O.
    Device dev = registry_.lookup(name);
    validate_input(input);
    driver_.switch_input(dev.path, input);
}

void CommandDispatcher::rescan() {
    CallScope scope(*this);
    registry_.rescan();
}

void CommandDispatcher::stop_server() {
    std::function<void()> handler;
    {
        std::lock_guard<std::mutex> lk(state_m_);
        if (shutting_down_) return;
        shutting_down_ = true;
        handler = on_stop_;
    }
    std::cout << "CommandDispatcher: stop requested" << std::endl;
    if (handler) handler();
}

void CommandDispatcher::set_stop_handler(std::function<void()> handler) {
    std::lock_guard<std::mutex> lk(state_m_);
    on_stop_ = std::move(handler);
}

void CommandDispatcher::begin_shutdown() {
    std::lock_guard<std::mutex> lk(state_m_);
    shutting_down_ = true;
}

bool CommandDispatcher::shutting_down() const {
    std::lock_guard<std::mutex> lk(state_m_);
    return shutting_down_;
}

bool CommandDispatcher::wait_idle(std::chrono::milliseconds grace) {
    std::unique_lock<std::mutex> lk(state_m_);
    return idle_cv_.wait_for(lk, grace, [this]() { return in_flight_ == 0; });
}

std::size_t CommandDispatcher::in_flight() const {
    std::lock_guard<std::mutex> lk(state_m_);
    return in_flight_;
}

void CommandDispatcher::validate_input(const std::string& input) {
    if (input.empty()) throw InvalidInputError(errors::D3022_EMPTY_INPUT);
    for (unsigned char c : input) {
        // '!' and control characters would end or corrupt the SIS command
        if (!std::isalnum(c)) throw InvalidInputError(errors::D3022_BAD_CHARACTERS);
    }
}

} // namespace extronctl
