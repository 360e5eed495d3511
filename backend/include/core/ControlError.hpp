#pragma once

#include "core/ErrorCatalog.hpp"

#include <stdexcept>
#include <string>

namespace extronctl {

/**
 * @brief Base of every error that crosses the RPC boundary.
 *
 * The numeric code comes from core/ErrorCatalog.hpp and is what the client
 * sees in the error reply.
 */
class ControlError : public std::runtime_error {
public:
    ControlError(int code, const std::string& message)
    : std::runtime_error(message), code_(code) {}

    int code() const noexcept { return code_; }
    const char* kind() const noexcept { return errors::kind_name(code_); }

private:
    int code_;
};

class ControlRejectedError : public ControlError {
public:
    explicit ControlRejectedError(std::string_view detail)
    : ControlError(errors::E2400_CONTROL_REJECTED, errors::format_E2400_control_rejected(detail)) {}
};

class ShutdownInProgressError : public ControlError {
public:
    ShutdownInProgressError()
    : ControlError(errors::E2420_SHUTDOWN_IN_PROGRESS, errors::MSG_E2420_SHUTDOWN_IN_PROGRESS) {}
};

class NotFoundError : public ControlError {
public:
    explicit NotFoundError(std::string_view name)
    : ControlError(errors::E3004_DEVICE_NOT_FOUND, errors::format_E3004_device_not_found(name)) {}
};

class InvalidInputError : public ControlError {
public:
    explicit InvalidInputError(std::string_view detail)
    : ControlError(errors::E3022_INVALID_INPUT, errors::format_E3022_invalid_input(detail)) {}
};

class DeviceCommunicationError : public ControlError {
public:
    explicit DeviceCommunicationError(std::string_view detail)
    : ControlError(errors::E3050_DEVICE_COMMUNICATION, errors::format_E3050_device_communication(detail)) {}
};

class DiscoveryError : public ControlError {
public:
    explicit DiscoveryError(std::string_view detail)
    : ControlError(errors::E3060_DISCOVERY_FAILED, errors::format_E3060_discovery_failed(detail)) {}
};

} // namespace extronctl
