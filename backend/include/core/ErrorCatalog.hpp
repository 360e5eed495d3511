#pragma once

#include <string>
#include <string_view>

namespace extronctl::errors {

// 2400-2499: WebSocket / control channel errors
// 3000-3099: device and discovery errors

inline constexpr int E2400_CONTROL_REJECTED = 2400;
inline constexpr int E2410_SESSION_DROPPED = 2410;
inline constexpr int E2420_SHUTDOWN_IN_PROGRESS = 2420;
inline constexpr int E2499_INTERNAL = 2499;

inline constexpr int E3004_DEVICE_NOT_FOUND = 3004;
inline constexpr int E3022_INVALID_INPUT = 3022;
inline constexpr int E3050_DEVICE_COMMUNICATION = 3050;
inline constexpr int E3060_DISCOVERY_FAILED = 3060;

// Message forms. Each is followed by a detail string.
inline constexpr const char* MSG_E2400_CONTROL_REJECTED_PREFIX = "Error 2400: Control message rejected: ";
inline constexpr const char* MSG_E2410_SESSION_DROPPED = "Error 2410: WebSocket session dropped unexpectedly";
inline constexpr const char* MSG_E2420_SHUTDOWN_IN_PROGRESS = "Error 2420: Server is shutting down";
inline constexpr const char* MSG_E2499_INTERNAL_PREFIX = "Error 2499: Internal error: ";
inline constexpr const char* MSG_E3004_DEVICE_NOT_FOUND_PREFIX = "Error 3004: Device not found: ";
inline constexpr const char* MSG_E3022_INVALID_INPUT_PREFIX = "Error 3022: Invalid input: ";
inline constexpr const char* MSG_E3050_DEVICE_COMMUNICATION_PREFIX = "Error 3050: Device communication failed: ";
inline constexpr const char* MSG_E3060_DISCOVERY_FAILED_PREFIX = "Error 3060: Device discovery failed: ";

// Common, catalogued detail strings for E2400.
inline constexpr const char* D2400_INVALID_REQUEST = "invalid request";
inline constexpr const char* D2400_NOT_JSON = "message is not valid json";
inline constexpr const char* D2400_NOT_OBJECT = "rpc request must be an object";
inline constexpr const char* D2400_RPC_MISSING_ID = "rpc request missing id";
inline constexpr const char* D2400_RPC_MISSING_METHOD = "rpc request missing method";
inline constexpr const char* D2400_RPC_UNKNOWN_METHOD = "unknown rpc method";
inline constexpr const char* D2400_PARAMS_NOT_OBJECT = "params must be object";
inline constexpr const char* D2400_MISSING_NAME = "missing params.name";
inline constexpr const char* D2400_MISSING_INPUT = "missing params.input";

// Catalogued detail strings for device errors.
inline constexpr const char* D3022_EMPTY_INPUT = "input must not be empty";
inline constexpr const char* D3022_BAD_CHARACTERS = "input may only contain letters and digits";
inline constexpr const char* D3050_NO_REPLY = "no reply before timeout";
inline constexpr const char* D3060_NO_SYSFS = "cannot enumerate serial ports";

inline const char* kind_name(int code) {
    switch (code) {
        case E2400_CONTROL_REJECTED: return "ControlRejected";
        case E2410_SESSION_DROPPED: return "SessionDropped";
        case E2420_SHUTDOWN_IN_PROGRESS: return "ShutdownInProgress";
        case E3004_DEVICE_NOT_FOUND: return "NotFound";
        case E3022_INVALID_INPUT: return "InvalidInput";
        case E3050_DEVICE_COMMUNICATION: return "DeviceCommunicationError";
        case E3060_DISCOVERY_FAILED: return "DiscoveryError";
        default: return "Internal";
    }
}

inline std::string format_with_prefix(const char* prefix, std::string_view detail, const char* fallback) {
    std::string out;
    out.reserve(std::char_traits<char>::length(prefix) + detail.size());
    out.append(prefix);
    if (detail.empty()) {
        out.append(fallback);
    } else {
        out.append(detail.data(), detail.size());
    }
    return out;
}

inline std::string format_E2400_control_rejected(std::string_view detail) {
    return format_with_prefix(MSG_E2400_CONTROL_REJECTED_PREFIX, detail, D2400_INVALID_REQUEST);
}

inline std::string format_E2499_internal(std::string_view detail) {
    return format_with_prefix(MSG_E2499_INTERNAL_PREFIX, detail, "unknown");
}

inline std::string format_E3004_device_not_found(std::string_view name) {
    return format_with_prefix(MSG_E3004_DEVICE_NOT_FOUND_PREFIX, name, "(unnamed)");
}

inline std::string format_E3022_invalid_input(std::string_view detail) {
    return format_with_prefix(MSG_E3022_INVALID_INPUT_PREFIX, detail, D3022_EMPTY_INPUT);
}

inline std::string format_E3050_device_communication(std::string_view detail) {
    return format_with_prefix(MSG_E3050_DEVICE_COMMUNICATION_PREFIX, detail, D3050_NO_REPLY);
}

inline std::string format_E3060_discovery_failed(std::string_view detail) {
    return format_with_prefix(MSG_E3060_DISCOVERY_FAILED_PREFIX, detail, D3060_NO_SYSFS);
}

} // namespace extronctl::errors
