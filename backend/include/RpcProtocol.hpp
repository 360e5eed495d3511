#pragma once
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <string_view>

namespace extronctl {

class CommandDispatcher;
class ControlError;

// Wire order of the control methods. A request may carry either the name or
// the index, so these values must never be renumbered.
enum class Method : int {
    ListDevices = 0,
    SelectInput = 1,
    Rescan = 2,
    StopServer = 3,
};

struct RpcRequest {
    std::string id;
    Method method = Method::ListDevices;
    nlohmann::json params = nlohmann::json::object();
};

class RpcProtocol {
public:
    explicit RpcProtocol(CommandDispatcher& dispatcher);

    // Validate a decoded message; throws ControlRejectedError.
    static RpcRequest parse_request(const nlohmann::json& msg);

    // Run the call and build its rpc_result. Never throws.
    nlohmann::json execute(const RpcRequest& req);

    static nlohmann::json build_result(const std::string& id, nlohmann::json result);
    static nlohmann::json build_error(const std::string& id, const ControlError& err);

    static const char* method_name(Method m);
    static std::optional<Method> method_from_name(std::string_view name);
    static std::optional<Method> method_from_index(long long index);

private:
    nlohmann::json invoke(const RpcRequest& req);

    CommandDispatcher& dispatcher;
};

} // namespace extronctl
