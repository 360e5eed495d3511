#include "RpcProtocol.hpp"
#include "CommandDispatcher.hpp"
#include "core/ControlError.hpp"
#include <iostream>

using json = nlohmann::json;

namespace extronctl {

namespace {

constexpr const char* kMethodNames[] = {
    "listDevices",
    "selectInput",
    "rescan",
    "stopServer",
};

std::string required_string(const json& params, const char* key, const char* missing_detail) {
    auto it = params.find(key);
    if (it == params.end() || !it->is_string()) throw ControlRejectedError(missing_detail);
    return it->get<std::string>();
}

} // namespace

RpcProtocol::RpcProtocol(CommandDispatcher& d)
: dispatcher(d) {}

const char* RpcProtocol::method_name(Method m) {
    return kMethodNames[static_cast<int>(m)];
}

std::optional<Method> RpcProtocol::method_from_name(std::string_view name) {
    for (int i = 0; i < 4; ++i) {
        if (name == kMethodNames[i]) return static_cast<Method>(i);
    }
    return std::nullopt;
}

std::optional<Method> RpcProtocol::method_from_index(long long index) {
    if (index < 0 || index > 3) return std::nullopt;
    return static_cast<Method>(index);
}

RpcRequest RpcProtocol::parse_request(const json& msg) {
    if (!msg.is_object()) throw ControlRejectedError(errors::D2400_NOT_OBJECT);
    if (msg.contains("type") && msg["type"] != "rpc") throw ControlRejectedError(errors::D2400_INVALID_REQUEST);

    RpcRequest req;
    auto id = msg.find("id");
    if (id == msg.end()) throw ControlRejectedError(errors::D2400_RPC_MISSING_ID);
    if (id->is_string()) req.id = id->get<std::string>();
    else if (id->is_number_integer()) req.id = std::to_string(id->get<long long>());
    else throw ControlRejectedError(errors::D2400_RPC_MISSING_ID);

    auto method = msg.find("method");
    if (method == msg.end()) throw ControlRejectedError(errors::D2400_RPC_MISSING_METHOD);
    std::optional<Method> m;
    if (method->is_string()) m = method_from_name(method->get<std::string>());
    else if (method->is_number_integer()) m = method_from_index(method->get<long long>());
    if (!m) throw ControlRejectedError(errors::D2400_RPC_UNKNOWN_METHOD);
    req.method = *m;

    if (msg.contains("params") && !msg["params"].is_null()) {
        if (!msg["params"].is_object()) throw ControlRejectedError(errors::D2400_PARAMS_NOT_OBJECT);
        req.params = msg["params"];
    }

    if (req.method == Method::SelectInput) {
        required_string(req.params, "name", errors::D2400_MISSING_NAME);
        required_string(req.params, "input", errors::D2400_MISSING_INPUT);
    }
    return req;
}

json RpcProtocol::invoke(const RpcRequest& req) {
    switch (req.method) {
        case Method::ListDevices:
            return { {"reply", dispatcher.list_devices()} };
        case Method::SelectInput:
            dispatcher.select_input(
                required_string(req.params, "name", errors::D2400_MISSING_NAME),
                required_string(req.params, "input", errors::D2400_MISSING_INPUT));
            return json::object();
        case Method::Rescan:
            dispatcher.rescan();
            return json::object();
        case Method::StopServer:
            dispatcher.stop_server();
            return json::object();
    }
    throw ControlRejectedError(errors::D2400_RPC_UNKNOWN_METHOD);
}

json RpcProtocol::execute(const RpcRequest& req) {
    try {
        return build_result(req.id, invoke(req));
    } catch (const ControlError& e) {
        std::cerr << "RpcProtocol: " << method_name(req.method) << " failed: " << e.what() << std::endl;
        return build_error(req.id, e);
    } catch (const std::exception& e) {
        std::cerr << "RpcProtocol: " << method_name(req.method) << " internal error: " << e.what() << std::endl;
        return build_error(req.id, ControlError(errors::E2499_INTERNAL, errors::format_E2499_internal(e.what())));
    }
}

json RpcProtocol::build_result(const std::string& id, json result) {
    return {
        {"type", "rpc_result"},
        {"id", id},
        {"ok", true},
        {"result", std::move(result)}
    };
}

json RpcProtocol::build_error(const std::string& id, const ControlError& err) {
    return {
        {"type", "rpc_result"},
        {"id", id},
        {"ok", false},
        {"error", {
            {"code", err.code()},
            {"kind", err.kind()},
            {"message", err.what()}
        }}
    };
}

} // namespace extronctl
