#include "lspc/json_rpc.hpp"
#include "lspc/version.hpp"

namespace lspc {

std::string to_string(const RequestId& id) {
    if (auto* i = std::get_if<int64_t>(&id)) return std::to_string(*i);
    return "\"" + std::get<std::string>(id) + "\"";
}

void to_json(nlohmann::json& j, const JsonRpcRequest& r) {
    nlohmann::json id_j;
    to_json(id_j, r.id);
    j = nlohmann::json::object();
    j["jsonrpc"] = std::string(JSONRPC_VERSION);
    j["id"] = id_j;
    j["method"] = r.method;
    if (r.params) j["params"] = *r.params;
}

void from_json(const nlohmann::json& j, JsonRpcRequest& r) {
    from_json(j.at("id"), r.id);
    r.method = j.at("method").get<std::string>();
    if (j.contains("params")) r.params = j.at("params");
}

void to_json(nlohmann::json& j, const JsonRpcResponse& r) {
    nlohmann::json id_j;
    to_json(id_j, r.id);
    j = nlohmann::json::object();
    j["jsonrpc"] = std::string(JSONRPC_VERSION);
    j["id"] = id_j;
    if (r.error) {
        j["error"] = *r.error;
    } else {
        // A response without error always carries a result, null included.
        j["result"] = r.result ? *r.result : nlohmann::json(nullptr);
    }
}

void from_json(const nlohmann::json& j, JsonRpcResponse& r) {
    from_json(j.at("id"), r.id);
    if (j.contains("result")) r.result = j.at("result");
    if (j.contains("error")) r.error = j.at("error").get<JsonRpcError>();
}

void to_json(nlohmann::json& j, const JsonRpcNotification& n) {
    j = nlohmann::json::object();
    j["jsonrpc"] = std::string(JSONRPC_VERSION);
    j["method"] = n.method;
    if (n.params) j["params"] = *n.params;
}

void from_json(const nlohmann::json& j, JsonRpcNotification& n) {
    n.method = j.at("method").get<std::string>();
    if (j.contains("params")) n.params = j.at("params");
}

void to_json(nlohmann::json& j, const JsonRpcMessage& m) {
    std::visit([&j](const auto& v) { to_json(j, v); }, m);
}

std::string method_of(const JsonRpcMessage& m) {
    if (auto* req = std::get_if<JsonRpcRequest>(&m)) return req->method;
    if (auto* notif = std::get_if<JsonRpcNotification>(&m)) return notif->method;
    return {};
}

} // namespace lspc
