#include "rpcwire/json_rpc.hpp"
#include "rpcwire/version.hpp"

namespace rpcwire {

std::string request_id_to_string(const RequestId& id) {
    if (auto* i = std::get_if<int64_t>(&id)) return std::to_string(*i);
    return std::get<std::string>(id);
}

std::string_view JsonRpcRequest::jsonrpc() const noexcept {
    return JSONRPC_VERSION;
}

void to_json(Json& j, const JsonRpcRequest& r) {
    Json id_j;
    to_json(id_j, r.id());
    j = Json::object();
    j["jsonrpc"] = std::string(JSONRPC_VERSION);
    j["method"] = r.method();
    j["params"] = r.params();
    j["id"] = std::move(id_j);
}

void from_json(const Json& j, JsonRpcResponse& r) {
    if (j.contains("id") && !j.at("id").is_null()) {
        RequestId id;
        from_json(j.at("id"), id);
        r.id = std::move(id);
    }
    if (j.contains("error") && !j.at("error").is_null()) {
        r.error = j.at("error").get<JsonRpcError>();
    }
    if (j.contains("result") && !(r.error && j.at("result").is_null())) {
        r.result = j.at("result");
    }
}

void to_json(Json& j, const JsonRpcResponse& r) {
    j = Json::object();
    j["jsonrpc"] = std::string(JSONRPC_VERSION);
    if (r.result) j["result"] = *r.result;
    if (r.error) j["error"] = *r.error;
    if (r.id) {
        Json id_j;
        to_json(id_j, *r.id);
        j["id"] = std::move(id_j);
    } else {
        j["id"] = nullptr;
    }
}

} // namespace rpcwire
