#pragma once
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <nlohmann/json.hpp>

namespace rpcwire {

/// Insertion-ordered JSON value. Keeps the wire order of envelope fields.
using Json = nlohmann::ordered_json;

using RequestId = std::variant<int64_t, std::string>;

// Helper to convert RequestId to json
inline void to_json(Json& j, const RequestId& id) {
    std::visit([&j](const auto& v) { j = v; }, id);
}

inline void from_json(const Json& j, RequestId& id) {
    if (j.is_number_integer()) {
        id = j.get<int64_t>();
    } else if (j.is_string()) {
        id = j.get<std::string>();
    } else {
        throw std::invalid_argument("RequestId must be integer or string");
    }
}

[[nodiscard]] std::string request_id_to_string(const RequestId& id);

struct JsonRpcError {
    int code;
    std::string message;
    std::optional<Json> data;

    bool operator==(const JsonRpcError& o) const {
        return code == o.code && message == o.message && data == o.data;
    }
};

inline void to_json(Json& j, const JsonRpcError& e) {
    j = Json{{"code", e.code}, {"message", e.message}};
    if (e.data) j["data"] = *e.data;
}

inline void from_json(const Json& j, JsonRpcError& e) {
    e.code = j.at("code").get<int>();
    e.message = j.at("message").get<std::string>();
    if (j.contains("data")) e.data = j.at("data");
}

/// JSON-RPC request envelope. The protocol version is fixed and is only
/// written out on serialization.
class JsonRpcRequest {
public:
    JsonRpcRequest(std::string method, Json params, RequestId id)
        : method_(std::move(method)), params_(std::move(params)), id_(std::move(id)) {}

    [[nodiscard]] std::string_view jsonrpc() const noexcept;
    [[nodiscard]] const std::string& method() const noexcept { return method_; }
    [[nodiscard]] const Json& params() const noexcept { return params_; }
    [[nodiscard]] const RequestId& id() const noexcept { return id_; }

    bool operator==(const JsonRpcRequest& o) const {
        return id_ == o.id_ && method_ == o.method_ && params_ == o.params_;
    }

private:
    std::string method_;
    Json params_;
    RequestId id_;
};

struct JsonRpcResponse {
    std::optional<RequestId> id;
    std::optional<Json> result;
    std::optional<JsonRpcError> error;

    [[nodiscard]] bool is_error() const noexcept { return error.has_value(); }

    bool operator==(const JsonRpcResponse& o) const {
        return id == o.id && result == o.result && error == o.error;
    }
};

void to_json(Json& j, const JsonRpcRequest& r);
void from_json(const Json& j, JsonRpcResponse& r);
void to_json(Json& j, const JsonRpcResponse& r);

/// Build a request envelope. `params` may be any value with a JSON
/// conversion: scalars, sequences, mappings or user types with `to_json`.
/// Throws std::invalid_argument if `method` is empty.
template <typename Params>
[[nodiscard]] JsonRpcRequest make_request(std::string method, const Params& params, RequestId id) {
    if (method.empty()) {
        throw std::invalid_argument("JSON-RPC method name must not be empty");
    }
    return JsonRpcRequest(std::move(method), Json(params), std::move(id));
}

} // namespace rpcwire
