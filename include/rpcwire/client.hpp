#pragma once
#include "api_key.hpp"
#include "json_rpc.hpp"
#include "service_address.hpp"
#include "transport/http_transport.hpp"
#include <cstdint>
#include <future>
#include <memory>
#include <optional>
#include <string>

namespace rpcwire {

/// Client bound to one service: address, optional API key and an id
/// sequence. Calls are independent; each opens its own connection.
class RpcClient {
public:
    struct Options {
        ServiceAddress address{"127.0.0.1:80", ""};
        std::optional<ApiKey> api_key;
        HttpTransport::Options transport;
        int64_t first_id = 0;
    };

    explicit RpcClient(Options opts);
    ~RpcClient();

    RpcClient(const RpcClient&) = delete;
    RpcClient& operator=(const RpcClient&) = delete;

    /// Call `method` with the next integer id.
    [[nodiscard]] JsonRpcResponse call(const std::string& method, const Json& params = Json::array());

    /// Call `method` with a caller-chosen id, sent verbatim.
    [[nodiscard]] JsonRpcResponse call(const std::string& method, const Json& params, RequestId id);

    [[nodiscard]] std::future<JsonRpcResponse> call_async(const std::string& method,
                                                          const Json& params = Json::array());

    /// Call and return `result`. Throws RemoteError when the peer replied
    /// with a JSON-RPC error.
    [[nodiscard]] Json call_result(const std::string& method, const Json& params = Json::array());

    /// Send a prepared envelope and return the raw decoded reply.
    [[nodiscard]] Json send(const JsonRpcRequest& request);

    [[nodiscard]] const ServiceAddress& address() const noexcept;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace rpcwire
