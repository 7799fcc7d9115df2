#include "rpcwire/client.hpp"
#include "rpcwire/codec.hpp"
#include "rpcwire/error.hpp"
#include "rpcwire/logging.hpp"
#include <atomic>
#include <utility>

namespace rpcwire {

struct RpcClient::Impl {
    Options opts;
    HttpTransport transport;
    std::atomic<int64_t> next_id;

    explicit Impl(Options o)
        : opts(std::move(o)), transport(opts.transport), next_id(opts.first_id) {}

    // Static so a deferred async call can outlive the client.
    static JsonRpcResponse decode(const Json& reply, const JsonRpcRequest& req) {
        JsonRpcResponse resp = Codec::to_response(reply);
        if (resp.id && *resp.id != req.id()) {
            RPCWIRE_LOG_WARN("reply id {} does not match request id {}",
                             request_id_to_string(*resp.id), request_id_to_string(req.id()));
        }
        if (resp.error) {
            RPCWIRE_LOG_DEBUG("{} returned error {}: {}", req.method(),
                              resp.error->code, resp.error->message);
        }
        return resp;
    }
};

RpcClient::RpcClient(Options opts)
    : impl_(std::make_unique<Impl>(std::move(opts))) {}

RpcClient::~RpcClient() = default;

JsonRpcResponse RpcClient::call(const std::string& method, const Json& params) {
    return call(method, params, RequestId{impl_->next_id++});
}

JsonRpcResponse RpcClient::call(const std::string& method, const Json& params, RequestId id) {
    auto req = make_request(method, params, std::move(id));
    return Impl::decode(send(req), req);
}

std::future<JsonRpcResponse> RpcClient::call_async(const std::string& method, const Json& params) {
    auto req = make_request(method, params, RequestId{impl_->next_id++});
    auto pending = impl_->transport.send_async(req, impl_->opts.address, impl_->opts.api_key);
    return std::async(std::launch::deferred,
        [pending = std::move(pending), req = std::move(req)]() mutable {
            return Impl::decode(pending.get(), req);
        });
}

Json RpcClient::call_result(const std::string& method, const Json& params) {
    JsonRpcResponse resp = call(method, params);
    if (resp.error) {
        throw RemoteError(resp.error->code, resp.error->message);
    }
    return resp.result.value_or(Json());
}

Json RpcClient::send(const JsonRpcRequest& request) {
    return impl_->transport.send(request, impl_->opts.address, impl_->opts.api_key);
}

const ServiceAddress& RpcClient::address() const noexcept {
    return impl_->opts.address;
}

} // namespace rpcwire
