#pragma once
#include "../api_key.hpp"
#include "../json_rpc.hpp"
#include "../service_address.hpp"
#include "../version.hpp"
#include "tcp_stream.hpp"
#include <chrono>
#include <cstddef>
#include <future>
#include <memory>
#include <optional>
#include <string>

namespace rpcwire {

/// Handle to a call in flight. get() yields the decoded reply or rethrows
/// the classified RpcError. Dropping an unfinished call cancels it.
class PendingCall {
public:
    PendingCall(std::future<Json> result, std::shared_ptr<CancelSignal> cancel);
    ~PendingCall();

    PendingCall(PendingCall&&) noexcept = default;
    PendingCall& operator=(PendingCall&& other) noexcept;

    /// Block until the call completes. Can be called once.
    [[nodiscard]] Json get();

    /// Wake the blocked connect/write/read. The socket is closed and get()
    /// throws ConnectionError or ResponseError depending on the phase.
    void cancel() noexcept;

    [[nodiscard]] std::future_status wait_for(std::chrono::milliseconds timeout) const;
    [[nodiscard]] bool valid() const noexcept { return result_.valid(); }

private:
    std::future<Json> result_;
    std::shared_ptr<CancelSignal> cancel_;
};

/// JSON-RPC over a minimal HTTP/1.1 POST on a raw TCP connection.
/// One connection per call; nothing is shared between calls.
class HttpTransport {
public:
    struct Options {
        /// Applied separately to connect, write and read. None waits forever.
        std::optional<std::chrono::milliseconds> timeout;
        std::string user_agent{DEFAULT_USER_AGENT};
        std::size_t max_response_bytes = 16 * 1024 * 1024;
    };

    HttpTransport();
    explicit HttpTransport(Options opts);

    /// Run one request/response exchange on a background task.
    [[nodiscard]] PendingCall send_async(const JsonRpcRequest& request,
                                         const ServiceAddress& address,
                                         const std::optional<ApiKey>& api_key = std::nullopt) const;

    /// Blocking form of send_async().
    /// Throws SerializationError, ConnectionError, ResponseError or
    /// InvalidResponseError.
    [[nodiscard]] Json send(const JsonRpcRequest& request,
                            const ServiceAddress& address,
                            const std::optional<ApiKey>& api_key = std::nullopt) const;

    [[nodiscard]] const Options& options() const noexcept { return opts_; }

private:
    static Json exchange(const JsonRpcRequest& request,
                         const ServiceAddress& address,
                         const std::optional<ApiKey>& api_key,
                         const Options& opts,
                         const CancelSignal& cancel);

    Options opts_;
};

} // namespace rpcwire
