#include "rpcwire/transport/http_transport.hpp"
#include "rpcwire/codec.hpp"
#include "rpcwire/error.hpp"
#include "rpcwire/http_message.hpp"
#include "rpcwire/logging.hpp"
#include <utility>

namespace rpcwire {

// ---------- PendingCall ----------

PendingCall::PendingCall(std::future<Json> result, std::shared_ptr<CancelSignal> cancel)
    : result_(std::move(result)), cancel_(std::move(cancel)) {}

PendingCall::~PendingCall() {
    // The future's destructor joins the task; cancel first so it is prompt.
    if (result_.valid()) cancel();
}

PendingCall& PendingCall::operator=(PendingCall&& other) noexcept {
    if (this != &other) {
        if (result_.valid()) cancel();
        result_ = std::move(other.result_);
        cancel_ = std::move(other.cancel_);
    }
    return *this;
}

Json PendingCall::get() {
    return result_.get();
}

void PendingCall::cancel() noexcept {
    if (cancel_) cancel_->cancel();
}

std::future_status PendingCall::wait_for(std::chrono::milliseconds timeout) const {
    return result_.wait_for(timeout);
}

// ---------- HttpTransport ----------

HttpTransport::HttpTransport() = default;

HttpTransport::HttpTransport(Options opts)
    : opts_(std::move(opts)) {}

PendingCall HttpTransport::send_async(const JsonRpcRequest& request,
                                      const ServiceAddress& address,
                                      const std::optional<ApiKey>& api_key) const {
    auto cancel = std::make_shared<CancelSignal>();
    auto fut = std::async(std::launch::async,
        [request, address, api_key, opts = opts_, cancel]() {
            return exchange(request, address, api_key, opts, *cancel);
        });
    return PendingCall(std::move(fut), std::move(cancel));
}

Json HttpTransport::send(const JsonRpcRequest& request,
                         const ServiceAddress& address,
                         const std::optional<ApiKey>& api_key) const {
    return send_async(request, address, api_key).get();
}

Json HttpTransport::exchange(const JsonRpcRequest& request,
                             const ServiceAddress& address,
                             const std::optional<ApiKey>& api_key,
                             const Options& opts,
                             const CancelSignal& cancel) {
    std::string body = Codec::serialize(request);

    TcpStream::Options stream_opts;
    stream_opts.timeout = opts.timeout;
    stream_opts.cancel = &cancel;
    stream_opts.max_read_bytes = opts.max_response_bytes;

    TcpStream stream = TcpStream::connect(address.host(), address.service(), stream_opts);

    std::string framed = http::frame_post(address, opts.user_agent, api_key, body);
    RPCWIRE_LOG_NET_DEBUG("POST {} method={} id={} ({} body bytes)",
                          address.full_path(), request.method(),
                          request_id_to_string(request.id()), body.size());
    stream.write_all(framed);

    std::size_t scanned = 0;
    std::string raw = stream.read_to_end([&scanned](std::string_view received) {
        return http::reply_complete(received, scanned);
    });
    stream.close();

    auto reply = http::split_reply(http::decode_utf8_lossy(raw));
    if (!reply) {
        RPCWIRE_LOG_NET_WARN("reply from {} has no header terminator ({} bytes)",
                             address.host_port(), raw.size());
        throw InvalidResponseError("no header/body separator in " +
                                   std::to_string(raw.size()) + "-byte reply from " +
                                   address.host_port());
    }

    if (auto status = reply->status_code()) {
        RPCWIRE_LOG_NET_DEBUG("{} replied HTTP {}", address.host_port(), *status);
    }

    return Codec::parse_body(reply->body);
}

} // namespace rpcwire
