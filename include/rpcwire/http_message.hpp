#pragma once
#include "api_key.hpp"
#include "service_address.hpp"
#include <cstddef>
#include <optional>
#include <string>
#include <string_view>

namespace rpcwire {

/// Header block and body of a received reply, split on the first blank line.
struct HttpReply {
    std::string head;  // status line and header lines, without the separator
    std::string body;

    /// Status code from the first line ("HTTP/1.1 200 OK" -> 200).
    [[nodiscard]] std::optional<int> status_code() const;

    /// Case-insensitive header lookup. Value is trimmed of surrounding blanks.
    [[nodiscard]] std::optional<std::string> header(std::string_view name) const;
};

namespace http {

constexpr std::string_view kLineEnd   = "\r\n";
constexpr std::string_view kSeparator = "\r\n\r\n";

/// Frame `body` as a minimal HTTP/1.1 POST to `address`. Header order is
/// Host, Content-Type, User-Agent, Accept, [credential], Content-Length.
/// Nothing follows the body.
[[nodiscard]] std::string frame_post(const ServiceAddress& address,
                                     std::string_view user_agent,
                                     const std::optional<ApiKey>& api_key,
                                     std::string_view body);

/// Decode bytes as UTF-8, replacing each ill-formed sequence with U+FFFD.
[[nodiscard]] std::string decode_utf8_lossy(std::string_view bytes);

/// True once `raw` holds the full header block and at least Content-Length
/// body bytes. Without a Content-Length the reply ends when the peer closes.
[[nodiscard]] bool reply_complete(std::string_view raw);

/// Incremental form for a growing buffer. `scanned` starts at 0 and is
/// advanced past the bytes already searched for the header terminator.
[[nodiscard]] bool reply_complete(std::string_view raw, std::size_t& scanned);

/// Split on the first "\r\n\r\n". Returns nullopt when there is none.
[[nodiscard]] std::optional<HttpReply> split_reply(std::string_view text);

} // namespace http
} // namespace rpcwire
