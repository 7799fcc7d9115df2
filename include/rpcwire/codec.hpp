#pragma once
#include "json_rpc.hpp"
#include "error.hpp"
#include <string>
#include <string_view>

namespace rpcwire {

class Codec {
public:
    /// Serialize an envelope to its wire text, fields in the order
    /// jsonrpc, method, params, id.
    /// Throws SerializationError if the params cannot be encoded
    /// (e.g. strings holding invalid UTF-8).
    [[nodiscard]] static std::string serialize(const JsonRpcRequest& req);

    /// Parse a reply body into a JSON value. Trailing whitespace is ignored.
    /// Throws SerializationError on malformed JSON.
    [[nodiscard]] static Json parse_body(std::string_view body);

    /// Interpret a decoded value as a JSON-RPC response.
    /// Throws SerializationError if it is not a response object.
    [[nodiscard]] static JsonRpcResponse to_response(const Json& value);

    /// Parse request text back into an envelope.
    /// Throws SerializationError on malformed JSON or a missing field.
    [[nodiscard]] static JsonRpcRequest parse_request(std::string_view raw);
};

} // namespace rpcwire
