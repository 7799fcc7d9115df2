#pragma once
#include <stdexcept>
#include <string>

namespace rpcwire {

enum class ErrorKind {
    Connection,
    Serialization,
    Response,
    InvalidResponse,
    Remote,
};

[[nodiscard]] const char* error_kind_name(ErrorKind kind) noexcept;

class RpcError : public std::runtime_error {
public:
    RpcError(ErrorKind kind, const std::string& msg)
        : std::runtime_error(msg), kind_(kind) {}

    [[nodiscard]] ErrorKind kind() const noexcept { return kind_; }

private:
    ErrorKind kind_;
};

/// Socket could not be opened, or the request could not be written.
class ConnectionError : public RpcError {
public:
    explicit ConnectionError(const std::string& msg)
        : RpcError(ErrorKind::Connection, msg) {}
};

/// Envelope could not be encoded, or the reply body could not be decoded.
class SerializationError : public RpcError {
public:
    explicit SerializationError(const std::string& msg)
        : RpcError(ErrorKind::Serialization, msg) {}
};

/// Socket read failed after a successful connection.
class ResponseError : public RpcError {
public:
    explicit ResponseError(const std::string& msg)
        : RpcError(ErrorKind::Response, msg) {}
};

/// Reply bytes arrived but contained no header/body separator.
class InvalidResponseError : public RpcError {
public:
    explicit InvalidResponseError(const std::string& msg)
        : RpcError(ErrorKind::InvalidResponse, msg) {}
};

/// The peer answered with a JSON-RPC error object.
class RemoteError : public RpcError {
public:
    int code;
    RemoteError(int code, const std::string& msg)
        : RpcError(ErrorKind::Remote, msg), code(code) {}
};

namespace error {
    constexpr int ParseError     = -32700;
    constexpr int InvalidRequest = -32600;
    constexpr int MethodNotFound = -32601;
    constexpr int InvalidParams  = -32602;
    constexpr int InternalError  = -32603;
} // namespace error

} // namespace rpcwire
