#pragma once
/// JSON-RPC math service: add, sub, mul, div over two numeric params.
/// Shared by the math_server example and the end-to-end tests.

#include <rpcwire/codec.hpp>
#include <rpcwire/error.hpp>
#include <rpcwire/json_rpc.hpp>
#include <string>

namespace math_service {

inline rpcwire::Json error_reply(const rpcwire::Json& id, int code, const std::string& message) {
    return rpcwire::Json{
        {"jsonrpc", "2.0"},
        {"result", nullptr},
        {"error", {{"code", code}, {"message", message}}},
        {"id", id},
    };
}

inline rpcwire::Json result_reply(const rpcwire::Json& id, rpcwire::Json result) {
    return rpcwire::Json{
        {"jsonrpc", "2.0"},
        {"result", std::move(result)},
        {"error", nullptr},
        {"id", id},
    };
}

/// Answer one request body. Always returns a JSON-RPC reply object.
inline rpcwire::Json handle(const std::string& body) {
    namespace err = rpcwire::error;

    rpcwire::Json id = nullptr;
    try {
        auto req = rpcwire::Codec::parse_request(body);
        rpcwire::to_json(id, req.id());

        const auto& m = req.method();
        if (m != "add" && m != "sub" && m != "mul" && m != "div") {
            return error_reply(id, err::MethodNotFound, "Method not found");
        }

        const auto& params = req.params();
        if (!params.is_array() || params.size() != 2 ||
            !params[0].is_number() || !params[1].is_number()) {
            return error_reply(id, err::InvalidParams, "Invalid params");
        }

        double a = params[0].get<double>();
        double b = params[1].get<double>();
        if (m == "add") return result_reply(id, a + b);
        if (m == "sub") return result_reply(id, a - b);
        if (m == "mul") return result_reply(id, a * b);
        if (b == 0.0) return error_reply(id, err::InvalidParams, "Division by zero");
        return result_reply(id, a / b);
    } catch (const rpcwire::SerializationError&) {
        return error_reply(id, err::ParseError, "Parse error");
    }
}

} // namespace math_service
