#pragma once
#include <string_view>

namespace rpcwire {

constexpr std::string_view LIBRARY_VERSION    = "0.1.0";
constexpr std::string_view JSONRPC_VERSION    = "2.0";
constexpr std::string_view DEFAULT_USER_AGENT = "rpcwire/0.1.0";
constexpr std::string_view CONTENT_TYPE_JSON  = "application/json";
constexpr std::string_view ACCEPT_JSON        = "application/json";

} // namespace rpcwire
