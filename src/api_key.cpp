#include "rpcwire/api_key.hpp"
#include <utility>

namespace rpcwire {

ApiKey::ApiKey(std::string name, std::string value)
    : name_(std::move(name)), value_(std::move(value)) {}

std::string ApiKey::as_header() const {
    return name_ + ": " + value_;
}

std::string ApiKey::as_query_str() const {
    return name_ + "=" + value_;
}

std::string ApiKey::as_cookie() const {
    return "Cookie: " + name_ + "=" + value_;
}

} // namespace rpcwire
