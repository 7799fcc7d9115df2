#pragma once
#include <string>

namespace rpcwire {

/// API key credential, rendered on demand in the form a server expects it.
///
///   ApiKey key("API-KEY", "abcdef12345");
///   key.as_header();     // "API-KEY: abcdef12345"
///   key.as_query_str();  // "API-KEY=abcdef12345"
///   key.as_cookie();     // "Cookie: API-KEY=abcdef12345"
class ApiKey {
public:
    ApiKey(std::string name, std::string value);

    [[nodiscard]] const std::string& name() const noexcept { return name_; }
    [[nodiscard]] const std::string& value() const noexcept { return value_; }

    [[nodiscard]] std::string as_header() const;
    [[nodiscard]] std::string as_query_str() const;
    [[nodiscard]] std::string as_cookie() const;

private:
    std::string name_;
    std::string value_;
};

} // namespace rpcwire
