#pragma once
#include <string>
#include <string_view>

namespace rpcwire {

/// Target of a call: `host:port` plus a path on that host.
///
/// Normalized on construction so that `host_port` never ends and `path`
/// never starts or ends with '/'. Joining them always yields exactly one
/// separating slash.
class ServiceAddress {
public:
    ServiceAddress(std::string_view host_port, std::string_view path);

    /// Parse "http://host:port/path" (scheme optional). A missing port
    /// defaults to 80. Throws std::invalid_argument for "https://" URLs or
    /// an empty host.
    [[nodiscard]] static ServiceAddress from_url(std::string_view url);

    [[nodiscard]] const std::string& host_port() const noexcept { return host_port_; }
    [[nodiscard]] const std::string& path() const noexcept { return path_; }

    /// "host:port/path"
    [[nodiscard]] std::string full_path() const;

    /// "/path", the HTTP request target.
    [[nodiscard]] std::string request_target() const;

    /// Host part of host_port, without IPv6 brackets.
    [[nodiscard]] std::string host() const;

    /// Port part of host_port, "80" when absent.
    [[nodiscard]] std::string service() const;

    bool operator==(const ServiceAddress& o) const {
        return host_port_ == o.host_port_ && path_ == o.path_;
    }

private:
    std::string host_port_;
    std::string path_;
};

} // namespace rpcwire
