#include "rpcwire/service_address.hpp"
#include <stdexcept>

namespace rpcwire {

namespace {

constexpr std::string_view kDefaultService = "80";

std::string_view trim_slashes_right(std::string_view s) {
    while (!s.empty() && s.back() == '/') s.remove_suffix(1);
    return s;
}

std::string_view trim_slashes_left(std::string_view s) {
    while (!s.empty() && s.front() == '/') s.remove_prefix(1);
    return s;
}

bool starts_with(std::string_view s, std::string_view prefix) {
    return s.substr(0, prefix.size()) == prefix;
}

} // anonymous namespace

ServiceAddress::ServiceAddress(std::string_view host_port, std::string_view path)
    : host_port_(trim_slashes_right(host_port))
    , path_(trim_slashes_right(trim_slashes_left(path))) {
}

ServiceAddress ServiceAddress::from_url(std::string_view url) {
    if (starts_with(url, "https://")) {
        throw std::invalid_argument("https URLs are not supported: " + std::string(url));
    }
    if (starts_with(url, "http://")) url.remove_prefix(7);

    auto slash = url.find('/');
    std::string_view host_port = (slash == std::string_view::npos) ? url : url.substr(0, slash);
    std::string_view path = (slash == std::string_view::npos) ? std::string_view{} : url.substr(slash);
    if (host_port.empty()) {
        throw std::invalid_argument("URL has no host: " + std::string(url));
    }
    return ServiceAddress(host_port, path);
}

std::string ServiceAddress::full_path() const {
    return host_port_ + "/" + path_;
}

std::string ServiceAddress::request_target() const {
    return "/" + path_;
}

std::string ServiceAddress::host() const {
    if (!host_port_.empty() && host_port_.front() == '[') {
        auto close = host_port_.find(']');
        if (close != std::string::npos) return host_port_.substr(1, close - 1);
    }
    auto colon = host_port_.rfind(':');
    if (colon == std::string::npos) return host_port_;
    return host_port_.substr(0, colon);
}

std::string ServiceAddress::service() const {
    std::string::size_type colon;
    if (!host_port_.empty() && host_port_.front() == '[') {
        auto close = host_port_.find(']');
        if (close == std::string::npos || close + 1 >= host_port_.size() ||
            host_port_[close + 1] != ':') {
            return std::string(kDefaultService);
        }
        colon = close + 1;
    } else {
        colon = host_port_.rfind(':');
        if (colon == std::string::npos) return std::string(kDefaultService);
    }
    std::string port = host_port_.substr(colon + 1);
    return port.empty() ? std::string(kDefaultService) : port;
}

} // namespace rpcwire
