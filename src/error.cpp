#include "rpcwire/error.hpp"

namespace rpcwire {

const char* error_kind_name(ErrorKind kind) noexcept {
    switch (kind) {
        case ErrorKind::Connection:      return "connection";
        case ErrorKind::Serialization:   return "serialization";
        case ErrorKind::Response:        return "response";
        case ErrorKind::InvalidResponse: return "invalid_response";
        case ErrorKind::Remote:          return "remote";
    }
    return "unknown";
}

} // namespace rpcwire
