#include "core/UpstreamError.hpp"

namespace core {

const char* to_string(UpstreamError::Kind kind) noexcept {
    switch (kind) {
    case UpstreamError::Kind::Timeout:
        return "timeout";
    case UpstreamError::Kind::ServerError:
        return "server_error";
    case UpstreamError::Kind::ClientError:
        return "client_error";
    case UpstreamError::Kind::Network:
        return "network";
    case UpstreamError::Kind::InvalidPayload:
        return "invalid_payload";
    }
    return "unknown";
}

}  // namespace core
