#pragma once

#include <stdexcept>
#include <string>

namespace core {

class UpstreamError : public std::runtime_error {
public:
    enum class Kind {
        Timeout,
        ServerError,
        ClientError,
        Network,
        InvalidPayload,
    };

    UpstreamError(Kind kind, const std::string& message, unsigned status = 0U)
        : std::runtime_error(message), kind_(kind), status_(status) {}

    Kind kind() const noexcept { return kind_; }

    // HTTP status when the upstream answered, 0 otherwise.
    unsigned status() const noexcept { return status_; }

    bool retryable() const noexcept { return kind_ == Kind::Timeout || kind_ == Kind::ServerError; }

private:
    Kind kind_;
    unsigned status_;
};

const char* to_string(UpstreamError::Kind kind) noexcept;

}  // namespace core
