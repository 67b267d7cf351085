#pragma once

#include <cctype>
#include <chrono>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace core::ports {

using HeaderList = std::vector<std::pair<std::string, std::string>>;

struct HttpGet {
    std::string url;  // absolute, http:// or https://
    HeaderList headers;
    std::chrono::milliseconds timeout{0};
};

struct HttpResult {
    unsigned status = 0U;
    std::string body;
    HeaderList headers;

    // Case-insensitive lookup.
    std::optional<std::string> header(std::string_view name) const {
        for (const auto& [key, value] : headers) {
            if (key.size() != name.size()) {
                continue;
            }
            bool same = true;
            for (std::size_t i = 0; i < key.size() && same; ++i) {
                same = std::tolower(static_cast<unsigned char>(key[i]))
                       == std::tolower(static_cast<unsigned char>(name[i]));
            }
            if (same) {
                return value;
            }
        }
        return std::nullopt;
    }
};

// Raised when no HTTP response was obtained at all.
class TransportError : public std::runtime_error {
public:
    enum class Kind { Timeout, Network };

    TransportError(Kind kind, const std::string& message) : std::runtime_error(message), kind_(kind) {}

    Kind kind() const noexcept { return kind_; }

private:
    Kind kind_;
};

class IHttpTransport {
public:
    virtual ~IHttpTransport() = default;

    // Returns any HTTP response, including 4xx/5xx; throws TransportError otherwise.
    virtual HttpResult get(const HttpGet& request) = 0;
};

}  // namespace core::ports
