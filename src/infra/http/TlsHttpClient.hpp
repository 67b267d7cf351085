#pragma once

#include <string>

#include "core/ports/IHttpTransport.hpp"

namespace infra::http {

struct ParsedUrl {
    bool secure = true;
    std::string host;
    std::string port;
    std::string target;
};

// Accepts http:// and https:// URLs; throws std::invalid_argument otherwise.
ParsedUrl parse_url(const std::string& url);

// Blocking HTTP(S) GET over Boost.Beast, one connection per request.
class TlsHttpClient : public core::ports::IHttpTransport {
public:
    explicit TlsHttpClient(bool verifyPeer);
    ~TlsHttpClient() override = default;

    core::ports::HttpResult get(const core::ports::HttpGet& request) override;

private:
    bool verifyPeer_;
};

}  // namespace infra::http
