#include "infra/http/TlsHttpClient.hpp"

#include <chrono>
#include <memory>
#include <sstream>
#include <stdexcept>
#include <string>
#include <thread>
#include <utility>

#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/ssl/context.hpp>
#include <boost/asio/ssl/error.hpp>
#include <boost/asio/ssl/rfc2818_verification.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/ssl.hpp>
#include <boost/beast/version.hpp>

#include <openssl/err.h>

namespace infra::http {
namespace {

namespace beast = boost::beast;
namespace http = beast::http;
namespace net = boost::asio;
namespace ssl = boost::asio::ssl;

using core::ports::HttpGet;
using core::ports::HttpResult;
using core::ports::TransportError;
using Clock = std::chrono::steady_clock;

constexpr int kMaxRedirects = 5;

std::string describe(const ParsedUrl& url) {
    std::ostringstream oss;
    oss << (url.secure ? "https://" : "http://") << url.host;
    if (url.port != (url.secure ? "443" : "80")) {
        oss << ':' << url.port;
    }
    oss << url.target;
    return oss.str();
}

TransportError makeError(const ParsedUrl& url, const beast::error_code& ec, const std::string& stage) {
    std::ostringstream oss;
    oss << "GET " << describe(url) << " failed: " << stage << ": " << ec.message();
    const bool timedOut = ec == beast::error::timeout || ec == net::error::timed_out;
    if (timedOut) {
        oss << " (timeout)";
    }
    return TransportError(timedOut ? TransportError::Kind::Timeout : TransportError::Kind::Network, oss.str());
}

bool isRedirect(unsigned status) {
    return status == 301U || status == 302U || status == 303U || status == 307U || status == 308U;
}

ParsedUrl resolveRedirect(const std::string& location, const ParsedUrl& current) {
    if (location.empty()) {
        throw TransportError(TransportError::Kind::Network, "Redirect response missing Location header");
    }
    if (location.rfind("https://", 0) == 0 || location.rfind("http://", 0) == 0) {
        return parse_url(location);
    }

    ParsedUrl next = current;
    if (location.front() == '/') {
        next.target = location;
    } else {
        next.target = "/" + location;
    }
    return next;
}

void prepareRequest(http::request<http::empty_body>& req, const ParsedUrl& url, const HttpGet& request) {
    req.method(http::verb::get);
    req.target(url.target);
    req.version(11);
    req.set(http::field::host, url.host);
    for (const auto& [name, value] : request.headers) {
        req.set(name, value);
    }
    req.set(http::field::connection, "close");
}

HttpResult toResult(http::response<http::string_body>& response) {
    HttpResult result{};
    result.status = static_cast<unsigned>(response.result_int());
    for (const auto& field : response.base()) {
        result.headers.emplace_back(std::string{field.name_string()}, std::string{field.value()});
    }
    result.body = std::move(response.body());
    return result;
}

struct ResolveState {
    bool done{false};
    beast::error_code ec;
    net::ip::tcp::resolver::results_type results;
};

// Lookup bounded by the attempt deadline. On timeout the context is released
// on a detached thread: destroying it joins the resolver's worker, which may
// still be blocked inside getaddrinfo.
net::ip::tcp::resolver::results_type resolveBefore(std::shared_ptr<net::io_context>& ioc,
                                                   const ParsedUrl& url,
                                                   Clock::time_point deadline) {
    auto state = std::make_shared<ResolveState>();
    {
        net::ip::tcp::resolver resolver(*ioc);
        resolver.async_resolve(url.host, url.port,
                               [state](const beast::error_code& ec, net::ip::tcp::resolver::results_type results) {
                                   state->done = true;
                                   state->ec = ec;
                                   state->results = std::move(results);
                               });
        ioc->restart();
        ioc->run_until(deadline);
        if (!state->done) {
            resolver.cancel();
        }
    }

    if (!state->done) {
        std::thread([abandoned = std::move(ioc)]() mutable { abandoned.reset(); }).detach();
        throw TransportError(TransportError::Kind::Timeout,
                             "GET " + describe(url) + " failed: DNS resolution error: deadline exceeded (timeout)");
    }
    if (state->ec) {
        throw makeError(url, state->ec, "DNS resolution error");
    }
    return state->results;
}

// Runs the context until the operation started by initiate has completed.
// Stream deadlines are armed by the caller with expires_at.
template <class Initiate>
beast::error_code runToCompletion(net::io_context& ioc, Initiate&& initiate) {
    beast::error_code result = net::error::would_block;
    initiate([&result](const beast::error_code& ec, auto&&...) { result = ec; });
    ioc.restart();
    ioc.run();
    return result;
}

HttpResult performPlain(const ParsedUrl& url, const HttpGet& request, Clock::time_point deadline) {
    auto ioc = std::make_shared<net::io_context>();
    const auto results = resolveBefore(ioc, url, deadline);

    beast::tcp_stream stream(*ioc);
    stream.expires_at(deadline);
    auto ec = runToCompletion(*ioc, [&](auto handler) { stream.async_connect(results, std::move(handler)); });
    if (ec) {
        throw makeError(url, ec, "Connection error");
    }

    http::request<http::empty_body> req;
    prepareRequest(req, url, request);

    stream.expires_at(deadline);
    ec = runToCompletion(*ioc, [&](auto handler) { http::async_write(stream, req, std::move(handler)); });
    if (ec) {
        throw makeError(url, ec, "Write error");
    }

    beast::flat_buffer buffer;
    http::response<http::string_body> response;
    stream.expires_at(deadline);
    ec = runToCompletion(*ioc, [&](auto handler) { http::async_read(stream, buffer, response, std::move(handler)); });
    if (ec) {
        throw makeError(url, ec, "Read error");
    }

    stream.socket().shutdown(net::ip::tcp::socket::shutdown_both, ec);
    return toResult(response);
}

HttpResult performSecure(const ParsedUrl& url, const HttpGet& request, bool verifyPeer, Clock::time_point deadline) {
    auto ioc = std::make_shared<net::io_context>();
    const auto results = resolveBefore(ioc, url, deadline);

    ssl::context sslContext(ssl::context::tls_client);
    if (verifyPeer) {
        sslContext.set_default_verify_paths();
        sslContext.set_verify_mode(ssl::verify_peer);
    } else {
        sslContext.set_verify_mode(ssl::verify_none);
    }

    ssl::stream<beast::tcp_stream> stream(*ioc, sslContext);
    if (verifyPeer) {
        stream.set_verify_callback(ssl::rfc2818_verification(url.host));
    }

    if (!SSL_set_tlsext_host_name(stream.native_handle(), url.host.c_str())) {
        const unsigned long err = ::ERR_get_error();
        const char* reason = err != 0 ? ::ERR_reason_error_string(err) : nullptr;
        std::ostringstream oss;
        oss << "GET " << describe(url) << " failed: cannot set SNI hostname";
        if (reason != nullptr) {
            oss << ": " << reason;
        }
        throw TransportError(TransportError::Kind::Network, oss.str());
    }

    auto& lowestLayer = beast::get_lowest_layer(stream);
    lowestLayer.expires_at(deadline);
    auto ec = runToCompletion(*ioc, [&](auto handler) { lowestLayer.async_connect(results, std::move(handler)); });
    if (ec) {
        throw makeError(url, ec, "Connection error");
    }

    lowestLayer.expires_at(deadline);
    ec = runToCompletion(*ioc, [&](auto handler) {
        stream.async_handshake(ssl::stream_base::client, std::move(handler));
    });
    if (ec) {
        throw makeError(url, ec, "TLS handshake error");
    }

    http::request<http::empty_body> req;
    prepareRequest(req, url, request);

    lowestLayer.expires_at(deadline);
    ec = runToCompletion(*ioc, [&](auto handler) { http::async_write(stream, req, std::move(handler)); });
    if (ec) {
        throw makeError(url, ec, "Write error");
    }

    beast::flat_buffer buffer;
    http::response<http::string_body> response;
    lowestLayer.expires_at(deadline);
    ec = runToCompletion(*ioc, [&](auto handler) { http::async_read(stream, buffer, response, std::move(handler)); });
    if (ec) {
        throw makeError(url, ec, "Read error");
    }

    // The response is complete and the connection was requested closed; no close_notify exchange.
    lowestLayer.socket().shutdown(net::ip::tcp::socket::shutdown_both, ec);
    return toResult(response);
}

}  // namespace

ParsedUrl parse_url(const std::string& url) {
    ParsedUrl parsed{};
    std::string rest;
    if (url.rfind("https://", 0) == 0) {
        parsed.secure = true;
        parsed.port = "443";
        rest = url.substr(std::string{"https://"}.size());
    } else if (url.rfind("http://", 0) == 0) {
        parsed.secure = false;
        parsed.port = "80";
        rest = url.substr(std::string{"http://"}.size());
    } else {
        throw std::invalid_argument("Unsupported URL scheme: " + url);
    }

    const auto slashPos = rest.find_first_of("/?");
    std::string authority = slashPos == std::string::npos ? rest : rest.substr(0, slashPos);
    if (const auto atPos = authority.rfind('@'); atPos != std::string::npos) {
        authority = authority.substr(atPos + 1);
    }
    if (const auto colonPos = authority.find(':'); colonPos != std::string::npos) {
        parsed.port = authority.substr(colonPos + 1);
        authority = authority.substr(0, colonPos);
    }
    if (authority.empty() || parsed.port.empty()) {
        throw std::invalid_argument("URL missing host: " + url);
    }
    parsed.host = authority;

    if (slashPos == std::string::npos) {
        parsed.target = "/";
    } else if (rest[slashPos] == '?') {
        parsed.target = "/" + rest.substr(slashPos);
    } else {
        parsed.target = rest.substr(slashPos);
    }
    if (const auto hashPos = parsed.target.find('#'); hashPos != std::string::npos) {
        parsed.target.erase(hashPos);
    }
    return parsed;
}

TlsHttpClient::TlsHttpClient(bool verifyPeer) : verifyPeer_(verifyPeer) {}

HttpResult TlsHttpClient::get(const HttpGet& request) {
    if (request.timeout.count() <= 0) {
        throw std::invalid_argument("HTTP GET timeout must be positive");
    }

    // One deadline covers resolution, connect, handshake and every redirect hop.
    const auto deadline = Clock::now() + request.timeout;

    ParsedUrl current;
    try {
        current = parse_url(request.url);
    } catch (const std::invalid_argument& ex) {
        throw TransportError(TransportError::Kind::Network, ex.what());
    }

    for (int redirectCount = 0; redirectCount <= kMaxRedirects; ++redirectCount) {
        if (Clock::now() >= deadline) {
            throw TransportError(TransportError::Kind::Timeout,
                                 "GET " + request.url + " failed: timeout of "
                                     + std::to_string(request.timeout.count()) + "ms exceeded");
        }
        auto result = current.secure ? performSecure(current, request, verifyPeer_, deadline)
                                     : performPlain(current, request, deadline);
        if (!isRedirect(result.status)) {
            return result;
        }
        const auto location = result.header("Location").value_or(std::string{});
        try {
            current = resolveRedirect(location, current);
        } catch (const std::invalid_argument& ex) {
            throw TransportError(TransportError::Kind::Network, ex.what());
        }
    }

    throw TransportError(TransportError::Kind::Network, "GET " + request.url + " failed: too many redirects");
}

}  // namespace infra::http
