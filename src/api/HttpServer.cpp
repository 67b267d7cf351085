#include "api/HttpServer.hpp"

#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <sys/time.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>
#include <sstream>
#include <stdexcept>
#include <string>
#include <utility>

#include "common/Log.hpp"
#include "http/json_error.hpp"

namespace igp::api {

namespace {

std::string describeErrno(int err) {
    return std::strerror(err);
}

std::string formatAddress(const Endpoint& endpoint) {
    const std::string host = endpoint.address.empty() ? std::string{"0.0.0.0"} : endpoint.address;
    return host + ':' + std::to_string(endpoint.port);
}

// Bound, listening IPv4 socket; throws with the failing step on error.
int openListener(const Endpoint& endpoint) {
    const int fd = ::socket(AF_INET, SOCK_STREAM, 0);
    if (fd < 0) {
        throw std::runtime_error("socket: " + describeErrno(errno));
    }

    auto fail = [fd](const std::string& what) {
        const auto message = what + ": " + describeErrno(errno);
        ::close(fd);
        return std::runtime_error(message);
    };

    int reuse = 1;
    if (::setsockopt(fd, SOL_SOCKET, SO_REUSEADDR, &reuse, sizeof(reuse)) < 0) {
        LOG_WARN(SYS, "SO_REUSEADDR failed: " << describeErrno(errno));
    }

    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_port = htons(endpoint.port);
    if (endpoint.address.empty() || endpoint.address == "0.0.0.0") {
        addr.sin_addr.s_addr = INADDR_ANY;
    } else if (::inet_pton(AF_INET, endpoint.address.c_str(), &addr.sin_addr) != 1) {
        ::close(fd);
        throw std::runtime_error("invalid listen address " + endpoint.address);
    }

    if (::bind(fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) < 0) {
        throw fail("bind " + formatAddress(endpoint));
    }
    if (::listen(fd, SOMAXCONN) < 0) {
        throw fail("listen");
    }
    return fd;
}

// Reads until the end of the header block, the size limit, EOF or the read timeout.
std::string readRequestHead(int clientFd, std::size_t limit) {
    std::string raw;
    raw.reserve(1024);
    char buffer[1024];
    while (raw.find("\r\n\r\n") == std::string::npos && raw.size() <= limit) {
        const auto bytes = ::recv(clientFd, buffer, sizeof(buffer), 0);
        if (bytes <= 0) {
            break;
        }
        raw.append(buffer, static_cast<std::size_t>(bytes));
    }
    return raw;
}

Request parseRequestHead(const std::string& raw) {
    std::istringstream requestStream(raw);
    std::string requestLine;
    std::getline(requestStream, requestLine);
    if (!requestLine.empty() && requestLine.back() == '\r') {
        requestLine.pop_back();
    }

    Request request{};
    std::istringstream lineStream(requestLine);
    lineStream >> request.method >> request.target >> request.version;

    const auto queryPos = request.target.find('?');
    request.path = request.target.substr(0, queryPos);
    if (queryPos != std::string::npos) {
        request.query = request.target.substr(queryPos + 1);
    }
    return request;
}

std::string serializeResponse(const Response& response, const HttpServer::CorsConfig& cors, bool withBody) {
    std::ostringstream out;
    out << "HTTP/1.1 " << response.statusCode << ' ' << response.statusText << "\r\n";
    if (response.statusCode != 204) {
        out << "Content-Type: " << (response.contentType.empty() ? "application/json" : response.contentType)
            << "\r\n";
    }
    for (const auto& [name, value] : response.headers) {
        if (!name.empty()) {
            out << name << ": " << value << "\r\n";
        }
    }
    if (cors.enabled && !cors.origin.empty()) {
        out << "Access-Control-Allow-Origin: " << cors.origin << "\r\n";
        if (cors.origin != "*") {
            out << "Vary: Origin\r\n";
        }
    }
    out << "Content-Length: " << response.body.size() << "\r\n";
    out << "Connection: close\r\n\r\n";
    if (withBody) {
        out << response.body;
    }
    return out.str();
}

void sendAll(int clientFd, const std::string& payload) {
    const char* data = payload.data();
    std::size_t remaining = payload.size();
    while (remaining > 0) {
        const auto written = ::send(clientFd, data, remaining, MSG_NOSIGNAL);
        if (written <= 0) {
            LOG_DEBUG(SYS, "send aborted with " << remaining << " bytes left");
            return;
        }
        remaining -= static_cast<std::size_t>(written);
        data += written;
    }
}

}  // namespace

HttpServer::HttpServer(const Router& router, Endpoint endpoint, std::size_t threadCount)
    : router_(router), endpoint_(std::move(endpoint)), threadCount_(threadCount ? threadCount : 1) {}

HttpServer::~HttpServer() { stop(); }

void HttpServer::setCorsConfig(CorsConfig config) { corsConfig_ = std::move(config); }

void HttpServer::start() {
    bool expected = false;
    if (!running_.compare_exchange_strong(expected, true)) {
        return;
    }

    try {
        serverFd_ = openListener(endpoint_);
    } catch (const std::exception&) {
        running_.store(false);
        throw;
    }

    sockaddr_in bound{};
    socklen_t boundLen = sizeof(bound);
    if (::getsockname(serverFd_, reinterpret_cast<sockaddr*>(&bound), &boundLen) == 0) {
        boundPort_ = ntohs(bound.sin_port);
    } else {
        boundPort_ = endpoint_.port;
    }

    LOG_INFO(SYS, "HTTP server listening on " << formatAddress(Endpoint{endpoint_.address, boundPort_})
                                              << " workers=" << threadCount_);

    // Workers get their own copy of the descriptor; serverFd_ is only touched
    // by start() and stop().
    const int listenFd = serverFd_;
    threads_.reserve(threadCount_);
    for (std::size_t i = 0; i < threadCount_; ++i) {
        threads_.emplace_back([this, i, listenFd]() { workerLoop(i, listenFd); });
    }
}

void HttpServer::stop() {
    if (!running_.exchange(false)) {
        return;
    }

    // Wake blocked accept() calls, join, then release the descriptor.
    if (serverFd_ >= 0) {
        ::shutdown(serverFd_, SHUT_RDWR);
    }
    wait();
    if (serverFd_ >= 0) {
        ::close(serverFd_);
        serverFd_ = -1;
    }
}

std::uint16_t HttpServer::port() const { return boundPort_; }

void HttpServer::wait() {
    for (auto& thread : threads_) {
        if (thread.joinable()) {
            thread.join();
        }
    }
    threads_.clear();
}

void HttpServer::workerLoop(std::size_t workerId, int listenFd) {
    LOG_DEBUG(SYS, "Worker " << workerId << " started");

    while (running_.load()) {
        sockaddr_in clientAddr{};
        socklen_t clientLen = sizeof(clientAddr);
        const int clientFd = ::accept(listenFd, reinterpret_cast<sockaddr*>(&clientAddr), &clientLen);
        if (clientFd >= 0) {
            handleClient(clientFd);
            continue;
        }
        if (!running_.load() || errno == EBADF || errno == EINVAL) {
            break;
        }
        if (errno != EINTR) {
            LOG_WARN(SYS, "accept failed: " << describeErrno(errno));
        }
    }

    LOG_DEBUG(SYS, "Worker " << workerId << " stopped");
}

void HttpServer::handleClient(int clientFd) {
    timeval readTimeout{};
    readTimeout.tv_sec = static_cast<time_t>(kClientReadTimeout.count());
    if (::setsockopt(clientFd, SOL_SOCKET, SO_RCVTIMEO, &readTimeout, sizeof(readTimeout)) < 0) {
        LOG_DEBUG(SYS, "SO_RCVTIMEO failed: " << describeErrno(errno));
    }

    auto request = parseRequestHead(readRequestHead(clientFd, kMaxHeaderBytes));

    // HEAD is answered as GET without a body.
    const bool headOnly = request.method == "HEAD";
    if (headOnly) {
        request.method = "GET";
    }

    Response response{};
    if (request.method.empty() || request.target.empty()) {
        igp::http::json_error(response, 400, "bad_request");
    } else {
        response = router_.handle(request);
    }
    LOG_DEBUG(SYS, request.method << ' ' << request.target << " -> " << response.statusCode);

    sendAll(clientFd, serializeResponse(response, corsConfig_, !headOnly));

    ::shutdown(clientFd, SHUT_RDWR);
    ::close(clientFd);
}

}  // namespace igp::api
