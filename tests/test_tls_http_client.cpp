#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>

#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <iostream>
#include <stdexcept>
#include <string>
#include <thread>
#include <utility>

#include "infra/http/TlsHttpClient.hpp"

namespace {

using namespace std::chrono_literals;
using core::ports::HttpGet;
using core::ports::TransportError;
using Clock = std::chrono::steady_clock;

// Loopback HTTP/1.1 server answering one connection at a time. The handler
// maps a request path to a raw response; an empty response means the
// connection is held open without answering until the delay elapses.
class LoopbackServer {
public:
    using Handler = std::function<std::string(const std::string& path)>;

    LoopbackServer(Handler handler, std::chrono::milliseconds delay)
        : handler_(std::move(handler)), delay_(delay) {
        listenFd_ = ::socket(AF_INET, SOCK_STREAM, 0);
        if (listenFd_ < 0) {
            throw std::runtime_error("socket failed");
        }
        int reuse = 1;
        ::setsockopt(listenFd_, SOL_SOCKET, SO_REUSEADDR, &reuse, sizeof(reuse));

        sockaddr_in addr{};
        addr.sin_family = AF_INET;
        addr.sin_port = 0;
        addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
        if (::bind(listenFd_, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) < 0
            || ::listen(listenFd_, 16) < 0) {
            ::close(listenFd_);
            throw std::runtime_error("bind/listen failed");
        }
        socklen_t len = sizeof(addr);
        ::getsockname(listenFd_, reinterpret_cast<sockaddr*>(&addr), &len);
        port_ = ntohs(addr.sin_port);

        thread_ = std::thread([this]() { serve(); });
    }

    ~LoopbackServer() {
        running_.store(false);
        ::shutdown(listenFd_, SHUT_RDWR);
        thread_.join();
        ::close(listenFd_);
    }

    std::string url(const std::string& path) const {
        return "http://127.0.0.1:" + std::to_string(port_) + path;
    }

    int hits() const { return hits_.load(); }

private:
    void serve() {
        while (running_.load()) {
            const int clientFd = ::accept(listenFd_, nullptr, nullptr);
            if (clientFd < 0) {
                break;
            }
            hits_.fetch_add(1);

            std::string raw;
            char buffer[512];
            while (raw.find("\r\n\r\n") == std::string::npos) {
                const auto bytes = ::recv(clientFd, buffer, sizeof(buffer), 0);
                if (bytes <= 0) {
                    break;
                }
                raw.append(buffer, static_cast<std::size_t>(bytes));
            }
            const auto pathStart = raw.find(' ') + 1;
            const auto path = raw.substr(pathStart, raw.find(' ', pathStart) - pathStart);

            const auto response = handler_(path);
            std::this_thread::sleep_for(delay_);
            if (!response.empty()) {
                ::send(clientFd, response.data(), response.size(), MSG_NOSIGNAL);
            }
            ::shutdown(clientFd, SHUT_RDWR);
            ::close(clientFd);
        }
    }

    Handler handler_;
    std::chrono::milliseconds delay_;
    int listenFd_ = -1;
    std::uint16_t port_ = 0;
    std::atomic<bool> running_{true};
    std::atomic<int> hits_{0};
    std::thread thread_;
};

std::string okResponse(const std::string& body) {
    return "HTTP/1.1 200 OK\r\nContent-Type: application/json\r\nX-Response-Time: 3ms\r\nContent-Length: "
           + std::to_string(body.size()) + "\r\nConnection: close\r\n\r\n" + body;
}

std::string redirectTo(const std::string& location) {
    return "HTTP/1.1 302 Found\r\nLocation: " + location + "\r\nContent-Length: 0\r\nConnection: close\r\n\r\n";
}

long long millisSince(Clock::time_point start) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(Clock::now() - start).count();
}

}  // namespace

int main() {
    infra::http::TlsHttpClient client(false);

    {
        LoopbackServer server([](const std::string&) { return okResponse(R"({"ok":true})"); }, 0ms);
        const auto result = client.get(HttpGet{server.url("/api/ticker/btc_idr"), {{"User-Agent", "test"}}, 2000ms});
        if (result.status != 200U || result.body != R"({"ok":true})") {
            std::cerr << "Expected a plain 200 response, got status " << result.status << "\n";
            return 1;
        }
        if (result.header("x-response-time").value_or("") != "3ms") {
            std::cerr << "Expected response headers to be exposed case-insensitively\n";
            return 1;
        }
    }

    {
        // Four redirect hops of 150 ms each before the final answer: every hop
        // is well under the timeout, the chain as a whole is not.
        LoopbackServer server(
            [](const std::string& path) {
                const int hop = path.size() > 4 ? std::stoi(path.substr(4)) : 0;
                return hop < 4 ? redirectTo("/hop" + std::to_string(hop + 1)) : okResponse("{}");
            },
            150ms);

        const auto start = Clock::now();
        try {
            const auto result = client.get(HttpGet{server.url("/hop0"), {}, 500ms});
            std::cerr << "Expected the redirect chain to exceed its deadline, got status " << result.status
                      << " after " << millisSince(start) << " ms\n";
            return 1;
        } catch (const TransportError& ex) {
            if (ex.kind() != TransportError::Kind::Timeout) {
                std::cerr << "Expected a Timeout failure, got: " << ex.what() << "\n";
                return 1;
            }
        }
        const auto elapsed = millisSince(start);
        if (elapsed > 1000) {
            std::cerr << "Expected the attempt to end near its 500 ms deadline, took " << elapsed << " ms\n";
            return 1;
        }
    }

    {
        // Accepts the connection and never answers.
        LoopbackServer server([](const std::string&) { return std::string{}; }, 1200ms);

        const auto start = Clock::now();
        try {
            client.get(HttpGet{server.url("/api/summaries"), {}, 300ms});
            std::cerr << "Expected a silent server to time out\n";
            return 1;
        } catch (const TransportError& ex) {
            if (ex.kind() != TransportError::Kind::Timeout) {
                std::cerr << "Expected a Timeout failure, got: " << ex.what() << "\n";
                return 1;
            }
        }
        const auto elapsed = millisSince(start);
        if (elapsed > 900) {
            std::cerr << "Expected the read to stop at the 300 ms deadline, took " << elapsed << " ms\n";
            return 1;
        }
    }

    {
        const auto secure = infra::http::parse_url("https://indodax.com/api/tradingview/history?symbol=btc_idr");
        if (!secure.secure || secure.host != "indodax.com" || secure.port != "443"
            || secure.target != "/api/tradingview/history?symbol=btc_idr") {
            std::cerr << "Unexpected parse of an https URL\n";
            return 1;
        }
        const auto plain = infra::http::parse_url("http://127.0.0.1:8080?x=1#frag");
        if (plain.secure || plain.port != "8080" || plain.target != "/?x=1") {
            std::cerr << "Unexpected parse of an http URL with a port and no path\n";
            return 1;
        }
        bool rejected = false;
        try {
            infra::http::parse_url("ftp://indodax.com/");
        } catch (const std::invalid_argument&) {
            rejected = true;
        }
        if (!rejected) {
            std::cerr << "Expected a non-HTTP scheme to be rejected\n";
            return 1;
        }
    }

    return 0;
}
