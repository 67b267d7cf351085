#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <string>
#include <thread>
#include <vector>

#include "api/Router.hpp"

namespace igp::api {

struct Endpoint {
    std::string address;
    std::uint16_t port;
};

// Blocking accept loop shared by a fixed pool of worker threads; one
// request per connection. A slow upstream call occupies only its worker.
class HttpServer {
public:
    struct CorsConfig {
        bool enabled{true};
        std::string origin{"*"};
    };

    HttpServer(const Router& router, Endpoint endpoint, std::size_t threadCount);
    ~HttpServer();

    HttpServer(const HttpServer&) = delete;
    HttpServer& operator=(const HttpServer&) = delete;

    void start();
    void stop();
    void wait();

    void setCorsConfig(CorsConfig config);

    // Port actually bound; differs from the endpoint's when it asked for 0.
    std::uint16_t port() const;

private:
    static constexpr std::size_t kMaxHeaderBytes = 8192;
    static constexpr std::chrono::seconds kClientReadTimeout{15};

    void workerLoop(std::size_t workerId, int listenFd);
    void handleClient(int clientFd);

    const Router& router_;
    Endpoint endpoint_;
    std::size_t threadCount_;
    std::vector<std::thread> threads_;
    std::atomic<bool> running_{false};
    int serverFd_ = -1;
    std::uint16_t boundPort_ = 0;
    CorsConfig corsConfig_{};
};

}  // namespace igp::api
