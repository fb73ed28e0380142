#pragma once

#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>
#include <thread>
#include <vector>

#include "api/Router.hpp"

namespace gridimg::api {

struct Endpoint {
    std::string address;
    std::uint16_t port;
};

class HttpServer {
public:
    struct CorsConfig {
        bool enabled{false};
        std::string origin;
    };

    static constexpr std::size_t kMaxHeaderBytes = 16 * 1024;
    static constexpr std::size_t kMaxBodyBytes = 1024 * 1024;
    static constexpr std::chrono::milliseconds kDefaultReceiveTimeout{10000};

    HttpServer(Endpoint endpoint, std::size_t threadCount);
    ~HttpServer();

    HttpServer(const HttpServer&) = delete;
    HttpServer& operator=(const HttpServer&) = delete;

    void start();
    void stop();
    void wait();

    void setCorsConfig(CorsConfig config);
    // Call before start(). A client silent for longer than this is answered 408 and dropped.
    void setReceiveTimeout(std::chrono::milliseconds timeout);

    // Port 0 is replaced by the kernel-assigned port once start() returns.
    const Endpoint& endpoint() const { return endpoint_; }

private:
    void workerLoop(std::size_t workerId);
    void handleClient(int clientFd);
    void applyReceiveTimeout(int clientFd) const;
    void sendResponse(int clientFd, const Response& response) const;

    Endpoint endpoint_;
    std::size_t threadCount_;
    std::vector<std::thread> threads_;
    std::atomic<bool> running_{false};
    int serverFd_ = -1;
    Router router_{};
    CorsConfig corsConfig_{};
    std::chrono::milliseconds receiveTimeout_{kDefaultReceiveTimeout};
};

}  // namespace gridimg::api
