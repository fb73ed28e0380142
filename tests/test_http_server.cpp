#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <sys/time.h>
#include <unistd.h>

#include <chrono>
#include <cstring>
#include <iostream>
#include <string>

#include "api/HttpServer.hpp"

using gridimg::api::Endpoint;
using gridimg::api::HttpServer;

namespace {

int connectTo(std::uint16_t port) {
    const int fd = ::socket(AF_INET, SOCK_STREAM, 0);
    if (fd < 0) {
        return -1;
    }
    timeval timeout{};
    timeout.tv_sec = 5;
    ::setsockopt(fd, SOL_SOCKET, SO_RCVTIMEO, &timeout, sizeof(timeout));

    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_port = htons(port);
    ::inet_pton(AF_INET, "127.0.0.1", &addr.sin_addr);
    if (::connect(fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) < 0) {
        ::close(fd);
        return -1;
    }
    return fd;
}

bool sendAll(int fd, const std::string& data) {
    return ::send(fd, data.data(), data.size(), MSG_NOSIGNAL) == static_cast<ssize_t>(data.size());
}

// Reads until the peer closes or our own 5 s timeout fires.
std::string readAll(int fd) {
    std::string out;
    char buffer[1024];
    while (true) {
        const auto bytes = ::recv(fd, buffer, sizeof(buffer), 0);
        if (bytes <= 0) {
            break;
        }
        out.append(buffer, static_cast<std::size_t>(bytes));
    }
    return out;
}

}  // namespace

int main() {
    HttpServer server(Endpoint{"127.0.0.1", 0}, 1);
    server.setReceiveTimeout(std::chrono::milliseconds(200));
    server.start();

    const std::uint16_t port = server.endpoint().port;
    if (port == 0) {
        std::cerr << "Expected a kernel-assigned port\n";
        return 1;
    }

    // A client that stops mid-header is answered 408 and released.
    {
        const int fd = connectTo(port);
        if (fd < 0 || !sendAll(fd, "GET /health HTTP/1.1\r\nHost: localhost\r\n")) {
            std::cerr << "Unable to connect\n";
            return 1;
        }
        const auto started = std::chrono::steady_clock::now();
        const std::string reply = readAll(fd);
        const auto waited = std::chrono::steady_clock::now() - started;
        ::close(fd);

        if (reply.compare(0, 12, "HTTP/1.1 408") != 0) {
            std::cerr << "Expected 408 for a stalled header, got: " << reply.substr(0, 40) << "\n";
            return 1;
        }
        if (waited > std::chrono::seconds(4)) {
            std::cerr << "Stalled client held the worker too long\n";
            return 1;
        }
    }

    // A body shorter than Content-Length times out the same way.
    {
        const int fd = connectTo(port);
        if (fd < 0
            || !sendAll(fd, "POST /generate HTTP/1.1\r\nContent-Length: 50\r\n\r\n{\"grid_data\":")) {
            std::cerr << "Unable to connect\n";
            return 1;
        }
        const std::string reply = readAll(fd);
        ::close(fd);
        if (reply.compare(0, 12, "HTTP/1.1 408") != 0 || reply.find("request_timeout") == std::string::npos) {
            std::cerr << "Expected 408 for a stalled body\n";
            return 1;
        }
    }

    // The single worker is free again for the next client.
    {
        const int fd = connectTo(port);
        if (fd < 0 || !sendAll(fd, "GET /health HTTP/1.1\r\nHost: localhost\r\n\r\n")) {
            std::cerr << "Unable to connect\n";
            return 1;
        }
        const std::string reply = readAll(fd);
        ::close(fd);
        if (reply.compare(0, 15, "HTTP/1.1 200 OK") != 0 || reply.find("healthy") == std::string::npos) {
            std::cerr << "Health check after a stalled client failed\n";
            return 1;
        }
    }

    server.stop();
    std::cout << "test_http_server passed\n";
    return 0;
}
