#include "api/HttpServer.hpp"

#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <sys/time.h>
#include <unistd.h>

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstring>
#include <sstream>
#include <stdexcept>
#include <string>
#include <utility>

#include "http/ErrorCodes.hpp"
#include "http/json_error.hpp"
#include "logging/Log.h"

namespace gridimg::api {

namespace {

constexpr logging::LogCategory kLogCategory = logging::LogCategory::HTTP;

std::string describeErrno(int err) {
    return std::strerror(err);
}

std::string formatAddress(const Endpoint& endpoint) {
    if (endpoint.address.empty()) {
        return std::string("0.0.0.0:") + std::to_string(endpoint.port);
    }
    return endpoint.address + ':' + std::to_string(endpoint.port);
}

std::string toLowerCopy(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(), [](unsigned char ch) {
        return static_cast<char>(std::tolower(ch));
    });
    return value;
}

std::string trimCopy(const std::string& value) {
    const auto first = value.find_first_not_of(" \t\r");
    if (first == std::string::npos) {
        return {};
    }
    const auto last = value.find_last_not_of(" \t\r");
    return value.substr(first, last - first + 1);
}

// Parses the request line and headers; returns false when the request line is unusable.
bool parseHead(const std::string& head, Request& request) {
    std::istringstream stream(head);
    std::string requestLine;
    std::getline(stream, requestLine);
    if (!requestLine.empty() && requestLine.back() == '\r') {
        requestLine.pop_back();
    }

    std::istringstream lineStream(requestLine);
    lineStream >> request.method >> request.target >> request.version;
    if (request.method.empty() || request.target.empty()) {
        return false;
    }

    const auto queryPos = request.target.find('?');
    if (queryPos != std::string::npos) {
        request.path = request.target.substr(0, queryPos);
        request.query = request.target.substr(queryPos + 1);
    } else {
        request.path = request.target;
    }

    std::string line;
    while (std::getline(stream, line)) {
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        if (line.empty()) {
            break;
        }
        const auto colon = line.find(':');
        if (colon == std::string::npos) {
            continue;
        }
        request.headers.emplace_back(trimCopy(line.substr(0, colon)), trimCopy(line.substr(colon + 1)));
    }
    return true;
}

// -1 when absent, -2 when unparsable.
long long contentLengthOf(const Request& request) {
    for (const auto& header : request.headers) {
        if (toLowerCopy(header.first) != "content-length") {
            continue;
        }
        try {
            std::size_t consumed = 0;
            const long long value = std::stoll(header.second, &consumed);
            if (consumed != header.second.size() || value < 0) {
                return -2;
            }
            return value;
        }
        catch (const std::logic_error&) {
            return -2;
        }
    }
    return -1;
}

Response errorResponse(int statusCode, std::string_view code, std::string_view detail = {}) {
    Response response;
    http::json_error(response, statusCode, code, detail);
    return response;
}

}  // namespace

HttpServer::HttpServer(Endpoint endpoint, std::size_t threadCount)
    : endpoint_(std::move(endpoint)), threadCount_(threadCount ? threadCount : 1) {}

HttpServer::~HttpServer() { stop(); }

void HttpServer::setCorsConfig(CorsConfig config) { corsConfig_ = std::move(config); }

void HttpServer::setReceiveTimeout(std::chrono::milliseconds timeout) { receiveTimeout_ = timeout; }

void HttpServer::start() {
    bool expected = false;
    if (!running_.compare_exchange_strong(expected, true)) {
        return;
    }

    serverFd_ = ::socket(AF_INET, SOCK_STREAM, 0);
    if (serverFd_ < 0) {
        running_.store(false);
        throw std::runtime_error("Unable to create server socket: " + describeErrno(errno));
    }

    int opt = 1;
    ::setsockopt(serverFd_, SOL_SOCKET, SO_REUSEADDR, &opt, sizeof(opt));

    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_port = htons(endpoint_.port);
    if (endpoint_.address.empty() || endpoint_.address == "0.0.0.0") {
        addr.sin_addr.s_addr = INADDR_ANY;
    } else {
        if (::inet_pton(AF_INET, endpoint_.address.c_str(), &addr.sin_addr) != 1) {
            ::close(serverFd_);
            serverFd_ = -1;
            running_.store(false);
            throw std::runtime_error("Invalid listen address: " + endpoint_.address);
        }
    }

    if (::bind(serverFd_, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) < 0) {
        const auto message = describeErrno(errno);
        ::close(serverFd_);
        serverFd_ = -1;
        running_.store(false);
        throw std::runtime_error("Unable to bind " + formatAddress(endpoint_) + ": " + message);
    }

    if (::listen(serverFd_, SOMAXCONN) < 0) {
        const auto message = describeErrno(errno);
        ::close(serverFd_);
        serverFd_ = -1;
        running_.store(false);
        throw std::runtime_error("Unable to listen: " + message);
    }

    sockaddr_in bound{};
    socklen_t boundLen = sizeof(bound);
    if (::getsockname(serverFd_, reinterpret_cast<sockaddr*>(&bound), &boundLen) == 0) {
        endpoint_.port = ntohs(bound.sin_port);
    }

    LOG_INFO(kLogCategory, "HTTP server listening on %s", formatAddress(endpoint_).c_str());

    threads_.reserve(threadCount_);
    for (std::size_t i = 0; i < threadCount_; ++i) {
        threads_.emplace_back([this, i]() { workerLoop(i); });
    }
}

void HttpServer::stop() {
    if (!running_.exchange(false)) {
        return;
    }

    if (serverFd_ >= 0) {
        ::shutdown(serverFd_, SHUT_RDWR);
        ::close(serverFd_);
        serverFd_ = -1;
    }

    wait();
}

void HttpServer::wait() {
    for (auto& thread : threads_) {
        if (thread.joinable()) {
            thread.join();
        }
    }
    threads_.clear();
}

void HttpServer::workerLoop(std::size_t workerId) {
    LOG_DEBUG(kLogCategory, "Worker %zu started", workerId);

    while (running_.load()) {
        sockaddr_in clientAddr{};
        socklen_t clientLen = sizeof(clientAddr);
        int clientFd = ::accept(serverFd_, reinterpret_cast<sockaddr*>(&clientAddr), &clientLen);
        if (clientFd < 0) {
            if (!running_.load()) {
                break;
            }
            if (errno == EINTR) {
                continue;
            }
            if (errno == EBADF || errno == EINVAL) {
                break;
            }
            LOG_WARN(kLogCategory, "accept failed: %s", describeErrno(errno).c_str());
            continue;
        }

        applyReceiveTimeout(clientFd);
        handleClient(clientFd);
    }

    LOG_DEBUG(kLogCategory, "Worker %zu finished", workerId);
}

void HttpServer::applyReceiveTimeout(int clientFd) const {
    if (receiveTimeout_.count() <= 0) {
        return;
    }
    timeval timeout{};
    timeout.tv_sec = static_cast<time_t>(receiveTimeout_.count() / 1000);
    timeout.tv_usec = static_cast<suseconds_t>((receiveTimeout_.count() % 1000) * 1000);
    if (::setsockopt(clientFd, SOL_SOCKET, SO_RCVTIMEO, &timeout, sizeof(timeout)) < 0) {
        LOG_WARN(kLogCategory, "SO_RCVTIMEO failed: %s", describeErrno(errno).c_str());
    }
}

void HttpServer::handleClient(int clientFd) {
    std::string data;
    data.reserve(4096);
    char buffer[4096];

    bool timedOut = false;
    std::size_t headerEnd = std::string::npos;
    while ((headerEnd = data.find("\r\n\r\n")) == std::string::npos) {
        const auto bytes = ::recv(clientFd, buffer, sizeof(buffer), 0);
        if (bytes <= 0) {
            timedOut = bytes < 0 && (errno == EAGAIN || errno == EWOULDBLOCK);
            break;
        }
        data.append(buffer, static_cast<std::size_t>(bytes));
        if (data.size() > kMaxHeaderBytes) {
            break;
        }
    }

    Request request{};
    if (headerEnd == std::string::npos && timedOut) {
        LOG_WARN(kLogCategory, "Dropping client idle for %lld ms", static_cast<long long>(receiveTimeout_.count()));
        if (!data.empty()) {
            sendResponse(clientFd, errorResponse(408, http::errors::request_timeout));
        }
        ::close(clientFd);
        return;
    }
    if (headerEnd == std::string::npos || !parseHead(data.substr(0, headerEnd + 2), request)) {
        if (!data.empty()) {
            sendResponse(clientFd, errorResponse(400, http::errors::invalid_input, "Malformed HTTP request"));
        }
        ::close(clientFd);
        return;
    }

    const long long contentLength = contentLengthOf(request);
    if (contentLength == -2) {
        sendResponse(clientFd, errorResponse(400, http::errors::invalid_input, "Invalid Content-Length"));
        ::shutdown(clientFd, SHUT_RDWR);
        ::close(clientFd);
        return;
    }
    if (contentLength > static_cast<long long>(kMaxBodyBytes)) {
        LOG_WARN(kLogCategory, "Rejecting %lld byte body on %s", contentLength, request.path.c_str());
        sendResponse(clientFd, errorResponse(413, http::errors::payload_too_large));
        ::shutdown(clientFd, SHUT_RDWR);
        ::close(clientFd);
        return;
    }

    request.body = data.substr(headerEnd + 4);
    if (contentLength >= 0) {
        const auto expected = static_cast<std::size_t>(contentLength);
        while (request.body.size() < expected) {
            const auto bytes = ::recv(clientFd, buffer, sizeof(buffer), 0);
            if (bytes <= 0) {
                timedOut = bytes < 0 && (errno == EAGAIN || errno == EWOULDBLOCK);
                break;
            }
            request.body.append(buffer, static_cast<std::size_t>(bytes));
        }
        if (timedOut && request.body.size() < expected) {
            LOG_WARN(kLogCategory, "Body for %s stalled at %zu of %zu bytes", request.path.c_str(),
                     request.body.size(), expected);
            sendResponse(clientFd, errorResponse(408, http::errors::request_timeout));
            ::shutdown(clientFd, SHUT_RDWR);
            ::close(clientFd);
            return;
        }
        if (request.body.size() > expected) {
            request.body.resize(expected);
        }
    }

    sendResponse(clientFd, router_.handle(request));

    ::shutdown(clientFd, SHUT_RDWR);
    ::close(clientFd);
}

void HttpServer::sendResponse(int clientFd, const Response& responseData) const {
    std::ostringstream response;
    response << "HTTP/1.1 " << responseData.statusCode << ' ' << responseData.statusText << "\r\n";
    if (responseData.statusCode != 204) {
        const std::string contentType =
            responseData.contentType.empty() ? "application/json" : responseData.contentType;
        response << "Content-Type: " << contentType << "\r\n";
    }
    for (const auto& header : responseData.headers) {
        if (!header.first.empty()) {
            response << header.first << ": " << header.second << "\r\n";
        }
    }
    if (corsConfig_.enabled && !corsConfig_.origin.empty()) {
        response << "Access-Control-Allow-Origin: " << corsConfig_.origin << "\r\n";
        response << "Vary: Origin\r\n";
        response << "Access-Control-Allow-Headers: Content-Type\r\n";
        response << "Access-Control-Allow-Methods: GET, POST, OPTIONS\r\n";
    }
    response << "Content-Length: " << responseData.body.size() << "\r\n";
    response << "Connection: close\r\n\r\n";
    response << responseData.body;

    const auto responseStr = response.str();
    const char* data = responseStr.data();
    std::size_t remaining = responseStr.size();

    while (remaining > 0) {
        const auto written = ::send(clientFd, data, remaining, MSG_NOSIGNAL);
        if (written <= 0) {
            LOG_DEBUG(kLogCategory, "Client closed before the response was sent");
            break;
        }
        remaining -= static_cast<std::size_t>(written);
        data += written;
    }
}

}  // namespace gridimg::api
