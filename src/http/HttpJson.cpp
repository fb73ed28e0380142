#include "http/HttpJson.hpp"

#include <array>

#include <boost/json/serializer.hpp>

namespace gridimg::http {

const char* status_reason(int statusCode) {
    switch (statusCode) {
    case 200:
        return "OK";
    case 204:
        return "No Content";
    case 400:
        return "Bad Request";
    case 404:
        return "Not Found";
    case 405:
        return "Method Not Allowed";
    case 408:
        return "Request Timeout";
    case 413:
        return "Payload Too Large";
    case 500:
        return "Internal Server Error";
    default:
        break;
    }
    return "Unknown";
}

std::string serialize_json(const boost::json::value& value) {
    boost::json::serializer sr;
    sr.reset(&value);

    std::string result;
    std::array<char, 4096> buffer{};

    while (!sr.done()) {
        boost::json::string_view chunk = sr.read(buffer.data(), buffer.size());
        result.append(chunk.data(), chunk.size());
    }

    return result;
}

void write_json(api::Response& response, const boost::json::value& value) {
    response.body = serialize_json(value);
    response.statusCode = 200;
    response.statusText = status_reason(response.statusCode);
    response.contentType = "application/json; charset=utf-8";
    response.headers.clear();
}

}  // namespace gridimg::http
