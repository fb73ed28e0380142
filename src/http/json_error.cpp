#include "http/json_error.hpp"

#include <utility>

#include <boost/json/object.hpp>

#include "http/HttpJson.hpp"

namespace gridimg::http {

void json_error(api::Response& response, int statusCode, std::string_view errorCode, std::string_view detail) {
    boost::json::object payload;
    payload["error"] = boost::json::string_view(errorCode.data(), errorCode.size());
    if (!detail.empty()) {
        payload["detail"] = boost::json::string_view(detail.data(), detail.size());
    }

    response.body = serialize_json(boost::json::value(std::move(payload)));
    response.statusCode = statusCode;
    response.statusText = status_reason(statusCode);
    response.contentType = "application/json; charset=utf-8";
    response.headers.clear();
}

}  // namespace gridimg::http
