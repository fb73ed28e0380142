#include "api/Router.hpp"

#include "api/ToolSchema.hpp"
#include "http/ErrorCodes.hpp"
#include "http/json_error.hpp"
#include "logging/Log.h"

namespace gridimg::api {

namespace {

std::string makeKey(const std::string& method, const std::string& path) {
    return method + ' ' + path;
}

}  // namespace

Router::Router() {
    routes_.emplace(makeKey("GET", "/"), [](const Request&) { return root(); });
    routes_.emplace(makeKey("GET", "/health"), [](const Request&) { return health(); });
    routes_.emplace(makeKey("GET", "/tools"), [](const Request&) { return tools(); });
    routes_.emplace(makeKey("POST", std::string("/tools/") + kToolName),
                    [](const Request& request) { return generateImage(request); });
    routes_.emplace(makeKey("POST", "/generate"), [](const Request& request) { return generateImage(request); });
}

bool Router::hasPath(const std::string& path) const {
    for (const auto& route : routes_) {
        const auto& key = route.first;
        const auto space = key.find(' ');
        if (space != std::string::npos && key.compare(space + 1, std::string::npos, path) == 0) {
            return true;
        }
    }
    return false;
}

Response Router::handle(const Request& request) const {
    const auto it = routes_.find(makeKey(request.method, request.path));
    if (it != routes_.end()) {
        LOG_DEBUG(logging::LogCategory::HTTP, "%s %s", request.method.c_str(), request.path.c_str());
        return it->second(request);
    }

    Response response;
    if (hasPath(request.path)) {
        if (request.method == "OPTIONS") {
            response.statusCode = 204;
            response.statusText = "No Content";
            return response;
        }
        http::json_error(response, 405, http::errors::method_not_allowed);
        return response;
    }

    LOG_DEBUG(logging::LogCategory::HTTP, "No route for %s %s", request.method.c_str(), request.path.c_str());
    http::json_error(response, 404, http::errors::not_found);
    return response;
}

}  // namespace gridimg::api
