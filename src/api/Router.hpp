#pragma once

#include <functional>
#include <map>
#include <string>

#include "api/Controllers.hpp"

namespace gridimg::api {

class Router {
public:
    Router();

    Response handle(const Request& request) const;

    bool hasPath(const std::string& path) const;

private:
    using Handler = std::function<Response(const Request&)>;

    std::map<std::string, Handler> routes_;
};

}  // namespace gridimg::api
