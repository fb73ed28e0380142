#pragma once

#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace gridimg::app {
class RenderService;
}

namespace gridimg::api {

struct Request {
    std::string method;
    std::string target;
    std::string path;
    std::string query;
    std::string version;
    std::vector<std::pair<std::string, std::string>> headers;
    std::string body;
};

struct Response {
    int statusCode{200};
    std::string statusText{"OK"};
    std::string body;
    std::string contentType;
    std::vector<std::pair<std::string, std::string>> headers;
};

Response root();

Response health();

Response tools();

// POST {"grid_data": {...}, "return_base64": bool}
Response generateImage(const Request& request);

void setRenderService(std::shared_ptr<const app::RenderService> service);

}  // namespace gridimg::api
