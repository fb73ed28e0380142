#include <iostream>
#include <memory>
#include <string>

#include <boost/json/parse.hpp>
#include <boost/json/value.hpp>

#include "api/Controllers.hpp"
#include "api/Router.hpp"
#include "app/RenderService.h"
#include "config/Config.h"
#include "ui/ResourceProvider.h"

using gridimg::api::Request;
using gridimg::api::Response;
using gridimg::api::Router;

namespace {

Request makeRequest(const std::string& method, const std::string& path, const std::string& body = {}) {
    Request request;
    request.method = method;
    request.target = path;
    request.path = path;
    request.version = "HTTP/1.1";
    request.body = body;
    return request;
}

std::string errorOf(const Response& response) {
    boost::json::error_code ec;
    const auto json = boost::json::parse(response.body, ec);
    if (ec || !json.is_object()) {
        return {};
    }
    const auto* error = json.get_object().if_contains("error");
    return error && error->is_string() ? std::string(error->get_string().c_str()) : std::string();
}

std::string field(const boost::json::value& json, const char* key) {
    const auto* value = json.as_object().if_contains(key);
    return value && value->is_string() ? std::string(value->get_string().c_str()) : std::string();
}

std::string headerOf(const Response& response, const std::string& name) {
    for (const auto& header : response.headers) {
        if (header.first == name) {
            return header.second;
        }
    }
    return {};
}

const char* kValidBody =
    "{\"grid_data\":{\"T_Date\":\"20-11-2025\",\"T_00\":\"\xE2\x97\x8F\",\"T_06\":\"\xE2\x9C\x95\",\"T_16\":\"%\"}";

}  // namespace

int main() {
    const Router router;

    {
        const auto response = router.handle(makeRequest("GET", "/health"));
        const auto json = boost::json::parse(response.body);
        if (response.statusCode != 200 || field(json, "status") != "healthy"
            || field(json, "service") != "grid-image-generator") {
            std::cerr << "Unexpected /health response: " << response.body << "\n";
            return 1;
        }
    }

    {
        const auto response = router.handle(makeRequest("GET", "/tools"));
        const auto json = boost::json::parse(response.body);
        const auto& tools = json.as_object().at("tools").as_array();
        if (response.statusCode != 200 || tools.size() != 1
            || field(tools[0], "name") != "generate_grid_availability_image"
            || !tools[0].as_object().at("inputSchema").as_object().at("properties").as_object().contains("grid_data")) {
            std::cerr << "Unexpected /tools response: " << response.body << "\n";
            return 1;
        }
    }

    if (router.handle(makeRequest("GET", "/")).statusCode != 200) {
        std::cerr << "Root endpoint must answer 200\n";
        return 1;
    }

    {
        const auto response = router.handle(makeRequest("GET", "/missing"));
        if (response.statusCode != 404 || errorOf(response) != "not_found") {
            std::cerr << "Expected 404 not_found, got " << response.statusCode << " " << response.body << "\n";
            return 1;
        }
    }

    if (router.handle(makeRequest("GET", "/generate")).statusCode != 405) {
        std::cerr << "Expected 405 for GET /generate\n";
        return 1;
    }

    // No service configured yet.
    if (router.handle(makeRequest("POST", "/generate", kValidBody)).statusCode != 500) {
        std::cerr << "Expected 500 without a render service\n";
        return 1;
    }

    gridimg::config::Config config;
    gridimg::ui::ResourceProvider resources;
    gridimg::api::setRenderService(std::make_shared<const gridimg::app::RenderService>(config, resources));

    {
        const auto response = router.handle(makeRequest("POST", "/generate", "not json"));
        if (response.statusCode != 400 || errorOf(response) != "invalid_input") {
            std::cerr << "Expected 400 invalid_input for a non-JSON body\n";
            return 1;
        }
    }

    {
        const auto response = router.handle(makeRequest("POST", "/generate", "{\"return_base64\":true}"));
        if (response.statusCode != 400 || errorOf(response) != "grid_data_required") {
            std::cerr << "Expected 400 grid_data_required\n";
            return 1;
        }
    }

    {
        const auto response = router.handle(
            makeRequest("POST", "/tools/generate_grid_availability_image", "{\"grid_data\":{\"T_Date\":\"31-02-2025\"}}"));
        if (response.statusCode != 400 || errorOf(response) != "invalid_date_format") {
            std::cerr << "Expected 400 invalid_date_format, got " << response.statusCode << " " << response.body << "\n";
            return 1;
        }
    }

    {
        const auto response = router.handle(makeRequest("POST", "/generate", kValidBody));
        if (response.statusCode != 200 || response.contentType != "image/png"
            || response.body.compare(0, 4, "\x89PNG") != 0) {
            std::cerr << "Expected a PNG body, got " << response.statusCode << "\n";
            return 1;
        }
        if (headerOf(response, "Content-Disposition").find("grid_availability_20_11_2025.png") == std::string::npos) {
            std::cerr << "Missing Content-Disposition filename\n";
            return 1;
        }
    }

    {
        std::string body(kValidBody);
        body.insert(body.size() - 1, ",\"return_base64\":true");
        const auto response = router.handle(makeRequest("POST", "/tools/generate_grid_availability_image", body));
        const auto json = boost::json::parse(response.body);
        if (response.statusCode != 200 || !json.as_object().at("success").as_bool()
            || field(json, "image_size") != "1024x250px" || field(json, "mime_type") != "image/png"
            || field(json, "image_base64").empty()) {
            std::cerr << "Unexpected base64 response\n";
            return 1;
        }
    }

    gridimg::api::setRenderService(nullptr);
    std::cout << "test_router passed\n";
    return 0;
}
