#include "api/Controllers.hpp"

#include <exception>
#include <mutex>
#include <string>
#include <utility>

#include <boost/json/array.hpp>
#include <boost/json/object.hpp>
#include <boost/json/parse.hpp>
#include <boost/json/value.hpp>

#include "api/ToolSchema.hpp"
#include "app/RenderService.h"
#include "domain/Calendar.h"
#include "domain/Errors.h"
#include "http/ErrorCodes.hpp"
#include "http/HttpJson.hpp"
#include "http/json_error.hpp"
#include "logging/Log.h"
#include "ui/OutputEncoder.h"

namespace gridimg::api {

namespace {

constexpr logging::LogCategory kLogCategory = logging::LogCategory::HTTP;

std::mutex& serviceMutex() {
    static std::mutex mutex;
    return mutex;
}

std::shared_ptr<const app::RenderService>& serviceStorage() {
    static std::shared_ptr<const app::RenderService> service;
    return service;
}

std::shared_ptr<const app::RenderService> currentService() {
    std::lock_guard<std::mutex> lock(serviceMutex());
    return serviceStorage();
}

Response errorResponse(int statusCode, std::string_view code, std::string_view detail = {}) {
    Response response;
    http::json_error(response, statusCode, code, detail);
    return response;
}

}  // namespace

void setRenderService(std::shared_ptr<const app::RenderService> service) {
    std::lock_guard<std::mutex> lock(serviceMutex());
    serviceStorage() = std::move(service);
}

Response root() {
    boost::json::object endpoints;
    endpoints["/health"] = "Health check endpoint";
    endpoints["/tools"] = "List available tools";
    endpoints["/tools/generate_grid_availability_image"] = "Generate grid availability image";
    endpoints["/generate"] = "Alias of /tools/generate_grid_availability_image";

    boost::json::object payload;
    payload["name"] = "Grid Image Generator";
    payload["version"] = kServiceVersion;
    payload["description"] = "HTTP API for generating electricity grid availability images";
    payload["endpoints"] = std::move(endpoints);

    Response response;
    http::write_json(response, payload);
    return response;
}

Response health() {
    boost::json::object payload;
    payload["status"] = "healthy";
    payload["service"] = kServiceName;

    Response response;
    http::write_json(response, payload);
    return response;
}

Response tools() {
    boost::json::array list;
    list.emplace_back(gridToolDescriptor(false));

    boost::json::object payload;
    payload["tools"] = std::move(list);

    Response response;
    http::write_json(response, payload);
    return response;
}

Response generateImage(const Request& request) {
    boost::json::error_code ec;
    const boost::json::value body =
        boost::json::parse(boost::json::string_view(request.body.data(), request.body.size()), ec);
    if (ec || !body.is_object()) {
        return errorResponse(400, http::errors::invalid_input, "Request body must be a JSON object");
    }

    const auto& object = body.get_object();
    const auto* gridData = object.if_contains("grid_data");
    if (!gridData || !gridData->is_object()) {
        return errorResponse(400, http::errors::grid_data_required, "grid_data object is required");
    }

    bool returnBase64 = false;
    if (const auto* flag = object.if_contains("return_base64"); flag && !flag->is_null()) {
        if (!flag->is_bool()) {
            return errorResponse(400, http::errors::invalid_input, "return_base64 must be a boolean");
        }
        returnBase64 = flag->get_bool();
    }

    auto service = currentService();
    LOG_GUARD_RET(service, kLogCategory, errorResponse(500, http::errors::internal_error),
                  "generateImage called before a render service was configured");

    try {
        const domain::StateModel model = service->validate(*gridData);
        const domain::RenderedImage image = service->render(model);

        Response response;
        if (returnBase64) {
            boost::json::object payload;
            payload["success"] = true;
            payload["message"] = "Grid availability image generated successfully";
            payload["image_size"] = kImageSize;
            payload["image_base64"] = ui::OutputEncoder::toBase64(image);
            payload["mime_type"] = "image/png";
            http::write_json(response, payload);
            return response;
        }

        response.statusCode = 200;
        response.statusText = http::status_reason(200);
        response.contentType = "image/png";
        response.body.assign(image.bytes.begin(), image.bytes.end());
        response.headers.emplace_back(
            "Content-Disposition",
            "attachment; filename=grid_availability_" + domain::format_date_stem(model.date) + ".png");
        return response;
    }
    catch (const domain::RenderError& ex) {
        const int status = domain::is_validation_error(ex.kind()) ? 400 : 500;
        LOG_WARN(kLogCategory, "Image generation failed (%d): %s", status, ex.what());
        return errorResponse(status, ex.code(), ex.what());
    }
    catch (const std::exception& ex) {
        LOG_ERROR(kLogCategory, "Unexpected error generating image: %s", ex.what());
        return errorResponse(500, http::errors::internal_error, ex.what());
    }
}

}  // namespace gridimg::api
