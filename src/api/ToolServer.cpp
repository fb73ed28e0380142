#include "api/ToolServer.hpp"

#include <exception>
#include <filesystem>
#include <istream>
#include <ostream>
#include <utility>

#include <boost/json/array.hpp>
#include <boost/json/parse.hpp>

#include "api/ToolSchema.hpp"
#include "app/RenderService.h"
#include "domain/Calendar.h"
#include "domain/Errors.h"
#include "http/HttpJson.hpp"
#include "logging/Log.h"
#include "ui/OutputEncoder.h"

namespace gridimg::api {

namespace {

constexpr logging::LogCategory kLogCategory = logging::LogCategory::RPC;

namespace rpc {
constexpr int kParseError = -32700;
constexpr int kInvalidRequest = -32600;
constexpr int kMethodNotFound = -32601;
constexpr int kInvalidParams = -32602;
constexpr int kInternalError = -32603;
}  // namespace rpc

boost::json::value makeResult(const boost::json::value& id, boost::json::value result) {
    boost::json::object response;
    response["jsonrpc"] = "2.0";
    response["id"] = id;
    response["result"] = std::move(result);
    return response;
}

boost::json::value makeError(const boost::json::value& id, int code, const std::string& message) {
    boost::json::object error;
    error["code"] = code;
    error["message"] = message;

    boost::json::object response;
    response["jsonrpc"] = "2.0";
    response["id"] = id;
    response["error"] = std::move(error);
    return response;
}

boost::json::object textItem(const std::string& text) {
    boost::json::object item;
    item["type"] = "text";
    item["text"] = text;
    return item;
}

boost::json::value toolFailure(const boost::json::value& id, const std::string& text) {
    boost::json::array content;
    content.emplace_back(textItem(text));

    boost::json::object result;
    result["content"] = std::move(content);
    result["isError"] = true;
    return makeResult(id, std::move(result));
}

std::string stringOf(const boost::json::string& s) {
    return std::string(s.data(), s.size());
}

}  // namespace

ToolServer::ToolServer(std::shared_ptr<const app::RenderService> service) : service_(std::move(service)) {}

int ToolServer::run(std::istream& in, std::ostream& out) {
    LOG_INFO(kLogCategory, "Tool server reading JSON-RPC from stdin");

    std::string line;
    while (std::getline(in, line)) {
        if (auto reply = handleLine(line)) {
            out << *reply << '\n';
            out.flush();
        }
    }

    LOG_INFO(kLogCategory, "Input closed, tool server exiting");
    return 0;
}

std::optional<std::string> ToolServer::handleLine(const std::string& line) {
    if (line.find_first_not_of(" \t\r") == std::string::npos) {
        return std::nullopt;
    }

    boost::json::error_code ec;
    const boost::json::value message = boost::json::parse(boost::json::string_view(line.data(), line.size()), ec);
    if (ec) {
        LOG_WARN(kLogCategory, "Unparsable message: %s", ec.message().c_str());
        return http::serialize_json(makeError(nullptr, rpc::kParseError, "Parse error"));
    }

    auto reply = handleMessage(message);
    if (!reply) {
        return std::nullopt;
    }
    return http::serialize_json(*reply);
}

std::optional<boost::json::value> ToolServer::handleMessage(const boost::json::value& message) {
    if (!message.is_object()) {
        return makeError(nullptr, rpc::kInvalidRequest, "Invalid Request");
    }

    const auto& object = message.get_object();
    const auto* idField = object.if_contains("id");
    const auto* methodField = object.if_contains("method");
    const boost::json::value id = idField ? *idField : boost::json::value(nullptr);

    if (!methodField || !methodField->is_string()) {
        if (!idField) {
            return std::nullopt;
        }
        return makeError(id, rpc::kInvalidRequest, "Invalid Request");
    }

    const std::string method = stringOf(methodField->get_string());
    const auto* paramsField = object.if_contains("params");
    const boost::json::value params = paramsField ? *paramsField : boost::json::value(boost::json::object{});

    if (!idField) {
        if (method == "notifications/initialized") {
            initialized_ = true;
            LOG_DEBUG(kLogCategory, "Client finished initialization");
        } else {
            LOG_DEBUG(kLogCategory, "Ignoring notification %s", method.c_str());
        }
        return std::nullopt;
    }

    try {
        return dispatch_(method, params, id);
    }
    catch (const std::exception& ex) {
        LOG_ERROR(kLogCategory, "%s failed: %s", method.c_str(), ex.what());
        return makeError(id, rpc::kInternalError, ex.what());
    }
}

boost::json::value ToolServer::dispatch_(const std::string& method, const boost::json::value& params,
                                         const boost::json::value& id) {
    LOG_DEBUG(kLogCategory, "-> %s", method.c_str());

    if (method == "initialize") {
        return initialize_(params, id);
    }
    if (method == "ping") {
        return makeResult(id, boost::json::object{});
    }
    if (method == "tools/list") {
        return listTools_(id);
    }
    if (method == "tools/call") {
        return callTool_(params, id);
    }
    if (method == "logging/setLevel") {
        return setLogLevel_(params, id);
    }

    LOG_WARN(kLogCategory, "Unknown method %s", method.c_str());
    return makeError(id, rpc::kMethodNotFound, "Method not found: " + method);
}

boost::json::value ToolServer::initialize_(const boost::json::value& params, const boost::json::value& id) {
    std::string protocolVersion = kProtocolVersion;
    if (params.is_object()) {
        if (const auto* requested = params.get_object().if_contains("protocolVersion");
            requested && requested->is_string()) {
            protocolVersion = stringOf(requested->get_string());
        }
    }

    boost::json::object tools;
    tools["listChanged"] = false;

    boost::json::object capabilities;
    capabilities["tools"] = std::move(tools);
    capabilities["logging"] = boost::json::object{};

    boost::json::object serverInfo;
    serverInfo["name"] = kServiceName;
    serverInfo["version"] = kServiceVersion;

    boost::json::object result;
    result["protocolVersion"] = protocolVersion;
    result["capabilities"] = std::move(capabilities);
    result["serverInfo"] = std::move(serverInfo);

    LOG_INFO(kLogCategory, "Initialized (protocol %s)", protocolVersion.c_str());
    return makeResult(id, std::move(result));
}

boost::json::value ToolServer::listTools_(const boost::json::value& id) const {
    boost::json::array list;
    list.emplace_back(gridToolDescriptor(true));

    boost::json::object result;
    result["tools"] = std::move(list);
    return makeResult(id, std::move(result));
}

boost::json::value ToolServer::callTool_(const boost::json::value& params, const boost::json::value& id) const {
    if (!params.is_object()) {
        return makeError(id, rpc::kInvalidParams, "params must be an object");
    }
    const auto& object = params.get_object();

    const auto* name = object.if_contains("name");
    if (!name || !name->is_string() || stringOf(name->get_string()) != kToolName) {
        return makeError(id, rpc::kInvalidParams, "Unknown tool");
    }

    const auto* argumentsField = object.if_contains("arguments");
    if (!argumentsField || !argumentsField->is_object()) {
        return makeError(id, rpc::kInvalidParams, "arguments must be an object");
    }
    const auto& arguments = argumentsField->get_object();

    const auto* gridData = arguments.if_contains("grid_data");
    if (!gridData || !gridData->is_object()) {
        return makeError(id, rpc::kInvalidParams, "grid_data object is required");
    }

    std::string outputPath;
    if (const auto* path = arguments.if_contains("output_path"); path && !path->is_null()) {
        if (!path->is_string()) {
            return makeError(id, rpc::kInvalidParams, "output_path must be a string");
        }
        outputPath = stringOf(path->get_string());
    }

    bool returnBase64 = false;
    if (const auto* flag = arguments.if_contains("return_base64"); flag && !flag->is_null()) {
        if (!flag->is_bool()) {
            return makeError(id, rpc::kInvalidParams, "return_base64 must be a boolean");
        }
        returnBase64 = flag->get_bool();
    }

    LOG_GUARD_RET(service_, kLogCategory, makeError(id, rpc::kInternalError, "Render service unavailable"),
                  "tools/call without a render service");

    try {
        const domain::StateModel model = service_->validate(*gridData);
        const domain::RenderedImage image = service_->render(model);

        if (outputPath.empty() && !returnBase64) {
            const auto fileName = "grid_availability_" + domain::format_date_stem(model.date) + ".png";
            outputPath = (std::filesystem::temp_directory_path() / fileName).string();
        }
        if (!outputPath.empty()) {
            ui::OutputEncoder::writeToFile(image, outputPath);
            LOG_INFO(kLogCategory, "Image written to %s", outputPath.c_str());
        }

        std::string text = "Grid availability image generated successfully";
        if (!outputPath.empty()) {
            text += " at: " + outputPath;
        }
        text += std::string(". Image size: ") + kImageSize;

        boost::json::array content;
        content.emplace_back(textItem(text));
        if (returnBase64) {
            boost::json::object imageItem;
            imageItem["type"] = "image";
            imageItem["data"] = ui::OutputEncoder::toBase64(image);
            imageItem["mimeType"] = "image/png";
            content.emplace_back(std::move(imageItem));
        }

        boost::json::object result;
        result["content"] = std::move(content);
        result["isError"] = false;
        return makeResult(id, std::move(result));
    }
    catch (const domain::RenderError& ex) {
        LOG_WARN(kLogCategory, "Tool call failed: %s", ex.what());
        return toolFailure(id, std::string("Error (") + std::string(ex.code()) + "): " + ex.what());
    }
}

boost::json::value ToolServer::setLogLevel_(const boost::json::value& params, const boost::json::value& id) const {
    const boost::json::value* levelField = params.is_object() ? params.get_object().if_contains("level") : nullptr;
    if (!levelField || !levelField->is_string()) {
        return makeError(id, rpc::kInvalidParams, "level must be a string");
    }

    std::string requested = stringOf(levelField->get_string());
    if (requested == "notice") {
        requested = "info";
    } else if (requested == "critical" || requested == "alert" || requested == "emergency") {
        requested = "error";
    }

    config::LogLevel level{};
    if (!logging::Log::try_parse_log_level(requested, level)) {
        return makeError(id, rpc::kInvalidParams, "Unknown log level: " + requested);
    }
    logging::Log::set_log_level(level);
    LOG_INFO(kLogCategory, "Log level set to %s", logging::Log::level_to_string(level));
    return makeResult(id, boost::json::object{});
}

}  // namespace gridimg::api
