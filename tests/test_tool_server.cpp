#include <filesystem>
#include <iostream>
#include <memory>
#include <optional>
#include <sstream>
#include <string>

#include <boost/json/parse.hpp>
#include <boost/json/value.hpp>

#include "api/ToolServer.hpp"
#include "app/RenderService.h"
#include "config/Config.h"
#include "logging/Log.h"
#include "ui/ResourceProvider.h"

using gridimg::api::ToolServer;

namespace {

boost::json::value call(ToolServer& server, const std::string& line) {
    const auto reply = server.handleLine(line);
    if (!reply) {
        return nullptr;
    }
    return boost::json::parse(*reply);
}

int errorCodeOf(const boost::json::value& reply) {
    if (!reply.is_object()) {
        return 0;
    }
    const auto* error = reply.as_object().if_contains("error");
    if (!error) {
        return 0;
    }
    return static_cast<int>(error->as_object().at("code").as_int64());
}

const boost::json::object* resultOf(const boost::json::value& reply) {
    if (!reply.is_object()) {
        return nullptr;
    }
    const auto* result = reply.as_object().if_contains("result");
    return result ? result->if_object() : nullptr;
}

std::string firstText(const boost::json::object& result) {
    const auto& content = result.at("content").as_array();
    return std::string(content.at(0).as_object().at("text").as_string().c_str());
}

std::string toolCall(int id, const std::string& arguments) {
    return "{\"jsonrpc\":\"2.0\",\"id\":" + std::to_string(id)
        + ",\"method\":\"tools/call\",\"params\":{\"name\":\"generate_grid_availability_image\",\"arguments\":"
        + arguments + "}}";
}

}  // namespace

int main() {
    gridimg::config::Config config;
    gridimg::ui::ResourceProvider resources;
    ToolServer server(std::make_shared<const gridimg::app::RenderService>(config, resources));

    {
        const auto reply = call(server,
            R"({"jsonrpc":"2.0","id":1,"method":"initialize","params":{"protocolVersion":"2024-11-05"}})");
        const auto* result = resultOf(reply);
        if (!result || result->at("serverInfo").as_object().at("name").as_string() != "grid-image-generator"
            || !result->at("capabilities").as_object().contains("tools")) {
            std::cerr << "Unexpected initialize result\n";
            return 1;
        }
    }

    if (server.handleLine(R"({"jsonrpc":"2.0","method":"notifications/initialized"})") || !server.initialized()) {
        std::cerr << "notifications/initialized must not be answered\n";
        return 1;
    }

    if (!resultOf(call(server, R"({"jsonrpc":"2.0","id":2,"method":"ping"})"))) {
        std::cerr << "ping must return an empty result\n";
        return 1;
    }

    {
        const auto* result = resultOf(call(server, R"({"jsonrpc":"2.0","id":3,"method":"tools/list"})"));
        if (!result) {
            std::cerr << "tools/list failed\n";
            return 1;
        }
        const auto& tools = result->at("tools").as_array();
        const auto& properties =
            tools.at(0).as_object().at("inputSchema").as_object().at("properties").as_object();
        if (tools.size() != 1 || !properties.contains("output_path") || !properties.contains("grid_data")) {
            std::cerr << "tools/list must describe the one tool with output_path\n";
            return 1;
        }
    }

    if (errorCodeOf(call(server, R"({"jsonrpc":"2.0","id":4,"method":"resources/list"})")) != -32601) {
        std::cerr << "Unknown methods must answer -32601\n";
        return 1;
    }
    if (errorCodeOf(call(server, "{not json")) != -32700) {
        std::cerr << "Garbage must answer -32700\n";
        return 1;
    }
    if (server.handleLine("   ")) {
        std::cerr << "Blank lines must be ignored\n";
        return 1;
    }
    if (errorCodeOf(call(server, toolCall(5, R"({"return_base64":true})"))) != -32602) {
        std::cerr << "Missing grid_data must answer -32602\n";
        return 1;
    }

    {
        const auto* result = resultOf(call(server, toolCall(6, R"({"grid_data":{"T_Date":"2025-11-20"}})")));
        if (!result || !result->at("isError").as_bool()
            || firstText(*result).find("invalid_date_format") == std::string::npos) {
            std::cerr << "Validation failures must come back as isError results\n";
            return 1;
        }
    }

    {
        const auto previous = gridimg::logging::Log::get_log_level();
        const auto reply = call(server, R"({"jsonrpc":"2.0","id":7,"method":"logging/setLevel","params":{"level":"debug"}})");
        if (!resultOf(reply) || gridimg::logging::Log::get_log_level() != gridimg::config::LogLevel::Debug) {
            std::cerr << "logging/setLevel did not apply\n";
            return 1;
        }
        if (errorCodeOf(call(server, R"({"jsonrpc":"2.0","id":8,"method":"logging/setLevel","params":{"level":"loud"}})"))
            != -32602) {
            std::cerr << "Unknown log levels must answer -32602\n";
            return 1;
        }
        gridimg::logging::Log::set_log_level(previous);
    }

    // run() answers requests line by line and skips notifications.
    {
        std::istringstream in("{\"jsonrpc\":\"2.0\",\"id\":9,\"method\":\"ping\"}\n"
                              "{\"jsonrpc\":\"2.0\",\"method\":\"notifications/initialized\"}\n"
                              "{\"jsonrpc\":\"2.0\",\"id\":10,\"method\":\"ping\"}\n");
        std::ostringstream out;
        if (server.run(in, out) != 0) {
            std::cerr << "run() must exit cleanly at EOF\n";
            return 1;
        }
        std::istringstream lines(out.str());
        std::string line;
        int count = 0;
        while (std::getline(lines, line)) {
            ++count;
        }
        if (count != 2) {
            std::cerr << "Expected 2 replies from run(), got " << count << "\n";
            return 1;
        }
    }

    const std::string gridData =
        "{\"T_Date\":\"20-11-2025\",\"T_00\":\"\xE2\x97\x8F\",\"T_12\":\"\xE2\x9C\x95\"}";

    {
        const auto path = std::filesystem::temp_directory_path() / "gridimg_test_tool_server.png";
        std::filesystem::remove(path);
        const auto* result = resultOf(call(
            server, toolCall(11, "{\"grid_data\":" + gridData + ",\"output_path\":\"" + path.string() + "\"}")));
        if (!result || result->at("isError").as_bool() || !std::filesystem::exists(path)
            || firstText(*result).find("generated successfully at: " + path.string()) == std::string::npos
            || firstText(*result).find("1024x250px") == std::string::npos) {
            std::cerr << "tools/call did not write the requested file\n";
            return 1;
        }
        std::filesystem::remove(path);
    }

    {
        const auto* result = resultOf(call(server, toolCall(12, "{\"grid_data\":" + gridData + ",\"return_base64\":true}")));
        if (!result || result->at("isError").as_bool()) {
            std::cerr << "Base64 tools/call failed\n";
            return 1;
        }
        const auto& content = result->at("content").as_array();
        if (content.size() != 2 || content.at(1).as_object().at("mimeType").as_string() != "image/png"
            || content.at(1).as_object().at("data").as_string().empty()) {
            std::cerr << "Base64 tools/call must carry an image item\n";
            return 1;
        }
    }

    std::cout << "test_tool_server passed\n";
    return 0;
}
