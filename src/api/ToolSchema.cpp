#include "api/ToolSchema.hpp"

#include <string>

#include <boost/json/array.hpp>

#include "domain/InputValidator.h"

namespace gridimg::api {

namespace {

constexpr const char* kToolDescription =
    "Generate an image showing electricity grid availability for a given date. "
    "The image is 1024x250px and follows iOS design guidelines. "
    "Input data should be a JSON object with T_Date (format: DD-MM-YYYY) and "
    "T_00 through T_23 keys with values: '\xE2\x97\x8F' (available), '\xE2\x9C\x95' (unavailable), "
    "'%' (partial/transition), or '-' (unknown).";

boost::json::object stringProperty(const std::string& description) {
    boost::json::object property;
    property["type"] = "string";
    property["description"] = description;
    return property;
}

}  // namespace

boost::json::object gridDataSchema() {
    boost::json::object properties;
    properties[domain::InputValidator::kDateKey] = stringProperty("Date in DD-MM-YYYY format (e.g., '20-11-2025')");
    for (std::size_t hour = 0; hour < domain::kSlotCount; ++hour) {
        properties[domain::InputValidator::hourKey(hour)] = stringProperty("State for hour " + std::to_string(hour));
    }

    boost::json::object schema;
    schema["type"] = "object";
    schema["properties"] = std::move(properties);
    schema["required"] = boost::json::array{domain::InputValidator::kDateKey};
    return schema;
}

boost::json::object gridToolDescriptor(bool withOutputPath) {
    boost::json::object properties;
    properties["grid_data"] = gridDataSchema();

    boost::json::object returnBase64;
    returnBase64["type"] = "boolean";
    returnBase64["description"] = "If true, return the image as a base64-encoded string.";
    returnBase64["default"] = false;
    properties["return_base64"] = std::move(returnBase64);

    if (withOutputPath) {
        properties["output_path"] =
            stringProperty("Optional output file path. If not provided, a temporary file will be used.");
    }

    boost::json::object inputSchema;
    inputSchema["type"] = "object";
    inputSchema["properties"] = std::move(properties);
    inputSchema["required"] = boost::json::array{"grid_data"};

    boost::json::object tool;
    tool["name"] = kToolName;
    tool["description"] = kToolDescription;
    tool["inputSchema"] = std::move(inputSchema);
    return tool;
}

}  // namespace gridimg::api
