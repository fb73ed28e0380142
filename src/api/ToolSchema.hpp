#pragma once

#include <boost/json/object.hpp>

namespace gridimg::api {

inline constexpr const char* kToolName = "generate_grid_availability_image";
inline constexpr const char* kServiceName = "grid-image-generator";
inline constexpr const char* kServiceVersion = "1.0.0";
inline constexpr const char* kImageSize = "1024x250px";

// Tool descriptor ({name, description, inputSchema}) shared by the HTTP and stdio transports.
boost::json::object gridToolDescriptor(bool withOutputPath);

// JSON schema of one day record (T_Date + T_00..T_23).
boost::json::object gridDataSchema();

}  // namespace gridimg::api
