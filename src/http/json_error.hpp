#pragma once

#include <string_view>

#include "api/Controllers.hpp"

namespace gridimg::http {

// Writes {"error":"<code>"} (plus "detail" when given) and sets the HTTP status.
void json_error(api::Response& response, int statusCode, std::string_view errorCode, std::string_view detail = {});

}  // namespace gridimg::http
