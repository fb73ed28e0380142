#pragma once

#include <string>

#include <boost/json/value.hpp>

#include "api/Controllers.hpp"

namespace gridimg::http {

// Serializes a JSON value into the response body and sets 200 + JSON content type.
void write_json(api::Response& response, const boost::json::value& value);

std::string serialize_json(const boost::json::value& value);

const char* status_reason(int statusCode);

}  // namespace gridimg::http
