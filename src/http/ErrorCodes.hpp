#pragma once

#include <string_view>

namespace gridimg::http::errors {

inline constexpr std::string_view not_found = "not_found";
inline constexpr std::string_view method_not_allowed = "method_not_allowed";
inline constexpr std::string_view invalid_input = "invalid_input";
inline constexpr std::string_view grid_data_required = "grid_data_required";
inline constexpr std::string_view request_timeout = "request_timeout";
inline constexpr std::string_view payload_too_large = "payload_too_large";
inline constexpr std::string_view internal_error = "internal_error";

}  // namespace gridimg::http::errors
