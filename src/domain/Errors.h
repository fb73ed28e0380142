#pragma once

#include <stdexcept>
#include <string>
#include <string_view>

namespace gridimg::domain {

enum class ErrorKind {
    InvalidDateFormat,
    UnsupportedStateSymbol,
    MalformedInput,
    FontLoadFailure,
    OutputWriteFailure,
};

// Stable snake_case code used in HTTP and JSON-RPC error payloads.
inline std::string_view error_code(ErrorKind kind) {
    switch (kind) {
    case ErrorKind::InvalidDateFormat:
        return "invalid_date_format";
    case ErrorKind::UnsupportedStateSymbol:
        return "unsupported_state_symbol";
    case ErrorKind::MalformedInput:
        return "invalid_input";
    case ErrorKind::FontLoadFailure:
        return "font_load_failure";
    case ErrorKind::OutputWriteFailure:
        return "output_write_failure";
    }
    return "internal_error";
}

// Errors the caller can fix by changing the request.
inline bool is_validation_error(ErrorKind kind) {
    return kind == ErrorKind::InvalidDateFormat || kind == ErrorKind::UnsupportedStateSymbol
        || kind == ErrorKind::MalformedInput;
}

class RenderError : public std::runtime_error {
public:
    RenderError(ErrorKind kind, const std::string& message)
        : std::runtime_error(message), kind_(kind) {}

    ErrorKind kind() const noexcept { return kind_; }
    std::string_view code() const { return error_code(kind_); }

private:
    ErrorKind kind_;
};

}  // namespace gridimg::domain
