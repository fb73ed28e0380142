#pragma once

#include <optional>
#include <string>
#include <string_view>

#include <boost/json/object.hpp>
#include <boost/json/value.hpp>

#include "config/Config.h"
#include "domain/Errors.h"
#include "domain/Types.h"

namespace gridimg::domain {

// Turns a raw day record ({"T_Date": "DD-MM-YYYY", "T_00": "●", ...}) into a StateModel.
// Throws RenderError on failure; nothing is drawn before validation has completed.
class InputValidator {
public:
    static constexpr const char* kDateKey = "T_Date";

    explicit InputValidator(config::SymbolPolicy policy = config::SymbolPolicy::Coerce);

    StateModel validate(const boost::json::value& input) const;
    StateModel validate(const boost::json::object& input) const;
    StateModel validateText(std::string_view jsonText) const;

    // Parses raw JSON text; syntax errors are reported as MalformedInput.
    static boost::json::value parseText(std::string_view jsonText);

    static std::optional<StateSymbol> parseSymbol(std::string_view glyph);
    static std::string hourKey(std::size_t hour);

private:
    StateSymbol resolveSymbol(std::size_t hour, const boost::json::value& raw) const;

    config::SymbolPolicy policy_;
};

}  // namespace gridimg::domain
