#include "domain/InputValidator.h"

#include <cstdio>

#include <boost/json/parse.hpp>
#include <boost/json/serialize.hpp>
#include <boost/json/string.hpp>

#include "domain/Calendar.h"
#include "logging/Log.h"

namespace gridimg::domain {

namespace {

constexpr logging::LogCategory kLogCategory = logging::LogCategory::INPUT;

bool isHourKey(std::string_view key) {
    return key.size() == 4 && key[0] == 'T' && key[1] == '_' && key[2] >= '0' && key[2] <= '9'
        && key[3] >= '0' && key[3] <= '9';
}

}  // namespace

InputValidator::InputValidator(config::SymbolPolicy policy) : policy_(policy) {}

std::optional<StateSymbol> InputValidator::parseSymbol(std::string_view glyph) {
    for (const auto symbol : kAllSymbols) {
        if (glyph == symbol_glyph(symbol)) {
            return symbol;
        }
    }
    return std::nullopt;
}

std::string InputValidator::hourKey(std::size_t hour) {
    char key[8];
    std::snprintf(key, sizeof(key), "T_%02zu", hour);
    return key;
}

boost::json::value InputValidator::parseText(std::string_view jsonText) {
    boost::json::error_code ec;
    boost::json::value parsed = boost::json::parse(boost::json::string_view(jsonText.data(), jsonText.size()), ec);
    if (ec) {
        throw RenderError(ErrorKind::MalformedInput, "Input is not valid JSON: " + ec.message());
    }
    return parsed;
}

StateModel InputValidator::validateText(std::string_view jsonText) const {
    return validate(parseText(jsonText));
}

StateModel InputValidator::validate(const boost::json::value& input) const {
    const auto* object = input.if_object();
    if (!object) {
        throw RenderError(ErrorKind::MalformedInput, "Input must be a JSON object");
    }
    return validate(*object);
}

StateModel InputValidator::validate(const boost::json::object& input) const {
    StateModel model;

    const auto* dateValue = input.if_contains(kDateKey);
    if (!dateValue || !dateValue->is_string()) {
        throw RenderError(ErrorKind::InvalidDateFormat, "T_Date is required (format DD-MM-YYYY)");
    }
    const auto& dateText = dateValue->get_string();
    auto date = parse_date(std::string_view(dateText.data(), dateText.size()));
    if (!date) {
        throw RenderError(ErrorKind::InvalidDateFormat,
                          "T_Date '" + std::string(dateText.c_str()) + "' is not a valid DD-MM-YYYY date");
    }
    model.date = *date;

    for (std::size_t hour = 0; hour < kSlotCount; ++hour) {
        const auto key = hourKey(hour);
        const auto* raw = input.if_contains(key);
        if (!raw || raw->is_null()) {
            LOG_TRACE(kLogCategory, "%s missing, defaulting to Unknown", key.c_str());
            continue;
        }
        model.hours[hour] = resolveSymbol(hour, *raw);
    }

    for (const auto& entry : input) {
        const std::string_view key(entry.key().data(), entry.key().size());
        if (key == kDateKey) {
            continue;
        }
        if (isHourKey(key) && (key[2] - '0') * 10 + (key[3] - '0') < static_cast<int>(kSlotCount)) {
            continue;
        }
        LOG_DEBUG(kLogCategory, "Ignoring unrecognized key %.*s", static_cast<int>(key.size()), key.data());
    }

    return model;
}

StateSymbol InputValidator::resolveSymbol(std::size_t hour, const boost::json::value& raw) const {
    if (const auto* text = raw.if_string()) {
        if (auto symbol = parseSymbol(std::string_view(text->data(), text->size()))) {
            return *symbol;
        }
    }

    const std::string rendered = boost::json::serialize(raw);
    if (policy_ == config::SymbolPolicy::Reject) {
        throw RenderError(ErrorKind::UnsupportedStateSymbol,
                          "Unsupported state symbol " + rendered + " for " + hourKey(hour));
    }

    LOG_WARN(kLogCategory,
             "Unsupported state symbol %s for %s, treating as Unknown",
             rendered.c_str(),
             hourKey(hour).c_str());
    return StateSymbol::Unknown;
}

}  // namespace gridimg::domain
