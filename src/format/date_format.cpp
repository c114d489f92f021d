/**
 * @file date_format.cpp
 * @brief DateFormat implementation
 */

#include "typesys/format/date_format.h"
#include <spdlog/spdlog.h>
#include <regex>
#include <stdexcept>

namespace typesys {
namespace format {

namespace {

const std::regex& dateRegex() {
    static const std::regex pattern(R"((\d{4})-(\d{1,2})-(\d{1,2}))");
    return pattern;
}

} // anonymous namespace

const ErrorTemplates& DateFormat::errorTemplates() const {
    static const ErrorTemplates templates = {
        {CODE_FORMAT, "Must be a valid date format."},
        {CODE_INVALID, "Must be a real date."},
    };
    return templates;
}

bool DateFormat::isNativeType(const FormatValue& value) const {
    return std::holds_alternative<Date>(value);
}

Date DateFormat::parse(const std::string& value) const {
    std::smatch match;
    if (!std::regex_match(value, match, dateRegex())) {
        spdlog::debug("[DateFormat] Rejected '{}': not a date format", value);
        throw validationError(CODE_FORMAT);
    }

    try {
        return Date::of(std::stoi(match[1].str()),
                        std::stoi(match[2].str()),
                        std::stoi(match[3].str()));
    } catch (const std::out_of_range& e) {
        spdlog::debug("[DateFormat] Rejected '{}': {}", value, e.what());
        throw validationError(CODE_INVALID);
    }
}

FormatValue DateFormat::validate(const std::string& value) const {
    return parse(value);
}

std::optional<std::string> DateFormat::serialize(const FormatValue& value) const {
    if (std::holds_alternative<std::monostate>(value)) {
        return std::nullopt;
    }
    const auto* date = std::get_if<Date>(&value);
    if (!date) {
        throwWrongType(value);
    }
    return date->toIsoString();
}

} // namespace format
} // namespace typesys
