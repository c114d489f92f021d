/**
 * @file time_format.cpp
 * @brief TimeFormat implementation
 */

#include "typesys/format/time_format.h"
#include "temporal_parsing.h"
#include <spdlog/spdlog.h>
#include <regex>
#include <stdexcept>

namespace typesys {
namespace format {

namespace {

// Fraction: first six digits captured, up to six more consumed and dropped
const std::regex& timeRegex() {
    static const std::regex pattern(
        R"((\d{1,2}):(\d{1,2}))"
        R"((?::(\d{1,2})(?:\.(\d{1,6})\d{0,6})?)?)");
    return pattern;
}

} // anonymous namespace

const ErrorTemplates& TimeFormat::errorTemplates() const {
    static const ErrorTemplates templates = {
        {CODE_FORMAT, "Must be a valid time format."},
        {CODE_INVALID, "Must be a real time."},
    };
    return templates;
}

bool TimeFormat::isNativeType(const FormatValue& value) const {
    return std::holds_alternative<Time>(value);
}

Time TimeFormat::parse(const std::string& value) const {
    std::smatch match;
    if (!std::regex_search(value, match, timeRegex(), std::regex_constants::match_continuous)) {
        spdlog::debug("[TimeFormat] Rejected '{}': not a time format", value);
        throw validationError(CODE_FORMAT);
    }

    try {
        return detail::timeFromGroups(match, 1);
    } catch (const std::out_of_range& e) {
        spdlog::debug("[TimeFormat] Rejected '{}': {}", value, e.what());
        throw validationError(CODE_INVALID);
    }
}

FormatValue TimeFormat::validate(const std::string& value) const {
    return parse(value);
}

std::optional<std::string> TimeFormat::serialize(const FormatValue& value) const {
    if (std::holds_alternative<std::monostate>(value)) {
        return std::nullopt;
    }
    const auto* time = std::get_if<Time>(&value);
    if (!time) {
        throwWrongType(value);
    }
    return time->toIsoString();
}

} // namespace format
} // namespace typesys
