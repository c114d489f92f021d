/**
 * @file datetime_format.cpp
 * @brief DateTimeFormat implementation
 *
 * Timezone designators:
 *   Z        -> UTC
 *   +HH      -> hours only
 *   +HHMM    -> hours and minutes
 *   +HH:MM   -> hours and minutes
 */

#include "typesys/format/datetime_format.h"
#include "typesys/utils/string_utils.h"
#include "temporal_parsing.h"
#include <spdlog/spdlog.h>
#include <regex>
#include <stdexcept>

namespace typesys {
namespace format {

namespace {

constexpr size_t GROUP_YEAR = 1;
constexpr size_t GROUP_HOUR = 4;
constexpr size_t GROUP_TZINFO = 8;

const std::regex& datetimeRegex() {
    static const std::regex pattern(
        R"((\d{4})-(\d{1,2})-(\d{1,2}))"
        R"([T ](\d{1,2}):(\d{1,2}))"
        R"((?::(\d{1,2})(?:\.(\d{1,6})\d{0,6})?)?)"
        R"((Z|[+-]\d{2}(?::?\d{2})?)?)");
    return pattern;
}

/**
 * @throws std::out_of_range if the offset reaches 24 hours
 */
std::optional<UtcOffset> offsetFromDesignator(const std::ssub_match& group) {
    if (!group.matched) {
        return std::nullopt;
    }

    const std::string tz = group.str();
    if (tz == "Z") {
        return UtcOffset::utc();
    }

    const int hours = std::stoi(tz.substr(1, 2));
    const int minutes = tz.length() > 3 ? std::stoi(tz.substr(tz.length() - 2)) : 0;
    int total = hours * 60 + minutes;
    if (tz[0] == '-') {
        total = -total;
    }
    return UtcOffset::ofMinutes(total);
}

} // anonymous namespace

const ErrorTemplates& DateTimeFormat::errorTemplates() const {
    static const ErrorTemplates templates = {
        {CODE_FORMAT, "Must be a valid datetime format."},
        {CODE_INVALID, "Must be a real datetime."},
    };
    return templates;
}

bool DateTimeFormat::isNativeType(const FormatValue& value) const {
    return std::holds_alternative<DateTime>(value);
}

DateTime DateTimeFormat::parse(const std::string& value) const {
    std::smatch match;
    if (!std::regex_match(value, match, datetimeRegex())) {
        spdlog::debug("[DateTimeFormat] Rejected '{}': not a datetime format", value);
        throw validationError(CODE_FORMAT);
    }

    try {
        auto offset = offsetFromDesignator(match[GROUP_TZINFO]);
        auto date = Date::of(std::stoi(match[GROUP_YEAR].str()),
                             std::stoi(match[GROUP_YEAR + 1].str()),
                             std::stoi(match[GROUP_YEAR + 2].str()));
        auto time = detail::timeFromGroups(match, GROUP_HOUR);
        return DateTime::of(date, time, offset);
    } catch (const std::out_of_range& e) {
        spdlog::debug("[DateTimeFormat] Rejected '{}': {}", value, e.what());
        throw validationError(CODE_INVALID);
    }
}

FormatValue DateTimeFormat::validate(const std::string& value) const {
    return parse(value);
}

std::string DateTimeFormat::toCanonicalString(const DateTime& value) {
    std::string result = value.toIsoString();
    if (utils::endsWith(result, "+00:00")) {
        result = result.substr(0, result.length() - 6) + "Z";
    }
    return result;
}

std::optional<std::string> DateTimeFormat::serialize(const FormatValue& value) const {
    if (std::holds_alternative<std::monostate>(value)) {
        return std::nullopt;
    }
    const auto* datetime = std::get_if<DateTime>(&value);
    if (!datetime) {
        throwWrongType(value);
    }
    return toCanonicalString(*datetime);
}

} // namespace format
} // namespace typesys
