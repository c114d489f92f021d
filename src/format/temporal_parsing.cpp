/**
 * @file temporal_parsing.cpp
 * @brief Regex group helpers shared by TimeFormat and DateTimeFormat
 */

#include "temporal_parsing.h"
#include "typesys/utils/string_utils.h"

namespace typesys {
namespace format {
namespace detail {

int fractionToMicroseconds(const std::ssub_match& fraction) {
    if (!fraction.matched) {
        return 0;
    }
    return std::stoi(utils::padRight(fraction.str(), 6, '0'));
}

Time timeFromGroups(const std::smatch& match, size_t firstGroup) {
    const int hour = std::stoi(match[firstGroup].str());
    const int minute = std::stoi(match[firstGroup + 1].str());
    const int second = match[firstGroup + 2].matched ? std::stoi(match[firstGroup + 2].str()) : 0;
    const int microsecond = fractionToMicroseconds(match[firstGroup + 3]);
    return Time::of(hour, minute, second, microsecond);
}

} // namespace detail
} // namespace format
} // namespace typesys
