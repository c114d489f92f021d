/**
 * @file temporal_parsing.h
 * @brief Regex group helpers shared by TimeFormat and DateTimeFormat
 */

#pragma once

#include "typesys/format/temporal_types.h"
#include <regex>
#include <string>

namespace typesys {
namespace format {
namespace detail {

/**
 * @brief Microseconds from the captured fraction digits
 *
 * The digits are right-padded with zeros to six places before conversion,
 * so "5" is 500000 and "000123" is 123. An unmatched group is zero.
 */
int fractionToMicroseconds(const std::ssub_match& fraction);

/**
 * @brief Build a Time from four consecutive capture groups
 *
 * Groups are hour, minute, optional second, optional fraction, starting at
 * firstGroup.
 *
 * @throws std::out_of_range if the fields are not a real time
 */
Time timeFromGroups(const std::smatch& match, size_t firstGroup);

} // namespace detail
} // namespace format
} // namespace typesys
