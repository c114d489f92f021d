/**
 * @file time_utils.h
 * @brief Calendar arithmetic utilities
 *
 * Proleptic Gregorian calendar helpers used by the date and datetime
 * native types.
 *
 * @version 1.0.0
 */

#pragma once

#include <cstdint>

namespace typesys {
namespace utils {

/**
 * @brief Check if year is leap year
 *
 * @param year Year number
 * @return true if leap year
 */
bool isLeapYear(int year);

/**
 * @brief Get number of days in month
 *
 * @param year Year number
 * @param month Month number (1-12)
 * @return Number of days in month, 0 if month is out of range
 */
int daysInMonth(int year, int month);

/**
 * @brief Days since 1970-01-01 for a civil date
 *
 * Valid for the whole proleptic Gregorian calendar, including dates
 * before the epoch (negative result).
 *
 * @param year Year number
 * @param month Month number (1-12)
 * @param day Day of month (1-31)
 * @return Day count relative to the Unix epoch
 */
int64_t daysFromCivil(int year, int month, int day);

} // namespace utils
} // namespace typesys
