/**
 * @file temporal_types.h
 * @brief Native calendar and clock values produced by the temporal formats
 *
 * Date, Time, UtcOffset and DateTime are immutable value objects. Their
 * factories reject impossible combinations with std::out_of_range, which the
 * formats translate into the "invalid" error code.
 */

#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

namespace typesys {
namespace format {

/**
 * @brief Calendar date (proleptic Gregorian, years 1-9999)
 */
class Date {
private:
    int year_;
    int month_;
    int day_;

    Date(int year, int month, int day)
        : year_(year), month_(month), day_(day) {
        validate();
    }

    void validate() const;

public:
    static constexpr int MIN_YEAR = 1;
    static constexpr int MAX_YEAR = 9999;

    /**
     * @brief Create Date
     * @throws std::out_of_range if the combination is not a real date
     */
    static Date of(int year, int month, int day) {
        return Date(year, month, day);
    }

    [[nodiscard]] int getYear() const noexcept { return year_; }
    [[nodiscard]] int getMonth() const noexcept { return month_; }
    [[nodiscard]] int getDay() const noexcept { return day_; }

    /**
     * @brief ISO 8601 rendering
     * @return "YYYY-MM-DD"
     */
    [[nodiscard]] std::string toIsoString() const;

    bool operator==(const Date& other) const noexcept {
        return year_ == other.year_ && month_ == other.month_ && day_ == other.day_;
    }

    bool operator!=(const Date& other) const noexcept {
        return !(*this == other);
    }
};

/**
 * @brief Time of day with microsecond precision, no timezone
 */
class Time {
private:
    int hour_;
    int minute_;
    int second_;
    int microsecond_;

    Time(int hour, int minute, int second, int microsecond)
        : hour_(hour), minute_(minute), second_(second), microsecond_(microsecond) {
        validate();
    }

    void validate() const;

public:
    /**
     * @brief Create Time
     * @throws std::out_of_range if any field is outside its clock range
     */
    static Time of(int hour, int minute, int second = 0, int microsecond = 0) {
        return Time(hour, minute, second, microsecond);
    }

    [[nodiscard]] int getHour() const noexcept { return hour_; }
    [[nodiscard]] int getMinute() const noexcept { return minute_; }
    [[nodiscard]] int getSecond() const noexcept { return second_; }
    [[nodiscard]] int getMicrosecond() const noexcept { return microsecond_; }

    /**
     * @brief ISO 8601 rendering
     * @return "HH:MM:SS", or "HH:MM:SS.ffffff" when microseconds are non-zero
     */
    [[nodiscard]] std::string toIsoString() const;

    bool operator==(const Time& other) const noexcept {
        return hour_ == other.hour_ && minute_ == other.minute_ &&
               second_ == other.second_ && microsecond_ == other.microsecond_;
    }

    bool operator!=(const Time& other) const noexcept {
        return !(*this == other);
    }
};

/**
 * @brief Fixed offset from UTC, strictly between -24h and +24h
 */
class UtcOffset {
private:
    int totalMinutes_;

    explicit UtcOffset(int totalMinutes) : totalMinutes_(totalMinutes) {
        validate();
    }

    void validate() const;

public:
    /**
     * @brief Create offset from signed minutes east of UTC
     * @throws std::out_of_range if |minutes| >= 24h
     */
    static UtcOffset ofMinutes(int totalMinutes) {
        return UtcOffset(totalMinutes);
    }

    static UtcOffset utc() {
        return UtcOffset(0);
    }

    [[nodiscard]] int getTotalMinutes() const noexcept { return totalMinutes_; }
    [[nodiscard]] bool isUtc() const noexcept { return totalMinutes_ == 0; }

    /**
     * @brief Render as "+HH:MM" / "-HH:MM" (UTC renders as "+00:00")
     */
    [[nodiscard]] std::string toIsoString() const;

    bool operator==(const UtcOffset& other) const noexcept {
        return totalMinutes_ == other.totalMinutes_;
    }

    bool operator!=(const UtcOffset& other) const noexcept {
        return !(*this == other);
    }
};

/**
 * @brief Timestamp: date and time with an optional UTC offset
 *
 * A DateTime without offset is "naive". Equality is field-wise, so a naive
 * value never equals an aware one and two aware values with different
 * offsets are different even if they denote the same instant.
 */
class DateTime {
private:
    Date date_;
    Time time_;
    std::optional<UtcOffset> offset_;

    DateTime(Date date, Time time, std::optional<UtcOffset> offset)
        : date_(date), time_(time), offset_(offset) {}

public:
    static DateTime of(const Date& date, const Time& time,
                       std::optional<UtcOffset> offset = std::nullopt) {
        return DateTime(date, time, offset);
    }

    [[nodiscard]] const Date& getDate() const noexcept { return date_; }
    [[nodiscard]] const Time& getTime() const noexcept { return time_; }
    [[nodiscard]] const std::optional<UtcOffset>& getOffset() const noexcept { return offset_; }
    [[nodiscard]] bool isNaive() const noexcept { return !offset_.has_value(); }

    /**
     * @brief ISO 8601 rendering, e.g. "2021-06-01T12:00:00+05:30"
     *
     * UTC renders as "+00:00" here; DateTimeFormat applies the "Z" rewrite.
     */
    [[nodiscard]] std::string toIsoString() const;

    /**
     * @brief Convert to a UTC time_point
     *
     * Naive values are interpreted as UTC.
     */
    [[nodiscard]] std::chrono::system_clock::time_point toTimePoint() const;

    bool operator==(const DateTime& other) const noexcept {
        return date_ == other.date_ && time_ == other.time_ && offset_ == other.offset_;
    }

    bool operator!=(const DateTime& other) const noexcept {
        return !(*this == other);
    }
};

} // namespace format
} // namespace typesys
