/**
 * @file temporal_types.cpp
 * @brief Date, Time, UtcOffset and DateTime implementation
 */

#include "typesys/format/temporal_types.h"
#include "typesys/utils/string_utils.h"
#include "typesys/utils/time_utils.h"
#include <cstdlib>
#include <stdexcept>

namespace typesys {
namespace format {

using utils::zeroPad;

void Date::validate() const {
    if (year_ < MIN_YEAR || year_ > MAX_YEAR) {
        throw std::out_of_range("year " + std::to_string(year_) + " is out of range");
    }
    if (month_ < 1 || month_ > 12) {
        throw std::out_of_range("month must be in 1..12");
    }
    if (day_ < 1 || day_ > utils::daysInMonth(year_, month_)) {
        throw std::out_of_range("day is out of range for month");
    }
}

std::string Date::toIsoString() const {
    return zeroPad(year_, 4) + "-" + zeroPad(month_, 2) + "-" + zeroPad(day_, 2);
}

void Time::validate() const {
    if (hour_ < 0 || hour_ > 23) {
        throw std::out_of_range("hour must be in 0..23");
    }
    if (minute_ < 0 || minute_ > 59) {
        throw std::out_of_range("minute must be in 0..59");
    }
    if (second_ < 0 || second_ > 59) {
        throw std::out_of_range("second must be in 0..59");
    }
    if (microsecond_ < 0 || microsecond_ > 999999) {
        throw std::out_of_range("microsecond must be in 0..999999");
    }
}

std::string Time::toIsoString() const {
    std::string result = zeroPad(hour_, 2) + ":" + zeroPad(minute_, 2) + ":" + zeroPad(second_, 2);
    if (microsecond_ != 0) {
        result += "." + zeroPad(microsecond_, 6);
    }
    return result;
}

void UtcOffset::validate() const {
    if (std::abs(totalMinutes_) >= 24 * 60) {
        throw std::out_of_range("offset must be strictly between -24h and 24h");
    }
}

std::string UtcOffset::toIsoString() const {
    const int magnitude = std::abs(totalMinutes_);
    return std::string(totalMinutes_ < 0 ? "-" : "+") +
           zeroPad(magnitude / 60, 2) + ":" + zeroPad(magnitude % 60, 2);
}

std::string DateTime::toIsoString() const {
    std::string result = date_.toIsoString() + "T" + time_.toIsoString();
    if (offset_) {
        result += offset_->toIsoString();
    }
    return result;
}

std::chrono::system_clock::time_point DateTime::toTimePoint() const {
    const int64_t days = utils::daysFromCivil(date_.getYear(), date_.getMonth(), date_.getDay());
    int64_t seconds = days * 86400 +
                      time_.getHour() * 3600 +
                      time_.getMinute() * 60 +
                      time_.getSecond();
    if (offset_) {
        seconds -= static_cast<int64_t>(offset_->getTotalMinutes()) * 60;
    }

    auto sinceEpoch = std::chrono::seconds(seconds) + std::chrono::microseconds(time_.getMicrosecond());
    return std::chrono::system_clock::time_point(
        std::chrono::duration_cast<std::chrono::system_clock::duration>(sinceEpoch));
}

} // namespace format
} // namespace typesys
