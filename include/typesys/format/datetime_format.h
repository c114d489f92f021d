/**
 * @file datetime_format.h
 * @brief Timestamp format (ISO 8601 with optional UTC offset <-> DateTime)
 */

#pragma once

#include "typesys/format/format.h"

namespace typesys {
namespace format {

/**
 * @brief Converts ISO 8601 timestamps to DateTime and back
 *
 * Accepted input: date, 'T' or ' ', time (same sub-grammars as DateFormat
 * and TimeFormat), then an optional "Z", "+HH", "+HHMM" or "+HH:MM"
 * designator. Without a designator the result is naive.
 *
 * Output is "YYYY-MM-DDTHH:MM:SS[.ffffff][+HH:MM]" with a UTC offset
 * written as "Z".
 */
class DateTimeFormat : public Format {
public:
    [[nodiscard]] std::string name() const override { return "datetime"; }

    [[nodiscard]] bool isNativeType(const FormatValue& value) const override;
    FormatValue validate(const std::string& value) const override;
    std::optional<std::string> serialize(const FormatValue& value) const override;
    [[nodiscard]] const ErrorTemplates& errorTemplates() const override;

    /**
     * @brief Typed variant of validate()
     * @throws ValidationError ("format" or "invalid")
     */
    DateTime parse(const std::string& value) const;

    /**
     * @brief Canonical rendering of a DateTime
     */
    static std::string toCanonicalString(const DateTime& value);
};

} // namespace format
} // namespace typesys
