/**
 * @file time_format.h
 * @brief Time-of-day format ("H:M[:S[.ffffff]]" <-> Time)
 */

#pragma once

#include "typesys/format/format.h"

namespace typesys {
namespace format {

/**
 * @brief Converts "H:M[:S[.ffffff]]" strings to Time and back
 *
 * The grammar is matched from the start of the input; anything after the
 * recognised time is ignored. Fractional seconds are right-padded to six
 * digits ("5" is 500000 microseconds) and digits past the sixth are dropped.
 */
class TimeFormat : public Format {
public:
    [[nodiscard]] std::string name() const override { return "time"; }

    [[nodiscard]] bool isNativeType(const FormatValue& value) const override;
    FormatValue validate(const std::string& value) const override;
    std::optional<std::string> serialize(const FormatValue& value) const override;
    [[nodiscard]] const ErrorTemplates& errorTemplates() const override;

    /**
     * @brief Typed variant of validate()
     * @throws ValidationError ("format" or "invalid")
     */
    Time parse(const std::string& value) const;
};

} // namespace format
} // namespace typesys
