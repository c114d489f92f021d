/**
 * @file date_format.h
 * @brief Calendar date format ("YYYY-M-D" <-> Date)
 */

#pragma once

#include "typesys/format/format.h"

namespace typesys {
namespace format {

/**
 * @brief Converts "YYYY-M-D" strings to Date and back
 *
 * Month and day accept one or two digits. Output is always zero-padded
 * "YYYY-MM-DD".
 */
class DateFormat : public Format {
public:
    [[nodiscard]] std::string name() const override { return "date"; }

    [[nodiscard]] bool isNativeType(const FormatValue& value) const override;
    FormatValue validate(const std::string& value) const override;
    std::optional<std::string> serialize(const FormatValue& value) const override;
    [[nodiscard]] const ErrorTemplates& errorTemplates() const override;

    /**
     * @brief Typed variant of validate()
     * @throws ValidationError ("format" or "invalid")
     */
    Date parse(const std::string& value) const;
};

} // namespace format
} // namespace typesys
