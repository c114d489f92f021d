/**
 * @file email_format.h
 * @brief Email format (local@domain <-> EmailAddress)
 */

#pragma once

#include "typesys/format/format.h"

namespace typesys {
namespace format {

/**
 * @brief Checks "local@domain" strings
 *
 * The local part allows letters, digits and "_.+-"; the domain allows
 * letters, digits, '-' and '.', and must contain a dot. The validated string
 * is kept as is. Input longer than MAX_LENGTH is rejected before matching.
 */
class EmailFormat : public Format {
public:
    /// Longest accepted address (RFC 5321 forward-path limit)
    static constexpr size_t MAX_LENGTH = 254;

    [[nodiscard]] std::string name() const override { return "email"; }

    [[nodiscard]] bool isNativeType(const FormatValue& value) const override;
    FormatValue validate(const std::string& value) const override;
    std::optional<std::string> serialize(const FormatValue& value) const override;
    [[nodiscard]] const ErrorTemplates& errorTemplates() const override;

    /**
     * @brief Typed variant of validate()
     * @throws ValidationError ("format")
     */
    EmailAddress parse(const std::string& value) const;
};

} // namespace format
} // namespace typesys
