/**
 * @file uuid_format.h
 * @brief UUID format (8-4-4-4-12 hex <-> Uuid)
 */

#pragma once

#include "typesys/format/format.h"

namespace typesys {
namespace format {

/**
 * @brief Converts hyphenated UUID strings to Uuid and back
 *
 * Only RFC 4122 layouts are accepted: version 1-5, variant 8/9/a/b.
 * Hex digits may be either case; output is lowercase.
 */
class UuidFormat : public Format {
public:
    [[nodiscard]] std::string name() const override { return "uuid"; }

    [[nodiscard]] bool isNativeType(const FormatValue& value) const override;
    FormatValue validate(const std::string& value) const override;
    std::optional<std::string> serialize(const FormatValue& value) const override;
    [[nodiscard]] const ErrorTemplates& errorTemplates() const override;

    /**
     * @brief Typed variant of validate()
     * @throws ValidationError ("format")
     */
    Uuid parse(const std::string& value) const;
};

} // namespace format
} // namespace typesys
