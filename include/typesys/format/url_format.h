/**
 * @file url_format.h
 * @brief URL format (permissive URL extraction <-> Url)
 */

#pragma once

#include "typesys/format/format.h"

#include <vector>

namespace typesys {
namespace format {

/**
 * @brief Converts URL-like strings to Url and back
 *
 * The grammar is searched anywhere in the input (text around the URL is
 * tolerated) and the top-level domain must be one of a fixed list. Input
 * that does not start with "http" gets "http://" prepended before it is
 * split, so "example.com" serializes as "http://example.com". Input longer
 * than MAX_LENGTH is rejected before the search.
 */
class UrlFormat : public Format {
public:
    /// Longest accepted input
    static constexpr size_t MAX_LENGTH = 2048;

    [[nodiscard]] std::string name() const override { return "url"; }

    [[nodiscard]] bool isNativeType(const FormatValue& value) const override;
    FormatValue validate(const std::string& value) const override;
    std::optional<std::string> serialize(const FormatValue& value) const override;
    [[nodiscard]] const ErrorTemplates& errorTemplates() const override;

    /**
     * @brief Typed variant of validate()
     * @throws ValidationError ("format")
     */
    Url parse(const std::string& value) const;

    /**
     * @brief Top-level domains accepted by the grammar
     */
    static const std::vector<std::string>& topLevelDomains();
};

} // namespace format
} // namespace typesys
