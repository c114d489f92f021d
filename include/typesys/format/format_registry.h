/**
 * @file format_registry.h
 * @brief Name -> Format lookup used by schema fields
 *
 * A field declared with format "date" looks up the DateFormat here, skips
 * parsing when it already holds a Date, and serializes through the same
 * instance.
 */

#pragma once

#include "typesys/format/format.h"

#include <map>
#include <memory>
#include <string>
#include <vector>

namespace typesys {
namespace format {

/**
 * @brief Owns a set of formats keyed by Format::name()
 *
 * Not synchronized: populate it first, then share it read-only.
 */
class FormatRegistry {
private:
    std::map<std::string, std::unique_ptr<Format>> formats_;

public:
    FormatRegistry() = default;

    FormatRegistry(const FormatRegistry&) = delete;
    FormatRegistry& operator=(const FormatRegistry&) = delete;
    FormatRegistry(FormatRegistry&&) = default;
    FormatRegistry& operator=(FormatRegistry&&) = default;

    /**
     * @brief Registry with date, time, datetime, uuid, url and email
     *
     * Built once on first use and immutable afterwards.
     */
    static const FormatRegistry& builtin();

    /**
     * @brief Create a new registry holding the built-in formats
     *
     * Start from this to add application-specific formats.
     */
    static FormatRegistry withBuiltinFormats();

    /**
     * @brief Register a format under its name
     * @throws std::invalid_argument if format is null or the name is taken
     */
    void add(std::unique_ptr<Format> format);

    /**
     * @brief Find a format
     * @return Format, or nullptr if no format has that name
     */
    [[nodiscard]] const Format* find(const std::string& name) const;

    /**
     * @brief Get a format
     * @throws std::out_of_range if no format has that name
     */
    [[nodiscard]] const Format& get(const std::string& name) const;

    [[nodiscard]] bool contains(const std::string& name) const;

    /// @brief Registered names in ascending order
    [[nodiscard]] std::vector<std::string> names() const;

    [[nodiscard]] size_t size() const noexcept { return formats_.size(); }
};

} // namespace format
} // namespace typesys
