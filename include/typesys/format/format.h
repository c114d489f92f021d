/**
 * @file format.h
 * @brief Format capability contract
 *
 * A Format converts between a textual wire representation and one native
 * value type. Formats are stateless and immutable: a single instance can be
 * shared between threads and reused for every value of its kind.
 *
 * @version 1.0.0
 */

#pragma once

#include "typesys/format/identifier_types.h"
#include "typesys/format/temporal_types.h"
#include "typesys/format/validation_error.h"

#include <map>
#include <optional>
#include <string>
#include <variant>

namespace typesys {
namespace format {

/**
 * @brief Any value a format consumes or produces
 *
 * std::monostate is "null", std::string is raw (unparsed) input, the other
 * alternatives are the native types.
 */
using FormatValue = std::variant<
    std::monostate,
    std::string,
    Date,
    Time,
    DateTime,
    Uuid,
    Url,
    EmailAddress
>;

/// @brief Error code -> message template ("Must be at least {min}.")
using ErrorTemplates = std::map<std::string, std::string>;

/// @brief Placeholder name -> value used to fill an error template
using ErrorParams = std::map<std::string, std::string>;

/**
 * @brief Fill "{name}" placeholders of a template
 *
 * Placeholders without a matching parameter are left untouched.
 */
std::string renderErrorTemplate(const std::string& tmpl, const ErrorParams& params);

/**
 * @brief Format interface
 */
class Format {
public:
    virtual ~Format() = default;

    /**
     * @brief Registry name of the format ("date", "uuid", ...)
     */
    [[nodiscard]] virtual std::string name() const = 0;

    /**
     * @brief Check whether value already holds this format's native type
     */
    [[nodiscard]] virtual bool isNativeType(const FormatValue& value) const = 0;

    /**
     * @brief Parse a string into the native type
     *
     * @throws ValidationError with code "format" when the grammar does not
     *         match, or "invalid" when it matches but the value is impossible
     */
    virtual FormatValue validate(const std::string& value) const = 0;

    /**
     * @brief Produce the canonical textual form
     *
     * @return std::nullopt for a null value, the canonical string otherwise
     * @throws std::invalid_argument if value holds another type
     */
    virtual std::optional<std::string> serialize(const FormatValue& value) const = 0;

    /**
     * @brief Error code -> message template table of this format
     */
    [[nodiscard]] virtual const ErrorTemplates& errorTemplates() const = 0;

    /**
     * @brief Values substituted into error templates
     *
     * Formats with parameters (bounds, lengths) override this.
     */
    [[nodiscard]] virtual ErrorParams errorParams() const {
        return {};
    }

    /**
     * @brief Build the error for one of this format's codes
     *
     * @throws std::logic_error if the format declares no such code
     */
    [[nodiscard]] ValidationError validationError(const std::string& code) const;

protected:
    // Shared rejection for serialize() given a value of the wrong type
    [[noreturn]] void throwWrongType(const FormatValue& value) const;
};

/**
 * @brief Bring a value into the format's native type
 *
 * Null stays null, native values pass through unchanged, raw strings are
 * validated.
 *
 * @throws ValidationError code "type" for a value of some other native type,
 *         or whatever validate() throws for a string
 */
FormatValue toNative(const Format& format, const FormatValue& value);

/**
 * @brief Human-readable name of the alternative held by a FormatValue
 */
std::string valueTypeName(const FormatValue& value);

} // namespace format
} // namespace typesys
