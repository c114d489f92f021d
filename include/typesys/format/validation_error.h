/**
 * @file validation_error.h
 * @brief Error raised when a string cannot be converted by a format
 */

#pragma once

#include <json/json.h>
#include <stdexcept>
#include <string>
#include <utility>

namespace typesys {
namespace format {

/// @name Error codes shared by all formats
/// @{
constexpr const char* CODE_FORMAT = "format";    ///< Input does not match the grammar
constexpr const char* CODE_INVALID = "invalid";  ///< Grammar matched, value is impossible
constexpr const char* CODE_TYPE = "type";        ///< Input is not a string at all
/// @}

/**
 * @brief Exception for rejected input values
 *
 * Carries a human-readable text and a short machine-readable code.
 * The caller attaches field paths or document positions; this error
 * knows nothing about the surrounding document.
 */
class ValidationError : public std::runtime_error {
private:
    std::string text_;
    std::string code_;

public:
    /**
     * @brief Construct a new Validation Error
     * @param text Human-readable error message (e.g., "Must be a real date.")
     * @param code Error code (e.g., "invalid")
     */
    ValidationError(std::string text, std::string code)
        : std::runtime_error(text),
          text_(std::move(text)),
          code_(std::move(code)) {}

    /**
     * @brief Get the error message
     */
    [[nodiscard]] const std::string& getText() const noexcept {
        return text_;
    }

    /**
     * @brief Get the error code
     */
    [[nodiscard]] const std::string& getCode() const noexcept {
        return code_;
    }

    bool operator==(const ValidationError& other) const noexcept {
        return text_ == other.text_ && code_ == other.code_;
    }

    /**
     * @brief Convert to JSON ({"text": ..., "code": ...})
     */
    Json::Value toJson() const {
        Json::Value json;
        json["text"] = text_;
        json["code"] = code_;
        return json;
    }
};

} // namespace format
} // namespace typesys
