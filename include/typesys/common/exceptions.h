/**
 * @file exceptions.h
 * @brief Exception hierarchy outside of value validation
 *
 * Rejected input values are reported with format::ValidationError; the
 * types here cover the surrounding tooling.
 */

#pragma once

#include <stdexcept>
#include <string>

namespace typesys {
namespace common {

/**
 * @brief Base exception for typesys tooling errors
 */
class TypesysException : public std::runtime_error {
public:
    explicit TypesysException(const std::string& message)
        : std::runtime_error(message) {}
};

/**
 * @brief Configuration error
 */
class ConfigException : public TypesysException {
public:
    explicit ConfigException(const std::string& message)
        : TypesysException("Configuration error: " + message) {}
};

} // namespace common
} // namespace typesys
