/**
 * @file json_bridge.h
 * @brief Run formats on values decoded from JSON documents
 */

#pragma once

#include "typesys/format/format.h"
#include <json/json.h>

namespace typesys {
namespace format {

/**
 * @brief Validate a decoded JSON value
 *
 * JSON null gives a null FormatValue, a JSON string is passed to
 * format.validate().
 *
 * @throws ValidationError code "type" for numbers, booleans, arrays and
 *         objects, or whatever format.validate() throws
 */
FormatValue validateJson(const Format& format, const Json::Value& value);

/**
 * @brief Serialize to a JSON value
 *
 * @return JSON string with the canonical form, or JSON null
 * @throws std::invalid_argument if value holds another native type
 */
Json::Value serializeJson(const Format& format, const FormatValue& value);

} // namespace format
} // namespace typesys
