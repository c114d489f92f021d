/**
 * @file json_bridge.cpp
 * @brief JSON bridge implementation
 */

#include "typesys/format/json_bridge.h"
#include <spdlog/spdlog.h>

namespace typesys {
namespace format {

FormatValue validateJson(const Format& format, const Json::Value& value) {
    if (value.isNull()) {
        return std::monostate{};
    }

    if (!value.isString()) {
        spdlog::debug("[{}] Rejected JSON value of type {}", format.name(),
                      static_cast<int>(value.type()));
        throw ValidationError("Must be a string.", CODE_TYPE);
    }

    return format.validate(value.asString());
}

Json::Value serializeJson(const Format& format, const FormatValue& value) {
    auto text = format.serialize(value);
    if (!text) {
        return Json::Value(Json::nullValue);
    }
    return Json::Value(*text);
}

} // namespace format
} // namespace typesys
