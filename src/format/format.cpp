/**
 * @file format.cpp
 * @brief Shared Format behaviour: error construction and value coercion
 */

#include "typesys/format/format.h"
#include "typesys/utils/string_utils.h"
#include <spdlog/spdlog.h>
#include <stdexcept>

namespace typesys {
namespace format {

std::string renderErrorTemplate(const std::string& tmpl, const ErrorParams& params) {
    std::string result = tmpl;
    for (const auto& [key, value] : params) {
        result = utils::replaceAll(result, "{" + key + "}", value);
    }
    return result;
}

ValidationError Format::validationError(const std::string& code) const {
    const auto& templates = errorTemplates();
    auto it = templates.find(code);
    if (it == templates.end()) {
        throw std::logic_error("Format '" + name() + "' has no error code '" + code + "'");
    }
    return ValidationError(renderErrorTemplate(it->second, errorParams()), code);
}

void Format::throwWrongType(const FormatValue& value) const {
    throw std::invalid_argument(
        "Format '" + name() + "' cannot serialize a value of type " + valueTypeName(value));
}

FormatValue toNative(const Format& format, const FormatValue& value) {
    if (std::holds_alternative<std::monostate>(value) || format.isNativeType(value)) {
        return value;
    }

    if (const auto* text = std::get_if<std::string>(&value)) {
        return format.validate(*text);
    }

    spdlog::debug("[{}] Rejected non-string input of type {}", format.name(), valueTypeName(value));
    throw ValidationError("Must be a string.", CODE_TYPE);
}

std::string valueTypeName(const FormatValue& value) {
    switch (value.index()) {
        case 0: return "null";
        case 1: return "string";
        case 2: return "date";
        case 3: return "time";
        case 4: return "datetime";
        case 5: return "uuid";
        case 6: return "url";
        case 7: return "email";
    }
    return "unknown";
}

} // namespace format
} // namespace typesys
