/**
 * @file uuid_format.cpp
 * @brief UuidFormat implementation
 */

#include "typesys/format/uuid_format.h"
#include <spdlog/spdlog.h>
#include <regex>

namespace typesys {
namespace format {

namespace {

// Version nibble 1-5, RFC 4122 variant nibble 8/9/a/b
const std::regex& uuidRegex() {
    static const std::regex pattern(
        R"([0-9a-f]{8}-[0-9a-f]{4}-[1-5][0-9a-f]{3}-[89ab][0-9a-f]{3}-[0-9a-f]{12})",
        std::regex::ECMAScript | std::regex::icase);
    return pattern;
}

} // anonymous namespace

const ErrorTemplates& UuidFormat::errorTemplates() const {
    static const ErrorTemplates templates = {
        {CODE_FORMAT, "Must be valid UUID format."},
    };
    return templates;
}

bool UuidFormat::isNativeType(const FormatValue& value) const {
    return std::holds_alternative<Uuid>(value);
}

Uuid UuidFormat::parse(const std::string& value) const {
    std::optional<Uuid> uuid;
    if (std::regex_match(value, uuidRegex())) {
        uuid = Uuid::fromString(value);
    }

    if (!uuid) {
        spdlog::debug("[UuidFormat] Rejected '{}': not a UUID", value);
        throw validationError(CODE_FORMAT);
    }
    return *uuid;
}

FormatValue UuidFormat::validate(const std::string& value) const {
    return parse(value);
}

std::optional<std::string> UuidFormat::serialize(const FormatValue& value) const {
    if (std::holds_alternative<std::monostate>(value)) {
        return std::nullopt;
    }
    const auto* uuid = std::get_if<Uuid>(&value);
    if (!uuid) {
        throwWrongType(value);
    }
    return uuid->toString();
}

} // namespace format
} // namespace typesys
