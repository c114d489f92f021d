/**
 * @file email_format.cpp
 * @brief EmailFormat implementation
 */

#include "typesys/format/email_format.h"
#include <spdlog/spdlog.h>
#include <regex>

namespace typesys {
namespace format {

namespace {

const std::regex& emailRegex() {
    static const std::regex pattern(
        R"([a-zA-Z0-9_.+\-]+@[a-zA-Z0-9\-]+\.[a-zA-Z0-9.\-]+)");
    return pattern;
}

} // anonymous namespace

const ErrorTemplates& EmailFormat::errorTemplates() const {
    static const ErrorTemplates templates = {
        {CODE_FORMAT, "Must be valid Email format."},
    };
    return templates;
}

bool EmailFormat::isNativeType(const FormatValue& value) const {
    return std::holds_alternative<EmailAddress>(value);
}

EmailAddress EmailFormat::parse(const std::string& value) const {
    // std::regex recursion depth grows with input length
    if (value.length() > MAX_LENGTH) {
        spdlog::debug("[EmailFormat] Rejected input of {} bytes: longer than {}",
                      value.length(), MAX_LENGTH);
        throw validationError(CODE_FORMAT);
    }

    if (!std::regex_match(value, emailRegex())) {
        spdlog::debug("[EmailFormat] Rejected '{}': not an email address", value);
        throw validationError(CODE_FORMAT);
    }
    return EmailAddress::of(value);
}

FormatValue EmailFormat::validate(const std::string& value) const {
    return parse(value);
}

std::optional<std::string> EmailFormat::serialize(const FormatValue& value) const {
    if (std::holds_alternative<std::monostate>(value)) {
        return std::nullopt;
    }
    const auto* email = std::get_if<EmailAddress>(&value);
    if (!email) {
        throwWrongType(value);
    }
    return email->getValue();
}

} // namespace format
} // namespace typesys
