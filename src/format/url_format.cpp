/**
 * @file url_format.cpp
 * @brief UrlFormat implementation
 */

#include "typesys/format/url_format.h"
#include "typesys/utils/string_utils.h"
#include <spdlog/spdlog.h>
#include <regex>

namespace typesys {
namespace format {

namespace {

std::string joinAlternatives(const std::vector<std::string>& parts) {
    std::string result;
    for (size_t i = 0; i < parts.size(); ++i) {
        if (i > 0) result += "|";
        result += parts[i];
    }
    return result;
}

// Unanchored: the URL may be surrounded by other text
const std::regex& urlRegex() {
    static const std::regex pattern(
        R"(\b(http[s]?://)?([^:\s]+)(\.\w+)*\.()" +
        joinAlternatives(UrlFormat::topLevelDomains()) +
        R"()(/[\w.\-]+[^#?\s]+)*/?\b)");
    return pattern;
}

} // anonymous namespace

const std::vector<std::string>& UrlFormat::topLevelDomains() {
    static const std::vector<std::string> domains = {
        "com", "org", "net", "us", "co", "int", "mil", "edu", "gov", "biz",
        "info", "jobs", "mobi", "name", "ly", "tel", "kitchen", "email",
        "tech", "estate", "xyz", "codes", "bargains", "bid", "expert", "ca",
        "cn", "fr", "ch", "au", "in", "de", "jp", "nl", "uk", "mx", "no",
        "ru", "br", "se", "es"
    };
    return domains;
}

const ErrorTemplates& UrlFormat::errorTemplates() const {
    static const ErrorTemplates templates = {
        {CODE_FORMAT, "Must be valid URL format."},
    };
    return templates;
}

bool UrlFormat::isNativeType(const FormatValue& value) const {
    return std::holds_alternative<Url>(value);
}

Url UrlFormat::parse(const std::string& value) const {
    // std::regex recursion depth grows with input length
    if (value.length() > MAX_LENGTH) {
        spdlog::debug("[UrlFormat] Rejected input of {} bytes: longer than {}",
                      value.length(), MAX_LENGTH);
        throw validationError(CODE_FORMAT);
    }

    if (!std::regex_search(value, urlRegex())) {
        spdlog::debug("[UrlFormat] Rejected '{}': no URL found", value);
        throw validationError(CODE_FORMAT);
    }

    // Schemeless input is taken as plain http
    if (!utils::startsWith(value, "http")) {
        return Url::parse("http://" + value);
    }
    return Url::parse(value);
}

FormatValue UrlFormat::validate(const std::string& value) const {
    return parse(value);
}

std::optional<std::string> UrlFormat::serialize(const FormatValue& value) const {
    if (std::holds_alternative<std::monostate>(value)) {
        return std::nullopt;
    }
    const auto* url = std::get_if<Url>(&value);
    if (!url) {
        throwWrongType(value);
    }
    return url->toString();
}

} // namespace format
} // namespace typesys
