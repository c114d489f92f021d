/**
 * @file url.cpp
 * @brief Url value implementation
 *
 * Splits URLs into scheme, netloc, path, params, query and fragment the way
 * generic URL libraries do, and reassembles them.
 */

#include "typesys/format/identifier_types.h"
#include "typesys/utils/string_utils.h"
#include <algorithm>
#include <cctype>
#include <set>

namespace typesys {
namespace format {

namespace {

// Schemes whose URLs carry a network location ("//host")
const std::set<std::string>& schemesWithNetloc() {
    static const std::set<std::string> schemes = {
        "ftp", "http", "gopher", "nntp", "telnet", "imap", "wais", "file",
        "mms", "https", "shttp", "snews", "prospero", "rtsp", "rtspu",
        "rsync", "svn", "svn+ssh", "sftp", "nfs", "git", "git+ssh", "ws", "wss"
    };
    return schemes;
}

// Schemes whose last path segment may carry ";params"
const std::set<std::string>& schemesWithParams() {
    static const std::set<std::string> schemes = {
        "", "ftp", "hdl", "prospero", "http", "imap", "https", "shttp",
        "rtsp", "rtspu", "sip", "sips", "mms", "sftp", "tel"
    };
    return schemes;
}

bool isSchemeChar(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) || c == '+' || c == '-' || c == '.';
}

std::string sanitize(const std::string& url) {
    size_t start = 0;
    while (start < url.length() && static_cast<unsigned char>(url[start]) <= 0x20) {
        ++start;
    }

    std::string result;
    result.reserve(url.length() - start);
    for (size_t i = start; i < url.length(); ++i) {
        if (url[i] != '\t' && url[i] != '\r' && url[i] != '\n') {
            result += url[i];
        }
    }
    return result;
}

// netloc without "user:password@"
std::string hostInfo(const std::string& netloc) {
    size_t at = netloc.rfind('@');
    return at == std::string::npos ? netloc : netloc.substr(at + 1);
}

} // anonymous namespace

Url Url::parse(const std::string& url) {
    Url result;
    std::string rest = sanitize(url);

    size_t colon = rest.find(':');
    if (colon != std::string::npos && colon > 0 &&
        std::isalpha(static_cast<unsigned char>(rest[0])) &&
        std::all_of(rest.begin(), rest.begin() + colon, isSchemeChar)) {
        result.scheme_ = utils::toLower(rest.substr(0, colon));
        rest = rest.substr(colon + 1);
    }

    if (utils::startsWith(rest, "//")) {
        size_t delim = rest.find_first_of("/?#", 2);
        if (delim == std::string::npos) {
            result.netloc_ = rest.substr(2);
            rest.clear();
        } else {
            result.netloc_ = rest.substr(2, delim - 2);
            rest = rest.substr(delim);
        }
    }

    size_t hash = rest.find('#');
    if (hash != std::string::npos) {
        result.fragment_ = rest.substr(hash + 1);
        rest = rest.substr(0, hash);
    }

    size_t question = rest.find('?');
    if (question != std::string::npos) {
        result.query_ = rest.substr(question + 1);
        rest = rest.substr(0, question);
    }

    if (schemesWithParams().count(result.scheme_) && rest.find(';') != std::string::npos) {
        size_t slash = rest.rfind('/');
        size_t semicolon = slash == std::string::npos ? rest.find(';') : rest.find(';', slash);
        if (semicolon != std::string::npos) {
            result.params_ = rest.substr(semicolon + 1);
            rest = rest.substr(0, semicolon);
        }
    }

    result.path_ = rest;
    return result;
}

std::optional<std::string> Url::hostname() const {
    std::string info = hostInfo(netloc_);

    std::string host;
    size_t open = info.find('[');
    if (open != std::string::npos) {
        size_t close = info.find(']', open);
        host = info.substr(open + 1, close == std::string::npos ? std::string::npos : close - open - 1);
    } else {
        host = info.substr(0, info.find(':'));
    }

    if (host.empty()) {
        return std::nullopt;
    }
    return utils::toLower(host);
}

std::optional<int> Url::port() const {
    std::string info = hostInfo(netloc_);

    std::string portText;
    size_t open = info.find('[');
    if (open != std::string::npos) {
        size_t close = info.find(']', open);
        if (close == std::string::npos) {
            return std::nullopt;
        }
        size_t colon = info.find(':', close);
        if (colon != std::string::npos) {
            portText = info.substr(colon + 1);
        }
    } else {
        size_t colon = info.find(':');
        if (colon != std::string::npos) {
            portText = info.substr(colon + 1);
        }
    }

    if (portText.empty() || portText.length() > 5 ||
        !std::all_of(portText.begin(), portText.end(),
                     [](char c) { return c >= '0' && c <= '9'; })) {
        return std::nullopt;
    }

    int value = std::stoi(portText);
    if (value > 65535) {
        return std::nullopt;
    }
    return value;
}

std::string Url::toString() const {
    std::string url = path_;
    if (!params_.empty()) {
        url += ";" + params_;
    }

    if (!netloc_.empty() ||
        (!scheme_.empty() && schemesWithNetloc().count(scheme_) && !utils::startsWith(url, "//"))) {
        if (!url.empty() && url[0] != '/') {
            url = "/" + url;
        }
        url = "//" + netloc_ + url;
    }

    if (!scheme_.empty()) {
        url = scheme_ + ":" + url;
    }
    if (!query_.empty()) {
        url += "?" + query_;
    }
    if (!fragment_.empty()) {
        url += "#" + fragment_;
    }
    return url;
}

} // namespace format
} // namespace typesys
