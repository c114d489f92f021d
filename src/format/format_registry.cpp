/**
 * @file format_registry.cpp
 * @brief FormatRegistry implementation
 */

#include "typesys/format/format_registry.h"
#include "typesys/format/date_format.h"
#include "typesys/format/datetime_format.h"
#include "typesys/format/email_format.h"
#include "typesys/format/time_format.h"
#include "typesys/format/url_format.h"
#include "typesys/format/uuid_format.h"
#include <spdlog/spdlog.h>
#include <stdexcept>

namespace typesys {
namespace format {

const FormatRegistry& FormatRegistry::builtin() {
    static const FormatRegistry registry = withBuiltinFormats();
    return registry;
}

FormatRegistry FormatRegistry::withBuiltinFormats() {
    FormatRegistry registry;
    registry.add(std::make_unique<DateFormat>());
    registry.add(std::make_unique<TimeFormat>());
    registry.add(std::make_unique<DateTimeFormat>());
    registry.add(std::make_unique<UuidFormat>());
    registry.add(std::make_unique<UrlFormat>());
    registry.add(std::make_unique<EmailFormat>());
    return registry;
}

void FormatRegistry::add(std::unique_ptr<Format> format) {
    if (!format) {
        throw std::invalid_argument("Cannot register a null format");
    }

    std::string name = format->name();
    if (formats_.count(name)) {
        throw std::invalid_argument("Format already registered: " + name);
    }

    formats_.emplace(name, std::move(format));
    spdlog::debug("Format registered: {}", name);
}

const Format* FormatRegistry::find(const std::string& name) const {
    auto it = formats_.find(name);
    return it == formats_.end() ? nullptr : it->second.get();
}

const Format& FormatRegistry::get(const std::string& name) const {
    const Format* format = find(name);
    if (!format) {
        throw std::out_of_range("Unknown format: " + name);
    }
    return *format;
}

bool FormatRegistry::contains(const std::string& name) const {
    return formats_.count(name) > 0;
}

std::vector<std::string> FormatRegistry::names() const {
    std::vector<std::string> result;
    result.reserve(formats_.size());
    for (const auto& entry : formats_) {
        result.push_back(entry.first);
    }
    return result;
}

} // namespace format
} // namespace typesys
