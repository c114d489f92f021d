/**
 * @file format_check.cpp
 * @brief Command-line checker for the built-in formats
 *
 * Usage: typesys-format-check <format> <value>...
 *
 * Prints one JSON object per value on stdout. Exit status is 0 when every
 * value is accepted, 1 when any value is rejected and 2 on usage errors.
 *
 * Environment:
 *   LOG_LEVEL    trace|debug|info|warn|error|critical|off (default: warn)
 *   LOG_TO_FILE  also log to LOG_FILE (default: false)
 *   LOG_FILE     log file path, required when LOG_TO_FILE is set
 */

#include "typesys/common/config_manager.h"
#include "typesys/common/exceptions.h"
#include "typesys/common/logger.h"
#include "typesys/format/format_registry.h"
#include "typesys/format/json_bridge.h"

#include <json/json.h>
#include <spdlog/spdlog.h>

#include <iostream>
#include <memory>
#include <string>

namespace {

void printUsage(const char* program) {
    std::cerr << "Usage: " << program << " <format> <value>..." << std::endl;
    std::cerr << "Formats:";
    for (const auto& name : typesys::format::FormatRegistry::builtin().names()) {
        std::cerr << " " << name;
    }
    std::cerr << std::endl;
}

Json::Value checkValue(const typesys::format::Format& format, const std::string& input) {
    Json::Value result;
    result["input"] = input;

    try {
        auto native = format.validate(input);
        result["valid"] = true;
        result["canonical"] = typesys::format::serializeJson(format, native);
    } catch (const typesys::format::ValidationError& e) {
        result["valid"] = false;
        result["error"] = e.toJson();
    }

    return result;
}

} // anonymous namespace

int main(int argc, char* argv[]) {
    using typesys::common::ConfigManager;

    auto& config = ConfigManager::getInstance();
    try {
        bool logToFile = config.getBool(ConfigManager::LOG_TO_FILE, false);
        std::string logFile = logToFile ? config.getRequiredString(ConfigManager::LOG_FILE) : "";
        typesys::common::Logger::initialize(
            "format-check", config.getString(ConfigManager::LOG_LEVEL, "warn"), logToFile, logFile);
    } catch (const typesys::common::ConfigException& e) {
        std::cerr << e.what() << std::endl;
        return 2;
    }

    if (argc < 3) {
        printUsage(argv[0]);
        return 2;
    }

    const std::string formatName = argv[1];
    const auto* format = typesys::format::FormatRegistry::builtin().find(formatName);
    if (!format) {
        spdlog::error("Unknown format: {}", formatName);
        printUsage(argv[0]);
        return 2;
    }

    Json::StreamWriterBuilder writerBuilder;
    writerBuilder["indentation"] = "";
    std::unique_ptr<Json::StreamWriter> writer(writerBuilder.newStreamWriter());

    int rejected = 0;
    for (int i = 2; i < argc; ++i) {
        Json::Value result = checkValue(*format, argv[i]);
        if (!result["valid"].asBool()) {
            ++rejected;
        }
        writer->write(result, &std::cout);
        std::cout << std::endl;
    }

    spdlog::info("Checked {} value(s) with format '{}': {} rejected", argc - 2, formatName, rejected);
    typesys::common::Logger::flush();
    return rejected == 0 ? 0 : 1;
}
