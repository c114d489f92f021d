/**
 * @file config_manager.h
 * @brief Centralized Configuration Management
 *
 * Environment-backed configuration with typed getters and defaults.
 * Thread-safe singleton.
 */

#pragma once

#include <map>
#include <memory>
#include <mutex>
#include <string>

namespace typesys {
namespace common {

/**
 * @brief Configuration Manager (Singleton)
 */
class ConfigManager {
private:
    std::map<std::string, std::string> config_;
    mutable std::mutex mutex_;

    static std::unique_ptr<ConfigManager> instance_;
    static std::once_flag initFlag_;

    ConfigManager();

public:
    /**
     * @brief Get singleton instance
     */
    static ConfigManager& getInstance();

    ConfigManager(const ConfigManager&) = delete;
    ConfigManager& operator=(const ConfigManager&) = delete;
    ConfigManager(ConfigManager&&) = delete;
    ConfigManager& operator=(ConfigManager&&) = delete;

    /**
     * @brief Get string configuration value
     * @param key Configuration key
     * @param defaultValue Default value if key not found
     * @return Configuration value
     */
    std::string getString(const std::string& key, const std::string& defaultValue = "") const;

    /**
     * @brief Get a value that must be present and non-empty
     * @throws ConfigException if the key is missing or empty
     */
    std::string getRequiredString(const std::string& key) const;

    /**
     * @brief Get boolean configuration value
     *
     * Accepts true/false, 1/0, yes/no, on/off (any case).
     */
    bool getBool(const std::string& key, bool defaultValue = false) const;

    /**
     * @brief Set configuration value (overrides the environment)
     */
    void set(const std::string& key, const std::string& value);

    /**
     * @brief Load known keys from the environment
     */
    void loadFromEnvironment();

    /// @name Predefined Configuration Keys
    static constexpr const char* LOG_LEVEL = "LOG_LEVEL";
    static constexpr const char* LOG_TO_FILE = "LOG_TO_FILE";
    static constexpr const char* LOG_FILE = "LOG_FILE";
};

} // namespace common
} // namespace typesys
