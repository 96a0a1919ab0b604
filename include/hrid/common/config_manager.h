/**
 * @file config_manager.h
 * @brief Centralized configuration for hrid tools
 *
 * Values set explicitly take precedence over the environment; unset keys
 * fall back to the environment and then to the caller's default.
 */

#pragma once

#include <initializer_list>
#include <map>
#include <memory>
#include <mutex>
#include <string>

namespace hrid {
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
     */
    std::string getString(const std::string& key, const std::string& defaultValue = "") const;

    /**
     * @brief Get integer configuration value
     *
     * Unparseable values log a warning and yield the default.
     */
    int getInt(const std::string& key, int defaultValue = 0) const;

    /**
     * @brief Get boolean configuration value
     *
     * Accepts true/false, 1/0, yes/no, on/off (case-insensitive).
     */
    bool getBool(const std::string& key, bool defaultValue = false) const;

    /**
     * @brief Get a value that must be one of the allowed choices
     * @throws ConfigException if the value is set but not allowed
     */
    std::string getChoice(const std::string& key,
                          const std::string& defaultValue,
                          std::initializer_list<const char*> allowed) const;

    bool has(const std::string& key) const;

    void set(const std::string& key, const std::string& value);

    /**
     * @brief Remove an explicit value (environment fallback applies again)
     */
    void unset(const std::string& key);

    /**
     * @brief Load the predefined keys from the environment
     */
    void loadFromEnvironment();

    /// @name Predefined Configuration Keys

    static constexpr const char* LOG_LEVEL = "HRID_LOG_LEVEL";
    static constexpr const char* LOG_TO_FILE = "HRID_LOG_TO_FILE";
    static constexpr const char* LOG_FILE = "HRID_LOG_FILE";
    static constexpr const char* HASH_ALGORITHM = "HRID_HASH_ALGORITHM";
    static constexpr const char* OUTPUT_FORMAT = "HRID_OUTPUT_FORMAT";
};

} // namespace common
} // namespace hrid
