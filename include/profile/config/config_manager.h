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

namespace profile::config {

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
     * @brief Get integer configuration value (default on parse failure)
     */
    int getInt(const std::string& key, int defaultValue = 0) const;

    /**
     * @brief Get boolean configuration value
     *
     * Accepts true/false, 1/0, yes/no, on/off in any case.
     */
    bool getBool(const std::string& key, bool defaultValue = false) const;

    bool has(const std::string& key) const;

    void set(const std::string& key, const std::string& value);

    /**
     * @brief Drop a key set through set()
     */
    void unset(const std::string& key);

    /**
     * @brief Load the known PROFILE_* keys from the environment
     */
    void loadFromEnvironment();

    static std::string getEnv(const std::string& key, const std::string& defaultValue = "");

    /// @name Predefined Configuration Keys

    static constexpr const char* LOG_LEVEL = "PROFILE_LOG_LEVEL";
    static constexpr const char* LOG_TO_FILE = "PROFILE_LOG_TO_FILE";
    static constexpr const char* LOG_FILE = "PROFILE_LOG_FILE";
};

} // namespace profile::config
