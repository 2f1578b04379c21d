#ifndef DESKPILOT_CONFIG_MANAGER_H
#define DESKPILOT_CONFIG_MANAGER_H

#include <string>
#include <stdexcept>
#include <nlohmann/json.hpp>
#include "run_config.h"

namespace deskpilot {

/**
 * @brief JSON configuration store
 *
 * Holds defaults for every section; a loaded file overrides individual keys
 * within a section. Values such as safety.risk_levels are replaced whole,
 * never merged with the defaults.
 */
class ConfigManager {
public:
    static ConfigManager& getInstance();

    /**
     * @brief Load configuration from a JSON file
     * @return false if the file does not exist (defaults stay in effect)
     * @throws DeskpilotException CONFIGURATION_ERROR if the file is not valid JSON
     */
    bool loadConfig(const std::string& configPath = "config/deskpilot.json");

    /**
     * @brief Apply a configuration document over the defaults
     * @throws DeskpilotException CONFIGURATION_ERROR if the document is not an object
     */
    void loadFromJson(const nlohmann::json& document);

    bool saveConfig(const std::string& configPath) const;
    void resetToDefaults();

    /**
     * @brief Validate the current configuration into an immutable RunConfig
     * @throws DeskpilotException CONFIGURATION_ERROR on a type error, an
     *         unknown action kind, an out-of-range risk level, a non-total risk
     *         table or any bound violation
     */
    RunConfig buildRunConfig() const;

    // Logging configuration
    std::string getLogLevel() const;
    std::string getLogFormat() const;
    std::string getLogFile() const;
    int getLogMaxSizeMb() const;
    int getLogMaxFiles() const;
    bool getLogAsync() const;

    std::string getMetricsFile() const;
    std::string getConfigPath() const;

    const nlohmann::json& raw() const { return m_config; }

    template<typename T>
    T get(const std::string& section, const std::string& key) const;

    template<typename T>
    void set(const std::string& section, const std::string& key, const T& value);

private:
    ConfigManager();
    ~ConfigManager() = default;
    ConfigManager(const ConfigManager&) = delete;
    ConfigManager& operator=(const ConfigManager&) = delete;

    nlohmann::json m_config;
    std::string m_configPath;

    void setDefaults();
};

template<typename T>
T ConfigManager::get(const std::string& section, const std::string& key) const {
    if (m_config.contains(section) && m_config[section].contains(key)) {
        return m_config[section][key].get<T>();
    }
    throw std::runtime_error("Configuration key not found: " + section + "." + key);
}

template<typename T>
void ConfigManager::set(const std::string& section, const std::string& key, const T& value) {
    m_config[section][key] = value;
}

} // namespace deskpilot

#endif // DESKPILOT_CONFIG_MANAGER_H
