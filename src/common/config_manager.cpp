#include "config_manager.h"
#include "error_handler.h"
#include "structured_logger.h"
#include "file_utils.h"

namespace deskpilot {

namespace {
    void configError(const std::string& message, const std::string& details = "") {
        DESKPILOT_THROW(ErrorType::CONFIGURATION_ERROR, ErrorSeverity::HIGH,
                        message, details, "ConfigManager");
    }

    template<typename T>
    T readValue(const nlohmann::json& section, const std::string& sectionName, const char* key) {
        try {
            return section.at(key).get<T>();
        } catch (const nlohmann::json::exception& e) {
            configError("Invalid configuration value: " + sectionName + "." + key, e.what());
        }
        return T();
    }

    std::chrono::milliseconds readMs(const nlohmann::json& section, const std::string& sectionName, const char* key) {
        return std::chrono::milliseconds(readValue<int64_t>(section, sectionName, key));
    }
}

ConfigManager::ConfigManager() {
    setDefaults();
}

ConfigManager& ConfigManager::getInstance() {
    static ConfigManager instance;
    return instance;
}

bool ConfigManager::loadConfig(const std::string& configPath) {
    m_configPath = configPath;

    if (!utils::FileUtils::fileExists(configPath)) {
        SLOG_WARNING().message("Config file not found, using defaults").context("config_path", configPath);
        setDefaults();
        return false;
    }

    nlohmann::json document;
    std::string error;
    if (!utils::FileUtils::loadJsonFromFile(configPath, document, &error)) {
        configError("Cannot load configuration file", error);
    }

    loadFromJson(document);
    SLOG_INFO().message("Configuration loaded").context("config_path", configPath);
    return true;
}

void ConfigManager::loadFromJson(const nlohmann::json& document) {
    if (!document.is_object()) {
        configError("Configuration root must be a JSON object");
    }

    setDefaults();
    for (auto it = document.begin(); it != document.end(); ++it) {
        if (it.value().is_object() && m_config.contains(it.key()) && m_config[it.key()].is_object()) {
            for (auto field = it.value().begin(); field != it.value().end(); ++field) {
                m_config[it.key()][field.key()] = field.value();
            }
        } else {
            m_config[it.key()] = it.value();
        }
    }
}

bool ConfigManager::saveConfig(const std::string& configPath) const {
    if (!utils::FileUtils::saveJsonToFile(configPath, m_config)) {
        SLOG_ERROR().message("Failed to save configuration").context("config_path", configPath);
        return false;
    }
    SLOG_INFO().message("Configuration saved").context("config_path", configPath);
    return true;
}

void ConfigManager::resetToDefaults() {
    setDefaults();
    m_configPath.clear();
}

void ConfigManager::setDefaults() {
    m_config = RunConfig::defaults().toJson();
    m_config["logging"] = {
        {"level", "INFO"},
        {"format", "text"},
        {"file", ""},
        {"max_size_mb", 10},
        {"max_files", 5},
        {"async", false}
    };
}

RunConfig ConfigManager::buildRunConfig() const {
    RunConfig config;

    const auto& run = m_config["run"];
    config.historyCapacity = readValue<size_t>(run, "run", "history_capacity");
    config.workerThreads = readValue<size_t>(run, "run", "worker_threads");

    const auto& budget = m_config["budget"];
    config.maxCycles = readValue<uint64_t>(budget, "budget", "max_cycles");
    config.maxRunDuration = readMs(budget, "budget", "max_run_duration_ms");

    const auto& timeouts = m_config["timeouts"];
    config.perceptionTimeout = readMs(timeouts, "timeouts", "perception_ms");
    config.executionTimeout = readMs(timeouts, "timeouts", "execution_ms");
    config.confirmationWindow = readMs(timeouts, "timeouts", "confirmation_window_ms");
    config.cancellationPoll = readMs(timeouts, "timeouts", "cancellation_poll_ms");

    const auto& retry = m_config["retry"];
    config.retry.perceptionMaxAttempts = readValue<int>(retry, "retry", "perception_max_attempts");
    config.retry.reasoningMaxAttempts = readValue<int>(retry, "retry", "reasoning_max_attempts");
    config.retry.executionMaxConsecutiveFailures = readValue<int>(retry, "retry", "execution_max_consecutive_failures");
    config.retry.maxConsecutiveFailures = readValue<int>(retry, "retry", "max_consecutive_failures");
    config.retry.initialBackoff = readMs(retry, "retry", "initial_backoff_ms");
    config.retry.backoffMultiplier = readValue<double>(retry, "retry", "backoff_multiplier");
    config.retry.maxBackoff = readMs(retry, "retry", "max_backoff_ms");

    const auto& safety = m_config["safety"];
    const auto& levels = safety.contains("risk_levels") ? safety["risk_levels"] : nlohmann::json();
    if (!levels.is_object()) {
        configError("safety.risk_levels must be an object");
    }
    RiskTable table;
    for (auto it = levels.begin(); it != levels.end(); ++it) {
        auto kind = actionKindFromString(it.key());
        if (!kind) {
            configError("Unknown action kind in safety.risk_levels", it.key());
        }
        if (!it.value().is_number_integer()) {
            configError("Risk level must be an integer 0..3", it.key());
        }
        auto level = riskLevelFromInt(it.value().get<int>());
        if (!level) {
            configError("Risk level out of range 0..3", it.key());
        }
        table.set(*kind, *level);
    }
    config.riskTable = table;

    config.denylist = readValue<std::vector<std::string>>(safety, "safety", "denylist");

    const auto& models = m_config["models"];
    if (!models.is_array()) {
        configError("models must be an array");
    }
    config.endpoints.clear();
    for (const auto& entry : models) {
        if (!entry.is_object()) {
            configError("models entries must be objects");
        }
        EndpointConfig endpoint;
        endpoint.name = readValue<std::string>(entry, "models", "name");
        endpoint.model = entry.value("model", endpoint.name);
        endpoint.timeout = std::chrono::milliseconds(entry.value("timeout_ms", int64_t(20000)));
        endpoint.vision = entry.value("vision", false);
        config.endpoints.push_back(endpoint);
    }

    const auto& metrics = m_config["metrics"];
    config.metricsQueueCapacity = readValue<size_t>(metrics, "metrics", "queue_capacity");
    config.metricsFile = metrics.value("jsonl_file", std::string());

    config.validate();
    return config;
}

std::string ConfigManager::getLogLevel() const {
    return m_config["logging"].value("level", std::string("INFO"));
}

std::string ConfigManager::getLogFormat() const {
    return m_config["logging"].value("format", std::string("text"));
}

std::string ConfigManager::getLogFile() const {
    return m_config["logging"].value("file", std::string());
}

int ConfigManager::getLogMaxSizeMb() const {
    return m_config["logging"].value("max_size_mb", 10);
}

int ConfigManager::getLogMaxFiles() const {
    return m_config["logging"].value("max_files", 5);
}

bool ConfigManager::getLogAsync() const {
    return m_config["logging"].value("async", false);
}

std::string ConfigManager::getMetricsFile() const {
    return m_config["metrics"].value("jsonl_file", std::string());
}

std::string ConfigManager::getConfigPath() const {
    return m_configPath;
}

} // namespace deskpilot
