#ifndef DESKPILOT_STRUCTURED_LOGGER_H
#define DESKPILOT_STRUCTURED_LOGGER_H

#include <string>
#include <memory>
#include <chrono>
#include <atomic>
#include <cstdint>
#include <optional>
#include <thread>
#include <mutex>
#include <vector>
#include <deque>
#include <fstream>
#include <nlohmann/json.hpp>
#include "thread_safe_queue.h"

namespace deskpilot {

enum class LogLevel {
    DEBUG,
    INFO,
    WARNING,
    ERROR_LEVEL,  // ERROR collides with a Windows macro
    CRITICAL
};

std::string logLevelToString(LogLevel level);
LogLevel parseLogLevel(const std::string& name);

/**
 * @brief Log entry structure with structured data
 */
struct LogEntry {
    std::chrono::system_clock::time_point timestamp;
    LogLevel level;
    std::string message;
    std::string file;
    int line;
    std::thread::id thread_id;
    nlohmann::json context;  // Additional structured data

    // Sequence number of the agent cycle that produced the entry, if any
    std::optional<uint64_t> cycle;

    LogEntry() : level(LogLevel::INFO), line(0) {}
};

/**
 * @brief Log formatter interface
 */
class ILogFormatter {
public:
    virtual ~ILogFormatter() = default;
    virtual std::string format(const LogEntry& entry) = 0;
};

/**
 * @brief JSON-lines formatter
 */
class JsonLogFormatter : public ILogFormatter {
public:
    std::string format(const LogEntry& entry) override;
};

/**
 * @brief Human-readable formatter
 */
class TextLogFormatter : public ILogFormatter {
public:
    std::string format(const LogEntry& entry) override;
};

/**
 * @brief Log sink interface
 */
class ILogSink {
public:
    virtual ~ILogSink() = default;
    virtual void write(const LogEntry& entry) = 0;
    virtual void flush() = 0;
};

class ConsoleLogSink : public ILogSink {
public:
    explicit ConsoleLogSink(std::shared_ptr<ILogFormatter> formatter);
    void write(const LogEntry& entry) override;
    void flush() override;

private:
    std::shared_ptr<ILogFormatter> m_formatter;
    std::mutex m_mutex;
};

/**
 * @brief File sink with size based rotation (app.log, app.1.log, ...)
 */
class RotatingFileLogSink : public ILogSink {
public:
    struct Config {
        std::string base_path;
        size_t max_file_size = 10 * 1024 * 1024;
        size_t max_files = 5;
    };

    RotatingFileLogSink(const Config& config, std::shared_ptr<ILogFormatter> formatter);
    ~RotatingFileLogSink();

    void write(const LogEntry& entry) override;
    void flush() override;

private:
    Config m_config;
    std::shared_ptr<ILogFormatter> m_formatter;
    std::unique_ptr<std::ofstream> m_file;
    std::mutex m_mutex;
    size_t m_current_size;

    void rotateIfNeeded();
    void openNewFile();
    std::string generateFileName(size_t index) const;
};

/**
 * @brief Keeps the most recent entries in memory. Used by the run report and tests.
 */
class MemoryLogSink : public ILogSink {
public:
    explicit MemoryLogSink(size_t capacity = 1000);
    void write(const LogEntry& entry) override;
    void flush() override {}

    std::vector<LogEntry> entries() const;
    size_t count(LogLevel minLevel) const;
    bool contains(const std::string& messageFragment) const;
    void clear();

private:
    size_t m_capacity;
    std::deque<LogEntry> m_entries;
    mutable std::mutex m_mutex;
};

/**
 * @brief Process-wide structured logger
 */
class StructuredLogger {
public:
    static StructuredLogger& getInstance();

    // Configuration
    void setLogLevel(LogLevel level);
    LogLevel getLogLevel() const;
    void addSink(std::shared_ptr<ILogSink> sink);
    void removeSink(std::shared_ptr<ILogSink> sink);
    void clearSinks();
    void setAsyncLogging(bool async);

    void log(const LogEntry& entry);

    class LogBuilder {
    public:
        LogBuilder(StructuredLogger* logger, LogLevel level);

        LogBuilder& message(const std::string& msg);
        LogBuilder& context(const std::string& key, const nlohmann::json& value);
        LogBuilder& file(const char* file, int line);
        LogBuilder& cycle(uint64_t sequence);

        ~LogBuilder();  // Logs on destruction

    private:
        StructuredLogger* m_logger;
        LogEntry m_entry;
    };

    LogBuilder debug() { return LogBuilder(this, LogLevel::DEBUG); }
    LogBuilder info() { return LogBuilder(this, LogLevel::INFO); }
    LogBuilder warning() { return LogBuilder(this, LogLevel::WARNING); }
    LogBuilder error() { return LogBuilder(this, LogLevel::ERROR_LEVEL); }
    LogBuilder critical() { return LogBuilder(this, LogLevel::CRITICAL); }

    void shutdown();
    void flush();

private:
    StructuredLogger();
    ~StructuredLogger();
    StructuredLogger(const StructuredLogger&) = delete;
    StructuredLogger& operator=(const StructuredLogger&) = delete;

    std::atomic<LogLevel> m_min_level;
    std::vector<std::shared_ptr<ILogSink>> m_sinks;
    mutable std::mutex m_config_mutex;

    // Async logging
    std::atomic<bool> m_async_enabled;
    ThreadSafeQueue<LogEntry> m_log_queue;
    std::thread m_logging_thread;
    std::atomic<bool> m_stop_async;
    std::atomic<bool> m_shutdown;

    void asyncLoggingLoop();
    void processLogEntry(const LogEntry& entry);
};

// Convenience macros for structured logging
#define SLOG_DEBUG() deskpilot::StructuredLogger::getInstance().debug().file(__FILE__, __LINE__)
#define SLOG_INFO() deskpilot::StructuredLogger::getInstance().info().file(__FILE__, __LINE__)
#define SLOG_WARNING() deskpilot::StructuredLogger::getInstance().warning().file(__FILE__, __LINE__)
#define SLOG_ERROR() deskpilot::StructuredLogger::getInstance().error().file(__FILE__, __LINE__)
#define SLOG_CRITICAL() deskpilot::StructuredLogger::getInstance().critical().file(__FILE__, __LINE__)

} // namespace deskpilot

#endif // DESKPILOT_STRUCTURED_LOGGER_H
