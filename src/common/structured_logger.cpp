#include "structured_logger.h"
#include <iostream>
#include <sstream>
#include <iomanip>
#include <filesystem>
#include <algorithm>
#include <cctype>

namespace deskpilot {

namespace fs = std::filesystem;

namespace {
    std::string formatTimestamp(const std::chrono::system_clock::time_point& tp) {
        auto time_t = std::chrono::system_clock::to_time_t(tp);
        auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
            tp.time_since_epoch()) % 1000;

        std::tm tm_buf{};
#ifdef _WIN32
        localtime_s(&tm_buf, &time_t);
#else
        localtime_r(&time_t, &tm_buf);
#endif
        std::stringstream ss;
        ss << std::put_time(&tm_buf, "%Y-%m-%d %H:%M:%S");
        ss << '.' << std::setfill('0') << std::setw(3) << ms.count();
        return ss.str();
    }

    std::string threadIdToString(std::thread::id id) {
        std::stringstream ss;
        ss << id;
        return ss.str();
    }
}

std::string logLevelToString(LogLevel level) {
    switch (level) {
        case LogLevel::DEBUG: return "DEBUG";
        case LogLevel::INFO: return "INFO";
        case LogLevel::WARNING: return "WARNING";
        case LogLevel::ERROR_LEVEL: return "ERROR";
        case LogLevel::CRITICAL: return "CRITICAL";
        default: return "UNKNOWN";
    }
}

LogLevel parseLogLevel(const std::string& name) {
    std::string upper = name;
    std::transform(upper.begin(), upper.end(), upper.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    if (upper == "DEBUG") return LogLevel::DEBUG;
    if (upper == "WARNING" || upper == "WARN") return LogLevel::WARNING;
    if (upper == "ERROR") return LogLevel::ERROR_LEVEL;
    if (upper == "CRITICAL") return LogLevel::CRITICAL;
    return LogLevel::INFO;
}

// JsonLogFormatter implementation
std::string JsonLogFormatter::format(const LogEntry& entry) {
    nlohmann::json log_json;

    log_json["timestamp"] = formatTimestamp(entry.timestamp);
    log_json["level"] = logLevelToString(entry.level);
    log_json["message"] = entry.message;
    log_json["thread"] = threadIdToString(entry.thread_id);

    if (entry.cycle) {
        log_json["cycle"] = *entry.cycle;
    }

    if (!entry.file.empty()) {
        log_json["source"]["file"] = fs::path(entry.file).filename().string();
        log_json["source"]["line"] = entry.line;
    }

    if (!entry.context.empty()) {
        log_json["context"] = entry.context;
    }

    return log_json.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace) + "\n";
}

// TextLogFormatter implementation
std::string TextLogFormatter::format(const LogEntry& entry) {
    std::stringstream ss;

    ss << "[" << formatTimestamp(entry.timestamp) << "] ";
    ss << "[" << std::setw(8) << logLevelToString(entry.level) << "] ";

    // Thread ID (shortened)
    std::string thread_str = threadIdToString(entry.thread_id);
    if (thread_str.length() > 6) {
        thread_str = thread_str.substr(thread_str.length() - 6);
    }
    ss << "[" << std::setw(6) << thread_str << "] ";

    if (entry.cycle) {
        ss << "[cycle " << *entry.cycle << "] ";
    }

    ss << entry.message;

    // Source location for errors and above
    if (!entry.file.empty() && entry.level >= LogLevel::ERROR_LEVEL) {
        ss << " (" << fs::path(entry.file).filename().string() << ":" << entry.line << ")";
    }

    if (!entry.context.empty()) {
        ss << " " << entry.context.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
    }

    ss << "\n";
    return ss.str();
}

// ConsoleLogSink implementation
ConsoleLogSink::ConsoleLogSink(std::shared_ptr<ILogFormatter> formatter)
    : m_formatter(formatter) {}

void ConsoleLogSink::write(const LogEntry& entry) {
    std::lock_guard<std::mutex> lock(m_mutex);

    std::string formatted = m_formatter->format(entry);
    if (entry.level >= LogLevel::ERROR_LEVEL) {
        std::cerr << formatted;
    } else {
        std::cout << formatted;
    }
}

void ConsoleLogSink::flush() {
    std::cout.flush();
    std::cerr.flush();
}

// RotatingFileLogSink implementation
RotatingFileLogSink::RotatingFileLogSink(const Config& config,
                                         std::shared_ptr<ILogFormatter> formatter)
    : m_config(config), m_formatter(formatter), m_current_size(0) {
    fs::path parent = fs::path(m_config.base_path).parent_path();
    if (!parent.empty()) {
        std::error_code ec;
        fs::create_directories(parent, ec);
    }
    openNewFile();
}

RotatingFileLogSink::~RotatingFileLogSink() {
    if (m_file && m_file->is_open()) {
        m_file->close();
    }
}

void RotatingFileLogSink::write(const LogEntry& entry) {
    std::lock_guard<std::mutex> lock(m_mutex);

    if (!m_file || !m_file->is_open()) {
        openNewFile();
        if (!m_file->is_open()) {
            return;
        }
    }

    std::string formatted = m_formatter->format(entry);
    *m_file << formatted;
    m_current_size += formatted.size();

    rotateIfNeeded();
}

void RotatingFileLogSink::flush() {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_file && m_file->is_open()) {
        m_file->flush();
    }
}

void RotatingFileLogSink::rotateIfNeeded() {
    if (m_current_size < m_config.max_file_size) {
        return;
    }

    m_file->close();
    std::error_code ec;

    // Shift app.N.log -> app.N+1.log, dropping the oldest
    for (size_t i = m_config.max_files; i-- > 1;) {
        std::string older = generateFileName(i);
        if (i + 1 >= m_config.max_files) {
            fs::remove(older, ec);
            continue;
        }
        if (fs::exists(older, ec)) {
            fs::rename(older, generateFileName(i + 1), ec);
        }
    }
    if (m_config.max_files > 1) {
        fs::rename(m_config.base_path, generateFileName(1), ec);
    } else {
        fs::remove(m_config.base_path, ec);
    }

    openNewFile();
}

void RotatingFileLogSink::openNewFile() {
    m_file = std::make_unique<std::ofstream>(m_config.base_path, std::ios::app);
    std::error_code ec;
    auto size = fs::file_size(m_config.base_path, ec);
    m_current_size = ec ? 0 : static_cast<size_t>(size);
}

std::string RotatingFileLogSink::generateFileName(size_t index) const {
    if (index == 0) {
        return m_config.base_path;
    }

    fs::path p(m_config.base_path);
    std::string stem = p.stem().string();
    std::string ext = p.extension().string();

    return (p.parent_path() / (stem + "." + std::to_string(index) + ext)).string();
}

// MemoryLogSink implementation
MemoryLogSink::MemoryLogSink(size_t capacity) : m_capacity(capacity == 0 ? 1 : capacity) {}

void MemoryLogSink::write(const LogEntry& entry) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_entries.push_back(entry);
    while (m_entries.size() > m_capacity) {
        m_entries.pop_front();
    }
}

std::vector<LogEntry> MemoryLogSink::entries() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return std::vector<LogEntry>(m_entries.begin(), m_entries.end());
}

size_t MemoryLogSink::count(LogLevel minLevel) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return static_cast<size_t>(std::count_if(m_entries.begin(), m_entries.end(),
        [minLevel](const LogEntry& e) { return e.level >= minLevel; }));
}

bool MemoryLogSink::contains(const std::string& messageFragment) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return std::any_of(m_entries.begin(), m_entries.end(), [&](const LogEntry& e) {
        return e.message.find(messageFragment) != std::string::npos;
    });
}

void MemoryLogSink::clear() {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_entries.clear();
}

// StructuredLogger implementation
StructuredLogger& StructuredLogger::getInstance() {
    static StructuredLogger instance;
    return instance;
}

StructuredLogger::StructuredLogger()
    : m_min_level(LogLevel::INFO)
    , m_async_enabled(false)
    , m_stop_async(false)
    , m_shutdown(false) {

    // Add default console sink
    auto formatter = std::make_shared<TextLogFormatter>();
    addSink(std::make_shared<ConsoleLogSink>(formatter));
}

StructuredLogger::~StructuredLogger() {
    shutdown();
}

void StructuredLogger::setLogLevel(LogLevel level) {
    m_min_level = level;
}

LogLevel StructuredLogger::getLogLevel() const {
    return m_min_level.load();
}

void StructuredLogger::addSink(std::shared_ptr<ILogSink> sink) {
    std::lock_guard<std::mutex> lock(m_config_mutex);
    m_sinks.push_back(sink);
}

void StructuredLogger::removeSink(std::shared_ptr<ILogSink> sink) {
    std::lock_guard<std::mutex> lock(m_config_mutex);
    m_sinks.erase(std::remove(m_sinks.begin(), m_sinks.end(), sink), m_sinks.end());
}

void StructuredLogger::clearSinks() {
    std::lock_guard<std::mutex> lock(m_config_mutex);
    m_sinks.clear();
}

void StructuredLogger::setAsyncLogging(bool async) {
    if (m_async_enabled == async) return;

    if (async) {
        m_stop_async = false;
        m_async_enabled = true;
        m_logging_thread = std::thread(&StructuredLogger::asyncLoggingLoop, this);
    } else {
        m_async_enabled = false;
        m_stop_async = true;
        if (m_logging_thread.joinable()) {
            m_logging_thread.join();
        }
    }
}

void StructuredLogger::log(const LogEntry& entry) {
    if (m_shutdown) return;
    if (entry.level < m_min_level.load()) return;

    if (m_async_enabled && m_log_queue.push(entry)) {
        return;
    }
    processLogEntry(entry);
}

void StructuredLogger::shutdown() {
    if (m_shutdown.exchange(true)) {
        return;
    }

    if (m_async_enabled) {
        m_async_enabled = false;
        m_stop_async = true;
        if (m_logging_thread.joinable()) {
            m_logging_thread.join();
        }
    }
    m_log_queue.close();

    std::lock_guard<std::mutex> lock(m_config_mutex);
    for (auto& sink : m_sinks) {
        sink->flush();
    }
}

void StructuredLogger::flush() {
    if (m_async_enabled) {
        for (int i = 0; i < 200 && !m_log_queue.empty(); ++i) {
            std::this_thread::sleep_for(std::chrono::milliseconds(5));
        }
    }

    std::lock_guard<std::mutex> lock(m_config_mutex);
    for (auto& sink : m_sinks) {
        sink->flush();
    }
}

void StructuredLogger::asyncLoggingLoop() {
    while (!m_stop_async) {
        auto entry_opt = m_log_queue.popFor(std::chrono::milliseconds(50));
        if (entry_opt) {
            processLogEntry(*entry_opt);
        }
    }

    // Drain what was queued before the switch
    while (auto entry_opt = m_log_queue.tryPop()) {
        processLogEntry(*entry_opt);
    }
}

void StructuredLogger::processLogEntry(const LogEntry& entry) {
    std::lock_guard<std::mutex> lock(m_config_mutex);
    for (auto& sink : m_sinks) {
        // Runs from ~LogBuilder; a failing sink must not escape it
        try {
            sink->write(entry);
        } catch (const std::exception& e) {
            std::cerr << "Log sink failed: " << e.what() << std::endl;
        }
    }
}

// LogBuilder implementation
StructuredLogger::LogBuilder::LogBuilder(StructuredLogger* logger, LogLevel level)
    : m_logger(logger) {
    m_entry.level = level;
    m_entry.timestamp = std::chrono::system_clock::now();
    m_entry.thread_id = std::this_thread::get_id();
}

StructuredLogger::LogBuilder&
StructuredLogger::LogBuilder::message(const std::string& msg) {
    m_entry.message = msg;
    return *this;
}

StructuredLogger::LogBuilder&
StructuredLogger::LogBuilder::context(const std::string& key, const nlohmann::json& value) {
    m_entry.context[key] = value;
    return *this;
}

StructuredLogger::LogBuilder&
StructuredLogger::LogBuilder::file(const char* file, int line) {
    m_entry.file = file;
    m_entry.line = line;
    return *this;
}

StructuredLogger::LogBuilder&
StructuredLogger::LogBuilder::cycle(uint64_t sequence) {
    m_entry.cycle = sequence;
    return *this;
}

StructuredLogger::LogBuilder::~LogBuilder() {
    if (m_logger) {
        m_logger->log(m_entry);
    }
}

} // namespace deskpilot
