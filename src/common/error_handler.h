#ifndef DESKPILOT_ERROR_HANDLER_H
#define DESKPILOT_ERROR_HANDLER_H

#include <string>
#include <exception>
#include <deque>
#include <vector>
#include <mutex>
#include <chrono>

namespace deskpilot {

enum class ErrorType {
    PERCEPTION_FAILURE,
    MODEL_UNAVAILABLE,
    MODEL_MALFORMED_RESPONSE,
    REASONING_EXHAUSTED,
    SAFETY_DENIED,
    CONFIRMATION_TIMEOUT,
    EXECUTION_FAILURE,
    EMERGENCY_STOP,
    CYCLE_BUDGET_EXCEEDED,
    CONFIGURATION_ERROR,
    UNKNOWN_ERROR
};

enum class ErrorSeverity {
    LOW,
    MEDIUM,
    HIGH,
    CRITICAL
};

std::string errorTypeToString(ErrorType type);
std::string errorSeverityToString(ErrorSeverity severity);

struct ErrorInfo {
    ErrorType type;
    ErrorSeverity severity;
    std::string message;
    std::string details;
    std::string context;
    std::chrono::system_clock::time_point timestamp;

    ErrorInfo(ErrorType t, ErrorSeverity s, const std::string& msg,
              const std::string& det = "", const std::string& ctx = "")
        : type(t), severity(s), message(msg), details(det), context(ctx),
          timestamp(std::chrono::system_clock::now()) {}
};

class DeskpilotException : public std::exception {
public:
    explicit DeskpilotException(const ErrorInfo& error) : m_errorInfo(error) {}

    const char* what() const noexcept override {
        return m_errorInfo.message.c_str();
    }

    const ErrorInfo& getErrorInfo() const { return m_errorInfo; }
    ErrorType type() const { return m_errorInfo.type; }

private:
    ErrorInfo m_errorInfo;
};

/**
 * @brief Process-wide error sink
 *
 * Errors reported here are logged through the structured logger and kept in a
 * bounded history for the run report. Nothing is rethrown.
 */
class ErrorHandler {
public:
    static ErrorHandler& getInstance();

    void handleError(const ErrorInfo& error);
    void handleException(const std::exception& e, const std::string& context = "");

    void logError(const ErrorInfo& error);
    std::vector<ErrorInfo> getRecentErrors(size_t count = 10) const;
    size_t errorCount(ErrorType type) const;
    void clearErrorHistory();

    void setHistoryLimit(size_t limit);

private:
    ErrorHandler() = default;
    ~ErrorHandler() = default;
    ErrorHandler(const ErrorHandler&) = delete;
    ErrorHandler& operator=(const ErrorHandler&) = delete;

    mutable std::mutex m_mutex;
    std::deque<ErrorInfo> m_errorHistory;
    size_t m_historyLimit = 1000;
};

// Convenience macros for error handling
#define DESKPILOT_THROW(type, severity, message, details, context) \
    throw deskpilot::DeskpilotException(deskpilot::ErrorInfo(type, severity, message, details, context))

#define DESKPILOT_HANDLE_ERROR(type, severity, message, details, context) \
    deskpilot::ErrorHandler::getInstance().handleError(deskpilot::ErrorInfo(type, severity, message, details, context))

#define DESKPILOT_TRY_CATCH(code, context) \
    try { \
        code; \
    } catch (const std::exception& e) { \
        deskpilot::ErrorHandler::getInstance().handleException(e, context); \
    }

} // namespace deskpilot

#endif // DESKPILOT_ERROR_HANDLER_H
