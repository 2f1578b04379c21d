#include "error_handler.h"
#include "structured_logger.h"
#include <algorithm>
#include <sstream>

namespace deskpilot {

std::string errorTypeToString(ErrorType type) {
    switch (type) {
        case ErrorType::PERCEPTION_FAILURE: return "PERCEPTION_FAILURE";
        case ErrorType::MODEL_UNAVAILABLE: return "MODEL_UNAVAILABLE";
        case ErrorType::MODEL_MALFORMED_RESPONSE: return "MODEL_MALFORMED_RESPONSE";
        case ErrorType::REASONING_EXHAUSTED: return "REASONING_EXHAUSTED";
        case ErrorType::SAFETY_DENIED: return "SAFETY_DENIED";
        case ErrorType::CONFIRMATION_TIMEOUT: return "CONFIRMATION_TIMEOUT";
        case ErrorType::EXECUTION_FAILURE: return "EXECUTION_FAILURE";
        case ErrorType::EMERGENCY_STOP: return "EMERGENCY_STOP";
        case ErrorType::CYCLE_BUDGET_EXCEEDED: return "CYCLE_BUDGET_EXCEEDED";
        case ErrorType::CONFIGURATION_ERROR: return "CONFIGURATION";
        case ErrorType::UNKNOWN_ERROR: return "UNKNOWN";
        default: return "UNKNOWN";
    }
}

std::string errorSeverityToString(ErrorSeverity severity) {
    switch (severity) {
        case ErrorSeverity::LOW: return "LOW";
        case ErrorSeverity::MEDIUM: return "MEDIUM";
        case ErrorSeverity::HIGH: return "HIGH";
        case ErrorSeverity::CRITICAL: return "CRITICAL";
        default: return "UNKNOWN";
    }
}

ErrorHandler& ErrorHandler::getInstance() {
    static ErrorHandler instance;
    return instance;
}

void ErrorHandler::handleError(const ErrorInfo& error) {
    logError(error);
}

void ErrorHandler::handleException(const std::exception& e, const std::string& context) {
    const DeskpilotException* deskpilotError = dynamic_cast<const DeskpilotException*>(&e);
    if (deskpilotError) {
        ErrorInfo info = deskpilotError->getErrorInfo();
        if (info.context.empty()) {
            info.context = context;
        }
        handleError(info);
    } else {
        ErrorInfo error(ErrorType::UNKNOWN_ERROR, ErrorSeverity::HIGH,
                        e.what(), "", context);
        handleError(error);
    }
}

void ErrorHandler::logError(const ErrorInfo& error) {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_errorHistory.push_back(error);
        while (m_errorHistory.size() > m_historyLimit) {
            m_errorHistory.pop_front();
        }
    }

    std::ostringstream logMessage;
    logMessage << "[" << errorTypeToString(error.type) << "] "
               << error.message;
    if (!error.details.empty()) {
        logMessage << " - Details: " << error.details;
    }
    if (!error.context.empty()) {
        logMessage << " - Context: " << error.context;
    }

    const std::string typeName = errorTypeToString(error.type);
    const std::string severityName = errorSeverityToString(error.severity);

    switch (error.severity) {
        case ErrorSeverity::LOW:
            SLOG_DEBUG().message(logMessage.str()).context("error_type", typeName).context("severity", severityName);
            break;
        case ErrorSeverity::MEDIUM:
            SLOG_WARNING().message(logMessage.str()).context("error_type", typeName).context("severity", severityName);
            break;
        case ErrorSeverity::HIGH:
            SLOG_ERROR().message(logMessage.str()).context("error_type", typeName).context("severity", severityName);
            break;
        case ErrorSeverity::CRITICAL:
            SLOG_CRITICAL().message(logMessage.str()).context("error_type", typeName).context("severity", severityName);
            break;
        default:
            SLOG_INFO().message(logMessage.str()).context("error_type", typeName).context("severity", severityName);
            break;
    }
}

std::vector<ErrorInfo> ErrorHandler::getRecentErrors(size_t count) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    size_t start = (m_errorHistory.size() > count) ? m_errorHistory.size() - count : 0;
    return std::vector<ErrorInfo>(m_errorHistory.begin() + static_cast<std::ptrdiff_t>(start),
                                  m_errorHistory.end());
}

size_t ErrorHandler::errorCount(ErrorType type) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return static_cast<size_t>(std::count_if(m_errorHistory.begin(), m_errorHistory.end(),
        [type](const ErrorInfo& e) { return e.type == type; }));
}

void ErrorHandler::clearErrorHistory() {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_errorHistory.clear();
}

void ErrorHandler::setHistoryLimit(size_t limit) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_historyLimit = limit == 0 ? 1 : limit;
    while (m_errorHistory.size() > m_historyLimit) {
        m_errorHistory.pop_front();
    }
}

} // namespace deskpilot
