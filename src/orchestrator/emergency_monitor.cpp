#include "emergency_monitor.h"
#include "../common/error_handler.h"
#include "../common/shutdown_manager.h"
#include "../common/structured_logger.h"
#include <csignal>
#include <cstdlib>
#ifdef _WIN32
#include <windows.h>
#endif

namespace deskpilot {

namespace {
#ifdef _WIN32
    BOOL WINAPI consoleHandler(DWORD signal) {
        if (signal == CTRL_C_EVENT || signal == CTRL_BREAK_EVENT) {
            auto& shutdownMgr = ShutdownManager::getInstance();
            if (shutdownMgr.incrementCtrlCCount() == 1) {
                shutdownMgr.requestShutdown(SIGINT);
            } else {
                std::_Exit(1);
            }
            return TRUE;
        }
        return FALSE;
    }
#else
    // Only lock-free atomics and _Exit here
    void signalHandler(int signal) {
        if (signal == SIGINT || signal == SIGTERM) {
            auto& shutdownMgr = ShutdownManager::getInstance();
            if (shutdownMgr.incrementCtrlCCount() == 1) {
                shutdownMgr.requestShutdown(signal);
            } else {
                std::_Exit(1);
            }
        }
    }
#endif
}

void SignalTriggerSource::install() {
    // Create the singleton before a signal can arrive
    ShutdownManager::getInstance();
#ifdef _WIN32
    if (!SetConsoleCtrlHandler(consoleHandler, TRUE)) {
        SLOG_WARNING().message("Could not set console control handler");
    }
#else
    std::signal(SIGINT, signalHandler);
    std::signal(SIGTERM, signalHandler);
#endif
}

bool SignalTriggerSource::poll() {
    return ShutdownManager::getInstance().isShutdownRequested();
}

#ifdef _WIN32
bool HotkeyTriggerSource::poll() {
    return (GetAsyncKeyState(VK_CONTROL) & 0x8000) &&
           (GetAsyncKeyState(VK_SHIFT) & 0x8000) &&
           (GetAsyncKeyState('Q') & 0x8000);
}
#endif

EmergencyMonitor::EmergencyMonitor(std::shared_ptr<CancellationToken> token,
                                   std::chrono::milliseconds pollInterval)
    : m_token(std::move(token))
    , m_pollInterval(pollInterval.count() > 0 ? pollInterval : std::chrono::milliseconds(25))
    , m_running(false)
    , m_stopRequested(false) {
    if (!m_token) {
        DESKPILOT_THROW(ErrorType::CONFIGURATION_ERROR, ErrorSeverity::HIGH,
                        "Emergency monitor needs a cancellation token", "", "EmergencyMonitor");
    }
}

EmergencyMonitor::~EmergencyMonitor() {
    stop();
}

void EmergencyMonitor::addSource(std::shared_ptr<EmergencyTriggerSource> source) {
    std::lock_guard<std::mutex> lock(m_sourcesMutex);
    m_sources.push_back(std::move(source));
}

void EmergencyMonitor::start() {
    if (m_running.exchange(true)) {
        return;
    }
    m_stopRequested = false;
    m_thread = std::thread(&EmergencyMonitor::monitorLoop, this);
}

void EmergencyMonitor::stop() {
    {
        std::lock_guard<std::mutex> lock(m_waitMutex);
        m_stopRequested = true;
    }
    m_waitCondition.notify_all();
    if (m_thread.joinable()) {
        m_thread.join();
    }
    m_running = false;
}

bool EmergencyMonitor::trigger(const std::string& reason) {
    if (!m_token->cancel(reason)) {
        return false;
    }

    DESKPILOT_HANDLE_ERROR(ErrorType::EMERGENCY_STOP, ErrorSeverity::CRITICAL,
                           "Emergency stop triggered", reason, "EmergencyMonitor");
    return true;
}

void EmergencyMonitor::monitorLoop() {
    while (!m_stopRequested) {
        std::vector<std::shared_ptr<EmergencyTriggerSource>> sources;
        {
            std::lock_guard<std::mutex> lock(m_sourcesMutex);
            sources = m_sources;
        }

        if (!m_token->isCancelled()) {
            for (const auto& source : sources) {
                // A failing source is reported and skipped for this round
                bool fired = false;
                DESKPILOT_TRY_CATCH(fired = source->poll(), "EmergencyMonitor:" + source->name());
                if (fired) {
                    trigger(source->name());
                    break;
                }
            }
        }

        std::unique_lock<std::mutex> lock(m_waitMutex);
        m_waitCondition.wait_for(lock, m_pollInterval, [this] { return m_stopRequested.load(); });
    }
}

} // namespace deskpilot
