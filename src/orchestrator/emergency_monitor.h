#ifndef DESKPILOT_EMERGENCY_MONITOR_H
#define DESKPILOT_EMERGENCY_MONITOR_H

#include <atomic>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>
#include <chrono>
#include <condition_variable>
#include "../common/cancellation.h"

namespace deskpilot {

/**
 * @brief Something the monitor polls for an operator stop request
 */
class EmergencyTriggerSource {
public:
    virtual ~EmergencyTriggerSource() = default;
    virtual std::string name() const = 0;

    // true once the operator asked to stop
    virtual bool poll() = 0;
};

/**
 * @brief Fires after SIGINT or SIGTERM
 *
 * install() registers the process handlers. A second signal exits immediately.
 */
class SignalTriggerSource : public EmergencyTriggerSource {
public:
    static void install();

    std::string name() const override { return "signal"; }
    bool poll() override;
};

#ifdef _WIN32
/**
 * @brief Fires while Ctrl+Shift+Q is held
 */
class HotkeyTriggerSource : public EmergencyTriggerSource {
public:
    std::string name() const override { return "hotkey Ctrl+Shift+Q"; }
    bool poll() override;
};
#endif

/**
 * @brief Watches trigger sources on its own thread and cancels the run token
 *
 * Triggering is idempotent; the first reason is kept.
 */
class EmergencyMonitor {
public:
    EmergencyMonitor(std::shared_ptr<CancellationToken> token,
                     std::chrono::milliseconds pollInterval = std::chrono::milliseconds(25));
    ~EmergencyMonitor();

    EmergencyMonitor(const EmergencyMonitor&) = delete;
    EmergencyMonitor& operator=(const EmergencyMonitor&) = delete;

    void addSource(std::shared_ptr<EmergencyTriggerSource> source);

    void start();
    void stop();
    bool isRunning() const { return m_running; }

    /**
     * @return true if this call raised the flag
     */
    bool trigger(const std::string& reason);

    bool triggered() const { return m_token->isCancelled(); }

private:
    void monitorLoop();

    std::shared_ptr<CancellationToken> m_token;
    std::chrono::milliseconds m_pollInterval;

    std::vector<std::shared_ptr<EmergencyTriggerSource>> m_sources;
    std::mutex m_sourcesMutex;

    std::atomic<bool> m_running;
    std::atomic<bool> m_stopRequested;
    std::mutex m_waitMutex;
    std::condition_variable m_waitCondition;
    std::thread m_thread;
};

} // namespace deskpilot

#endif // DESKPILOT_EMERGENCY_MONITOR_H
