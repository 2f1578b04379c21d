#ifndef DESKPILOT_SHUTDOWN_MANAGER_H
#define DESKPILOT_SHUTDOWN_MANAGER_H

#include <atomic>

namespace deskpilot {

/**
 * @brief Process-wide record of operator interrupt signals
 *
 * Only async-signal-safe operations (lock-free atomics) are used so the
 * signal handler can write here directly. The emergency monitor polls it
 * through SignalTriggerSource.
 */
class ShutdownManager {
public:
    static ShutdownManager& getInstance() {
        static ShutdownManager instance;
        return instance;
    }

    void requestShutdown(int signalNumber) {
        m_last_signal = signalNumber;
        m_shutdown_requested = true;
    }

    bool isShutdownRequested() const {
        return m_shutdown_requested.load();
    }

    int lastSignal() const {
        return m_last_signal.load();
    }

    int incrementCtrlCCount() {
        return ++m_ctrl_c_count;
    }

    int getCtrlCCount() const {
        return m_ctrl_c_count.load();
    }

    void reset() {
        m_shutdown_requested = false;
        m_last_signal = 0;
        m_ctrl_c_count = 0;
    }

private:
    ShutdownManager() : m_shutdown_requested(false), m_last_signal(0), m_ctrl_c_count(0) {}

    std::atomic<bool> m_shutdown_requested;
    std::atomic<int> m_last_signal;
    std::atomic<int> m_ctrl_c_count;
};

} // namespace deskpilot

#endif // DESKPILOT_SHUTDOWN_MANAGER_H
