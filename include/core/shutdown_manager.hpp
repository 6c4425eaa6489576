#pragma once

#include <atomic>
#include <csignal>
#include <cstdint>
#include <functional>
#include <map>
#include <mutex>
#include <string>
#include <thread>

/**
 * Process-wide shutdown coordination.
 * - Installs async-signal-safe handlers for SIGINT/SIGTERM
 * - A watcher thread turns the signal flag into a shutdown request
 * - Registered callbacks (e.g. cancel in-flight uploads) run once, off the signal path
 */
class ShutdownManager
{
public:
    static ShutdownManager &getInstance();

    void installSignalHandlers();

    // Safe from any thread, not from a signal handler
    void requestShutdown(const std::string &reason, int signal_number = 0) noexcept;

    bool isShutdownRequested() const noexcept { return shutdown_requested_.load(); }

    /**
     * @brief Run @p callback when shutdown is requested; immediately if it already was
     * @return Id for removeShutdownCallback()
     */
    uint64_t addShutdownCallback(std::function<void()> callback);
    void removeShutdownCallback(uint64_t id);

    int getSignalNumber() const noexcept { return last_signal_.load(); }
    std::string getReason() const;

    // Reset state for testing purposes
    void reset() noexcept;

private:
    ShutdownManager() = default;
    ~ShutdownManager();
    ShutdownManager(const ShutdownManager &) = delete;
    ShutdownManager &operator=(const ShutdownManager &) = delete;

    // Async-signal-safe handler (sets only sig_atomic_t flags)
    static void handleSignal(int sig) noexcept;

    void startWatcher();
    void stopWatcher();

    std::atomic<bool> shutdown_requested_{false};
    std::atomic<int> last_signal_{0};
    std::string reason_;
    mutable std::mutex mutex_;

    uint64_t next_callback_id_ = 1;
    std::map<uint64_t, std::function<void()>> callbacks_;

    std::thread watcher_;
    std::atomic<bool> watcher_running_{false};

    static volatile sig_atomic_t signal_flag_;
    static volatile sig_atomic_t signal_num_;
};
