#include "core/shutdown_manager.hpp"
#include "logging/logger.hpp"
#include <chrono>
#include <vector>

volatile sig_atomic_t ShutdownManager::signal_flag_ = 0;
volatile sig_atomic_t ShutdownManager::signal_num_ = 0;

ShutdownManager &ShutdownManager::getInstance()
{
    static ShutdownManager instance;
    return instance;
}

ShutdownManager::~ShutdownManager()
{
    stopWatcher();
}

void ShutdownManager::installSignalHandlers()
{
    signal(SIGINT, &ShutdownManager::handleSignal);
    signal(SIGTERM, &ShutdownManager::handleSignal);

    startWatcher();
    Logger::debug("ShutdownManager: signal handlers installed");
}

void ShutdownManager::handleSignal(int sig) noexcept
{
    signal_num_ = sig;
    signal_flag_ = 1;
}

void ShutdownManager::startWatcher()
{
    if (watcher_running_.exchange(true))
    {
        return;
    }
    watcher_ = std::thread([this]()
                           {
        while (watcher_running_.load())
        {
            if (signal_flag_)
            {
                int sig = signal_num_;
                signal_flag_ = 0;
                requestShutdown("Signal received", sig);
                break;
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(50));
        } });
}

void ShutdownManager::stopWatcher()
{
    watcher_running_.store(false);
    if (watcher_.joinable() && watcher_.get_id() != std::this_thread::get_id())
    {
        watcher_.join();
    }
}

void ShutdownManager::requestShutdown(const std::string &reason, int signal_number) noexcept
{
    std::map<uint64_t, std::function<void()>> callbacks;
    {
        std::lock_guard<std::mutex> lk(mutex_);
        if (shutdown_requested_.load())
        {
            return;
        }
        reason_ = reason;
        last_signal_.store(signal_number);
        shutdown_requested_.store(true);
        callbacks.swap(callbacks_);
    }

    if (signal_number != 0)
    {
        Logger::info("ShutdownManager: received signal " + std::to_string(signal_number) + ", cancelling in-flight work");
    }
    else
    {
        Logger::info("ShutdownManager: shutdown requested - " + reason);
    }

    for (auto &entry : callbacks)
    {
        try
        {
            entry.second();
        }
        catch (const std::exception &e)
        {
            Logger::error("ShutdownManager: callback failed: " + std::string(e.what()));
        }
    }
}

uint64_t ShutdownManager::addShutdownCallback(std::function<void()> callback)
{
    {
        std::lock_guard<std::mutex> lk(mutex_);
        if (!shutdown_requested_.load())
        {
            uint64_t id = next_callback_id_++;
            callbacks_[id] = std::move(callback);
            return id;
        }
    }
    callback();
    return 0;
}

void ShutdownManager::removeShutdownCallback(uint64_t id)
{
    std::lock_guard<std::mutex> lk(mutex_);
    callbacks_.erase(id);
}

std::string ShutdownManager::getReason() const
{
    std::lock_guard<std::mutex> lk(mutex_);
    return reason_;
}

void ShutdownManager::reset() noexcept
{
    stopWatcher();

    std::lock_guard<std::mutex> lk(mutex_);
    shutdown_requested_.store(false);
    last_signal_.store(0);
    callbacks_.clear();
    reason_.clear();
    signal_flag_ = 0;
    signal_num_ = 0;
}
