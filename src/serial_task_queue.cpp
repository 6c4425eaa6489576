#include "core/serial_task_queue.hpp"
#include "logging/logger.hpp"

SerialTaskQueue::SerialTaskQueue(const std::string &name) : name_(name)
{
    worker_ = std::thread(&SerialTaskQueue::workerLoop, this);
}

SerialTaskQueue::~SerialTaskQueue()
{
    stop();
}

bool SerialTaskQueue::enqueue(std::function<void()> task)
{
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (should_stop_)
        {
            Logger::warn("Task queue '" + name_ + "' is stopped, dropping task");
            return false;
        }
        tasks_.push(std::move(task));
    }
    cv_.notify_one();
    return true;
}

void SerialTaskQueue::waitForCompletion()
{
    std::unique_lock<std::mutex> lock(mutex_);
    idle_cv_.wait(lock, [this]
                  { return tasks_.empty() && !busy_; });
}

void SerialTaskQueue::stop()
{
    {
        std::lock_guard<std::mutex> lock(mutex_);
        should_stop_ = true;
    }
    cv_.notify_all();
    if (worker_.joinable() && !isWorkerThread())
    {
        worker_.join();
    }
}

void SerialTaskQueue::workerLoop()
{
    while (true)
    {
        std::function<void()> task;
        {
            std::unique_lock<std::mutex> lock(mutex_);
            cv_.wait(lock, [this]
                     { return !tasks_.empty() || should_stop_; });

            if (tasks_.empty())
            {
                break;
            }

            task = std::move(tasks_.front());
            tasks_.pop();
            busy_ = true;
        }

        try
        {
            task();
        }
        catch (const std::exception &e)
        {
            Logger::error("Task on queue '" + name_ + "' threw: " + std::string(e.what()));
        }

        {
            std::lock_guard<std::mutex> lock(mutex_);
            busy_ = false;
        }
        idle_cv_.notify_all();
    }

    Logger::debug("Task queue '" + name_ + "' worker exited");
}
