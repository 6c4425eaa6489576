#pragma once

#include <atomic>
#include <condition_variable>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <queue>
#include <stdexcept>
#include <string>
#include <thread>

/**
 * @brief Single worker thread that runs posted tasks one at a time, in order
 *
 * Everything that mutates composer, attempt or generation state runs on this
 * queue; background work communicates back by enqueueing a task.
 */
class SerialTaskQueue
{
public:
    explicit SerialTaskQueue(const std::string &name);
    ~SerialTaskQueue();

    SerialTaskQueue(const SerialTaskQueue &) = delete;
    SerialTaskQueue &operator=(const SerialTaskQueue &) = delete;

    /**
     * @brief Post a task; returns false if the queue has been stopped
     */
    bool enqueue(std::function<void()> task);

    /**
     * @brief Post a task and obtain its result
     */
    template <typename T>
    std::future<T> enqueueWithResult(std::function<T()> task)
    {
        auto promise = std::make_shared<std::promise<T>>();
        std::future<T> future = promise->get_future();
        bool accepted = enqueue([promise, task = std::move(task)]()
                                {
            try
            {
                promise->set_value(task());
            }
            catch (...)
            {
                promise->set_exception(std::current_exception());
            } });
        if (!accepted)
        {
            promise->set_exception(std::make_exception_ptr(std::runtime_error("Task queue stopped")));
        }
        return future;
    }

    /**
     * @brief Block until the queue is empty and no task is running
     */
    void waitForCompletion();

    /**
     * @brief Finish the queued tasks and join the worker
     */
    void stop();

    bool isWorkerThread() const { return std::this_thread::get_id() == worker_.get_id(); }

private:
    void workerLoop();

    std::string name_;
    std::queue<std::function<void()>> tasks_;
    std::mutex mutex_;
    std::condition_variable cv_;
    std::condition_variable idle_cv_;
    bool busy_ = false;
    bool should_stop_ = false;
    std::thread worker_;
};
