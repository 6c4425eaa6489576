#include <gtest/gtest.h>
#include <atomic>
#include <vector>
#include "core/serial_task_queue.hpp"

TEST(SerialTaskQueueTest, RunsTasksInOrderOnOneThread)
{
    SerialTaskQueue queue("test-queue");
    std::vector<int> order;
    std::vector<std::thread::id> threads;
    for (int i = 0; i < 50; ++i)
    {
        ASSERT_TRUE(queue.enqueue([&, i]()
                                  {
            order.push_back(i);
            threads.push_back(std::this_thread::get_id()); }));
    }
    queue.waitForCompletion();

    ASSERT_EQ(order.size(), 50u);
    for (int i = 0; i < 50; ++i)
    {
        EXPECT_EQ(order[i], i);
        EXPECT_EQ(threads[i], threads[0]);
    }
    EXPECT_NE(threads[0], std::this_thread::get_id());
}

TEST(SerialTaskQueueTest, ResultsAndExceptionsReachTheFuture)
{
    SerialTaskQueue queue("test-queue");
    std::future<int> value = queue.enqueueWithResult<int>([]()
                                                          { return 42; });
    std::future<int> failure = queue.enqueueWithResult<int>([]() -> int
                                                            { throw std::runtime_error("nope"); });
    EXPECT_EQ(value.get(), 42);
    EXPECT_THROW(failure.get(), std::runtime_error);

    // A throwing task does not kill the worker
    std::future<bool> after = queue.enqueueWithResult<bool>([&queue]()
                                                            { return queue.isWorkerThread(); });
    EXPECT_TRUE(after.get());
}

TEST(SerialTaskQueueTest, StopDrainsThenRejects)
{
    SerialTaskQueue queue("test-queue");
    std::atomic<int> ran{0};
    for (int i = 0; i < 10; ++i)
    {
        queue.enqueue([&]()
                      { ++ran; });
    }
    queue.stop();
    EXPECT_EQ(ran.load(), 10);
    EXPECT_FALSE(queue.enqueue([]() {}));

    std::future<int> rejected = queue.enqueueWithResult<int>([]()
                                                             { return 1; });
    EXPECT_THROW(rejected.get(), std::runtime_error);
}
