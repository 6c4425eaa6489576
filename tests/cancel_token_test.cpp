#include <gtest/gtest.h>
#include <atomic>
#include <thread>
#include "core/cancel_token.hpp"
#include "core/upload_errors.hpp"

TEST(CancelTokenTest, CopiesShareCancellation)
{
    CancelToken token;
    CancelToken copy = token;
    EXPECT_FALSE(copy.isCancelled());
    token.cancel();
    EXPECT_TRUE(copy.isCancelled());
    EXPECT_TRUE(token == copy);
    EXPECT_FALSE(token == CancelToken());
}

TEST(CancelTokenTest, CallbacksRunOnceAndRegistrationUnregisters)
{
    CancelToken token;
    int fired = 0;
    int removed = 0;
    auto keep = token.onCancel([&]()
                               { ++fired; });
    {
        auto dropped = token.onCancel([&]()
                                      { ++removed; });
    }
    token.cancel();
    token.cancel();
    EXPECT_EQ(fired, 1);
    EXPECT_EQ(removed, 0);
}

TEST(CancelTokenTest, CallbackOnCancelledTokenRunsImmediately)
{
    CancelToken token;
    token.cancel();
    bool ran = false;
    auto registration = token.onCancel([&]()
                                       { ran = true; });
    EXPECT_TRUE(ran);
}

TEST(CancelTokenTest, LinkedTokenFollowsParentOnly)
{
    CancelToken parent;
    auto link = CancelToken::linkedTo(parent);
    CancelToken child = link.first;

    child.cancel();
    EXPECT_FALSE(parent.isCancelled());

    auto second = CancelToken::linkedTo(parent);
    parent.cancel();
    EXPECT_TRUE(second.first.isCancelled());
}

TEST(CancelTokenTest, WaitForIsInterruptedByCancel)
{
    CancelToken token;
    EXPECT_FALSE(token.waitFor(std::chrono::milliseconds(5)));

    std::thread canceller([token]()
                          {
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
        token.cancel(); });
    auto start = std::chrono::steady_clock::now();
    EXPECT_TRUE(token.waitFor(std::chrono::seconds(10)));
    EXPECT_LT(std::chrono::steady_clock::now() - start, std::chrono::seconds(5));
    canceller.join();
}

TEST(CancelTokenTest, ThrowIfCancelledRaisesUploadCanceledError)
{
    CancelToken token;
    EXPECT_NO_THROW(token.throwIfCancelled("append"));
    token.cancel();
    try
    {
        token.throwIfCancelled("append");
        FAIL() << "expected UploadCanceledError";
    }
    catch (const TransportError &e)
    {
        EXPECT_EQ(std::string(e.what()), "Canceled: append");
    }
}

TEST(CancelTokenTest, ResetBeforeCallbackRunsPreventsIt)
{
    CancelToken token;
    std::atomic<bool> second_ran{false};
    auto slow = token.onCancel([]()
                               { std::this_thread::sleep_for(std::chrono::milliseconds(50)); });
    auto second = token.onCancel([&second_ran]()
                                 { second_ran = true; });

    std::thread canceller([token]()
                          { token.cancel(); });
    while (!token.isCancelled())
    {
        std::this_thread::yield();
    }
    second.reset();
    EXPECT_FALSE(second_ran.load());

    canceller.join();
    EXPECT_FALSE(second_ran.load());
}

TEST(CancelTokenTest, ResetWaitsForRunningCallback)
{
    CancelToken token;
    std::atomic<bool> started{false};
    std::atomic<bool> finished{false};
    auto registration = token.onCancel([&started, &finished]()
                                       {
        started = true;
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
        finished = true; });

    std::thread canceller([token]()
                          { token.cancel(); });
    while (!started.load())
    {
        std::this_thread::yield();
    }
    registration.reset();
    EXPECT_TRUE(finished.load());
    canceller.join();
}

TEST(CancelTokenTest, CallbackMayResetItsOwnRegistration)
{
    CancelToken token;
    CancelToken::Registration registration;
    int fired = 0;
    registration = token.onCancel([&]()
                                  {
        ++fired;
        registration.reset(); });
    token.cancel();
    EXPECT_EQ(fired, 1);
}
