#include <agentlink/cancellation.hpp>

#include <atomic>
#include <gtest/gtest.h>
#include <thread>

using agentlink::CancellationSubscription;
using agentlink::CancellationToken;

TEST(CancellationTokenTest, StartsUncancelled)
{
    CancellationToken token;
    EXPECT_FALSE(token.is_cancelled());

    token.cancel();
    EXPECT_TRUE(token.is_cancelled());
}

TEST(CancellationTokenTest, CopiesShareState)
{
    CancellationToken token;
    CancellationToken copy = token;

    copy.cancel();
    EXPECT_TRUE(token.is_cancelled());
}

TEST(CancellationTokenTest, CallbacksRunOnce)
{
    CancellationToken token;
    int calls = 0;
    token.subscribe([&] { ++calls; });

    token.cancel();
    token.cancel();
    EXPECT_EQ(calls, 1);
}

TEST(CancellationTokenTest, SubscribeAfterCancelRunsImmediately)
{
    CancellationToken token;
    token.cancel();

    bool ran = false;
    auto id = token.subscribe([&] { ran = true; });
    EXPECT_TRUE(ran);
    EXPECT_EQ(id, 0u);

    // Unsubscribing an already-run callback is harmless
    token.unsubscribe(id);
}

TEST(CancellationTokenTest, UnsubscribedCallbackDoesNotRun)
{
    CancellationToken token;
    bool ran = false;
    auto id = token.subscribe([&] { ran = true; });
    token.unsubscribe(id);

    token.cancel();
    EXPECT_FALSE(ran);
}

TEST(CancellationTokenTest, CallbackMayCancelAnotherToken)
{
    CancellationToken outer;
    CancellationToken inner;
    outer.subscribe([inner]() mutable { inner.cancel(); });

    outer.cancel();
    EXPECT_TRUE(inner.is_cancelled());
}

TEST(CancellationSubscriptionTest, NullTokenIsNoOp)
{
    bool ran = false;
    {
        CancellationSubscription sub(nullptr, [&] { ran = true; });
    }
    EXPECT_FALSE(ran);
}

TEST(CancellationSubscriptionTest, UnsubscribesOnScopeExit)
{
    CancellationToken token;
    std::atomic<int> calls{0};
    {
        CancellationSubscription sub(&token, [&] { ++calls; });
    }
    token.cancel();
    EXPECT_EQ(calls.load(), 0);

    CancellationToken other;
    {
        CancellationSubscription sub(&other, [&] { ++calls; });
        other.cancel();
    }
    EXPECT_EQ(calls.load(), 1);
}

TEST(CancellationTokenTest, ConcurrentCancelRunsCallbackOnce)
{
    CancellationToken token;
    std::atomic<int> calls{0};
    token.subscribe([&] { ++calls; });

    std::vector<std::thread> threads;
    for (int i = 0; i < 8; ++i)
        threads.emplace_back([token]() mutable { token.cancel(); });
    for (auto& t : threads)
        t.join();

    EXPECT_EQ(calls.load(), 1);
}
