#include <gtest/gtest.h>
#include "zmcp/context.hpp"
#include "zmcp/error.hpp"
#include <atomic>
#include <chrono>
#include <thread>

using namespace zmcp;
using namespace std::chrono_literals;

TEST(Context, RootIsNotCancelled) {
    Context ctx;
    EXPECT_FALSE(ctx.cancelled());
    EXPECT_FALSE(ctx.expired());
    EXPECT_FALSE(ctx.deadline().has_value());
    EXPECT_NO_THROW(ctx.throw_if_cancelled());
}

TEST(Context, CopiesShareCancellation) {
    Context a;
    Context b = a;
    b.cancel();
    EXPECT_TRUE(a.cancelled());
    EXPECT_THROW(a.throw_if_cancelled(), McpCancelledError);
}

TEST(Context, CancelPropagatesToChildrenOnly) {
    Context parent;
    Context child = Context::child_of(parent);
    Context grandchild = Context::child_of(child);

    child.cancel();
    EXPECT_FALSE(parent.cancelled());
    EXPECT_TRUE(child.cancelled());
    EXPECT_TRUE(grandchild.cancelled());

    Context parent2;
    Context child2 = Context::child_of(parent2);
    parent2.cancel();
    EXPECT_TRUE(child2.cancelled());
}

TEST(Context, ChildOfCancelledParentStartsCancelled) {
    Context parent;
    parent.cancel();
    EXPECT_TRUE(Context::child_of(parent).cancelled());
}

TEST(Context, TimeoutExpires) {
    Context root;
    Context ctx = Context::with_timeout(root, 20ms);
    ASSERT_TRUE(ctx.deadline().has_value());
    EXPECT_FALSE(ctx.cancelled());
    std::this_thread::sleep_for(40ms);
    EXPECT_TRUE(ctx.expired());
    EXPECT_TRUE(ctx.cancelled());
    EXPECT_FALSE(root.cancelled());
    EXPECT_THROW(ctx.throw_if_cancelled(), McpCancelledError);
}

TEST(Context, ChildInheritsEarlierDeadline) {
    Context root;
    Context outer = Context::with_timeout(root, 50ms);
    Context inner = Context::with_timeout(outer, 10s);
    EXPECT_EQ(*inner.deadline(), *outer.deadline());
}

TEST(Context, WaitForReturnsFalseOnTimeout) {
    Context ctx;
    auto start = std::chrono::steady_clock::now();
    EXPECT_FALSE(ctx.wait_for(20ms));
    EXPECT_GE(std::chrono::steady_clock::now() - start, 20ms);
}

TEST(Context, WaitForWakesOnCancel) {
    Context ctx;
    std::thread canceller([ctx] {
        std::this_thread::sleep_for(20ms);
        ctx.cancel();
    });
    auto start = std::chrono::steady_clock::now();
    EXPECT_TRUE(ctx.wait_for(5s));
    EXPECT_LT(std::chrono::steady_clock::now() - start, 2s);
    canceller.join();
}

TEST(Context, WaitForWakesOnParentCancel) {
    Context parent;
    Context child = Context::child_of(parent);
    std::thread canceller([parent] {
        std::this_thread::sleep_for(20ms);
        parent.cancel();
    });
    EXPECT_TRUE(child.wait_for(5s));
    canceller.join();
}

TEST(Context, WaitForStopsAtDeadline) {
    Context ctx = Context::with_timeout(Context(), 20ms);
    auto start = std::chrono::steady_clock::now();
    EXPECT_TRUE(ctx.wait_for(5s));
    EXPECT_LT(std::chrono::steady_clock::now() - start, 2s);
}

TEST(Context, OnCancelRunsOnce) {
    Context ctx;
    std::atomic<int> fired{0};
    ctx.on_cancel([&fired] { ++fired; });
    ctx.cancel();
    ctx.cancel();
    EXPECT_EQ(fired.load(), 1);
}

TEST(Context, OnCancelRunsImmediatelyWhenAlreadyCancelled) {
    Context ctx;
    ctx.cancel();
    bool fired = false;
    ctx.on_cancel([&fired] { fired = true; });
    EXPECT_TRUE(fired);
}

TEST(Context, RemoveOnCancel) {
    Context ctx;
    bool fired = false;
    auto handle = ctx.on_cancel([&fired] { fired = true; });
    ctx.remove_on_cancel(handle);
    ctx.cancel();
    EXPECT_FALSE(fired);
}

TEST(Context, DroppedChildrenAreNotRetained) {
    Context parent;
    for (int i = 0; i < 10000; ++i) {
        Context child = Context::child_of(parent);
        (void)child;
    }
    EXPECT_EQ(parent.child_count(), 0u);

    // Pruning happens on the next registration.
    Context kept = Context::with_timeout(parent, 1s);
    EXPECT_EQ(parent.child_count(), 1u);

    // Live children are still cancelled through the parent.
    parent.cancel();
    EXPECT_TRUE(kept.cancelled());
}

TEST(Context, HugeTimeoutSaturates) {
    Context root;
    auto ctx = Context::with_timeout(
        root, std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::hours(24 * 365 * 1000000LL)));
    ASSERT_TRUE(ctx.deadline().has_value());
    EXPECT_EQ(*ctx.deadline(), Context::Clock::time_point::max());
    EXPECT_FALSE(ctx.cancelled());
    EXPECT_FALSE(ctx.wait_for(10ms));
}
