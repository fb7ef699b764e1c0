/**
 * test_deferred.cpp - Tests for Promise/Deferred completion cells
 */

#include <gtest/gtest.h>
#include <rowstream/deferred.hpp>
#include <stdexcept>
#include <string>
#include <vector>

using rowstream::Deferred;
using rowstream::Promise;

TEST(DeferredTest, StartsPending) {
    Promise<bool> p;
    auto d = p.deferred();
    EXPECT_TRUE(d.is_pending());
    EXPECT_FALSE(d.is_settled());
    EXPECT_THROW(d.value(), rowstream::state_error);
}

TEST(DeferredTest, ResolveSetsValue) {
    Promise<int> p;
    auto d = p.deferred();
    p.resolve(42);
    EXPECT_TRUE(d.is_resolved());
    EXPECT_EQ(d.value(), 42);
    EXPECT_EQ(d.error(), nullptr);
}

TEST(DeferredTest, RejectRethrowsOnValue) {
    Promise<int> p;
    auto d = p.deferred();
    p.reject(std::make_exception_ptr(std::runtime_error("boom")));
    EXPECT_TRUE(d.is_rejected());
    EXPECT_THROW(d.value(), std::runtime_error);
    EXPECT_EQ(rowstream::error_message(d.error()), "boom");
}

TEST(DeferredTest, RejectRequiresError) {
    Promise<int> p;
    EXPECT_THROW(p.reject(nullptr), rowstream::state_error);
    EXPECT_TRUE(p.is_pending());
}

TEST(DeferredTest, SettlesOnlyOnce) {
    Promise<int> p;
    p.resolve(1);
    EXPECT_THROW(p.resolve(2), rowstream::state_error);
    EXPECT_THROW(p.reject(std::make_exception_ptr(std::runtime_error("x"))),
                 rowstream::state_error);
    EXPECT_EQ(p.deferred().value(), 1);
}

TEST(DeferredTest, ContinuationsRunInOrderOnSettle) {
    Promise<std::string> p;
    auto d = p.deferred();
    std::vector<std::string> calls;

    d.then([&](const Deferred<std::string>& r) { calls.push_back("a:" + r.value()); });
    d.then([&](const Deferred<std::string>& r) { calls.push_back("b:" + r.value()); });
    EXPECT_TRUE(calls.empty());

    p.resolve("x");
    EXPECT_EQ(calls, (std::vector<std::string>{"a:x", "b:x"}));
}

TEST(DeferredTest, ThenOnSettledRunsImmediately) {
    auto d = rowstream::resolved(true);
    bool called = false;
    d.then([&](const Deferred<bool>& r) { called = r.value(); });
    EXPECT_TRUE(called);
}

TEST(DeferredTest, ContinuationAddedDuringSettleRunsImmediately) {
    Promise<int> p;
    auto d = p.deferred();
    std::vector<int> calls;
    d.then([&](const Deferred<int>& r) {
        calls.push_back(1);
        r.then([&](const Deferred<int>&) { calls.push_back(2); });
        calls.push_back(3);
    });
    p.resolve(0);
    EXPECT_EQ(calls, (std::vector<int>{1, 2, 3}));
}

TEST(DeferredTest, VoidCell) {
    Promise<void> p;
    auto d = p.deferred();
    int calls = 0;
    d.then([&](const Deferred<void>& r) {
        EXPECT_TRUE(r.is_resolved());
        r.get();
        ++calls;
    });
    p.resolve();
    EXPECT_EQ(calls, 1);
    EXPECT_NO_THROW(d.get());
}

TEST(DeferredTest, RejectedFactory) {
    auto d = Deferred<void>::rejected(std::make_exception_ptr(std::logic_error("nope")));
    EXPECT_TRUE(d.is_rejected());
    EXPECT_THROW(d.get(), std::logic_error);
}

TEST(DeferredTest, CopiesShareTheCell) {
    Promise<int> p;
    auto a = p.deferred();
    auto b = a;
    EXPECT_TRUE(a.same_as(b));
    p.resolve(7);
    EXPECT_EQ(b.value(), 7);
    EXPECT_FALSE(a.same_as(rowstream::resolved(7)));
}
