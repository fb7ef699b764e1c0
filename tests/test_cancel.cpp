/**
 * test_cancel.cpp - Tests for CancelSource
 */

#include <gtest/gtest.h>
#include <rowstream/cancel.hpp>
#include <stdexcept>
#include <vector>

using rowstream::CancelSource;
using rowstream::CancelToken;

TEST(CancelSourceTest, CallsRegisteredCallbacksOnce) {
    CancelSource source;
    std::vector<int> calls;
    source.on_cancel([&](std::exception_ptr) { calls.push_back(1); });
    source.on_cancel([&](std::exception_ptr) { calls.push_back(2); });
    EXPECT_EQ(source.size(), 2);

    source.cancel();
    source.cancel();

    EXPECT_EQ(calls, (std::vector<int>{1, 2}));
    EXPECT_EQ(source.size(), 0);
    EXPECT_TRUE(source.is_canceled());
}

TEST(CancelSourceTest, DefaultErrorIsCanceledError) {
    CancelSource source;
    std::exception_ptr seen;
    source.on_cancel([&](std::exception_ptr err) { seen = err; });
    source.cancel();

    ASSERT_TRUE(seen);
    EXPECT_EQ(seen, source.err());
    EXPECT_THROW(std::rethrow_exception(seen), rowstream::canceled_error);
}

TEST(CancelSourceTest, CustomError) {
    CancelSource source;
    std::exception_ptr seen;
    source.on_cancel([&](std::exception_ptr err) { seen = err; });
    source.cancel(std::make_exception_ptr(std::runtime_error("deadline exceeded")));
    EXPECT_EQ(rowstream::error_message(seen), "deadline exceeded");
}

TEST(CancelSourceTest, OffRemovesCallback) {
    CancelSource source;
    bool called = false;
    CancelToken token = source.on_cancel([&](std::exception_ptr) { called = true; });
    EXPECT_NE(token, rowstream::kNoCancelToken);

    EXPECT_TRUE(source.off(token));
    EXPECT_FALSE(source.off(token));
    source.cancel();
    EXPECT_FALSE(called);
}

TEST(CancelSourceTest, RegisterAfterCancelFiresImmediately) {
    CancelSource source;
    source.cancel();

    bool called = false;
    CancelToken token = source.on_cancel([&](std::exception_ptr) { called = true; });
    EXPECT_TRUE(called);
    EXPECT_EQ(token, rowstream::kNoCancelToken);
    EXPECT_EQ(source.size(), 0);
}

TEST(CancelSourceTest, CallbackMayRemoveOthers) {
    CancelSource source;
    CancelToken second = 0;
    int calls = 0;
    source.on_cancel([&](std::exception_ptr) {
        ++calls;
        source.off(second);
    });
    second = source.on_cancel([&](std::exception_ptr) { ++calls; });

    source.cancel();
    EXPECT_EQ(calls, 1);
}
