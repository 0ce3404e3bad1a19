/**
 * @file test_cancellation.cpp
 * @brief Unit tests for cancellation_token
 */

#include <gtest/gtest.h>

#include <kcenon/log_harvest/core/cancellation.h>

#include <thread>

namespace kcenon::log_harvest::test {

using namespace std::chrono_literals;

TEST(CancellationTokenTest, FreshTokenPassesCheck) {
    cancellation_token token;

    EXPECT_FALSE(token.is_cancelled());
    EXPECT_FALSE(token.is_expired());
    EXPECT_TRUE(token.check().has_value());
}

TEST(CancellationTokenTest, CancelIsSharedByCopies) {
    cancellation_token token;
    auto copy = token;

    copy.cancel();

    EXPECT_TRUE(token.is_cancelled());
    auto check = token.check();
    ASSERT_FALSE(check.has_value());
    EXPECT_EQ(check.error().code, error_code::transfer_cancelled);
}

TEST(CancellationTokenTest, ZeroTimeoutNeverExpires) {
    auto token = cancellation_token::with_timeout(0ms);
    std::this_thread::sleep_for(5ms);

    EXPECT_FALSE(token.is_expired());
    EXPECT_TRUE(token.check().has_value());
}

TEST(CancellationTokenTest, DeadlineExpires) {
    auto token = cancellation_token::with_timeout(1ms);
    std::this_thread::sleep_for(10ms);

    EXPECT_TRUE(token.is_expired());
    auto check = token.check();
    ASSERT_FALSE(check.has_value());
    EXPECT_EQ(check.error().code, error_code::transfer_timeout);
}

TEST(CancellationTokenTest, CancelTakesPrecedenceOverDeadline) {
    auto token = cancellation_token::with_timeout(1ms);
    std::this_thread::sleep_for(10ms);
    token.cancel();

    EXPECT_EQ(token.check().error().code, error_code::transfer_cancelled);
}

}  // namespace kcenon::log_harvest::test
