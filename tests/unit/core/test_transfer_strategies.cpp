/**
 * @file test_transfer_strategies.cpp
 * @brief Unit tests for the sequential and chunked copy strategies
 */

#include <gtest/gtest.h>

#include <kcenon/log_harvest/core/chunked_transfer.h>
#include <kcenon/log_harvest/core/sequential_transfer.h>

#include "integration/test_fixtures.h"

#include <thread>

namespace kcenon::log_harvest::test {

using namespace std::chrono_literals;

class TransferStrategyTest : public TempDirectoryFixture {
protected:
    void SetUp() override {
        TempDirectoryFixture::SetUp();
        pool_ = std::make_shared<adapters::async_harvest_pool>();
    }

    auto make_source(std::size_t size, uint32_t seed = 7) -> std::filesystem::path {
        auto path = test_dir_ / ("source_" + std::to_string(size) + ".log");
        write_random_file(path, size, seed);
        return path;
    }

    std::shared_ptr<adapters::harvest_thread_pool_interface> pool_;
};

// =============================================================================
// Sequential
// =============================================================================

TEST_F(TransferStrategyTest, SequentialCopiesWholeFile) {
    auto source = make_source(3 * 1024 * 1024 + 123);
    auto dest = test_dir_ / "copy.log";

    sequential_transfer copier(64 * 1024);
    auto stats = copier.copy(source, dest, std::filesystem::file_size(source),
                             cancellation_token{});

    ASSERT_TRUE(stats.has_value()) << stats.error().message;
    EXPECT_EQ(stats.value().bytes_copied, 3u * 1024 * 1024 + 123);
    EXPECT_EQ(stats.value().chunks, 1u);
    EXPECT_TRUE(files_equal(source, dest));
    EXPECT_EQ(copier.mode(), transfer_mode::sequential);
}

TEST_F(TransferStrategyTest, SequentialCopiesEmptyFile) {
    auto source = make_source(0);
    auto dest = test_dir_ / "copy.log";

    sequential_transfer copier;
    auto stats = copier.copy(source, dest, 0, cancellation_token{});

    ASSERT_TRUE(stats.has_value());
    EXPECT_EQ(stats.value().bytes_copied, 0u);
    EXPECT_TRUE(std::filesystem::exists(dest));
    EXPECT_EQ(std::filesystem::file_size(dest), 0u);
}

TEST_F(TransferStrategyTest, SequentialTakesSnapshotOfShrunkFile) {
    auto source = make_source(1000);
    auto dest = test_dir_ / "copy.log";

    sequential_transfer copier(4096);
    auto stats = copier.copy(source, dest, 5000, cancellation_token{});

    ASSERT_TRUE(stats.has_value());
    EXPECT_EQ(stats.value().bytes_copied, 1000u);
    EXPECT_TRUE(files_equal(source, dest));
}

TEST_F(TransferStrategyTest, SequentialMissingSourceFails) {
    sequential_transfer copier;
    auto stats = copier.copy(test_dir_ / "missing.log", test_dir_ / "copy.log", 10,
                             cancellation_token{});

    ASSERT_FALSE(stats.has_value());
    EXPECT_EQ(stats.error().code, error_code::file_open_error);
}

TEST_F(TransferStrategyTest, SequentialReportsFullDestinationDevice) {
    const std::filesystem::path full_device = "/dev/full";
    if (!std::filesystem::exists(full_device)) {
        GTEST_SKIP() << "/dev/full not available";
    }
    auto source = make_source(64 * 1024);

    sequential_transfer copier(4096);
    auto stats = copier.copy(source, full_device, 64 * 1024, cancellation_token{});

    ASSERT_FALSE(stats.has_value());
    EXPECT_EQ(stats.error().code, error_code::file_write_error);
}

TEST_F(TransferStrategyTest, SequentialZeroBufferUsesDefault) {
    sequential_transfer copier(0);
    EXPECT_EQ(copier.buffer_size(), harvest_config::default_sequential_buffer);
}

// =============================================================================
// Chunked
// =============================================================================

TEST_F(TransferStrategyTest, ChunkedCopiesWholeFile) {
    auto source = make_source(2 * 1024 * 1024 + 3);
    auto dest = test_dir_ / "copy.log";

    chunked_transfer copier(chunk_config{4}, pool_);
    auto stats = copier.copy(source, dest, std::filesystem::file_size(source),
                             cancellation_token{});

    ASSERT_TRUE(stats.has_value()) << stats.error().message;
    EXPECT_EQ(stats.value().bytes_copied, 2u * 1024 * 1024 + 3);
    EXPECT_EQ(stats.value().chunks, 4u);
    EXPECT_TRUE(files_equal(source, dest));
    EXPECT_EQ(copier.mode(), transfer_mode::chunked);
}

TEST_F(TransferStrategyTest, ChunkedMatchesSequential) {
    auto source = make_source(1024 * 1024 + 777, 99);
    auto size = std::filesystem::file_size(source);

    sequential_transfer sequential;
    chunked_transfer chunked(chunk_config{7}, pool_);

    ASSERT_TRUE(sequential.copy(source, test_dir_ / "seq.log", size, cancellation_token{}));
    ASSERT_TRUE(chunked.copy(source, test_dir_ / "par.log", size, cancellation_token{}));

    EXPECT_TRUE(files_equal(test_dir_ / "seq.log", test_dir_ / "par.log"));
}

TEST_F(TransferStrategyTest, ChunkedSmallBufferAcrossManyReads) {
    auto source = make_source(300 * 1024 + 1);
    auto dest = test_dir_ / "copy.log";

    chunk_config config{3};
    config.chunk_buffer_size = chunk_config::min_buffer_size;
    chunked_transfer copier(config, pool_);

    auto stats = copier.copy(source, dest, std::filesystem::file_size(source),
                             cancellation_token{});

    ASSERT_TRUE(stats.has_value());
    EXPECT_TRUE(files_equal(source, dest));
}

TEST_F(TransferStrategyTest, ChunkedReportsShortRead) {
    auto source = make_source(1000);
    auto dest = test_dir_ / "copy.log";

    chunked_transfer copier(chunk_config{4}, pool_);
    auto stats = copier.copy(source, dest, 4000, cancellation_token{});

    ASSERT_FALSE(stats.has_value());
    EXPECT_EQ(stats.error().code, error_code::short_read);
    EXPECT_NE(stats.error().message.find(source.string()), std::string::npos);
}

TEST_F(TransferStrategyTest, ChunkedCopiesEmptyFileWithOneTask) {
    auto source = make_source(0);
    auto dest = test_dir_ / "copy.log";

    chunked_transfer copier(chunk_config{4}, pool_);
    auto stats = copier.copy(source, dest, 0, cancellation_token{});

    ASSERT_TRUE(stats.has_value()) << stats.error().message;
    EXPECT_EQ(stats.value().bytes_copied, 0u);
    EXPECT_EQ(stats.value().chunks, 1u);
    EXPECT_EQ(std::filesystem::file_size(dest), 0u);
}

TEST_F(TransferStrategyTest, ChunkedReportsUnwritableDestinationDevice) {
    const std::filesystem::path full_device = "/dev/full";
    if (!std::filesystem::exists(full_device)) {
        GTEST_SKIP() << "/dev/full not available";
    }
    auto source = make_source(64 * 1024);

    chunked_transfer copier(chunk_config{4}, pool_);
    auto stats = copier.copy(source, full_device, 64 * 1024, cancellation_token{});

    ASSERT_FALSE(stats.has_value());
    EXPECT_EQ(stats.error().code, error_code::file_write_error);
}

TEST_F(TransferStrategyTest, ChunkedRejectsInvalidConfig) {
    auto source = make_source(100);

    chunked_transfer copier(chunk_config{0}, pool_);
    auto stats = copier.copy(source, test_dir_ / "copy.log", 100, cancellation_token{});

    ASSERT_FALSE(stats.has_value());
    EXPECT_EQ(stats.error().code, error_code::invalid_configuration);
}

TEST_F(TransferStrategyTest, ChunkedRunsOnChunkStage) {
    auto source = make_source(64 * 1024);

    chunked_transfer copier(chunk_config{4}, pool_);
    ASSERT_TRUE(copier.copy(source, test_dir_ / "copy.log", 64 * 1024, cancellation_token{}));

    // All tasks have been waited for
    EXPECT_EQ(pool_->pending_tasks(adapters::chunk_copy_stage), 0u);
}

TEST_F(TransferStrategyTest, ChunkedDefaultPoolWhenNull) {
    auto source = make_source(10 * 1024);
    auto dest = test_dir_ / "copy.log";

    chunked_transfer copier(chunk_config{2});
    auto stats = copier.copy(source, dest, 10 * 1024, cancellation_token{});

    ASSERT_TRUE(stats.has_value());
    EXPECT_TRUE(files_equal(source, dest));
}

// =============================================================================
// Cancellation
// =============================================================================

TEST_F(TransferStrategyTest, CancelledTokenStopsBothStrategies) {
    auto source = make_source(4096);
    cancellation_token token;
    token.cancel();

    sequential_transfer sequential;
    chunked_transfer chunked(chunk_config{2}, pool_);

    auto a = sequential.copy(source, test_dir_ / "a.log", 4096, token);
    auto b = chunked.copy(source, test_dir_ / "b.log", 4096, token);

    ASSERT_FALSE(a.has_value());
    ASSERT_FALSE(b.has_value());
    EXPECT_EQ(a.error().code, error_code::transfer_cancelled);
    EXPECT_EQ(b.error().code, error_code::transfer_cancelled);
}

TEST_F(TransferStrategyTest, ExpiredDeadlineTimesOut) {
    auto source = make_source(4096);
    auto token = cancellation_token::with_timeout(1ms);
    std::this_thread::sleep_for(10ms);

    chunked_transfer chunked(chunk_config{2}, pool_);
    auto stats = chunked.copy(source, test_dir_ / "copy.log", 4096, token);

    ASSERT_FALSE(stats.has_value());
    EXPECT_EQ(stats.error().code, error_code::transfer_timeout);
}

}  // namespace kcenon::log_harvest::test
