/**
 * @file test_thread_pool_adapter.cpp
 * @brief Unit tests for the harvest worker pools
 */

#include <gtest/gtest.h>

#include <kcenon/log_harvest/adapters/thread_pool_adapter.h>

#include <atomic>
#include <chrono>
#include <memory>
#include <stdexcept>
#include <vector>

namespace kcenon::log_harvest::adapters::test {

using namespace std::chrono_literals;

TEST(StageTrackerTest, CountsPerStage) {
    stage_tracker tracker;

    tracker.increment(chunk_copy_stage);
    tracker.increment(chunk_copy_stage);
    tracker.increment(machine_harvest_stage);
    tracker.decrement(chunk_copy_stage);

    EXPECT_EQ(tracker.count(chunk_copy_stage), 1u);
    EXPECT_EQ(tracker.count(machine_harvest_stage), 1u);
    EXPECT_EQ(tracker.count("unknown"), 0u);
}

TEST(StageTrackerTest, DecrementNeverUnderflows) {
    stage_tracker tracker;

    tracker.decrement(chunk_copy_stage);

    EXPECT_EQ(tracker.count(chunk_copy_stage), 0u);
}

class HarvestPoolTest : public ::testing::Test {
protected:
    void SetUp() override { pool_ = harvest_pool_factory::create(4, "test_pool"); }

    std::shared_ptr<harvest_thread_pool_interface> pool_;
};

TEST_F(HarvestPoolTest, FactoryCreatesRunningPool) {
    ASSERT_NE(pool_, nullptr);
    EXPECT_TRUE(pool_->is_running());
    EXPECT_GT(pool_->worker_count(), 0u);
}

TEST_F(HarvestPoolTest, SubmitRunsTask) {
    std::atomic<int> value{0};

    auto future = pool_->submit([&value]() { value = 42; });
    future.get();

    EXPECT_EQ(value.load(), 42);
}

TEST_F(HarvestPoolTest, ManyTasksAllComplete) {
    std::atomic<int> counter{0};
    std::vector<std::future<void>> futures;

    for (int i = 0; i < 64; ++i) {
        futures.push_back(pool_->submit_to_stage([&counter]() { ++counter; }, chunk_copy_stage));
    }
    for (auto& future : futures) {
        future.get();
    }

    EXPECT_EQ(counter.load(), 64);
    EXPECT_EQ(pool_->pending_tasks(chunk_copy_stage), 0u);
}

TEST_F(HarvestPoolTest, ExceptionReachesFuture) {
    auto future = pool_->submit_to_stage(
        []() { throw std::runtime_error("chunk failed"); }, chunk_copy_stage);

    EXPECT_THROW(future.get(), std::runtime_error);
    EXPECT_EQ(pool_->pending_tasks(chunk_copy_stage), 0u);
}

TEST_F(HarvestPoolTest, StageCountsRunningTasks) {
    std::promise<void> release;
    auto gate = release.get_future().share();

    auto future = pool_->submit_to_stage([gate]() { gate.wait(); }, machine_harvest_stage);

    EXPECT_EQ(pool_->pending_tasks(machine_harvest_stage), 1u);
    EXPECT_EQ(pool_->pending_tasks(chunk_copy_stage), 0u);

    release.set_value();
    future.get();
    EXPECT_EQ(pool_->pending_tasks(machine_harvest_stage), 0u);
}

TEST(AsyncHarvestPoolTest, NestedTasksDoNotStarve) {
    async_harvest_pool pool;
    std::atomic<int> inner_done{0};

    std::vector<std::future<void>> outer;
    for (int i = 0; i < 8; ++i) {
        outer.push_back(pool.submit_to_stage(
            [&pool, &inner_done]() {
                auto inner = pool.submit_to_stage([&inner_done]() { ++inner_done; },
                                                  chunk_copy_stage);
                inner.get();
            },
            machine_harvest_stage));
    }
    for (auto& future : outer) {
        ASSERT_EQ(future.wait_for(10s), std::future_status::ready);
        future.get();
    }

    EXPECT_EQ(inner_done.load(), 8);
    EXPECT_EQ(pool.pending_tasks(), 0u);
}

TEST(HarvestPoolFactoryTest, ReportsBackend) {
#if KCENON_WITH_THREAD_SYSTEM
    EXPECT_TRUE(harvest_pool_factory::has_thread_system());
#else
    EXPECT_FALSE(harvest_pool_factory::has_thread_system());
#endif
}

TEST(HarvestPoolFactoryTest, WorkerCountOnlySizesThreadSystemPool) {
    auto pool = harvest_pool_factory::create(3, "sized_pool");
    ASSERT_NE(pool, nullptr);

#if KCENON_WITH_THREAD_SYSTEM
    EXPECT_EQ(std::dynamic_pointer_cast<async_harvest_pool>(pool), nullptr);
#else
    ASSERT_NE(std::dynamic_pointer_cast<async_harvest_pool>(pool), nullptr);
    EXPECT_EQ(pool->worker_count(), async_harvest_pool{}.worker_count());
#endif
}

}  // namespace kcenon::log_harvest::adapters::test
