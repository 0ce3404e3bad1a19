/**
 * @file test_concurrency.cpp
 * @brief Concurrent harvests sharing one orchestrator
 *
 * This file contains tests for:
 * - Fleet harvests with mixed outcomes
 * - The same machine and item harvested from many threads
 * - Registry cleanup after a burst of harvests
 */

#include "test_fixtures.h"

#include <atomic>
#include <latch>
#include <mutex>
#include <set>
#include <thread>
#include <vector>

namespace kcenon::log_harvest::test {

using namespace std::chrono_literals;

class ConcurrentHarvestTest : public OrchestratorFixture {};

TEST_F(ConcurrentHarvestTest, FleetHarvestWithMixedOutcomes) {
    std::vector<std::string> machines;
    std::vector<std::filesystem::path> sources;
    for (int i = 0; i < 12; ++i) {
        auto machine = "WEB" + std::to_string(i);
        machines.push_back(machine);
        if (i % 4 == 3) {
            // Unreachable machine
            sources.emplace_back();
            continue;
        }
        auto size = (i % 2 == 0) ? small_threshold * 3 : std::size_t{20000};
        sources.push_back(create_log(machine, "Orders", "app.log",
                                     static_cast<std::size_t>(size), 0s,
                                     static_cast<uint32_t>(i)));
    }

    auto results = orchestrator_->harvest_many(machines, "Orders");

    ASSERT_EQ(results.size(), machines.size());
    std::size_t succeeded = 0;
    for (std::size_t i = 0; i < results.size(); ++i) {
        EXPECT_EQ(results[i].machine_name, machines[i]);
        if (i % 4 == 3) {
            EXPECT_FALSE(results[i].success);
            EXPECT_EQ(results[i].code, error_code::path_not_accessible);
            continue;
        }
        ASSERT_TRUE(results[i].success) << machines[i] << ": "
                                        << results[i].error_message.value_or("");
        EXPECT_TRUE(files_equal(sources[i], *results[i].local_file_path));
        ++succeeded;
    }
    EXPECT_EQ(succeeded, 9u);
    EXPECT_EQ(workspace_count(), 9u);
}

TEST_F(ConcurrentHarvestTest, EmptyFleet) {
    auto results = orchestrator_->harvest_many({}, "Orders");
    EXPECT_TRUE(results.empty());
}

TEST_F(ConcurrentHarvestTest, CancelledFleetHarvest) {
    for (int i = 0; i < 4; ++i) {
        create_log("DB" + std::to_string(i), "Orders", "app.log", small_threshold * 2);
    }
    cancellation_token token;
    token.cancel();

    auto results = orchestrator_->harvest_many({"DB0", "DB1", "DB2", "DB3"}, "Orders", token);

    ASSERT_EQ(results.size(), 4u);
    for (const auto& r : results) {
        EXPECT_FALSE(r.success);
        EXPECT_EQ(r.code, error_code::transfer_cancelled);
    }
    EXPECT_EQ(workspace_count(), 0u);
}

TEST_F(ConcurrentHarvestTest, SameFileFromManyThreads) {
    auto source = create_log("WEB01", "Orders", "app.log", small_threshold * 2 + 5);
    constexpr int thread_count = 8;

    std::latch start(thread_count);
    std::mutex mutex;
    std::vector<harvest_result> results;

    std::vector<std::thread> threads;
    for (int i = 0; i < thread_count; ++i) {
        threads.emplace_back([&]() {
            start.arrive_and_wait();
            auto r = orchestrator_->harvest({"WEB01", "Orders"});
            std::lock_guard<std::mutex> lock(mutex);
            results.push_back(std::move(r));
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }

    ASSERT_EQ(results.size(), static_cast<std::size_t>(thread_count));
    std::set<std::string> paths;
    for (const auto& r : results) {
        ASSERT_TRUE(r.success) << r.error_message.value_or("");
        EXPECT_TRUE(files_equal(source, *r.local_file_path));
        paths.insert(r.local_file_path->string());
    }
    EXPECT_EQ(paths.size(), static_cast<std::size_t>(thread_count));
}

TEST_F(ConcurrentHarvestTest, AsyncHarvestsInFlightTogether) {
    std::vector<std::future<harvest_result>> futures;
    for (int i = 0; i < 6; ++i) {
        auto machine = "APP" + std::to_string(i);
        create_log(machine, "Orders", "app.log", 50000, 0s, static_cast<uint32_t>(i));
        futures.push_back(orchestrator_->harvest_async({machine, "Orders"}));
    }

    for (auto& future : futures) {
        ASSERT_EQ(future.wait_for(60s), std::future_status::ready);
        EXPECT_TRUE(future.get().success);
    }
    EXPECT_EQ(workspace_count(), 6u);
}

TEST_F(ConcurrentHarvestTest, RegistryCleansUpBurst) {
    auto registry = std::make_shared<log_file_registry>(workspace_root_);
    auto orchestrator = make_orchestrator(default_builder().with_registry(registry));
    ASSERT_NE(orchestrator, nullptr);

    std::vector<std::string> machines;
    for (int i = 0; i < 5; ++i) {
        machines.push_back("SRV" + std::to_string(i));
        create_log(machines.back(), "Orders", "app.log", 30000);
    }

    auto results = orchestrator->harvest_many(machines, "Orders");
    for (const auto& r : results) {
        ASSERT_TRUE(r.success);
    }
    EXPECT_EQ(registry->tracked_count(), 5u);

    auto stats = registry->cleanup_all();

    EXPECT_EQ(stats.files_deleted, 5u);
    EXPECT_EQ(stats.files_failed, 0u);
    EXPECT_EQ(stats.directories_deleted, 6u);
    EXPECT_FALSE(std::filesystem::exists(workspace_root_));
    EXPECT_EQ(registry->tracked_count(), 0u);
}

}  // namespace kcenon::log_harvest::test
