/**
 * @file test_fixtures.h
 * @brief Shared fixtures: fake machine shares and workspace roots on local disk
 */

#ifndef KCENON_LOG_HARVEST_TEST_FIXTURES_H
#define KCENON_LOG_HARVEST_TEST_FIXTURES_H

#include <gtest/gtest.h>

#include <kcenon/log_harvest/log_harvest.h>

#include <algorithm>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <random>
#include <string>
#include <vector>

namespace kcenon::log_harvest::test {

/**
 * @brief Temporary tree with one share directory per fake machine
 *
 * Layout:
 *   <test_dir>/shares/<machine>/<item>/...   remote log directories
 *   <test_dir>/workspaces/                   workspace root
 */
class TempDirectoryFixture : public ::testing::Test {
protected:
    void SetUp() override {
        test_dir_ = std::filesystem::temp_directory_path() /
                    ("log_harvest_test_" + std::to_string(std::random_device{}()));
        share_root_ = test_dir_ / "shares";
        workspace_root_ = test_dir_ / "workspaces";
        std::filesystem::create_directories(share_root_);
        std::filesystem::create_directories(workspace_root_);

        // Keep test output readable
        get_logger().set_console_output(false);
    }

    void TearDown() override {
        get_logger().set_console_output(true);
        std::error_code ec;
        std::filesystem::remove_all(test_dir_, ec);
    }

    /**
     * @brief Share template resolving to <shares>/<machine>/<item>
     */
    auto share_template() const -> std::string {
        return (share_root_ / "{machine}" / "{item}").string();
    }

    auto log_dir(const std::string& machine, const std::string& item) const
        -> std::filesystem::path {
        return share_root_ / machine / item;
    }

    /**
     * @brief Write a log file of random bytes with a write time relative to now
     */
    auto create_log(const std::string& machine,
                    const std::string& item,
                    const std::string& name,
                    std::size_t size,
                    std::chrono::seconds age = std::chrono::seconds{0},
                    uint32_t seed = 42) -> std::filesystem::path {
        auto dir = log_dir(machine, item);
        std::filesystem::create_directories(dir);
        auto path = dir / name;
        write_random_file(path, size, seed);
        std::filesystem::last_write_time(
            path, std::filesystem::file_time_type::clock::now() - age);
        return path;
    }

    static void write_random_file(const std::filesystem::path& path,
                                  std::size_t size,
                                  uint32_t seed = 42) {
        std::ofstream file(path, std::ios::binary | std::ios::trunc);

        std::mt19937 gen(seed);  // Fixed seed for reproducibility
        std::uniform_int_distribution<> dis(0, 255);

        std::vector<char> block(64 * 1024);
        std::size_t written = 0;
        while (written < size) {
            auto n = std::min(block.size(), size - written);
            for (std::size_t i = 0; i < n; ++i) {
                block[i] = static_cast<char>(dis(gen));
            }
            file.write(block.data(), static_cast<std::streamsize>(n));
            written += n;
        }
    }

    static auto read_file(const std::filesystem::path& path) -> std::vector<char> {
        std::ifstream file(path, std::ios::binary);
        return std::vector<char>(std::istreambuf_iterator<char>(file),
                                 std::istreambuf_iterator<char>());
    }

    static auto files_equal(const std::filesystem::path& a, const std::filesystem::path& b)
        -> bool {
        return read_file(a) == read_file(b);
    }

    /**
     * @brief Number of entries directly under the workspace root
     */
    auto workspace_count() const -> std::size_t {
        std::error_code ec;
        if (!std::filesystem::exists(workspace_root_, ec)) {
            return 0;
        }
        return static_cast<std::size_t>(std::distance(
            std::filesystem::directory_iterator(workspace_root_),
            std::filesystem::directory_iterator{}));
    }

    std::filesystem::path test_dir_;
    std::filesystem::path share_root_;
    std::filesystem::path workspace_root_;
};

/**
 * @brief Fixture with an orchestrator wired to the fake shares
 *
 * A small parallel threshold keeps chunked copies fast in tests.
 */
class OrchestratorFixture : public TempDirectoryFixture {
protected:
    static constexpr uint64_t small_threshold = 256 * 1024;

    void SetUp() override {
        TempDirectoryFixture::SetUp();
        orchestrator_ = make_orchestrator(default_builder());
    }

    void TearDown() override {
        orchestrator_.reset();
        TempDirectoryFixture::TearDown();
    }

    auto default_builder() -> harvest_orchestrator::builder {
        harvest_orchestrator::builder builder;
        builder.with_share_template(share_template())
            .with_workspace_root(workspace_root_)
            .with_parallel_threshold(small_threshold)
            .with_chunk_count(4);
        return builder;
    }

    static auto make_orchestrator(harvest_orchestrator::builder builder)
        -> std::unique_ptr<harvest_orchestrator> {
        auto built = builder.build();
        EXPECT_TRUE(built.has_value()) << built.error().message;
        if (!built) {
            return nullptr;
        }
        return std::make_unique<harvest_orchestrator>(std::move(built.value()));
    }

    std::unique_ptr<harvest_orchestrator> orchestrator_;
};

}  // namespace kcenon::log_harvest::test

#endif  // KCENON_LOG_HARVEST_TEST_FIXTURES_H
