/**
 * @file benchmark_helpers.h
 * @brief Helper utilities for benchmarks
 */

#ifndef KCENON_LOG_HARVEST_BENCHMARKS_BENCHMARK_HELPERS_H
#define KCENON_LOG_HARVEST_BENCHMARKS_BENCHMARK_HELPERS_H

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

namespace kcenon::log_harvest::benchmark {

/**
 * @brief Generates log-like content for benchmark sources
 */
class test_data_generator {
public:
    /**
     * @brief Generate random binary data
     * @param size Size in bytes
     * @param seed Random seed (0 for random)
     */
    static auto generate_random_data(std::size_t size, uint32_t seed = 0)
        -> std::vector<std::byte>;

    /**
     * @brief Generate timestamped text lines resembling an application log
     * @param size Approximate size in bytes
     * @param seed Random seed (0 for random)
     */
    static auto generate_log_lines(std::size_t size, uint32_t seed = 0)
        -> std::vector<std::byte>;
};

/**
 * @brief Fake share tree laid out as <base>/shares/<machine>/<item>
 *
 * Everything below the base directory is removed on destruction.
 */
class fake_share {
public:
    explicit fake_share(const std::filesystem::path& base_dir = {});
    ~fake_share();

    fake_share(const fake_share&) = delete;
    auto operator=(const fake_share&) -> fake_share& = delete;

    /**
     * @brief Place a log file of the given size on a machine's share
     * @return Path of the created file
     */
    auto add_log(const std::string& machine,
                 const std::string& item,
                 const std::string& name,
                 std::size_t size,
                 uint32_t seed = 0) -> std::filesystem::path;

    /**
     * @brief Share template resolving to this tree
     */
    [[nodiscard]] auto share_template() const -> std::string;

    [[nodiscard]] auto workspace_root() const -> std::filesystem::path;

    [[nodiscard]] auto base_dir() const -> const std::filesystem::path&;

    /**
     * @brief Remove every workspace created under workspace_root()
     */
    void clear_workspaces();

private:
    std::filesystem::path base_dir_;
};

/**
 * @brief Format bytes as human-readable string (e.g. "1.50 GB")
 */
auto format_bytes(uint64_t bytes) -> std::string;

/**
 * @brief Format throughput as human-readable string (e.g. "500.00 MB/s")
 */
auto format_throughput(double bytes_per_second) -> std::string;

/**
 * @brief Size constants for benchmarks
 */
namespace sizes {
constexpr std::size_t KB = 1024;
constexpr std::size_t MB = 1024 * KB;
constexpr std::size_t GB = 1024 * MB;

constexpr std::size_t small_log = 512 * KB;     // rotated daily log
constexpr std::size_t threshold = 10 * MB;      // default parallel threshold
constexpr std::size_t large_log = 64 * MB;
constexpr std::size_t xlarge_log = 256 * MB;
}  // namespace sizes

}  // namespace kcenon::log_harvest::benchmark

#endif  // KCENON_LOG_HARVEST_BENCHMARKS_BENCHMARK_HELPERS_H
