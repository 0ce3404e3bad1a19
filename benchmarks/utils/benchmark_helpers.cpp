/**
 * @file benchmark_helpers.cpp
 * @brief Implementation of benchmark helper utilities
 */

#include "utils/benchmark_helpers.h"

#include <fstream>
#include <iomanip>
#include <random>
#include <sstream>
#include <system_error>

namespace kcenon::log_harvest::benchmark {

auto test_data_generator::generate_random_data(std::size_t size, uint32_t seed)
    -> std::vector<std::byte> {
    std::vector<std::byte> data(size);

    std::mt19937 gen(seed == 0 ? std::random_device{}() : seed);
    std::uniform_int_distribution<uint16_t> dis(0, 255);

    for (auto& byte : data) {
        byte = static_cast<std::byte>(dis(gen));
    }

    return data;
}

auto test_data_generator::generate_log_lines(std::size_t size, uint32_t seed)
    -> std::vector<std::byte> {
    std::vector<std::byte> data;
    data.reserve(size);

    std::mt19937 gen(seed == 0 ? std::random_device{}() : seed);

    static const std::vector<std::string> levels = {"DEBUG", "INFO", "INFO", "INFO", "WARN",
                                                    "ERROR"};
    static const std::vector<std::string> messages = {
        "Order received", "Payment authorized", "Inventory reserved",
        "Shipment scheduled", "Retrying downstream call", "Request timed out",
        "Cache miss for customer profile", "Session closed"};

    std::uniform_int_distribution<std::size_t> level_dis(0, levels.size() - 1);
    std::uniform_int_distribution<std::size_t> message_dis(0, messages.size() - 1);
    std::uniform_int_distribution<int> id_dis(1000, 999999);

    uint64_t second = 0;
    while (data.size() < size) {
        std::ostringstream line;
        line << "2025-01-01 " << std::setfill('0') << std::setw(2) << (second / 3600) % 24 << ':'
             << std::setw(2) << (second / 60) % 60 << ':' << std::setw(2) << second % 60
             << " [" << levels[level_dis(gen)] << "] " << messages[message_dis(gen)]
             << " id=" << id_dis(gen) << '\n';
        ++second;

        for (char c : line.str()) {
            if (data.size() >= size) break;
            data.push_back(static_cast<std::byte>(c));
        }
    }

    return data;
}

fake_share::fake_share(const std::filesystem::path& base_dir) {
    base_dir_ = base_dir.empty()
        ? std::filesystem::temp_directory_path() /
              ("log_harvest_bench_" + std::to_string(std::random_device{}()))
        : base_dir;

    std::error_code ec;
    std::filesystem::create_directories(base_dir_ / "shares", ec);
    std::filesystem::create_directories(workspace_root(), ec);
}

fake_share::~fake_share() {
    std::error_code ec;
    std::filesystem::remove_all(base_dir_, ec);
}

auto fake_share::add_log(const std::string& machine,
                         const std::string& item,
                         const std::string& name,
                         std::size_t size,
                         uint32_t seed) -> std::filesystem::path {
    auto dir = base_dir_ / "shares" / machine / item;
    std::filesystem::create_directories(dir);

    auto path = dir / name;
    auto data = test_data_generator::generate_log_lines(size, seed);
    std::ofstream file(path, std::ios::binary | std::ios::trunc);
    file.write(reinterpret_cast<const char*>(data.data()),
               static_cast<std::streamsize>(data.size()));
    return path;
}

auto fake_share::share_template() const -> std::string {
    return (base_dir_ / "shares" / "{machine}" / "{item}").string();
}

auto fake_share::workspace_root() const -> std::filesystem::path {
    return base_dir_ / "workspaces";
}

auto fake_share::base_dir() const -> const std::filesystem::path& {
    return base_dir_;
}

void fake_share::clear_workspaces() {
    std::error_code ec;
    std::filesystem::remove_all(workspace_root(), ec);
    std::filesystem::create_directories(workspace_root(), ec);
}

auto format_bytes(uint64_t bytes) -> std::string {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(2);

    if (bytes >= sizes::GB) {
        oss << static_cast<double>(bytes) / sizes::GB << " GB";
    } else if (bytes >= sizes::MB) {
        oss << static_cast<double>(bytes) / sizes::MB << " MB";
    } else if (bytes >= sizes::KB) {
        oss << static_cast<double>(bytes) / sizes::KB << " KB";
    } else {
        oss << bytes << " B";
    }

    return oss.str();
}

auto format_throughput(double bytes_per_second) -> std::string {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(2);

    if (bytes_per_second >= sizes::GB) {
        oss << bytes_per_second / sizes::GB << " GB/s";
    } else if (bytes_per_second >= sizes::MB) {
        oss << bytes_per_second / sizes::MB << " MB/s";
    } else if (bytes_per_second >= sizes::KB) {
        oss << bytes_per_second / sizes::KB << " KB/s";
    } else {
        oss << bytes_per_second << " B/s";
    }

    return oss.str();
}

}  // namespace kcenon::log_harvest::benchmark
