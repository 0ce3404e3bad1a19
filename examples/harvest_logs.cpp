/**
 * @file harvest_logs.cpp
 * @brief Harvest the newest log of one machine and print where it landed
 *
 * This example demonstrates:
 * - Building an orchestrator with a custom share template and threshold
 * - Reading the harvest result and the failure kind
 * - Optional SHA-256 fingerprint and JSON log output
 */

#include <kcenon/log_harvest/log_harvest.h>

#include <chrono>
#include <cstdlib>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <string>

using namespace kcenon::log_harvest;

namespace {

auto format_bytes(uint64_t bytes) -> std::string {
    constexpr uint64_t KB = 1024;
    constexpr uint64_t MB = KB * 1024;
    constexpr uint64_t GB = MB * 1024;

    std::ostringstream oss;
    oss << std::fixed << std::setprecision(2);

    if (bytes >= GB) {
        oss << static_cast<double>(bytes) / static_cast<double>(GB) << " GB";
    } else if (bytes >= MB) {
        oss << static_cast<double>(bytes) / static_cast<double>(MB) << " MB";
    } else if (bytes >= KB) {
        oss << static_cast<double>(bytes) / static_cast<double>(KB) << " KB";
    } else {
        oss << bytes << " bytes";
    }
    return oss.str();
}

}  // namespace

void print_usage(const char* program) {
    std::cout << "Harvest Logs - log_harvest" << std::endl;
    std::cout << std::endl;
    std::cout << "Usage: " << program << " [options] <machine> <item>" << std::endl;
    std::cout << std::endl;
    std::cout << "Options:" << std::endl;
    std::cout << "  -s, --share <template>   Share template with {machine} and {item}" << std::endl;
    std::cout << "  -w, --workspace <dir>    Workspace root (default: <temp>/XceleratorLogs)" << std::endl;
    std::cout << "  -t, --threshold <bytes>  Parallel copy threshold (default: 10485760)" << std::endl;
    std::cout << "  -c, --chunks <n>         Number of parallel ranges (default: 4)" << std::endl;
    std::cout << "  --sequential             Never use the chunked copy" << std::endl;
    std::cout << "  --sha256                 Print a SHA-256 digest of the copy" << std::endl;
    std::cout << "  --json                   Emit structured JSON log lines" << std::endl;
    std::cout << "  --verbose                Log at debug level" << std::endl;
    std::cout << "  --help                   Show this help message" << std::endl;
    std::cout << std::endl;
    std::cout << "Examples:" << std::endl;
    std::cout << "  " << program << " WEB01 OrderService" << std::endl;
    std::cout << "  " << program << " -s \"/mnt/{machine}/logs/{item}\" --sha256 WEB01 OrderService"
              << std::endl;
}

int main(int argc, char* argv[]) {
    harvest_orchestrator::builder builder;
    bool json = false;
    bool verbose = false;
    std::string machine;
    std::string item;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        auto next = [&](const char* name) -> const char* {
            if (++i >= argc) {
                std::cerr << "Error: " << name << " requires an argument" << std::endl;
                std::exit(1);
            }
            return argv[i];
        };

        if (arg == "--help") {
            print_usage(argv[0]);
            return 0;
        } else if (arg == "-s" || arg == "--share") {
            builder.with_share_template(next("--share"));
        } else if (arg == "-w" || arg == "--workspace") {
            builder.with_workspace_root(next("--workspace"));
        } else if (arg == "-t" || arg == "--threshold") {
            builder.with_parallel_threshold(std::strtoull(next("--threshold"), nullptr, 10));
        } else if (arg == "-c" || arg == "--chunks") {
            builder.with_chunk_count(
                static_cast<uint32_t>(std::strtoul(next("--chunks"), nullptr, 10)));
        } else if (arg == "--sequential") {
            builder.with_parallel(false);
        } else if (arg == "--sha256") {
            builder.with_sha256(true);
        } else if (arg == "--json") {
            json = true;
        } else if (arg == "--verbose") {
            verbose = true;
        } else if (!arg.empty() && arg[0] == '-') {
            std::cerr << "Error: Unknown option " << arg << std::endl;
            print_usage(argv[0]);
            return 1;
        } else if (machine.empty()) {
            machine = arg;
        } else if (item.empty()) {
            item = arg;
        } else {
            std::cerr << "Error: Unexpected argument " << arg << std::endl;
            return 1;
        }
    }

    if (machine.empty() || item.empty()) {
        print_usage(argv[0]);
        return 1;
    }

    auto built = builder.build();
    if (!built) {
        std::cerr << "Invalid configuration: " << built.error().message << std::endl;
        return 1;
    }
    auto& orchestrator = built.value();

    get_logger().set_output_format(json ? log_output_format::json : log_output_format::text);
    get_logger().set_level(verbose ? log_level::debug : log_level::info);

    std::cout << "Harvesting " << item << " from " << machine << std::endl;
    std::cout << "  Share: " << orchestrator.locator().resolve_remote_path(machine, item).string()
              << std::endl;

    auto result = orchestrator.harvest({machine, item});
    get_logger().flush();

    if (!result.success) {
        std::cerr << "Harvest failed [" << to_string(result.failure()) << "]: "
                  << result.error_message.value_or("unknown error") << std::endl;
        return 2;
    }

    std::cout << std::endl;
    std::cout << "Harvest completed" << std::endl;
    std::cout << "  Remote file: " << result.remote_file->full_path.string() << std::endl;
    std::cout << "  Local file:  " << result.local_file_path->string() << std::endl;
    std::cout << "  Size:        " << format_bytes(result.bytes_copied) << std::endl;
    std::cout << "  Mode:        " << to_string(result.mode) << std::endl;
    std::cout << "  Time:        " << result.elapsed.count() << " ms" << std::endl;
    if (result.sha256_hash) {
        std::cout << "  SHA-256:     " << *result.sha256_hash << std::endl;
    }

    return 0;
}
