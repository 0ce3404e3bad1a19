/**
 * @file fleet_harvest.cpp
 * @brief Harvest the same log item from several machines at once
 *
 * This example demonstrates:
 * - harvest_many() with results in input order
 * - Tracking harvested files in a log_file_registry
 * - Removing every harvested copy with cleanup_all()
 */

#include <kcenon/log_harvest/log_harvest.h>

#include <iomanip>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

using namespace kcenon::log_harvest;

void print_usage(const char* program) {
    std::cout << "Fleet Harvest - log_harvest" << std::endl;
    std::cout << std::endl;
    std::cout << "Usage: " << program << " [options] <item> <machine> [machine...]" << std::endl;
    std::cout << std::endl;
    std::cout << "Options:" << std::endl;
    std::cout << "  -s, --share <template>   Share template with {machine} and {item}" << std::endl;
    std::cout << "  -w, --workspace <dir>    Workspace root" << std::endl;
    std::cout << "  --cleanup                Delete the harvested copies before exiting" << std::endl;
    std::cout << "  --help                   Show this help message" << std::endl;
}

int main(int argc, char* argv[]) {
    harvest_config config;
    bool cleanup = false;
    std::string item;
    std::vector<std::string> machines;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg == "--help") {
            print_usage(argv[0]);
            return 0;
        } else if (arg == "-s" || arg == "--share") {
            if (++i >= argc) {
                std::cerr << "Error: --share requires an argument" << std::endl;
                return 1;
            }
            config.share_template = argv[i];
        } else if (arg == "-w" || arg == "--workspace") {
            if (++i >= argc) {
                std::cerr << "Error: --workspace requires an argument" << std::endl;
                return 1;
            }
            config.workspace_root = argv[i];
        } else if (arg == "--cleanup") {
            cleanup = true;
        } else if (item.empty()) {
            item = arg;
        } else {
            machines.push_back(arg);
        }
    }

    if (item.empty() || machines.empty()) {
        print_usage(argv[0]);
        return 1;
    }

    auto registry = std::make_shared<log_file_registry>(config.workspace_root);

    auto built = harvest_orchestrator::builder()
        .with_config(config)
        .with_registry(registry)
        .with_cleanup_observer([](const std::filesystem::path& dir, const std::string& reason) {
            std::cerr << "Workspace left behind: " << dir.string() << " (" << reason << ")"
                      << std::endl;
        })
        .build();
    if (!built) {
        std::cerr << "Invalid configuration: " << built.error().message << std::endl;
        return 1;
    }

    auto results = built.value().harvest_many(machines, item);

    std::size_t failures = 0;
    std::cout << std::left;
    for (const auto& r : results) {
        std::cout << std::setw(16) << r.machine_name;
        if (r.success) {
            std::cout << "OK    " << std::setw(10) << to_string(r.mode)
                      << r.local_file_path->string() << std::endl;
        } else {
            ++failures;
            std::cout << "FAIL  " << std::setw(20) << to_string(r.failure())
                      << r.error_message.value_or("") << std::endl;
        }
    }

    std::cout << std::endl
              << (results.size() - failures) << "/" << results.size() << " machines harvested"
              << std::endl;

    if (cleanup) {
        auto stats = registry->cleanup_all();
        std::cout << "Cleanup: " << stats.to_string() << std::endl;
    }

    return failures == 0 ? 0 : 2;
}
