/**
 * @file log_harvest.h
 * @brief Main header for the log_harvest library
 * @version 0.1.0
 *
 * Pulls the newest log file of a service off remote machines into local
 * scratch directories.
 *
 * @code
 * #include <kcenon/log_harvest/log_harvest.h>
 *
 * using namespace kcenon::log_harvest;
 *
 * auto registry = std::make_shared<log_file_registry>(default_workspace_root());
 * auto orchestrator = harvest_orchestrator::builder()
 *     .with_registry(registry)
 *     .build();
 *
 * auto results = orchestrator.value().harvest_many({"WEB01", "WEB02"}, "OrderService");
 * @endcode
 */

#ifndef KCENON_LOG_HARVEST_LOG_HARVEST_H
#define KCENON_LOG_HARVEST_LOG_HARVEST_H

#include <cstdint>
#include <string>

// Core types
#include "kcenon/log_harvest/core/types.h"
#include "kcenon/log_harvest/core/harvest_types.h"
#include "kcenon/log_harvest/core/cancellation.h"
#include "kcenon/log_harvest/core/logging.h"

// Building blocks
#include "kcenon/log_harvest/core/remote_file_locator.h"
#include "kcenon/log_harvest/core/sequential_transfer.h"
#include "kcenon/log_harvest/core/chunked_transfer.h"
#include "kcenon/log_harvest/core/workspace.h"
#include "kcenon/log_harvest/core/log_file_registry.h"
#include "kcenon/log_harvest/core/checksum.h"

// Orchestration
#include "kcenon/log_harvest/harvest/harvest_orchestrator.h"

// Adapters
#include "kcenon/log_harvest/adapters/thread_pool_adapter.h"

namespace kcenon::log_harvest {

/**
 * @brief Library version information
 */
struct version {
    static constexpr int major = 0;
    static constexpr int minor = 1;
    static constexpr int patch = 0;

    /**
     * @brief Get version string
     * @return Version string in format "major.minor.patch"
     */
    static std::string to_string() {
        return std::to_string(major) + "." +
               std::to_string(minor) + "." +
               std::to_string(patch);
    }
};

}  // namespace kcenon::log_harvest

#endif  // KCENON_LOG_HARVEST_LOG_HARVEST_H
