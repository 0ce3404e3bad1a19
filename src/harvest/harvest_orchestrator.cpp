/**
 * @file harvest_orchestrator.cpp
 * @brief Implementation of the harvest workflow
 */

#include <kcenon/log_harvest/harvest/harvest_orchestrator.h>

#include <kcenon/log_harvest/core/checksum.h>
#include <kcenon/log_harvest/core/chunked_transfer.h>
#include <kcenon/log_harvest/core/logging.h>
#include <kcenon/log_harvest/core/sequential_transfer.h>
#include <kcenon/log_harvest/core/workspace.h>

#include <algorithm>
#include <cctype>
#include <exception>

namespace kcenon::log_harvest {

namespace {

auto is_blank(const std::string& value) -> bool {
    return std::all_of(value.begin(), value.end(),
                       [](unsigned char c) { return std::isspace(c) != 0; });
}

auto check_component(const std::string& value, const char* what) -> result<void> {
    if (is_blank(value)) {
        return unexpected(error{error_code::invalid_request,
                                std::string(what) + " cannot be null or empty."});
    }
    if (value.find_first_of("/\\") != std::string::npos) {
        return unexpected(error{error_code::invalid_request,
                                std::string(what) + " must not contain path separators."});
    }
    if (value == "." || value == "..") {
        return unexpected(error{error_code::invalid_request,
                                std::string(what) + " must not be a relative path component."});
    }
    return {};
}

auto elapsed_since(std::chrono::steady_clock::time_point start) -> std::chrono::milliseconds {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start);
}

auto failed(harvest_result result, const error& err) -> harvest_result {
    result.success = false;
    result.local_file_path.reset();
    result.code = err.code;
    result.error_message = err.message;
    return result;
}

}  // namespace

// ============================================================================
// impl
// ============================================================================

struct harvest_orchestrator::impl {
    harvest_config config;
    remote_file_locator locator;
    std::shared_ptr<adapters::harvest_thread_pool_interface> chunk_pool;
    std::shared_ptr<adapters::harvest_thread_pool_interface> fleet_pool;
    std::shared_ptr<log_file_registry> registry;
    cleanup_observer observer;
    workspace_remover remover;
    std::shared_ptr<transfer_strategy> sequential;
    std::shared_ptr<transfer_strategy> chunked;

    explicit impl(harvest_config cfg)
        : config(std::move(cfg)), locator(config.share_template) {}

    auto run(const harvest_request& request, const cancellation_token& token) const
        -> harvest_result;

    auto run_guarded(const harvest_request& request, const cancellation_token& token) const
        noexcept -> harvest_result;

    auto run_many(const std::vector<std::string>& machines,
                  const std::string& item,
                  const cancellation_token* shared_token) const -> std::vector<harvest_result>;

    auto copy_file(transfer_strategy& strategy,
                   const remote_file_ref& remote,
                   const std::filesystem::path& destination,
                   const cancellation_token& token) const -> result<transfer_stats>;

    void discard(workspace& ws, const harvest_request& request) const;
};

auto harvest_orchestrator::impl::copy_file(transfer_strategy& strategy,
                                           const remote_file_ref& remote,
                                           const std::filesystem::path& destination,
                                           const cancellation_token& token) const
    -> result<transfer_stats> {
    try {
        // Strategies report through result<T>; exceptions here are
        // allocation failures or faults in injected strategies
        return strategy.copy(remote.full_path, destination, remote.size_bytes, token);
    } catch (const std::exception& e) {
        return unexpected(error{error_code::transfer_failed,
                                std::string("Transfer failed: ") + e.what()});
    }
}

void harvest_orchestrator::impl::discard(workspace& ws, const harvest_request& request) const {
    auto dir = ws.path();
    auto removed = ws.discard();
    if (removed) {
        return;
    }

    harvest_log_context ctx;
    ctx.machine = request.machine;
    ctx.item = request.item;
    ctx.local_path = dir.string();
    ctx.error_message = removed.error().message;
    LH_LOG_WARN_CTX(log_category::workspace, "Workspace left behind after failed harvest", ctx);

    if (!observer) {
        return;
    }
    try {
        observer(dir, removed.error().message);
    } catch (const std::exception& e) {
        LH_LOG_WARN(log_category::workspace,
            std::string("Cleanup observer threw: ") + e.what());
    }
}

auto harvest_orchestrator::impl::run(const harvest_request& request,
                                     const cancellation_token& token) const -> harvest_result {
    const auto start = std::chrono::steady_clock::now();

    harvest_result result;
    result.machine_name = request.machine;
    result.item_name = request.item;

    harvest_log_context ctx;
    ctx.machine = request.machine;
    ctx.item = request.item;

    if (auto valid = validate_request(request); !valid) {
        ctx.error_message = valid.error().message;
        LH_LOG_WARN_CTX(log_category::orchestrator, "Harvest request rejected", ctx);
        return failed(std::move(result), valid.error());
    }

    auto ws = workspace::create(config.workspace_root, remover);
    if (!ws) {
        ctx.error_message = ws.error().message;
        LH_LOG_ERROR_CTX(log_category::orchestrator, "Harvest failed", ctx);
        return failed(std::move(result), ws.error());
    }

    auto remote_dir = locator.resolve_remote_path(request.machine, request.item);
    ctx.remote_path = remote_dir.string();
    LH_LOG_DEBUG_CTX(log_category::orchestrator, "Harvest started", ctx);

    auto located = locator.locate(remote_dir);
    if (!located) {
        discard(ws.value(), request);
        result.elapsed = elapsed_since(start);
        ctx.error_message = located.error().message;
        LH_LOG_WARN_CTX(log_category::orchestrator, "Harvest failed", ctx);
        return failed(std::move(result), located.error());
    }

    const auto& remote = located.value();
    result.remote_file = remote;
    ctx.remote_path = remote.full_path.string();
    ctx.file_size = remote.size_bytes;

    const auto destination = ws.value().path() / remote.name;
    result.mode = config.select_mode(remote.size_bytes);
    auto& strategy = result.mode == transfer_mode::chunked ? *chunked : *sequential;

    auto copied = copy_file(strategy, remote, destination, token);
    if (copied) {
        result.bytes_copied = copied.value().bytes_copied;
    }

    if (copied && config.compute_sha256) {
        auto digest = checksum::sha256_file(destination);
        if (!digest) {
            copied = unexpected(digest.error());
        } else {
            result.sha256_hash = digest.value();
        }
    }

    result.elapsed = elapsed_since(start);
    ctx.duration_ms = static_cast<uint64_t>(result.elapsed.count());

    if (!copied) {
        discard(ws.value(), request);
        ctx.error_message = copied.error().message;
        LH_LOG_ERROR_CTX(log_category::orchestrator, "Harvest failed", ctx);
        return failed(std::move(result), copied.error());
    }

    ws.value().release();
    result.success = true;
    result.code = error_code::success;
    result.local_file_path = destination;

    if (registry) {
        registry->register_file(destination);
    }

    ctx.local_path = destination.string();
    ctx.bytes_copied = result.bytes_copied;
    if (result.elapsed.count() > 0) {
        ctx.rate_mbps = (static_cast<double>(result.bytes_copied) / (1024.0 * 1024.0)) /
                        (static_cast<double>(result.elapsed.count()) / 1000.0);
    }
    LH_LOG_INFO_CTX(log_category::orchestrator,
        std::string("Harvest completed (") + to_string(result.mode) + ")", ctx);

    return result;
}

auto harvest_orchestrator::impl::run_guarded(const harvest_request& request,
                                             const cancellation_token& token) const noexcept
    -> harvest_result {
    harvest_result result;
    try {
        result.machine_name = request.machine;
        result.item_name = request.item;
        return run(request, token);
    } catch (const std::exception& e) {
        LH_LOG_ERROR(log_category::orchestrator,
            "Unexpected error harvesting " + request.machine + ": " + e.what());
        return failed(std::move(result),
                      error{error_code::internal_error, std::string("Unexpected error: ") + e.what()});
    } catch (...) {
        LH_LOG_ERROR(log_category::orchestrator,
            "Unexpected non-standard exception harvesting " + request.machine);
        return failed(std::move(result), error{error_code::internal_error, "Unexpected error"});
    }
}

auto harvest_orchestrator::impl::run_many(const std::vector<std::string>& machines,
                                          const std::string& item,
                                          const cancellation_token* shared_token) const
    -> std::vector<harvest_result> {
    std::vector<harvest_result> results(machines.size());
    std::vector<std::future<void>> futures(machines.size());

    LH_LOG_INFO(log_category::orchestrator,
        "Harvesting " + item + " from " + std::to_string(machines.size()) + " machines");

    auto task_failed = [&](std::size_t i, const std::string& reason) {
        harvest_result failure;
        failure.machine_name = machines[i];
        failure.item_name = item;
        results[i] = failed(std::move(failure), error{error_code::internal_error,
                                                      "Harvest task failed: " + reason});
    };

    for (std::size_t i = 0; i < machines.size(); ++i) {
        try {
            futures[i] = fleet_pool->submit_to_stage(
                [this, &results, &machines, &item, shared_token, i]() {
                    harvest_request request{machines[i], item};
                    results[i] = shared_token
                        ? run_guarded(request, *shared_token)
                        : run_guarded(request,
                                      cancellation_token::with_timeout(config.harvest_timeout));
                },
                adapters::machine_harvest_stage);
        } catch (const std::exception& e) {
            task_failed(i, e.what());
        }
    }

    // Tasks reference results and machines; wait for all of them
    for (std::size_t i = 0; i < futures.size(); ++i) {
        if (!futures[i].valid()) {
            continue;
        }
        try {
            futures[i].get();
        } catch (const std::exception& e) {
            task_failed(i, e.what());
        }
    }

    const auto succeeded = std::count_if(results.begin(), results.end(),
                                         [](const harvest_result& r) { return r.success; });
    LH_LOG_INFO(log_category::orchestrator,
        "Fleet harvest of " + item + " finished: " + std::to_string(succeeded) + "/" +
        std::to_string(results.size()) + " succeeded");

    return results;
}

// ============================================================================
// builder
// ============================================================================

harvest_orchestrator::builder::builder() = default;

auto harvest_orchestrator::builder::with_config(harvest_config config) -> builder& {
    config_ = std::move(config);
    return *this;
}

auto harvest_orchestrator::builder::with_share_template(std::string share_template) -> builder& {
    config_.share_template = std::move(share_template);
    return *this;
}

auto harvest_orchestrator::builder::with_workspace_root(std::filesystem::path root) -> builder& {
    config_.workspace_root = std::move(root);
    return *this;
}

auto harvest_orchestrator::builder::with_parallel(bool enable) -> builder& {
    config_.enable_parallel = enable;
    return *this;
}

auto harvest_orchestrator::builder::with_parallel_threshold(uint64_t bytes) -> builder& {
    config_.parallel_threshold = bytes;
    return *this;
}

auto harvest_orchestrator::builder::with_chunk_count(uint32_t count) -> builder& {
    config_.chunks.chunk_count = count;
    return *this;
}

auto harvest_orchestrator::builder::with_min_chunk_bytes(uint64_t bytes) -> builder& {
    config_.chunks.min_chunk_bytes = bytes;
    return *this;
}

auto harvest_orchestrator::builder::with_sequential_buffer_size(std::size_t bytes) -> builder& {
    config_.sequential_buffer_size = bytes;
    return *this;
}

auto harvest_orchestrator::builder::with_timeout(std::chrono::milliseconds timeout) -> builder& {
    config_.harvest_timeout = timeout;
    return *this;
}

auto harvest_orchestrator::builder::with_sha256(bool enable) -> builder& {
    config_.compute_sha256 = enable;
    return *this;
}

auto harvest_orchestrator::builder::with_worker_count(std::size_t count) -> builder& {
    config_.worker_count = count;
    return *this;
}

auto harvest_orchestrator::builder::with_thread_pool(
    std::shared_ptr<adapters::harvest_thread_pool_interface> pool) -> builder& {
    chunk_pool_ = std::move(pool);
    return *this;
}

auto harvest_orchestrator::builder::with_fleet_pool(
    std::shared_ptr<adapters::harvest_thread_pool_interface> pool) -> builder& {
    fleet_pool_ = std::move(pool);
    return *this;
}

auto harvest_orchestrator::builder::with_registry(std::shared_ptr<log_file_registry> registry)
    -> builder& {
    registry_ = std::move(registry);
    return *this;
}

auto harvest_orchestrator::builder::with_cleanup_observer(cleanup_observer observer)
    -> builder& {
    observer_ = std::move(observer);
    return *this;
}

auto harvest_orchestrator::builder::with_workspace_remover(workspace_remover remover)
    -> builder& {
    remover_ = std::move(remover);
    return *this;
}

auto harvest_orchestrator::builder::with_sequential_strategy(
    std::shared_ptr<transfer_strategy> strategy) -> builder& {
    sequential_ = std::move(strategy);
    return *this;
}

auto harvest_orchestrator::builder::with_chunked_strategy(
    std::shared_ptr<transfer_strategy> strategy) -> builder& {
    chunked_ = std::move(strategy);
    return *this;
}

auto harvest_orchestrator::builder::build() -> result<harvest_orchestrator> {
    if (auto valid = config_.validate(); !valid) {
        return unexpected(valid.error());
    }

    get_logger().initialize();

    auto state = std::make_shared<impl>(config_);
    state->registry = registry_;
    state->observer = observer_;
    state->remover = remover_;

    state->chunk_pool = chunk_pool_;
    if (!state->chunk_pool) {
        auto workers = config_.worker_count > 0 ? config_.worker_count
                                                : static_cast<std::size_t>(config_.chunks.chunk_count);
        state->chunk_pool = adapters::harvest_pool_factory::create(workers, "log_harvest_chunks");
    }

    state->fleet_pool = fleet_pool_;
    if (!state->fleet_pool) {
        state->fleet_pool =
            adapters::harvest_pool_factory::create(config_.worker_count, "log_harvest_fleet");
    }

    state->sequential = sequential_;
    if (!state->sequential) {
        state->sequential = std::make_shared<sequential_transfer>(config_.sequential_buffer_size);
    }

    state->chunked = chunked_;
    if (!state->chunked) {
        state->chunked = std::make_shared<chunked_transfer>(config_.chunks, state->chunk_pool);
    }

    LH_LOG_DEBUG(log_category::orchestrator,
        "Orchestrator ready: threshold=" + std::to_string(config_.parallel_threshold) +
        " chunks=" + std::to_string(config_.chunks.chunk_count) +
        " parallel=" + (config_.enable_parallel ? "on" : "off"));

    return harvest_orchestrator{std::move(state)};
}

// ============================================================================
// harvest_orchestrator
// ============================================================================

harvest_orchestrator::harvest_orchestrator(std::shared_ptr<impl> state)
    : impl_(std::move(state)) {}

harvest_orchestrator::harvest_orchestrator(harvest_orchestrator&&) noexcept = default;
auto harvest_orchestrator::operator=(harvest_orchestrator&&) noexcept
    -> harvest_orchestrator& = default;
harvest_orchestrator::~harvest_orchestrator() = default;

auto harvest_orchestrator::validate_request(const harvest_request& request) -> result<void> {
    if (auto machine = check_component(request.machine, "Machine name"); !machine) {
        return machine;
    }
    return check_component(request.item, "Item");
}

auto harvest_orchestrator::harvest(const harvest_request& request) const noexcept
    -> harvest_result {
    harvest_result result;
    try {
        auto token = cancellation_token::with_timeout(impl_->config.harvest_timeout);
        return impl_->run_guarded(request, token);
    } catch (const std::exception& e) {
        return failed(std::move(result),
                      error{error_code::internal_error, std::string("Unexpected error: ") + e.what()});
    }
}

auto harvest_orchestrator::harvest(const harvest_request& request,
                                   const cancellation_token& token) const noexcept
    -> harvest_result {
    return impl_->run_guarded(request, token);
}

auto harvest_orchestrator::harvest_many(const std::vector<std::string>& machines,
                                        const std::string& item) const
    -> std::vector<harvest_result> {
    return impl_->run_many(machines, item, nullptr);
}

auto harvest_orchestrator::harvest_many(const std::vector<std::string>& machines,
                                        const std::string& item,
                                        const cancellation_token& token) const
    -> std::vector<harvest_result> {
    return impl_->run_many(machines, item, &token);
}

auto harvest_orchestrator::harvest_async(harvest_request request) const
    -> std::future<harvest_result> {
    return std::async(std::launch::async, [state = impl_, request = std::move(request)]() {
        auto token = cancellation_token::with_timeout(state->config.harvest_timeout);
        return state->run_guarded(request, token);
    });
}

auto harvest_orchestrator::config() const -> const harvest_config& {
    return impl_->config;
}

auto harvest_orchestrator::locator() const -> const remote_file_locator& {
    return impl_->locator;
}

}  // namespace kcenon::log_harvest
