/**
 * @file bench_transfer_strategies.cpp
 * @brief Benchmarks comparing sequential and chunked copies
 *
 * Used to tune the parallel threshold and chunk count: the chunked copy
 * should overtake the sequential one somewhere around the default 10MB
 * threshold on a network share.
 */

#include <benchmark/benchmark.h>

#include <kcenon/log_harvest/log_harvest.h>

#include "utils/benchmark_helpers.h"

#include <memory>

namespace kcenon::log_harvest::benchmark {

/**
 * @brief Sequential copy throughput by file size
 */
static void BM_Sequential_Copy(::benchmark::State& state) {
    const auto file_size = static_cast<std::size_t>(state.range(0));

    fake_share share;
    auto source = share.add_log("BENCH", "Orders", "app.log", file_size, 42);
    auto destination = share.base_dir() / "copy.log";

    sequential_transfer copier;

    for (auto _ : state) {
        auto result = copier.copy(source, destination, file_size, cancellation_token{});
        if (!result) {
            state.SkipWithError(result.error().message.c_str());
            return;
        }
        ::benchmark::DoNotOptimize(result.value().bytes_copied);
    }

    state.SetBytesProcessed(static_cast<int64_t>(file_size) *
                            static_cast<int64_t>(state.iterations()));
}

/**
 * @brief Chunked copy throughput by file size and chunk count
 */
static void BM_Chunked_Copy(::benchmark::State& state) {
    const auto file_size = static_cast<std::size_t>(state.range(0));
    const auto chunk_count = static_cast<uint32_t>(state.range(1));

    fake_share share;
    auto source = share.add_log("BENCH", "Orders", "app.log", file_size, 42);
    auto destination = share.base_dir() / "copy.log";

    auto pool = adapters::harvest_pool_factory::create(chunk_count, "bench_chunks");
    chunked_transfer copier(chunk_config{chunk_count}, pool);

    for (auto _ : state) {
        auto result = copier.copy(source, destination, file_size, cancellation_token{});
        if (!result) {
            state.SkipWithError(result.error().message.c_str());
            return;
        }
        ::benchmark::DoNotOptimize(result.value().bytes_copied);
    }

    state.SetBytesProcessed(static_cast<int64_t>(file_size) *
                            static_cast<int64_t>(state.iterations()));
    state.counters["chunks"] = static_cast<double>(chunk_count);
}

/**
 * @brief Full harvest including enumeration and workspace handling
 */
static void BM_Harvest_EndToEnd(::benchmark::State& state) {
    const auto file_size = static_cast<std::size_t>(state.range(0));

    fake_share share;
    share.add_log("BENCH", "Orders", "app.log", file_size, 7);

    auto built = harvest_orchestrator::builder()
        .with_share_template(share.share_template())
        .with_workspace_root(share.workspace_root())
        .build();
    if (!built) {
        state.SkipWithError(built.error().message.c_str());
        return;
    }
    get_logger().set_console_output(false);
    auto orchestrator = std::move(built.value());

    for (auto _ : state) {
        auto result = orchestrator.harvest({"BENCH", "Orders"});
        if (!result.success) {
            state.SkipWithError(result.error_message.value_or("harvest failed").c_str());
            return;
        }
        state.PauseTiming();
        share.clear_workspaces();
        state.ResumeTiming();
    }

    state.SetBytesProcessed(static_cast<int64_t>(file_size) *
                            static_cast<int64_t>(state.iterations()));
    get_logger().set_console_output(true);
}

BENCHMARK(BM_Sequential_Copy)
    ->Arg(static_cast<int64_t>(sizes::small_log))
    ->Arg(static_cast<int64_t>(sizes::threshold))
    ->Arg(static_cast<int64_t>(sizes::large_log))
    ->Unit(::benchmark::kMillisecond)
    ->Iterations(10);

BENCHMARK(BM_Chunked_Copy)
    ->Args({static_cast<int64_t>(sizes::threshold), 2})
    ->Args({static_cast<int64_t>(sizes::threshold), 4})
    ->Args({static_cast<int64_t>(sizes::large_log), 4})
    ->Args({static_cast<int64_t>(sizes::large_log), 8})
    ->Args({static_cast<int64_t>(sizes::xlarge_log), 8})
    ->Unit(::benchmark::kMillisecond)
    ->Iterations(5);

BENCHMARK(BM_Harvest_EndToEnd)
    ->Arg(static_cast<int64_t>(sizes::small_log))
    ->Arg(static_cast<int64_t>(sizes::large_log))
    ->Unit(::benchmark::kMillisecond)
    ->Iterations(5);

}  // namespace kcenon::log_harvest::benchmark
