#include <benchmark/benchmark.h>
#include "cpupool/TaskPool.hpp"
#include "cpupool/util/Logger.hpp"
#include "cpupool/util/Sha256.hpp"
#include <future>
#include <memory>
#include <vector>

namespace {

std::shared_ptr<cpupool::HandlerRegistry> benchRegistry() {
    auto reg = std::make_shared<cpupool::HandlerRegistry>();
    reg->registerHandler("noop", [](const std::string& d) { return d; });
    reg->registerHandler("sha", [](const std::string& d) { return cpupool::util::Sha256::hexOf(d); });
    return reg;
}

cpupool::util::Config benchConfig(std::size_t workers) {
    cpupool::util::Config cfg;
    cfg.maxWorkers = workers;
    cfg.enableMetrics = false;
    return cfg;
}

cpupool::Task task(const std::string& type, const std::string& data) {
    cpupool::Task t;
    t.type = type;
    t.data = data;
    return t;
}

} // namespace

// Round trip of one tiny task: submit, dispatch, report, settle.
static void BM_SubmitRoundTrip(benchmark::State& state) {
    cpupool::util::logger().setLevel(cpupool::util::LogLevel::Warn);
    cpupool::TaskPool pool(benchConfig(static_cast<std::size_t>(state.range(0))), benchRegistry());

    for (auto _ : state) {
        benchmark::DoNotOptimize(pool.submit(task("noop", "x")).get());
    }
    state.SetItemsProcessed(state.iterations());
}

BENCHMARK(BM_SubmitRoundTrip)->Arg(1)->Arg(4)->Unit(benchmark::kMicrosecond);

static void BM_BatchOf100(benchmark::State& state) {
    cpupool::util::logger().setLevel(cpupool::util::LogLevel::Warn);
    cpupool::TaskPool pool(benchConfig(static_cast<std::size_t>(state.range(0))), benchRegistry());

    for (auto _ : state) {
        std::vector<cpupool::Task> batch;
        batch.reserve(100);
        for (int i = 0; i < 100; ++i) batch.push_back(task("noop", "x"));
        benchmark::DoNotOptimize(pool.executeBatch(std::move(batch)));
    }
    state.SetItemsProcessed(state.iterations() * 100);
}

BENCHMARK(BM_BatchOf100)->Arg(1)->Arg(2)->Arg(4)->Unit(benchmark::kMicrosecond);

static void BM_ParallelHash(benchmark::State& state) {
    cpupool::util::logger().setLevel(cpupool::util::LogLevel::Warn);
    cpupool::TaskPool pool(benchConfig(static_cast<std::size_t>(state.range(0))), benchRegistry());
    const std::vector<std::string> blobs(16, std::string(256 * 1024, 'z'));

    for (auto _ : state) {
        auto out = pool.parallelMap(blobs, "sha", [](const std::string& b) { return b; });
        benchmark::DoNotOptimize(out);
    }
    state.SetBytesProcessed(state.iterations() * 16 * 256 * 1024);
}

BENCHMARK(BM_ParallelHash)->Arg(1)->Arg(2)->Arg(4)->Unit(benchmark::kMillisecond);

BENCHMARK_MAIN();
