#include <benchmark/benchmark.h>

#include <random>
#include <string>
#include <vector>

#include "loglens/anomaly/AnomalyDetector.hpp"
#include "loglens/expr/ExpressionEngine.hpp"
#include "loglens/input/LineParser.hpp"
#include "loglens/metrics/MetricProcessor.hpp"
#include "loglens/metrics/StandardMetrics.hpp"
#include "loglens/utils/Logger.hpp"
#include "loglens/window/Window.hpp"

using namespace LogLens;

// Synthetic event stream: one event every 100ms, mixed levels and sources.
class EventGenerator {
public:
    explicit EventGenerator(size_t seed = 42) : rng_(seed) {}

    std::vector<Core::Event> generate(size_t count) {
        static const std::vector<std::string> sources{"api", "db", "auth", "cache", "worker"};
        std::uniform_int_distribution<int> level_dist(0, 99);
        std::uniform_int_distribution<size_t> source_dist(0, sources.size() - 1);
        std::uniform_real_distribution<double> latency_dist(5.0, 500.0);

        const auto base = Utils::fromMillisSinceEpoch(1704067200000LL);
        std::vector<Core::Event> events;
        events.reserve(count);
        for (size_t i = 0; i < count; ++i) {
            const int roll = level_dist(rng_);
            const auto level = roll < 5 ? Core::EventLevel::Error
                             : roll < 15 ? Core::EventLevel::Warning
                                         : Core::EventLevel::Info;
            events.emplace_back(base + std::chrono::milliseconds(100 * i), level,
                                sources[source_dist(rng_)], "request handled",
                                Core::Metadata{{"latency_ms", latency_dist(rng_)}});
        }
        return events;
    }

private:
    std::mt19937 rng_;
};

static void quietLogs() {
    Utils::getLogger().setLevel(Utils::LogLevel::ERROR);
}

// Admission cost of a sliding window holding about range(0) seconds of values.
static void BM_SlidingWindowAdmit(benchmark::State& state) {
    quietLogs();
    const auto spec = Window::WindowSpec::parse(std::to_string(state.range(0)) + "s", "sliding");
    const auto base = Utils::fromMillisSinceEpoch(1704067200000LL);

    for (auto _ : state) {
        state.PauseTiming();
        auto window = Window::makeWindow(spec);
        state.ResumeTiming();
        for (int i = 0; i < 10000; ++i) {
            benchmark::DoNotOptimize(window->admit(1.0, base + std::chrono::milliseconds(100 * i)));
        }
    }

    state.SetItemsProcessed(state.iterations() * 10000);
}

static void BM_TumblingWindowAdmit(benchmark::State& state) {
    quietLogs();
    const auto spec = Window::WindowSpec::parse("1m", "tumbling");
    const auto base = Utils::fromMillisSinceEpoch(1704067200000LL);

    for (auto _ : state) {
        state.PauseTiming();
        auto window = Window::makeWindow(spec);
        state.ResumeTiming();
        for (int i = 0; i < 10000; ++i) {
            benchmark::DoNotOptimize(window->admit(1.0, base + std::chrono::milliseconds(100 * i)));
        }
    }

    state.SetItemsProcessed(state.iterations() * 10000);
}

// Full filter -> group -> window -> aggregate path with the standard metrics.
static void BM_MetricProcessorThroughput(benchmark::State& state) {
    quietLogs();
    const size_t num_events = state.range(0);

    EventGenerator generator;
    const auto events = generator.generate(num_events);

    for (auto _ : state) {
        state.PauseTiming();
        Metrics::MetricProcessor processor({
            Metrics::errorCountMetric(),
            Metrics::warningRateMetric(),
            Metrics::eventsBySourceMetric(),
            Metrics::eventsByLevelMetric(),
        });
        state.ResumeTiming();
        for (const auto& event : events) {
            benchmark::DoNotOptimize(processor.addEvent(event));
        }
    }

    state.SetItemsProcessed(state.iterations() * num_events);
}

static void BM_PercentileMetric(benchmark::State& state) {
    quietLogs();
    const size_t num_events = state.range(0);

    EventGenerator generator;
    const auto events = generator.generate(num_events);
    Expr::ExpressionEngine engine;

    Metrics::MetricDefinition p95;
    p95.name = "latency_p95";
    p95.filter = engine.compilePredicate("exists(metadata.latency_ms)");
    p95.valueExtractor = engine.compileValue("metadata.latency_ms");
    p95.aggregation = Metrics::Aggregation::percentile(95);
    p95.window = Window::WindowSpec::parse("1m");

    for (auto _ : state) {
        state.PauseTiming();
        Metrics::MetricProcessor processor({p95});
        state.ResumeTiming();
        for (const auto& event : events) {
            benchmark::DoNotOptimize(processor.addEvent(event));
        }
    }

    state.SetItemsProcessed(state.iterations() * num_events);
}

static void BM_AnomalyDetectorAddValue(benchmark::State& state) {
    quietLogs();
    Anomaly::DetectorConfig config;
    config.metricName = "bench";
    config.windowSize = static_cast<size_t>(state.range(0));

    std::mt19937 rng(42);
    std::normal_distribution<double> dist(100.0, 10.0);
    std::vector<double> values(4096);
    for (auto& v : values) {
        v = dist(rng);
    }

    Anomaly::AnomalyDetector detector(config);
    const auto base = Utils::fromMillisSinceEpoch(1704067200000LL);
    size_t i = 0;
    for (auto _ : state) {
        benchmark::DoNotOptimize(detector.addValue(values[i % values.size()], base));
        ++i;
    }

    state.SetItemsProcessed(state.iterations());
}

static void BM_LineParser(benchmark::State& state) {
    quietLogs();
    const std::string line =
        "2024-01-01 00:01:30 ERROR payments: Timeout talking to ledger latency_ms=250.5 retries=3 user=alice";
    Input::LineParser parser;

    for (auto _ : state) {
        benchmark::DoNotOptimize(parser.parseLine(line));
    }

    state.SetItemsProcessed(state.iterations());
    state.SetBytesProcessed(state.iterations() * line.size());
}

BENCHMARK(BM_SlidingWindowAdmit)
    ->Arg(60)
    ->Arg(300)
    ->Arg(3600);

BENCHMARK(BM_TumblingWindowAdmit);

BENCHMARK(BM_MetricProcessorThroughput)
    ->Arg(10000)
    ->Arg(100000);

BENCHMARK(BM_PercentileMetric)
    ->Arg(10000);

BENCHMARK(BM_AnomalyDetectorAddValue)
    ->Arg(20)
    ->Arg(200);

BENCHMARK(BM_LineParser);

BENCHMARK_MAIN();
