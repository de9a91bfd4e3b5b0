#include <gtest/gtest.h>

#include <cmath>
#include <string>
#include <vector>

#include "TestSupport.hpp"
#include "loglens/engine/Pipeline.hpp"
#include "loglens/expr/ExpressionEngine.hpp"

using namespace LogLens;
using namespace LogLens::Engine;
using Core::EventLevel;
using Testing::atMinutes;
using Testing::atSeconds;
using Testing::makeEvent;

class PipelineTest : public ::testing::Test {
protected:
    Metrics::MetricDefinition errorsPerMinute() {
        Metrics::MetricDefinition def;
        def.name = "errors_per_minute";
        def.filter = engine.compilePredicate("level == 'ERROR'");
        def.aggregation = Metrics::Aggregation::count();
        def.window = Window::WindowSpec::parse("1m", "tumbling");
        return def;
    }

    static Anomaly::DetectorConfig detectorFor(const std::string &metric, std::size_t minSamples = 3) {
        Anomaly::DetectorConfig config;
        config.metricName = metric;
        config.minSamples = minSamples;
        return config;
    }

    // n ERROR events spread over the given minute.
    static void emitErrors(Pipeline &pipeline, long long minute, int n, PipelineOutput *last = nullptr) {
        for (int i = 0; i < n; ++i) {
            auto out = pipeline.process(makeEvent(atMinutes(minute) + std::chrono::seconds(i), EventLevel::Error));
            if (last) {
                *last = std::move(out);
            }
        }
    }

    Expr::ExpressionEngine engine;
};

TEST_F(PipelineTest, SpikeInErrorRateRaisesAnomaly) {
    Pipeline pipeline({errorsPerMinute()}, {detectorFor("errors_per_minute")});

    std::vector<Metrics::MetricResult> seenResults;
    std::vector<Anomaly::AnomalyRecord> seenAnomalies;
    pipeline.setResultSink([&](const Metrics::MetricResult &r) { seenResults.push_back(r); });
    pipeline.setAnomalySink([&](const Anomaly::AnomalyRecord &a) { seenAnomalies.push_back(a); });

    for (long long minute = 0; minute < 5; ++minute) {
        emitErrors(pipeline, minute, 2);
    }
    emitErrors(pipeline, 5, 20);
    EXPECT_TRUE(seenAnomalies.empty());

    // The first event of minute 6 closes minute 5.
    auto output = pipeline.process(makeEvent(atMinutes(6), EventLevel::Error));
    ASSERT_EQ(output.results.size(), 1u);
    EXPECT_DOUBLE_EQ(*output.results[0].value, 20.0);
    ASSERT_EQ(output.anomalies.size(), 1u);

    const auto &anomaly = output.anomalies[0];
    EXPECT_EQ(anomaly.metricName, "errors_per_minute");
    EXPECT_EQ(anomaly.timestamp, atMinutes(6));
    EXPECT_EQ(anomaly.direction, Anomaly::Direction::Spike);
    EXPECT_TRUE(std::isinf(anomaly.zScore));
    EXPECT_EQ(anomaly.severity, Anomaly::Severity::Critical);

    EXPECT_EQ(seenResults.size(), 6u);
    ASSERT_EQ(seenAnomalies.size(), 1u);
    EXPECT_DOUBLE_EQ(seenAnomalies[0].value, 20.0);
}

TEST_F(PipelineTest, FinishFlushesPartialWindows) {
    Pipeline pipeline({errorsPerMinute()}, {});

    emitErrors(pipeline, 0, 3);
    auto output = pipeline.finish();
    ASSERT_EQ(output.results.size(), 1u);
    EXPECT_DOUBLE_EQ(*output.results[0].value, 3.0);
    EXPECT_EQ(output.results[0].windowStart, atMinutes(0));
    EXPECT_EQ(output.results[0].windowEnd, atMinutes(1));
    EXPECT_TRUE(output.anomalies.empty());

    EXPECT_TRUE(pipeline.finish().results.empty());
}

TEST_F(PipelineTest, ResultsAreSortedByMetricName) {
    auto zeta = errorsPerMinute();
    zeta.name = "zeta";
    zeta.window = Window::WindowSpec::parse("5m");
    auto alpha = zeta;
    alpha.name = "alpha";

    Pipeline pipeline({zeta, alpha}, {});
    auto output = pipeline.process(makeEvent(atSeconds(0), EventLevel::Error));
    ASSERT_EQ(output.results.size(), 2u);
    EXPECT_EQ(output.results[0].metricName, "alpha");
    EXPECT_EQ(output.results[1].metricName, "zeta");
}

TEST_F(PipelineTest, GroupedMetricScoredPerGroup) {
    Metrics::MetricDefinition bySource;
    bySource.name = "errors_by_source";
    bySource.filter = engine.compilePredicate("level == 'ERROR'");
    bySource.groupBy = engine.compileGroupKey("source");
    bySource.aggregation = Metrics::Aggregation::count();
    bySource.window = Window::WindowSpec::parse("1m", "tumbling");

    Pipeline pipeline({bySource}, {detectorFor("errors_by_source")});

    std::vector<Anomaly::AnomalyRecord> anomalies;
    pipeline.setAnomalySink([&](const Anomaly::AnomalyRecord &a) { anomalies.push_back(a); });

    // db fails once a minute, then ten times in minute 4.
    for (long long minute = 0; minute < 4; ++minute) {
        pipeline.process(makeEvent(atMinutes(minute), EventLevel::Error, "db"));
    }
    for (int i = 0; i < 10; ++i) {
        pipeline.process(makeEvent(atMinutes(4) + std::chrono::seconds(i), EventLevel::Error, "db"));
    }
    pipeline.process(makeEvent(atMinutes(5), EventLevel::Error, "db"));

    ASSERT_EQ(anomalies.size(), 1u);
    EXPECT_EQ(anomalies[0].metricName, "errors_by_source[db]");
    EXPECT_DOUBLE_EQ(anomalies[0].value, 10.0);
    EXPECT_TRUE(pipeline.monitor().baselineStats("errors_by_source[db]").has_value());
}

TEST_F(PipelineTest, GroupCapBoundsPerGroupDetectors) {
    Metrics::MetricDefinition bySource;
    bySource.name = "by_source";
    bySource.filter = engine.compilePredicate("true");
    bySource.groupBy = engine.compileGroupKey("source");
    bySource.aggregation = Metrics::Aggregation::count();
    bySource.window = Window::WindowSpec::parse("1m", "sliding");
    bySource.maxGroups = 2;

    Pipeline pipeline({bySource}, {detectorFor("by_source")});

    for (int i = 0; i < 1000; ++i) {
        pipeline.process(makeEvent(atSeconds(i), EventLevel::Info, "source-" + std::to_string(i)));
    }

    EXPECT_EQ(pipeline.processor().groupCount("by_source"), 2u);
    EXPECT_EQ(pipeline.processor().statistics().groupsEvicted, 998u);
    const auto stats = pipeline.monitor().baselineStats();
    EXPECT_LE(stats.size(), 2u);
    EXPECT_TRUE(stats.count("by_source[source-999]"));
    EXPECT_TRUE(stats.count("by_source[source-998]"));
    EXPECT_FALSE(stats.count("by_source[source-0]"));
}

TEST_F(PipelineTest, BuildsFromEngineConfig) {
    Utils::ConfigLoader loader;
    loader.loadFromString(R"(
metric.errors.filter      = level == 'ERROR'
metric.errors.aggregation = count
metric.errors.window      = 5m
anomaly.errors.min_samples = 2
)");

    Pipeline pipeline(EngineConfig::fromLoader(loader, engine));
    EXPECT_TRUE(pipeline.monitor().isMonitored("errors"));
    ASSERT_EQ(pipeline.processor().metricNames().size(), 1u);

    auto output = pipeline.process(makeEvent(atSeconds(0), EventLevel::Error));
    ASSERT_EQ(output.results.size(), 1u);
    EXPECT_DOUBLE_EQ(*pipeline.processor().getMetric("errors")->value, 1.0);
}
