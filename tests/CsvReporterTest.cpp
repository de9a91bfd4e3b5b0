#include <gtest/gtest.h>

#include <cmath>
#include <limits>
#include <sstream>

#include "TestSupport.hpp"
#include "loglens/report/CsvReporter.hpp"

using namespace LogLens;
using namespace LogLens::Report;
using Testing::atMinutes;

class CsvReporterTest : public ::testing::Test {
protected:
    static Metrics::MetricResult scalar(const std::string &name, double value) {
        Metrics::MetricResult r;
        r.metricName = name;
        r.windowStart = atMinutes(0);
        r.windowEnd = atMinutes(5);
        r.value = value;
        return r;
    }

    static Anomaly::AnomalyRecord anomaly(Anomaly::Severity severity, std::string explanation) {
        Anomaly::AnomalyRecord a;
        a.metricName = "error_count";
        a.timestamp = atMinutes(5);
        a.value = 10.0;
        a.baselineMean = 3.0;
        a.baselineStd = 1.5;
        a.zScore = 4.5;
        a.direction = Anomaly::Direction::Spike;
        a.severity = severity;
        a.explanation = std::move(explanation);
        return a;
    }

    CsvReporter reporter;
};

TEST_F(CsvReporterTest, ScalarResultRow) {
    reporter.addResult(scalar("error_count", 3.0));
    reporter.addResult(scalar("latency_avg", 12.25));

    std::ostringstream out;
    reporter.writeResults(out);
    EXPECT_EQ(out.str(),
              "metric,window_start,window_end,group,value\r\n"
              "error_count,2024-01-01T00:00:00Z,2024-01-01T00:05:00Z,,3\r\n"
              "latency_avg,2024-01-01T00:00:00Z,2024-01-01T00:05:00Z,,12.25\r\n");
    EXPECT_EQ(reporter.resultRowCount(), 2u);
}

TEST_F(CsvReporterTest, GroupedResultOneRowPerSortedGroup) {
    Metrics::MetricResult r;
    r.metricName = "by_source";
    r.windowStart = atMinutes(0);
    r.windowEnd = atMinutes(10);
    r.groupedValues = {{"worker", 1.0}, {"api", 4.0}, {"db", 2.0}};
    reporter.addResult(r);

    std::ostringstream out;
    reporter.writeResults(out, false);
    EXPECT_EQ(out.str(),
              "by_source,2024-01-01T00:00:00Z,2024-01-01T00:10:00Z,api,4\r\n"
              "by_source,2024-01-01T00:00:00Z,2024-01-01T00:10:00Z,db,2\r\n"
              "by_source,2024-01-01T00:00:00Z,2024-01-01T00:10:00Z,worker,1\r\n");
}

TEST_F(CsvReporterTest, AnomalyRowsQuoteFields) {
    reporter.addAnomaly(anomaly(Anomaly::Severity::High, "error_count spiked, \"badly\""));

    std::ostringstream out;
    reporter.writeAnomalies(out);
    EXPECT_EQ(out.str(),
              "metric,timestamp,value,baseline_mean,baseline_std,z_score,direction,severity,explanation\r\n"
              "error_count,2024-01-01T00:05:00Z,10,3,1.5,4.5,spike,high,"
              "\"error_count spiked, \"\"badly\"\"\"\r\n");
}

TEST_F(CsvReporterTest, InfiniteZScoreIsWritten) {
    auto a = anomaly(Anomaly::Severity::Critical, "flat");
    a.zScore = std::numeric_limits<double>::infinity();
    a.baselineStd = 0.0;
    reporter.addAnomaly(a);

    std::ostringstream out;
    reporter.writeAnomalies(out, false);
    EXPECT_NE(out.str().find(",inf,spike,critical,"), std::string::npos);
}

TEST_F(CsvReporterTest, MinSeverityFiltersAnomalies) {
    reporter.addAnomaly(anomaly(Anomaly::Severity::Low, "low"));
    reporter.addAnomaly(anomaly(Anomaly::Severity::Critical, "critical"));
    reporter.setMinSeverity(Anomaly::Severity::High);

    std::ostringstream out;
    reporter.writeAnomalies(out, false);
    EXPECT_EQ(out.str().find("low"), std::string::npos);
    EXPECT_NE(out.str().find("critical"), std::string::npos);
    EXPECT_EQ(reporter.anomalyCount(), 2u);
}

TEST_F(CsvReporterTest, ClearAndUnwritablePath) {
    reporter.addResult(scalar("a", 1.0));
    reporter.clear();
    EXPECT_EQ(reporter.resultRowCount(), 0u);

    EXPECT_FALSE(reporter.saveResults("/nonexistent/loglens/results.csv"));
}
