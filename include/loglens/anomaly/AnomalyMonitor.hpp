#pragma once

#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include "loglens/anomaly/AnomalyDetector.hpp"
#include "loglens/metrics/MetricDefinition.hpp"

namespace LogLens
{
    namespace Anomaly
    {
        /**
         * AnomalyMonitor
         *
         * Responsibilities:
         *  - Hold one AnomalyDetector per monitored series.
         *  - Route metric results to their detectors.
         *
         * Design notes:
         *  - Detectors are configured per metric name; disabled configs are skipped.
         *  - A grouped metric gets one detector per group, named
         *    "metric[group]", sharing the metric's configuration.
         *  - Detectors are created lazily on the first value of a series.
         *    Reset drops them, so a reset monitor matches a fresh one.
         */
        class AnomalyMonitor
        {
        public:
            explicit AnomalyMonitor(std::vector<DetectorConfig> configs);

            AnomalyMonitor(const AnomalyMonitor &)            = delete;
            AnomalyMonitor &operator=(const AnomalyMonitor &) = delete;

            /// Score one value of a monitored series; unmonitored metrics return std::nullopt.
            std::optional<AnomalyRecord> addValue(std::string_view metricName,
                                                  double value,
                                                  Utils::TimePoint timestamp);

            /**
             * Score a metric result. The value is timestamped with the
             * window end. Grouped results are scored per group.
             */
            std::vector<AnomalyRecord> observe(const Metrics::MetricResult &result);

            /// Baseline snapshot of every live series, keyed by series name.
            std::map<std::string, BaselineStats> baselineStats() const;

            /// Baseline of one series, if it has a detector.
            std::optional<BaselineStats> baselineStats(std::string_view seriesName) const;

            /// Drop every detector; the configurations are kept.
            void reset();

            /// Drop one metric's detector and all of its group detectors.
            void reset(std::string_view metricName);

            /// Drop the detector of one group, e.g. when the group's window is evicted.
            void forgetGroup(std::string_view metricName, std::string_view group);

            /// Number of live detectors, group detectors included.
            std::size_t detectorCount() const;

            bool isMonitored(std::string_view metricName) const;

            /// Name of the per-group series: "metric[group]".
            static std::string seriesName(std::string_view metricName, std::string_view group);

        private:
            AnomalyDetector *detectorUnlocked(std::string_view metricName, const std::string &series);

        private:
            std::unordered_map<std::string, DetectorConfig>         m_configs;
            std::map<std::string, std::unique_ptr<AnomalyDetector>> m_detectors;
            mutable std::mutex                                      m_mutex;
        };

    } // namespace Anomaly
} // namespace LogLens
