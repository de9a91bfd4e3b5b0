#pragma once

#include <deque>
#include <mutex>
#include <optional>
#include <string>

#include "loglens/anomaly/AnomalyRecord.hpp"
#include "loglens/utils/TimeUtils.hpp"

namespace LogLens
{
    namespace Anomaly
    {
        /// Lower edges of the severity bands, as multiples of the threshold.
        struct SeverityBands
        {
            double medium   = 1.5;
            double high     = 2.0;
            double critical = 3.0;
        };

        struct DetectorConfig
        {
            std::string   metricName;
            std::size_t   windowSize = 20;
            double        threshold  = 2.0;
            std::size_t   minSamples = 5;
            bool          enabled    = true;
            SeverityBands bands;

            /// Throws Core::ConfigurationError on inconsistent parameters.
            void validate() const;
        };

        /**
         * AnomalyDetector
         *
         * Responsibilities:
         *  - Keep a rolling baseline (last windowSize values, FIFO by insertion).
         *  - Score each new value against the baseline that precedes it.
         *  - Flag values whose |z| reaches the threshold.
         *
         * Design notes:
         *  - Population standard deviation over the baseline.
         *  - The first minSamples values only build the baseline.
         *  - A zero-variance baseline flags any value different from its
         *    mean, with an infinite z-score (Critical).
         *  - Every value, flagged or not, joins the baseline afterwards.
         *  - Thread-safe; one instance scores one metric series.
         */
        class AnomalyDetector
        {
        public:
            explicit AnomalyDetector(DetectorConfig config);

            AnomalyDetector(const AnomalyDetector &)            = delete;
            AnomalyDetector &operator=(const AnomalyDetector &) = delete;

            /// Score and absorb one value; returns a record when it is anomalous.
            std::optional<AnomalyRecord> addValue(double value, Utils::TimePoint timestamp);

            BaselineStats getBaselineStats() const;

            /// Back to the freshly constructed state (WarmingUp, empty baseline).
            void reset();

            DetectorState state() const;
            const DetectorConfig &config() const noexcept { return m_config; }

            /// Severity band of an absolute z-score that reached the threshold.
            Severity classify(double absZ) const noexcept;

        private:
            void recomputeUnlocked();
            std::string explain(double value, double z, Direction direction) const;

        private:
            DetectorConfig     m_config;
            std::deque<double> m_values;
            double             m_mean = 0.0;
            double             m_std = 0.0;
            mutable std::mutex m_mutex;
        };

    } // namespace Anomaly
} // namespace LogLens
