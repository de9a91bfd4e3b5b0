#pragma once

#include <ostream>
#include <string>
#include <vector>

#include "loglens/anomaly/AnomalyRecord.hpp"
#include "loglens/metrics/MetricDefinition.hpp"

namespace LogLens
{
    namespace Report
    {
        /**
         * CsvReporter
         *
         * Responsibilities:
         *  - Collect metric results and anomaly records as they are produced.
         *  - Write them as RFC 4180 CSV tables for spreadsheets.
         *
         * Tables:
         *  - results:   metric,window_start,window_end,group,value
         *               (one row per group for grouped results, groups sorted)
         *  - anomalies: metric,timestamp,value,baseline_mean,baseline_std,
         *               z_score,direction,severity,explanation
         *
         * Timestamps are ISO-8601 UTC. Rows keep insertion order.
         */
        class CsvReporter
        {
        public:
            CsvReporter() = default;

            void addResult(const Metrics::MetricResult &result);
            void addAnomaly(const Anomaly::AnomalyRecord &record);

            /// Anomalies below this severity are not written (default: all).
            void setMinSeverity(Anomaly::Severity severity) noexcept { m_minSeverity = severity; }

            void writeResults(std::ostream &output, bool includeHeader = true) const;
            void writeAnomalies(std::ostream &output, bool includeHeader = true) const;

            /// Write a table to a file; false (and an error log) when the file cannot be written.
            bool saveResults(const std::string &path) const;
            bool saveAnomalies(const std::string &path) const;

            std::size_t resultRowCount() const noexcept { return m_resultRows.size(); }
            std::size_t anomalyCount() const noexcept { return m_anomalies.size(); }

            void clear() noexcept;

        private:
            static void writeCsvRow(std::ostream &os, const std::vector<std::string> &fields);

        private:
            std::vector<std::vector<std::string>> m_resultRows;
            std::vector<Anomaly::AnomalyRecord>   m_anomalies;
            Anomaly::Severity                     m_minSeverity = Anomaly::Severity::Low;
        };

    } // namespace Report
} // namespace LogLens
