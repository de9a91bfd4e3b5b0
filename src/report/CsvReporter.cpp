#include "loglens/report/CsvReporter.hpp"

#include <algorithm>
#include <fstream>

#include "loglens/utils/Logger.hpp"
#include "loglens/utils/StringUtils.hpp"
#include "loglens/utils/TimeUtils.hpp"

namespace LogLens
{
    namespace Report
    {
        namespace
        {
            template <typename Writer>
            bool saveTable(const std::string &path, Writer &&write)
            {
                std::ofstream out(path, std::ios::out | std::ios::trunc);
                if (!out)
                {
                    Utils::getLogger().error("Cannot open '" + path + "' for writing");
                    return false;
                }
                write(out);
                out.flush();
                if (!out)
                {
                    Utils::getLogger().error("Failed writing '" + path + "'");
                    return false;
                }
                return true;
            }
        } // anonymous namespace

        void CsvReporter::addResult(const Metrics::MetricResult &result)
        {
            const std::string start = Utils::toIso8601(result.windowStart);
            const std::string end   = Utils::toIso8601(result.windowEnd);

            if (result.value)
            {
                m_resultRows.push_back({result.metricName, start, end, "", Utils::formatNumber(*result.value)});
                return;
            }

            std::vector<std::pair<std::string, double>> groups(result.groupedValues.begin(),
                                                               result.groupedValues.end());
            std::sort(groups.begin(), groups.end());
            for (const auto &[group, value] : groups)
            {
                m_resultRows.push_back({result.metricName, start, end, group, Utils::formatNumber(value)});
            }
        }

        void CsvReporter::addAnomaly(const Anomaly::AnomalyRecord &record)
        {
            m_anomalies.push_back(record);
        }

        void CsvReporter::writeResults(std::ostream &output, bool includeHeader) const
        {
            if (includeHeader)
            {
                writeCsvRow(output, {"metric", "window_start", "window_end", "group", "value"});
            }
            for (const auto &row : m_resultRows)
            {
                writeCsvRow(output, row);
            }
        }

        void CsvReporter::writeAnomalies(std::ostream &output, bool includeHeader) const
        {
            if (includeHeader)
            {
                writeCsvRow(output, {"metric", "timestamp", "value", "baseline_mean", "baseline_std",
                                     "z_score", "direction", "severity", "explanation"});
            }
            for (const auto &a : m_anomalies)
            {
                if (a.severity < m_minSeverity)
                {
                    continue;
                }
                writeCsvRow(output, {a.metricName,
                                     Utils::toIso8601(a.timestamp),
                                     Utils::formatNumber(a.value),
                                     Utils::formatNumber(a.baselineMean),
                                     Utils::formatNumber(a.baselineStd),
                                     Utils::formatNumber(a.zScore),
                                     Anomaly::toString(a.direction),
                                     Anomaly::toString(a.severity),
                                     a.explanation});
            }
        }

        bool CsvReporter::saveResults(const std::string &path) const
        {
            return saveTable(path, [this](std::ostream &os) { writeResults(os); });
        }

        bool CsvReporter::saveAnomalies(const std::string &path) const
        {
            return saveTable(path, [this](std::ostream &os) { writeAnomalies(os); });
        }

        void CsvReporter::clear() noexcept
        {
            m_resultRows.clear();
            m_anomalies.clear();
        }

        void CsvReporter::writeCsvRow(std::ostream &os, const std::vector<std::string> &fields)
        {
            for (std::size_t i = 0; i < fields.size(); ++i)
            {
                if (i > 0)
                {
                    os << ',';
                }
                os << Utils::escapeCsv(fields[i]);
            }
            // RFC 4180 line terminator.
            os << "\r\n";
        }

    } // namespace Report
} // namespace LogLens
