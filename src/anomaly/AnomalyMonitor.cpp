#include "loglens/anomaly/AnomalyMonitor.hpp"

#include <algorithm>

#include "loglens/core/Errors.hpp"
#include "loglens/utils/Logger.hpp"

namespace LogLens
{
    namespace Anomaly
    {
        using Utils::getLogger;

        AnomalyMonitor::AnomalyMonitor(std::vector<DetectorConfig> configs)
        {
            for (auto &config : configs)
            {
                config.validate();
                if (!config.enabled)
                {
                    getLogger().debug("Anomaly detection disabled for '" + config.metricName + "'");
                    continue;
                }
                if (config.metricName.empty())
                {
                    throw Core::ConfigurationError("anomaly detector without metric name");
                }
                const std::string name = config.metricName;
                if (!m_configs.emplace(name, std::move(config)).second)
                {
                    throw Core::ConfigurationError("duplicate anomaly detector for metric '" + name + "'");
                }
            }
            getLogger().info("AnomalyMonitor initialized (" + std::to_string(m_configs.size()) + " metrics monitored)");
        }

        std::optional<AnomalyRecord> AnomalyMonitor::addValue(std::string_view metricName,
                                                              double value,
                                                              Utils::TimePoint timestamp)
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            AnomalyDetector *detector = detectorUnlocked(metricName, std::string(metricName));
            if (!detector)
            {
                return std::nullopt;
            }
            return detector->addValue(value, timestamp);
        }

        std::vector<AnomalyRecord> AnomalyMonitor::observe(const Metrics::MetricResult &result)
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            std::vector<AnomalyRecord> records;

            if (result.value)
            {
                if (auto *detector = detectorUnlocked(result.metricName, result.metricName))
                {
                    if (auto record = detector->addValue(*result.value, result.windowEnd))
                    {
                        records.push_back(std::move(*record));
                    }
                }
                return records;
            }

            // Sorted for a deterministic record order.
            std::vector<std::pair<std::string, double>> groups(result.groupedValues.begin(),
                                                               result.groupedValues.end());
            std::sort(groups.begin(), groups.end());
            for (const auto &[group, value] : groups)
            {
                auto *detector = detectorUnlocked(result.metricName, seriesName(result.metricName, group));
                if (!detector)
                {
                    break;
                }
                if (auto record = detector->addValue(value, result.windowEnd))
                {
                    records.push_back(std::move(*record));
                }
            }
            return records;
        }

        std::map<std::string, BaselineStats> AnomalyMonitor::baselineStats() const
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            std::map<std::string, BaselineStats> stats;
            for (const auto &[name, detector] : m_detectors)
            {
                stats.emplace(name, detector->getBaselineStats());
            }
            return stats;
        }

        std::optional<BaselineStats> AnomalyMonitor::baselineStats(std::string_view seriesName) const
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            auto it = m_detectors.find(std::string(seriesName));
            if (it == m_detectors.end())
            {
                return std::nullopt;
            }
            return it->second->getBaselineStats();
        }

        void AnomalyMonitor::reset()
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            m_detectors.clear();
            getLogger().debug("AnomalyMonitor reset");
        }

        void AnomalyMonitor::reset(std::string_view metricName)
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            const std::string groupPrefix = std::string(metricName) + "[";
            for (auto it = m_detectors.begin(); it != m_detectors.end();)
            {
                const std::string &name = it->first;
                if (name == metricName || name.compare(0, groupPrefix.size(), groupPrefix) == 0)
                {
                    it = m_detectors.erase(it);
                }
                else
                {
                    ++it;
                }
            }
        }

        void AnomalyMonitor::forgetGroup(std::string_view metricName, std::string_view group)
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            if (m_detectors.erase(seriesName(metricName, group)) != 0)
            {
                getLogger().debug("AnomalyMonitor dropped detector for '" + seriesName(metricName, group) + "'");
            }
        }

        std::size_t AnomalyMonitor::detectorCount() const
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            return m_detectors.size();
        }

        bool AnomalyMonitor::isMonitored(std::string_view metricName) const
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            return m_configs.count(std::string(metricName)) != 0;
        }

        std::string AnomalyMonitor::seriesName(std::string_view metricName, std::string_view group)
        {
            std::string name(metricName);
            name += "[";
            name += group;
            name += "]";
            return name;
        }

        AnomalyDetector *AnomalyMonitor::detectorUnlocked(std::string_view metricName, const std::string &series)
        {
            if (auto it = m_detectors.find(series); it != m_detectors.end())
            {
                return it->second.get();
            }

            auto cfg = m_configs.find(std::string(metricName));
            if (cfg == m_configs.end())
            {
                return nullptr;
            }

            DetectorConfig config = cfg->second;
            config.metricName = series;
            auto inserted = m_detectors.emplace(series, std::make_unique<AnomalyDetector>(std::move(config)));
            return inserted.first->second.get();
        }

    } // namespace Anomaly
} // namespace LogLens
