#include "loglens/anomaly/AnomalyDetector.hpp"

#include <cmath>
#include <iomanip>
#include <limits>
#include <numeric>
#include <sstream>

#include "loglens/core/Errors.hpp"
#include "loglens/utils/Logger.hpp"

namespace LogLens
{
    namespace Anomaly
    {
        using Utils::getLogger;

        const char *toString(Direction direction) noexcept
        {
            return direction == Direction::Spike ? "spike" : "drop";
        }

        const char *toString(Severity severity) noexcept
        {
            switch (severity)
            {
            case Severity::Low:      return "low";
            case Severity::Medium:   return "medium";
            case Severity::High:     return "high";
            case Severity::Critical: return "critical";
            }
            return "unknown";
        }

        const char *toString(DetectorState state) noexcept
        {
            return state == DetectorState::Active ? "active" : "warming_up";
        }

        void DetectorConfig::validate() const
        {
            const std::string who = metricName.empty() ? std::string("detector") : "detector '" + metricName + "'";

            if (windowSize < 1)
            {
                throw Core::ConfigurationError(who + ": window_size must be at least 1");
            }
            if (!std::isfinite(threshold) || threshold <= 0.0)
            {
                throw Core::ConfigurationError(who + ": threshold must be a positive number");
            }
            if (minSamples < 1 || minSamples > windowSize)
            {
                throw Core::ConfigurationError(who + ": min_samples must be within [1, window_size]");
            }
            if (!(bands.medium >= 1.0 && bands.medium < bands.high && bands.high < bands.critical))
            {
                throw Core::ConfigurationError(who + ": severity bands must satisfy 1 <= medium < high < critical");
            }
        }

        AnomalyDetector::AnomalyDetector(DetectorConfig config)
            : m_config(std::move(config))
        {
            m_config.validate();
            getLogger().debug("AnomalyDetector initialized for '" + m_config.metricName +
                              "' (window: " + std::to_string(m_config.windowSize) +
                              ", threshold: " + std::to_string(m_config.threshold) +
                              ", min samples: " + std::to_string(m_config.minSamples) + ")");
        }

        std::optional<AnomalyRecord> AnomalyDetector::addValue(double value, Utils::TimePoint timestamp)
        {
            std::lock_guard<std::mutex> lock(m_mutex);

            std::optional<AnomalyRecord> record;

            if (m_values.size() >= m_config.minSamples)
            {
                // Score against the baseline as it stood before this value.
                const double mean = m_mean;
                const double sd = m_std;

                double z = 0.0;
                bool flagged = false;
                if (sd == 0.0)
                {
                    if (value != mean)
                    {
                        z = value > mean ? std::numeric_limits<double>::infinity()
                                         : -std::numeric_limits<double>::infinity();
                        flagged = true;
                    }
                }
                else
                {
                    z = (value - mean) / sd;
                    flagged = std::abs(z) >= m_config.threshold;
                }

                if (flagged)
                {
                    AnomalyRecord r;
                    r.metricName = m_config.metricName;
                    r.value = value;
                    r.baselineMean = mean;
                    r.baselineStd = sd;
                    r.zScore = z;
                    r.direction = value > mean ? Direction::Spike : Direction::Drop;
                    r.severity = classify(std::abs(z));
                    r.timestamp = timestamp;
                    r.explanation = explain(value, z, r.direction);
                    record = std::move(r);
                }
            }

            m_values.push_back(value);
            while (m_values.size() > m_config.windowSize)
            {
                m_values.pop_front();
            }
            recomputeUnlocked();

            return record;
        }

        BaselineStats AnomalyDetector::getBaselineStats() const
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            BaselineStats stats;
            stats.mean = m_mean;
            stats.stdDev = m_std;
            stats.sampleCount = m_values.size();
            stats.windowSize = m_config.windowSize;
            stats.state = m_values.size() >= m_config.minSamples ? DetectorState::Active
                                                                 : DetectorState::WarmingUp;
            return stats;
        }

        void AnomalyDetector::reset()
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            m_values.clear();
            m_mean = 0.0;
            m_std = 0.0;
            getLogger().debug("AnomalyDetector reset for '" + m_config.metricName + "'");
        }

        DetectorState AnomalyDetector::state() const
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            return m_values.size() >= m_config.minSamples ? DetectorState::Active
                                                          : DetectorState::WarmingUp;
        }

        Severity AnomalyDetector::classify(double absZ) const noexcept
        {
            const double ratio = absZ / m_config.threshold;
            if (ratio >= m_config.bands.critical)
                return Severity::Critical;
            if (ratio >= m_config.bands.high)
                return Severity::High;
            if (ratio >= m_config.bands.medium)
                return Severity::Medium;
            return Severity::Low;
        }

        // --- Private implementation ---

        void AnomalyDetector::recomputeUnlocked()
        {
            if (m_values.empty())
            {
                m_mean = 0.0;
                m_std = 0.0;
                return;
            }

            const double n = static_cast<double>(m_values.size());
            m_mean = std::accumulate(m_values.begin(), m_values.end(), 0.0) / n;

            double sq = 0.0;
            for (double v : m_values)
            {
                sq += (v - m_mean) * (v - m_mean);
            }
            m_std = std::sqrt(sq / n);
        }

        std::string AnomalyDetector::explain(double value, double z, Direction direction) const
        {
            const double absZ = std::abs(z);
            const bool spike = direction == Direction::Spike;

            std::ostringstream oss;
            oss << std::fixed << std::setprecision(2);
            oss << m_config.metricName << (spike ? " spiked " : " dropped ");

            if (std::isinf(absZ))
            {
                oss << (spike ? "above" : "below") << " a flat baseline ("
                    << value << " vs constant " << m_mean << ")";
                return oss.str();
            }

            if (m_mean > 0.0)
            {
                if (!spike && value <= 0.0)
                {
                    oss << "to zero (" << value << " vs " << m_mean << " average)";
                    return oss.str();
                }
                const double multiplier = spike ? value / m_mean : m_mean / value;
                if (multiplier >= 2.0)
                {
                    oss << std::setprecision(1) << multiplier << "x"
                        << (spike ? " above" : " below") << " baseline (" << std::setprecision(2)
                        << value << " vs " << m_mean << " average)";
                    return oss.str();
                }
                oss << std::setprecision(1) << absZ << " standard deviations "
                    << (spike ? "above" : "below") << " baseline (" << std::setprecision(2)
                    << value << " vs " << m_mean << " average)";
                return oss.str();
            }

            oss << "to " << value << " (" << std::setprecision(1) << absZ
                << " standard deviations " << (spike ? "above" : "below") << " baseline)";
            return oss.str();
        }

    } // namespace Anomaly
} // namespace LogLens
