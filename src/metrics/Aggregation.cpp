#include "loglens/metrics/Aggregation.hpp"

#include <algorithm>
#include <cmath>
#include <numeric>
#include <unordered_set>

#include "loglens/core/Errors.hpp"
#include "loglens/utils/StringUtils.hpp"

namespace LogLens
{
    namespace Metrics
    {
        const char *toString(AggregationType type) noexcept
        {
            switch (type)
            {
            case AggregationType::Count:       return "count";
            case AggregationType::Sum:         return "sum";
            case AggregationType::Average:     return "average";
            case AggregationType::Min:         return "min";
            case AggregationType::Max:         return "max";
            case AggregationType::Percentile:  return "percentile";
            case AggregationType::Rate:        return "rate";
            case AggregationType::UniqueCount: return "unique_count";
            case AggregationType::Custom:      return "custom";
            }
            return "unknown";
        }

        namespace
        {
            Aggregation ofType(AggregationType type)
            {
                switch (type)
                {
                case AggregationType::Count:       return Aggregation::count();
                case AggregationType::Sum:         return Aggregation::sum();
                case AggregationType::Average:     return Aggregation::average();
                case AggregationType::Min:         return Aggregation::min();
                case AggregationType::Max:         return Aggregation::max();
                case AggregationType::Rate:        return Aggregation::rate();
                case AggregationType::UniqueCount: return Aggregation::uniqueCount();
                default:
                    break;
                }
                throw Core::ConfigurationError(std::string("aggregation '") + toString(type) +
                                               "' needs an argument");
            }
        } // anonymous namespace

        // ---------- factories ----------

        Aggregation Aggregation::count()
        {
            return Aggregation();
        }

        Aggregation Aggregation::sum()
        {
            Aggregation a;
            a.m_type = AggregationType::Sum;
            return a;
        }

        Aggregation Aggregation::average()
        {
            Aggregation a;
            a.m_type = AggregationType::Average;
            return a;
        }

        Aggregation Aggregation::min()
        {
            Aggregation a;
            a.m_type = AggregationType::Min;
            return a;
        }

        Aggregation Aggregation::max()
        {
            Aggregation a;
            a.m_type = AggregationType::Max;
            return a;
        }

        Aggregation Aggregation::percentile(double rank)
        {
            Aggregation a;
            a.m_type = AggregationType::Percentile;
            a.m_percentile = rank;
            a.validate();
            return a;
        }

        Aggregation Aggregation::rate()
        {
            Aggregation a;
            a.m_type = AggregationType::Rate;
            return a;
        }

        Aggregation Aggregation::uniqueCount()
        {
            Aggregation a;
            a.m_type = AggregationType::UniqueCount;
            return a;
        }

        Aggregation Aggregation::custom(CustomReducer reducer, std::string label)
        {
            Aggregation a;
            a.m_type = AggregationType::Custom;
            a.m_reducer = std::move(reducer);
            a.m_label = std::move(label);
            a.validate();
            return a;
        }

        Aggregation Aggregation::parse(std::string_view name, std::optional<double> percentileRank)
        {
            const std::string key = Utils::toLower(Utils::trim(name));

            if (key == "count")
                return ofType(AggregationType::Count);
            if (key == "sum")
                return ofType(AggregationType::Sum);
            if (key == "average" || key == "avg" || key == "mean")
                return ofType(AggregationType::Average);
            if (key == "min")
                return ofType(AggregationType::Min);
            if (key == "max")
                return ofType(AggregationType::Max);
            if (key == "rate")
                return ofType(AggregationType::Rate);
            if (key == "unique_count" || key == "distinct")
                return ofType(AggregationType::UniqueCount);

            if (key == "percentile")
            {
                if (!percentileRank)
                {
                    throw Core::ConfigurationError("percentile aggregation requires a percentile rank");
                }
                return percentile(*percentileRank);
            }

            // "p95", "p99.9"
            if (key.size() > 1 && key.front() == 'p')
            {
                if (const auto rank = Utils::parseDouble(std::string_view(key).substr(1)))
                {
                    return percentile(*rank);
                }
            }

            throw Core::ConfigurationError("unknown aggregation '" + std::string(name) + "'");
        }

        // ---------- queries ----------

        bool Aggregation::requiresValue() const noexcept
        {
            switch (m_type)
            {
            case AggregationType::Sum:
            case AggregationType::Average:
            case AggregationType::Min:
            case AggregationType::Max:
            case AggregationType::Percentile:
            case AggregationType::UniqueCount:
                return true;
            case AggregationType::Count:
            case AggregationType::Rate:
            case AggregationType::Custom:
                return false;
            }
            return false;
        }

        std::string Aggregation::name() const
        {
            if (m_type == AggregationType::Percentile)
                return "p" + Utils::formatNumber(m_percentile);
            if (m_type == AggregationType::Custom)
                return m_label;
            return toString(m_type);
        }

        void Aggregation::validate() const
        {
            if (m_type == AggregationType::Percentile &&
                (!std::isfinite(m_percentile) || m_percentile < 0.0 || m_percentile > 100.0))
            {
                throw Core::ConfigurationError("percentile rank must be within [0, 100], got " +
                                               Utils::formatNumber(m_percentile));
            }
            if (m_type == AggregationType::Custom && !m_reducer)
            {
                throw Core::ConfigurationError("custom aggregation '" + m_label + "' has no reducer");
            }
        }

        double Aggregation::apply(const Window::WindowFrame &frame) const
        {
            const auto &values = frame.values;
            if (m_type == AggregationType::Custom)
            {
                return m_reducer(values);
            }
            if (values.empty())
            {
                return 0.0;
            }

            switch (m_type)
            {
            case AggregationType::Count:
                return static_cast<double>(values.size());

            case AggregationType::Sum:
                return std::accumulate(values.begin(), values.end(), 0.0);

            case AggregationType::Average:
                return std::accumulate(values.begin(), values.end(), 0.0) /
                       static_cast<double>(values.size());

            case AggregationType::Min:
                return *std::min_element(values.begin(), values.end());

            case AggregationType::Max:
                return *std::max_element(values.begin(), values.end());

            case AggregationType::Percentile:
                return interpolatedPercentile(values, m_percentile);

            case AggregationType::Rate:
            {
                const double n = static_cast<double>(values.size());
                // A zero span (single entry, identical timestamps) reports the raw count.
                if (frame.elapsedSeconds <= 0.0)
                {
                    return n;
                }
                return n / frame.elapsedSeconds;
            }

            case AggregationType::UniqueCount:
            {
                std::unordered_set<double> distinct(values.begin(), values.end());
                return static_cast<double>(distinct.size());
            }

            case AggregationType::Custom:
                break;
            }
            return 0.0;
        }

        double interpolatedPercentile(std::vector<double> values, double rank)
        {
            if (values.empty())
            {
                return 0.0;
            }
            std::sort(values.begin(), values.end());
            if (values.size() == 1)
            {
                return values.front();
            }

            const double pos = std::clamp(rank, 0.0, 100.0) / 100.0 *
                               static_cast<double>(values.size() - 1);
            const auto lower = static_cast<std::size_t>(std::floor(pos));
            const auto upper = std::min(lower + 1, values.size() - 1);
            const double fraction = pos - static_cast<double>(lower);
            return values[lower] + (values[upper] - values[lower]) * fraction;
        }

    } // namespace Metrics
} // namespace LogLens
