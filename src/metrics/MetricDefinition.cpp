#include "loglens/metrics/MetricDefinition.hpp"

#include "loglens/core/Errors.hpp"

namespace LogLens
{
    namespace Metrics
    {
        void MetricDefinition::validate() const
        {
            if (name.empty())
            {
                throw Core::ConfigurationError("metric name must not be empty");
            }
            if (!filter)
            {
                throw Core::ConfigurationError("metric '" + name + "' has no filter");
            }
            if (window.duration.count() <= 0)
            {
                throw Core::ConfigurationError("metric '" + name + "' has a non-positive window duration");
            }
            if (aggregation.requiresValue() && !valueExtractor)
            {
                throw Core::ConfigurationError("metric '" + name + "' uses aggregation '" +
                                               aggregation.name() + "' which requires a value extractor");
            }

            try
            {
                aggregation.validate();
            }
            catch (const Core::ConfigurationError &e)
            {
                throw Core::ConfigurationError("metric '" + name + "': " + e.reason());
            }
        }

    } // namespace Metrics
} // namespace LogLens
