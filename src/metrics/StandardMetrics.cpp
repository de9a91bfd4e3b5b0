#include "loglens/metrics/StandardMetrics.hpp"

namespace LogLens
{
    namespace Metrics
    {
        using Core::Event;
        using Core::EventLevel;

        MetricDefinition errorCountMetric(Window::WindowSpec window)
        {
            MetricDefinition def;
            def.name = "error_count";
            def.description = "ERROR and CRITICAL events in the window";
            def.filter = [](const Event &e) {
                return e.level() == EventLevel::Error || e.level() == EventLevel::Critical;
            };
            def.aggregation = Aggregation::count();
            def.window = window;
            return def;
        }

        MetricDefinition warningRateMetric(Window::WindowSpec window)
        {
            MetricDefinition def;
            def.name = "warning_rate";
            def.description = "WARNING events per second";
            def.filter = [](const Event &e) { return e.level() == EventLevel::Warning; };
            def.aggregation = Aggregation::rate();
            def.window = window;
            return def;
        }

        MetricDefinition eventsBySourceMetric(Window::WindowSpec window)
        {
            MetricDefinition def;
            def.name = "events_by_source";
            def.description = "Events per source";
            def.filter = [](const Event &) { return true; };
            def.groupBy = [](const Event &e) { return e.source().empty() ? std::string("<none>") : e.source(); };
            def.aggregation = Aggregation::count();
            def.window = window;
            return def;
        }

        MetricDefinition eventsByLevelMetric(Window::WindowSpec window)
        {
            MetricDefinition def;
            def.name = "events_by_level";
            def.description = "Events per level";
            def.filter = [](const Event &) { return true; };
            def.groupBy = [](const Event &e) { return std::string(Core::toString(e.level())); };
            def.aggregation = Aggregation::count();
            def.window = window;
            return def;
        }

    } // namespace Metrics
} // namespace LogLens
