#pragma once

#include "loglens/metrics/MetricDefinition.hpp"

namespace LogLens
{
    namespace Metrics
    {
        /**
         * Ready-made metric definitions for the most common log questions.
         * Each takes the window the caller wants and can be renamed freely.
         */

        /// "error_count": ERROR and CRITICAL events counted over the window.
        MetricDefinition errorCountMetric(Window::WindowSpec window = Window::WindowSpec::parse("5m"));

        /// "warning_rate": WARNING events per second over the window.
        MetricDefinition warningRateMetric(Window::WindowSpec window = Window::WindowSpec::parse("1m"));

        /// "events_by_source": event count per source.
        MetricDefinition eventsBySourceMetric(Window::WindowSpec window = Window::WindowSpec::parse("5m"));

        /// "events_by_level": event count per level name.
        MetricDefinition eventsByLevelMetric(Window::WindowSpec window = Window::WindowSpec::parse("5m"));

    } // namespace Metrics
} // namespace LogLens
