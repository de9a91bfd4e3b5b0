#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <unordered_map>

#include "loglens/expr/Expression.hpp"
#include "loglens/metrics/Aggregation.hpp"
#include "loglens/utils/TimeUtils.hpp"
#include "loglens/window/Window.hpp"

namespace LogLens
{
    namespace Metrics
    {
        /**
         * MetricDefinition
         *
         * Declarative description of one metric: which events count
         * (filter), how they are partitioned (groupBy), which number each one
         * contributes (valueExtractor) and how a window of them is reduced
         * (aggregation). Immutable once handed to a MetricProcessor.
         */
        struct MetricDefinition
        {
            std::string              name;
            std::string              description;
            Expr::EventPredicate     filter;
            Aggregation              aggregation;
            Window::WindowSpec       window;
            Expr::GroupKeyExtractor  groupBy;          // empty: ungrouped
            Expr::ValueExtractor     valueExtractor;   // empty: every event contributes 1.0
            std::size_t              maxGroups = 0;    // 0: unbounded

            bool isGrouped() const noexcept { return static_cast<bool>(groupBy); }

            /**
             * Check the definition on its own.
             * Throws Core::ConfigurationError naming the metric and the problem.
             */
            void validate() const;
        };

        /**
         * MetricResult
         *
         * Output of one window emission. Ungrouped metrics set value;
         * grouped metrics leave it unset and fill groupedValues.
         */
        struct MetricResult
        {
            std::string                             metricName;
            Utils::TimePoint                        windowStart{};
            Utils::TimePoint                        windowEnd{};
            std::optional<double>                   value;
            std::unordered_map<std::string, double> groupedValues;

            bool isGrouped() const noexcept { return !value.has_value(); }
        };

    } // namespace Metrics
} // namespace LogLens
