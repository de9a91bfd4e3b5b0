#pragma once

#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "loglens/window/Window.hpp"

namespace LogLens
{
    namespace Metrics
    {
        /// Built-in aggregations plus one caller-supplied escape hatch.
        enum class AggregationType
        {
            Count,
            Sum,
            Average,
            Min,
            Max,
            Percentile,
            Rate,
            UniqueCount,
            Custom,
        };

        const char *toString(AggregationType type) noexcept;

        using CustomReducer = std::function<double(const std::vector<double> &)>;

        /**
         * Aggregation
         *
         * Tagged value: the aggregation type, the percentile rank for
         * Percentile, and the reducer for Custom. Applied to the values of a
         * WindowFrame each time a window emits.
         */
        class Aggregation
        {
        public:
            /// Count aggregation.
            Aggregation() = default;

            static Aggregation count();
            static Aggregation sum();
            static Aggregation average();
            static Aggregation min();
            static Aggregation max();
            static Aggregation percentile(double rank);
            static Aggregation rate();
            static Aggregation uniqueCount();
            /// The reducer reports failure by throwing a std::exception-derived type.
            static Aggregation custom(CustomReducer reducer, std::string label = "custom");

            /**
             * Resolve a configured aggregation name.
             *
             * Accepts the built-in names (case-insensitive, plus avg/mean and
             * distinct aliases) and the shorthand "p95" for percentile(95).
             * "percentile" needs the rank argument. Throws
             * Core::ConfigurationError for unknown names or a bad rank.
             */
            static Aggregation parse(std::string_view name,
                                     std::optional<double> percentileRank = std::nullopt);

            AggregationType type() const noexcept { return m_type; }
            double percentileRank() const noexcept { return m_percentile; }

            /// True for aggregations that need a numeric value extractor.
            bool requiresValue() const noexcept;

            /// "count", "p95", or the custom label.
            std::string name() const;

            /// Throws Core::ConfigurationError for out-of-range ranks or a missing reducer.
            void validate() const;

            /**
             * Aggregate a window frame.
             *
             * An empty frame yields 0. Custom reducers may throw; the caller
             * reports that as an evaluation error.
             */
            double apply(const Window::WindowFrame &frame) const;

        private:
            AggregationType m_type = AggregationType::Count;
            double          m_percentile = 50.0;
            CustomReducer   m_reducer;
            std::string     m_label;
        };

        /**
         * Percentile by linear interpolation between closest ranks:
         * rank = p / 100 * (n - 1). Returns 0 for an empty input.
         */
        double interpolatedPercentile(std::vector<double> values, double rank);

    } // namespace Metrics
} // namespace LogLens
