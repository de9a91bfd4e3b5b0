#pragma once

#include <functional>
#include <string>
#include <string_view>

#include "loglens/core/Event.hpp"

namespace LogLens
{
    namespace Expr
    {
        /// Filter: does this event count towards the metric?
        using EventPredicate = std::function<bool(const Core::Event &)>;

        /// Group key of an event under a grouped metric.
        using GroupKeyExtractor = std::function<std::string(const Core::Event &)>;

        /// Numeric value fed to value-based aggregations.
        using ValueExtractor = std::function<double(const Core::Event &)>;

        /**
         * IExpressionCompiler
         *
         * Turns declarative expressions (configuration data) into the three
         * callables the metric processor consumes. The processor only sees
         * the callables, so the expression language can be swapped without
         * touching windowing or aggregation.
         *
         * Contract:
         *  - compile* throws Core::ConfigurationError for invalid expressions.
         *  - The returned callables throw Core::EvaluationError when an event
         *    cannot be evaluated.
         */
        class IExpressionCompiler
        {
        public:
            virtual ~IExpressionCompiler() = default;

            virtual EventPredicate compilePredicate(std::string_view expression) const = 0;
            virtual GroupKeyExtractor compileGroupKey(std::string_view expression) const = 0;
            virtual ValueExtractor compileValue(std::string_view expression) const = 0;
        };

    } // namespace Expr
} // namespace LogLens
