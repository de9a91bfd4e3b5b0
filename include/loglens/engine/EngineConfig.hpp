#pragma once

#include <optional>
#include <string>
#include <vector>

#include "loglens/anomaly/AnomalyDetector.hpp"
#include "loglens/expr/Expression.hpp"
#include "loglens/metrics/MetricDefinition.hpp"
#include "loglens/utils/ConfigLoader.hpp"
#include "loglens/utils/Logger.hpp"

namespace LogLens
{
    namespace Engine
    {
        /**
         * EngineConfig
         *
         * Everything a Pipeline needs, as plain data. Built explicitly by the
         * caller (usually from a ConfigLoader) and passed by value; nothing
         * here is global.
         *
         * Recognised keys:
         *   log_level, log_file
         *   metric.<name>.filter | aggregation | window | strategy | group_by
         *               | value | percentile | max_groups | description
         *   anomaly.<metric>.window_size | threshold | min_samples | enabled
         *                   | medium | high | critical
         */
        struct EngineConfig
        {
            std::vector<Metrics::MetricDefinition> metrics;
            std::vector<Anomaly::DetectorConfig>   detectors;
            std::optional<Utils::LogLevel>         logLevel;
            std::string                            logFile;

            /**
             * Build the configuration from loaded keys, compiling expressions
             * with the given compiler.
             *
             * Throws Core::ConfigurationError on the first invalid entry; a
             * partially valid file is rejected as a whole.
             */
            static EngineConfig fromLoader(const Utils::ConfigLoader &loader,
                                           const Expr::IExpressionCompiler &compiler);
        };

    } // namespace Engine
} // namespace LogLens
