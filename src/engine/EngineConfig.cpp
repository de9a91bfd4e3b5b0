#include "loglens/engine/EngineConfig.hpp"

#include <algorithm>
#include <array>
#include <string_view>

#include "loglens/core/Errors.hpp"
#include "loglens/utils/StringUtils.hpp"

namespace LogLens
{
    namespace Engine
    {
        namespace
        {
            constexpr std::array<std::string_view, 9> kMetricFields = {
                "filter", "aggregation", "window", "strategy", "group_by",
                "value", "percentile", "max_groups", "description"};

            constexpr std::array<std::string_view, 7> kDetectorFields = {
                "window_size", "threshold", "min_samples", "enabled",
                "medium", "high", "critical"};

            // A misspelled field would otherwise leave its default in place.
            template <std::size_t N>
            void rejectUnknownFields(const Utils::ConfigLoader &loader,
                                     std::string_view section,
                                     const std::array<std::string_view, N> &fields)
            {
                const std::string lead = std::string(section) + ".";
                for (const auto &[k, value] : loader.all())
                {
                    if (!Utils::startsWith(k, lead))
                    {
                        continue;
                    }
                    const std::string_view rest = std::string_view(k).substr(lead.size());
                    const auto dot = rest.rfind('.');
                    if (dot == std::string_view::npos || dot == 0)
                    {
                        throw Core::ConfigurationError("'" + k + "' names no " + std::string(section) + " field");
                    }
                    const std::string_view field = rest.substr(dot + 1);
                    if (std::find(fields.begin(), fields.end(), field) == fields.end())
                    {
                        throw Core::ConfigurationError(std::string(section) + " '" + std::string(rest.substr(0, dot)) +
                                                       "': unknown field '" + std::string(field) + "'");
                    }
                }
            }

            std::string key(std::string_view section, const std::string &name, std::string_view field)
            {
                std::string k(section);
                k += '.';
                k += name;
                k += '.';
                k += field;
                return k;
            }

            // Typed getters that refuse to fall back when a key is present but malformed.
            long long requireInt(const Utils::ConfigLoader &loader, const std::string &k, long long fallback)
            {
                if (!loader.hasKey(k))
                {
                    return fallback;
                }
                auto value = loader.getInt(k);
                if (!value)
                {
                    throw Core::ConfigurationError("'" + k + "' is not an integer");
                }
                return *value;
            }

            double requireDouble(const Utils::ConfigLoader &loader, const std::string &k, double fallback)
            {
                if (!loader.hasKey(k))
                {
                    return fallback;
                }
                auto value = loader.getDouble(k);
                if (!value)
                {
                    throw Core::ConfigurationError("'" + k + "' is not a number");
                }
                return *value;
            }

            bool requireBool(const Utils::ConfigLoader &loader, const std::string &k, bool fallback)
            {
                if (!loader.hasKey(k))
                {
                    return fallback;
                }
                auto value = loader.getBool(k);
                if (!value)
                {
                    throw Core::ConfigurationError("'" + k + "' is not a boolean");
                }
                return *value;
            }

            std::size_t requireCount(const Utils::ConfigLoader &loader, const std::string &k, std::size_t fallback)
            {
                const long long value = requireInt(loader, k, static_cast<long long>(fallback));
                if (value < 0)
                {
                    throw Core::ConfigurationError("'" + k + "' must not be negative");
                }
                return static_cast<std::size_t>(value);
            }

            Metrics::MetricDefinition buildMetric(const Utils::ConfigLoader &loader,
                                                  const Expr::IExpressionCompiler &compiler,
                                                  const std::string &name)
            {
                Metrics::MetricDefinition def;
                def.name        = name;
                def.description = loader.getStringOr(key("metric", name, "description"), "");

                const auto aggregation = loader.getString(key("metric", name, "aggregation"));
                if (!aggregation)
                {
                    throw Core::ConfigurationError("metric '" + name + "' has no aggregation");
                }
                const auto window = loader.getString(key("metric", name, "window"));
                if (!window)
                {
                    throw Core::ConfigurationError("metric '" + name + "' has no window");
                }

                std::optional<double> rank;
                const std::string rankKey = key("metric", name, "percentile");
                if (loader.hasKey(rankKey))
                {
                    rank = requireDouble(loader, rankKey, 0.0);
                }

                try
                {
                    def.aggregation = Metrics::Aggregation::parse(*aggregation, rank);
                    def.window = Window::WindowSpec::parse(
                        *window, loader.getStringOr(key("metric", name, "strategy"), "sliding"));

                    def.filter = compiler.compilePredicate(
                        loader.getStringOr(key("metric", name, "filter"), "true"));

                    if (auto groupBy = loader.getString(key("metric", name, "group_by")))
                    {
                        def.groupBy = compiler.compileGroupKey(*groupBy);
                    }
                    if (auto value = loader.getString(key("metric", name, "value")))
                    {
                        def.valueExtractor = compiler.compileValue(*value);
                    }
                }
                catch (const Core::ConfigurationError &e)
                {
                    throw Core::ConfigurationError("metric '" + name + "': " + e.reason());
                }

                def.maxGroups = requireCount(loader, key("metric", name, "max_groups"), 0);
                def.validate();
                return def;
            }

            Anomaly::DetectorConfig buildDetector(const Utils::ConfigLoader &loader, const std::string &metric)
            {
                Anomaly::DetectorConfig config;
                config.metricName = metric;
                config.windowSize = requireCount(loader, key("anomaly", metric, "window_size"), config.windowSize);
                config.threshold  = requireDouble(loader, key("anomaly", metric, "threshold"), config.threshold);
                config.minSamples = requireCount(loader, key("anomaly", metric, "min_samples"), config.minSamples);
                config.enabled    = requireBool(loader, key("anomaly", metric, "enabled"), config.enabled);

                config.bands.medium   = requireDouble(loader, key("anomaly", metric, "medium"), config.bands.medium);
                config.bands.high     = requireDouble(loader, key("anomaly", metric, "high"), config.bands.high);
                config.bands.critical = requireDouble(loader, key("anomaly", metric, "critical"), config.bands.critical);

                try
                {
                    config.validate();
                }
                catch (const Core::ConfigurationError &e)
                {
                    throw Core::ConfigurationError("anomaly '" + metric + "': " + e.reason());
                }
                return config;
            }
        } // anonymous namespace

        EngineConfig EngineConfig::fromLoader(const Utils::ConfigLoader &loader,
                                              const Expr::IExpressionCompiler &compiler)
        {
            EngineConfig config;

            if (auto level = loader.getString("log_level"))
            {
                config.logLevel = Utils::parseLogLevel(*level);
                if (!config.logLevel)
                {
                    throw Core::ConfigurationError("unknown log_level '" + *level + "'");
                }
            }
            config.logFile = loader.getStringOr("log_file", "");

            rejectUnknownFields(loader, "metric", kMetricFields);
            rejectUnknownFields(loader, "anomaly", kDetectorFields);

            for (const auto &name : loader.sectionNames("metric"))
            {
                config.metrics.push_back(buildMetric(loader, compiler, name));
            }
            for (const auto &metric : loader.sectionNames("anomaly"))
            {
                config.detectors.push_back(buildDetector(loader, metric));
            }

            Utils::getLogger().debug("Configuration built: " + std::to_string(config.metrics.size()) +
                                     " metrics, " + std::to_string(config.detectors.size()) + " detectors");
            return config;
        }

    } // namespace Engine
} // namespace LogLens
