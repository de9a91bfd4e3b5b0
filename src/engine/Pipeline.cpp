#include "loglens/engine/Pipeline.hpp"

#include <algorithm>

#include "loglens/utils/Logger.hpp"

namespace LogLens
{
    namespace Engine
    {
        Pipeline::Pipeline(std::vector<Metrics::MetricDefinition> metrics,
                           std::vector<Anomaly::DetectorConfig> detectors)
            : m_processor(std::move(metrics)),
              m_monitor(std::move(detectors))
        {
            // A group dropped by the maxGroups cap takes its detector with it.
            m_processor.setEvictionHandler([this](const std::string &metric, const std::string &group) {
                m_monitor.forgetGroup(metric, group);
            });
            for (const auto &name : m_processor.metricNames())
            {
                if (!m_monitor.isMonitored(name))
                {
                    Utils::getLogger().debug("Metric '" + name + "' has no anomaly detector");
                }
            }
            Utils::getLogger().info("Pipeline initialized");
        }

        Pipeline::Pipeline(EngineConfig config)
            : Pipeline(std::move(config.metrics), std::move(config.detectors))
        {
        }

        PipelineOutput Pipeline::process(const Core::Event &event)
        {
            auto emitted = m_processor.addEvent(event);

            std::vector<Metrics::MetricResult> results;
            results.reserve(emitted.size());
            for (auto &[name, result] : emitted)
            {
                results.push_back(std::move(result));
            }
            return dispatch(std::move(results));
        }

        PipelineOutput Pipeline::finish()
        {
            return dispatch(m_processor.flush());
        }

        PipelineOutput Pipeline::dispatch(std::vector<Metrics::MetricResult> results)
        {
            std::stable_sort(results.begin(), results.end(),
                             [](const Metrics::MetricResult &a, const Metrics::MetricResult &b) {
                                 return a.metricName < b.metricName;
                             });

            PipelineOutput output;
            for (const auto &result : results)
            {
                if (m_resultSink)
                {
                    m_resultSink(result);
                }
                for (auto &record : m_monitor.observe(result))
                {
                    if (m_anomalySink)
                    {
                        m_anomalySink(record);
                    }
                    output.anomalies.push_back(std::move(record));
                }
            }
            output.results = std::move(results);
            return output;
        }

    } // namespace Engine
} // namespace LogLens
