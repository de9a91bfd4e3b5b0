#pragma once

#include <functional>
#include <vector>

#include "loglens/anomaly/AnomalyMonitor.hpp"
#include "loglens/engine/EngineConfig.hpp"
#include "loglens/metrics/MetricProcessor.hpp"

namespace LogLens
{
    namespace Engine
    {
        /// What one event (or the end of the stream) produced.
        struct PipelineOutput
        {
            std::vector<Metrics::MetricResult>  results;    // sorted by metric name
            std::vector<Anomaly::AnomalyRecord> anomalies;
        };

        using ResultSink  = std::function<void(const Metrics::MetricResult &)>;
        using AnomalySink = std::function<void(const Anomaly::AnomalyRecord &)>;

        /**
         * Pipeline
         *
         * Event -> MetricProcessor -> MetricResult -> AnomalyMonitor -> AnomalyRecord.
         *
         * Owns both stages and wires the output of the first into the second.
         * Sinks, when set, see every result and anomaly in emission order.
         * Groups evicted by the processor's maxGroups cap lose their
         * per-group detector too.
         */
        class Pipeline
        {
        public:
            Pipeline(std::vector<Metrics::MetricDefinition> metrics,
                     std::vector<Anomaly::DetectorConfig> detectors);

            explicit Pipeline(EngineConfig config);

            Pipeline(const Pipeline &)            = delete;
            Pipeline &operator=(const Pipeline &) = delete;

            PipelineOutput process(const Core::Event &event);

            /// End of stream: flush tumbling windows through the same path.
            PipelineOutput finish();

            void setResultSink(ResultSink sink) { m_resultSink = std::move(sink); }
            void setAnomalySink(AnomalySink sink) { m_anomalySink = std::move(sink); }

            Metrics::MetricProcessor &processor() noexcept { return m_processor; }
            const Metrics::MetricProcessor &processor() const noexcept { return m_processor; }

            Anomaly::AnomalyMonitor &monitor() noexcept { return m_monitor; }
            const Anomaly::AnomalyMonitor &monitor() const noexcept { return m_monitor; }

        private:
            PipelineOutput dispatch(std::vector<Metrics::MetricResult> results);

        private:
            Metrics::MetricProcessor m_processor;
            Anomaly::AnomalyMonitor  m_monitor;
            ResultSink               m_resultSink;
            AnomalySink              m_anomalySink;
        };

    } // namespace Engine
} // namespace LogLens
