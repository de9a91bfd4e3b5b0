#pragma once

#include <cstdint>
#include <deque>
#include <functional>
#include <list>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>
#include <vector>

#include "loglens/core/Errors.hpp"
#include "loglens/core/Event.hpp"
#include "loglens/metrics/MetricDefinition.hpp"
#include "loglens/window/Window.hpp"

namespace LogLens
{
    namespace Metrics
    {
        /// Results of one addEvent call, keyed by metric name.
        using MetricResults = std::unordered_map<std::string, MetricResult>;

        /// Receives every evaluation error after it has been logged.
        using ErrorHandler = std::function<void(const Core::EvaluationError &)>;

        /// Receives (metric name, group key) for every group dropped by the maxGroups cap.
        using EvictionHandler = std::function<void(const std::string &, const std::string &)>;

        struct ProcessorStatistics
        {
            std::uint64_t eventsSeen = 0;
            std::uint64_t resultsEmitted = 0;
            std::uint64_t evaluationErrors = 0;
            std::uint64_t lateEventsDropped = 0;
            std::uint64_t groupsEvicted = 0;
        };

        /**
         * MetricProcessor
         *
         * Responsibilities:
         *  - Own one window per metric, or one per observed group key for
         *    grouped metrics.
         *  - Run filter -> group -> extract -> window -> aggregate for every
         *    event and every metric.
         *  - Keep the latest result of every metric for queries.
         *
         * Design notes:
         *  - Definitions are validated as a whole at construction; any
         *    invalid definition rejects the configuration
         *    (Core::ConfigurationError).
         *  - A filter, key, extractor or reducer that throws only drops that
         *    metric's result for that event. The error is tagged with the
         *    metric name and the event, logged, kept in recentErrors() and
         *    passed to the error handler.
         *  - Events below a window's lower bound are dropped (see Window).
         *  - Grouped metrics with maxGroups > 0 evict the least recently
         *    active group when a new one would exceed the cap. The eviction
         *    handler hears about it after addEvent releases the lock.
         *  - Custom reducers and other callables must throw types derived
         *    from std::exception; anything else escapes addEvent and drops
         *    the results of the metrics not yet processed for that event.
         *  - Public methods are serialized by an internal mutex.
         */
        class MetricProcessor
        {
        public:
            explicit MetricProcessor(std::vector<MetricDefinition> definitions);

            MetricProcessor(const MetricProcessor &)            = delete;
            MetricProcessor &operator=(const MetricProcessor &) = delete;

            ~MetricProcessor();

            /**
             * Feed one event to every metric.
             *
             * Returns only the metrics whose window emitted for this event.
             * A grouped result carries the emitting group only.
             */
            MetricResults addEvent(const Core::Event &event);

            /// Feed a batch; every emitted result per metric, in order.
            std::unordered_map<std::string, std::vector<MetricResult>>
            processEvents(const std::vector<Core::Event> &events);

            /**
             * End of stream: emit the partial window of every tumbling
             * window that holds values, one result per emitting window.
             *
             * A flushed window moves on to its next interval; events that
             * arrive later for the flushed span count as late drops.
             */
            std::vector<MetricResult> flush();

            /// Drop all window state and latest results; definitions are kept.
            void reset();

            /**
             * Latest result of a metric. For grouped metrics, groupedValues
             * merges the latest value of every live group.
             */
            std::optional<MetricResult> getMetric(std::string_view name) const;

            /// Latest result of every metric that has produced one.
            MetricResults getAllMetrics() const;

            /// Metric names in configuration order.
            std::vector<std::string> metricNames() const;

            /// Definition by name, or nullptr.
            const MetricDefinition *definition(std::string_view name) const;

            /// Number of live groups of a grouped metric (0 for unknown or ungrouped).
            std::size_t groupCount(std::string_view name) const;

            void setErrorHandler(ErrorHandler handler);

            void setEvictionHandler(EvictionHandler handler);

            /// Most recent evaluation errors, oldest first (bounded).
            std::vector<Core::EvaluationError> recentErrors() const;

            ProcessorStatistics statistics() const;

            static constexpr std::size_t kMaxRecentErrors = 100;

        private:
            struct GroupState
            {
                std::unique_ptr<Window::Window>      window;
                std::list<std::string>::iterator     lruPosition;
                std::optional<double>                latestValue;
            };

            struct MetricState
            {
                MetricDefinition                            definition;
                std::unique_ptr<Window::Window>             window;   // ungrouped metrics
                std::unordered_map<std::string, GroupState> groups;
                std::list<std::string>                      lru;      // most recently active first
                std::optional<MetricResult>                 latest;
            };

            std::optional<MetricResult> admitUnlocked(MetricState &state, const Core::Event &event);
            Window::Window &groupWindowUnlocked(MetricState &state, const std::string &key);
            MetricResult recordUnlocked(MetricState &state,
                                        const std::optional<std::string> &key,
                                        const Window::WindowFrame &frame,
                                        double value);
            MetricResult snapshotUnlocked(const MetricState &state) const;
            void reportErrors(const std::vector<Core::EvaluationError> &errors);
            void reportEvictions(const std::vector<std::pair<std::string, std::string>> &evicted);

        private:
            std::vector<MetricState>                     m_metrics;   // configuration order
            std::unordered_map<std::string, std::size_t> m_index;
            std::deque<Core::EvaluationError>            m_recentErrors;
            ErrorHandler                                 m_errorHandler;
            EvictionHandler                              m_evictionHandler;
            std::vector<std::pair<std::string, std::string>> m_pendingEvictions;
            ProcessorStatistics                          m_stats;
            mutable std::mutex                           m_mutex;
        };

    } // namespace Metrics
} // namespace LogLens
