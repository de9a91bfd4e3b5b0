#include "loglens/metrics/MetricProcessor.hpp"

#include <sstream>

#include "loglens/utils/Logger.hpp"
#include "loglens/utils/StringUtils.hpp"

namespace LogLens
{
    namespace Metrics
    {
        using Utils::getLogger;

        MetricProcessor::MetricProcessor(std::vector<MetricDefinition> definitions)
        {
            m_metrics.reserve(definitions.size());
            for (auto &def : definitions)
            {
                def.validate();
                if (m_index.count(def.name) != 0)
                {
                    throw Core::ConfigurationError("duplicate metric name '" + def.name + "'");
                }
                m_index.emplace(def.name, m_metrics.size());

                MetricState state;
                if (!def.isGrouped())
                {
                    state.window = Window::makeWindow(def.window);
                }
                state.definition = std::move(def);
                m_metrics.push_back(std::move(state));
            }

            getLogger().info("MetricProcessor initialized (" + std::to_string(m_metrics.size()) + " metrics)");
            for (const auto &state : m_metrics)
            {
                const auto &def = state.definition;
                getLogger().debug("  metric '" + def.name + "': " + def.aggregation.name() + " over " +
                                  Window::toString(def.window.strategy) + " " +
                                  Utils::formatDuration(def.window.duration) +
                                  (def.isGrouped() ? " (grouped)" : ""));
            }
        }

        MetricProcessor::~MetricProcessor() = default;

        MetricResults MetricProcessor::addEvent(const Core::Event &event)
        {
            MetricResults results;
            std::vector<Core::EvaluationError> errors;
            std::vector<std::pair<std::string, std::string>> evicted;

            {
                std::lock_guard<std::mutex> lock(m_mutex);
                ++m_stats.eventsSeen;

                for (auto &state : m_metrics)
                {
                    const std::string &name = state.definition.name;
                    try
                    {
                        if (auto result = admitUnlocked(state, event))
                        {
                            results.emplace(name, std::move(*result));
                        }
                    }
                    catch (const Core::EvaluationError &e)
                    {
                        errors.emplace_back(name, event.describe(), e.reason());
                    }
                    catch (const std::exception &e)
                    {
                        errors.emplace_back(name, event.describe(), e.what());
                    }
                }

                m_stats.resultsEmitted += results.size();
                m_stats.evaluationErrors += errors.size();
                for (const auto &error : errors)
                {
                    getLogger().warn(error.what());
                    m_recentErrors.push_back(error);
                    if (m_recentErrors.size() > kMaxRecentErrors)
                    {
                        m_recentErrors.pop_front();
                    }
                }
                evicted.swap(m_pendingEvictions);
            }

            reportErrors(errors);
            reportEvictions(evicted);
            return results;
        }

        std::unordered_map<std::string, std::vector<MetricResult>>
        MetricProcessor::processEvents(const std::vector<Core::Event> &events)
        {
            std::unordered_map<std::string, std::vector<MetricResult>> all;
            for (const auto &event : events)
            {
                for (auto &[name, result] : addEvent(event))
                {
                    all[name].push_back(std::move(result));
                }
            }
            return all;
        }

        std::vector<MetricResult> MetricProcessor::flush()
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            std::vector<MetricResult> flushed;

            for (auto &state : m_metrics)
            {
                const auto &def = state.definition;
                if (def.window.strategy != Window::WindowStrategy::Tumbling)
                {
                    continue;
                }

                // Flushed partials reuse the same aggregation path as regular emissions.
                auto emit = [&](const std::optional<std::string> &key, Window::Window &window) {
                    if (auto frame = window.flush())
                    {
                        try
                        {
                            const double value = def.aggregation.apply(*frame);
                            flushed.push_back(recordUnlocked(state, key, *frame, value));
                        }
                        catch (const std::exception &e)
                        {
                            Core::EvaluationError error(def.name, "end-of-stream flush", e.what());
                            ++m_stats.evaluationErrors;
                            getLogger().warn(error.what());
                            m_recentErrors.push_back(error);
                            if (m_recentErrors.size() > kMaxRecentErrors)
                            {
                                m_recentErrors.pop_front();
                            }
                        }
                    }
                };

                if (!def.isGrouped())
                {
                    emit(std::nullopt, *state.window);
                    continue;
                }
                // Least recently active first so the merged snapshot ends with the newest group.
                for (auto it = state.lru.rbegin(); it != state.lru.rend(); ++it)
                {
                    emit(*it, *state.groups.at(*it).window);
                }
            }

            m_stats.resultsEmitted += flushed.size();
            getLogger().debug("MetricProcessor flushed " + std::to_string(flushed.size()) + " partial windows");
            return flushed;
        }

        void MetricProcessor::reset()
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            for (auto &state : m_metrics)
            {
                if (state.window)
                {
                    state.window->reset();
                }
                state.groups.clear();
                state.lru.clear();
                state.latest.reset();
            }
            m_recentErrors.clear();
            m_pendingEvictions.clear();
            m_stats = ProcessorStatistics{};
            getLogger().debug("MetricProcessor reset");
        }

        std::optional<MetricResult> MetricProcessor::getMetric(std::string_view name) const
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            auto it = m_index.find(std::string(name));
            if (it == m_index.end())
            {
                return std::nullopt;
            }
            const auto &state = m_metrics[it->second];
            if (!state.latest)
            {
                return std::nullopt;
            }
            return snapshotUnlocked(state);
        }

        MetricResults MetricProcessor::getAllMetrics() const
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            MetricResults all;
            for (const auto &state : m_metrics)
            {
                if (state.latest)
                {
                    all.emplace(state.definition.name, snapshotUnlocked(state));
                }
            }
            return all;
        }

        std::vector<std::string> MetricProcessor::metricNames() const
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            std::vector<std::string> names;
            names.reserve(m_metrics.size());
            for (const auto &state : m_metrics)
            {
                names.push_back(state.definition.name);
            }
            return names;
        }

        const MetricDefinition *MetricProcessor::definition(std::string_view name) const
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            auto it = m_index.find(std::string(name));
            return it == m_index.end() ? nullptr : &m_metrics[it->second].definition;
        }

        std::size_t MetricProcessor::groupCount(std::string_view name) const
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            auto it = m_index.find(std::string(name));
            return it == m_index.end() ? 0 : m_metrics[it->second].groups.size();
        }

        void MetricProcessor::setErrorHandler(ErrorHandler handler)
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            m_errorHandler = std::move(handler);
        }

        void MetricProcessor::setEvictionHandler(EvictionHandler handler)
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            m_evictionHandler = std::move(handler);
        }

        std::vector<Core::EvaluationError> MetricProcessor::recentErrors() const
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            return {m_recentErrors.begin(), m_recentErrors.end()};
        }

        ProcessorStatistics MetricProcessor::statistics() const
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            return m_stats;
        }

        // --- Private implementation ---

        std::optional<MetricResult> MetricProcessor::admitUnlocked(MetricState &state, const Core::Event &event)
        {
            const auto &def = state.definition;

            if (!def.filter(event))
            {
                return std::nullopt;
            }

            std::optional<std::string> key;
            if (def.isGrouped())
            {
                key = def.groupBy(event);
            }

            const double value = def.valueExtractor ? def.valueExtractor(event) : 1.0;

            Window::Window &window = key ? groupWindowUnlocked(state, *key) : *state.window;
            const std::size_t dropsBefore = window.lateDrops();

            auto frame = window.admit(value, event.timestamp());
            if (window.lateDrops() != dropsBefore)
            {
                ++m_stats.lateEventsDropped;
                if (getLogger().isEnabled(Utils::LogLevel::DEBUG))
                {
                    getLogger().debug("metric '" + def.name + "' dropped late event at " +
                                      Utils::toIso8601(event.timestamp()) + " (window lower bound " +
                                      Utils::toIso8601(window.lowerBound().value_or(Utils::TimePoint{})) + ")");
                }
                return std::nullopt;
            }
            if (!frame)
            {
                return std::nullopt;
            }

            return recordUnlocked(state, key, *frame, def.aggregation.apply(*frame));
        }

        Window::Window &MetricProcessor::groupWindowUnlocked(MetricState &state, const std::string &key)
        {
            auto it = state.groups.find(key);
            if (it != state.groups.end())
            {
                // Mark as most recently active.
                state.lru.splice(state.lru.begin(), state.lru, it->second.lruPosition);
                return *it->second.window;
            }

            const auto &def = state.definition;
            if (def.maxGroups > 0 && state.groups.size() >= def.maxGroups)
            {
                const std::string victim = state.lru.back();
                state.lru.pop_back();
                state.groups.erase(victim);
                m_pendingEvictions.emplace_back(def.name, victim);
                ++m_stats.groupsEvicted;
                getLogger().debug("metric '" + def.name + "' evicted group '" + victim +
                                  "' (cap " + std::to_string(def.maxGroups) + ")");
            }

            state.lru.push_front(key);
            GroupState group;
            group.window = Window::makeWindow(def.window);
            group.lruPosition = state.lru.begin();
            auto inserted = state.groups.emplace(key, std::move(group)).first;
            return *inserted->second.window;
        }

        MetricResult MetricProcessor::recordUnlocked(MetricState &state,
                                                     const std::optional<std::string> &key,
                                                     const Window::WindowFrame &frame,
                                                     double value)
        {
            MetricResult result;
            result.metricName = state.definition.name;
            result.windowStart = frame.start;
            result.windowEnd = frame.end;

            if (key)
            {
                result.groupedValues.emplace(*key, value);
                auto it = state.groups.find(*key);
                if (it != state.groups.end())
                {
                    it->second.latestValue = value;
                }
            }
            else
            {
                result.value = value;
            }

            state.latest = result;
            return result;
        }

        MetricResult MetricProcessor::snapshotUnlocked(const MetricState &state) const
        {
            MetricResult snapshot = *state.latest;
            if (state.definition.isGrouped())
            {
                snapshot.groupedValues.clear();
                for (const auto &[key, group] : state.groups)
                {
                    if (group.latestValue)
                    {
                        snapshot.groupedValues.emplace(key, *group.latestValue);
                    }
                }
            }
            return snapshot;
        }

        void MetricProcessor::reportErrors(const std::vector<Core::EvaluationError> &errors)
        {
            if (errors.empty())
            {
                return;
            }

            ErrorHandler handler;
            {
                std::lock_guard<std::mutex> lock(m_mutex);
                handler = m_errorHandler;
            }
            if (!handler)
            {
                return;
            }
            for (const auto &error : errors)
            {
                handler(error);
            }
        }

        void MetricProcessor::reportEvictions(const std::vector<std::pair<std::string, std::string>> &evicted)
        {
            if (evicted.empty())
            {
                return;
            }

            EvictionHandler handler;
            {
                std::lock_guard<std::mutex> lock(m_mutex);
                handler = m_evictionHandler;
            }
            if (!handler)
            {
                return;
            }
            for (const auto &[metric, group] : evicted)
            {
                handler(metric, group);
            }
        }

    } // namespace Metrics
} // namespace LogLens
