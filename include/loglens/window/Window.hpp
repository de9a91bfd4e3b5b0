#pragma once

#include <cstddef>
#include <memory>
#include <optional>
#include <string_view>
#include <vector>

#include "loglens/utils/TimeUtils.hpp"

namespace LogLens
{
    namespace Window
    {
        enum class WindowStrategy
        {
            Sliding,
            Tumbling,
        };

        const char *toString(WindowStrategy strategy) noexcept;

        /**
         * Duration and strategy of a metric window.
         *
         * parse() is the configuration entry point and throws
         * Core::ConfigurationError for malformed durations or strategies.
         */
        struct WindowSpec
        {
            Utils::Duration duration{std::chrono::minutes(5)};
            WindowStrategy  strategy = WindowStrategy::Sliding;

            static WindowSpec parse(std::string_view duration,
                                    std::string_view strategy = "sliding");

            double seconds() const noexcept
            {
                return std::chrono::duration<double>(duration).count();
            }

            /// Throws Core::ConfigurationError if the duration is not positive.
            void validate() const;
        };

        /**
         * Snapshot a window hands to an aggregation when it emits.
         *
         * elapsedSeconds is the time base used by rate aggregations: the span
         * covered by the retained entries for sliding windows, the configured
         * duration for tumbling windows.
         */
        struct WindowFrame
        {
            Utils::TimePoint    start;
            Utils::TimePoint    end;
            std::vector<double> values;
            double              elapsedSeconds = 0.0;
        };

        /**
         * Window
         *
         * Common interface of the sliding and tumbling strategies. One
         * instance holds the state of one metric (or one group of a grouped
         * metric) and is never shared.
         *
         * Admission contract:
         *  - Values arrive in non-decreasing timestamp order.
         *  - An event below lowerBound() is dropped without touching the
         *    window; lateDrops() counts those events.
         */
        class Window
        {
        public:
            virtual ~Window() = default;

            Window(const Window &)            = delete;
            Window &operator=(const Window &) = delete;

            /// Admit one value; returns a frame when the window emits.
            virtual std::optional<WindowFrame> admit(double value, Utils::TimePoint ts) = 0;

            /// Emit pending state at end of stream (tumbling only; sliding has nothing pending).
            virtual std::optional<WindowFrame> flush() = 0;

            /// Return to the freshly constructed state.
            virtual void reset() = 0;

            virtual std::size_t size() const noexcept = 0;
            virtual Utils::TimePoint start() const noexcept = 0;
            virtual Utils::TimePoint end() const noexcept = 0;

            /// Oldest timestamp still admissible; std::nullopt before the first admission.
            virtual std::optional<Utils::TimePoint> lowerBound() const noexcept = 0;

            std::size_t lateDrops() const noexcept { return m_lateDrops; }
            const WindowSpec &spec() const noexcept { return m_spec; }

        protected:
            explicit Window(WindowSpec spec);

            WindowSpec  m_spec;
            std::size_t m_lateDrops = 0;
        };

        /// Build the window strategy a WindowSpec names.
        std::unique_ptr<Window> makeWindow(const WindowSpec &spec);

    } // namespace Window
} // namespace LogLens
