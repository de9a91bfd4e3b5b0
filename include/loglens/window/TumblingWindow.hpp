#pragma once

#include <vector>

#include "loglens/window/Window.hpp"

namespace LogLens
{
    namespace Window
    {
        /**
         * TumblingWindow
         *
         * Fixed, non-overlapping windows aligned to epoch multiples of the
         * duration (a 5 minute window starts at :00, :05, :10...).
         *
         * Values accumulate in [start, end). The first value at or after end
         * closes the window: one frame is emitted for the buffered values,
         * the window advances past any empty gap and the value starts the new
         * window. Empty windows are never emitted.
         */
        class TumblingWindow final : public Window
        {
        public:
            explicit TumblingWindow(WindowSpec spec);

            std::optional<WindowFrame> admit(double value, Utils::TimePoint ts) override;

            /**
             * Emit the partial current window if it holds values, then move
             * on to the next interval. A span is emitted at most once; later
             * values that fall in a flushed span are dropped as late.
             */
            std::optional<WindowFrame> flush() override;

            void reset() override;

            std::size_t size() const noexcept override { return m_values.size(); }
            Utils::TimePoint start() const noexcept override { return m_start; }
            Utils::TimePoint end() const noexcept override { return m_end; }
            std::optional<Utils::TimePoint> lowerBound() const noexcept override;

            /// Start of the epoch-aligned window containing ts.
            static Utils::TimePoint alignDown(Utils::TimePoint ts, Utils::Duration duration) noexcept;

        private:
            WindowFrame makeFrame() const;

        private:
            std::vector<double> m_values;
            Utils::TimePoint    m_start{};
            Utils::TimePoint    m_end{};
            bool                m_initialized = false;
        };

    } // namespace Window
} // namespace LogLens
