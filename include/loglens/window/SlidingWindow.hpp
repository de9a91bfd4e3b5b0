#pragma once

#include <deque>

#include "loglens/window/Window.hpp"

namespace LogLens
{
    namespace Window
    {
        /**
         * SlidingWindow
         *
         * Continuously advancing window: every admission appends the value,
         * evicts every entry strictly older than (latest - duration) and emits
         * a frame over what remains.
         *
         * Invariant: after each admission, every retained entry has a
         * timestamp >= end() - duration, where end() is the latest timestamp.
         *
         * A value older than the latest admission but still inside the bound
         * is inserted at its ordered position; anything older is dropped.
         */
        class SlidingWindow final : public Window
        {
        public:
            explicit SlidingWindow(WindowSpec spec);

            std::optional<WindowFrame> admit(double value, Utils::TimePoint ts) override;
            std::optional<WindowFrame> flush() override;
            void reset() override;

            std::size_t size() const noexcept override { return m_entries.size(); }
            Utils::TimePoint start() const noexcept override;
            Utils::TimePoint end() const noexcept override;
            std::optional<Utils::TimePoint> lowerBound() const noexcept override;

        private:
            struct Entry
            {
                Utils::TimePoint timestamp;
                double           value;
            };

            void evictExpired();
            WindowFrame makeFrame() const;

        private:
            std::deque<Entry>               m_entries;   // ordered by timestamp, oldest first
            std::optional<Utils::TimePoint> m_latest;
        };

    } // namespace Window
} // namespace LogLens
