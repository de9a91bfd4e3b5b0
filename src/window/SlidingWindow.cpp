#include "loglens/window/SlidingWindow.hpp"

#include <algorithm>

namespace LogLens
{
    namespace Window
    {
        SlidingWindow::SlidingWindow(WindowSpec spec)
            : Window(spec)
        {
        }

        std::optional<WindowFrame> SlidingWindow::admit(double value, Utils::TimePoint ts)
        {
            if (m_latest && ts < *m_latest - m_spec.duration)
            {
                ++m_lateDrops;
                return std::nullopt;
            }

            if (!m_latest || ts >= *m_latest)
            {
                m_entries.push_back(Entry{ts, value});
                m_latest = ts;
            }
            else
            {
                // Late but still inside the window: keep the deque ordered.
                auto pos = std::upper_bound(
                    m_entries.begin(), m_entries.end(), ts,
                    [](Utils::TimePoint t, const Entry &e) { return t < e.timestamp; });
                m_entries.insert(pos, Entry{ts, value});
            }

            evictExpired();
            return makeFrame();
        }

        std::optional<WindowFrame> SlidingWindow::flush()
        {
            // Every admission already emitted; nothing is pending.
            return std::nullopt;
        }

        void SlidingWindow::reset()
        {
            m_entries.clear();
            m_latest.reset();
            m_lateDrops = 0;
        }

        Utils::TimePoint SlidingWindow::start() const noexcept
        {
            return m_latest ? *m_latest - m_spec.duration : Utils::TimePoint{};
        }

        Utils::TimePoint SlidingWindow::end() const noexcept
        {
            return m_latest.value_or(Utils::TimePoint{});
        }

        std::optional<Utils::TimePoint> SlidingWindow::lowerBound() const noexcept
        {
            if (!m_latest)
            {
                return std::nullopt;
            }
            return *m_latest - m_spec.duration;
        }

        void SlidingWindow::evictExpired()
        {
            const Utils::TimePoint cutoff = *m_latest - m_spec.duration;
            while (!m_entries.empty() && m_entries.front().timestamp < cutoff)
            {
                m_entries.pop_front();
            }
        }

        WindowFrame SlidingWindow::makeFrame() const
        {
            WindowFrame frame;
            frame.start = start();
            frame.end = end();
            frame.values.reserve(m_entries.size());
            for (const auto &entry : m_entries)
            {
                frame.values.push_back(entry.value);
            }
            if (!m_entries.empty())
            {
                frame.elapsedSeconds = Utils::elapsedSeconds(m_entries.front().timestamp,
                                                             m_entries.back().timestamp);
            }
            return frame;
        }

    } // namespace Window
} // namespace LogLens
