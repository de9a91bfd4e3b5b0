#include "loglens/window/TumblingWindow.hpp"

namespace LogLens
{
    namespace Window
    {
        TumblingWindow::TumblingWindow(WindowSpec spec)
            : Window(spec)
        {
        }

        Utils::TimePoint TumblingWindow::alignDown(Utils::TimePoint ts, Utils::Duration duration) noexcept
        {
            const auto step = std::chrono::duration_cast<Utils::TimePoint::duration>(duration);
            auto rem = ts.time_since_epoch() % step;
            if (rem < Utils::TimePoint::duration::zero())
            {
                rem += step;
            }
            return ts - rem;
        }

        std::optional<WindowFrame> TumblingWindow::admit(double value, Utils::TimePoint ts)
        {
            if (!m_initialized)
            {
                m_start = alignDown(ts, m_spec.duration);
                m_end = m_start + m_spec.duration;
                m_initialized = true;
            }

            if (ts < m_start)
            {
                ++m_lateDrops;
                return std::nullopt;
            }

            std::optional<WindowFrame> closed;
            if (ts >= m_end)
            {
                if (!m_values.empty())
                {
                    closed = makeFrame();
                }
                m_values.clear();

                // Skip whole empty windows in one step instead of looping per gap.
                const auto skipped = (ts - m_end) / m_spec.duration;
                m_start = m_end + skipped * m_spec.duration;
                m_end = m_start + m_spec.duration;
            }

            m_values.push_back(value);
            return closed;
        }

        std::optional<WindowFrame> TumblingWindow::flush()
        {
            if (m_values.empty())
            {
                return std::nullopt;
            }
            WindowFrame frame = makeFrame();
            m_values.clear();
            m_start = m_end;
            m_end = m_start + m_spec.duration;
            return frame;
        }

        void TumblingWindow::reset()
        {
            m_values.clear();
            m_start = Utils::TimePoint{};
            m_end = Utils::TimePoint{};
            m_initialized = false;
            m_lateDrops = 0;
        }

        std::optional<Utils::TimePoint> TumblingWindow::lowerBound() const noexcept
        {
            if (!m_initialized)
            {
                return std::nullopt;
            }
            return m_start;
        }

        WindowFrame TumblingWindow::makeFrame() const
        {
            WindowFrame frame;
            frame.start = m_start;
            frame.end = m_end;
            frame.values = m_values;
            frame.elapsedSeconds = m_spec.seconds();
            return frame;
        }

    } // namespace Window
} // namespace LogLens
