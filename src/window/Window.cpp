#include "loglens/window/Window.hpp"
#include "loglens/window/SlidingWindow.hpp"
#include "loglens/window/TumblingWindow.hpp"

#include "loglens/core/Errors.hpp"
#include "loglens/utils/StringUtils.hpp"

namespace LogLens
{
    namespace Window
    {
        const char *toString(WindowStrategy strategy) noexcept
        {
            switch (strategy)
            {
            case WindowStrategy::Sliding:  return "sliding";
            case WindowStrategy::Tumbling: return "tumbling";
            }
            return "unknown";
        }

        WindowSpec WindowSpec::parse(std::string_view duration, std::string_view strategy)
        {
            WindowSpec spec;

            const auto parsed = Utils::parseDuration(duration);
            if (!parsed)
            {
                throw Core::ConfigurationError("invalid window duration '" + std::string(duration) +
                                               "' (expected <positive integer><ms|s|m|h|d>)");
            }
            spec.duration = *parsed;

            const std::string_view name = Utils::trim(strategy);
            if (name.empty() || Utils::iequals(name, "sliding"))
            {
                spec.strategy = WindowStrategy::Sliding;
            }
            else if (Utils::iequals(name, "tumbling"))
            {
                spec.strategy = WindowStrategy::Tumbling;
            }
            else
            {
                throw Core::ConfigurationError("unknown window strategy '" + std::string(strategy) +
                                               "' (expected sliding or tumbling)");
            }
            return spec;
        }

        void WindowSpec::validate() const
        {
            if (duration.count() <= 0)
            {
                throw Core::ConfigurationError("window duration must be positive");
            }
        }

        Window::Window(WindowSpec spec)
            : m_spec(spec)
        {
            m_spec.validate();
        }

        std::unique_ptr<Window> makeWindow(const WindowSpec &spec)
        {
            switch (spec.strategy)
            {
            case WindowStrategy::Sliding:
                return std::make_unique<SlidingWindow>(spec);
            case WindowStrategy::Tumbling:
                return std::make_unique<TumblingWindow>(spec);
            }
            throw Core::ConfigurationError("unsupported window strategy");
        }

    } // namespace Window
} // namespace LogLens
