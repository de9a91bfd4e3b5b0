// Error taxonomy of the metric and anomaly engine.
//
// ConfigurationError is raised while building processors and detectors and
// rejects the configuration as a whole. EvaluationError is raised while a
// single event is evaluated for a single metric; the metric processor
// recovers from it and keeps processing the stream.

#ifndef LOGLENS_CORE_ERRORS_HPP
#define LOGLENS_CORE_ERRORS_HPP

#include <stdexcept>
#include <string>

namespace LogLens
{
namespace Core
{

/// Base class of every error thrown by the engine.
class LogLensError : public std::runtime_error
{
public:
    explicit LogLensError(const std::string& message)
        : std::runtime_error(message)
    {
    }
};

/// Invalid metric or detector setup (unknown aggregation, bad duration, missing extractor...).
class ConfigurationError : public LogLensError
{
public:
    explicit ConfigurationError(const std::string& message)
        : LogLensError("configuration error: " + message),
          m_reason(message)
    {
    }

    /// Message without the "configuration error: " prefix.
    const std::string& reason() const noexcept { return m_reason; }

private:
    std::string m_reason;
};

/**
 * @brief A filter, group key, value extractor or reducer failed on one event.
 *
 * Carries the metric being evaluated and a one-line description of the
 * offending event. Both are empty when the error is raised by the
 * expression layer, which has no notion of metrics; the metric processor
 * re-tags it before reporting.
 */
class EvaluationError : public LogLensError
{
public:
    explicit EvaluationError(const std::string& message)
        : LogLensError(message),
          m_reason(message)
    {
    }

    EvaluationError(const std::string& metricName,
                    const std::string& eventDescription,
                    const std::string& reason)
        : LogLensError("metric '" + metricName + "' failed on event [" +
                       eventDescription + "]: " + reason),
          m_metricName(metricName),
          m_eventDescription(eventDescription),
          m_reason(reason)
    {
    }

    const std::string& metricName() const noexcept { return m_metricName; }
    const std::string& eventDescription() const noexcept { return m_eventDescription; }
    const std::string& reason() const noexcept { return m_reason; }

private:
    std::string m_metricName;
    std::string m_eventDescription;
    std::string m_reason;
};

} // namespace Core
} // namespace LogLens

#endif // LOGLENS_CORE_ERRORS_HPP
