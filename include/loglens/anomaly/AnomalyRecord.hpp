// Output data model of the anomaly detector: one flagged metric value
// together with the baseline it was scored against.

#ifndef LOGLENS_ANOMALY_ANOMALY_RECORD_HPP
#define LOGLENS_ANOMALY_ANOMALY_RECORD_HPP

#include <cstddef>
#include <cstdint>
#include <string>

#include "loglens/utils/TimeUtils.hpp"

namespace LogLens
{
namespace Anomaly
{

/// Whether the value sits above or below its baseline.
enum class Direction : std::uint8_t
{
    Spike = 0,
    Drop
};

/**
 * @brief Severity band derived from |z| as a multiple of the threshold.
 *
 * Bands are monotonic: a larger |z| never maps to a lower severity.
 */
enum class Severity : std::uint8_t
{
    Low = 0,
    Medium,
    High,
    Critical
};

enum class DetectorState : std::uint8_t
{
    WarmingUp = 0,  ///< Fewer than min_samples values seen.
    Active          ///< Baseline established, detection enabled.
};

const char* toString(Direction direction) noexcept;
const char* toString(Severity severity) noexcept;
const char* toString(DetectorState state) noexcept;

/**
 * @brief One anomalous metric value.
 *
 * baselineMean and baselineStd describe the values seen *before* this one.
 * zScore is +/-infinity when the baseline had zero variance.
 */
struct AnomalyRecord
{
    std::string      metricName;
    double           value = 0.0;
    double           baselineMean = 0.0;
    double           baselineStd = 0.0;
    double           zScore = 0.0;
    Direction        direction = Direction::Spike;
    Severity         severity = Severity::Low;
    Utils::TimePoint timestamp{};
    std::string      explanation;  ///< Human-readable summary for alerts.
};

/// Introspection snapshot of a detector; obtaining it has no side effects.
struct BaselineStats
{
    double        mean = 0.0;
    double        stdDev = 0.0;
    std::size_t   sampleCount = 0;
    std::size_t   windowSize = 0;
    DetectorState state = DetectorState::WarmingUp;
};

} // namespace Anomaly
} // namespace LogLens

#endif // LOGLENS_ANOMALY_ANOMALY_RECORD_HPP
