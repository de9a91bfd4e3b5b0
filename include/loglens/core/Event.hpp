// Core data model: a single structured log event flowing through the
// window engine, the metric processor and the anomaly detector.
// Events are value types, cheap to store in STL containers and never
// mutated once built by the ingestion layer.

#ifndef LOGLENS_CORE_EVENT_HPP
#define LOGLENS_CORE_EVENT_HPP

#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <variant>

#include "loglens/utils/TimeUtils.hpp"

namespace LogLens
{
namespace Core
{

/**
 * @brief Normalized severity of an event.
 *
 * Parsers map format-specific severities into this set
 * (WARN -> Warning, FATAL -> Critical).
 */
enum class EventLevel : std::uint8_t
{
    Trace = 0,
    Debug,
    Info,
    Warning,
    Error,
    Critical,
    Unknown  ///< Used when the original level cannot be parsed.
};

/// Canonical upper-case name ("WARNING", "ERROR", ...).
const char* toString(EventLevel level) noexcept;

/// Case-insensitive level parsing with aliases; Unknown when unrecognized.
EventLevel parseEventLevel(std::string_view text) noexcept;

class MetadataValue;

/// Metadata mapping; transparent comparator allows lookups by string_view.
using Metadata = std::map<std::string, MetadataValue, std::less<>>;

/**
 * @brief Scalar or nested metadata value attached to an event.
 *
 * Nested objects are held behind a shared pointer to an immutable map, so
 * copying an Event never deep-copies its metadata tree.
 */
class MetadataValue
{
public:
    using Object  = std::shared_ptr<const Metadata>;
    using Storage = std::variant<std::monostate, bool, std::int64_t, double, std::string, Object>;

    MetadataValue() = default;
    MetadataValue(bool value) : m_value(value) {}
    MetadataValue(int value) : m_value(static_cast<std::int64_t>(value)) {}
    MetadataValue(std::int64_t value) : m_value(value) {}
    MetadataValue(double value) : m_value(value) {}
    MetadataValue(std::string value) : m_value(std::move(value)) {}
    MetadataValue(const char* value) : m_value(std::string(value)) {}
    MetadataValue(Metadata object);

    bool isNull() const noexcept { return std::holds_alternative<std::monostate>(m_value); }
    bool isBool() const noexcept { return std::holds_alternative<bool>(m_value); }
    bool isNumber() const noexcept
    {
        return std::holds_alternative<std::int64_t>(m_value) || std::holds_alternative<double>(m_value);
    }
    bool isString() const noexcept { return std::holds_alternative<std::string>(m_value); }
    bool isObject() const noexcept { return std::holds_alternative<Object>(m_value); }

    /// Numeric view of integers and doubles; std::nullopt for anything else.
    std::optional<double> asNumber() const noexcept;

    const bool* asBool() const noexcept { return std::get_if<bool>(&m_value); }
    const std::string* asString() const noexcept { return std::get_if<std::string>(&m_value); }

    /// Nested object, or nullptr for scalars.
    const Metadata* asObject() const noexcept;

    /// Display text used in diagnostics and group keys.
    std::string toString() const;

    const Storage& storage() const noexcept { return m_value; }

private:
    Storage m_value;
};

/**
 * @brief Immutable structured log event.
 *
 * Responsibilities:
 *  - Carry the normalized fields produced by ingestion.
 *  - Provide read access for predicates, group keys and value extractors.
 *
 * Design notes:
 *  - Timestamps use std::chrono::system_clock.
 *  - The event has no identity beyond its fields.
 */
class Event
{
public:
    using TimePoint = Utils::TimePoint;

    Event() = default;

    Event(TimePoint timestamp,
          EventLevel level,
          std::string source,
          std::string message,
          Metadata metadata = {})
        : m_timestamp(timestamp),
          m_level(level),
          m_source(std::move(source)),
          m_message(std::move(message)),
          m_metadata(std::move(metadata))
    {
    }

    const TimePoint& timestamp() const noexcept { return m_timestamp; }
    EventLevel level() const noexcept { return m_level; }
    const std::string& source() const noexcept { return m_source; }
    const std::string& message() const noexcept { return m_message; }
    const Metadata& metadata() const noexcept { return m_metadata; }

    /**
     * @brief Look up a metadata value by key or dotted path.
     *
     * An exact top-level key match wins ("http.status" stored flat);
     * otherwise each dot descends into a nested object. Returns nullptr
     * when any segment is missing.
     */
    const MetadataValue* findMetadata(std::string_view path) const noexcept;

    /// "2024-01-01 10:00:00 ERROR api: message" (message truncated), for diagnostics.
    std::string describe() const;

private:
    TimePoint   m_timestamp{};
    EventLevel  m_level{EventLevel::Unknown};
    std::string m_source;
    std::string m_message;
    Metadata    m_metadata;
};

} // namespace Core
} // namespace LogLens

#endif // LOGLENS_CORE_EVENT_HPP
