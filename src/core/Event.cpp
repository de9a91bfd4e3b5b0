#include "loglens/core/Event.hpp"
#include "loglens/utils/StringUtils.hpp"

namespace LogLens
{
namespace Core
{

const char* toString(EventLevel level) noexcept
{
    switch (level)
    {
    case EventLevel::Trace:    return "TRACE";
    case EventLevel::Debug:    return "DEBUG";
    case EventLevel::Info:     return "INFO";
    case EventLevel::Warning:  return "WARNING";
    case EventLevel::Error:    return "ERROR";
    case EventLevel::Critical: return "CRITICAL";
    case EventLevel::Unknown:  return "UNKNOWN";
    }
    return "UNKNOWN";
}

EventLevel parseEventLevel(std::string_view text) noexcept
{
    using Utils::iequals;

    text = Utils::trim(text);
    if (iequals(text, "TRACE"))
        return EventLevel::Trace;
    if (iequals(text, "DEBUG"))
        return EventLevel::Debug;
    if (iequals(text, "INFO") || iequals(text, "NOTICE"))
        return EventLevel::Info;
    if (iequals(text, "WARNING") || iequals(text, "WARN"))
        return EventLevel::Warning;
    if (iequals(text, "ERROR") || iequals(text, "ERR"))
        return EventLevel::Error;
    if (iequals(text, "CRITICAL") || iequals(text, "FATAL") || iequals(text, "CRIT"))
        return EventLevel::Critical;
    return EventLevel::Unknown;
}

// ---------- MetadataValue ----------

MetadataValue::MetadataValue(Metadata object)
    : m_value(std::make_shared<const Metadata>(std::move(object)))
{
}

std::optional<double> MetadataValue::asNumber() const noexcept
{
    if (const auto* i = std::get_if<std::int64_t>(&m_value))
        return static_cast<double>(*i);
    if (const auto* d = std::get_if<double>(&m_value))
        return *d;
    return std::nullopt;
}

const Metadata* MetadataValue::asObject() const noexcept
{
    const auto* object = std::get_if<Object>(&m_value);
    return object ? object->get() : nullptr;
}

std::string MetadataValue::toString() const
{
    if (isNull())
        return "null";
    if (const auto* b = asBool())
        return *b ? "true" : "false";
    if (const auto* i = std::get_if<std::int64_t>(&m_value))
        return std::to_string(*i);
    if (const auto* d = std::get_if<double>(&m_value))
        return Utils::formatNumber(*d);
    if (const auto* s = asString())
        return *s;

    std::string out = "{";
    bool first = true;
    for (const auto& [key, value] : *asObject())
    {
        if (!first)
            out += ", ";
        first = false;
        out += key;
        out += "=";
        out += value.toString();
    }
    out += "}";
    return out;
}

// ---------- Event ----------

const MetadataValue* Event::findMetadata(std::string_view path) const noexcept
{
    if (auto it = m_metadata.find(path); it != m_metadata.end())
    {
        return &it->second;
    }

    const Metadata* current = &m_metadata;
    const MetadataValue* found = nullptr;
    std::size_t start = 0;
    while (start <= path.size())
    {
        if (!current)
        {
            return nullptr;
        }
        const std::size_t dot = path.find('.', start);
        const std::string_view segment =
            path.substr(start, dot == std::string_view::npos ? std::string_view::npos : dot - start);

        auto it = current->find(segment);
        if (it == current->end())
        {
            return nullptr;
        }
        found = &it->second;
        if (dot == std::string_view::npos)
        {
            return found;
        }
        current = found->asObject();
        start = dot + 1;
    }
    return nullptr;
}

std::string Event::describe() const
{
    constexpr std::size_t maxMessage = 80;

    std::string text = Utils::formatTimestamp(m_timestamp);
    text += " ";
    text += toString(m_level);
    if (!m_source.empty())
    {
        text += " ";
        text += m_source;
        text += ":";
    }
    text += " ";
    if (m_message.size() > maxMessage)
    {
        text += m_message.substr(0, maxMessage);
        text += "...";
    }
    else
    {
        text += m_message;
    }
    return text;
}

} // namespace Core
} // namespace LogLens
