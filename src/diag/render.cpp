#include <ctime>
#include <iomanip>
#include <mentat/diag/render.h>
#include <sstream>
#include <variant>

namespace mentat::diag
{

std::string_view severity_string(Severity severity)
{
    switch (severity)
    {
    case Severity::Debug:
        return "debug";
    case Severity::Info:
        return "info";
    case Severity::Warning:
        return "warn";
    case Severity::Error:
        return "error";
    }
    return "error";
}

std::string render_text(const Diagnostic& diagnostic, std::string_view source)
{
    std::ostringstream out;
    out << source << ": " << severity_string(diagnostic.severity) << ": " << diagnostic.message
        << "\n";
    return out.str();
}

std::string render_event(const Event& event)
{
    auto evt = json::object();
    evt.set("type", json::Json{event.type});
    if (event.level.has_value())
    {
        evt.set("level", json::Json{std::string(severity_string(*event.level))});
    }
    if (event.message.has_value())
    {
        evt.set("message", json::Json{*event.message});
    }
    if (event.data.has_value())
    {
        evt.set("data", *event.data);
    }
    if (event.correlation_id.has_value() && !event.correlation_id->empty())
    {
        evt.set("correlation_id", json::Json{*event.correlation_id});
    }
    evt.set("ts", json::Json{event.ts});

    auto encoded = json::serialize(evt);
    if (auto* err = std::get_if<json::SerializeError>(&encoded))
    {
        // Keep the line well-formed even when a payload cannot be encoded.
        auto fallback = json::object();
        fallback.set("type", json::Json{std::string("log")});
        fallback.set("level", json::Json{std::string("error")});
        fallback.set("message", json::Json{"unencodable diagnostic: " + err->message});
        fallback.set("ts", json::Json{event.ts});
        encoded = json::serialize(fallback);
    }

    return std::get<std::string>(encoded) + "\n";
}

std::string iso8601_utc(std::chrono::system_clock::time_point tp)
{
    const auto since_epoch = tp.time_since_epoch();
    const auto secs = std::chrono::floor<std::chrono::seconds>(since_epoch);
    const auto micros = std::chrono::duration_cast<std::chrono::microseconds>(since_epoch - secs);

    const std::time_t raw = static_cast<std::time_t>(secs.count());
    std::tm tm{};
    gmtime_r(&raw, &tm);

    std::ostringstream out;
    out << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S") << '.' << std::setfill('0') << std::setw(6)
        << micros.count() << 'Z';
    return out.str();
}

} // namespace mentat::diag
