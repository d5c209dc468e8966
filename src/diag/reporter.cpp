#include <cstdio>
#include <mentat/diag/render.h>
#include <mentat/diag/reporter.h>

namespace mentat::diag
{

Reporter::Reporter(std::ostream& out, ReporterOptions options)
    : out_(out), options_(std::move(options)), clock_([] { return std::chrono::system_clock::now(); })
{
}

void Reporter::report(const Diagnostic& diagnostic)
{
    if (diagnostic.severity == Severity::Debug && !options_.verbose)
    {
        return;
    }

    if (options_.format == Format::Text)
    {
        write_line(render_text(diagnostic, options_.source));
        return;
    }

    write_line(render_event(Event{
        .type = "log",
        .level = diagnostic.severity,
        .message = diagnostic.message,
        .data = diagnostic.data,
        .correlation_id = options_.correlation_id,
        .ts = iso8601_utc(clock_()),
    }));
}

void Reporter::debug(std::string message, std::optional<json::Json> data)
{
    report(Diagnostic{
        .severity = Severity::Debug, .message = std::move(message), .data = std::move(data)});
}

void Reporter::info(std::string message, std::optional<json::Json> data)
{
    report(Diagnostic{
        .severity = Severity::Info, .message = std::move(message), .data = std::move(data)});
}

void Reporter::error(std::string message, std::optional<json::Json> data)
{
    report(Diagnostic{
        .severity = Severity::Error, .message = std::move(message), .data = std::move(data)});
}

void Reporter::checkpoint(std::string_view stage, double progress, std::optional<json::Json> extra)
{
    if (options_.format == Format::Text)
    {
        char pct[16];
        std::snprintf(pct, sizeof(pct), "%.0f%%", progress * 100.0);
        debug("checkpoint " + std::string(stage) + " " + pct);
        return;
    }

    auto payload = json::object();
    payload.set("stage", json::Json{std::string(stage)});
    payload.set("progress", json::Json{progress});
    if (extra.has_value())
    {
        if (const auto* members = extra->as_object())
        {
            for (const auto& [key, value] : *members)
            {
                payload.set(key, value);
            }
        }
    }

    write_line(render_event(Event{
        .type = "checkpoint",
        .level = std::nullopt,
        .message = std::nullopt,
        .data = std::move(payload),
        .correlation_id = options_.correlation_id,
        .ts = iso8601_utc(clock_()),
    }));
}

void Reporter::set_clock(Clock clock)
{
    clock_ = std::move(clock);
}

void Reporter::write_line(const std::string& line)
{
    out_ << line;
    out_.flush();
}

} // namespace mentat::diag
