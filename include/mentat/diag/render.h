#pragma once

#include <chrono>
#include <mentat/diag/diagnostic.h>
#include <mentat/json/json.h>
#include <optional>
#include <string>
#include <string_view>

namespace mentat::diag
{

/** @brief Render `<source>: <severity>: <message>` followed by a newline. */
[[nodiscard]] std::string render_text(const Diagnostic& diagnostic, std::string_view source);

/**
 * @brief One structured event line.
 *
 * `type` is "log" for diagnostics and "checkpoint" for progress markers;
 * unset optional members are omitted from the rendered object.
 */
struct Event
{
    std::string type = "log";
    std::optional<Severity> level;
    std::optional<std::string> message;
    std::optional<json::Json> data;
    std::optional<std::string> correlation_id;
    std::string ts;
};

/** @brief Render an event as a single compact JSON line ending in a newline. */
[[nodiscard]] std::string render_event(const Event& event);

/** @brief ISO-8601 UTC timestamp with microseconds and a `Z` suffix. */
[[nodiscard]] std::string iso8601_utc(std::chrono::system_clock::time_point tp);

} // namespace mentat::diag
