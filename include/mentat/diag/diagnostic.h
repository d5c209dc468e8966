#pragma once

#include <mentat/json/json.h>
#include <optional>
#include <string>
#include <string_view>

/**
 * @file diagnostic.h
 * @brief Diagnostic records written to the agent's standard error.
 *
 * Diagnostics are informational only; they never form part of the response
 * contract on standard output.
 */

namespace mentat::diag
{

/** @brief Severity level for a diagnostic. */
enum class Severity
{
    Debug,
    Info,
    Warning,
    Error,
};

/** @brief Lower-case name used in both text and NDJSON output. */
[[nodiscard]] std::string_view severity_string(Severity severity);

/** @brief A diagnostic message with optional structured payload. */
struct Diagnostic
{
    Severity severity = Severity::Info;
    std::string message;
    std::optional<json::Json> data; /**< Object payload; only rendered in NDJSON mode. */
};

} // namespace mentat::diag
