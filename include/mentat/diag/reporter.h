#pragma once

#include <chrono>
#include <functional>
#include <mentat/diag/diagnostic.h>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>

/**
 * @file reporter.h
 * @brief Writes diagnostics and progress checkpoints to a stream (normally stderr).
 */

namespace mentat::diag
{

/** @brief Output format of the diagnostic stream. */
enum class Format
{
    Text,   /**< `<source>: <severity>: <message>` lines. */
    Ndjson, /**< One JSON event object per line. */
};

struct ReporterOptions
{
    Format format = Format::Text;
    std::string source = "mentat_agent";       /**< Prefix for text lines. */
    std::optional<std::string> correlation_id; /**< Stamped on NDJSON events. */
    bool verbose = false;                      /**< Emit Debug diagnostics. */
};

/**
 * @brief Diagnostic sink.
 *
 * Each line is flushed as soon as it is written. Write failures on the
 * diagnostic stream are not reported back to the caller.
 */
class Reporter
{
  public:
    using Clock = std::function<std::chrono::system_clock::time_point()>;

    Reporter(std::ostream& out, ReporterOptions options);

    void report(const Diagnostic& diagnostic);

    void debug(std::string message, std::optional<json::Json> data = std::nullopt);
    void info(std::string message, std::optional<json::Json> data = std::nullopt);
    void error(std::string message, std::optional<json::Json> data = std::nullopt);

    /**
     * @brief Record a progress marker; `progress` is in [0, 1].
     *
     * NDJSON mode emits a `checkpoint` event. Text mode reports it as a Debug
     * diagnostic.
     */
    void checkpoint(std::string_view stage, double progress,
                    std::optional<json::Json> extra = std::nullopt);

    /** @brief Override the timestamp source (tests). */
    void set_clock(Clock clock);

    [[nodiscard]] const ReporterOptions& options() const { return options_; }

  private:
    std::ostream& out_;
    ReporterOptions options_;
    Clock clock_;

    void write_line(const std::string& line);
};

} // namespace mentat::diag
