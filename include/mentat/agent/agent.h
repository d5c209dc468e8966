#pragma once

#include <functional>
#include <istream>
#include <mentat/agent/documents.h>
#include <mentat/config/build_info.h>
#include <mentat/diag/reporter.h>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>

/**
 * @file agent.h
 * @brief One-shot request processor: JSON in on stdin, JSON out on stdout.
 */

namespace mentat::agent
{

inline constexpr int kExitOk = 0;
inline constexpr int kExitFailure = 1;

/**
 * @brief The replaceable business logic.
 *
 * Must be a pure function of the input text and total over all strings,
 * including empty, non-ASCII and very long input. A transform that throws a
 * std::exception is reported as a processing error.
 */
using Transform = std::function<std::string(std::string_view)>;

/** @brief Reference transform: `"Processed: " + text`. */
[[nodiscard]] std::string echo_transform(std::string_view text);

/** @brief Why a request produced an error document. */
enum class FailureKind
{
    ReadError,      /**< stdin could not be read or was not UTF-8. */
    EmptyInput,     /**< nothing but whitespace on stdin. */
    DecodeError,    /**< not JSON, or not the expected shape. */
    TransformError, /**< the transform threw. */
    EncodeError,    /**< the response could not be serialized. */
};

[[nodiscard]] std::string_view failure_kind_string(FailureKind kind);

struct Options
{
    Transform transform = echo_transform;
    std::string model = std::string(config::agent_id());
};

/** @brief Bytes for stdout plus the exit code that goes with them. */
struct Response
{
    int exit_code = kExitOk;
    std::string body;
    std::optional<FailureKind> failure;
    std::optional<MetaRecord> meta; /**< Metrics of a successful response. */
};

/**
 * @brief Process one raw request.
 *
 * Diagnostics for every step go to `reporter`; the returned body is either a
 * success or an error document and is never empty. Completion of a
 * successful request is reported by `run` once the body has been written.
 */
[[nodiscard]] Response process(std::string_view raw, const Options& options,
                               diag::Reporter& reporter);

/**
 * @brief Read `in` to the end, process it, write the body to `out` and flush.
 *
 * Success is logged only after the flush succeeds. Returns the process exit
 * code.
 */
int run(std::istream& in, std::ostream& out, diag::Reporter& reporter, const Options& options);

} // namespace mentat::agent
