#pragma once

#include <cstddef>
#include <mentat/json/json.h>
#include <optional>
#include <string>
#include <string_view>
#include <variant>

/**
 * @file documents.h
 * @brief The request and response documents exchanged over stdin/stdout.
 *
 * Wire shapes:
 *
 *     request:  {"text": string?}
 *     success:  {"result": string, "mentat_meta": {...}}
 *     error:    {"error": string, "mentat_meta": {...}}
 *     meta:     {"tokens_input": int|null, "tokens_output": int|null,
 *                "seconds": number|null, "model": string}
 */

namespace mentat::agent
{

/** @brief Decoded request. An absent or null `text` decodes to the empty string. */
struct InputDocument
{
    std::string text;
};

/** @brief Metrics envelope attached to every response. */
struct MetaRecord
{
    std::optional<std::size_t> tokens_input;
    std::optional<std::size_t> tokens_output;
    std::optional<double> seconds;
    std::string model;
};

struct SuccessDocument
{
    std::string result;
    MetaRecord meta;
};

struct ErrorDocument
{
    std::string error;
    MetaRecord meta;
};

/** @brief A document did not have the expected shape (or was not JSON at all). */
struct DecodeError
{
    std::string message;
};

using InputDecodeResult = std::variant<InputDocument, DecodeError>;
using ResponseDecodeResult = std::variant<SuccessDocument, ErrorDocument, DecodeError>;

/** @brief Map a parsed request value onto an InputDocument. */
[[nodiscard]] InputDecodeResult decode_input(const json::Json& value);

/** @brief Meta record for an error response: only `model` is set. */
[[nodiscard]] MetaRecord error_meta(std::string model);

[[nodiscard]] json::Json to_json(const InputDocument& doc);
[[nodiscard]] json::Json to_json(const MetaRecord& meta);
[[nodiscard]] json::Json to_json(const SuccessDocument& doc);
[[nodiscard]] json::Json to_json(const ErrorDocument& doc);

/** @brief Encode a success response; fails if the result is not valid UTF-8. */
[[nodiscard]] json::SerializeResult encode(const SuccessDocument& doc);

/**
 * @brief Encode an error response.
 *
 * Invalid UTF-8 in the message is replaced with U+FFFD, so this cannot fail.
 */
[[nodiscard]] std::string encode(const ErrorDocument& doc);

/** @brief Decode a response written by an agent (used by callers and tests). */
[[nodiscard]] ResponseDecodeResult decode_response(std::string_view body);

} // namespace mentat::agent
