#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>

/**
 * @file utf8.h
 * @brief UTF-8 decoding, validation and Unicode whitespace helpers.
 */

namespace mentat::text
{

/** @brief One decoded code point and the number of bytes it occupied. */
struct DecodeStep
{
    char32_t code_point = 0;
    std::size_t length = 1; /**< Always >= 1 so callers can make progress on bad input. */
    bool valid = false;
};

/**
 * @brief Decode the code point starting at byte `pos` of `input`.
 *
 * Overlong forms, surrogate code points and values above U+10FFFF are rejected.
 * An invalid sequence reports `valid = false` and a length of 1.
 */
[[nodiscard]] DecodeStep decode_one(std::string_view input, std::size_t pos);

/** @brief Byte offset of the first invalid UTF-8 sequence, or nullopt if `input` is valid. */
[[nodiscard]] std::optional<std::size_t> find_invalid_utf8(std::string_view input);

/** @brief Append the UTF-8 encoding of `cp` to `out`. */
void append_utf8(std::string& out, char32_t cp);

/** @brief True for code points with the Unicode White_Space property. */
[[nodiscard]] bool is_whitespace(char32_t cp);

/** @brief Strip leading and trailing Unicode whitespace. */
[[nodiscard]] std::string_view trim(std::string_view input);

/** @brief Copy of `input` with each invalid byte replaced by U+FFFD. */
[[nodiscard]] std::string to_valid_utf8(std::string_view input);

/** @brief Number of code points in `input`; invalid bytes count as one each. */
[[nodiscard]] std::size_t code_point_count(std::string_view input);

} // namespace mentat::text
