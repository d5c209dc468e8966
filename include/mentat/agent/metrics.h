#pragma once

#include <cstddef>
#include <string_view>

namespace mentat::agent
{

/**
 * @brief Count whitespace-delimited tokens in `text`.
 *
 * Whitespace is the Unicode White_Space set, so the count does not change when
 * leading or trailing whitespace is added. Empty text has zero tokens.
 */
[[nodiscard]] std::size_t count_tokens(std::string_view text);

/** @brief Round a duration in seconds to 3 decimal places (half away from zero). */
[[nodiscard]] double round_seconds(double seconds);

} // namespace mentat::agent
