#pragma once

#include <cstddef>
#include <string_view>
#include <vector>

/**
 * @file line_map.h
 * @brief Maps byte offsets within an input document to line/column positions.
 */

namespace mentat::source
{

/**
 * @brief A 1-based line/column pair.
 *
 * Columns count UTF-8 code points, not bytes.
 */
struct LineCol
{
    std::size_t line = 1;
    std::size_t col = 1;
};

/** @brief Precomputes line start offsets for offset-to-line/col queries. */
class LineMap
{
  public:
    explicit LineMap(std::string_view text);

    /** @brief Convert a byte offset into a LineCol; offsets past the end are clamped. */
    [[nodiscard]] LineCol offset_to_line_col(std::size_t offset) const;
    [[nodiscard]] std::size_t line_count() const;

  private:
    std::string_view text_;
    std::vector<std::size_t> line_starts_; // byte offset of each line start, first line included
};

} // namespace mentat::source
