#include <algorithm>
#include <mentat/source/line_map.h>
#include <mentat/text/utf8.h>

namespace mentat::source
{

LineMap::LineMap(std::string_view text) : text_(text)
{
    line_starts_.push_back(0);
    for (std::size_t i = 0; i < text.size(); ++i)
    {
        if (text[i] == '\n')
        {
            line_starts_.push_back(i + 1);
        }
    }
}

LineCol LineMap::offset_to_line_col(std::size_t offset) const
{
    offset = std::min(offset, text_.size());

    // Last line start <= offset; line_starts_[0] == 0 so this never returns begin().
    const auto it = std::upper_bound(line_starts_.begin(), line_starts_.end(), offset);
    const auto index = static_cast<std::size_t>(std::distance(line_starts_.begin(), it) - 1);
    const std::size_t start = line_starts_[index];

    const std::size_t chars = text::code_point_count(text_.substr(start, offset - start));
    return LineCol{.line = index + 1, .col = 1 + chars};
}

std::size_t LineMap::line_count() const
{
    return line_starts_.size();
}

} // namespace mentat::source
