#include <cmath>
#include <mentat/agent/metrics.h>
#include <mentat/text/utf8.h>

namespace mentat::agent
{

std::size_t count_tokens(std::string_view text)
{
    std::size_t tokens = 0;
    bool in_token = false;
    std::size_t pos = 0;
    while (pos < text.size())
    {
        const auto step = text::decode_one(text, pos);
        pos += step.length;
        if (step.valid && text::is_whitespace(step.code_point))
        {
            in_token = false;
            continue;
        }
        if (!in_token)
        {
            ++tokens;
            in_token = true;
        }
    }
    return tokens;
}

double round_seconds(double seconds)
{
    return std::round(seconds * 1000.0) / 1000.0;
}

} // namespace mentat::agent
