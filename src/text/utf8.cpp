#include <mentat/text/utf8.h>

namespace mentat::text
{
namespace
{

constexpr bool is_continuation(unsigned char c)
{
    return (c & 0xC0U) == 0x80U;
}

} // namespace

DecodeStep decode_one(std::string_view input, std::size_t pos)
{
    if (pos >= input.size())
    {
        return DecodeStep{};
    }

    const auto lead = static_cast<unsigned char>(input[pos]);
    if (lead < 0x80U)
    {
        return DecodeStep{.code_point = lead, .length = 1, .valid = true};
    }

    std::size_t length = 0;
    char32_t cp = 0;
    char32_t min_value = 0;
    if ((lead & 0xE0U) == 0xC0U)
    {
        length = 2;
        cp = lead & 0x1FU;
        min_value = 0x80;
    }
    else if ((lead & 0xF0U) == 0xE0U)
    {
        length = 3;
        cp = lead & 0x0FU;
        min_value = 0x800;
    }
    else if ((lead & 0xF8U) == 0xF0U)
    {
        length = 4;
        cp = lead & 0x07U;
        min_value = 0x10000;
    }
    else
    {
        return DecodeStep{};
    }

    if (pos + length > input.size())
    {
        return DecodeStep{};
    }

    for (std::size_t i = 1; i < length; ++i)
    {
        const auto c = static_cast<unsigned char>(input[pos + i]);
        if (!is_continuation(c))
        {
            return DecodeStep{};
        }
        cp = (cp << 6) | (c & 0x3FU);
    }

    if (cp < min_value || cp > 0x10FFFF || (cp >= 0xD800 && cp <= 0xDFFF))
    {
        return DecodeStep{};
    }

    return DecodeStep{.code_point = cp, .length = length, .valid = true};
}

std::optional<std::size_t> find_invalid_utf8(std::string_view input)
{
    std::size_t pos = 0;
    while (pos < input.size())
    {
        const auto step = decode_one(input, pos);
        if (!step.valid)
        {
            return pos;
        }
        pos += step.length;
    }
    return std::nullopt;
}

void append_utf8(std::string& out, char32_t cp)
{
    if (cp < 0x80)
    {
        out.push_back(static_cast<char>(cp));
    }
    else if (cp < 0x800)
    {
        out.push_back(static_cast<char>(0xC0 | (cp >> 6)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    }
    else if (cp < 0x10000)
    {
        out.push_back(static_cast<char>(0xE0 | (cp >> 12)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    }
    else
    {
        out.push_back(static_cast<char>(0xF0 | (cp >> 18)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 12) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    }
}

bool is_whitespace(char32_t cp)
{
    switch (cp)
    {
    case 0x09:
    case 0x0A:
    case 0x0B:
    case 0x0C:
    case 0x0D:
    case 0x20:
    case 0x85:
    case 0xA0:
    case 0x1680:
    case 0x2028:
    case 0x2029:
    case 0x202F:
    case 0x205F:
    case 0x3000:
        return true;
    default:
        return cp >= 0x2000 && cp <= 0x200A;
    }
}

std::string_view trim(std::string_view input)
{
    std::size_t start = 0;
    while (start < input.size())
    {
        const auto step = decode_one(input, start);
        if (!step.valid || !is_whitespace(step.code_point))
        {
            break;
        }
        start += step.length;
    }

    // Scan forward so multi-byte whitespace at the tail is recognised.
    std::size_t end = start;
    std::size_t pos = start;
    while (pos < input.size())
    {
        const auto step = decode_one(input, pos);
        pos += step.length;
        if (!step.valid || !is_whitespace(step.code_point))
        {
            end = pos;
        }
    }

    return input.substr(start, end - start);
}

std::string to_valid_utf8(std::string_view input)
{
    std::string out;
    out.reserve(input.size());
    std::size_t pos = 0;
    while (pos < input.size())
    {
        const auto step = decode_one(input, pos);
        if (step.valid)
        {
            out.append(input.substr(pos, step.length));
        }
        else
        {
            append_utf8(out, 0xFFFD);
        }
        pos += step.length;
    }
    return out;
}

std::size_t code_point_count(std::string_view input)
{
    std::size_t count = 0;
    std::size_t pos = 0;
    while (pos < input.size())
    {
        pos += decode_one(input, pos).length;
        ++count;
    }
    return count;
}

} // namespace mentat::text
