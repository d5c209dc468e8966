#include <charconv>
#include <cmath>
#include <mentat/json/json.h>
#include <mentat/source/line_map.h>
#include <mentat/text/utf8.h>
#include <optional>

namespace mentat::json
{
namespace
{

constexpr bool is_digit(char c)
{
    return c >= '0' && c <= '9';
}

constexpr bool is_json_space(char c)
{
    return c == ' ' || c == '\t' || c == '\n' || c == '\r';
}

struct Parser
{
    std::string_view input;
    std::size_t pos = 0;
    std::optional<ParseError> error;

    [[nodiscard]] bool eof() const { return pos >= input.size(); }

    std::nullopt_t fail(std::string message, std::size_t at)
    {
        if (!error.has_value())
        {
            error = ParseError{.message = std::move(message), .offset = at};
        }
        return std::nullopt;
    }

    std::nullopt_t fail(std::string message) { return fail(std::move(message), pos); }

    void skip_ws()
    {
        while (!eof() && is_json_space(input[pos]))
        {
            ++pos;
        }
    }

    std::optional<Json> parse_literal(std::string_view word, Json value)
    {
        if (input.substr(pos, word.size()) != word)
        {
            return fail("expected value");
        }
        pos += word.size();
        return value;
    }

    std::optional<Json> parse_value(std::size_t depth)
    {
        skip_ws();
        if (eof())
        {
            return fail("EOF while parsing a value");
        }

        switch (input[pos])
        {
        case 'n':
            return parse_literal("null", Json{nullptr});
        case 't':
            return parse_literal("true", Json{true});
        case 'f':
            return parse_literal("false", Json{false});
        case '"':
        {
            auto s = parse_string();
            if (!s.has_value())
            {
                return std::nullopt;
            }
            return Json{std::move(*s)};
        }
        case '[':
            return parse_array(depth + 1);
        case '{':
            return parse_object(depth + 1);
        default:
            break;
        }

        if (input[pos] == '-' || is_digit(input[pos]))
        {
            return parse_number();
        }
        return fail("expected value");
    }

    std::optional<char32_t> parse_hex4()
    {
        if (pos + 4 > input.size())
        {
            return fail("EOF while parsing a string", input.size());
        }
        char32_t cp = 0;
        for (std::size_t i = 0; i < 4; ++i)
        {
            const char c = input[pos + i];
            cp <<= 4;
            if (c >= '0' && c <= '9')
            {
                cp |= static_cast<char32_t>(c - '0');
            }
            else if (c >= 'a' && c <= 'f')
            {
                cp |= static_cast<char32_t>(c - 'a' + 10);
            }
            else if (c >= 'A' && c <= 'F')
            {
                cp |= static_cast<char32_t>(c - 'A' + 10);
            }
            else
            {
                return fail("invalid escape", pos + i);
            }
        }
        pos += 4;
        return cp;
    }

    // Called with pos just past "\u".
    bool parse_unicode_escape(std::string& out)
    {
        const std::size_t escape_start = pos - 2;
        const auto high = parse_hex4();
        if (!high.has_value())
        {
            return false;
        }

        if (*high >= 0xDC00 && *high <= 0xDFFF)
        {
            fail("lone surrogate in hex escape", escape_start);
            return false;
        }

        if (*high < 0xD800 || *high > 0xDBFF)
        {
            text::append_utf8(out, *high);
            return true;
        }

        if (input.substr(pos, 2) != "\\u")
        {
            fail("unexpected end of hex escape", pos);
            return false;
        }
        pos += 2;
        const auto low = parse_hex4();
        if (!low.has_value())
        {
            return false;
        }
        if (*low < 0xDC00 || *low > 0xDFFF)
        {
            fail("lone surrogate in hex escape", escape_start);
            return false;
        }

        text::append_utf8(out, 0x10000 + ((*high - 0xD800) << 10) + (*low - 0xDC00));
        return true;
    }

    std::optional<std::string> parse_string()
    {
        ++pos; // opening quote
        std::string out;
        while (!eof())
        {
            const char c = input[pos];
            if (c == '"')
            {
                ++pos;
                return out;
            }

            if (static_cast<unsigned char>(c) < 0x20)
            {
                return fail("control character (\\u0000-\\u001F) found while parsing a string");
            }

            if (static_cast<unsigned char>(c) >= 0x80)
            {
                const auto step = text::decode_one(input, pos);
                if (!step.valid)
                {
                    return fail("invalid UTF-8 in string");
                }
                out.append(input.substr(pos, step.length));
                pos += step.length;
                continue;
            }

            if (c != '\\')
            {
                out.push_back(c);
                ++pos;
                continue;
            }

            ++pos;
            if (eof())
            {
                break;
            }
            const char esc = input[pos++];
            switch (esc)
            {
            case '"':
                out.push_back('"');
                break;
            case '\\':
                out.push_back('\\');
                break;
            case '/':
                out.push_back('/');
                break;
            case 'b':
                out.push_back('\b');
                break;
            case 'f':
                out.push_back('\f');
                break;
            case 'n':
                out.push_back('\n');
                break;
            case 'r':
                out.push_back('\r');
                break;
            case 't':
                out.push_back('\t');
                break;
            case 'u':
                if (!parse_unicode_escape(out))
                {
                    return std::nullopt;
                }
                break;
            default:
                return fail("invalid escape", pos - 1);
            }
        }
        return fail("EOF while parsing a string", input.size());
    }

    std::optional<Json> parse_number()
    {
        const std::size_t start = pos;
        if (input[pos] == '-')
        {
            ++pos;
        }

        if (eof() || !is_digit(input[pos]))
        {
            return fail("invalid number");
        }
        if (input[pos] == '0')
        {
            ++pos;
            if (!eof() && is_digit(input[pos]))
            {
                return fail("invalid number");
            }
        }
        else
        {
            while (!eof() && is_digit(input[pos]))
            {
                ++pos;
            }
        }

        bool integral = true;
        if (!eof() && input[pos] == '.')
        {
            integral = false;
            ++pos;
            if (eof() || !is_digit(input[pos]))
            {
                return fail("invalid number");
            }
            while (!eof() && is_digit(input[pos]))
            {
                ++pos;
            }
        }

        if (!eof() && (input[pos] == 'e' || input[pos] == 'E'))
        {
            integral = false;
            ++pos;
            if (!eof() && (input[pos] == '+' || input[pos] == '-'))
            {
                ++pos;
            }
            if (eof() || !is_digit(input[pos]))
            {
                return fail("invalid number");
            }
            while (!eof() && is_digit(input[pos]))
            {
                ++pos;
            }
        }

        const char* first = input.data() + start;
        const char* last = input.data() + pos;

        if (integral)
        {
            std::int64_t i = 0;
            const auto [ptr, ec] = std::from_chars(first, last, i);
            if (ec == std::errc{} && ptr == last)
            {
                return Json{i};
            }
            // Too large for int64: fall through and keep it as a double.
        }

        double d = 0.0;
        const auto [ptr, ec] = std::from_chars(first, last, d);
        if (ec == std::errc::result_out_of_range)
        {
            return fail("number out of range", start);
        }
        if (ec != std::errc{} || ptr != last)
        {
            return fail("invalid number", start);
        }
        return Json{d};
    }

    std::optional<Json> parse_array(std::size_t depth)
    {
        if (depth > kMaxDepth)
        {
            return fail("recursion limit exceeded");
        }
        ++pos; // '['

        Json::Array items;
        skip_ws();
        if (!eof() && input[pos] == ']')
        {
            ++pos;
            return Json{std::move(items)};
        }

        while (true)
        {
            auto item = parse_value(depth);
            if (!item.has_value())
            {
                return std::nullopt;
            }
            items.push_back(std::move(*item));

            skip_ws();
            if (eof())
            {
                return fail("EOF while parsing a list");
            }
            if (input[pos] == ']')
            {
                ++pos;
                return Json{std::move(items)};
            }
            if (input[pos] != ',')
            {
                return fail("expected `,` or `]`");
            }
            ++pos;
        }
    }

    std::optional<Json> parse_object(std::size_t depth)
    {
        if (depth > kMaxDepth)
        {
            return fail("recursion limit exceeded");
        }
        ++pos; // '{'

        Json::Object members;
        skip_ws();
        if (!eof() && input[pos] == '}')
        {
            ++pos;
            return Json{std::move(members)};
        }

        while (true)
        {
            skip_ws();
            if (eof())
            {
                return fail("EOF while parsing an object");
            }
            if (input[pos] != '"')
            {
                return fail("key must be a string");
            }
            auto key = parse_string();
            if (!key.has_value())
            {
                return std::nullopt;
            }

            skip_ws();
            if (eof())
            {
                return fail("EOF while parsing an object");
            }
            if (input[pos] != ':')
            {
                return fail("expected `:`");
            }
            ++pos;

            auto member = parse_value(depth);
            if (!member.has_value())
            {
                return std::nullopt;
            }
            members.emplace_back(std::move(*key), std::move(*member));

            skip_ws();
            if (eof())
            {
                return fail("EOF while parsing an object");
            }
            if (input[pos] == '}')
            {
                ++pos;
                return Json{std::move(members)};
            }
            if (input[pos] != ',')
            {
                return fail("expected `,` or `}`");
            }
            ++pos;
        }
    }
};

struct Writer
{
    std::string out;
    std::optional<SerializeError> error;

    void write_string(std::string_view s)
    {
        if (const auto bad = text::find_invalid_utf8(s); bad.has_value())
        {
            error = SerializeError{.message = "string contains invalid UTF-8 at byte " +
                                              std::to_string(*bad)};
            return;
        }

        static constexpr char kHex[] = "0123456789abcdef";
        out.push_back('"');
        for (const char c : s)
        {
            switch (c)
            {
            case '"':
                out += "\\\"";
                break;
            case '\\':
                out += "\\\\";
                break;
            case '\b':
                out += "\\b";
                break;
            case '\f':
                out += "\\f";
                break;
            case '\n':
                out += "\\n";
                break;
            case '\r':
                out += "\\r";
                break;
            case '\t':
                out += "\\t";
                break;
            default:
                if (static_cast<unsigned char>(c) < 0x20)
                {
                    out += "\\u00";
                    out.push_back(kHex[(c >> 4) & 0x0F]);
                    out.push_back(kHex[c & 0x0F]);
                }
                else
                {
                    out.push_back(c);
                }
                break;
            }
        }
        out.push_back('"');
    }

    void write_double(double d)
    {
        if (!std::isfinite(d))
        {
            error = SerializeError{.message = "cannot serialize non-finite number"};
            return;
        }

        char buf[32];
        const auto [ptr, ec] = std::to_chars(buf, buf + sizeof(buf), d);
        if (ec != std::errc{})
        {
            error = SerializeError{.message = "failed to format number"};
            return;
        }
        const std::string_view digits(buf, static_cast<std::size_t>(ptr - buf));
        out.append(digits);
        if (digits.find_first_of(".e") == std::string_view::npos)
        {
            out += ".0";
        }
    }

    void write(const Json& value)
    {
        if (error.has_value())
        {
            return;
        }

        if (value.is_null())
        {
            out += "null";
        }
        else if (const auto* b = std::get_if<bool>(&value.value))
        {
            out += *b ? "true" : "false";
        }
        else if (const auto* i = value.as_integer())
        {
            out += std::to_string(*i);
        }
        else if (const auto* d = value.as_double())
        {
            write_double(*d);
        }
        else if (const auto* s = value.as_string())
        {
            write_string(*s);
        }
        else if (const auto* arr = value.as_array())
        {
            out.push_back('[');
            for (std::size_t idx = 0; idx < arr->size(); ++idx)
            {
                if (idx > 0)
                {
                    out.push_back(',');
                }
                write((*arr)[idx]);
            }
            out.push_back(']');
        }
        else
        {
            out.push_back('{');
            bool first = true;
            for (const auto& [key, member] : *value.as_object())
            {
                if (!first)
                {
                    out.push_back(',');
                }
                first = false;
                write_string(key);
                out.push_back(':');
                write(member);
            }
            out.push_back('}');
        }
    }
};

} // namespace

const Json* Json::find(std::string_view key) const
{
    const auto* members = as_object();
    if (members == nullptr)
    {
        return nullptr;
    }

    for (auto it = members->rbegin(); it != members->rend(); ++it)
    {
        if (it->first == key)
        {
            return &it->second;
        }
    }
    return nullptr;
}

Json& Json::set(std::string key, Json member)
{
    std::get<Object>(value).emplace_back(std::move(key), std::move(member));
    return *this;
}

Json object()
{
    return Json{Json::Object{}};
}

std::string ParseError::describe(std::string_view input) const
{
    const source::LineMap map(input);
    const auto lc = map.offset_to_line_col(offset);
    return message + " at line " + std::to_string(lc.line) + " column " + std::to_string(lc.col);
}

ParseResult parse(std::string_view input)
{
    Parser parser{.input = input};
    auto value = parser.parse_value(0);
    if (!value.has_value())
    {
        return *parser.error;
    }

    parser.skip_ws();
    if (!parser.eof())
    {
        return ParseError{.message = "trailing characters", .offset = parser.pos};
    }
    return std::move(*value);
}

SerializeResult serialize(const Json& value)
{
    Writer writer;
    writer.write(value);
    if (writer.error.has_value())
    {
        return std::move(*writer.error);
    }
    return std::move(writer.out);
}

} // namespace mentat::json
