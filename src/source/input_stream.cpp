#include <mentat/source/input_stream.h>
#include <mentat/text/utf8.h>
#include <sstream>

namespace mentat::source
{

ReadResult read_all(std::istream& in)
{
    std::ostringstream buffer;
    // operator<< sets failbit on the destination when the source is already empty.
    if (in.peek() != std::istream::traits_type::eof())
    {
        buffer << in.rdbuf();
        // A device error after the first byte is caught by operator<< and lands on `buffer`.
        if (buffer.fail())
        {
            return ReadError{.message = "failed while reading input stream"};
        }
    }

    if (in.bad())
    {
        return ReadError{.message = "failed while reading input stream"};
    }

    std::string bytes = buffer.str();
    if (const auto bad = text::find_invalid_utf8(bytes); bad.has_value())
    {
        return ReadError{.message = "stream did not contain valid UTF-8 (invalid byte at offset " +
                                    std::to_string(*bad) + ")"};
    }

    return bytes;
}

} // namespace mentat::source
