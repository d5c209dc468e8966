#pragma once

#include <istream>
#include <string>
#include <variant>

/**
 * @file input_stream.h
 * @brief Read an entire request stream into memory.
 */

namespace mentat::source
{

/** @brief Error returned when the request stream cannot be read. */
struct ReadError
{
    std::string message;
};

using ReadResult = std::variant<std::string, ReadError>;

/**
 * @brief Read `in` to end-of-stream.
 *
 * Fails if the stream reports an I/O error or the bytes are not valid UTF-8.
 */
ReadResult read_all(std::istream& in);

} // namespace mentat::source
