#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

/**
 * @file json.h
 * @brief JSON value type with a strict parser and a compact serializer.
 *
 * Objects preserve insertion order so documents are written back with the
 * same member order they were built with.
 */

namespace mentat::json
{

/** @brief A JSON value. Integers without fraction or exponent are kept as int64. */
struct Json
{
    using Array = std::vector<Json>;
    using Object = std::vector<std::pair<std::string, Json>>;

    std::variant<std::nullptr_t, bool, std::int64_t, double, std::string, Array, Object> value;

    [[nodiscard]] bool is_null() const { return std::holds_alternative<std::nullptr_t>(value); }
    [[nodiscard]] bool is_bool() const { return std::holds_alternative<bool>(value); }
    [[nodiscard]] bool is_integer() const { return std::holds_alternative<std::int64_t>(value); }
    [[nodiscard]] bool is_double() const { return std::holds_alternative<double>(value); }
    [[nodiscard]] bool is_number() const { return is_integer() || is_double(); }
    [[nodiscard]] bool is_string() const { return std::holds_alternative<std::string>(value); }
    [[nodiscard]] bool is_array() const { return std::holds_alternative<Array>(value); }
    [[nodiscard]] bool is_object() const { return std::holds_alternative<Object>(value); }

    [[nodiscard]] const std::string* as_string() const { return std::get_if<std::string>(&value); }
    [[nodiscard]] const std::int64_t* as_integer() const
    {
        return std::get_if<std::int64_t>(&value);
    }
    [[nodiscard]] const double* as_double() const { return std::get_if<double>(&value); }
    [[nodiscard]] const Array* as_array() const { return std::get_if<Array>(&value); }
    [[nodiscard]] const Object* as_object() const { return std::get_if<Object>(&value); }

    /**
     * @brief Look up an object member; returns nullptr if absent or not an object.
     *
     * With duplicate keys the last member wins.
     */
    [[nodiscard]] const Json* find(std::string_view key) const;

    /** @brief Append a member to an object value. */
    Json& set(std::string key, Json member);
};

/** @brief Construct an empty object value. */
[[nodiscard]] Json object();

/** @brief Parse failure, positioned at a byte offset of the input. */
struct ParseError
{
    std::string message;
    std::size_t offset = 0;

    /** @brief Render as `<message> at line L column C` for the given input text. */
    [[nodiscard]] std::string describe(std::string_view input) const;
};

using ParseResult = std::variant<Json, ParseError>;

/** @brief Maximum nesting of arrays and objects accepted by `parse`. */
inline constexpr std::size_t kMaxDepth = 128;

/** @brief Parse exactly one JSON value (surrounding whitespace allowed). */
[[nodiscard]] ParseResult parse(std::string_view input);

/** @brief Serialization failure (invalid UTF-8 string or non-finite number). */
struct SerializeError
{
    std::string message;
};

using SerializeResult = std::variant<std::string, SerializeError>;

/** @brief Serialize compactly (no insignificant whitespace). */
[[nodiscard]] SerializeResult serialize(const Json& value);

} // namespace mentat::json
