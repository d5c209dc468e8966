#include <mentat/agent/documents.h>
#include <mentat/text/utf8.h>

namespace mentat::agent
{
namespace
{

std::string_view type_name(const json::Json& value)
{
    if (value.is_null())
    {
        return "null";
    }
    if (value.is_bool())
    {
        return "boolean";
    }
    if (value.is_integer())
    {
        return "integer";
    }
    if (value.is_double())
    {
        return "floating point";
    }
    if (value.is_string())
    {
        return "string";
    }
    if (value.is_array())
    {
        return "array";
    }
    return "object";
}

DecodeError invalid_type(const json::Json& value, std::string_view expected)
{
    return DecodeError{.message = "invalid type: " + std::string(type_name(value)) +
                                  ", expected " + std::string(expected)};
}

json::Json optional_count(const std::optional<std::size_t>& count)
{
    if (!count.has_value())
    {
        return json::Json{nullptr};
    }
    return json::Json{static_cast<std::int64_t>(*count)};
}

std::variant<std::optional<std::size_t>, DecodeError> read_count(const json::Json& meta,
                                                                 std::string_view key)
{
    const auto* member = meta.find(key);
    if (member == nullptr || member->is_null())
    {
        return std::optional<std::size_t>{};
    }
    const auto* i = member->as_integer();
    if (i == nullptr || *i < 0)
    {
        return invalid_type(*member, "a non-negative integer for `" + std::string(key) + "`");
    }
    return std::optional<std::size_t>{static_cast<std::size_t>(*i)};
}

std::variant<MetaRecord, DecodeError> read_meta(const json::Json& top)
{
    const auto* meta = top.find("mentat_meta");
    if (meta == nullptr)
    {
        return DecodeError{.message = "missing field `mentat_meta`"};
    }
    if (!meta->is_object())
    {
        return invalid_type(*meta, "an object for `mentat_meta`");
    }

    MetaRecord record;

    const auto* model = meta->find("model");
    if (model == nullptr)
    {
        return DecodeError{.message = "missing field `model`"};
    }
    if (!model->is_string())
    {
        return invalid_type(*model, "a string for `model`");
    }
    record.model = *model->as_string();

    auto tokens_in = read_count(*meta, "tokens_input");
    if (auto* err = std::get_if<DecodeError>(&tokens_in))
    {
        return *err;
    }
    record.tokens_input = std::get<std::optional<std::size_t>>(tokens_in);

    auto tokens_out = read_count(*meta, "tokens_output");
    if (auto* err = std::get_if<DecodeError>(&tokens_out))
    {
        return *err;
    }
    record.tokens_output = std::get<std::optional<std::size_t>>(tokens_out);

    if (const auto* seconds = meta->find("seconds"); seconds != nullptr && !seconds->is_null())
    {
        if (const auto* d = seconds->as_double())
        {
            record.seconds = *d;
        }
        else if (const auto* i = seconds->as_integer())
        {
            record.seconds = static_cast<double>(*i);
        }
        else
        {
            return invalid_type(*seconds, "a number for `seconds`");
        }
    }

    return record;
}

} // namespace

InputDecodeResult decode_input(const json::Json& value)
{
    if (!value.is_object())
    {
        return invalid_type(value, "an object");
    }

    InputDocument doc;
    const auto* member = value.find("text");
    if (member == nullptr || member->is_null())
    {
        return doc;
    }
    if (!member->is_string())
    {
        return invalid_type(*member, "a string for field `text`");
    }
    doc.text = *member->as_string();
    return doc;
}

MetaRecord error_meta(std::string model)
{
    return MetaRecord{
        .tokens_input = std::nullopt,
        .tokens_output = std::nullopt,
        .seconds = std::nullopt,
        .model = std::move(model),
    };
}

json::Json to_json(const InputDocument& doc)
{
    auto out = json::object();
    out.set("text", json::Json{doc.text});
    return out;
}

json::Json to_json(const MetaRecord& meta)
{
    auto out = json::object();
    out.set("tokens_input", optional_count(meta.tokens_input));
    out.set("tokens_output", optional_count(meta.tokens_output));
    out.set("seconds", meta.seconds.has_value() ? json::Json{*meta.seconds} : json::Json{nullptr});
    out.set("model", json::Json{meta.model});
    return out;
}

json::Json to_json(const SuccessDocument& doc)
{
    auto out = json::object();
    out.set("result", json::Json{doc.result});
    out.set("mentat_meta", to_json(doc.meta));
    return out;
}

json::Json to_json(const ErrorDocument& doc)
{
    auto out = json::object();
    out.set("error", json::Json{doc.error});
    out.set("mentat_meta", to_json(doc.meta));
    return out;
}

json::SerializeResult encode(const SuccessDocument& doc)
{
    return json::serialize(to_json(doc));
}

std::string encode(const ErrorDocument& doc)
{
    ErrorDocument clean = doc;
    clean.error = text::to_valid_utf8(doc.error);
    clean.meta.model = text::to_valid_utf8(doc.meta.model);
    return std::get<std::string>(json::serialize(to_json(clean)));
}

ResponseDecodeResult decode_response(std::string_view body)
{
    const auto parsed = json::parse(body);
    if (const auto* err = std::get_if<json::ParseError>(&parsed))
    {
        return DecodeError{.message = err->describe(body)};
    }

    const auto& top = std::get<json::Json>(parsed);
    if (!top.is_object())
    {
        return invalid_type(top, "an object");
    }

    auto meta = read_meta(top);
    if (auto* err = std::get_if<DecodeError>(&meta))
    {
        return *err;
    }
    auto& record = std::get<MetaRecord>(meta);

    if (const auto* result = top.find("result"); result != nullptr)
    {
        if (!result->is_string())
        {
            return invalid_type(*result, "a string for `result`");
        }
        return SuccessDocument{.result = *result->as_string(), .meta = std::move(record)};
    }

    if (const auto* error = top.find("error"); error != nullptr)
    {
        if (!error->is_string())
        {
            return invalid_type(*error, "a string for `error`");
        }
        return ErrorDocument{.error = *error->as_string(), .meta = std::move(record)};
    }

    return DecodeError{.message = "missing field `result` or `error`"};
}

} // namespace mentat::agent
