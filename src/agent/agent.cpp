#include <chrono>
#include <exception>
#include <mentat/agent/agent.h>
#include <mentat/agent/metrics.h>
#include <mentat/json/json.h>
#include <mentat/source/input_stream.h>
#include <mentat/text/utf8.h>

namespace mentat::agent
{
namespace
{

constexpr std::string_view kNoInput = "No input received from stdin";

Response failure(FailureKind kind, std::string message, const Options& options)
{
    const ErrorDocument doc{.error = std::move(message), .meta = error_meta(options.model)};
    return Response{.exit_code = kExitFailure, .body = encode(doc), .failure = kind};
}

json::Json counts(std::size_t tokens_input, std::size_t tokens_output)
{
    auto data = json::object();
    data.set("tokens_input", json::Json{static_cast<std::int64_t>(tokens_input)});
    data.set("tokens_output", json::Json{static_cast<std::int64_t>(tokens_output)});
    return data;
}

} // namespace

std::string echo_transform(std::string_view text)
{
    return "Processed: " + std::string(text);
}

std::string_view failure_kind_string(FailureKind kind)
{
    switch (kind)
    {
    case FailureKind::ReadError:
        return "read_error";
    case FailureKind::EmptyInput:
        return "empty_input";
    case FailureKind::DecodeError:
        return "decode_error";
    case FailureKind::TransformError:
        return "transform_error";
    case FailureKind::EncodeError:
        return "encode_error";
    }
    return "unknown";
}

Response process(std::string_view raw, const Options& options, diag::Reporter& reporter)
{
    const std::string_view trimmed = text::trim(raw);
    if (trimmed.empty())
    {
        reporter.error(std::string(kNoInput));
        return failure(FailureKind::EmptyInput, std::string(kNoInput), options);
    }

    const auto parsed = json::parse(trimmed);
    if (const auto* err = std::get_if<json::ParseError>(&parsed))
    {
        const std::string detail = err->describe(trimmed);
        reporter.error("JSON parse error: " + detail);
        return failure(FailureKind::DecodeError, "Invalid JSON input: " + detail, options);
    }
    const auto& request = std::get<json::Json>(parsed);

    const auto decoded = decode_input(request);
    if (const auto* err = std::get_if<DecodeError>(&decoded))
    {
        reporter.error("JSON parse error: " + err->message);
        return failure(FailureKind::DecodeError, "Invalid JSON input: " + err->message, options);
    }
    const auto& input = std::get<InputDocument>(decoded);

    // Decoded text comes from the parser, so it is valid UTF-8 and always encodes.
    const auto echoed = json::serialize(to_json(input));
    if (const auto* line = std::get_if<std::string>(&echoed))
    {
        reporter.info("Processing input: " + *line);
    }
    reporter.checkpoint("start", 0.0);

    std::string result;
    const auto start = std::chrono::steady_clock::now();
    try
    {
        result = options.transform(input.text);
    }
    catch (const std::exception& ex)
    {
        reporter.error(std::string("Processing error: ") + ex.what());
        return failure(FailureKind::TransformError, std::string("Processing error: ") + ex.what(),
                       options);
    }
    const auto elapsed = std::chrono::steady_clock::now() - start;

    const std::size_t tokens_input = input.text.empty() ? 0 : count_tokens(input.text);
    const std::size_t tokens_output = result.empty() ? 0 : count_tokens(result);
    const SuccessDocument doc{
        .result = std::move(result),
        .meta =
            MetaRecord{
                .tokens_input = tokens_input,
                .tokens_output = tokens_output,
                .seconds = round_seconds(std::chrono::duration<double>(elapsed).count()),
                .model = options.model,
            },
    };

    auto encoded = encode(doc);
    if (const auto* err = std::get_if<json::SerializeError>(&encoded))
    {
        reporter.error("JSON serialization error: " + err->message);
        return failure(FailureKind::EncodeError, "JSON serialization error: " + err->message,
                       options);
    }

    return Response{
        .exit_code = kExitOk,
        .body = std::move(std::get<std::string>(encoded)),
        .failure = std::nullopt,
        .meta = doc.meta,
    };
}

int run(std::istream& in, std::ostream& out, diag::Reporter& reporter, const Options& options)
{
    auto read = source::read_all(in);

    Response response;
    if (const auto* err = std::get_if<source::ReadError>(&read))
    {
        reporter.error("Stdin error: " + err->message);
        response = failure(FailureKind::ReadError, "Stdin error: " + err->message, options);
    }
    else
    {
        response = process(std::get<std::string>(read), options, reporter);
    }

    out << response.body;
    out.flush();
    if (!out)
    {
        reporter.error("failed to write response to stdout");
        return kExitFailure;
    }

    if (response.meta.has_value())
    {
        reporter.checkpoint("end", 1.0,
                            counts(response.meta->tokens_input.value_or(0),
                                   response.meta->tokens_output.value_or(0)));
        reporter.info("Processing completed successfully");
    }
    return response.exit_code;
}

} // namespace mentat::agent
