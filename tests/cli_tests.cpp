#include <cctype>
#include <cstdlib>
#include <iostream>
#include <mentat/agent/documents.h>
#include <mentat/cli/cli.h>
#include <mentat/config/build_info.h>
#include <mentat/json/json.h>
#include <sstream>
#include <string>
#include <variant>
#include <vector>

using namespace mentat;

[[noreturn]] static void fail(const std::string& msg)
{
    std::cerr << "FAIL: " << msg << "\n";
    std::exit(1);
}

static void expect_eq(const std::string& got, const std::string& expected, const std::string& what)
{
    if (got != expected)
    {
        fail(what + ": got='" + got + "' expected='" + expected + "'");
    }
}

static bool contains(const std::string& haystack, const std::string& needle)
{
    return haystack.find(needle) != std::string::npos;
}

struct CliResult
{
    int rc = -1;
    std::string out;
    std::string err;
};

static CliResult run_cli(std::vector<std::string> args, const std::string& stdin_data,
                         const agent::Options& options = {})
{
    std::istringstream in(stdin_data);
    std::ostringstream out;
    std::ostringstream err;

    auto* old_in = std::cin.rdbuf(in.rdbuf());
    auto* old_out = std::cout.rdbuf(out.rdbuf());
    auto* old_err = std::cerr.rdbuf(err.rdbuf());
    std::cin.clear();

    std::vector<std::string> argv_storage = {"mentat_agent"};
    argv_storage.insert(argv_storage.end(), args.begin(), args.end());
    std::vector<char*> argv;
    argv.reserve(argv_storage.size());
    for (auto& s : argv_storage)
    {
        argv.push_back(s.data());
    }

    const int rc = cli::run(static_cast<int>(argv.size()), argv.data(), options);

    std::cin.rdbuf(old_in);
    std::cout.rdbuf(old_out);
    std::cerr.rdbuf(old_err);
    std::cin.clear();

    return CliResult{.rc = rc, .out = out.str(), .err = err.str()};
}

static bool is_hex_char(char c)
{
    return (c >= '0' && c <= '9') || (c >= 'a' && c <= 'f') || (c >= 'A' && c <= 'F');
}

static std::vector<std::string> lines_of(const std::string& text)
{
    std::vector<std::string> lines;
    std::istringstream in(text);
    std::string line;
    while (std::getline(in, line))
    {
        lines.push_back(line);
    }
    return lines;
}

int main()
{
    // --version: one line naming program, version, model, sha and build type.
    {
        const auto res = run_cli({"--version"}, "");
        if (res.rc != 0)
        {
            fail("expected --version to exit 0");
        }
        const std::string prefix = "mentat_agent " + std::string(config::version()) +
                                   " model=" + std::string(config::agent_id()) + " sha=";
        if (!res.out.starts_with(prefix))
        {
            fail("unexpected --version prefix: " + res.out);
        }
        if (res.out.back() != '\n' || lines_of(res.out).size() != 1)
        {
            fail("expected exactly one newline-terminated line");
        }

        const std::string rest = res.out.substr(prefix.size());
        const auto space = rest.find(' ');
        if (space == std::string::npos)
        {
            fail("expected build type after sha");
        }
        const std::string sha = rest.substr(0, space);
        if (sha != "unknown")
        {
            if (sha.empty())
            {
                fail("empty sha");
            }
            for (const char c : sha)
            {
                if (!is_hex_char(c))
                {
                    fail("sha is not hex: " + sha);
                }
            }
        }
        if (!rest.substr(space).starts_with(" build="))
        {
            fail("expected build=<type>: " + res.out);
        }
        if (!res.err.empty())
        {
            fail("--version must not write to stderr");
        }
    }

    // --help and -h print usage on stdout.
    for (const std::string flag : {"--help", "-h"})
    {
        const auto res = run_cli({flag}, "");
        if (res.rc != 0 || !contains(res.out, "usage:") || !contains(res.out, "--log-format"))
        {
            fail(flag + " should print usage and exit 0");
        }
    }

    // Usage errors exit 2 and leave stdout alone.
    {
        const auto expect_usage = [](std::vector<std::string> args, const std::string& message)
        {
            const auto res = run_cli(args, R"({"text":"x"})");
            if (res.rc != cli::kExitUsage)
            {
                fail("expected exit 2 for: " + message);
            }
            if (!res.out.empty())
            {
                fail("usage error must not write a response: " + message);
            }
            if (!res.err.starts_with("error: " + message + "\n\n") || !contains(res.err, "usage:"))
            {
                fail("unexpected usage error output: " + res.err);
            }
        };

        expect_usage({"--frobnicate"}, "unknown option: --frobnicate");
        expect_usage({"request.json"}, "unexpected argument: request.json");
        expect_usage({"--log-format", "xml"}, "unknown log format: xml");
        expect_usage({"--log-format=yaml"}, "unknown log format: yaml");
        expect_usage({"--log-format"}, "expected a format after --log-format");
        expect_usage({"--cid"}, "expected a correlation id after --cid");
        expect_usage({"--cid="}, "expected a correlation id after --cid=");
        expect_usage({"--verbose", "--version"}, "--version must be the only argument");
        expect_usage({"-v", "--help"}, "--help must be the only argument");
    }

    // A full request through the default text diagnostics.
    {
        const auto res = run_cli({}, R"({"text": "hello world"})");
        if (res.rc != 0)
        {
            fail("expected hello world to exit 0");
        }
        const auto decoded = agent::decode_response(res.out);
        const auto* doc = std::get_if<agent::SuccessDocument>(&decoded);
        if (doc == nullptr)
        {
            fail("expected a success document: " + res.out);
        }
        expect_eq(doc->result, "Processed: hello world", "result");
        expect_eq(res.err,
                  "mentat_agent: info: Processing input: {\"text\":\"hello world\"}\n"
                  "mentat_agent: info: Processing completed successfully\n",
                  "text diagnostics");
    }

    // Failures still write exactly one document.
    {
        const auto res = run_cli({}, "   ");
        if (res.rc != 1)
        {
            fail("expected empty input to exit 1");
        }
        expect_eq(res.out,
                  "{\"error\":\"No input received from stdin\",\"mentat_meta\":{\"tokens_input\":"
                  "null,\"tokens_output\":null,\"seconds\":null,\"model\":\"" +
                      std::string(config::agent_id()) + "\"}}",
                  "empty input document");
    }

    // NDJSON diagnostics carry the correlation id; verbose adds checkpoints.
    {
        const auto res =
            run_cli({"--log-format=ndjson", "--cid", "req-42", "-v"}, R"({"text": "a b"})");
        if (res.rc != 0)
        {
            fail("expected ndjson run to exit 0");
        }
        const auto lines = lines_of(res.err);
        if (lines.size() != 4)
        {
            fail("expected four NDJSON events, got: " + res.err);
        }

        std::vector<std::string> types;
        for (const auto& line : lines)
        {
            const auto parsed = json::parse(line);
            const auto* event = std::get_if<json::Json>(&parsed);
            if (event == nullptr || !event->is_object())
            {
                fail("event is not a JSON object: " + line);
            }
            const auto* cid = event->find("correlation_id");
            if (cid == nullptr || !cid->is_string() || *cid->as_string() != "req-42")
            {
                fail("event without correlation id: " + line);
            }
            const auto* ts = event->find("ts");
            if (ts == nullptr || !ts->is_string() || !ts->as_string()->ends_with("Z"))
            {
                fail("event without UTC timestamp: " + line);
            }
            types.push_back(*event->find("type")->as_string());
        }
        if (types != std::vector<std::string>{"log", "checkpoint", "checkpoint", "log"})
        {
            fail("unexpected event sequence: " + res.err);
        }
        if (!contains(lines[2], R"("data":{"stage":"end","progress":1.0,"tokens_input":2,)"
                                R"("tokens_output":3})"))
        {
            fail("end checkpoint missing counts: " + lines[2]);
        }
    }

    // Agents plug their own transform and model into the same entry point.
    {
        agent::Options options;
        options.transform = [](std::string_view text) { return std::string(text.rbegin(), text.rend()); };
        options.model = "mentat.reverse";
        const auto res = run_cli({}, R"({"text": "abc"})", options);
        const auto decoded = agent::decode_response(res.out);
        const auto* doc = std::get_if<agent::SuccessDocument>(&decoded);
        if (res.rc != 0 || doc == nullptr || doc->result != "cba" ||
            doc->meta.model != "mentat.reverse")
        {
            fail("custom transform through the CLI: " + res.out);
        }
    }

    std::cout << "OK\n";
    return 0;
}
