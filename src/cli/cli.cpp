#include <exception>
#include <iostream>
#include <mentat/cli/cli.h>
#include <mentat/config/build_info.h>
#include <mentat/diag/reporter.h>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace mentat::cli
{
namespace
{

constexpr std::string_view kProgram = "mentat_agent";

void print_usage(std::ostream& out)
{
    out << "mentat_agent: one-shot JSON agent (request on stdin, response on stdout)\n\n";
    out << "usage:\n";
    out << "  mentat_agent [--log-format <text|ndjson>] [--cid <id>] [--verbose] < request.json\n";
    out << "  mentat_agent --help\n";
    out << "  mentat_agent --version\n\n";
    out << "request:  {\"text\": \"...\"}\n";
    out << "response: {\"result\": \"...\", \"mentat_meta\": {...}} or {\"error\": \"...\", "
           "\"mentat_meta\": {...}}\n";
}

void print_version(std::ostream& out)
{
    out << kProgram << " " << config::version() << " model=" << config::agent_id()
        << " sha=" << config::git_sha() << " build=" << config::build_type() << "\n";
}

bool is_help_flag(std::string_view arg)
{
    return arg == "--help" || arg == "-h";
}

std::optional<diag::Format> parse_format(std::string_view name)
{
    if (name == "text")
    {
        return diag::Format::Text;
    }
    if (name == "ndjson")
    {
        return diag::Format::Ndjson;
    }
    return std::nullopt;
}

int usage_error(const std::string& message)
{
    std::cerr << "error: " << message << "\n\n";
    print_usage(std::cerr);
    return kExitUsage;
}

} // namespace

int run(int argc, char** argv)
{
    return run(argc, argv, agent::Options{});
}

int run(int argc, char** argv, const agent::Options& options)
{
    std::vector<std::string_view> args;
    for (int i = 1; i < argc; ++i)
    {
        args.push_back(argv[i]);
    }

    if (args.size() == 1 && is_help_flag(args[0]))
    {
        print_usage(std::cout);
        return agent::kExitOk;
    }
    if (args.size() == 1 && args[0] == "--version")
    {
        print_version(std::cout);
        return agent::kExitOk;
    }

    diag::ReporterOptions report_options;
    report_options.source = std::string(kProgram);

    for (std::size_t i = 0; i < args.size();)
    {
        const std::string_view a = args[i];

        std::optional<std::string_view> format_name;
        if (a == "--log-format")
        {
            if (i + 1 >= args.size())
            {
                return usage_error("expected a format after --log-format");
            }
            format_name = args[i + 1];
            i += 2;
        }
        else if (a.starts_with("--log-format="))
        {
            format_name = a.substr(std::string_view("--log-format=").size());
            ++i;
        }

        if (format_name.has_value())
        {
            const auto format = parse_format(*format_name);
            if (!format.has_value())
            {
                return usage_error("unknown log format: " + std::string(*format_name));
            }
            report_options.format = *format;
            continue;
        }

        if (a == "--cid")
        {
            if (i + 1 >= args.size() || args[i + 1].empty())
            {
                return usage_error("expected a correlation id after --cid");
            }
            report_options.correlation_id = std::string(args[i + 1]);
            i += 2;
            continue;
        }

        if (a.starts_with("--cid="))
        {
            const auto cid = a.substr(std::string_view("--cid=").size());
            if (cid.empty())
            {
                return usage_error("expected a correlation id after --cid=");
            }
            report_options.correlation_id = std::string(cid);
            ++i;
            continue;
        }

        if (a == "--verbose" || a == "-v")
        {
            report_options.verbose = true;
            ++i;
            continue;
        }

        if (is_help_flag(a) || a == "--version")
        {
            return usage_error(std::string(a) + " must be the only argument");
        }

        if (a.starts_with('-'))
        {
            return usage_error("unknown option: " + std::string(a));
        }

        return usage_error("unexpected argument: " + std::string(a));
    }

    try
    {
        diag::Reporter reporter(std::cerr, std::move(report_options));
        return agent::run(std::cin, std::cout, reporter, options);
    }
    catch (const std::exception& ex)
    {
        std::cerr << "fatal: " << ex.what() << "\n";
        return agent::kExitFailure;
    }
}

} // namespace mentat::cli
