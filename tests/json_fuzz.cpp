#include <cstddef>
#include <cstdint>
#include <fstream>
#include <iterator>
#include <mentat/agent/agent.h>
#include <mentat/json/json.h>
#include <sstream>
#include <string>
#include <variant>
#include <vector>

extern "C" int LLVMFuzzerTestOneInput(const std::uint8_t* data, std::size_t size)
{
    const std::string input(reinterpret_cast<const char*>(data), size);

    // Anything the parser accepts must serialize and parse back to the same text.
    const auto parsed = mentat::json::parse(input);
    if (const auto* value = std::get_if<mentat::json::Json>(&parsed))
    {
        const auto encoded = mentat::json::serialize(*value);
        const auto* text = std::get_if<std::string>(&encoded);
        if (text == nullptr)
        {
            __builtin_trap();
        }
        const auto reparsed = mentat::json::parse(*text);
        const auto* again = std::get_if<mentat::json::Json>(&reparsed);
        if (again == nullptr)
        {
            __builtin_trap();
        }
        const auto reencoded = mentat::json::serialize(*again);
        if (std::get_if<std::string>(&reencoded) == nullptr ||
            std::get<std::string>(reencoded) != *text)
        {
            __builtin_trap();
        }
    }

    // Whatever the bytes, the processor answers with exactly one parseable document.
    std::ostringstream sink;
    mentat::diag::Reporter reporter(sink, mentat::diag::ReporterOptions{});
    const auto response = mentat::agent::process(input, mentat::agent::Options{}, reporter);
    if (!std::holds_alternative<mentat::json::Json>(mentat::json::parse(response.body)))
    {
        __builtin_trap();
    }

    return 0;
}

#ifdef MENTAT_FUZZER_STANDALONE
int main(int argc, char** argv)
{
    if (argc != 2)
    {
        return 2;
    }

    std::ifstream in(argv[1], std::ios::binary);
    if (!in)
    {
        return 2;
    }

    const std::vector<char> bytes((std::istreambuf_iterator<char>(in)),
                                  std::istreambuf_iterator<char>());
    return LLVMFuzzerTestOneInput(reinterpret_cast<const std::uint8_t*>(bytes.data()),
                                  bytes.size());
}
#endif
