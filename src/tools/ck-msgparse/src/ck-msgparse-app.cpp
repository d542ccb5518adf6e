#include "msgparse/block_json.hpp"
#include "msgparse/config.hpp"
#include "msgparse/image_store.hpp"
#include "msgparse/message_parser.hpp"

#include <charconv>
#include <fstream>
#include <iostream>
#include <iterator>
#include <memory>
#include <optional>
#include <sstream>
#include <string>
#include <string_view>
#include <system_error>

namespace
{
constexpr const char *kExecutable = "ck-msgparse";

struct CliOptions
{
    bool showHelp = false;
    bool verbose = false;
    std::optional<std::filesystem::path> configPath;
    std::optional<std::filesystem::path> imageDirectory;
    std::optional<msgparse::OutputFormat> format;
    std::optional<int> indent;
    bool strict = false;
    std::optional<std::filesystem::path> input;
};

void print_usage(std::ostream &out)
{
    out << "Usage: " << kExecutable << " [OPTIONS] [FILE]\n";
    out << "Split a chat message into text, code, table, formula, thinking and image blocks.\n\n";
    out << "  --json              print blocks as a JSON array (default)\n";
    out << "  --text              print a tagged block listing\n";
    out << "  --indent N          JSON indentation, -1 for a single line\n";
    out << "  --images DIR        resolve <image-uuid> references from DIR\n";
    out << "  --config FILE       read settings from FILE instead of the default\n";
    out << "  --strict            keep every line inside open code, math and thinking blocks\n";
    out << "  --verbose           report configuration and block counts on stderr\n";
    out << "  -h, --help          show this help\n\n";
    out << "Reads standard input when FILE is omitted or '-'.\n";
    out << "Default configuration: " << msgparse::ConfigLoader::default_config_path().string() << std::endl;
}

bool parse_int(std::string_view text, int &value)
{
    auto rc = std::from_chars(text.data(), text.data() + text.size(), value);
    return rc.ec == std::errc() && rc.ptr == text.data() + text.size();
}

// Returns false after reporting a usage error.
bool parse_cli(int argc, char **argv, CliOptions &options)
{
    auto requireValue = [&](int &i, std::string_view name) -> std::optional<std::string> {
        if (i + 1 >= argc)
        {
            std::cerr << kExecutable << ": " << name << " requires a value" << std::endl;
            return std::nullopt;
        }
        return std::string(argv[++i]);
    };

    for (int i = 1; i < argc; ++i)
    {
        std::string_view arg(argv[i]);
        if (arg == "--help" || arg == "-h")
            options.showHelp = true;
        else if (arg == "--verbose" || arg == "-v")
            options.verbose = true;
        else if (arg == "--json")
            options.format = msgparse::OutputFormat::Json;
        else if (arg == "--text")
            options.format = msgparse::OutputFormat::Text;
        else if (arg == "--strict")
            options.strict = true;
        else if (arg == "--images")
        {
            auto value = requireValue(i, arg);
            if (!value)
                return false;
            options.imageDirectory = *value;
        }
        else if (arg == "--config")
        {
            auto value = requireValue(i, arg);
            if (!value)
                return false;
            options.configPath = *value;
        }
        else if (arg == "--indent")
        {
            auto value = requireValue(i, arg);
            if (!value)
                return false;
            int indent = 0;
            if (!parse_int(*value, indent) || indent < -1 || indent > 16)
            {
                std::cerr << kExecutable << ": invalid indent '" << *value << "'" << std::endl;
                return false;
            }
            options.indent = indent;
        }
        else if (arg == "-" || arg.empty() || arg.front() != '-')
        {
            if (options.input)
            {
                std::cerr << kExecutable << ": only one input file may be given" << std::endl;
                return false;
            }
            options.input = std::filesystem::path(std::string(arg));
        }
        else
        {
            std::cerr << kExecutable << ": unknown option '" << arg << "'" << std::endl;
            return false;
        }
    }
    return true;
}

std::optional<std::string> read_input(const CliOptions &options)
{
    if (!options.input || options.input->string() == "-")
    {
        std::ostringstream buffer;
        buffer << std::cin.rdbuf();
        if (std::cin.bad())
        {
            std::cerr << kExecutable << ": failed to read standard input" << std::endl;
            return std::nullopt;
        }
        return buffer.str();
    }

    std::ifstream in(*options.input, std::ios::binary);
    if (!in)
    {
        std::cerr << kExecutable << ": cannot open '" << options.input->string() << "'" << std::endl;
        return std::nullopt;
    }
    return std::string(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
}

msgparse::Config resolve_config(const CliOptions &options)
{
    auto path = options.configPath.value_or(msgparse::ConfigLoader::default_config_path());
    if (options.verbose)
        std::cerr << kExecutable << ": configuration " << path.string() << std::endl;

    msgparse::Config config = msgparse::ConfigLoader::load_from_file(path);
    if (options.imageDirectory)
        config.image_directory = *options.imageDirectory;
    if (options.format)
        config.output.format = *options.format;
    if (options.indent)
        config.output.indent = *options.indent;
    if (options.strict)
        config.parser.strictBlocks = true;
    return config;
}

int run_cli(const CliOptions &options)
{
    msgparse::Config config = resolve_config(options);

    auto message = read_input(options);
    if (!message)
        return 1;

    std::unique_ptr<msgparse::ImageStore> store;
    msgparse::MessageParser parser;
    parser.setOptions(config.parser);
    if (!config.image_directory.empty())
    {
        std::error_code ec;
        if (!std::filesystem::is_directory(config.image_directory, ec))
            std::cerr << kExecutable << ": image directory '" << config.image_directory.string()
                      << "' not found, image references stay text" << std::endl;
        store = std::make_unique<msgparse::ImageStore>(config.image_directory);
        parser.setImageResolver(store->resolver());
    }

    auto blocks = parser.parse(*message);
    if (options.verbose)
    {
        std::cerr << kExecutable << ": " << blocks.size() << " blocks";
        if (store)
            std::cerr << ", " << store->cached_count() << " images resolved";
        std::cerr << std::endl;
    }

    if (config.output.format == msgparse::OutputFormat::Text)
        std::cout << msgparse::describeBlocks(blocks);
    else
        std::cout << msgparse::blocksToJson(blocks).dump(config.output.indent, ' ', false,
                                                         nlohmann::json::error_handler_t::replace)
                  << '\n';
    std::cout.flush();
    if (!std::cout)
    {
        std::cerr << kExecutable << ": failed to write output" << std::endl;
        return 1;
    }
    return 0;
}

} // namespace

int main(int argc, char **argv)
{
    CliOptions options;
    if (!parse_cli(argc, argv, options))
    {
        print_usage(std::cerr);
        return 2;
    }
    if (options.showHelp)
    {
        print_usage(std::cout);
        return 0;
    }
    return run_cli(options);
}
