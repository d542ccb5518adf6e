#include "msgparse/config.hpp"

#include <cctype>
#include <charconv>
#include <cstdlib>
#include <fstream>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>

namespace msgparse
{
namespace
{
std::string trim(std::string_view view)
{
    std::size_t start = 0;
    std::size_t end = view.size();
    while (start < end && std::isspace(static_cast<unsigned char>(view[start])))
        ++start;
    while (end > start && std::isspace(static_cast<unsigned char>(view[end - 1])))
        --end;
    return std::string(view.substr(start, end - start));
}

void parse_assignment(std::string_view line, std::string &key, std::string &value)
{
    auto equal = line.find('=');
    if (equal == std::string_view::npos)
        return;
    key = trim(line.substr(0, equal));
    value = trim(line.substr(equal + 1));
}

bool is_section_header(std::string_view line, std::string &section)
{
    if (line.size() < 3 || line.front() != '[' || line.back() != ']')
        return false;
    section = trim(line.substr(1, line.size() - 2));
    return true;
}

bool is_quoted(std::string_view value)
{
    return value.size() >= 2 && value.front() == '"' && value.back() == '"';
}

std::string parse_string(std::string value)
{
    if (is_quoted(value))
        return value.substr(1, value.size() - 2);
    return value;
}

// Drops a trailing comment, leaving '#' inside a quoted string alone.
std::string strip_comment(const std::string &line)
{
    bool quoted = false;
    for (std::size_t i = 0; i < line.size(); ++i)
    {
        if (line[i] == '"')
            quoted = !quoted;
        else if (line[i] == '#' && !quoted)
            return line.substr(0, i);
    }
    return line;
}

std::optional<long long> parse_integer(const std::string &value)
{
    long long result = 0;
    auto begin = value.data();
    auto end = value.data() + value.size();
    auto rc = std::from_chars(begin, end, result);
    if (rc.ec == std::errc() && rc.ptr == end)
        return result;
    return std::nullopt;
}

std::optional<bool> parse_bool(const std::string &value)
{
    if (value == "true")
        return true;
    if (value == "false")
        return false;
    return std::nullopt;
}
} // namespace

const char *output_format_name(OutputFormat format) noexcept
{
    return format == OutputFormat::Text ? "text" : "json";
}

bool parse_output_format(std::string_view text, OutputFormat &format) noexcept
{
    if (text == "json")
    {
        format = OutputFormat::Json;
        return true;
    }
    if (text == "text")
    {
        format = OutputFormat::Text;
        return true;
    }
    return false;
}

std::filesystem::path ConfigLoader::default_config_path()
{
    std::filesystem::path config_home;
    if (const char *xdg = std::getenv("XDG_CONFIG_HOME"); xdg && *xdg)
        config_home = xdg;
    else if (const char *home = std::getenv("HOME"); home && *home)
        config_home = std::filesystem::path(home) / ".config";
    else
        config_home = std::filesystem::current_path();

    return config_home / "cktools" / "msgparse.toml";
}

Config ConfigLoader::load_from_file(const std::filesystem::path &path)
{
    Config config;

    std::ifstream stream(path);
    if (!stream)
        return config;

    std::string line;
    std::string section;
    while (std::getline(stream, line))
    {
        line = trim(strip_comment(line));
        if (line.empty())
            continue;

        std::string maybe_section;
        if (is_section_header(line, maybe_section))
        {
            section = maybe_section;
            continue;
        }

        std::string key;
        std::string value;
        parse_assignment(line, key, value);
        if (key.empty())
            continue;

        if (section == "parser")
        {
            if (key == "strict_blocks")
            {
                if (auto parsed = parse_bool(value))
                    config.parser.strictBlocks = *parsed;
            }
        }
        else if (section == "images")
        {
            if (key == "directory")
                config.image_directory = parse_string(value);
        }
        else if (section == "output")
        {
            if (key == "format")
            {
                OutputFormat format;
                if (parse_output_format(parse_string(value), format))
                    config.output.format = format;
            }
            else if (key == "indent")
            {
                if (auto parsed = parse_integer(value); parsed && *parsed >= -1 && *parsed <= 16)
                    config.output.indent = static_cast<int>(*parsed);
            }
        }
    }

    return config;
}

Config ConfigLoader::load_or_default()
{
    return load_from_file(default_config_path());
}

bool ConfigLoader::save(const Config &config, const std::filesystem::path &path)
{
    std::error_code ec;
    if (path.has_parent_path())
        std::filesystem::create_directories(path.parent_path(), ec);
    if (ec)
        return false;

    std::ofstream out(path);
    if (!out.is_open())
        return false;

    out << "[parser]\n";
    out << "strict_blocks = " << (config.parser.strictBlocks ? "true" : "false") << "\n";

    if (!config.image_directory.empty())
    {
        out << "\n[images]\n";
        out << "directory = \"" << config.image_directory.string() << "\"\n";
    }

    out << "\n[output]\n";
    out << "format = \"" << output_format_name(config.output.format) << "\"\n";
    out << "indent = " << config.output.indent << "\n";
    return static_cast<bool>(out);
}

bool ConfigLoader::save(const Config &config)
{
    return save(config, default_config_path());
}

} // namespace msgparse
