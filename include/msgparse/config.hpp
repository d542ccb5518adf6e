#pragma once

#include "msgparse/message_parser.hpp"

#include <filesystem>
#include <string>

namespace msgparse
{
enum class OutputFormat
{
    Json,
    Text
};

struct OutputConfig
{
    OutputFormat format = OutputFormat::Json;
    int indent = 2; // JSON indentation, -1 for a single line
};

struct Config
{
    ParserOptions parser;
    std::filesystem::path image_directory;
    OutputConfig output;
};

class ConfigLoader
{
public:
    static std::filesystem::path default_config_path();
    static Config load_from_file(const std::filesystem::path &path);
    static Config load_or_default();
    static bool save(const Config &config, const std::filesystem::path &path);
    static bool save(const Config &config);
};

const char *output_format_name(OutputFormat format) noexcept;
bool parse_output_format(std::string_view text, OutputFormat &format) noexcept;
} // namespace msgparse
