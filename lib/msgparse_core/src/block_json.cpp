#include "msgparse/block_json.hpp"

#include <sstream>

namespace msgparse
{
namespace
{
void appendIndented(std::ostringstream &out, const std::string &payload)
{
    std::size_t start = 0;
    while (true)
    {
        std::size_t end = payload.find('\n', start);
        out << "  " << payload.substr(start, end == std::string::npos ? std::string::npos : end - start) << '\n';
        if (end == std::string::npos)
            break;
        start = end + 1;
    }
}

std::string describeHeader(const ContentBlock &block)
{
    std::ostringstream out;
    out << '[' << blockKindName(blockKind(block));
    if (const auto *code = std::get_if<CodeBlock>(&block))
    {
        if (!code->language.empty())
            out << " language=" << code->language;
        if (code->indent > 0)
            out << " indent=" << code->indent;
    }
    else if (const auto *table = std::get_if<TableBlock>(&block))
    {
        out << " columns=" << table->header.size() << " rows=" << table->rows.size();
    }
    else if (const auto *image = std::get_if<ImageBlock>(&block))
    {
        if (image->image)
            out << ' ' << image->image->mediaType << ' ' << image->image->data.size() << " bytes";
    }
    out << ']';
    return out.str();
}

} // namespace

nlohmann::json blockToJson(const ContentBlock &block)
{
    nlohmann::json j;
    j["type"] = blockKindName(blockKind(block));
    switch (blockKind(block))
    {
    case BlockKind::Text:
        j["body"] = std::get<TextBlock>(block).body;
        break;
    case BlockKind::Code:
    {
        const auto &code = std::get<CodeBlock>(block);
        j["body"] = code.body;
        if (code.language.empty())
            j["language"] = nullptr;
        else
            j["language"] = code.language;
        j["indent"] = code.indent;
        break;
    }
    case BlockKind::Table:
    {
        const auto &table = std::get<TableBlock>(block);
        j["header"] = table.header;
        j["rows"] = table.rows;
        break;
    }
    case BlockKind::Formula:
        j["content"] = std::get<FormulaBlock>(block).content;
        break;
    case BlockKind::Thinking:
    {
        const auto &thinking = std::get<ThinkingBlock>(block);
        j["content"] = thinking.content;
        j["expanded"] = thinking.expanded;
        break;
    }
    case BlockKind::Image:
    {
        const auto &image = std::get<ImageBlock>(block).image;
        if (!image)
            break;
        j["id"] = image->id.toString();
        j["media_type"] = image->mediaType;
        j["source"] = image->source.string();
        j["bytes"] = image->data.size();
        break;
    }
    }
    return j;
}

nlohmann::json blocksToJson(const std::vector<ContentBlock> &blocks)
{
    nlohmann::json array = nlohmann::json::array();
    for (const auto &block : blocks)
        array.push_back(blockToJson(block));
    return array;
}

std::string describeBlocks(const std::vector<ContentBlock> &blocks)
{
    std::ostringstream out;
    for (const auto &block : blocks)
    {
        out << describeHeader(block) << '\n';
        if (blockKind(block) != BlockKind::Image)
            appendIndented(out, blockPayload(block));
    }
    return out.str();
}

} // namespace msgparse
