#include "msgparse/content_block.hpp"

#include <sstream>

namespace msgparse
{
namespace
{
std::string joinCells(const std::vector<std::string> &cells)
{
    std::ostringstream out;
    out << '|';
    for (const auto &cell : cells)
        out << ' ' << cell << " |";
    return out.str();
}

} // namespace

BlockKind blockKind(const ContentBlock &block) noexcept
{
    return static_cast<BlockKind>(block.index());
}

const char *blockKindName(BlockKind kind) noexcept
{
    switch (kind)
    {
    case BlockKind::Text:
        return "text";
    case BlockKind::Code:
        return "code";
    case BlockKind::Table:
        return "table";
    case BlockKind::Formula:
        return "formula";
    case BlockKind::Thinking:
        return "thinking";
    case BlockKind::Image:
        return "image";
    }
    return "text";
}

std::string blockPayload(const ContentBlock &block)
{
    switch (blockKind(block))
    {
    case BlockKind::Text:
        return std::get<TextBlock>(block).body;
    case BlockKind::Code:
        return std::get<CodeBlock>(block).body;
    case BlockKind::Table:
    {
        const auto &table = std::get<TableBlock>(block);
        std::string payload = joinCells(table.header);
        for (const auto &row : table.rows)
            payload += "\n" + joinCells(row);
        return payload;
    }
    case BlockKind::Formula:
        return std::get<FormulaBlock>(block).content;
    case BlockKind::Thinking:
        return std::get<ThinkingBlock>(block).content;
    case BlockKind::Image:
    {
        const auto &image = std::get<ImageBlock>(block).image;
        return image ? image->id.toString() : std::string();
    }
    }
    return std::string();
}

} // namespace msgparse
