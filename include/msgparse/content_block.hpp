#pragma once

#include "msgparse/image_id.hpp"

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <string>
#include <variant>
#include <vector>

namespace msgparse
{

struct ImageResource
{
    ImageId id;
    std::string mediaType;
    std::filesystem::path source;
    std::vector<std::uint8_t> data;
};

struct TextBlock
{
    std::string body;
};

struct CodeBlock
{
    std::string body;
    std::string language; // empty when the fence carried no tag
    std::size_t indent = 0;
};

struct TableBlock
{
    std::vector<std::string> header;
    std::vector<std::vector<std::string>> rows;
};

struct FormulaBlock
{
    std::string content;
};

struct ThinkingBlock
{
    std::string content;
    bool expanded = false;
};

struct ImageBlock
{
    std::shared_ptr<const ImageResource> image;
};

using ContentBlock = std::variant<TextBlock, CodeBlock, TableBlock, FormulaBlock, ThinkingBlock, ImageBlock>;

enum class BlockKind
{
    Text,
    Code,
    Table,
    Formula,
    Thinking,
    Image
};

inline bool operator==(const TextBlock &a, const TextBlock &b) { return a.body == b.body; }
inline bool operator==(const CodeBlock &a, const CodeBlock &b)
{
    return a.body == b.body && a.language == b.language && a.indent == b.indent;
}
inline bool operator==(const TableBlock &a, const TableBlock &b) { return a.header == b.header && a.rows == b.rows; }
inline bool operator==(const FormulaBlock &a, const FormulaBlock &b) { return a.content == b.content; }
inline bool operator==(const ThinkingBlock &a, const ThinkingBlock &b)
{
    return a.content == b.content && a.expanded == b.expanded;
}
inline bool operator==(const ImageBlock &a, const ImageBlock &b)
{
    if (!a.image || !b.image)
        return a.image == b.image;
    return a.image->id == b.image->id;
}

BlockKind blockKind(const ContentBlock &block) noexcept;
const char *blockKindName(BlockKind kind) noexcept;

// Textual payload of a block as it appeared in the message, used to
// reconstruct the message body from a parsed sequence.
std::string blockPayload(const ContentBlock &block);

} // namespace msgparse
