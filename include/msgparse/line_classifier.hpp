#pragma once

#include <cstddef>
#include <string>
#include <string_view>

namespace msgparse
{

enum class LineCategory
{
    PlainText,
    TableRow,
    CodeFence,
    MathBlockOpen,
    MathLine,
    Thinking,
    ImageReference
};

inline constexpr std::string_view kThinkOpenTag = "<think>";
inline constexpr std::string_view kThinkCloseTag = "</think>";
inline constexpr std::string_view kCodeFence = "```";
inline constexpr std::string_view kMathOpen = "\\[";
inline constexpr std::string_view kMathClose = "\\]";
inline constexpr std::string_view kImageOpenTag = "<image-uuid>";
inline constexpr std::string_view kImageCloseTag = "</image-uuid>";

LineCategory classifyLine(std::string_view line) noexcept;

// Trims spaces and tabs; this is the trimming used for classification.
std::string_view trimHorizontal(std::string_view view) noexcept;
std::size_t leadingWhitespaceWidth(std::string_view line) noexcept;

} // namespace msgparse
