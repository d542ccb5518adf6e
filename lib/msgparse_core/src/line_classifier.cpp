#include "msgparse/line_classifier.hpp"

namespace msgparse
{
namespace
{
bool isHorizontalSpace(char ch) noexcept
{
    return ch == ' ' || ch == '\t';
}

bool startsWith(std::string_view view, std::string_view prefix) noexcept
{
    return view.size() >= prefix.size() && view.compare(0, prefix.size(), prefix) == 0;
}

// True when the line holds only "\[" with optional spaces in between.
bool isBareMathOpener(std::string_view trimmed) noexcept
{
    std::size_t matched = 0;
    for (char ch : trimmed)
    {
        if (ch == ' ')
            continue;
        if (matched == kMathOpen.size() || ch != kMathOpen[matched])
            return false;
        ++matched;
    }
    return matched == kMathOpen.size();
}

} // namespace

std::string_view trimHorizontal(std::string_view view) noexcept
{
    std::size_t start = 0;
    std::size_t end = view.size();
    while (start < end && isHorizontalSpace(view[start]))
        ++start;
    while (end > start && isHorizontalSpace(view[end - 1]))
        --end;
    return view.substr(start, end - start);
}

std::size_t leadingWhitespaceWidth(std::string_view line) noexcept
{
    std::size_t width = 0;
    while (width < line.size() && isHorizontalSpace(line[width]))
        ++width;
    return width;
}

LineCategory classifyLine(std::string_view line) noexcept
{
    std::string_view trimmed = trimHorizontal(line);

    if (startsWith(trimmed, kThinkOpenTag))
        return LineCategory::Thinking;
    if (startsWith(trimmed, kCodeFence))
        return LineCategory::CodeFence;
    if (!trimmed.empty() && trimmed.front() == '|')
        return LineCategory::TableRow;
    if (startsWith(trimmed, kMathOpen))
        return isBareMathOpener(trimmed) ? LineCategory::MathBlockOpen : LineCategory::MathLine;
    if (startsWith(trimmed, kMathClose))
        return LineCategory::MathLine;
    if (startsWith(trimmed, kImageOpenTag))
        return LineCategory::ImageReference;
    return LineCategory::PlainText;
}

} // namespace msgparse
