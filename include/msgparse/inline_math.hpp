#pragma once

#include "msgparse/content_block.hpp"

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace msgparse
{

enum class MathDelimiter
{
    Dollar,
    Parenthesis
};

struct InlineMathSpan
{
    MathDelimiter delimiter = MathDelimiter::Dollar;
    std::size_t start = 0; // offset of the opening delimiter
    std::size_t end = 0;   // one past the closing delimiter
    std::string content;   // interior, not yet un-escaped
};

class InlineMathScanner
{
public:
    InlineMathScanner() = default;

    std::vector<InlineMathSpan> findSpans(std::string_view line) const;
    std::vector<ContentBlock> split(std::string_view line) const;

    static std::string unescape(std::string_view content);

private:
    static bool findDollarSpan(std::string_view line, std::size_t open, InlineMathSpan &span);
    static bool findParenthesisSpan(std::string_view line, std::size_t open, InlineMathSpan &span);
};

} // namespace msgparse
