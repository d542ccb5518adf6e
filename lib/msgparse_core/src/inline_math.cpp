#include "msgparse/inline_math.hpp"

namespace msgparse
{
namespace
{
bool escapedAt(std::string_view line, std::size_t index) noexcept
{
    return index > 0 && line[index - 1] == '\\';
}

bool isParenthesisOpener(std::string_view line, std::size_t index) noexcept
{
    return index + 1 < line.size() && line[index] == '\\' && line[index + 1] == '(';
}

void replaceAll(std::string &text, std::string_view from, std::string_view to)
{
    std::size_t pos = 0;
    while ((pos = text.find(from, pos)) != std::string::npos)
    {
        text.replace(pos, from.size(), to);
        pos += to.size();
    }
}

} // namespace

std::vector<InlineMathSpan> InlineMathScanner::findSpans(std::string_view line) const
{
    std::vector<InlineMathSpan> spans;
    // A closer search that fails for one opener fails for every later opener
    // of the same kind, so each kind is given up after its first miss.
    bool dollarExhausted = false;
    bool parenthesisExhausted = false;
    std::size_t pos = 0;
    while (pos < line.size())
    {
        bool matched = false;
        for (std::size_t i = pos; i < line.size(); ++i)
        {
            if (escapedAt(line, i))
                continue;
            InlineMathSpan span;
            if (line[i] == '$')
            {
                if (dollarExhausted)
                    continue;
                matched = findDollarSpan(line, i, span);
                dollarExhausted = !matched;
            }
            else if (isParenthesisOpener(line, i))
            {
                if (parenthesisExhausted)
                    continue;
                matched = findParenthesisSpan(line, i, span);
                parenthesisExhausted = !matched;
            }
            if (matched)
            {
                pos = span.end;
                spans.push_back(std::move(span));
                break;
            }
        }
        if (!matched)
            break;
    }
    return spans;
}

std::vector<ContentBlock> InlineMathScanner::split(std::string_view line) const
{
    std::vector<ContentBlock> fragments;
    auto spans = findSpans(line);
    if (spans.empty())
    {
        fragments.emplace_back(TextBlock{std::string(line)});
        return fragments;
    }

    std::size_t last = 0;
    for (const auto &span : spans)
    {
        if (span.start > last)
            fragments.emplace_back(TextBlock{std::string(line.substr(last, span.start - last))});
        fragments.emplace_back(FormulaBlock{unescape(span.content)});
        last = span.end;
    }
    if (last < line.size())
        fragments.emplace_back(TextBlock{std::string(line.substr(last))});
    return fragments;
}

std::string InlineMathScanner::unescape(std::string_view content)
{
    std::string result(content);
    replaceAll(result, "\\$", "$");
    replaceAll(result, "\\(", "(");
    replaceAll(result, "\\)", ")");
    return result;
}

bool InlineMathScanner::findDollarSpan(std::string_view line, std::size_t open, InlineMathSpan &span)
{
    for (std::size_t j = open + 1; j < line.size(); ++j)
    {
        if (line[j] != '$' || escapedAt(line, j))
            continue;
        span.delimiter = MathDelimiter::Dollar;
        span.start = open;
        span.end = j + 1;
        span.content.assign(line.substr(open + 1, j - open - 1));
        return true;
    }
    return false;
}

bool InlineMathScanner::findParenthesisSpan(std::string_view line, std::size_t open, InlineMathSpan &span)
{
    std::size_t contentStart = open + 2;
    for (std::size_t j = contentStart; j + 1 < line.size(); ++j)
    {
        if (line[j] != '\\' || line[j + 1] != ')' || escapedAt(line, j))
            continue;
        span.delimiter = MathDelimiter::Parenthesis;
        span.start = open;
        span.end = j + 2;
        span.content.assign(line.substr(contentStart, j - contentStart));
        return true;
    }
    return false;
}

} // namespace msgparse
