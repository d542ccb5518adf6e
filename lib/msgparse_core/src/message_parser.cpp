#include "msgparse/message_parser.hpp"

#include <exception>
#include <utility>

namespace msgparse
{
namespace
{
bool isWhitespace(char ch) noexcept
{
    return ch == ' ' || ch == '\t' || ch == '\r' || ch == '\n' || ch == '\v' || ch == '\f';
}

std::string trim(std::string_view view)
{
    std::size_t start = 0;
    std::size_t end = view.size();
    while (start < end && isWhitespace(view[start]))
        ++start;
    while (end > start && isWhitespace(view[end - 1]))
        --end;
    return std::string(view.substr(start, end - start));
}

std::string join(const std::vector<std::string> &lines)
{
    std::string result;
    for (std::size_t i = 0; i < lines.size(); ++i)
    {
        if (i > 0)
            result.push_back('\n');
        result += lines[i];
    }
    return result;
}

std::string removeAll(std::string text, std::string_view token)
{
    std::size_t pos = 0;
    while ((pos = text.find(token, pos)) != std::string::npos)
        text.erase(pos, token.size());
    return text;
}

std::string stripMathDelimiters(std::string_view line)
{
    return removeAll(removeAll(std::string(line), kMathOpen), kMathClose);
}

// Drops `count` leading characters, counting a UTF-8 sequence as one.
std::string dropCharacters(std::string_view line, std::size_t count)
{
    std::size_t pos = 0;
    while (count > 0 && pos < line.size())
    {
        ++pos;
        while (pos < line.size() && (static_cast<unsigned char>(line[pos]) & 0xC0) == 0x80)
            ++pos;
        --count;
    }
    return std::string(line.substr(pos));
}

std::string fenceLanguage(std::string_view line)
{
    std::string_view trimmed = trimHorizontal(line);
    std::size_t pos = 0;
    while (pos < trimmed.size() && trimmed[pos] == '`')
        ++pos;
    return trim(trimmed.substr(pos));
}

// Rest of the line after the closing think tag at `close`, if not blank.
std::optional<std::string_view> remainderAfter(std::string_view line, std::size_t close)
{
    std::string_view after = line.substr(close + kThinkCloseTag.size());
    if (trimHorizontal(after).empty())
        return std::nullopt;
    return after;
}

} // namespace

MessageParser::MessageParser(ImageResolver resolver, ParserOptions options)
    : resolver_(std::move(resolver)), options_(options)
{
}

std::vector<ContentBlock> MessageParser::parse(std::string_view message) const
{
    AssemblerState state;
    for (const auto &line : splitLines(message))
    {
        // Text after a closing think tag is handled as a line of its own.
        std::optional<std::string_view> pending = std::string_view(line);
        while (pending)
            pending = processLine(*pending, state);
    }
    finish(state);
    return std::move(state.blocks);
}

std::vector<std::string> MessageParser::splitLines(std::string_view message)
{
    std::vector<std::string> lines;
    std::size_t offset = 0;
    while (true)
    {
        std::size_t end = message.find('\n', offset);
        if (end == std::string_view::npos)
        {
            lines.emplace_back(message.substr(offset));
            break;
        }
        lines.emplace_back(message.substr(offset, end - offset));
        offset = end + 1;
    }
    return lines;
}

std::vector<std::string> MessageParser::parseTableRow(std::string_view line)
{
    std::vector<std::string> cells;
    std::size_t start = 0;
    while (start <= line.size())
    {
        std::size_t end = line.find('|', start);
        if (end == std::string_view::npos)
            end = line.size();
        auto cell = trim(line.substr(start, end - start));
        if (!cell.empty())
            cells.push_back(std::move(cell));
        start = end + 1;
    }
    return cells;
}

bool MessageParser::isTableDelimiterRow(const std::vector<std::string> &cells) noexcept
{
    for (const auto &cell : cells)
        for (char ch : cell)
            if (ch != '-' && ch != ':')
                return false;
    return true;
}

std::optional<ImageId> MessageParser::extractImageId(std::string_view line) noexcept
{
    std::size_t open = line.find(kImageOpenTag);
    if (open == std::string_view::npos)
        return std::nullopt;
    std::size_t start = open + kImageOpenTag.size();
    std::size_t close = line.find(kImageCloseTag, start);
    if (close == std::string_view::npos)
        return std::nullopt;
    return ImageId::parse(line.substr(start, close - start));
}

LineCategory MessageParser::effectiveCategory(std::string_view line, const AssemblerState &state) const
{
    LineCategory category = classifyLine(line);
    if (!options_.strictBlocks)
        return category;

    if (state.codeOpen)
        return category == LineCategory::CodeFence ? category : LineCategory::PlainText;
    if (state.mathOpen)
        return category == LineCategory::MathLine ? category : LineCategory::PlainText;
    if (state.thinkingOpen)
        return LineCategory::PlainText;
    return category;
}

std::optional<std::string_view> MessageParser::processLine(std::string_view line, AssemblerState &state) const
{
    switch (effectiveCategory(line, state))
    {
    case LineCategory::CodeFence:
        handleCodeFence(line, state);
        break;
    case LineCategory::TableRow:
        handleTableRow(line, state);
        break;
    case LineCategory::MathBlockOpen:
        handleMathOpen(state);
        break;
    case LineCategory::MathLine:
        handleMathLine(line, state);
        break;
    case LineCategory::Thinking:
        return handleThinking(line, state);
    case LineCategory::ImageReference:
        handleImageReference(line, state);
        break;
    case LineCategory::PlainText:
        return handlePlainText(line, state);
    }
    return std::nullopt;
}

void MessageParser::handleCodeFence(std::string_view line, AssemblerState &state) const
{
    flushText(state);
    flushTable(state);
    if (state.codeOpen)
    {
        flushCode(state);
        state.codeOpen = false;
        state.codeLanguage.clear();
        state.codeIndent = 0;
        return;
    }

    state.codeOpen = true;
    state.codeLanguage = fenceLanguage(line);
    state.codeIndent = leadingWhitespaceWidth(line);
}

void MessageParser::handleTableRow(std::string_view line, AssemblerState &state) const
{
    flushText(state);

    auto cells = parseTableRow(line);
    if (isTableDelimiterRow(cells))
        return;

    auto &table = state.table;
    if (!table.headerCaptured)
    {
        table.header = std::move(cells);
        table.headerCaptured = true;
    }
    else
        table.rows.push_back(std::move(cells));
}

void MessageParser::handleMathOpen(AssemblerState &state) const
{
    flushText(state);
    flushTable(state);
    state.mathOpen = true;
    state.mathLines.clear();
}

void MessageParser::handleMathLine(std::string_view line, AssemblerState &state) const
{
    flushText(state);
    flushTable(state);

    std::string_view trimmed = trimHorizontal(line);
    if (trimmed.compare(0, kMathClose.size(), kMathClose) == 0)
    {
        state.mathOpen = false;
        flushMath(state);
        return;
    }

    state.mathLines.push_back(stripMathDelimiters(line));
    if (!state.mathOpen)
        flushMath(state);
}

std::optional<std::string_view> MessageParser::handleThinking(std::string_view line, AssemblerState &state) const
{
    std::size_t open = line.find(kThinkOpenTag);
    if (open == std::string_view::npos)
        return handlePlainText(line, state);

    std::size_t contentStart = open + kThinkOpenTag.size();
    std::size_t close = line.find(kThinkCloseTag, contentStart);
    if (close == std::string_view::npos)
    {
        flushText(state);
        flushTable(state);
        state.thinkingOpen = true;
        std::string_view rest = line.substr(contentStart);
        if (!rest.empty())
            state.thinkingLines.emplace_back(rest);
        return std::nullopt;
    }

    state.blocks.emplace_back(ThinkingBlock{trim(line.substr(contentStart, close - contentStart)), false});
    return remainderAfter(line, close);
}

std::optional<std::string_view> MessageParser::handleThinkingContent(std::string_view line,
                                                                     AssemblerState &state) const
{
    std::size_t close = line.find(kThinkCloseTag);
    if (close == std::string_view::npos)
    {
        state.thinkingLines.emplace_back(line);
        return std::nullopt;
    }

    if (close > 0)
        state.thinkingLines.emplace_back(line.substr(0, close));
    state.thinkingOpen = false;
    flushThinking(state);
    return remainderAfter(line, close);
}

void MessageParser::handleImageReference(std::string_view line, AssemblerState &state) const
{
    if (auto id = extractImageId(line))
    {
        if (auto image = resolveImage(*id))
        {
            flushText(state);
            state.blocks.emplace_back(ImageBlock{std::move(image)});
            return;
        }
    }
    state.textLines.emplace_back(line);
}

std::optional<std::string_view> MessageParser::handlePlainText(std::string_view line, AssemblerState &state) const
{
    if (state.thinkingOpen)
        return handleThinkingContent(line, state);
    if (state.codeOpen)
    {
        state.codeLines.push_back(dropCharacters(line, state.codeIndent));
        return std::nullopt;
    }
    if (state.mathOpen)
    {
        state.mathLines.push_back(stripMathDelimiters(line));
        return std::nullopt;
    }

    flushTable(state);
    flushText(state);
    for (auto &fragment : scanner_.split(line))
        state.blocks.push_back(std::move(fragment));
    return std::nullopt;
}

std::shared_ptr<const ImageResource> MessageParser::resolveImage(const ImageId &id) const
{
    if (!resolver_)
        return nullptr;
    try
    {
        return resolver_(id);
    }
    catch (const std::exception &)
    {
        // A failing store degrades the reference to text like a miss does.
        return nullptr;
    }
}

void MessageParser::flushText(AssemblerState &state)
{
    if (state.textLines.empty())
        return;
    state.blocks.emplace_back(TextBlock{join(state.textLines)});
    state.textLines.clear();
}

void MessageParser::flushCode(AssemblerState &state)
{
    if (state.codeLines.empty())
        return;
    state.blocks.emplace_back(CodeBlock{join(state.codeLines), state.codeLanguage, state.codeIndent});
    state.codeLines.clear();
}

// Unlike the other buffers an empty math block still yields a formula.
void MessageParser::flushMath(AssemblerState &state)
{
    state.blocks.emplace_back(FormulaBlock{join(state.mathLines)});
    state.mathLines.clear();
}

void MessageParser::flushTable(AssemblerState &state)
{
    auto &table = state.table;
    if (!table.rows.empty())
        state.blocks.emplace_back(TableBlock{std::move(table.header), std::move(table.rows)});
    table = PendingTable{};
}

void MessageParser::flushThinking(AssemblerState &state)
{
    if (state.thinkingLines.empty())
        return;
    std::string content = removeAll(removeAll(join(state.thinkingLines), kThinkOpenTag), kThinkCloseTag);
    state.blocks.emplace_back(ThinkingBlock{trim(content), false});
    state.thinkingLines.clear();
}

void MessageParser::finish(AssemblerState &state)
{
    flushText(state);
    flushCode(state);
    if (state.mathOpen)
    {
        state.mathOpen = false;
        flushMath(state);
    }
    flushTable(state);
    state.thinkingOpen = false;
    flushThinking(state);
}

} // namespace msgparse
