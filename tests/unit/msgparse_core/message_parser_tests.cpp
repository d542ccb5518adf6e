#include <gtest/gtest.h>

#include "msgparse/message_parser.hpp"

#include <map>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

using msgparse::CodeBlock;
using msgparse::ContentBlock;
using msgparse::FormulaBlock;
using msgparse::ImageBlock;
using msgparse::ImageId;
using msgparse::ImageResource;
using msgparse::MessageParser;
using msgparse::ParserOptions;
using msgparse::TableBlock;
using msgparse::TextBlock;
using msgparse::ThinkingBlock;

namespace
{

const char *kCatId = "3f2504e0-4f89-11d3-9a0c-0305e82c3301";
const char *kDogId = "6ba7b810-9dad-11d1-80b4-00c04fd430c8";

ContentBlock text(std::string body)
{
    return TextBlock{std::move(body)};
}

ContentBlock formula(std::string content)
{
    return FormulaBlock{std::move(content)};
}

ContentBlock code(std::string body, std::string language = {}, std::size_t indent = 0)
{
    return CodeBlock{std::move(body), std::move(language), indent};
}

ContentBlock table(std::vector<std::string> header, std::vector<std::vector<std::string>> rows)
{
    return TableBlock{std::move(header), std::move(rows)};
}

ContentBlock thinking(std::string content)
{
    return ThinkingBlock{std::move(content), false};
}

std::vector<ContentBlock> parse(const std::string &message, bool strict = false)
{
    ParserOptions options;
    options.strictBlocks = strict;
    return MessageParser({}, options).parse(message);
}

// Resolver over a fixed set of identifiers.
class FakeImageStore
{
public:
    void add(const char *id)
    {
        auto parsed = ImageId::parse(id);
        ASSERT_TRUE(parsed.has_value());
        auto image = std::make_shared<ImageResource>();
        image->id = *parsed;
        image->mediaType = "image/png";
        image->data = {0x89, 'P', 'N', 'G'};
        images_[*parsed] = image;
    }

    msgparse::ImageResolver resolver()
    {
        return [this](const ImageId &id) -> std::shared_ptr<const ImageResource> {
            ++calls_;
            auto it = images_.find(id);
            if (it == images_.end())
                return nullptr;
            return it->second;
        };
    }

    int calls() const { return calls_; }

private:
    std::map<ImageId, std::shared_ptr<const ImageResource>> images_;
    int calls_ = 0;
};

std::string imageLine(const char *id)
{
    return std::string("<image-uuid>") + id + "</image-uuid>";
}

} // namespace

TEST(MessageParser, EmptyInputYieldsSingleEmptyText)
{
    EXPECT_EQ(parse(""), std::vector<ContentBlock>{text("")});
}

TEST(MessageParser, PlainLineIsSingleText)
{
    EXPECT_EQ(parse("This is just plain text."), std::vector<ContentBlock>{text("This is just plain text.")});
}

TEST(MessageParser, EmitsProseLinesOneAtATime)
{
    std::vector<ContentBlock> expected{text("first line"), text(""), text("second line")};
    EXPECT_EQ(parse("first line\n\nsecond line"), expected);
}

TEST(MessageParser, SplitsInlineMathInProse)
{
    std::vector<ContentBlock> expected{text("Hello "), formula("x^2"), text(" world")};
    EXPECT_EQ(parse("Hello $x^2$ world"), expected);
}

TEST(MessageParser, KeepsEscapedDollarInText)
{
    std::vector<ContentBlock> expected{text("This is a real \\$5 price, not "), formula("x=1"), text(".")};
    EXPECT_EQ(parse("This is a real \\$5 price, not $x=1$."), expected);
}

TEST(MessageParser, EmptyDollarSpanIsFormula)
{
    std::vector<ContentBlock> expected{text("Text "), formula(""), text(" end")};
    EXPECT_EQ(parse("Text $$ end"), expected);
}

TEST(MessageParser, TableBetweenProse)
{
    const std::string input = "Intro text\n"
                              "| Column 1 | Column 2 |\n"
                              "| -------- | -------- |\n"
                              "| Value 1  | Value 2  |\n"
                              "| Value 3  | Value 4  |\n"
                              "Closing text";
    std::vector<ContentBlock> expected{
        text("Intro text"),
        table({"Column 1", "Column 2"}, {{"Value 1", "Value 2"}, {"Value 3", "Value 4"}}),
        text("Closing text")};
    EXPECT_EQ(parse(input), expected);
}

TEST(MessageParser, TableWithBlankLinesAround)
{
    const std::string input = "This is a sample text.\n"
                              "\n"
                              "Table: Test Table\n"
                              "| Column 1 | Column 2 |\n"
                              "| -------- | -------- |\n"
                              "| Value 1  | Value 2  |\n"
                              "| Value 3  | Value 4  |\n"
                              "\n"
                              "This is another sample text.";
    auto blocks = parse(input);
    ASSERT_EQ(blocks.size(), 6u);
    EXPECT_EQ(blocks[2], text("Table: Test Table"));
    EXPECT_EQ(blocks[3], table({"Column 1", "Column 2"}, {{"Value 1", "Value 2"}, {"Value 3", "Value 4"}}));
    EXPECT_EQ(blocks[4], text(""));
    EXPECT_EQ(blocks[5], text("This is another sample text."));
}

TEST(MessageParser, TableAtEndOfInputIsFlushed)
{
    std::vector<ContentBlock> expected{table({"A", "B"}, {{"1", "2"}})};
    EXPECT_EQ(parse("| A | B |\n|---|---|\n| 1 | 2 |"), expected);
}

TEST(MessageParser, AlignmentRowsAreNotData)
{
    auto blocks = parse("| Left | Center | Right |\n|:-----|:------:|------:|\n| a | b | c |");
    ASSERT_EQ(blocks.size(), 1u);
    const auto &parsed = std::get<TableBlock>(blocks[0]);
    EXPECT_EQ(parsed.header, (std::vector<std::string>{"Left", "Center", "Right"}));
    ASSERT_EQ(parsed.rows.size(), 1u);
    EXPECT_EQ(parsed.rows[0], (std::vector<std::string>{"a", "b", "c"}));
}

TEST(MessageParser, DropsEmptyCells)
{
    std::vector<ContentBlock> expected{table({"a", "b"}, {{"1", "2"}})};
    EXPECT_EQ(parse("| a | | b |\n| 1 | 2 | |"), expected);
}

TEST(MessageParser, HeaderOnlyTableIsDropped)
{
    EXPECT_EQ(parse("| Only | Header |\n|---|---|\nAfter"), std::vector<ContentBlock>{text("After")});
}

TEST(MessageParser, HeaderOnlyTableDoesNotLeakIntoNextTable)
{
    std::vector<ContentBlock> expected{text("plain"), table({"H"}, {{"r"}})};
    EXPECT_EQ(parse("| Lost |\nplain\n| H |\n| r |"), expected);
}

TEST(MessageParser, TablesAndCodeBlocksInterleave)
{
    const std::string input = "| A | B |\n"
                              "|---|---|\n"
                              "| 1 | 2 |\n"
                              "\n"
                              "```\n"
                              "This is a code block\n"
                              "```\n"
                              "| C | D |\n"
                              "|:-:|--:|\n"
                              "| 3 | 4 |\n";
    std::vector<ContentBlock> expected{
        table({"A", "B"}, {{"1", "2"}}),
        text(""),
        code("This is a code block"),
        table({"C", "D"}, {{"3", "4"}}),
        text("")};
    EXPECT_EQ(parse(input), expected);
}

TEST(MessageParser, CodeFenceFlushesPendingTable)
{
    std::vector<ContentBlock> expected{table({"A"}, {{"1"}}), code("x")};
    EXPECT_EQ(parse("| A |\n|---|\n| 1 |\n```\nx\n```"), expected);
}

TEST(MessageParser, CodeBlockWithLanguage)
{
    std::vector<ContentBlock> expected{text("Code:"), code("let a = 1", "swift"), text("End.")};
    EXPECT_EQ(parse("Code:\n```swift\nlet a = 1\n```\nEnd."), expected);
}

TEST(MessageParser, TrimsLanguageTag)
{
    EXPECT_EQ(parse("```  c++  \nint x;\n```"), std::vector<ContentBlock>{code("int x;", "c++")});
}

TEST(MessageParser, StripsFenceIndentFromBody)
{
    const std::string input = "  ```python\n"
                              "  def f():\n"
                              "      return 1\n"
                              "  ```";
    EXPECT_EQ(parse(input), std::vector<ContentBlock>{code("def f():\n    return 1", "python", 2)});
}

TEST(MessageParser, IndentComesFromOpeningFence)
{
    EXPECT_EQ(parse("  ```\n  a\n```"), std::vector<ContentBlock>{code("a", "", 2)});
}

TEST(MessageParser, CodeBodyIsNotScannedForMath)
{
    EXPECT_EQ(parse("```\nprice $5 and $6\n```"), std::vector<ContentBlock>{code("price $5 and $6")});
}

TEST(MessageParser, UnclosedFenceRunsToEndOfInput)
{
    const std::string input = "Here's a FizzBuzz implementation in Shakespeare Programming Language:\n"
                              "\n"
                              "```\n"
                              "The Infamous FizzBuzz Program.\n"
                              "By ChatGPT.\n"
                              "\n"
                              "Act 1: The Setup\n"
                              "Scene 1: Initializing Variables.\n"
                              "[Enter Romeo and Juliet]";
    std::vector<ContentBlock> expected{
        text("Here's a FizzBuzz implementation in Shakespeare Programming Language:"),
        text(""),
        code("The Infamous FizzBuzz Program.\nBy ChatGPT.\n\nAct 1: The Setup\nScene 1: Initializing Variables.\n"
             "[Enter Romeo and Juliet]")};
    EXPECT_EQ(parse(input), expected);
}

TEST(MessageParser, EmptyCodeBlockEmitsNothing)
{
    std::vector<ContentBlock> expected{text("a"), text("b")};
    EXPECT_EQ(parse("a\n```\n```\nb"), expected);
}

TEST(MessageParser, MathBlockAcrossLines)
{
    const std::string input = "Intro:\n"
                              "\\[\n"
                              "S = -\\frac{1}{4\\pi\\alpha'} \\int d\\tau\n"
                              "\\]\n"
                              "\n"
                              "Where:\n"
                              "- \\( S \\) is the action.";
    std::vector<ContentBlock> expected{
        text("Intro:"),
        formula("S = -\\frac{1}{4\\pi\\alpha'} \\int d\\tau"),
        text(""),
        text("Where:"),
        text("- "),
        formula(" S "),
        text(" is the action.")};
    EXPECT_EQ(parse(input), expected);
}

TEST(MessageParser, SingleLineBlockFormula)
{
    std::vector<ContentBlock> expected{text("Formula:"), formula("\\sum i = 0"), text("Next line.")};
    EXPECT_EQ(parse("Formula:\n\\[\\sum i = 0\\]\nNext line."), expected);
}

TEST(MessageParser, EmptyMathBlockStillYieldsFormula)
{
    EXPECT_EQ(parse("\\[\n\\]"), std::vector<ContentBlock>{formula("")});
}

TEST(MessageParser, ConsecutiveMathBlocksDoNotShareLines)
{
    std::vector<ContentBlock> expected{formula("a"), formula("b\nc")};
    EXPECT_EQ(parse("\\[\na\n\\]\n\\[\nb\nc\n\\]"), expected);
}

TEST(MessageParser, UnterminatedMathBlockIsFlushed)
{
    EXPECT_EQ(parse("\\[\na = b"), std::vector<ContentBlock>{formula("a = b")});
}

TEST(MessageParser, SingleLineThinking)
{
    std::vector<ContentBlock> expected{thinking("pondering"), text("Answer")};
    EXPECT_EQ(parse("<think> pondering </think>\nAnswer"), expected);
}

TEST(MessageParser, MultiLineThinking)
{
    std::vector<ContentBlock> expected{thinking("step one\nstep two"), text("Result")};
    EXPECT_EQ(parse("<think>\nstep one\nstep two\n</think>\nResult"), expected);
}

TEST(MessageParser, ThinkingContentOnTagLines)
{
    EXPECT_EQ(parse("<think>first\nsecond</think>"), std::vector<ContentBlock>{thinking("first\nsecond")});
}

TEST(MessageParser, TextAfterClosingThinkTagIsKept)
{
    std::vector<ContentBlock> expected{thinking("idea"), text("The answer is "), formula("x")};
    EXPECT_EQ(parse("<think>\nidea\n</think>The answer is $x$"), expected);
}

TEST(MessageParser, ThinkingIsNotScannedForMath)
{
    EXPECT_EQ(parse("<think>\ncost $5 or $6\n</think>"), std::vector<ContentBlock>{thinking("cost $5 or $6")});
}

TEST(MessageParser, UnterminatedThinkingIsFlushed)
{
    auto blocks = parse("Before\n<think>\nstill going");
    ASSERT_EQ(blocks.size(), 2u);
    const auto &block = std::get<ThinkingBlock>(blocks[1]);
    EXPECT_EQ(block.content, "still going");
    EXPECT_FALSE(block.expanded);
}

TEST(MessageParser, SingleLineThinkingDoesNotSplitTable)
{
    std::vector<ContentBlock> expected{thinking("t"), table({"A"}, {{"1"}, {"2"}})};
    EXPECT_EQ(parse("| A |\n| 1 |\n<think>t</think>\n| 2 |"), expected);
}

TEST(MessageParser, OpeningThinkTagFlushesTable)
{
    std::vector<ContentBlock> expected{table({"A"}, {{"1"}}), thinking("t")};
    EXPECT_EQ(parse("| A |\n| 1 |\n<think>\nt\n</think>"), expected);
}

TEST(MessageParser, ManyThinkingPairsOnOneLine)
{
    const std::size_t pairs = 50000;
    std::string line;
    for (std::size_t i = 0; i < pairs; ++i)
        line += "<think>a</think>";
    line += "done";

    auto blocks = parse(line);
    ASSERT_EQ(blocks.size(), pairs + 1);
    EXPECT_EQ(blocks.front(), thinking("a"));
    EXPECT_EQ(blocks[pairs - 1], thinking("a"));
    EXPECT_EQ(blocks.back(), text("done"));
}

TEST(MessageParser, ThinkingClosedMidLineThenReopened)
{
    std::vector<ContentBlock> expected{thinking("one"), thinking("two"), thinking("three\nfour")};
    EXPECT_EQ(parse("<think>\none</think><think>two</think><think>three\nfour</think>"), expected);
}

TEST(MessageParser, EmptyThinkingEmitsNothing)
{
    EXPECT_EQ(parse("<think>\n</think>\nok"), std::vector<ContentBlock>{text("ok")});
}

TEST(MessageParser, ResolvedImageBecomesImageBlock)
{
    FakeImageStore store;
    store.add(kCatId);
    MessageParser parser(store.resolver());

    auto blocks = parser.parse("See below:\n" + imageLine(kCatId) + "\nDone");
    ASSERT_EQ(blocks.size(), 3u);
    EXPECT_EQ(blocks[0], text("See below:"));
    const auto &image = std::get<ImageBlock>(blocks[1]);
    ASSERT_NE(image.image, nullptr);
    EXPECT_EQ(image.image->id.toString(), kCatId);
    EXPECT_EQ(blocks[2], text("Done"));
    EXPECT_EQ(store.calls(), 1);
}

TEST(MessageParser, UppercaseIdentifierResolves)
{
    FakeImageStore store;
    store.add(kDogId);
    MessageParser parser(store.resolver());

    auto blocks = parser.parse("<image-uuid>6BA7B810-9DAD-11D1-80B4-00C04FD430C8</image-uuid>");
    ASSERT_EQ(blocks.size(), 1u);
    EXPECT_TRUE(std::holds_alternative<ImageBlock>(blocks[0]));
}

TEST(MessageParser, UnresolvedImagesFallBackToOneTextRun)
{
    FakeImageStore store;
    store.add(kCatId);
    MessageParser parser(store.resolver());

    const std::string missing = imageLine(kDogId);
    const std::string malformed = "<image-uuid>not-a-uuid</image-uuid>";
    auto blocks = parser.parse(missing + "\n" + malformed + "\nafter");
    std::vector<ContentBlock> expected{text(missing + "\n" + malformed), text("after")};
    EXPECT_EQ(blocks, expected);
    EXPECT_EQ(store.calls(), 1);
}

TEST(MessageParser, UnclosedImageTagIsText)
{
    FakeImageStore store;
    store.add(kCatId);
    MessageParser parser(store.resolver());

    const std::string line = std::string("<image-uuid>") + kCatId;
    EXPECT_EQ(parser.parse(line), std::vector<ContentBlock>{text(line)});
    EXPECT_EQ(store.calls(), 0);
}

TEST(MessageParser, ImageWithoutResolverIsText)
{
    const std::string line = imageLine(kCatId);
    EXPECT_EQ(parse(line), std::vector<ContentBlock>{text(line)});
}

TEST(MessageParser, ThrowingResolverDegradesToText)
{
    MessageParser parser([](const ImageId &) -> std::shared_ptr<const ImageResource> {
        throw std::runtime_error("store offline");
    });
    const std::string line = imageLine(kCatId);
    EXPECT_EQ(parser.parse(line), std::vector<ContentBlock>{text(line)});
}

TEST(MessageParser, TableRowInsideFenceKeepsLegacyRouting)
{
    EXPECT_EQ(parse("```\n| a | b |\ncode\n```"), std::vector<ContentBlock>{code("code")});
}

TEST(MessageParser, StrictBlocksKeepTableRowsInCode)
{
    EXPECT_EQ(parse("```\n| a | b |\ncode\n```", true), std::vector<ContentBlock>{code("| a | b |\ncode")});
}

TEST(MessageParser, MathOpenerInsideFence)
{
    EXPECT_EQ(parse("```\n\\[\n```"), std::vector<ContentBlock>{formula("")});
    EXPECT_EQ(parse("```\n\\[\n```", true), std::vector<ContentBlock>{code("\\[")});
}

TEST(MessageParser, StrictBlocksKeepTableRowsInThinking)
{
    EXPECT_TRUE(parse("<think>\n| not | table |\n</think>").empty());
    EXPECT_EQ(parse("<think>\n| not | table |\n</think>", true),
              std::vector<ContentBlock>{thinking("| not | table |")});
}

TEST(MessageParser, ProseReconstructsInput)
{
    const std::string input = "alpha\n\nbeta gamma\n  indented line\n";
    std::string rebuilt;
    auto blocks = parse(input);
    for (std::size_t i = 0; i < blocks.size(); ++i)
    {
        ASSERT_TRUE(std::holds_alternative<TextBlock>(blocks[i]));
        if (i > 0)
            rebuilt.push_back('\n');
        rebuilt += std::get<TextBlock>(blocks[i]).body;
    }
    EXPECT_EQ(rebuilt, input);
}

TEST(MessageParser, MixedMessageReconstructsFromPayloads)
{
    const std::string input = "Intro\n"
                              "```cpp\n"
                              "int x = 1;\n"
                              "return x;\n"
                              "```\n"
                              "| A | B |\n"
                              "|---|---|\n"
                              "| 1 | 2 |\n"
                              "$E=mc^2$\n"
                              "<think>plan</think>\n"
                              "Outro";
    auto blocks = parse(input);

    std::vector<msgparse::BlockKind> kinds;
    std::string rebuilt;
    for (std::size_t i = 0; i < blocks.size(); ++i)
    {
        kinds.push_back(msgparse::blockKind(blocks[i]));
        if (i > 0)
            rebuilt.push_back('\n');
        rebuilt += msgparse::blockPayload(blocks[i]);
    }

    using msgparse::BlockKind;
    EXPECT_EQ(kinds, (std::vector<BlockKind>{BlockKind::Text, BlockKind::Code, BlockKind::Table, BlockKind::Formula,
                                             BlockKind::Thinking, BlockKind::Text}));
    EXPECT_EQ(rebuilt, "Intro\n"
                       "int x = 1;\n"
                       "return x;\n"
                       "| A | B |\n"
                       "| 1 | 2 |\n"
                       "E=mc^2\n"
                       "plan\n"
                       "Outro");
}

TEST(MessageParser, EndOfInputFlushesTextBeforeTable)
{
    const std::string reference = imageLine(kDogId);
    std::vector<ContentBlock> expected{text(reference), table({"A"}, {{"1"}})};
    EXPECT_EQ(parse("| A |\n| 1 |\n" + reference), expected);
}

TEST(MessageParser, ParserIsReusable)
{
    MessageParser parser;
    auto first = parser.parse("```\nopen fence");
    auto second = parser.parse("plain");
    EXPECT_EQ(first, std::vector<ContentBlock>{code("open fence")});
    EXPECT_EQ(second, std::vector<ContentBlock>{text("plain")});
}

TEST(MessageParser, SplitLinesKeepsEmptyLines)
{
    EXPECT_EQ(MessageParser::splitLines(""), std::vector<std::string>{""});
    EXPECT_EQ(MessageParser::splitLines("a\n\nb\n"), (std::vector<std::string>{"a", "", "b", ""}));
}

TEST(MessageParser, ParseTableRowTrimsAndDropsEmptyCells)
{
    EXPECT_EQ(MessageParser::parseTableRow("|  x  | |y|"), (std::vector<std::string>{"x", "y"}));
    EXPECT_TRUE((MessageParser::isTableDelimiterRow(std::vector<std::string>{"---", ":--:"})));
    EXPECT_FALSE((MessageParser::isTableDelimiterRow(std::vector<std::string>{"---", "a"})));
}
