#pragma once

#include "msgparse/content_block.hpp"
#include "msgparse/image_id.hpp"
#include "msgparse/inline_math.hpp"
#include "msgparse/line_classifier.hpp"

#include <cstddef>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace msgparse
{

// Returns null when the identifier is unknown.
using ImageResolver = std::function<std::shared_ptr<const ImageResource>(const ImageId &)>;

struct ParserOptions
{
    // Route every line inside an open code, math or thinking block into that
    // block, whatever its category.
    bool strictBlocks = false;
};

struct PendingTable
{
    std::vector<std::string> header;
    std::vector<std::vector<std::string>> rows;
    bool headerCaptured = false;
};

struct AssemblerState
{
    bool codeOpen = false;
    bool mathOpen = false;
    bool thinkingOpen = false;
    std::string codeLanguage;
    std::size_t codeIndent = 0;
    std::vector<std::string> textLines;
    std::vector<std::string> codeLines;
    std::vector<std::string> mathLines;
    std::vector<std::string> thinkingLines;
    PendingTable table;
    std::vector<ContentBlock> blocks;
};

class MessageParser
{
public:
    MessageParser() = default;
    explicit MessageParser(ImageResolver resolver, ParserOptions options = {});

    std::vector<ContentBlock> parse(std::string_view message) const;

    const ParserOptions &options() const noexcept { return options_; }
    void setOptions(const ParserOptions &options) { options_ = options; }
    void setImageResolver(ImageResolver resolver) { resolver_ = std::move(resolver); }

    static std::vector<std::string> splitLines(std::string_view message);
    static std::vector<std::string> parseTableRow(std::string_view line);
    static bool isTableDelimiterRow(const std::vector<std::string> &cells) noexcept;
    static std::optional<ImageId> extractImageId(std::string_view line) noexcept;

private:
    // Each returns the part of the line still to be processed, if any.
    std::optional<std::string_view> processLine(std::string_view line, AssemblerState &state) const;
    LineCategory effectiveCategory(std::string_view line, const AssemblerState &state) const;

    void handleCodeFence(std::string_view line, AssemblerState &state) const;
    void handleTableRow(std::string_view line, AssemblerState &state) const;
    void handleMathOpen(AssemblerState &state) const;
    void handleMathLine(std::string_view line, AssemblerState &state) const;
    std::optional<std::string_view> handleThinking(std::string_view line, AssemblerState &state) const;
    std::optional<std::string_view> handleThinkingContent(std::string_view line, AssemblerState &state) const;
    void handleImageReference(std::string_view line, AssemblerState &state) const;
    std::optional<std::string_view> handlePlainText(std::string_view line, AssemblerState &state) const;

    std::shared_ptr<const ImageResource> resolveImage(const ImageId &id) const;

    static void flushText(AssemblerState &state);
    static void flushCode(AssemblerState &state);
    static void flushMath(AssemblerState &state);
    static void flushTable(AssemblerState &state);
    static void flushThinking(AssemblerState &state);
    static void finish(AssemblerState &state);

    ImageResolver resolver_;
    ParserOptions options_;
    InlineMathScanner scanner_;
};

} // namespace msgparse
