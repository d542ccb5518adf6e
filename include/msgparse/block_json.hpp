#pragma once

#include "msgparse/content_block.hpp"

#include <nlohmann/json.hpp>

#include <string>
#include <vector>

namespace msgparse
{

nlohmann::json blockToJson(const ContentBlock &block);
nlohmann::json blocksToJson(const std::vector<ContentBlock> &blocks);

// One "[kind ...]" header per block followed by its payload, indented.
std::string describeBlocks(const std::vector<ContentBlock> &blocks);

} // namespace msgparse
