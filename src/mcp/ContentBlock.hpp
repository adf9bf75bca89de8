#pragma once

#include <string>
#include <variant>
#include <vector>
#include <nlohmann/json.hpp>

namespace ads_mcp {

using json = nlohmann::json;

/**
 * @brief Plain text produced by a tool
 */
struct TextContent {
    std::string text;
    json extra = json::object();  ///< Other members of a passed-through block (annotations, _meta)
};

/**
 * @brief Structured data (mapping, sequence or scalar) produced by a tool
 *
 * Sent to clients as a text block holding the pretty-printed JSON value.
 */
struct StructuredContent {
    json data;
};

using ContentBlock = std::variant<TextContent, StructuredContent>;

/**
 * @brief Serialize a content block into its MCP wire form
 */
json to_json(const ContentBlock& block);

/**
 * @brief Serialize a sequence of blocks into an MCP "content" array
 */
json to_json(const std::vector<ContentBlock>& blocks);

/**
 * @brief Check for an MCP text block: {"type": "text", "text": <string>}
 */
bool is_text_block(const json& value);

/**
 * @brief Normalize a tool's native return value into content blocks
 *
 * - string: one TextContent
 * - text block, or array / {"content": [...]} of text blocks: passed through
 *   with every member kept
 * - any other object, array, number or boolean: one StructuredContent
 *
 * @throws NormalizationError for null and binary values
 */
std::vector<ContentBlock> normalize_result(const json& value);

} // namespace ads_mcp
