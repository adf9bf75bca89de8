#include "ContentBlock.hpp"
#include "Errors.hpp"

namespace ads_mcp {

namespace {

struct BlockSerializer {
    json operator()(const TextContent& block) const {
        json out = block.extra.is_object() ? block.extra : json::object();
        out["type"] = "text";
        out["text"] = block.text;
        return out;
    }

    json operator()(const StructuredContent& block) const {
        return {{"type", "text"},
                {"text", block.data.dump(2, ' ', false, json::error_handler_t::replace)}};
    }
};

bool all_text_blocks(const json& array) {
    if (!array.is_array() || array.empty()) {
        return false;
    }
    for (const auto& item : array) {
        if (!is_text_block(item)) {
            return false;
        }
    }
    return true;
}

TextContent keep_text_block(const json& block) {
    json extra = block;
    extra.erase("type");
    extra.erase("text");
    return {block["text"].get<std::string>(), std::move(extra)};
}

std::vector<ContentBlock> pass_through(const json& array) {
    std::vector<ContentBlock> blocks;
    blocks.reserve(array.size());
    for (const auto& item : array) {
        blocks.push_back(keep_text_block(item));
    }
    return blocks;
}

} // namespace

json to_json(const ContentBlock& block) {
    return std::visit(BlockSerializer{}, block);
}

json to_json(const std::vector<ContentBlock>& blocks) {
    json content = json::array();
    for (const auto& block : blocks) {
        content.push_back(to_json(block));
    }
    return content;
}

bool is_text_block(const json& value) {
    if (!value.is_object()) {
        return false;
    }
    auto type = value.find("type");
    auto text = value.find("text");
    return type != value.end() && type->is_string() && *type == "text" &&
           text != value.end() && text->is_string();
}

std::vector<ContentBlock> normalize_result(const json& value) {
    switch (value.type()) {
    case json::value_t::string:
        return {TextContent{value.get<std::string>()}};

    case json::value_t::object:
        if (is_text_block(value)) {
            return {keep_text_block(value)};
        }
        if (value.contains("content") && all_text_blocks(value["content"])) {
            return pass_through(value["content"]);
        }
        return {StructuredContent{value}};

    case json::value_t::array:
        if (all_text_blocks(value)) {
            return pass_through(value);
        }
        return {StructuredContent{value}};

    case json::value_t::boolean:
    case json::value_t::number_integer:
    case json::value_t::number_unsigned:
    case json::value_t::number_float:
        return {StructuredContent{value}};

    case json::value_t::null:
        throw NormalizationError("Tool returned no value");

    default:
        throw NormalizationError(std::string("Cannot convert tool result of type ") +
                                 value.type_name() + " to content");
    }
}

} // namespace ads_mcp
