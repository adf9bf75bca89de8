#include "mcp/ContentBlock.hpp"
#include "mcp/Errors.hpp"
#include <gtest/gtest.h>

using namespace ads_mcp;
using json = nlohmann::json;

TEST(ContentBlockTest, StringBecomesText) {
    auto blocks = normalize_result("hello");
    ASSERT_EQ(blocks.size(), 1u);
    ASSERT_TRUE(std::holds_alternative<TextContent>(blocks[0]));
    EXPECT_EQ(std::get<TextContent>(blocks[0]).text, "hello");
}

TEST(ContentBlockTest, MappingBecomesStructured) {
    json value = {{"customer", "123"}, {"clicks", 4}};
    auto blocks = normalize_result(value);
    ASSERT_EQ(blocks.size(), 1u);
    ASSERT_TRUE(std::holds_alternative<StructuredContent>(blocks[0]));
    EXPECT_EQ(std::get<StructuredContent>(blocks[0]).data, value);
}

TEST(ContentBlockTest, SequenceOfPrimitivesBecomesOneStructuredBlock) {
    auto blocks = normalize_result(json::array({"123-456-7890", "555"}));
    ASSERT_EQ(blocks.size(), 1u);
    EXPECT_TRUE(std::holds_alternative<StructuredContent>(blocks[0]));
}

TEST(ContentBlockTest, EmptySequenceIsStructured) {
    auto blocks = normalize_result(json::array());
    ASSERT_EQ(blocks.size(), 1u);
    EXPECT_EQ(to_json(blocks[0])["text"], "[]");
}

TEST(ContentBlockTest, ScalarsAreStructured) {
    EXPECT_EQ(to_json(normalize_result(42)[0])["text"], "42");
    EXPECT_EQ(to_json(normalize_result(true)[0])["text"], "true");
}

TEST(ContentBlockTest, TextBlockPassesThrough) {
    auto blocks = normalize_result({{"type", "text"}, {"text", "already formatted"}});
    ASSERT_EQ(blocks.size(), 1u);
    EXPECT_EQ(std::get<TextContent>(blocks[0]).text, "already formatted");
}

TEST(ContentBlockTest, ArrayOfTextBlocksPassesThrough) {
    json value = json::array({
        {{"type", "text"}, {"text", "one"}},
        {{"type", "text"}, {"text", "two"}}
    });
    auto blocks = normalize_result(value);
    ASSERT_EQ(blocks.size(), 2u);
    EXPECT_EQ(to_json(blocks), value);
}

TEST(ContentBlockTest, FormedToolResultPassesThrough) {
    json value = {{"content", json::array({{{"type", "text"}, {"text", "done"}}})}};
    auto blocks = normalize_result(value);
    ASSERT_EQ(blocks.size(), 1u);
    EXPECT_EQ(std::get<TextContent>(blocks[0]).text, "done");
}

TEST(ContentBlockTest, MixedArrayIsStructured) {
    json value = json::array({{{"type", "text"}, {"text", "one"}}, 2});
    auto blocks = normalize_result(value);
    ASSERT_EQ(blocks.size(), 1u);
    EXPECT_TRUE(std::holds_alternative<StructuredContent>(blocks[0]));
}

TEST(ContentBlockTest, TextBlockWithNonStringTextIsStructured) {
    auto blocks = normalize_result({{"type", "text"}, {"text", 5}});
    EXPECT_TRUE(std::holds_alternative<StructuredContent>(blocks[0]));
}

TEST(ContentBlockTest, NullIsRejected) {
    EXPECT_THROW(normalize_result(nullptr), NormalizationError);
}

TEST(ContentBlockTest, BinaryIsRejected) {
    EXPECT_THROW(normalize_result(json::binary({0x01, 0x02})), NormalizationError);
}

TEST(ContentBlockTest, WireFormat) {
    json text = to_json(ContentBlock{TextContent{"hi"}});
    EXPECT_EQ(text, (json{{"type", "text"}, {"text", "hi"}}));

    json structured = to_json(ContentBlock{StructuredContent{{{"a", 1}}}});
    EXPECT_EQ(structured["type"], "text");
    EXPECT_EQ(json::parse(structured["text"].get<std::string>()), (json{{"a", 1}}));
    EXPECT_NE(structured["text"].get<std::string>().find("\n  \"a\""), std::string::npos);
}

TEST(ContentBlockTest, PassThroughKeepsExtraMembers) {
    json block = {{"type", "text"}, {"text", "note"},
                  {"annotations", {{"audience", {"user"}}, {"priority", 0.5}}}};

    auto single = normalize_result(block);
    ASSERT_EQ(single.size(), 1u);
    EXPECT_EQ(to_json(single[0]), block);

    auto listed = normalize_result({{"content", json::array({block})}});
    EXPECT_EQ(to_json(listed), json::array({block}));
}

TEST(ContentBlockTest, InvalidUtf8InStructuredDataIsReplaced) {
    json value = {{"name", std::string("bad\xff" "byte")}};
    auto blocks = normalize_result(value);
    json wire;
    ASSERT_NO_THROW(wire = to_json(blocks[0]));
    EXPECT_NE(wire["text"].get<std::string>().find("\xEF\xBF\xBD"), std::string::npos);
}
