#include "mcp/Errors.hpp"
#include "mcp/ToolExecutor.hpp"
#include <gtest/gtest.h>
#include <stdexcept>

using namespace ads_mcp;
using json = nlohmann::json;

class ToolExecutorTest : public ::testing::Test {
protected:
    void SetUp() override {
        registry = std::make_shared<ToolRegistry>();
        registry->register_tool(
            {"customers", "Lists customers", {{"type", "object"}}},
            [](const json&) -> json { return json::array({"123-456-7890"}); });
        registry->register_tool(
            {"greet", "Greets",
             {{"type", "object"},
              {"properties", {{"name", {{"type", "string"}}}}},
              {"required", json::array({"name"})}}},
            [](const json& args) -> json {
                return "Hello, " + args["name"].get<std::string>();
            });
        registry->register_tool(
            {"broken", "Throws", {{"type", "object"}}},
            [](const json&) -> json { throw std::runtime_error("network unreachable"); });
        registry->register_tool(
            {"rejects", "Throws an MCP error", {{"type", "object"}}},
            [](const json&) -> json { throw InvalidParamsError("bad input"); });
        executor = std::make_unique<ToolExecutor>(registry);
    }

    std::shared_ptr<ToolRegistry> registry;
    std::unique_ptr<ToolExecutor> executor;
};

TEST_F(ToolExecutorTest, NormalizesSequenceResult) {
    auto blocks = executor->execute("customers", json::object());
    ASSERT_EQ(blocks.size(), 1u);
    EXPECT_NE(to_json(blocks[0])["text"].get<std::string>().find("123-456-7890"),
              std::string::npos);
}

TEST_F(ToolExecutorTest, NormalizesTextResult) {
    auto blocks = executor->execute("greet", {{"name", "Ada"}});
    ASSERT_EQ(blocks.size(), 1u);
    EXPECT_EQ(std::get<TextContent>(blocks[0]).text, "Hello, Ada");
}

TEST_F(ToolExecutorTest, UnknownToolThrowsNotFound) {
    try {
        executor->execute("missing", json::object());
        FAIL() << "Expected ToolNotFoundError";
    } catch (const ToolNotFoundError& e) {
        EXPECT_EQ(e.tool_name(), "missing");
        EXPECT_EQ(e.code(), ErrorCode::ToolNotFound);
    }
}

TEST_F(ToolExecutorTest, SchemaViolationIsExecutionError) {
    try {
        executor->execute("greet", json::object());
        FAIL() << "Expected ToolExecutionError";
    } catch (const ToolExecutionError& e) {
        EXPECT_EQ(e.tool_name(), "greet");
        EXPECT_NE(e.cause().find("name"), std::string::npos);
    }
}

TEST_F(ToolExecutorTest, HandlerFailureIsExecutionError) {
    try {
        executor->execute("broken", json::object());
        FAIL() << "Expected ToolExecutionError";
    } catch (const ToolExecutionError& e) {
        EXPECT_EQ(e.code(), ErrorCode::ToolExecutionFailed);
        EXPECT_EQ(std::string(e.what()), "Error executing tool broken: network unreachable");
    }
}

TEST_F(ToolExecutorTest, McpErrorsFromHandlersKeepTheirCode) {
    try {
        executor->execute("rejects", json::object());
        FAIL() << "Expected McpError";
    } catch (const McpError& e) {
        EXPECT_EQ(e.code(), ErrorCode::InvalidParams);
    }
}

TEST(ToolExecutorConstructionTest, NullRegistryRejected) {
    EXPECT_THROW(ToolExecutor(nullptr), std::invalid_argument);
}

TEST(ToolRegistryTest, RejectsInvalidRegistrations) {
    ToolRegistry registry;
    auto handler = [](const json&) -> json { return "ok"; };
    EXPECT_THROW(registry.register_tool({"", "no name", json::object()}, handler),
                 std::invalid_argument);
    EXPECT_THROW(registry.register_tool({"x", "no handler", json::object()}, nullptr),
                 std::invalid_argument);
    registry.register_tool({"x", "first", json::object()}, handler);
    EXPECT_THROW(registry.register_tool({"x", "duplicate", json::object()}, handler),
                 std::invalid_argument);
    EXPECT_EQ(registry.size(), 1u);
}

TEST(ToolRegistryTest, PreservesRegistrationOrder) {
    ToolRegistry registry;
    auto handler = [](const json&) -> json { return "ok"; };
    registry.register_tool({"zeta", "", json::object()}, handler);
    registry.register_tool({"alpha", "", json::object()}, handler);
    auto tools = registry.list_tools();
    ASSERT_EQ(tools.size(), 2u);
    EXPECT_EQ(tools[0].name, "zeta");
    EXPECT_EQ(tools[1].name, "alpha");
    EXPECT_NE(registry.find("alpha"), nullptr);
    EXPECT_EQ(registry.find("beta"), nullptr);
}
