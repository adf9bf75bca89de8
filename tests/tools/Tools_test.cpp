#include "ads/FakeAdsService.hpp"
#include "tools/ListAccessibleCustomersTool.hpp"
#include "tools/RegisterTools.hpp"
#include "tools/SearchTool.hpp"
#include <gtest/gtest.h>
#include <stdexcept>

using namespace ads_mcp;
using json = nlohmann::json;

class ToolsTest : public ::testing::Test {
protected:
    void SetUp() override {
        service = std::make_shared<FakeAdsService>();
        service->customers = {"customers/1234567890", "customers/9876543210"};
        service->rows = json::array({
            {{"campaign", {{"id", "11"}, {"name", "Brand"}}}, {"metrics", {{"clicks", "40"}}}},
            {{"campaign", {{"id", "12"}, {"name", "Generic"}}}}
        });
    }

    json search_args() const {
        return {
            {"customer_id", "123-456-7890"},
            {"resource", "campaign"},
            {"fields", {"campaign.id", "campaign.name", "metrics.clicks"}}
        };
    }

    std::shared_ptr<FakeAdsService> service;
};

TEST_F(ToolsTest, SearchTool_BuildsQueryAndFormatsRows) {
    SearchTool tool(service);
    json result = tool.execute(search_args());

    ASSERT_EQ(service->queries.size(), 1u);
    EXPECT_EQ(service->queries[0].first, "1234567890");
    EXPECT_EQ(service->queries[0].second,
              "SELECT campaign.id, campaign.name, metrics.clicks FROM campaign");

    ASSERT_TRUE(result.is_array());
    ASSERT_EQ(result.size(), 2u);
    EXPECT_EQ(result[0], json({{"campaign.id", "11"}, {"campaign.name", "Brand"},
                               {"metrics.clicks", "40"}}));
    EXPECT_TRUE(result[1]["metrics.clicks"].is_null());
}

TEST_F(ToolsTest, SearchTool_OptionalClauses) {
    SearchTool tool(service);
    json args = search_args();
    args["conditions"] = {"campaign.status = 'ENABLED'"};
    args["orderings"] = {"metrics.clicks DESC"};
    args["limit"] = "25";
    tool.execute(args);

    ASSERT_EQ(service->queries.size(), 1u);
    EXPECT_EQ(service->queries[0].second,
              "SELECT campaign.id, campaign.name, metrics.clicks FROM campaign"
              " WHERE campaign.status = 'ENABLED' ORDER BY metrics.clicks DESC LIMIT 25");
}

TEST_F(ToolsTest, SearchTool_IntegerLimit) {
    SearchTool tool(service);
    json args = search_args();
    args["limit"] = 3;
    tool.execute(args);
    EXPECT_NE(service->queries[0].second.find(" LIMIT 3"), std::string::npos);
}

TEST_F(ToolsTest, SearchTool_RejectsBadLimit) {
    SearchTool tool(service);
    for (const json& limit : {json("ten"), json("5x"), json(0), json(-2), json(true)}) {
        json args = search_args();
        args["limit"] = limit;
        EXPECT_THROW(tool.execute(args), std::invalid_argument) << limit.dump();
    }
    EXPECT_TRUE(service->queries.empty());
}

TEST_F(ToolsTest, SearchTool_RejectsBadCustomerId) {
    SearchTool tool(service);
    json args = search_args();
    args["customer_id"] = "customers/123";
    EXPECT_THROW(tool.execute(args), std::invalid_argument);
}

TEST_F(ToolsTest, SearchTool_PropagatesApiErrors) {
    service->failure = "PERMISSION_DENIED";
    SearchTool tool(service);
    EXPECT_THROW(tool.execute(search_args()), AdsApiError);
}

TEST_F(ToolsTest, SearchTool_Info) {
    ToolInfo info = SearchTool::get_info();
    EXPECT_EQ(info.name, "search");
    EXPECT_FALSE(info.description.empty());
    EXPECT_EQ(info.input_schema["required"], json::array({"customer_id", "fields", "resource"}));
}

TEST_F(ToolsTest, ListAccessibleCustomers_StripsPrefix) {
    service->customers.push_back("5555555555");
    ListAccessibleCustomersTool tool(service);
    json result = tool.execute(json::object());
    EXPECT_EQ(result, json::array({"1234567890", "9876543210", "5555555555"}));
}

TEST_F(ToolsTest, ListAccessibleCustomers_Empty) {
    service->customers.clear();
    ListAccessibleCustomersTool tool(service);
    EXPECT_EQ(tool.execute(json::object()), json::array());
}

TEST_F(ToolsTest, NullServiceRejected) {
    EXPECT_THROW(SearchTool(nullptr), std::invalid_argument);
    EXPECT_THROW(ListAccessibleCustomersTool(nullptr), std::invalid_argument);
}

TEST_F(ToolsTest, RegisterAdsTools) {
    ToolRegistry registry;
    register_ads_tools(registry, service);

    auto tools = registry.list_tools();
    ASSERT_EQ(tools.size(), 2u);
    EXPECT_EQ(tools[0].name, "search");
    EXPECT_EQ(tools[1].name, "list_accessible_customers");

    const RegisteredTool* customers = registry.find("list_accessible_customers");
    ASSERT_NE(customers, nullptr);
    EXPECT_EQ(customers->handler(json::object()).size(), 2u);
}
