#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include "business/in_memory_business_layer.hpp"
#include "dialogue/quote_tools.hpp"

using namespace printvoice;
using namespace printvoice::dialogue;
using json = nlohmann::json;
using ::testing::Field;
using ::testing::InSequence;
using ::testing::Return;

namespace {

class MockBusinessLayer : public business::BusinessLayer {
public:
    MOCK_METHOD(business::Customer, findOrCreateCustomer, (const std::string&), (override));
    MOCK_METHOD(std::optional<business::Customer>, findCustomer, (const std::string&), (const, override));
    MOCK_METHOD(int, allocateQuoteNumber, (), (override));
    MOCK_METHOD(business::Quote, createQuote, (const business::QuoteDraft&), (override));
    MOCK_METHOD(double, recalculateQuoteTotal, (const std::string&), (override));
    MOCK_METHOD(std::optional<business::Quote>, getQuote, (const std::string&), (const, override));
    MOCK_METHOD(std::vector<business::Product>, searchProducts, (const std::string&, size_t), (const, override));
    MOCK_METHOD(std::vector<business::Quote>, recentQuotes, (const std::string&, size_t), (const, override));
};

} // namespace

class QuoteToolsTest : public ::testing::Test {
protected:
    void SetUp() override {
        business_ = std::make_shared<business::InMemoryBusinessLayer>(0.08);
        registerQuoteTools(registry_, business_);
    }

    std::shared_ptr<business::InMemoryBusinessLayer> business_;
    ToolRegistry registry_;
};

TEST_F(QuoteToolsTest, RegistersAllThreeTools) {
    EXPECT_EQ(registry_.getToolNames(),
              (std::vector<std::string>{"create_quote", "get_customer_history", "search_products"}));
}

TEST_F(QuoteToolsTest, CreateQuoteWithCatalogPrice) {
    json result = registry_.execute("create_quote", json::parse(R"({
        "customer_name": "ABC Company",
        "line_items": [{"product_name": "G5000", "quantity": 50, "decoration": "screen print"}]
    })"));

    ASSERT_EQ(result["success"], true) << result.dump();
    EXPECT_EQ(result["quote_number"], "Q-00001");
    EXPECT_EQ(result["customer"], "ABC Company");
    EXPECT_DOUBLE_EQ(result["subtotal"].get<double>(), 225.0);
    EXPECT_DOUBLE_EQ(result["tax"].get<double>(), 18.0);
    EXPECT_DOUBLE_EQ(result["total"].get<double>(), 243.0);
    EXPECT_EQ(result["message"], "Quote created successfully for ABC Company with 1 items. Total: $243.00");

    auto quote = business_->getQuote(result["quote_id"].get<std::string>());
    ASSERT_TRUE(quote.has_value());
    ASSERT_EQ(quote->groups.size(), 1u);
    EXPECT_EQ(quote->groups[0].name, "Main Items");
    EXPECT_EQ(quote->groups[0].items[0].decoration, "screen print");
}

TEST_F(QuoteToolsTest, CreateQuoteAcceptsNumericStringsAndImprints) {
    json result = registry_.execute("create_quote", json::parse(R"({
        "customer_name": "Jane Smith",
        "line_items": [{"product_name": "Custom Mug", "quantity": "12", "unit_price": "8.50"}],
        "imprints": [{"location": "wrap", "decoration_method": "sublimation", "setup_fee": 20, "per_item_price": 1}]
    })"));

    ASSERT_EQ(result["success"], true) << result.dump();
    // 12*8.50 + 20 + 12*1
    EXPECT_DOUBLE_EQ(result["subtotal"].get<double>(), 134.0);
    EXPECT_EQ(business_->findCustomer("jane smith")->email, "jane.smith@example.com");
}

TEST_F(QuoteToolsTest, CreateQuoteReusesExistingCustomer) {
    json params = json::parse(R"({
        "customer_name": "ABC Company",
        "line_items": [{"product_name": "G5000", "quantity": 1}]
    })");
    registry_.execute("create_quote", params);
    registry_.execute("create_quote", params);

    EXPECT_EQ(business_->customerCount(), 1u);
    EXPECT_EQ(business_->quoteCount(), 2u);
}

TEST_F(QuoteToolsTest, CreateQuoteMissingFields) {
    json noItems = registry_.execute("create_quote", json{{"customer_name", "ABC Company"}});
    EXPECT_EQ(noItems["success"], false);

    json noCustomer = registry_.execute("create_quote",
        json::parse(R"({"line_items": [{"product_name": "G5000", "quantity": 1}]})"));
    EXPECT_EQ(noCustomer["success"], false);

    json emptyParams = registry_.execute("create_quote", json::object());
    EXPECT_EQ(emptyParams["success"], false);

    EXPECT_EQ(business_->quoteCount(), 0u);
}

TEST_F(QuoteToolsTest, CreateQuoteValidationFailures) {
    json fractional = registry_.execute("create_quote", json::parse(R"({
        "customer_name": "ABC Company",
        "line_items": [{"product_name": "G5000", "quantity": 2.5}]
    })"));
    EXPECT_EQ(fractional["success"], false);

    json unknownProduct = registry_.execute("create_quote", json::parse(R"({
        "customer_name": "ABC Company",
        "line_items": [{"product_name": "Mystery Widget", "quantity": 5}]
    })"));
    EXPECT_EQ(unknownProduct["success"], false);
    EXPECT_NE(unknownProduct["error"].get<std::string>().find("Mystery Widget"), std::string::npos);

    json badPrice = registry_.execute("create_quote", json::parse(R"({
        "customer_name": "ABC Company",
        "line_items": [{"product_name": "G5000", "quantity": 5, "unit_price": "cheap"}]
    })"));
    EXPECT_EQ(badPrice["success"], false);

    EXPECT_EQ(business_->quoteCount(), 0u);
}

TEST_F(QuoteToolsTest, CreateQuoteRejectsOutOfRangeCounts) {
    json huge = registry_.execute("create_quote", json::parse(R"({
        "customer_name": "ABC Company",
        "line_items": [{"product_name": "G5000", "quantity": 1e10}]
    })"));
    EXPECT_EQ(huge["success"], false);
    EXPECT_NE(huge["error"].get<std::string>().find("quantity"), std::string::npos);

    json hugeString = registry_.execute("create_quote", json::parse(R"({
        "customer_name": "ABC Company",
        "line_items": [{"product_name": "G5000", "quantity": "2147483648"}]
    })"));
    EXPECT_EQ(hugeString["success"], false);

    json negative = registry_.execute("create_quote", json::parse(R"({
        "customer_name": "ABC Company",
        "line_items": [{"product_name": "G5000", "quantity": -3}]
    })"));
    EXPECT_EQ(negative["success"], false);

    json colors = registry_.execute("create_quote", json::parse(R"({
        "customer_name": "ABC Company",
        "line_items": [{"product_name": "G5000", "quantity": 5}],
        "imprints": [{"location": "front", "colors": 1e12}]
    })"));
    EXPECT_EQ(colors["success"], false);

    EXPECT_EQ(business_->quoteCount(), 0u);
}

TEST(CreateQuoteToolTest, UsesAllocatedQuoteNumber) {
    auto business = std::make_shared<MockBusinessLayer>();
    CreateQuoteTool tool(business);

    business::Customer customer;
    customer.id = "cust_1";
    customer.name = "ABC Company";

    business::Quote stored;
    stored.id = "quote_9";
    stored.quoteNumber = 42;

    InSequence sequence;
    EXPECT_CALL(*business, findOrCreateCustomer("ABC Company")).WillOnce(Return(customer));
    EXPECT_CALL(*business, allocateQuoteNumber()).WillOnce(Return(42));
    EXPECT_CALL(*business, createQuote(Field(&business::QuoteDraft::quoteNumber, 42)))
        .WillOnce(Return(stored));
    EXPECT_CALL(*business, recalculateQuoteTotal("quote_9")).WillOnce(Return(10.0));

    json result = tool.execute(json::parse(R"({
        "customer_name": "ABC Company",
        "line_items": [{"product_name": "G5000", "quantity": 2}]
    })"));

    ASSERT_EQ(result["success"], true) << result.dump();
    EXPECT_EQ(result["quote_number"], "Q-00042");
}

TEST_F(QuoteToolsTest, SearchProducts) {
    json result = registry_.execute("search_products", json{{"query", "cap"}});

    ASSERT_EQ(result["success"], true);
    EXPECT_EQ(result["count"], 2);
    ASSERT_EQ(result["products"].size(), 2u);
    const json& first = result["products"][0];
    EXPECT_TRUE(first.contains("id"));
    EXPECT_TRUE(first.contains("sku"));
    EXPECT_TRUE(first.contains("price"));
    EXPECT_TRUE(first.contains("category"));
    EXPECT_EQ(first["category"], "Headwear");
}

TEST_F(QuoteToolsTest, SearchProductsLimitsResults) {
    // Matches every product in the seeded catalog
    json result = registry_.execute("search_products", json{{"query", "t"}});

    ASSERT_EQ(result["success"], true);
    EXPECT_EQ(result["products"].size(), SearchProductsTool::kMaxResults);
}

TEST_F(QuoteToolsTest, SearchProductsRequiresQuery) {
    EXPECT_EQ(registry_.execute("search_products", json::object())["success"], false);
    EXPECT_EQ(registry_.execute("search_products", json{{"query", 5}})["success"], false);
}

TEST_F(QuoteToolsTest, CustomerHistoryForUnknownCustomer) {
    json result = registry_.execute("get_customer_history", json{{"customer_name", "Nobody"}});

    EXPECT_EQ(result["success"], true);
    EXPECT_EQ(result["found"], false);
    EXPECT_FALSE(result["message"].get<std::string>().empty());
    EXPECT_EQ(business_->customerCount(), 0u);
}

TEST_F(QuoteToolsTest, CustomerHistoryListsRecentQuotes) {
    for (int i = 0; i < 6; ++i) {
        registry_.execute("create_quote", json::parse(R"({
            "customer_name": "ABC Company",
            "line_items": [{"product_name": "G5000", "quantity": 10}]
        })"));
    }

    json result = registry_.execute("get_customer_history", json{{"customer_name", "abc company"}});

    ASSERT_EQ(result["success"], true);
    EXPECT_EQ(result["found"], true);
    EXPECT_EQ(result["customer"]["name"], "ABC Company");
    EXPECT_EQ(result["customer"]["email"], "abc.company@example.com");
    EXPECT_EQ(result["quote_count"], 5);
    ASSERT_EQ(result["recent_quotes"].size(), 5u);
    EXPECT_EQ(result["recent_quotes"][0]["number"], "Q-00006");
    EXPECT_EQ(result["recent_quotes"][0]["status"], "draft");
    EXPECT_FALSE(result["recent_quotes"][0]["created"].get<std::string>().empty());
}

TEST_F(QuoteToolsTest, SchemasNameRequiredFields) {
    json catalog = registry_.catalog();
    for (const auto& tool : catalog) {
        EXPECT_EQ(tool["input_schema"]["type"], "object");
        EXPECT_TRUE(tool["input_schema"].contains("required"));
    }
}
