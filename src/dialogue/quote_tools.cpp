#include "dialogue/quote_tools.hpp"
#include "utils/logging.hpp"

#include <cmath>
#include <ctime>
#include <iomanip>
#include <sstream>

using json = nlohmann::json;

namespace printvoice {
namespace dialogue {

namespace {

std::string requireString(const json& params, const char* key) {
    auto it = params.find(key);
    if (it == params.end() || !it->is_string() || it->get<std::string>().empty()) {
        throw business::QuoteValidationError(std::string("Missing required field: ") + key);
    }
    return it->get<std::string>();
}

std::string optionalString(const json& params, const char* key) {
    auto it = params.find(key);
    return (it != params.end() && it->is_string()) ? it->get<std::string>() : std::string();
}

// Accepts JSON numbers and numeric strings ("12.50"), as models emit both
std::optional<double> optionalNumber(const json& params, const char* key) {
    auto it = params.find(key);
    if (it == params.end() || it->is_null()) {
        return std::nullopt;
    }
    if (it->is_number()) {
        return it->get<double>();
    }
    if (it->is_string()) {
        const std::string& text = it->get_ref<const std::string&>();
        try {
            size_t consumed = 0;
            double value = std::stod(text, &consumed);
            if (consumed == text.size()) {
                return value;
            }
        } catch (const std::exception&) {
            // handled below
        }
    }
    throw business::QuoteValidationError(std::string("Field '") + key + "' must be a number");
}

// Range is checked on the double so the narrowing cast is always defined
int boundedWholeNumber(double value, const char* key, int minimum, int maximum) {
    if (!std::isfinite(value) || std::floor(value) != value) {
        throw business::QuoteValidationError(std::string("Field '") + key + "' must be a whole number");
    }
    if (value < minimum || value > maximum) {
        throw business::QuoteValidationError(std::string("Field '") + key + "' must be between " +
                                             std::to_string(minimum) + " and " + std::to_string(maximum));
    }
    return static_cast<int>(value);
}

int requireQuantity(const json& item) {
    auto value = optionalNumber(item, "quantity");
    if (!value) {
        throw business::QuoteValidationError("Missing required field: quantity");
    }
    return boundedWholeNumber(*value, "quantity", 1, business::kMaxLineItemQuantity);
}

business::LineItemDraft parseLineItem(const json& item) {
    if (!item.is_object()) {
        throw business::QuoteValidationError("Each line item must be an object");
    }
    business::LineItemDraft draft;
    draft.productName = requireString(item, "product_name");
    draft.quantity = requireQuantity(item);
    draft.unitPrice = optionalNumber(item, "unit_price");
    draft.decoration = optionalString(item, "decoration");
    draft.size = optionalString(item, "size");
    return draft;
}

business::ImprintDraft parseImprint(const json& imprint) {
    if (!imprint.is_object()) {
        throw business::QuoteValidationError("Each imprint must be an object");
    }
    business::ImprintDraft draft;
    draft.location = optionalString(imprint, "location");
    draft.method = optionalString(imprint, "method");
    if (draft.method.empty()) {
        draft.method = optionalString(imprint, "decoration_method");
    }
    draft.colors = boundedWholeNumber(optionalNumber(imprint, "colors").value_or(1.0), "colors",
                                      0, business::kMaxImprintColors);
    draft.setupFee = optionalNumber(imprint, "setup_fee").value_or(0.0);
    draft.perItemPrice = optionalNumber(imprint, "per_item_price").value_or(0.0);
    return draft;
}

std::string formatMoney(double amount) {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(2) << amount;
    return oss.str();
}

std::string formatTimestamp(std::chrono::system_clock::time_point timePoint) {
    std::time_t time = std::chrono::system_clock::to_time_t(timePoint);
    std::tm utc{};
    gmtime_r(&time, &utc);
    std::ostringstream oss;
    oss << std::put_time(&utc, "%Y-%m-%dT%H:%M:%SZ");
    return oss.str();
}

} // namespace

CreateQuoteTool::CreateQuoteTool(std::shared_ptr<business::BusinessLayer> business)
    : business_(std::move(business)) {
}

std::string CreateQuoteTool::description() const {
    return "Create a new quote for a customer. Unit prices may be omitted to use catalog prices.";
}

json CreateQuoteTool::parameterSchema() const {
    json item = {
        {"type", "object"},
        {"properties", {
            {"product_name", {{"type", "string"}}},
            {"quantity", {{"type", "integer"}, {"minimum", 1}, {"maximum", business::kMaxLineItemQuantity}}},
            {"unit_price", {{"type", "number"}}},
            {"decoration", {{"type", "string"}}},
            {"size", {{"type", "string"}}}
        }},
        {"required", json::array({"product_name", "quantity"})}
    };
    json imprint = {
        {"type", "object"},
        {"properties", {
            {"location", {{"type", "string"}}},
            {"method", {{"type", "string"}}},
            {"colors", {{"type", "integer"}, {"minimum", 0}, {"maximum", business::kMaxImprintColors}}},
            {"setup_fee", {{"type", "number"}}},
            {"per_item_price", {{"type", "number"}}}
        }}
    };

    json schema;
    schema["type"] = "object";
    schema["properties"]["customer_name"] = {{"type", "string"}};
    schema["properties"]["line_items"] = {{"type", "array"}, {"items", item}};
    schema["properties"]["imprints"] = {{"type", "array"}, {"items", imprint}};
    schema["required"] = json::array({"customer_name", "line_items"});
    return schema;
}

json CreateQuoteTool::execute(const json& params) {
    try {
        std::string customerName = requireString(params, "customer_name");

        auto itemsIt = params.find("line_items");
        if (itemsIt == params.end() || !itemsIt->is_array() || itemsIt->empty()) {
            return toolFailure("Missing required fields: customer_name, line_items");
        }

        business::LineItemGroupDraft group;
        group.name = "Main Items";
        for (const auto& item : *itemsIt) {
            group.items.push_back(parseLineItem(item));
        }

        auto imprintsIt = params.find("imprints");
        if (imprintsIt != params.end() && imprintsIt->is_array()) {
            for (const auto& imprint : *imprintsIt) {
                group.imprints.push_back(parseImprint(imprint));
            }
        }

        business::Customer customer = business_->findOrCreateCustomer(customerName);

        business::QuoteDraft draft;
        draft.customerId = customer.id;
        draft.quoteNumber = business_->allocateQuoteNumber();
        draft.notes = "Created via voice assistant for " + customerName;
        draft.groups.push_back(std::move(group));

        business::Quote quote = business_->createQuote(draft);
        double total = business_->recalculateQuoteTotal(quote.id);

        return json{
            {"success", true},
            {"quote_id", quote.id},
            {"quote_number", business::formatQuoteNumber(quote.quoteNumber)},
            {"customer", customerName},
            {"subtotal", quote.subtotal},
            {"tax", quote.tax},
            {"total", total},
            {"message", "Quote created successfully for " + customerName + " with " +
                        std::to_string(itemsIt->size()) + " items. Total: $" + formatMoney(total)}
        };
    } catch (const business::QuoteValidationError& e) {
        utils::Logger::warn(std::string("create_quote rejected: ") + e.what());
        return toolFailure(e.what());
    }
}

SearchProductsTool::SearchProductsTool(std::shared_ptr<business::BusinessLayer> business)
    : business_(std::move(business)) {
}

std::string SearchProductsTool::description() const {
    return "Search the product catalog by name or SKU.";
}

json SearchProductsTool::parameterSchema() const {
    json schema;
    schema["type"] = "object";
    schema["properties"]["query"] = {{"type", "string"}, {"description", "Product name or SKU fragment"}};
    schema["required"] = json::array({"query"});
    return schema;
}

json SearchProductsTool::execute(const json& params) {
    auto it = params.find("query");
    if (it == params.end() || !it->is_string() || it->get<std::string>().empty()) {
        return toolFailure("Missing required field: query");
    }
    std::string query = it->get<std::string>();

    json products = json::array();
    for (const auto& product : business_->searchProducts(query, kMaxResults)) {
        products.push_back({
            {"id", product.id},
            {"name", product.name},
            {"sku", product.sku},
            {"price", product.basePrice},
            {"category", product.category}
        });
    }

    return json{
        {"success", true},
        {"count", products.size()},
        {"products", products},
        {"message", "Found " + std::to_string(products.size()) + " products matching \"" + query + "\""}
    };
}

CustomerHistoryTool::CustomerHistoryTool(std::shared_ptr<business::BusinessLayer> business)
    : business_(std::move(business)) {
}

std::string CustomerHistoryTool::description() const {
    return "Get the most recent quotes for a customer.";
}

json CustomerHistoryTool::parameterSchema() const {
    json schema;
    schema["type"] = "object";
    schema["properties"]["customer_name"] = {{"type", "string"}};
    schema["required"] = json::array({"customer_name"});
    return schema;
}

json CustomerHistoryTool::execute(const json& params) {
    auto it = params.find("customer_name");
    if (it == params.end() || !it->is_string() || it->get<std::string>().empty()) {
        return toolFailure("Missing required field: customer_name");
    }
    std::string customerName = it->get<std::string>();

    auto customer = business_->findCustomer(customerName);
    if (!customer) {
        return json{
            {"success", true},
            {"found", false},
            {"message", "No customer found with name \"" + customerName + "\""}
        };
    }

    json quotes = json::array();
    for (const auto& quote : business_->recentQuotes(customer->id, kMaxQuotes)) {
        quotes.push_back({
            {"id", quote.id},
            {"number", business::formatQuoteNumber(quote.quoteNumber)},
            {"status", quote.status},
            {"total", quote.total},
            {"created", formatTimestamp(quote.createdAt)}
        });
    }

    return json{
        {"success", true},
        {"found", true},
        {"customer", {
            {"name", customer->name},
            {"email", customer->email},
            {"phone", customer->phone}
        }},
        {"quote_count", quotes.size()},
        {"recent_quotes", quotes},
        {"message", "Found " + std::to_string(quotes.size()) + " recent quotes for " + customerName}
    };
}

void registerQuoteTools(ToolRegistry& registry, std::shared_ptr<business::BusinessLayer> business) {
    registry.registerTool(std::make_shared<CreateQuoteTool>(business));
    registry.registerTool(std::make_shared<SearchProductsTool>(business));
    registry.registerTool(std::make_shared<CustomerHistoryTool>(business));
}

} // namespace dialogue
} // namespace printvoice
