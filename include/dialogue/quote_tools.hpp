#pragma once

#include "business/business_layer.hpp"
#include "dialogue/tool.hpp"
#include "dialogue/tool_registry.hpp"

#include <memory>

namespace printvoice {
namespace dialogue {

/**
 * create_quote: find-or-create the customer, validate the line items and
 * imprints against the catalog and persist a quote with one "Main Items"
 * group.
 */
class CreateQuoteTool : public Tool {
public:
    explicit CreateQuoteTool(std::shared_ptr<business::BusinessLayer> business);

    std::string name() const override { return "create_quote"; }
    std::string description() const override;
    nlohmann::json parameterSchema() const override;
    nlohmann::json execute(const nlohmann::json& params) override;

private:
    std::shared_ptr<business::BusinessLayer> business_;
};

class SearchProductsTool : public Tool {
public:
    static constexpr size_t kMaxResults = 10;

    explicit SearchProductsTool(std::shared_ptr<business::BusinessLayer> business);

    std::string name() const override { return "search_products"; }
    std::string description() const override;
    nlohmann::json parameterSchema() const override;
    nlohmann::json execute(const nlohmann::json& params) override;

private:
    std::shared_ptr<business::BusinessLayer> business_;
};

class CustomerHistoryTool : public Tool {
public:
    static constexpr size_t kMaxQuotes = 5;

    explicit CustomerHistoryTool(std::shared_ptr<business::BusinessLayer> business);

    std::string name() const override { return "get_customer_history"; }
    std::string description() const override;
    nlohmann::json parameterSchema() const override;
    nlohmann::json execute(const nlohmann::json& params) override;

private:
    std::shared_ptr<business::BusinessLayer> business_;
};

// Registers create_quote, search_products and get_customer_history
void registerQuoteTools(ToolRegistry& registry, std::shared_ptr<business::BusinessLayer> business);

} // namespace dialogue
} // namespace printvoice
