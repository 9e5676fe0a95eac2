#pragma once

#include "business/business_layer.hpp"

#include <cstdint>
#include <map>
#include <mutex>

namespace printvoice {
namespace business {

/**
 * Thread-safe in-process BusinessLayer with a seeded product catalog.
 */
class InMemoryBusinessLayer : public BusinessLayer {
public:
    explicit InMemoryBusinessLayer(double taxRate = 0.08,
                                   std::vector<Product> catalog = defaultCatalog());

    static std::vector<Product> defaultCatalog();

    Customer findOrCreateCustomer(const std::string& name) override;
    std::optional<Customer> findCustomer(const std::string& name) const override;
    int allocateQuoteNumber() override;
    Quote createQuote(const QuoteDraft& draft) override;
    double recalculateQuoteTotal(const std::string& quoteId) override;
    std::optional<Quote> getQuote(const std::string& quoteId) const override;
    std::vector<Product> searchProducts(const std::string& query, size_t limit) const override;
    std::vector<Quote> recentQuotes(const std::string& customerId, size_t limit) const override;

    size_t customerCount() const;
    size_t quoteCount() const;
    double getTaxRate() const { return taxRate_; }

private:
    LineItem resolveLineItem(const LineItemDraft& draft) const;
    Imprint resolveImprint(const ImprintDraft& draft) const;
    const Product* findProduct(const std::string& nameOrSku) const;
    void computeTotals(Quote& quote) const;
    std::string nextId(const std::string& prefix);

    const double taxRate_;
    const std::vector<Product> catalog_;

    mutable std::mutex mutex_;
    std::map<std::string, Customer> customers_;
    std::map<std::string, Quote> quotes_;
    std::vector<std::string> quoteOrder_;
    int lastQuoteNumber_ = 0;
    uint64_t idCounter_ = 0;
};

} // namespace business
} // namespace printvoice
