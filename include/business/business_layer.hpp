#pragma once

#include <chrono>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace printvoice {
namespace business {

// Upper bounds on caller-supplied counts; larger values are rejected
constexpr int kMaxLineItemQuantity = 1000000;
constexpr int kMaxImprintColors = 32;

struct Customer {
    std::string id;
    std::string name;
    std::string email;
    std::string phone;
};

struct Product {
    std::string id;
    std::string sku;
    std::string name;
    std::string brand;
    std::string category;
    double basePrice = 0.0;
};

// Line item as requested by a caller; a missing or zero unit price means
// "use the catalog price"
struct LineItemDraft {
    std::string productName;
    int quantity = 0;
    std::optional<double> unitPrice;
    std::string decoration;
    std::string size;
};

struct ImprintDraft {
    std::string location;
    std::string method;
    int colors = 1;
    double setupFee = 0.0;
    double perItemPrice = 0.0;
};

struct LineItemGroupDraft {
    std::string name;
    std::vector<LineItemDraft> items;
    std::vector<ImprintDraft> imprints;
};

struct QuoteDraft {
    std::string customerId;
    // Taken from allocateQuoteNumber(); 0 lets createQuote allocate one
    int quoteNumber = 0;
    std::string notes;
    std::vector<LineItemGroupDraft> groups;
};

struct LineItem {
    std::string productName;
    std::string sku;
    int quantity = 0;
    double unitPrice = 0.0;
    std::string decoration;
    std::string size;

    double total() const { return quantity * unitPrice; }
};

struct Imprint {
    std::string location;
    std::string method;
    int colors = 1;
    double setupFee = 0.0;
    double perItemPrice = 0.0;
};

struct LineItemGroup {
    std::string id;
    std::string name;
    std::vector<LineItem> items;
    std::vector<Imprint> imprints;

    long long totalQuantity() const;
    double itemsTotal() const;
    // Setup fees plus per-item prices over the whole group quantity
    double imprintsTotal() const;
};

struct Quote {
    std::string id;
    int quoteNumber = 0;
    std::string customerId;
    std::string status = "draft";
    std::string notes;
    std::vector<LineItemGroup> groups;
    double subtotal = 0.0;
    double tax = 0.0;
    double total = 0.0;
    std::chrono::system_clock::time_point createdAt;
};

// "Q-00042"
std::string formatQuoteNumber(int quoteNumber);

/**
 * Raised when a quote draft fails catalog or arithmetic validation.
 * Tools turn this into a {success:false} result.
 */
class QuoteValidationError : public std::invalid_argument {
public:
    explicit QuoteValidationError(const std::string& message)
        : std::invalid_argument(message) {}
};

/**
 * Customer, catalog and quote store used by the voice tools.
 */
class BusinessLayer {
public:
    virtual ~BusinessLayer() = default;

    virtual Customer findOrCreateCustomer(const std::string& name) = 0;
    virtual std::optional<Customer> findCustomer(const std::string& name) const = 0;

    // Next sequential quote number, never reused
    virtual int allocateQuoteNumber() = 0;

    /**
     * Validate the draft against the catalog, persist it under the draft's
     * quote number (or a freshly allocated one) and compute its totals.
     * @throws QuoteValidationError if any line item or imprint is invalid,
     *         or the quote number was never allocated or is already used
     */
    virtual Quote createQuote(const QuoteDraft& draft) = 0;

    // Recompute subtotal, tax and total from the stored groups; returns the total
    virtual double recalculateQuoteTotal(const std::string& quoteId) = 0;

    virtual std::optional<Quote> getQuote(const std::string& quoteId) const = 0;

    // Case-insensitive substring match on product name or SKU
    virtual std::vector<Product> searchProducts(const std::string& query, size_t limit) const = 0;

    // Most recent first
    virtual std::vector<Quote> recentQuotes(const std::string& customerId, size_t limit) const = 0;
};

} // namespace business
} // namespace printvoice
