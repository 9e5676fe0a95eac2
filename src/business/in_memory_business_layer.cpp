#include "business/in_memory_business_layer.hpp"
#include "utils/logging.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>

namespace printvoice {
namespace business {

namespace {

std::string toLower(const std::string& value) {
    std::string result = value;
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return result;
}

std::string emailFor(const std::string& name) {
    std::string local;
    bool pendingDot = false;
    for (unsigned char c : toLower(name)) {
        if (std::isspace(c)) {
            pendingDot = !local.empty();
            continue;
        }
        if (pendingDot) {
            local += '.';
            pendingDot = false;
        }
        local += static_cast<char>(c);
    }
    return local + "@example.com";
}

double roundCents(double amount) {
    return std::round(amount * 100.0) / 100.0;
}

} // namespace

InMemoryBusinessLayer::InMemoryBusinessLayer(double taxRate, std::vector<Product> catalog)
    : taxRate_(taxRate), catalog_(std::move(catalog)) {
    utils::Logger::info("Business layer ready with " + std::to_string(catalog_.size()) +
                        " catalog products");
}

std::vector<Product> InMemoryBusinessLayer::defaultCatalog() {
    return {
        {"prod_1", "G5000", "Gildan Heavy Cotton T-Shirt", "Gildan", "T-Shirts", 4.50},
        {"prod_2", "G2000", "Gildan Ultra Cotton T-Shirt", "Gildan", "T-Shirts", 5.25},
        {"prod_3", "BC3001", "Bella+Canvas Unisex Jersey Tee", "Bella+Canvas", "T-Shirts", 6.75},
        {"prod_4", "G18500", "Gildan Heavy Blend Hooded Sweatshirt", "Gildan", "Sweatshirts", 14.50},
        {"prod_5", "G18000", "Gildan Heavy Blend Crewneck Sweatshirt", "Gildan", "Sweatshirts", 11.25},
        {"prod_6", "PC54", "Port & Company Core Cotton Tee", "Port & Company", "T-Shirts", 4.25},
        {"prod_7", "K500", "Port Authority Silk Touch Polo", "Port Authority", "Polos", 13.98},
        {"prod_8", "112", "Richardson Trucker Cap", "Richardson", "Headwear", 7.50},
        {"prod_9", "C112", "Port Authority Snapback Trucker Cap", "Port Authority", "Headwear", 6.25},
        {"prod_10", "BG403", "Port Authority Cotton Tote", "Port Authority", "Bags", 3.75},
        {"prod_11", "DT6000", "District Very Important Tee", "District", "T-Shirts", 5.95},
        {"prod_12", "ST350", "Sport-Tek PosiCharge Competitor Tee", "Sport-Tek", "Athletic", 6.40}
    };
}

std::string InMemoryBusinessLayer::nextId(const std::string& prefix) {
    return prefix + "_" + std::to_string(++idCounter_);
}

Customer InMemoryBusinessLayer::findOrCreateCustomer(const std::string& name) {
    std::lock_guard<std::mutex> lock(mutex_);
    std::string key = toLower(name);
    for (const auto& entry : customers_) {
        if (toLower(entry.second.name) == key) {
            return entry.second;
        }
    }

    Customer customer;
    customer.id = nextId("cust");
    customer.name = name;
    customer.email = emailFor(name);
    customers_[customer.id] = customer;
    utils::Logger::info("Created customer '" + name + "' (" + customer.id + ")");
    return customer;
}

std::optional<Customer> InMemoryBusinessLayer::findCustomer(const std::string& name) const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::string key = toLower(name);
    for (const auto& entry : customers_) {
        if (toLower(entry.second.name) == key) {
            return entry.second;
        }
    }
    return std::nullopt;
}

int InMemoryBusinessLayer::allocateQuoteNumber() {
    std::lock_guard<std::mutex> lock(mutex_);
    return ++lastQuoteNumber_;
}

const Product* InMemoryBusinessLayer::findProduct(const std::string& nameOrSku) const {
    std::string key = toLower(nameOrSku);
    for (const auto& product : catalog_) {
        if (toLower(product.name) == key || toLower(product.sku) == key) {
            return &product;
        }
    }
    return nullptr;
}

LineItem InMemoryBusinessLayer::resolveLineItem(const LineItemDraft& draft) const {
    if (draft.productName.empty()) {
        throw QuoteValidationError("Line item is missing a product name");
    }
    if (draft.quantity <= 0) {
        throw QuoteValidationError("Quantity for '" + draft.productName + "' must be positive");
    }
    if (draft.quantity > kMaxLineItemQuantity) {
        throw QuoteValidationError("Quantity for '" + draft.productName + "' exceeds " +
                                   std::to_string(kMaxLineItemQuantity));
    }

    const Product* product = findProduct(draft.productName);

    LineItem item;
    item.productName = draft.productName;
    item.quantity = draft.quantity;
    item.decoration = draft.decoration;
    item.size = draft.size;

    double requested = draft.unitPrice.value_or(0.0);
    if (requested < 0.0) {
        throw QuoteValidationError("Unit price for '" + draft.productName + "' cannot be negative");
    }

    if (requested == 0.0) {
        if (!product) {
            throw QuoteValidationError("Unknown product '" + draft.productName +
                                       "' needs an explicit unit price");
        }
        item.unitPrice = product->basePrice;
    } else {
        item.unitPrice = requested;
        if (product && requested < product->basePrice) {
            utils::Logger::warn("Unit price " + std::to_string(requested) + " for '" +
                                draft.productName + "' is below catalog price " +
                                std::to_string(product->basePrice));
        }
    }

    if (product) {
        item.productName = product->name;
        item.sku = product->sku;
    }
    return item;
}

Imprint InMemoryBusinessLayer::resolveImprint(const ImprintDraft& draft) const {
    if (draft.setupFee < 0.0 || draft.perItemPrice < 0.0) {
        throw QuoteValidationError("Imprint prices cannot be negative");
    }
    if (draft.colors < 0 || draft.colors > kMaxImprintColors) {
        throw QuoteValidationError("Imprint color count must be between 0 and " +
                                   std::to_string(kMaxImprintColors));
    }

    Imprint imprint;
    imprint.location = draft.location;
    imprint.method = draft.method;
    imprint.colors = draft.colors;
    imprint.setupFee = draft.setupFee;
    imprint.perItemPrice = draft.perItemPrice;
    return imprint;
}

void InMemoryBusinessLayer::computeTotals(Quote& quote) const {
    double subtotal = 0.0;
    for (const auto& group : quote.groups) {
        subtotal += group.itemsTotal() + group.imprintsTotal();
    }
    quote.subtotal = roundCents(subtotal);
    quote.tax = roundCents(subtotal * taxRate_);
    quote.total = roundCents(quote.subtotal + quote.tax);
}

Quote InMemoryBusinessLayer::createQuote(const QuoteDraft& draft) {
    if (draft.groups.empty()) {
        throw QuoteValidationError("Quote needs at least one line item group");
    }

    // Validate everything before touching shared state
    Quote quote;
    quote.customerId = draft.customerId;
    quote.notes = draft.notes;
    for (const auto& groupDraft : draft.groups) {
        if (groupDraft.items.empty()) {
            throw QuoteValidationError("Line item group '" + groupDraft.name + "' has no items");
        }
        LineItemGroup group;
        group.name = groupDraft.name;
        for (const auto& itemDraft : groupDraft.items) {
            group.items.push_back(resolveLineItem(itemDraft));
        }
        for (const auto& imprintDraft : groupDraft.imprints) {
            group.imprints.push_back(resolveImprint(imprintDraft));
        }
        quote.groups.push_back(std::move(group));
    }
    computeTotals(quote);

    std::lock_guard<std::mutex> lock(mutex_);
    if (customers_.find(draft.customerId) == customers_.end()) {
        throw QuoteValidationError("Unknown customer '" + draft.customerId + "'");
    }

    if (draft.quoteNumber > 0) {
        if (draft.quoteNumber > lastQuoteNumber_) {
            throw QuoteValidationError("Quote number " + formatQuoteNumber(draft.quoteNumber) +
                                       " was never allocated");
        }
        for (const auto& entry : quotes_) {
            if (entry.second.quoteNumber == draft.quoteNumber) {
                throw QuoteValidationError("Quote number " + formatQuoteNumber(draft.quoteNumber) +
                                           " is already in use");
            }
        }
        quote.quoteNumber = draft.quoteNumber;
    } else {
        quote.quoteNumber = ++lastQuoteNumber_;
    }

    quote.id = nextId("quote");
    quote.createdAt = std::chrono::system_clock::now();
    for (auto& group : quote.groups) {
        group.id = nextId("lig");
    }

    quotes_[quote.id] = quote;
    quoteOrder_.push_back(quote.id);

    utils::Logger::info("Created quote " + formatQuoteNumber(quote.quoteNumber) +
                        " total " + std::to_string(quote.total));
    return quote;
}

double InMemoryBusinessLayer::recalculateQuoteTotal(const std::string& quoteId) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = quotes_.find(quoteId);
    if (it == quotes_.end()) {
        throw QuoteValidationError("Unknown quote '" + quoteId + "'");
    }
    computeTotals(it->second);
    return it->second.total;
}

std::optional<Quote> InMemoryBusinessLayer::getQuote(const std::string& quoteId) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = quotes_.find(quoteId);
    if (it == quotes_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::vector<Product> InMemoryBusinessLayer::searchProducts(const std::string& query, size_t limit) const {
    std::vector<Product> results;
    std::string key = toLower(query);
    for (const auto& product : catalog_) {
        if (results.size() >= limit) {
            break;
        }
        if (toLower(product.name).find(key) != std::string::npos ||
            toLower(product.sku).find(key) != std::string::npos) {
            results.push_back(product);
        }
    }
    return results;
}

std::vector<Quote> InMemoryBusinessLayer::recentQuotes(const std::string& customerId, size_t limit) const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<Quote> results;
    for (auto it = quoteOrder_.rbegin(); it != quoteOrder_.rend() && results.size() < limit; ++it) {
        const Quote& quote = quotes_.at(*it);
        if (quote.customerId == customerId) {
            results.push_back(quote);
        }
    }
    return results;
}

size_t InMemoryBusinessLayer::customerCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return customers_.size();
}

size_t InMemoryBusinessLayer::quoteCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return quotes_.size();
}

} // namespace business
} // namespace printvoice
