#include "business/business_layer.hpp"

#include <cstdio>

namespace printvoice {
namespace business {

long long LineItemGroup::totalQuantity() const {
    long long quantity = 0;
    for (const auto& item : items) {
        quantity += item.quantity;
    }
    return quantity;
}

double LineItemGroup::itemsTotal() const {
    double total = 0.0;
    for (const auto& item : items) {
        total += item.total();
    }
    return total;
}

double LineItemGroup::imprintsTotal() const {
    double quantity = static_cast<double>(totalQuantity());
    double total = 0.0;
    for (const auto& imprint : imprints) {
        total += imprint.setupFee + imprint.perItemPrice * quantity;
    }
    return total;
}

std::string formatQuoteNumber(int quoteNumber) {
    char buffer[32];
    std::snprintf(buffer, sizeof(buffer), "Q-%05d", quoteNumber);
    return buffer;
}

} // namespace business
} // namespace printvoice
