#include "order_calculator.h"
#include <algorithm>
#include <limits>

namespace Codexforge {

bool parseDropPosition(const std::string& text, DropPosition* out) {
    if (text == "before") *out = DropPosition::Before;
    else if (text == "after") *out = DropPosition::After;
    else if (text == "inside") *out = DropPosition::Inside;
    else return false;
    return true;
}

namespace OrderCalculator {

namespace {

// Midpoint of (lo, hi), flagged when it is not safely inside the interval
OrderResult between(double lo, double hi) {
    OrderResult result;
    result.order = lo + (hi - lo) / 2.0;
    result.needsRenormalize = !(lo < hi) ||
                              result.order - lo < kMinOrderGap ||
                              hi - result.order < kMinOrderGap;
    return result;
}

long indexOf(const OrderedItem& target, const std::vector<OrderedItem>& siblings) {
    for (size_t i = 0; i < siblings.size(); ++i) {
        if (siblings[i].key == target.key) return static_cast<long>(i);
    }
    return -1;
}

} // namespace

OrderResult calculateNewOrder(const OrderedItem& target, DropPosition position,
                              const std::vector<OrderedItem>& siblings) {
    const double targetOrder = target.order.value_or(0.0);
    const long index = indexOf(target, siblings);

    switch (position) {
        case DropPosition::Before: {
            if (index > 0) {
                double prev = siblings[index - 1].order.value_or(0.0);
                return between(prev, targetOrder);
            }
            return {targetOrder - 1.0, false};
        }
        case DropPosition::After: {
            if (index >= 0 && index + 1 < static_cast<long>(siblings.size())) {
                double next = siblings[index + 1].order.value_or(targetOrder + 2.0);
                return between(targetOrder, next);
            }
            return {targetOrder + 1.0, false};
        }
        case DropPosition::Inside: {
            if (!target.children.empty()) {
                return {target.children.front().order.value_or(0.0) - 1.0, false};
            }
            return {0.0, false};
        }
    }
    return {0.0, false};
}

void renormalize(std::vector<OrderedItem>& siblings) {
    const double missing = std::numeric_limits<double>::infinity();
    std::stable_sort(siblings.begin(), siblings.end(), [missing](const OrderedItem& a, const OrderedItem& b) {
        double oa = a.order.value_or(missing);
        double ob = b.order.value_or(missing);
        if (oa != ob) return oa < ob;
        return a.name < b.name;
    });
    for (size_t i = 0; i < siblings.size(); ++i) {
        siblings[i].order = static_cast<double>(i);
    }
}

} // namespace OrderCalculator

} // namespace Codexforge
