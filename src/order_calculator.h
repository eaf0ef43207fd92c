#pragma once

#include <optional>
#include <string>
#include <vector>

namespace Codexforge {

enum class DropPosition {
    Before,
    After,
    Inside
};

bool parseDropPosition(const std::string& text, DropPosition* out);

// One entry of a sibling list as seen by the order calculator
struct OrderedItem {
    std::string key;                // _filename or id, whatever identifies the entry
    std::string name;
    std::optional<double> order;    // missing counts as 0 when computing
    std::vector<OrderedItem> children;
};

struct OrderResult {
    double order = 0.0;
    // The gap to a neighbour is exhausted (or the neighbours were out of
    // order); renumber the siblings and compute again.
    bool needsRenormalize = false;
};

namespace OrderCalculator {

constexpr double kMinOrderGap = 1e-9;

// Order for an item dropped relative to target. siblings is the target's
// sibling list in display order; Inside uses target.children.
OrderResult calculateNewOrder(const OrderedItem& target, DropPosition position,
                              const std::vector<OrderedItem>& siblings);

// Stable sort by order (missing last), then name, and assign 0, 1, 2, ...
void renormalize(std::vector<OrderedItem>& siblings);

} // namespace OrderCalculator

} // namespace Codexforge
