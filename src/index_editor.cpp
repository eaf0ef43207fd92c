#include "index_editor.h"
#include "batch.h"
#include "codex_document.h"
#include <algorithm>
#include <cstdio>

namespace Codexforge {

namespace fs = std::filesystem;

namespace {

std::string field(const json& node, const char* key) {
    auto it = node.find(key);
    if (it == node.end() || !it->is_string()) return "";
    return it->get<std::string>();
}

bool matches(const json& node, const std::string& key) {
    if (!node.is_object() || key.empty()) return false;
    return field(node, "_filename") == key || field(node, "_computed_path") == key || field(node, "id") == key;
}

struct Location {
    json* list = nullptr;
    size_t index = 0;

    json& node() const { return (*list)[index]; }
};

bool findEntry(json& list, const std::string& key, Location* out) {
    if (!list.is_array()) return false;
    for (size_t i = 0; i < list.size(); ++i) {
        if (matches(list[i], key)) {
            *out = {&list, i};
            return true;
        }
        if (list[i].is_object() && list[i].contains("children") && findEntry(list[i]["children"], key, out)) {
            return true;
        }
    }
    return false;
}

constexpr const char* kAnchorMarker = "_drop_anchor";

bool findMarked(json& list, Location* out) {
    if (!list.is_array()) return false;
    for (size_t i = 0; i < list.size(); ++i) {
        if (!list[i].is_object()) continue;
        if (list[i].contains(kAnchorMarker)) {
            *out = {&list, i};
            return true;
        }
        if (list[i].contains("children") && findMarked(list[i]["children"], out)) return true;
    }
    return false;
}

json* findFolder(json& list, const std::string& folderName) {
    if (!list.is_array()) return nullptr;
    for (auto& node : list) {
        if (!node.is_object()) continue;
        if ((field(node, "name") == folderName || field(node, "_computed_path") == folderName) &&
            node.contains("children") && node["children"].is_array()) {
            return &node;
        }
        if (node.contains("children")) {
            if (json* found = findFolder(node["children"], folderName)) return found;
        }
    }
    return nullptr;
}

// Sibling list in display order; keys are array positions
std::vector<OrderedItem> displayOrder(const json& list) {
    std::vector<OrderedItem> items;
    for (size_t i = 0; i < list.size(); ++i) {
        const json& node = list[i];
        if (!node.is_object()) continue;
        OrderedItem item;
        item.key = std::to_string(i);
        item.name = field(node, "name");
        if (node.contains("order") && node["order"].is_number()) item.order = node["order"].get<double>();
        if (node.contains("children") && node["children"].is_array()) {
            item.children = displayOrder(node["children"]);
        }
        items.push_back(std::move(item));
    }
    std::stable_sort(items.begin(), items.end(), [](const OrderedItem& a, const OrderedItem& b) {
        return a.order.value_or(0.0) < b.order.value_or(0.0);
    });
    return items;
}

void renumber(json& list) {
    std::vector<OrderedItem> items = displayOrder(list);
    OrderCalculator::renormalize(items);
    for (const auto& item : items) {
        list[std::stoul(item.key)]["order"] = *item.order;
    }
}

bool loadIndex(const fs::path& indexPath, CodexDocument* doc, IndexEditResult* result) {
    try {
        *doc = loadDocument(indexPath);
    } catch (const CodexError& e) {
        result->errors.push_back({e.kind(), e.what()});
        fprintf(stderr, "[index] %s\n", e.what());
        return false;
    }
    if (!doc->root.contains("children") || !doc->root["children"].is_array()) {
        doc->root["children"] = json::array();
    }
    return true;
}

bool storeIndex(const CodexDocument& doc, IndexEditResult* result) {
    try {
        saveDocument(doc);
    } catch (const CodexError& e) {
        result->errors.insert(result->errors.begin(), Issue{e.kind(), e.what()});
        fprintf(stderr, "[index] %s\n", e.what());
        return false;
    }
    return true;
}

} // namespace

IndexEditor::IndexEditor(Settings settings) : m_settings(std::move(settings)) {}

IndexEditResult IndexEditor::reorderFileInIndex(const fs::path& indexPath, const std::string& fileName,
                                                double newOrder) const {
    IndexEditResult result;
    CodexDocument doc;
    if (!loadIndex(indexPath, &doc, &result)) return result;

    json& children = doc.root["children"];
    auto it = std::find_if(children.begin(), children.end(), [&](const json& node) {
        return node.is_object() && (field(node, "_filename") == fileName || field(node, "id") == fileName);
    });
    if (it == children.end()) {
        result.errors.push_back({ErrorKind::StructureError, "File not found in index: " + fileName});
        fprintf(stderr, "[index] File not found in index: %s\n", fileName.c_str());
        return result;
    }
    (*it)["order"] = newOrder;
    result.updated.push_back(fileName);

    if (!storeIndex(doc, &result)) return result;
    if (m_settings.verbose) {
        fprintf(stderr, "[index] %s -> order %g\n", fileName.c_str(), newOrder);
    }
    result.success = true;
    return result;
}

IndexEditResult IndexEditor::moveRelative(const fs::path& indexPath, const std::vector<std::string>& draggedFiles,
                                          const std::string& targetFile, DropPosition position,
                                          const ProgressCallback& progress) const {
    IndexEditResult result;
    CodexDocument doc;
    if (!loadIndex(indexPath, &doc, &result)) return result;

    json& top = doc.root["children"];
    Location located;
    if (!findEntry(top, targetFile, &located)) {
        result.errors.push_back({ErrorKind::StructureError, "Drop target not found in index: " + targetFile});
        return result;
    }

    bool anchored = false;
    auto labelOf = [](const std::string& key) { return key; };
    auto moveOne = [&](size_t, const std::string& key) -> ItemResult<std::string> {
        if (key == targetFile) {
            return ItemResult<std::string>::fail(ErrorKind::StructureError, "Cannot drop '" + key + "' onto itself");
        }
        Location from;
        if (!findEntry(top, key, &from)) {
            return ItemResult<std::string>::fail(ErrorKind::StructureError, "Entry not found in index: " + key);
        }
        Location nested;
        if (from.node().contains("children") && findEntry(from.node()["children"], targetFile, &nested)) {
            return ItemResult<std::string>::fail(ErrorKind::StructureError,
                "Cannot move '" + key + "' into its own subtree");
        }

        json moved = from.node();
        json* sourceList = from.list;
        sourceList->erase(sourceList->begin() + static_cast<long>(from.index));

        // Looked up after the erase: positions in the source list have shifted.
        // Once one entry is placed, the next goes right after it so the
        // dragged entries keep their relative order.
        const bool chained = anchored && position != DropPosition::Before;
        const DropPosition place = chained ? DropPosition::After : position;
        Location target;
        bool found = chained ? findMarked(top, &target) : findEntry(top, targetFile, &target);
        if (!found) {
            sourceList->insert(sourceList->begin() + static_cast<long>(from.index), moved);
            return ItemResult<std::string>::fail(ErrorKind::StructureError, "Drop target not found in index: " + targetFile);
        }
        json* destination = target.list;
        if (place == DropPosition::Inside) {
            json& targetNode = target.node();
            if (!targetNode.contains("children") || !targetNode["children"].is_array()) {
                targetNode["children"] = json::array();
            }
            destination = &targetNode["children"];
        }

        OrderedItem targetItem;
        std::vector<OrderedItem> siblings = displayOrder(*target.list);
        for (const auto& item : siblings) {
            if (item.key == std::to_string(target.index)) targetItem = item;
        }
        OrderResult order = OrderCalculator::calculateNewOrder(targetItem, place, siblings);
        if (order.needsRenormalize) {
            renumber(*destination);
            result.renormalized = true;
            siblings = displayOrder(*target.list);
            for (const auto& item : siblings) {
                if (item.key == std::to_string(target.index)) targetItem = item;
            }
            order = OrderCalculator::calculateNewOrder(targetItem, place, siblings);
        }

        moved["order"] = order.order;
        if (destination != sourceList) {
            // Recomputed on the next resolve
            moved.erase("_computed_path");
        }
        size_t insertAt = destination->size();
        if (place == DropPosition::Before) insertAt = target.index;
        else if (place == DropPosition::After) insertAt = target.index + 1;
        else insertAt = 0;

        if (position != DropPosition::Before) {
            if (chained) target.node().erase(kAnchorMarker);
            moved[kAnchorMarker] = true;
            anchored = true;
        }
        destination->insert(destination->begin() + static_cast<long>(insertAt), moved);

        if (m_settings.verbose) {
            fprintf(stderr, "[index] moved %s -> order %g\n", key.c_str(), order.order);
        }
        return ItemResult<std::string>::ok(key);
    };

    BatchOutcome<std::string> outcome = foldBatch<std::string>(draggedFiles, labelOf, moveOne, progress);
    Location anchor;
    if (findMarked(top, &anchor)) anchor.node().erase(kAnchorMarker);
    for (const auto& success : outcome.successes) {
        result.updated.push_back(success.second);
    }
    appendBatchIssues(outcome, draggedFiles.size(), "entries", &result.errors);
    result.summary = batchSummary(outcome, "entries");
    for (const auto& failure : outcome.failures) {
        fprintf(stderr, "[index] %s\n", failure.issue.message.c_str());
    }

    if (outcome.successes.empty()) {
        // Nothing moved; a batch that failed as a whole is not a success
        result.success = draggedFiles.empty() || outcome.cancelled;
        return result;
    }
    if (!storeIndex(doc, &result)) return result;
    result.success = true;
    return result;
}

IndexEditResult IndexEditor::renormalizeFolderOrder(const fs::path& indexPath, const std::string& folderName) const {
    IndexEditResult result;
    CodexDocument doc;
    if (!loadIndex(indexPath, &doc, &result)) return result;

    json* list = &doc.root["children"];
    if (!folderName.empty()) {
        json* folder = findFolder(doc.root["children"], folderName);
        if (!folder) {
            result.errors.push_back({ErrorKind::StructureError, "Folder not found in index: " + folderName});
            fprintf(stderr, "[index] Folder not found in index: %s\n", folderName.c_str());
            return result;
        }
        list = &(*folder)["children"];
    }

    renumber(*list);
    result.renormalized = true;
    for (const auto& node : *list) {
        if (!node.is_object()) continue;
        std::string key = field(node, "_filename");
        result.updated.push_back(key.empty() ? field(node, "id") : key);
    }

    if (!storeIndex(doc, &result)) return result;
    result.success = true;
    return result;
}

} // namespace Codexforge
