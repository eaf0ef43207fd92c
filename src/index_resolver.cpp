#include "index_resolver.h"
#include "codex_document.h"
#include "path_resolver.h"
#include <cstdio>
#include <map>

namespace Codexforge {

namespace fs = std::filesystem;

namespace {

const char* const kModelledKeys[] = {
    "id", "type", "name", "title", "order", "expanded", "emoji", "color", "status",
    "attributes", "children", "_filename", "_computed_path", "_format", "_type_emoji",
    "_type_color", "_default_status", "_included_from", "_subindex_path"
};

bool isModelledKey(const std::string& key) {
    for (const char* k : kModelledKeys) {
        if (key == k) return true;
    }
    return false;
}

std::string scalarText(const json& value) {
    if (value.is_string()) return value.get<std::string>();
    if (value.is_null()) return "";
    return value.dump();
}

std::string text(const json& obj, const char* key) {
    auto it = obj.find(key);
    if (it == obj.end()) return "";
    return scalarText(*it);
}

std::vector<Attribute> readAttributes(const json& obj) {
    std::vector<Attribute> out;
    auto it = obj.find("attributes");
    if (it == obj.end() || !it->is_array()) return out;
    for (const auto& a : *it) {
        if (!a.is_object() || !a.contains("key")) continue;
        out.push_back({scalarText(a["key"]), a.contains("value") ? scalarText(a["value"]) : ""});
    }
    return out;
}

std::vector<std::string> readStrings(const json& value) {
    std::vector<std::string> out;
    if (!value.is_array()) return out;
    for (const auto& v : value) {
        if (v.is_string()) out.push_back(v.get<std::string>());
    }
    return out;
}

std::vector<TypeStyle> readTypeStyles(const json& obj) {
    std::vector<TypeStyle> styles;
    auto it = obj.find("typeStyles");
    if (it == obj.end() || !it->is_array()) return styles;
    for (const auto& s : *it) {
        if (!s.is_object() || !s.contains("type")) continue;
        styles.push_back({text(s, "type"), text(s, "emoji"), text(s, "color")});
    }
    return styles;
}

// Node fields without children; resolution fills those in
IndexNode nodeFromJson(const json& obj) {
    IndexNode node;
    node.id = text(obj, "id");
    node.type = text(obj, "type");
    node.name = text(obj, "name");
    node.title = text(obj, "title");
    if (obj.contains("order") && obj["order"].is_number()) node.order = obj["order"].get<double>();
    if (obj.contains("expanded") && obj["expanded"].is_boolean()) node.expanded = obj["expanded"].get<bool>();
    node.emoji = text(obj, "emoji");
    node.color = text(obj, "color");
    node.status = text(obj, "status");
    node.attributes = readAttributes(obj);
    node.filename = text(obj, "_filename");
    node.computedPath = text(obj, "_computed_path");
    node.format = text(obj, "_format");
    node.typeEmoji = text(obj, "_type_emoji");
    node.typeColor = text(obj, "_type_color");
    node.defaultStatus = text(obj, "_default_status");
    node.includedFrom = text(obj, "_included_from");
    node.subindexPath = text(obj, "_subindex_path");
    for (auto it = obj.begin(); it != obj.end(); ++it) {
        if (!isModelledKey(it.key())) node.extra[it.key()] = it.value();
    }
    return node;
}

std::string joinComputed(const std::string& parent, const std::string& child) {
    if (parent.empty()) return child;
    if (child.empty()) return parent;
    return parent + "/" + child;
}

std::string relativeTo(const fs::path& path, const fs::path& root) {
    fs::path rel = PathResolver::normalize(path).lexically_relative(PathResolver::normalize(root));
    if (rel.empty() || rel == ".") return "";
    return rel.generic_string();
}

void putIfSet(json& out, const char* key, const std::string& value) {
    if (!value.empty()) out[key] = value;
}

void linkChildren(IndexNode& node) {
    for (auto& child : node.children) {
        child.parent = &node;
        linkChildren(child);
    }
}

} // namespace

IndexResolver::IndexResolver(Settings settings) : m_settings(std::move(settings)) {}

IndexResolveResult IndexResolver::resolveFile(const fs::path& indexPath) const {
    std::string content;
    try {
        content = readTextFile(indexPath);
    } catch (const CodexError& e) {
        IndexResolveResult result;
        result.errors.push_back({e.kind(), e.what()});
        fprintf(stderr, "[index] %s\n", e.what());
        return result;
    }
    const fs::path absPath = PathResolver::normalize(indexPath);
    return resolve(content, absPath.parent_path(), absPath, formatForPath(absPath));
}

IndexResolveResult IndexResolver::resolve(const std::string& content, const fs::path& indexDir,
                                          const fs::path& indexPath, Format format) const {
    IndexResolveResult result;

    json data;
    try {
        data = parseDocumentText(content, format);
        if (!data.is_object()) {
            throw CodexError(ErrorKind::StructureError, "Index file is not a mapping");
        }
        if (text(data, "type") != "index") {
            throw CodexError(ErrorKind::StructureError, "Not an index document (type must be \"index\")");
        }
    } catch (const CodexError& e) {
        result.errors.push_back({e.kind(), e.what()});
        fprintf(stderr, "[index] Failed to parse index file: %s\n", e.what());
        return result;
    }

    IndexDocument& doc = result.document;
    if (data.contains("metadata") && data["metadata"].is_object()) doc.metadata = data["metadata"];
    doc.id = text(data, "id");
    doc.type = "index";
    doc.name = text(data, "name");
    doc.title = text(data, "title");
    doc.summary = text(data, "summary");
    doc.status = text(data, "status");
    doc.attributes = readAttributes(data);
    if (data.contains("patterns") && data["patterns"].is_object()) {
        const json& patterns = data["patterns"];
        if (patterns.contains("include")) doc.includePatterns = readStrings(patterns["include"]);
        if (patterns.contains("exclude")) doc.excludePatterns = readStrings(patterns["exclude"]);
    }
    doc.typeStyles = readTypeStyles(data);

    std::set<fs::path> visited;
    if (!indexPath.empty()) {
        visited.insert(PathResolver::normalize(indexPath));
    }

    Context context;
    context.visited = &visited;
    context.baseDir = PathResolver::normalize(indexDir);
    context.indexDir = context.baseDir;
    context.rootDir = containmentRoot(m_settings, context.baseDir);
    if (data.contains("children") && data["children"].is_array()) {
        doc.children = resolveChildren(data["children"], context, &result);
    }

    applyTypeStyles(doc.children, doc.typeStyles);
    applyDefaultStatus(doc.children);
    linkParents(doc);

    result.success = true;
    return result;
}

std::vector<IndexNode> IndexResolver::resolveChildren(const json& children, const Context& context,
                                                      IndexResolveResult* result) const {
    std::vector<IndexNode> resolved;
    for (const auto& child : children) {
        if (isIncludeStub(child)) {
            const std::string includeSpec = child["include"].get<std::string>();
            if (PathResolver::isIndexFileName(includeSpec)) {
                std::optional<IndexNode> sub = resolveSubIndex(includeSpec, context, result);
                if (sub) resolved.push_back(std::move(*sub));
            } else {
                fs::path target = PathResolver::resolveIncludePath(includeSpec, context.baseDir);
                if (m_settings.enforceContainment && !PathResolver::isWithinRoot(target, context.rootDir)) {
                    result->errors.push_back({ErrorKind::UnresolvedInclude,
                                              "Include \"" + includeSpec + "\" points outside the project root"});
                    fprintf(stderr, "[index] include outside project root skipped: %s\n", includeSpec.c_str());
                    continue;
                }
                resolved.push_back(leafInclude(includeSpec, target, context));
            }
            continue;
        }
        if (!child.is_object()) continue;

        IndexNode node = nodeFromJson(child);
        if (node.computedPath.empty() && !node.filename.empty()) {
            node.computedPath = joinComputed(context.parentComputedPath, node.filename);
        }
        if (child.contains("children") && child["children"].is_array()) {
            Context nested = context;
            if (!node.filename.empty()) {
                nested.baseDir = PathResolver::normalize(context.baseDir / fs::path(node.filename).parent_path());
            }
            nested.parentComputedPath = node.computedPath.empty() ? context.parentComputedPath : node.computedPath;
            node.children = resolveChildren(child["children"], nested, result);
        }
        resolved.push_back(std::move(node));
    }
    return resolved;
}

std::optional<IndexNode> IndexResolver::resolveSubIndex(const std::string& includeSpec, const Context& context,
                                                        IndexResolveResult* result) const {
    const fs::path subIndexPath = PathResolver::resolveIncludePath(includeSpec, context.baseDir);

    if (context.visited->count(subIndexPath)) {
        result->errors.push_back({ErrorKind::CircularReference,
                                  "Circular sub-index reference detected: " + subIndexPath.string()});
        fprintf(stderr, "[index] Circular sub-index reference detected: %s\n", subIndexPath.string().c_str());
        return std::nullopt;
    }
    if (m_settings.enforceContainment && !PathResolver::isWithinRoot(subIndexPath, context.rootDir)) {
        result->errors.push_back({ErrorKind::UnresolvedInclude,
                                  "Sub-index outside the project root: " + subIndexPath.string()});
        fprintf(stderr, "[index] Sub-index outside the project root: %s\n", subIndexPath.string().c_str());
        return std::nullopt;
    }
    std::error_code ec;
    if (!fs::is_regular_file(subIndexPath, ec)) {
        result->errors.push_back({ErrorKind::UnresolvedInclude, "Sub-index not found: " + subIndexPath.string()});
        fprintf(stderr, "[index] Sub-index not found: %s\n", subIndexPath.string().c_str());
        return std::nullopt;
    }
    if (context.depth >= m_settings.maxIncludeDepth) {
        result->errors.push_back({ErrorKind::UnresolvedInclude,
                                  "Sub-index nesting too deep at " + subIndexPath.string()});
        return std::nullopt;
    }

    // Marked before parsing so a self include inside this file is caught too
    context.visited->insert(subIndexPath);

    json subData;
    try {
        subData = parseDocumentText(readTextFile(subIndexPath), formatForPath(subIndexPath));
    } catch (const CodexError& e) {
        result->errors.push_back({e.kind(), "Failed to load sub-index " + subIndexPath.string() + ": " + e.what()});
        fprintf(stderr, "[index] Failed to load sub-index %s: %s\n", subIndexPath.string().c_str(), e.what());
        return std::nullopt;
    }
    if (!subData.is_object()) {
        result->errors.push_back({ErrorKind::StructureError, "Sub-index is not a mapping: " + subIndexPath.string()});
        return std::nullopt;
    }
    result->subIndexes.push_back(subIndexPath);

    const fs::path subDir = subIndexPath.parent_path();
    const std::string dirName = subDir.filename().string();

    IndexNode node;
    node.id = text(subData, "id").empty() ? dirName : text(subData, "id");
    node.type = "folder";
    node.name = text(subData, "name").empty() ? dirName : text(subData, "name");
    // Directory name, not the display name: paths are composed from it
    node.filename = dirName;
    node.subindexPath = subIndexPath.generic_string();
    node.computedPath = relativeTo(subDir, context.indexDir);
    node.title = text(subData, "summary");
    node.emoji = text(subData, "emoji");
    if (!text(subData, "scrivener_label").empty()) {
        node.attributes.push_back({"scrivener_label", text(subData, "scrivener_label")});
    }

    if (subData.contains("children") && subData["children"].is_array()) {
        Context nested = context;
        nested.baseDir = subDir;
        nested.parentComputedPath = node.computedPath;
        nested.depth = context.depth + 1;
        node.children = resolveChildren(subData["children"], nested, result);
        // The sub-index's own styles win inside its subtree
        applyTypeStyles(node.children, readTypeStyles(subData));
    }
    return node;
}

IndexNode IndexResolver::leafInclude(const std::string& includeSpec, const fs::path& target,
                                     const Context& context) const {
    const fs::path fileName = fs::path(includeSpec).filename();
    const std::string ext = fileName.extension().string();
    std::string stem = fileName.stem().string();
    const std::string codexSuffix = ".codex";
    if (stem.size() > codexSuffix.size() &&
        stem.compare(stem.size() - codexSuffix.size(), codexSuffix.size(), codexSuffix) == 0) {
        stem.resize(stem.size() - codexSuffix.size());
    }

    IndexNode node;
    node.id = "file-" + stem;
    node.type = "document";
    node.name = PathResolver::humanizeName(stem);
    node.filename = fileName.string();
    node.includedFrom = includeSpec;
    if (ext == ".md") node.format = "markdown";
    else if (ext == ".yaml" || ext == ".yml") node.format = "yaml";
    else node.format = "json";
    node.computedPath = relativeTo(target, context.indexDir);
    return node;
}

void IndexResolver::applyTypeStyles(std::vector<IndexNode>& nodes, const std::vector<TypeStyle>& styles) {
    if (styles.empty()) return;
    std::map<std::string, const TypeStyle*> styleMap;
    for (const auto& style : styles) {
        styleMap[style.type] = &style;
    }

    struct Walker {
        const std::map<std::string, const TypeStyle*>& styles;
        void apply(std::vector<IndexNode>& list) const {
            for (auto& node : list) {
                auto it = styles.find(node.type);
                if (it != styles.end()) {
                    const TypeStyle& style = *it->second;
                    if (node.emoji.empty() && node.typeEmoji.empty() && !style.emoji.empty()) {
                        node.typeEmoji = style.emoji;
                    }
                    if (node.color.empty() && node.typeColor.empty() && !style.color.empty()) {
                        node.typeColor = style.color;
                    }
                }
                apply(node.children);
            }
        }
    };
    Walker{styleMap}.apply(nodes);
}

void IndexResolver::applyDefaultStatus(std::vector<IndexNode>& nodes) {
    for (auto& node : nodes) {
        if (node.defaultStatus.empty()) {
            node.defaultStatus = "private";
        }
        applyDefaultStatus(node.children);
    }
}

void IndexResolver::linkParents(IndexDocument& document) {
    for (auto& child : document.children) {
        child.parent = nullptr;
        linkChildren(child);
    }
}

json IndexResolver::toJson(const IndexNode& node) {
    json out = json::object();
    putIfSet(out, "id", node.id);
    putIfSet(out, "type", node.type);
    putIfSet(out, "name", node.name);
    putIfSet(out, "title", node.title);
    if (node.order) out["order"] = *node.order;
    if (node.expanded) out["expanded"] = *node.expanded;
    putIfSet(out, "emoji", node.emoji);
    putIfSet(out, "color", node.color);
    putIfSet(out, "status", node.status);
    if (!node.attributes.empty()) {
        json attrs = json::array();
        for (const auto& a : node.attributes) {
            json entry = json::object();
            entry["key"] = a.key;
            entry["value"] = a.value;
            attrs.push_back(entry);
        }
        out["attributes"] = attrs;
    }
    for (auto it = node.extra.begin(); it != node.extra.end(); ++it) {
        out[it.key()] = it.value();
    }
    putIfSet(out, "_filename", node.filename);
    putIfSet(out, "_computed_path", node.computedPath);
    putIfSet(out, "_format", node.format);
    putIfSet(out, "_type_emoji", node.typeEmoji);
    putIfSet(out, "_type_color", node.typeColor);
    putIfSet(out, "_default_status", node.defaultStatus);
    putIfSet(out, "_included_from", node.includedFrom);
    putIfSet(out, "_subindex_path", node.subindexPath);
    if (!node.children.empty()) {
        json children = json::array();
        for (const auto& child : node.children) {
            children.push_back(toJson(child));
        }
        out["children"] = children;
    }
    return out;
}

json IndexResolver::toJson(const IndexDocument& document) {
    json out = json::object();
    if (!document.metadata.empty()) out["metadata"] = document.metadata;
    putIfSet(out, "id", document.id);
    out["type"] = "index";
    putIfSet(out, "name", document.name);
    putIfSet(out, "title", document.title);
    putIfSet(out, "summary", document.summary);
    putIfSet(out, "status", document.status);
    if (!document.includePatterns.empty() || !document.excludePatterns.empty()) {
        out["patterns"]["include"] = document.includePatterns;
        out["patterns"]["exclude"] = document.excludePatterns;
    }
    if (!document.typeStyles.empty()) {
        json styles = json::array();
        for (const auto& s : document.typeStyles) {
            json entry = json::object();
            entry["type"] = s.type;
            putIfSet(entry, "emoji", s.emoji);
            putIfSet(entry, "color", s.color);
            styles.push_back(entry);
        }
        out["typeStyles"] = styles;
    }
    json children = json::array();
    for (const auto& child : document.children) {
        children.push_back(toJson(child));
    }
    out["children"] = children;
    return out;
}

std::string effectiveEmoji(const IndexNode& node) {
    for (const auto& a : node.attributes) {
        if (a.key == "emoji") return a.value;
    }
    if (!node.emoji.empty()) return node.emoji;
    return node.typeEmoji;
}

std::string effectiveColor(const IndexNode& node) {
    for (const auto& a : node.attributes) {
        if (a.key == "color") return a.value;
    }
    if (!node.color.empty()) return node.color;
    return node.typeColor;
}

size_t countFiles(const std::vector<IndexNode>& nodes) {
    size_t count = 0;
    for (const auto& node : nodes) {
        if (!node.isFolder()) ++count;
        count += countFiles(node.children);
    }
    return count;
}

} // namespace Codexforge
