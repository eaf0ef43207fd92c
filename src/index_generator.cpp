#include "index_generator.h"
#include "codex_document.h"
#include "path_resolver.h"
#include <algorithm>
#include <cctype>
#include <cstdio>
#include <functional>
#include <map>
#include <set>

namespace Codexforge {

namespace fs = std::filesystem;

namespace {

const char* const kIndexFileName = "index.codex.yaml";

std::string toLower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

bool endsWith(const std::string& s, const std::string& suffix) {
    return s.size() >= suffix.size() && s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

std::vector<std::string> splitPath(const std::string& path) {
    std::vector<std::string> parts;
    size_t start = 0;
    while (start <= path.size()) {
        size_t slash = path.find('/', start);
        if (slash == std::string::npos) slash = path.size();
        if (slash > start) parts.push_back(path.substr(start, slash - start));
        start = slash + 1;
    }
    return parts;
}

// '*' and '?' within one segment; leading dots are not special
bool matchSegment(const char* pattern, const char* text) {
    if (*pattern == '\0') return *text == '\0';
    if (*pattern == '*') {
        for (const char* t = text;; ++t) {
            if (matchSegment(pattern + 1, t)) return true;
            if (*t == '\0') return false;
        }
    }
    if (*text == '\0') return false;
    if (*pattern == '?' || *pattern == *text) return matchSegment(pattern + 1, text + 1);
    return false;
}

bool matchSegments(const std::vector<std::string>& pattern, size_t p, const std::vector<std::string>& path,
                   size_t s) {
    if (p == pattern.size()) return s == path.size();
    if (pattern[p] == "**") {
        for (size_t skip = s; skip <= path.size(); ++skip) {
            if (matchSegments(pattern, p + 1, path, skip)) return true;
        }
        return false;
    }
    if (s == path.size()) return false;
    return matchSegment(pattern[p].c_str(), path[s].c_str()) && matchSegments(pattern, p + 1, path, s + 1);
}

bool matchesAny(const std::string& relativePath, const std::vector<std::string>& patterns) {
    for (const auto& pattern : patterns) {
        if (IndexGenerator::matchesPattern(relativePath, pattern)) return true;
    }
    return false;
}

std::string text(const json& obj, const char* key) {
    auto it = obj.find(key);
    if (it == obj.end() || !it->is_string()) return "";
    return it->get<std::string>();
}

std::vector<std::string> readStrings(const json& value) {
    std::vector<std::string> out;
    if (!value.is_array()) return out;
    for (const auto& v : value) {
        if (v.is_string()) out.push_back(v.get<std::string>());
    }
    return out;
}

const TypeStyle* findStyle(const std::vector<TypeStyle>& styles, const std::string& type) {
    for (const auto& style : styles) {
        if (style.type == type) return &style;
    }
    return nullptr;
}

json stylesToJson(const std::vector<TypeStyle>& styles) {
    json out = json::array();
    for (const auto& s : styles) {
        json entry = json::object();
        entry["type"] = s.type;
        if (!s.emoji.empty()) entry["emoji"] = s.emoji;
        if (!s.color.empty()) entry["color"] = s.color;
        out.push_back(entry);
    }
    return out;
}

std::vector<TypeStyle> stylesFromJson(const json& value) {
    std::vector<TypeStyle> styles;
    if (!value.is_array()) return styles;
    for (const auto& s : value) {
        if (!s.is_object() || !s.contains("type")) continue;
        styles.push_back({text(s, "type"), text(s, "emoji"), text(s, "color")});
    }
    return styles;
}

std::string projectEmoji(const std::string& projectName) {
    static const std::vector<std::pair<const char*, const char*>> kByName = {
        {"codex", "📚"},   {"book", "📖"},    {"story", "📝"},   {"novel", "✍️"},
        {"character", "👤"}, {"world", "🌍"},  {"universe", "🌌"}, {"magic", "✨"},
        {"fantasy", "🐉"}, {"sci-fi", "🚀"},  {"science", "🔬"}, {"tech", "💻"},
        {"code", "💻"},    {"api", "⚙️"},     {"doc", "📄"},     {"guide", "📋"},
        {"wiki", "📚"},    {"note", "📝"},    {"journal", "📔"}, {"game", "🎮"},
        {"music", "🎵"},   {"art", "🎨"},     {"film", "🎬"},    {"movie", "🎬"},
    };
    const std::string lower = toLower(projectName);
    for (const auto& entry : kByName) {
        if (lower.find(entry.first) != std::string::npos) return entry.second;
    }
    return "📚";
}

// README, index or intro at the top level of the scan
std::string detectMainFile(const fs::path& baseDir, const std::vector<fs::path>& files) {
    static const char* const kMainNames[] = {"README.md", "readme.md", "INDEX.md", "index.md", "INTRO.md", "intro.md"};
    for (const auto& file : files) {
        if (file.parent_path() != baseDir) continue;
        const std::string name = file.filename().string();
        for (const char* candidate : kMainNames) {
            if (name == candidate) return name;
        }
    }
    return "";
}

// Fields a user may have edited by hand; regeneration keeps them
const char* const kPreservedKeys[] = {"id", "title", "emoji", "thumbnail", "status", "featured", "featuredOrder",
                                      "order", "expanded"};

} // namespace

IndexPatterns IndexPatterns::defaults() {
    IndexPatterns patterns;
    patterns.include = {"*.codex.yaml", "*.codex.json", "*.md"};
    patterns.exclude = {
        "**/node_modules/**", "**/.git/**",  "**/__pycache__/**", "**/venv/**",  "**/.venv/**",
        "**/dist/**",         "**/build/**", "**/.DS_Store",      "**/._*",      "**/.*",
        "**/*.jpg",           "**/*.jpeg",   "**/*.png",          "**/*.gif",    "**/*.webp",
        "**/*.svg",           "**/*.ico",    "**/index.codex.yaml", "**/.index.codex.yaml",
    };
    return patterns;
}

IndexPatterns IndexPatterns::fromJson(const json& patterns) {
    IndexPatterns out = defaults();
    if (!patterns.is_object()) return out;
    if (patterns.contains("include") && patterns["include"].is_array()) out.include = readStrings(patterns["include"]);
    if (patterns.contains("exclude") && patterns["exclude"].is_array()) out.exclude = readStrings(patterns["exclude"]);
    return out;
}

json IndexPatterns::toJson() const {
    json out = json::object();
    out["include"] = include;
    out["exclude"] = exclude;
    return out;
}

IndexGenerator::IndexGenerator(Settings settings) : m_settings(std::move(settings)) {}

std::vector<TypeStyle> IndexGenerator::defaultTypeStyles() {
    return {
        {"character", "👤", "#8B5CF6"}, {"location", "🌍", "#10B981"}, {"chapter", "📖", "#3B82F6"},
        {"scene", "🎬", "#F59E0B"},     {"act", "🎭", "#EC4899"},      {"folder", "📁", "#6B7280"},
        {"codex", "📚", "#10B981"},     {"markdown", "📝", "#6B7280"}, {"index", "📋", "#4F46E5"},
    };
}

bool IndexGenerator::matchesPattern(const std::string& relativePath, const std::string& pattern) {
    std::string path = relativePath;
    std::replace(path.begin(), path.end(), '\\', '/');

    // "*.ext" also covers compound extensions such as ".codex.yaml"
    if (pattern.size() > 2 && pattern[0] == '*' && pattern[1] == '.' &&
        pattern.find_first_of("*?/", 1) == std::string::npos && endsWith(path, pattern.substr(1))) {
        return true;
    }

    std::vector<std::string> segments = splitPath(path);
    if (segments.empty()) return false;
    if (pattern.find('/') == std::string::npos) {
        return matchSegment(pattern.c_str(), segments.back().c_str());
    }
    return matchSegments(splitPath(pattern), 0, segments, 0);
}

std::vector<fs::path> IndexGenerator::scanDirectory(const fs::path& baseDir, const IndexPatterns& patterns) {
    std::vector<fs::path> files;
    std::vector<fs::path> pending{baseDir};
    while (!pending.empty()) {
        fs::path dir = pending.back();
        pending.pop_back();

        std::error_code ec;
        fs::directory_iterator it(dir, ec);
        if (ec) {
            fprintf(stderr, "[index] Cannot scan %s: %s\n", dir.string().c_str(), ec.message().c_str());
            continue;
        }
        for (; it != fs::directory_iterator(); it.increment(ec)) {
            const fs::path full = it->path();
            const std::string relative = full.lexically_relative(baseDir).generic_string();
            if (matchesAny(relative, patterns.exclude)) continue;

            std::error_code typeEc;
            if (it->is_directory(typeEc)) {
                pending.push_back(full);
            } else if (it->is_regular_file(typeEc) && matchesAny(relative, patterns.include)) {
                files.push_back(full);
            }
        }
        if (ec) {
            fprintf(stderr, "[index] Scan of %s stopped early: %s\n", dir.string().c_str(), ec.message().c_str());
        }
    }
    std::sort(files.begin(), files.end());
    return files;
}

std::string IndexGenerator::detectFileType(const fs::path& file) {
    static const std::pair<const char*, const char*> kByExtension[] = {
        {".codex.yaml", "codex"}, {".codex.json", "codex"}, {".codex", "codex"}, {".md", "markdown"},
        {".txt", "text"},         {".json", "json"},        {".yaml", "yaml"},   {".yml", "yaml"},
    };
    const std::string name = toLower(file.filename().string());
    for (const auto& entry : kByExtension) {
        if (!endsWith(name, entry.first)) continue;
        if (std::string(entry.second) == "codex") {
            try {
                CodexDocument doc = loadDocument(file);
                std::string type = text(doc.root, "type");
                if (!type.empty()) return type;
            } catch (const CodexError& e) {
                fprintf(stderr, "[index] %s\n", e.what());
            }
        }
        return entry.second;
    }
    return "unknown";
}

std::string IndexGenerator::titleFromFileName(const std::string& fileName) {
    std::string stem = fileName;
    const std::string lower = toLower(fileName);
    for (const char* ext : {".codex.yaml", ".codex.json", ".codex", ".md", ".txt", ".yaml", ".yml", ".json"}) {
        if (endsWith(lower, ext)) {
            stem = fileName.substr(0, fileName.size() - std::char_traits<char>::length(ext));
            break;
        }
    }
    std::string out;
    bool wordStart = true;
    for (char c : stem) {
        if (c == '-' || c == '_') c = ' ';
        unsigned char uc = static_cast<unsigned char>(c);
        if (c == ' ') {
            out += c;
            wordStart = true;
        } else {
            out += static_cast<char>(wordStart ? std::toupper(uc) : std::tolower(uc));
            wordStart = false;
        }
    }
    return out;
}

json IndexGenerator::buildChildren(const fs::path& baseDir, const std::vector<fs::path>& files,
                                   const std::vector<TypeStyle>& styles) const {
    std::vector<std::vector<std::string>> relative;
    for (const auto& file : files) {
        relative.push_back(splitPath(file.lexically_relative(baseDir).generic_string()));
    }
    const TypeStyle* folderStyle = findStyle(styles, "folder");

    // Entries directly inside the folder named by prefix
    std::function<json(const std::vector<std::string>&)> toChildren = [&](const std::vector<std::string>& prefix) {
        std::set<std::string> folders;
        std::vector<size_t> direct;
        for (size_t i = 0; i < relative.size(); ++i) {
            const auto& parts = relative[i];
            if (parts.size() <= prefix.size() || !std::equal(prefix.begin(), prefix.end(), parts.begin())) continue;
            if (parts.size() == prefix.size() + 1) {
                direct.push_back(i);
            } else {
                folders.insert(parts[prefix.size()]);
            }
        }

        std::string computedDir;
        for (const auto& part : prefix) computedDir += part + "/";

        json children = json::array();
        int order = 1;
        for (const auto& folderName : folders) {
            std::vector<std::string> nested = prefix;
            nested.push_back(folderName);
            json node = json::object();
            node["id"] = generateUuid();
            node["type"] = "folder";
            node["name"] = folderName;
            node["order"] = order;
            node["expanded"] = order <= 3;
            if (folderStyle && !folderStyle->emoji.empty()) node["emoji"] = folderStyle->emoji;
            node["_filename"] = folderName;
            node["_computed_path"] = computedDir + folderName;
            node["children"] = toChildren(nested);
            children.push_back(node);
            ++order;
        }

        std::sort(direct.begin(), direct.end(),
                  [&](size_t a, size_t b) { return relative[a].back() < relative[b].back(); });
        for (size_t i : direct) {
            const std::string& name = relative[i].back();
            const std::string type = detectFileType(files[i]);
            json node = json::object();
            node["id"] = generateUuid();
            node["type"] = type;
            node["name"] = name;
            const std::string title = titleFromFileName(name);
            if (title != name) node["title"] = title;
            node["order"] = order;
            const TypeStyle* style = findStyle(styles, type);
            if (style && !style->emoji.empty()) node["emoji"] = style->emoji;
            node["_filename"] = name;
            node["_computed_path"] = computedDir + name;
            children.push_back(node);
            ++order;
        }
        return children;
    };
    return toChildren({});
}

json IndexGenerator::generateIndex(const fs::path& baseDir, const GenerateIndexOptions& options) const {
    const fs::path base = PathResolver::normalize(baseDir);
    const std::string projectName = options.projectName.empty() ? base.filename().string() : options.projectName;
    const IndexPatterns patterns = options.patterns ? *options.patterns : IndexPatterns::defaults();
    const std::vector<TypeStyle> styles = options.typeStyles ? *options.typeStyles : defaultTypeStyles();

    const std::vector<fs::path> files = scanDirectory(base, patterns);
    if (m_settings.verbose) {
        fprintf(stderr, "[index] %zu files matched under %s\n", files.size(), base.string().c_str());
    }

    json metadata = json::object();
    metadata["formatVersion"] = "2.1";
    metadata["documentVersion"] = "1.0.0";
    metadata["created"] = currentTimestamp();
    metadata["generated"] = true;

    json attributes = json::array();
    attributes.push_back({{"key", "emoji"}, {"value", projectEmoji(projectName)}});
    attributes.push_back({{"key", "color"}, {"value", "#10B981"}});
    const std::string mainFile = detectMainFile(base, files);
    if (!mainFile.empty()) attributes.push_back({{"key", "mainFile"}, {"value", mainFile}});

    json index = json::object();
    index["metadata"] = metadata;
    index["id"] = "index-root";
    index["type"] = "index";
    index["name"] = projectName;
    index["summary"] = "Index for " + projectName;
    index["attributes"] = attributes;
    index["patterns"] = patterns.toJson();
    index["typeStyles"] = stylesToJson(styles);
    index["status"] = options.status;
    index["children"] = buildChildren(base, files, styles);
    return index;
}

json IndexGenerator::mergeChildren(const json& existing, const json& fresh) {
    std::map<std::string, const json*> byName;
    if (existing.is_array()) {
        for (const auto& child : existing) {
            if (child.is_object()) byName[text(child, "name")] = &child;
        }
    }

    json merged = json::array();
    std::set<std::string> matched;
    for (const auto& node : fresh) {
        auto found = byName.find(text(node, "name"));
        if (found == byName.end()) {
            merged.push_back(node);
            continue;
        }
        matched.insert(found->first);
        const json& old = *found->second;
        json entry = node;
        for (const char* key : kPreservedKeys) {
            auto it = old.find(key);
            if (it != old.end() && !it->is_null()) entry[key] = *it;
        }
        if (node.contains("children") && old.contains("children")) {
            entry["children"] = mergeChildren(old["children"], node["children"]);
        } else if (old.contains("children")) {
            entry["children"] = old["children"];
        }
        merged.push_back(entry);
    }

    if (existing.is_array()) {
        for (const auto& child : existing) {
            if (!child.is_object() || matched.count(text(child, "name"))) continue;
            auto manual = child.find("_isManual");
            if (manual != child.end() && manual->is_boolean() && manual->get<bool>()) merged.push_back(child);
        }
    }
    return merged;
}

json IndexGenerator::regenerateIndex(const fs::path& baseDir, const json& existingIndex) const {
    const fs::path base = PathResolver::normalize(baseDir);
    const IndexPatterns patterns =
        IndexPatterns::fromJson(existingIndex.contains("patterns") ? existingIndex["patterns"] : json());
    std::vector<TypeStyle> styles = defaultTypeStyles();
    if (existingIndex.contains("typeStyles") && existingIndex["typeStyles"].is_array()) {
        styles = stylesFromJson(existingIndex["typeStyles"]);
    }

    const std::vector<fs::path> files = scanDirectory(base, patterns);
    json fresh = buildChildren(base, files, styles);

    json updated = existingIndex;
    if (!updated.contains("metadata") || !updated["metadata"].is_object()) updated["metadata"] = json::object();
    updated["metadata"]["updated"] = currentTimestamp();
    updated["children"] = mergeChildren(existingIndex.contains("children") ? existingIndex["children"] : json::array(),
                                        fresh);
    return updated;
}

IndexGenerateResult IndexGenerator::writeIndex(const fs::path& baseDir, const GenerateIndexOptions& options,
                                               bool regenerate) const {
    IndexGenerateResult result;
    std::error_code ec;
    if (!fs::is_directory(baseDir, ec)) {
        result.errors.push_back({ErrorKind::FileNotFound, "Folder not found: " + baseDir.string()});
        fprintf(stderr, "[index] Folder not found: %s\n", baseDir.string().c_str());
        return result;
    }

    fs::path existingPath;
    for (const char* name : {"index.codex.yaml", "index.codex.json"}) {
        if (fs::exists(baseDir / name, ec)) {
            existingPath = baseDir / name;
            break;
        }
    }

    try {
        if (!existingPath.empty()) {
            if (!regenerate) {
                throw CodexError(ErrorKind::OutputExists,
                    "Index already exists: " + existingPath.string() + " (use regenerate to merge)");
            }
            CodexDocument doc = loadDocument(existingPath);
            doc.root = regenerateIndex(baseDir, doc.root);
            saveDocument(doc);
            result.indexFile = existingPath;
            result.regenerated = true;
            result.itemCount = countIndexItems(doc.root["children"]);
        } else {
            json index = generateIndex(baseDir, options);
            result.indexFile = baseDir / kIndexFileName;
            writeDocument(result.indexFile, index, Format::Yaml);
            result.itemCount = countIndexItems(index["children"]);
        }
    } catch (const CodexError& e) {
        result.errors.push_back({e.kind(), e.what()});
        fprintf(stderr, "[index] %s\n", e.what());
        return result;
    }

    if (m_settings.verbose) {
        fprintf(stderr, "[index] %s %s with %zu items\n", result.regenerated ? "Regenerated" : "Generated",
                result.indexFile.string().c_str(), result.itemCount);
    }
    result.success = true;
    return result;
}

size_t countIndexItems(const json& children) {
    size_t count = 0;
    if (!children.is_array()) return count;
    for (const auto& child : children) {
        ++count;
        if (child.is_object() && child.contains("children")) count += countIndexItems(child["children"]);
    }
    return count;
}

} // namespace Codexforge
