#pragma once

#include "codex_types.h"
#include "settings.h"
#include <filesystem>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace Codexforge {

struct Attribute {
    std::string key;
    std::string value;
};

// Emoji/color defaults for every node of one type
struct TypeStyle {
    std::string type;
    std::string emoji;
    std::string color;
};

// One entry of a resolved navigation tree
struct IndexNode {
    std::string id;
    std::string type;
    std::string name;
    std::string title;
    std::optional<double> order;
    std::optional<bool> expanded;
    std::string emoji;
    std::string color;
    std::string status;
    std::vector<Attribute> attributes;
    std::vector<IndexNode> children;

    // Computed while resolving
    std::string filename;        // _filename: name on disk (directory name for sub-indexes)
    std::string computedPath;    // _computed_path: relative to the root index directory
    std::string format;          // _format
    std::string typeEmoji;       // _type_emoji
    std::string typeColor;       // _type_color
    std::string defaultStatus;   // _default_status
    std::string includedFrom;    // _included_from
    std::string subindexPath;    // _subindex_path

    // Fields not modelled above, kept for round-tripping
    json extra = json::object();

    // Navigation only. Set by linkParents(); invalidated if children are modified.
    IndexNode* parent = nullptr;

    bool isFolder() const { return type == "folder"; }
};

struct IndexDocument {
    json metadata = json::object();
    std::string id;
    std::string type;
    std::string name;
    std::string title;
    std::string summary;
    std::string status;
    std::vector<Attribute> attributes;
    std::vector<std::string> includePatterns;
    std::vector<std::string> excludePatterns;
    std::vector<TypeStyle> typeStyles;
    std::vector<IndexNode> children;
};

struct IndexResolveResult {
    bool success = false;
    IndexDocument document;
    // Every sub-index file that was loaded, in visit order
    std::vector<std::filesystem::path> subIndexes;
    std::vector<Issue> errors;

    std::vector<std::string> errorMessages() const { return issueMessages(errors); }
};

// Composes per-folder index files into a single navigation tree.
class IndexResolver {
public:
    explicit IndexResolver(Settings settings = Settings());

    // indexDir is the directory containing the index; indexPath (optional) is
    // the index file itself, so that a self include is caught.
    IndexResolveResult resolve(const std::string& text, const std::filesystem::path& indexDir,
                               const std::filesystem::path& indexPath = std::filesystem::path(),
                               Format format = Format::Yaml) const;

    IndexResolveResult resolveFile(const std::filesystem::path& indexPath) const;

    // Style pass: _type_emoji/_type_color where no explicit emoji/color and no
    // earlier assignment exists. Idempotent.
    static void applyTypeStyles(std::vector<IndexNode>& nodes, const std::vector<TypeStyle>& styles);
    // Status pass: _default_status = "private" where unset. Idempotent.
    static void applyDefaultStatus(std::vector<IndexNode>& nodes);

    static void linkParents(IndexDocument& document);

    static json toJson(const IndexNode& node);
    static json toJson(const IndexDocument& document);

private:
    struct Context {
        std::set<std::filesystem::path>* visited = nullptr;
        std::filesystem::path baseDir;
        // Directory of the root index; computed paths are relative to it
        std::filesystem::path indexDir;
        // Includes outside this directory are refused
        std::filesystem::path rootDir;
        std::string parentComputedPath;
        int depth = 0;
    };

    std::vector<IndexNode> resolveChildren(const json& children, const Context& context,
                                           IndexResolveResult* result) const;
    std::optional<IndexNode> resolveSubIndex(const std::string& includeSpec, const Context& context,
                                             IndexResolveResult* result) const;
    IndexNode leafInclude(const std::string& includeSpec, const std::filesystem::path& target,
                          const Context& context) const;

    Settings m_settings;
};

// Attribute "emoji", then the emoji field, then the type style
std::string effectiveEmoji(const IndexNode& node);
std::string effectiveColor(const IndexNode& node);

// Non-folder nodes in the tree
size_t countFiles(const std::vector<IndexNode>& nodes);

} // namespace Codexforge
