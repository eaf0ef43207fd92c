#pragma once

#include "codex_document.h"
#include "settings.h"
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace Codexforge {

struct ImplodeOptions {
    bool dryRun = false;
    bool deleteSourceFiles = false;
    bool backup = true;
    bool recursive = true;
    bool deleteEmptyFolders = false;

    static ImplodeOptions fromSettings(const Settings& settings);
};

struct ImplodeResult {
    bool success = false;
    size_t mergedCount = 0;
    std::vector<std::filesystem::path> mergedFiles;
    std::vector<std::filesystem::path> deletedFiles;
    std::vector<std::filesystem::path> deletedFolders;
    std::optional<std::filesystem::path> backupFile;
    std::optional<Issue> summary;
    std::vector<Issue> errors;

    std::vector<std::string> errorMessages() const { return issueMessages(errors); }
};

// State threaded through one include chain: the files already on the chain,
// the directory includes are resolved against, and the nesting depth.
struct ResolutionContext {
    std::vector<std::filesystem::path> chain;
    std::filesystem::path baseDir;
    int depth = 0;

    bool onChain(const std::filesystem::path& file) const;
    // Context for the children of an included file
    ResolutionContext enter(const std::filesystem::path& file) const;
};

// Resolves include stubs in a content document back into inline nodes.
class CodexImploder {
public:
    explicit CodexImploder(Settings settings = Settings());

    ImplodeResult implode(const std::filesystem::path& file, const ImplodeOptions& options,
                          const ProgressCallback& progress = nullptr) const;

    // Resolve stubs in children without touching the disk. Unresolvable stubs
    // are kept as they are and reported in issues.
    std::vector<ChildEntry> resolveChildren(const std::vector<ChildEntry>& children,
                                            const ResolutionContext& context, bool recursive,
                                            const std::filesystem::path& root,
                                            std::vector<std::filesystem::path>* merged,
                                            std::vector<Issue>* issues) const;

    // Include stubs among the direct children (or the whole tree when deep)
    static size_t countIncludes(const json& document, bool deep = false);
    static std::vector<std::string> listIncludePaths(const json& document);

private:
    // Parsed target of one stub with standalone metadata removed
    std::optional<json> resolveInclude(const std::string& includeSpec, const ResolutionContext& context,
                                       bool recursive, const std::filesystem::path& root,
                                       std::vector<std::filesystem::path>* merged,
                                       std::vector<Issue>* issues) const;

    void deleteSourceFiles(const std::vector<std::filesystem::path>& files, bool deleteEmptyFolders,
                           ImplodeResult* result) const;

    Settings m_settings;
};

} // namespace Codexforge
