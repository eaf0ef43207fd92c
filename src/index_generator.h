#pragma once

#include "codex_types.h"
#include "index_resolver.h"
#include "settings.h"
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace Codexforge {

struct IndexPatterns {
    std::vector<std::string> include;
    std::vector<std::string> exclude;

    static IndexPatterns defaults();
    static IndexPatterns fromJson(const json& patterns);
    json toJson() const;
};

struct GenerateIndexOptions {
    // Empty: the folder name
    std::string projectName;
    std::optional<IndexPatterns> patterns;
    std::optional<std::vector<TypeStyle>> typeStyles;
    std::string status = "private";
};

struct IndexGenerateResult {
    bool success = false;
    std::filesystem::path indexFile;
    // Every node written, folders included
    size_t itemCount = 0;
    bool regenerated = false;
    std::vector<Issue> errors;

    std::vector<std::string> errorMessages() const { return issueMessages(errors); }
};

// Builds index documents by scanning a folder. Folders come first, then
// files, each alphabetical and numbered from 1. Every node carries
// _filename and _computed_path relative to the scanned folder.
class IndexGenerator {
public:
    explicit IndexGenerator(Settings settings = Settings());

    json generateIndex(const std::filesystem::path& baseDir, const GenerateIndexOptions& options = {}) const;

    // Rescan using the existing index's patterns and typeStyles. Entries
    // that still exist keep their id, order and hand edits; entries marked
    // _isManual survive even without a file.
    json regenerateIndex(const std::filesystem::path& baseDir, const json& existingIndex) const;

    // Write <baseDir>/index.codex.yaml. An existing index file (yaml or json)
    // is regenerated in place when regenerate is set, otherwise refused.
    IndexGenerateResult writeIndex(const std::filesystem::path& baseDir, const GenerateIndexOptions& options,
                                   bool regenerate) const;

    // Files under baseDir matching the patterns, sorted
    static std::vector<std::filesystem::path> scanDirectory(const std::filesystem::path& baseDir,
                                                            const IndexPatterns& patterns);

    // Glob match of a '/'-separated relative path. '**' spans any number of
    // segments; a pattern without '/' is matched against the last segment.
    static bool matchesPattern(const std::string& relativePath, const std::string& pattern);

    static std::vector<TypeStyle> defaultTypeStyles();

    // Type from the file name; codex files report their own type field
    static std::string detectFileType(const std::filesystem::path& file);

    static std::string titleFromFileName(const std::string& fileName);

    static json mergeChildren(const json& existing, const json& fresh);

private:
    json buildChildren(const std::filesystem::path& baseDir, const std::vector<std::filesystem::path>& files,
                       const std::vector<TypeStyle>& styles) const;

    Settings m_settings;
};

size_t countIndexItems(const json& children);

} // namespace Codexforge
