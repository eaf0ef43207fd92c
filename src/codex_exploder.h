#pragma once

#include "codex_document.h"
#include "settings.h"
#include <filesystem>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace Codexforge {

struct ExplodeOptions {
    // Child types to extract (case-insensitive). Empty extracts every child node.
    std::vector<std::string> types;
    // {type} {name} {id} {index}
    std::string outputPattern = "./{type}s/{name}.codex.yaml";
    Format format = Format::Yaml;
    bool dryRun = false;
    bool backup = true;
    bool force = false;

    static ExplodeOptions fromSettings(const Settings& settings);
};

// childId -> output file, in extraction order
using ExtractionMap = std::vector<std::pair<std::string, std::filesystem::path>>;

struct ExplodeResult {
    bool success = false;
    size_t extractedCount = 0;
    std::vector<std::filesystem::path> extractedFiles;
    ExtractionMap extractionMap;
    std::optional<std::filesystem::path> backupFile;
    // Set when some children were extracted and some failed
    std::optional<Issue> summary;
    // Structural cause on failure; per-child failures and warnings otherwise
    std::vector<Issue> errors;

    std::vector<std::string> errorMessages() const { return issueMessages(errors); }
};

// Splits the direct children of a codex document into standalone files and
// replaces each one with an include stub.
class CodexExploder {
public:
    explicit CodexExploder(Settings settings = Settings());

    ExplodeResult explode(const std::filesystem::path& file, const ExplodeOptions& options,
                          const ProgressCallback& progress = nullptr) const;

    // Sorted unique types of the direct children
    static std::vector<std::string> listChildTypes(const json& document);

    // Standalone document for one child: fresh metadata (with author and
    // license inherited from the parent) plus every child field but metadata
    static json buildStandaloneDocument(const json& child, const json& parentMetadata,
                                        const std::filesystem::path& sourcePath);

private:
    Settings m_settings;
};

} // namespace Codexforge
