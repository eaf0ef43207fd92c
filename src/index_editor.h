#pragma once

#include "codex_types.h"
#include "order_calculator.h"
#include "settings.h"
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace Codexforge {

struct IndexEditResult {
    bool success = false;
    // Keys of the entries whose order (or position) changed
    std::vector<std::string> updated;
    // A sibling list was renumbered 0..n-1 along the way
    bool renormalized = false;
    std::optional<Issue> summary;
    std::vector<Issue> errors;

    std::vector<std::string> errorMessages() const { return issueMessages(errors); }
};

// Edits the order of entries in an index file on disk. Entries are addressed
// by _filename, _computed_path or id; the file keeps its own format.
class IndexEditor {
public:
    explicit IndexEditor(Settings settings = Settings());

    // Set the order of the direct child named fileName
    IndexEditResult reorderFileInIndex(const std::filesystem::path& indexPath, const std::string& fileName,
                                       double newOrder) const;

    // Drop each dragged entry before, after or inside target. Entries that
    // cannot be moved are reported and skipped.
    IndexEditResult moveRelative(const std::filesystem::path& indexPath, const std::vector<std::string>& draggedFiles,
                                 const std::string& targetFile, DropPosition position,
                                 const ProgressCallback& progress = nullptr) const;

    // Renumber the children of a folder 0..n-1. An empty folderName means the
    // top level of the index.
    IndexEditResult renormalizeFolderOrder(const std::filesystem::path& indexPath,
                                           const std::string& folderName) const;

private:
    Settings m_settings;
};

} // namespace Codexforge
