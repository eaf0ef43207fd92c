#pragma once

#include "codex_types.h"
#include <filesystem>
#include <string>

namespace Codexforge {

struct ExplodeDefaults {
    std::string outputPattern = "./{type}s/{name}.codex.yaml";
    Format format = Format::Yaml;
    bool backup = true;
    bool force = false;
};

struct ImplodeDefaults {
    bool recursive = true;
    bool backup = true;
    bool deleteSourceFiles = false;
    bool deleteEmptyFolders = false;
};

// Engine configuration. Built once by the caller and passed into each
// operation; nothing reads configuration behind the caller's back.
struct Settings {
    ExplodeDefaults explode;
    ImplodeDefaults implode;

    // Reject include targets outside projectRoot
    bool enforceContainment = true;
    // Empty: the directory of the document being processed
    std::filesystem::path projectRoot;
    int maxIncludeDepth = 64;

    // Per-item log lines on stderr
    bool verbose = false;
};

// $XDG_CONFIG_HOME/codexforge, or ~/.config/codexforge. Empty if neither is set.
std::filesystem::path userConfigDir();

// Name of the per-project override file
constexpr const char* kProjectSettingsFile = ".codexforge.json";

// Apply the keys present in a JSON settings file on top of *settings.
// Invalid values are reported on stderr and leave the previous value.
bool loadSettingsFile(const std::filesystem::path& file, Settings* settings);

bool saveSettingsFile(const std::filesystem::path& file, const Settings& settings);

// Built-in defaults <- user settings.json <- <projectDir>/.codexforge.json
Settings loadSettings(const std::filesystem::path& projectDir);

// Directory that include containment is checked against for a document in documentDir
std::filesystem::path containmentRoot(const Settings& settings, const std::filesystem::path& documentDir);

} // namespace Codexforge
