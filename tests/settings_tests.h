#pragma once

#include "test_harness.h"
#include "test_support.h"
#include "codex_exploder.h"
#include "codex_imploder.h"
#include "settings.h"
#include <cstdlib>

namespace Codexforge::Tests {

// Points XDG_CONFIG_HOME somewhere else for the lifetime of the object
class ScopedConfigHome {
public:
    explicit ScopedConfigHome(const std::filesystem::path& dir) {
        const char* old = std::getenv("XDG_CONFIG_HOME");
        if (old) m_old = old;
        m_hadOld = old != nullptr;
        setenv("XDG_CONFIG_HOME", dir.c_str(), 1);
    }
    ~ScopedConfigHome() {
        if (m_hadOld) setenv("XDG_CONFIG_HOME", m_old.c_str(), 1);
        else unsetenv("XDG_CONFIG_HOME");
    }

private:
    std::string m_old;
    bool m_hadOld = false;
};

inline bool settings_file_overrides_defaults() {
    TempDir dir;
    writeFile(dir / "settings.json", R"({
        "explode": {"outputPattern": "./out/{id}.codex.yaml", "format": "json", "backup": false},
        "implode": {"recursive": false, "deleteSourceFiles": true},
        "enforceContainment": false,
        "projectRoot": "..",
        "maxIncludeDepth": 8
    })");
    Settings settings;
    EXPECT(loadSettingsFile(dir / "settings.json", &settings), "file should load");
    EXPECT(settings.explode.outputPattern == "./out/{id}.codex.yaml", "pattern");
    EXPECT(settings.explode.format == Format::Json && !settings.explode.backup, "explode defaults");
    EXPECT(!settings.implode.recursive && settings.implode.deleteSourceFiles, "implode defaults");
    EXPECT(settings.implode.backup, "unset keys keep their defaults");
    EXPECT(!settings.enforceContainment && settings.maxIncludeDepth == 8, "engine settings");
    EXPECT(settings.projectRoot == dir.path().parent_path(), "relative root resolved against the file");
    return true;
}

inline bool invalid_values_are_ignored() {
    TempDir dir;
    writeFile(dir / "settings.json", R"({
        "explode": {"outputPattern": "./all-the-same.codex.yaml", "format": "toml", "force": "yes"},
        "maxIncludeDepth": -3
    })");
    Settings settings;
    EXPECT(loadSettingsFile(dir / "settings.json", &settings), "file should still load");
    EXPECT(settings.explode.outputPattern == "./{type}s/{name}.codex.yaml", "non-unique pattern rejected");
    EXPECT(settings.explode.format == Format::Yaml, "unknown format rejected");
    EXPECT(!settings.explode.force, "non-boolean rejected");
    EXPECT(settings.maxIncludeDepth == 64, "negative depth rejected");

    writeFile(dir / "broken.json", "{ not json");
    EXPECT(!loadSettingsFile(dir / "broken.json", &settings), "unparsable file rejected");
    EXPECT(!loadSettingsFile(dir / "absent.json", &settings), "missing file rejected");
    return true;
}

inline bool project_file_overrides_user_file() {
    TempDir dir;
    ScopedConfigHome home(dir / "config");
    EXPECT(userConfigDir() == dir / "config/codexforge", "config dir follows XDG_CONFIG_HOME");

    writeFile(dir / "config/codexforge/settings.json",
              R"({"explode": {"format": "json", "force": true}, "verbose": true})");
    writeFile(dir / "project" / kProjectSettingsFile, R"({"explode": {"format": "yaml"}})");

    Settings settings = loadSettings(dir / "project");
    EXPECT(settings.explode.format == Format::Yaml, "project file wins");
    EXPECT(settings.explode.force && settings.verbose, "user file still applies where the project is silent");

    Settings userOnly = loadSettings(std::filesystem::path());
    EXPECT(userOnly.explode.format == Format::Json, "user file alone");
    return true;
}

inline bool settings_save_and_reload() {
    TempDir dir;
    Settings settings;
    settings.explode.outputPattern = "{index}-{name}";
    settings.implode.deleteEmptyFolders = true;
    settings.maxIncludeDepth = 3;
    EXPECT(saveSettingsFile(dir / "nested/settings.json", settings), "save should succeed");

    Settings loaded;
    EXPECT(loadSettingsFile(dir / "nested/settings.json", &loaded), "reload should succeed");
    EXPECT(loaded.explode.outputPattern == "{index}-{name}", "pattern kept");
    EXPECT(loaded.implode.deleteEmptyFolders && loaded.maxIncludeDepth == 3, "values kept");
    return true;
}

inline bool options_start_from_settings() {
    Settings settings;
    settings.explode.format = Format::Json;
    settings.explode.force = true;
    settings.implode.recursive = false;
    settings.implode.backup = false;
    ExplodeOptions explode = ExplodeOptions::fromSettings(settings);
    EXPECT(explode.format == Format::Json && explode.force && !explode.dryRun, "explode options");
    ImplodeOptions implode = ImplodeOptions::fromSettings(settings);
    EXPECT(!implode.recursive && !implode.backup, "implode options");

    EXPECT(containmentRoot(settings, "/a/b") == std::filesystem::path("/a/b"), "document dir by default");
    settings.projectRoot = "/a";
    EXPECT(containmentRoot(settings, "/a/b") == std::filesystem::path("/a"), "configured project root");
    return true;
}

inline void runSettingsTests() {
    SUBCAT("Settings files");
    RUN_TEST(settings_file_overrides_defaults);
    RUN_TEST(invalid_values_are_ignored);
    RUN_TEST(project_file_overrides_user_file);
    RUN_TEST(settings_save_and_reload);
    RUN_TEST(options_start_from_settings);
}

} // namespace Codexforge::Tests
