#include "settings.h"
#include "path_resolver.h"
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <fstream>

namespace Codexforge {

namespace fs = std::filesystem;

namespace {

bool patternIsUnique(const std::string& pattern) {
    return pattern.find("{name}") != std::string::npos ||
           pattern.find("{id}") != std::string::npos ||
           pattern.find("{index}") != std::string::npos;
}

void readBool(const json& obj, const char* key, bool* out) {
    auto it = obj.find(key);
    if (it == obj.end()) return;
    if (it->is_boolean()) {
        *out = it->get<bool>();
    } else {
        fprintf(stderr, "[settings] '%s' must be a boolean, keeping %s\n", key, *out ? "true" : "false");
    }
}

} // namespace

fs::path userConfigDir() {
    fs::path configDir;
    const char* xdg = std::getenv("XDG_CONFIG_HOME");
    if (xdg && std::strlen(xdg) > 0) {
        configDir = xdg;
    } else {
        const char* home = std::getenv("HOME");
        if (!home) return {};
        configDir = fs::path(home) / ".config";
    }
    return configDir / "codexforge";
}

bool loadSettingsFile(const fs::path& file, Settings* settings) {
    if (!settings) return false;
    std::error_code ec;
    if (!fs::exists(file, ec)) return false;

    json j;
    try {
        std::ifstream ifs(file);
        if (!ifs.is_open()) return false;
        j = json::parse(ifs);
    } catch (const std::exception& e) {
        fprintf(stderr, "[settings] Ignoring %s: %s\n", file.string().c_str(), e.what());
        return false;
    }
    if (!j.is_object()) {
        fprintf(stderr, "[settings] Ignoring %s: not an object\n", file.string().c_str());
        return false;
    }

    if (j.contains("explode") && j["explode"].is_object()) {
        const json& e = j["explode"];
        if (e.contains("outputPattern")) {
            if (e["outputPattern"].is_string() && patternIsUnique(e["outputPattern"].get<std::string>())) {
                settings->explode.outputPattern = e["outputPattern"].get<std::string>();
            } else {
                fprintf(stderr, "[settings] explode.outputPattern needs {name}, {id} or {index}; keeping '%s'\n",
                        settings->explode.outputPattern.c_str());
            }
        }
        if (e.contains("format")) {
            std::string format = e["format"].is_string() ? e["format"].get<std::string>() : "";
            if (format == "yaml") settings->explode.format = Format::Yaml;
            else if (format == "json") settings->explode.format = Format::Json;
            else fprintf(stderr, "[settings] explode.format must be \"yaml\" or \"json\"\n");
        }
        readBool(e, "backup", &settings->explode.backup);
        readBool(e, "force", &settings->explode.force);
    }

    if (j.contains("implode") && j["implode"].is_object()) {
        const json& i = j["implode"];
        readBool(i, "recursive", &settings->implode.recursive);
        readBool(i, "backup", &settings->implode.backup);
        readBool(i, "deleteSourceFiles", &settings->implode.deleteSourceFiles);
        readBool(i, "deleteEmptyFolders", &settings->implode.deleteEmptyFolders);
    }

    readBool(j, "enforceContainment", &settings->enforceContainment);
    readBool(j, "verbose", &settings->verbose);

    if (j.contains("projectRoot")) {
        if (j["projectRoot"].is_string()) {
            fs::path root = j["projectRoot"].get<std::string>();
            // Relative roots are relative to the file that declares them
            settings->projectRoot = root.is_absolute() ? root : PathResolver::normalize(file.parent_path() / root);
        } else {
            fprintf(stderr, "[settings] projectRoot must be a string\n");
        }
    }

    if (j.contains("maxIncludeDepth")) {
        if (j["maxIncludeDepth"].is_number_integer() && j["maxIncludeDepth"].get<int>() > 0) {
            settings->maxIncludeDepth = j["maxIncludeDepth"].get<int>();
        } else {
            fprintf(stderr, "[settings] maxIncludeDepth must be a positive integer, keeping %d\n",
                    settings->maxIncludeDepth);
        }
    }
    return true;
}

bool saveSettingsFile(const fs::path& file, const Settings& settings) {
    try {
        std::error_code ec;
        if (file.has_parent_path()) fs::create_directories(file.parent_path(), ec);

        json j;
        j["explode"]["outputPattern"] = settings.explode.outputPattern;
        j["explode"]["format"] = formatName(settings.explode.format);
        j["explode"]["backup"] = settings.explode.backup;
        j["explode"]["force"] = settings.explode.force;
        j["implode"]["recursive"] = settings.implode.recursive;
        j["implode"]["backup"] = settings.implode.backup;
        j["implode"]["deleteSourceFiles"] = settings.implode.deleteSourceFiles;
        j["implode"]["deleteEmptyFolders"] = settings.implode.deleteEmptyFolders;
        j["enforceContainment"] = settings.enforceContainment;
        if (!settings.projectRoot.empty()) j["projectRoot"] = settings.projectRoot.string();
        j["maxIncludeDepth"] = settings.maxIncludeDepth;
        j["verbose"] = settings.verbose;

        std::ofstream ofs(file);
        if (!ofs.is_open()) return false;
        ofs << j.dump(4);
        ofs.close();
        return static_cast<bool>(ofs);
    } catch (const std::exception& e) {
        fprintf(stderr, "[settings] Cannot save %s: %s\n", file.string().c_str(), e.what());
        return false;
    }
}

Settings loadSettings(const fs::path& projectDir) {
    Settings settings;
    fs::path userDir = userConfigDir();
    if (!userDir.empty()) {
        loadSettingsFile(userDir / "settings.json", &settings);
    }
    if (!projectDir.empty()) {
        loadSettingsFile(projectDir / kProjectSettingsFile, &settings);
    }
    return settings;
}

fs::path containmentRoot(const Settings& settings, const fs::path& documentDir) {
    if (!settings.projectRoot.empty()) return PathResolver::normalize(settings.projectRoot);
    return PathResolver::normalize(documentDir);
}

} // namespace Codexforge
