#pragma once

#include "codex_document.h"
#include <filesystem>
#include <fstream>
#include <string>

namespace Codexforge::Tests {

// Scratch directory removed again when the test returns
class TempDir {
public:
    TempDir() {
        m_path = std::filesystem::temp_directory_path() / ("codexforge-test-" + generateUuid());
        std::filesystem::create_directories(m_path);
        // Canonical so paths compare equal to what the engine normalizes to
        m_path = std::filesystem::canonical(m_path);
    }
    ~TempDir() {
        std::error_code ec;
        std::filesystem::remove_all(m_path, ec);
    }
    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    const std::filesystem::path& path() const { return m_path; }
    std::filesystem::path operator/(const std::string& rel) const { return m_path / rel; }

private:
    std::filesystem::path m_path;
};

inline void writeFile(const std::filesystem::path& path, const std::string& content) {
    if (path.has_parent_path()) std::filesystem::create_directories(path.parent_path());
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    out << content;
}

inline std::string readFile(const std::filesystem::path& path) {
    return readTextFile(path);
}

inline bool fileExists(const std::filesystem::path& path) {
    std::error_code ec;
    return std::filesystem::exists(path, ec);
}

// Number of regular files below dir
inline size_t fileCount(const std::filesystem::path& dir) {
    size_t count = 0;
    for (const auto& entry : std::filesystem::recursive_directory_iterator(dir)) {
        if (entry.is_regular_file()) ++count;
    }
    return count;
}

} // namespace Codexforge::Tests
