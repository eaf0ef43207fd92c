#pragma once

#include "codex_types.h"
#include <cstddef>
#include <filesystem>
#include <string>

namespace Codexforge {

// Values substituted into an explode output pattern
struct OutputPathContext {
    std::string type;
    std::string name;
    std::string id;
    size_t index = 0;
};

namespace PathResolver {

constexpr size_t kMaxNameLength = 100;

// Turn an arbitrary display name into a safe single path component.
// Never returns an empty string, never contains a separator or "..",
// never starts with '.'.
std::string sanitizeName(const std::string& name);

// Substitute {type} {name} {id} {index} into pattern, force the extension
// for format, and resolve relative results against parentDir.
std::filesystem::path resolveOutputPath(const std::string& pattern,
                                        const OutputPathContext& context,
                                        const std::filesystem::path& parentDir,
                                        Format format);

// A leading '/' is relative to baseDir (the owning document's directory);
// anything else is resolved against baseDir too.
std::filesystem::path resolveIncludePath(const std::string& includeSpec,
                                         const std::filesystem::path& baseDir);

// "/"-prefixed POSIX path of outputPath relative to parentDir, or the
// absolute generic path when no relative path exists.
std::string generateIncludePath(const std::filesystem::path& outputPath,
                                const std::filesystem::path& parentDir);

// True when path (after lexical normalisation) lies at or below root
bool isWithinRoot(const std::filesystem::path& path, const std::filesystem::path& root);

std::filesystem::path normalize(const std::filesystem::path& path);

bool isCodexFile(const std::filesystem::path& path);
// index.codex.yaml, .index.codex.yaml, index.codex.json, .index.codex.json
bool isIndexFileName(const std::filesystem::path& path);

// "chapter-01_draft" -> "Chapter 01 Draft"
std::string humanizeName(const std::string& stem);

} // namespace PathResolver

// JSON when the file name ends in .json, YAML otherwise
Format formatForPath(const std::filesystem::path& path);

} // namespace Codexforge
