#pragma once

#include "codex_types.h"
#include <filesystem>
#include <string>
#include <variant>
#include <vector>

namespace YAML { class Node; }

namespace Codexforge {

// Reference-only entry of a children sequence: { include: "<path>" }
struct IncludeStub {
    std::string include;
};

// Any other children entry. Kept as the raw value so unknown fields survive.
struct ContentNode {
    json value;

    std::string id() const;
    std::string type() const;
    // name, falling back to title
    std::string displayName() const;
    bool hasChildren() const;
};

// Decided once when the children array is read
using ChildEntry = std::variant<IncludeStub, ContentNode>;

bool isIncludeStub(const json& value);
std::vector<ChildEntry> classifyChildren(const json& children);
json childrenToJson(const std::vector<ChildEntry>& children);
json childToJson(const ChildEntry& child);

// A codex file loaded from disk
struct CodexDocument {
    std::filesystem::path path;
    Format format = Format::Yaml;
    json root;

    bool hasChildrenArray() const;
    std::vector<ChildEntry> children() const;
    void setChildren(const std::vector<ChildEntry>& children);

    // Returns the metadata object, creating it when absent
    json& metadata();
};

// Parse serialized text into a document value. Throws CodexError(ParseError).
json parseDocumentText(const std::string& text, Format format);

// Render a document value in the given format
std::string serializeDocument(const json& value, Format format);

// YAML bridge (yaml-cpp <-> json)
json yamlToJson(const YAML::Node& node);
std::string emitYaml(const json& value);

// Load and check that the root is a mapping.
// Throws CodexError(FileNotFound | ParseError | StructureError).
CodexDocument loadDocument(const std::filesystem::path& path);

// Throws CodexError(IoError) when the file cannot be written
void writeDocument(const std::filesystem::path& path, const json& value, Format format);
void saveDocument(const CodexDocument& document);

// Byte-for-byte copy to "<path>.backup". Returns the backup path.
std::filesystem::path writeBackup(const std::filesystem::path& path);

std::string readTextFile(const std::filesystem::path& path);

// ISO-8601 UTC timestamp with milliseconds
std::string currentTimestamp();
// Random RFC 4122 version 4 identifier
std::string generateUuid();

} // namespace Codexforge
