#include "codex_document.h"
#include "path_resolver.h"
#include <yaml-cpp/yaml.h>
#include <algorithm>
#include <cctype>
#include <charconv>
#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <ctime>
#include <fstream>
#include <random>
#include <sstream>

namespace Codexforge {

namespace fs = std::filesystem;

namespace {

std::string stringField(const json& value, const char* key) {
    if (!value.is_object()) return "";
    auto it = value.find(key);
    if (it == value.end() || !it->is_string()) return "";
    return it->get<std::string>();
}

bool looksNumeric(const std::string& s) {
    if (s.empty()) return false;
    size_t i = 0;
    if (s[i] == '-' || s[i] == '+') ++i;
    if (i < s.size() && s[i] == '.') ++i;
    return i < s.size() && std::isdigit(static_cast<unsigned char>(s[i]));
}

// Interpret an unquoted YAML scalar the way the YAML core schema does
json plainScalarToJson(const std::string& scalar) {
    if (scalar.empty() || scalar == "~" || scalar == "null" || scalar == "Null" || scalar == "NULL") {
        return nullptr;
    }
    if (scalar == "true" || scalar == "True" || scalar == "TRUE") return true;
    if (scalar == "false" || scalar == "False" || scalar == "FALSE") return false;

    if (looksNumeric(scalar)) {
        const char* begin = scalar.data();
        const char* end = scalar.data() + scalar.size();
        if (*begin == '+') ++begin;
        int64_t asInt = 0;
        auto result = std::from_chars(begin, end, asInt);
        if (result.ec == std::errc() && result.ptr == end) {
            return asInt;
        }
        uint64_t asUnsigned = 0;
        result = std::from_chars(begin, end, asUnsigned);
        if (result.ec == std::errc() && result.ptr == end) {
            return asUnsigned;
        }
        char* parsedEnd = nullptr;
        double asDouble = std::strtod(scalar.c_str(), &parsedEnd);
        if (parsedEnd && *parsedEnd == '\0') {
            return asDouble;
        }
    }
    return scalar;
}

// Strings that a reader would otherwise take for another type, or that
// need escaping, are written double-quoted.
bool needsQuoting(const std::string& s) {
    if (s.empty()) return true;
    if (!plainScalarToJson(s).is_string()) return true;
    if (std::isspace(static_cast<unsigned char>(s.front())) ||
        std::isspace(static_cast<unsigned char>(s.back()))) return true;
    for (char c : s) {
        if (c == '\n' || c == '\r' || c == '\t') return true;
    }
    return false;
}

void emitValue(YAML::Emitter& out, const json& value) {
    if (value.is_object()) {
        out << YAML::BeginMap;
        for (auto it = value.begin(); it != value.end(); ++it) {
            out << YAML::Key << it.key();
            out << YAML::Value;
            emitValue(out, it.value());
        }
        out << YAML::EndMap;
    } else if (value.is_array()) {
        out << YAML::BeginSeq;
        for (const auto& item : value) {
            emitValue(out, item);
        }
        out << YAML::EndSeq;
    } else if (value.is_string()) {
        const auto& s = value.get_ref<const std::string&>();
        if (needsQuoting(s)) {
            out << YAML::DoubleQuoted << s;
        } else {
            out << s;
        }
    } else if (value.is_boolean()) {
        out << value.get<bool>();
    } else if (value.is_number_unsigned()) {
        out << value.get<uint64_t>();
    } else if (value.is_number_integer()) {
        out << value.get<int64_t>();
    } else if (value.is_number_float()) {
        // json's shortest round-trip form ("0.1" rather than 0.10000000000000001)
        out << value.dump();
    } else {
        out << YAML::Null;
    }
}

} // namespace

std::string ContentNode::id() const {
    if (value.is_object()) {
        auto it = value.find("id");
        if (it != value.end()) {
            if (it->is_string()) return it->get<std::string>();
            if (it->is_number()) return it->dump();
        }
    }
    return "";
}

std::string ContentNode::type() const {
    return stringField(value, "type");
}

std::string ContentNode::displayName() const {
    std::string name = stringField(value, "name");
    if (!name.empty()) return name;
    return stringField(value, "title");
}

bool ContentNode::hasChildren() const {
    if (!value.is_object()) return false;
    auto it = value.find("children");
    return it != value.end() && it->is_array();
}

bool isIncludeStub(const json& value) {
    if (!value.is_object() || value.size() != 1) return false;
    auto it = value.find("include");
    return it != value.end() && it->is_string();
}

std::vector<ChildEntry> classifyChildren(const json& children) {
    std::vector<ChildEntry> out;
    if (!children.is_array()) return out;
    out.reserve(children.size());
    for (const auto& child : children) {
        if (isIncludeStub(child)) {
            out.emplace_back(IncludeStub{child["include"].get<std::string>()});
        } else {
            out.emplace_back(ContentNode{child});
        }
    }
    return out;
}

json childToJson(const ChildEntry& child) {
    if (const auto* stub = std::get_if<IncludeStub>(&child)) {
        json out = json::object();
        out["include"] = stub->include;
        return out;
    }
    return std::get<ContentNode>(child).value;
}

json childrenToJson(const std::vector<ChildEntry>& children) {
    json out = json::array();
    for (const auto& child : children) {
        out.push_back(childToJson(child));
    }
    return out;
}

bool CodexDocument::hasChildrenArray() const {
    auto it = root.find("children");
    return it != root.end() && it->is_array();
}

std::vector<ChildEntry> CodexDocument::children() const {
    auto it = root.find("children");
    if (it == root.end()) return {};
    return classifyChildren(*it);
}

void CodexDocument::setChildren(const std::vector<ChildEntry>& children) {
    root["children"] = childrenToJson(children);
}

json& CodexDocument::metadata() {
    auto it = root.find("metadata");
    if (it == root.end() || !it->is_object()) {
        root["metadata"] = json::object();
    }
    return root["metadata"];
}

json yamlToJson(const YAML::Node& node) {
    if (!node || node.IsNull()) {
        return nullptr;
    }
    if (node.IsScalar()) {
        // yaml-cpp tags quoted scalars "!" and plain ones "?"
        if (node.Tag() == "!") {
            return node.Scalar();
        }
        return plainScalarToJson(node.Scalar());
    }
    if (node.IsSequence()) {
        json arr = json::array();
        for (const auto& item : node) {
            arr.push_back(yamlToJson(item));
        }
        return arr;
    }
    if (node.IsMap()) {
        json obj = json::object();
        for (const auto& pair : node) {
            obj[pair.first.as<std::string>()] = yamlToJson(pair.second);
        }
        return obj;
    }
    return nullptr;
}

std::string emitYaml(const json& value) {
    YAML::Emitter emitter;
    emitter.SetIndent(2);
    emitValue(emitter, value);
    std::string out(emitter.c_str());
    if (out.empty() || out.back() != '\n') out += '\n';
    return out;
}

json parseDocumentText(const std::string& text, Format format) {
    try {
        if (format == Format::Json) {
            return json::parse(text);
        }
        return yamlToJson(YAML::Load(text));
    } catch (const std::exception& e) {
        throw CodexError(ErrorKind::ParseError, std::string("Failed to parse document: ") + e.what());
    }
}

std::string serializeDocument(const json& value, Format format) {
    if (format == Format::Json) {
        return value.dump(2) + "\n";
    }
    return emitYaml(value);
}

std::string readTextFile(const fs::path& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        throw CodexError(ErrorKind::FileNotFound, "Cannot open file: " + path.string());
    }
    std::ostringstream ss;
    ss << file.rdbuf();
    return ss.str();
}

CodexDocument loadDocument(const fs::path& path) {
    std::error_code ec;
    if (!fs::is_regular_file(path, ec)) {
        throw CodexError(ErrorKind::FileNotFound, "Input file not found: " + path.string());
    }

    CodexDocument doc;
    doc.path = path;
    doc.format = formatForPath(path);
    doc.root = parseDocumentText(readTextFile(path), doc.format);

    if (!doc.root.is_object()) {
        throw CodexError(ErrorKind::StructureError, "Invalid codex file structure: " + path.string());
    }
    return doc;
}

void writeDocument(const fs::path& path, const json& value, Format format) {
    std::ofstream file(path, std::ios::binary | std::ios::trunc);
    if (!file.is_open()) {
        throw CodexError(ErrorKind::IoError, "Cannot write file: " + path.string());
    }
    file << serializeDocument(value, format);
    file.close();
    if (!file) {
        throw CodexError(ErrorKind::IoError, "Write failed: " + path.string());
    }
}

void saveDocument(const CodexDocument& document) {
    writeDocument(document.path, document.root, document.format);
}

fs::path writeBackup(const fs::path& path) {
    fs::path backup = path;
    backup += ".backup";
    std::error_code ec;
    fs::copy_file(path, backup, fs::copy_options::overwrite_existing, ec);
    if (ec) {
        throw CodexError(ErrorKind::IoError, "Cannot create backup " + backup.string() + ": " + ec.message());
    }
    return backup;
}

std::string currentTimestamp() {
    using namespace std::chrono;
    auto now = system_clock::now();
    auto ms = duration_cast<milliseconds>(now.time_since_epoch()) % 1000;
    std::time_t t = system_clock::to_time_t(now);
    std::tm tm{};
#ifdef _WIN32
    gmtime_s(&tm, &t);
#else
    gmtime_r(&t, &tm);
#endif
    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%S", &tm);
    char out[40];
    std::snprintf(out, sizeof(out), "%s.%03dZ", buf, static_cast<int>(ms.count()));
    return out;
}

std::string generateUuid() {
    static std::mt19937_64 rng{std::random_device{}()};
    std::uniform_int_distribution<int> nibble(0, 15);
    const char* hex = "0123456789abcdef";
    std::string pattern = "xxxxxxxx-xxxx-4xxx-yxxx-xxxxxxxxxxxx";
    for (auto& c : pattern) {
        if (c == 'x') {
            c = hex[nibble(rng)];
        } else if (c == 'y') {
            c = hex[(nibble(rng) & 0x3) | 0x8];
        }
    }
    return pattern;
}

} // namespace Codexforge
