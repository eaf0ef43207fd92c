#include "path_resolver.h"
#include <algorithm>
#include <cctype>

namespace Codexforge {

namespace fs = std::filesystem;

namespace {

std::string toLower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

bool endsWith(const std::string& s, const std::string& suffix) {
    return s.size() >= suffix.size() && s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

bool isIllegalFilenameChar(unsigned char c) {
    if (c < 0x20) return true;
    switch (c) {
        case '<': case '>': case ':': case '"': case '/':
        case '\\': case '|': case '?': case '*':
            return true;
        default:
            return false;
    }
}

void replaceAll(std::string& s, const std::string& from, const std::string& to) {
    size_t pos = 0;
    while ((pos = s.find(from, pos)) != std::string::npos) {
        s.replace(pos, from.size(), to);
        pos += to.size();
    }
}

} // namespace

namespace PathResolver {

std::string sanitizeName(const std::string& name) {
    if (name == "." || name == "..") {
        return "untitled";
    }

    // No hidden files
    std::string input = (!name.empty() && name[0] == '.') ? name.substr(1) : name;

    std::string stripped;
    stripped.reserve(input.size());
    for (char c : input) {
        if (!isIllegalFilenameChar(static_cast<unsigned char>(c))) stripped += c;
    }

    // ".." runs left over after stripping collapse to a single '.'
    std::string dotted;
    dotted.reserve(stripped.size());
    for (char c : stripped) {
        if (c == '.' && !dotted.empty() && dotted.back() == '.') continue;
        dotted += c;
    }

    // Whitespace runs become one hyphen, ends trimmed
    std::string out;
    bool pendingSpace = false;
    for (char c : dotted) {
        if (std::isspace(static_cast<unsigned char>(c))) {
            pendingSpace = !out.empty();
            continue;
        }
        if (pendingSpace) {
            out += '-';
            pendingSpace = false;
        }
        out += c;
    }

    if (out.size() > kMaxNameLength) {
        size_t cut = kMaxNameLength;
        // Don't split a UTF-8 sequence
        while (cut > 0 && (static_cast<unsigned char>(out[cut]) & 0xC0) == 0x80) --cut;
        out.resize(cut);
    }

    size_t lead = out.find_first_not_of('.');
    out = (lead == std::string::npos) ? std::string() : out.substr(lead);

    if (out.empty()) {
        out = "untitled";
    }
    return out;
}

fs::path resolveOutputPath(const std::string& pattern,
                           const OutputPathContext& context,
                           const fs::path& parentDir,
                           Format format) {
    std::string type = context.type.empty() ? "node" : context.type;
    std::string name = sanitizeName(context.name.empty() ? "Untitled" : context.name);
    std::string id = context.id.empty() ? "child_" + std::to_string(context.index) : context.id;

    std::string output = pattern;
    replaceAll(output, "{type}", type);
    replaceAll(output, "{name}", name);
    replaceAll(output, "{id}", id);
    replaceAll(output, "{index}", std::to_string(context.index));

    fs::path outputPath(output);
    const std::string lower = toLower(outputPath.filename().string());

    if (format == Format::Yaml && !endsWith(lower, ".yaml") && !endsWith(lower, ".yml")) {
        fs::path stem = outputPath;
        stem.replace_extension();
        if (endsWith(toLower(stem.filename().string()), ".codex")) stem.replace_extension();
        outputPath = stem;
        outputPath += ".codex.yaml";
    } else if (format == Format::Json && !endsWith(lower, ".json")) {
        fs::path stem = outputPath;
        stem.replace_extension();
        if (endsWith(toLower(stem.filename().string()), ".codex")) stem.replace_extension();
        outputPath = stem;
        outputPath += ".codex.json";
    }

    if (!outputPath.is_absolute()) {
        outputPath = parentDir / outputPath;
    }
    return normalize(outputPath);
}

fs::path resolveIncludePath(const std::string& includeSpec, const fs::path& baseDir) {
    if (!includeSpec.empty() && includeSpec[0] == '/') {
        size_t start = includeSpec.find_first_not_of('/');
        std::string rest = (start == std::string::npos) ? std::string() : includeSpec.substr(start);
        return normalize(baseDir / fs::path(rest));
    }
    return normalize(baseDir / fs::path(includeSpec));
}

std::string generateIncludePath(const fs::path& outputPath, const fs::path& parentDir) {
    fs::path rel = normalize(outputPath).lexically_relative(normalize(parentDir));
    if (rel.empty()) {
        return normalize(outputPath).generic_string();
    }
    return "/" + rel.generic_string();
}

fs::path normalize(const fs::path& path) {
    std::error_code ec;
    fs::path abs = fs::absolute(path, ec);
    if (ec) abs = path;
    fs::path out = abs.lexically_normal();
    if (out.has_relative_path() && out.filename().empty()) {
        out = out.parent_path();
    }
    return out;
}

bool isWithinRoot(const fs::path& path, const fs::path& root) {
    const fs::path p = normalize(path);
    const fs::path r = normalize(root);
    auto pit = p.begin();
    for (auto rit = r.begin(); rit != r.end(); ++rit) {
        if (rit->empty()) continue;
        if (pit == p.end() || *pit != *rit) return false;
        ++pit;
    }
    return true;
}

bool isCodexFile(const fs::path& path) {
    const std::string lower = toLower(path.filename().string());
    return endsWith(lower, ".codex.yaml") || endsWith(lower, ".codex.json") || endsWith(lower, ".codex");
}

bool isIndexFileName(const fs::path& path) {
    const std::string base = path.filename().string();
    return base == "index.codex.yaml" || base == ".index.codex.yaml" ||
           base == "index.codex.json" || base == ".index.codex.json";
}

std::string humanizeName(const std::string& stem) {
    std::string out;
    out.reserve(stem.size());
    bool wordStart = true;
    for (char c : stem) {
        if (c == '-' || c == '_') c = ' ';
        unsigned char uc = static_cast<unsigned char>(c);
        if (std::isalnum(uc)) {
            out += wordStart ? static_cast<char>(std::toupper(uc)) : c;
            wordStart = false;
        } else {
            out += c;
            wordStart = true;
        }
    }
    return out;
}

} // namespace PathResolver

Format formatForPath(const fs::path& path) {
    const std::string lower = toLower(path.filename().string());
    return endsWith(lower, ".json") ? Format::Json : Format::Yaml;
}

} // namespace Codexforge
