#include "codex_exploder.h"
#include "batch.h"
#include "path_resolver.h"
#include <algorithm>
#include <cctype>
#include <cstdio>
#include <set>

namespace Codexforge {

namespace fs = std::filesystem;

namespace {

std::string toLower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

bool hasValue(const json& obj, const char* key) {
    auto it = obj.find(key);
    if (it == obj.end() || it->is_null()) return false;
    if (it->is_string()) return !it->get_ref<const std::string&>().empty();
    return true;
}

struct Extracted {
    std::string childId;
    fs::path outputPath;
};

} // namespace

ExplodeOptions ExplodeOptions::fromSettings(const Settings& settings) {
    ExplodeOptions options;
    options.outputPattern = settings.explode.outputPattern;
    options.format = settings.explode.format;
    options.backup = settings.explode.backup;
    options.force = settings.explode.force;
    return options;
}

CodexExploder::CodexExploder(Settings settings) : m_settings(std::move(settings)) {}

std::vector<std::string> CodexExploder::listChildTypes(const json& document) {
    std::set<std::string> types;
    if (!document.is_object() || !document.contains("children") || !document["children"].is_array()) {
        return {};
    }
    for (const auto& child : classifyChildren(document["children"])) {
        if (const auto* node = std::get_if<ContentNode>(&child)) {
            if (!node->type().empty()) types.insert(node->type());
        }
    }
    return std::vector<std::string>(types.begin(), types.end());
}

json CodexExploder::buildStandaloneDocument(const json& child, const json& parentMetadata,
                                            const fs::path& sourcePath) {
    json metadata = json::object();
    metadata["formatVersion"] = "1.1";
    metadata["documentVersion"] = "1.0.0";
    metadata["created"] = currentTimestamp();
    metadata["extractedFrom"] = sourcePath.generic_string();
    if (parentMetadata.is_object()) {
        if (hasValue(parentMetadata, "author")) metadata["author"] = parentMetadata["author"];
        if (hasValue(parentMetadata, "license")) metadata["license"] = parentMetadata["license"];
    }

    json doc = json::object();
    doc["metadata"] = metadata;
    for (auto it = child.begin(); it != child.end(); ++it) {
        if (it.key() == "metadata") continue;
        doc[it.key()] = it.value();
    }

    if (!hasValue(doc, "id")) doc["id"] = generateUuid();
    if (!hasValue(doc, "type")) doc["type"] = "node";
    if (!hasValue(doc, "name") && !hasValue(doc, "title")) doc["name"] = "Untitled";
    return doc;
}

ExplodeResult CodexExploder::explode(const fs::path& file, const ExplodeOptions& options,
                                     const ProgressCallback& progress) const {
    ExplodeResult result;

    CodexDocument doc;
    try {
        doc = loadDocument(file);
        if (!doc.hasChildrenArray()) {
            throw CodexError(ErrorKind::StructureError, "No 'children' array found in codex file");
        }
    } catch (const CodexError& e) {
        result.errors.push_back({e.kind(), e.what()});
        fprintf(stderr, "[explode] %s\n", e.what());
        return result;
    }

    const std::vector<ChildEntry> children = doc.children();
    if (children.empty()) {
        result.success = true;
        result.errors.push_back({ErrorKind::NothingToDo, "Children array is empty - nothing to extract"});
        return result;
    }

    std::vector<std::string> wanted;
    for (const auto& t : options.types) wanted.push_back(toLower(t));

    // Include stubs and non-object entries are never extracted
    std::vector<json> extracted;
    std::vector<size_t> extractedAt;
    std::vector<ChildEntry> remaining;
    for (size_t i = 0; i < children.size(); ++i) {
        const ChildEntry& child = children[i];
        const auto* node = std::get_if<ContentNode>(&child);
        bool take = node && node->value.is_object() &&
                    (wanted.empty() ||
                     std::find(wanted.begin(), wanted.end(), toLower(node->type())) != wanted.end());
        if (take) {
            extracted.push_back(node->value);
            extractedAt.push_back(i);
        } else {
            remaining.push_back(child);
        }
    }

    if (m_settings.verbose) {
        fprintf(stderr, "[explode] %zu children, %zu to extract, %zu remaining\n",
                children.size(), extracted.size(), remaining.size());
    }

    if (extracted.empty()) {
        std::string types = "all";
        if (!options.types.empty()) {
            types.clear();
            for (const auto& t : options.types) types += (types.empty() ? "" : ", ") + t;
        }
        result.success = true;
        result.errors.push_back({ErrorKind::NothingToDo, "No children matched the specified types: " + types});
        return result;
    }

    const fs::path sourcePath = PathResolver::normalize(file);
    const fs::path parentDir = sourcePath.parent_path();
    const fs::path root = containmentRoot(m_settings, parentDir);
    const json parentMetadata = doc.root.contains("metadata") ? doc.root["metadata"] : json::object();
    std::set<fs::path> claimed;

    auto labelOf = [](const json& child) {
        std::string name = ContentNode{child}.displayName();
        return name.empty() ? std::string("Untitled") : name;
    };

    auto extractOne = [&](size_t index, const json& child) -> ItemResult<Extracted> {
        ContentNode node{child};
        OutputPathContext context{node.type(), node.displayName(), node.id(), index};
        fs::path outputPath = PathResolver::resolveOutputPath(options.outputPattern, context, parentDir, options.format);

        if (m_settings.enforceContainment && !PathResolver::isWithinRoot(outputPath, root)) {
            return ItemResult<Extracted>::fail(ErrorKind::IoError,
                "Output path escapes the project root: " + outputPath.string());
        }
        if (outputPath == sourcePath) {
            return ItemResult<Extracted>::fail(ErrorKind::OutputExists,
                "Output path is the source document itself: " + outputPath.string());
        }
        if (!claimed.insert(outputPath).second) {
            return ItemResult<Extracted>::fail(ErrorKind::OutputExists,
                "Output path used by an earlier child: " + outputPath.string());
        }
        std::error_code ec;
        if (fs::exists(outputPath, ec) && !options.force && !options.dryRun) {
            return ItemResult<Extracted>::fail(ErrorKind::OutputExists,
                "File already exists: " + outputPath.string() + " (use force option to overwrite)");
        }

        json standalone = buildStandaloneDocument(child, parentMetadata, sourcePath);
        std::string childId = ContentNode{standalone}.id();

        if (options.dryRun) {
            if (m_settings.verbose) {
                fprintf(stderr, "[explode] [dry run] would extract '%s' -> %s\n",
                        labelOf(child).c_str(), outputPath.string().c_str());
            }
        } else {
            if (options.backup && !result.backupFile) {
                // Taken before the first extracted file is written
                result.backupFile = writeBackup(file);
            }
            fs::create_directories(outputPath.parent_path(), ec);
            if (ec) {
                return ItemResult<Extracted>::fail(ErrorKind::IoError,
                    "Cannot create directory " + outputPath.parent_path().string() + ": " + ec.message());
            }
            writeDocument(outputPath, standalone, options.format);
            if (m_settings.verbose) {
                fprintf(stderr, "[explode] extracted '%s' -> %s\n", labelOf(child).c_str(), outputPath.string().c_str());
            }
        }
        return ItemResult<Extracted>::ok({childId, outputPath});
    };

    BatchOutcome<Extracted> outcome = foldBatch<Extracted>(extracted, labelOf, extractOne, progress);

    for (const auto& success : outcome.successes) {
        result.extractedFiles.push_back(success.second.outputPath);
        result.extractionMap.emplace_back(success.second.childId, success.second.outputPath);
    }
    result.extractedCount = result.extractedFiles.size();
    appendBatchIssues(outcome, extracted.size(), "children", &result.errors);
    result.summary = batchSummary(outcome, "children");

    for (const auto& failure : outcome.failures) {
        fprintf(stderr, "[explode] %s\n", failure.issue.message.c_str());
    }

    if (options.dryRun || outcome.successes.empty()) {
        result.success = true;
        return result;
    }

    // A successful extraction becomes a stub, a failed one stays inline
    std::vector<ChildEntry> processed;
    size_t next = 0;
    for (size_t i = 0; i < extracted.size(); ++i) {
        if (next < outcome.successes.size() && outcome.successes[next].first == i) {
            const fs::path& outputPath = outcome.successes[next].second.outputPath;
            processed.emplace_back(IncludeStub{PathResolver::generateIncludePath(outputPath, parentDir)});
            ++next;
        } else {
            processed.emplace_back(ContentNode{extracted[i]});
        }
    }

    std::vector<ChildEntry> replacement;
    if (wanted.empty()) {
        // Every content node was selected; stubs and other entries keep their slots
        replacement = children;
        for (size_t i = 0; i < processed.size(); ++i) {
            replacement[extractedAt[i]] = processed[i];
        }
    } else {
        replacement = processed;
        replacement.insert(replacement.end(), remaining.begin(), remaining.end());
    }
    doc.setChildren(replacement);

    json& metadata = doc.metadata();
    const std::string now = currentTimestamp();
    metadata["updated"] = now;
    json summary = json::object();
    summary["timestamp"] = now;
    if (options.types.empty()) {
        summary["extractedTypes"] = "all";
    } else {
        summary["extractedTypes"] = options.types;
    }
    summary["extractedCount"] = result.extractedCount;
    metadata["exploded"] = summary;

    try {
        saveDocument(doc);
    } catch (const CodexError& e) {
        // The extracted files exist but the parent still holds the inline children
        result.errors.insert(result.errors.begin(), Issue{e.kind(), e.what()});
        fprintf(stderr, "[explode] %s\n", e.what());
        return result;
    }

    result.success = true;
    return result;
}

} // namespace Codexforge
