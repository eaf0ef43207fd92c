#include "codex_imploder.h"
#include "batch.h"
#include "path_resolver.h"
#include <algorithm>
#include <iterator>
#include <cstdio>
#include <set>

namespace Codexforge {

namespace fs = std::filesystem;

namespace {

size_t countStubs(const json& children, bool deep) {
    size_t count = 0;
    if (!children.is_array()) return 0;
    for (const auto& child : children) {
        if (isIncludeStub(child)) {
            ++count;
        } else if (deep && child.is_object() && child.contains("children")) {
            count += countStubs(child["children"], deep);
        }
    }
    return count;
}

size_t pathDepth(const fs::path& p) {
    return static_cast<size_t>(std::distance(p.begin(), p.end()));
}

} // namespace

ImplodeOptions ImplodeOptions::fromSettings(const Settings& settings) {
    ImplodeOptions options;
    options.recursive = settings.implode.recursive;
    options.backup = settings.implode.backup;
    options.deleteSourceFiles = settings.implode.deleteSourceFiles;
    options.deleteEmptyFolders = settings.implode.deleteEmptyFolders;
    return options;
}

bool ResolutionContext::onChain(const fs::path& file) const {
    return std::find(chain.begin(), chain.end(), file) != chain.end();
}

ResolutionContext ResolutionContext::enter(const fs::path& file) const {
    ResolutionContext next;
    next.chain = chain;
    next.chain.push_back(file);
    next.baseDir = file.parent_path();
    next.depth = depth + 1;
    return next;
}

CodexImploder::CodexImploder(Settings settings) : m_settings(std::move(settings)) {}

size_t CodexImploder::countIncludes(const json& document, bool deep) {
    if (!document.is_object() || !document.contains("children")) return 0;
    return countStubs(document["children"], deep);
}

std::vector<std::string> CodexImploder::listIncludePaths(const json& document) {
    std::vector<std::string> paths;
    if (!document.is_object() || !document.contains("children")) return paths;
    for (const auto& child : classifyChildren(document["children"])) {
        if (const auto* stub = std::get_if<IncludeStub>(&child)) {
            paths.push_back(stub->include);
        }
    }
    return paths;
}

std::optional<json> CodexImploder::resolveInclude(const std::string& includeSpec,
                                                  const ResolutionContext& context, bool recursive,
                                                  const fs::path& root, std::vector<fs::path>* merged,
                                                  std::vector<Issue>* issues) const {
    const fs::path fullPath = PathResolver::resolveIncludePath(includeSpec, context.baseDir);

    if (m_settings.enforceContainment && !PathResolver::isWithinRoot(fullPath, root)) {
        issues->push_back({ErrorKind::UnresolvedInclude,
                           "Include \"" + includeSpec + "\" points outside the project root: " + fullPath.string()});
        return std::nullopt;
    }
    std::error_code ec;
    if (!fs::is_regular_file(fullPath, ec)) {
        issues->push_back({ErrorKind::UnresolvedInclude, "Include file not found: " + fullPath.string()});
        return std::nullopt;
    }
    if (!PathResolver::isCodexFile(fullPath)) {
        issues->push_back({ErrorKind::UnresolvedInclude, "Include is not a valid codex file: " + fullPath.string()});
        return std::nullopt;
    }
    if (context.onChain(fullPath)) {
        issues->push_back({ErrorKind::CircularReference,
                           "Circular include of " + fullPath.string() + " via \"" + includeSpec + "\""});
        return std::nullopt;
    }
    if (context.depth >= m_settings.maxIncludeDepth) {
        issues->push_back({ErrorKind::UnresolvedInclude,
                           "Include nesting deeper than " + std::to_string(m_settings.maxIncludeDepth) +
                           " at " + fullPath.string()});
        return std::nullopt;
    }

    json included;
    try {
        included = parseDocumentText(readTextFile(fullPath), formatForPath(fullPath));
    } catch (const CodexError& e) {
        issues->push_back({e.kind(), "Failed to parse include file \"" + fullPath.string() + "\": " + e.what()});
        return std::nullopt;
    }
    if (!included.is_object()) {
        issues->push_back({ErrorKind::UnresolvedInclude,
                           "Include is not a codex document: " + fullPath.string()});
        return std::nullopt;
    }

    merged->push_back(fullPath);
    if (m_settings.verbose) {
        fprintf(stderr, "[implode] resolved include: %s -> %s\n", includeSpec.c_str(), fullPath.string().c_str());
    }

    // metadata belongs to the standalone file only
    included.erase("metadata");

    if (recursive && included.contains("children") && included["children"].is_array()) {
        std::vector<ChildEntry> nested = resolveChildren(classifyChildren(included["children"]),
                                                         context.enter(fullPath), recursive, root,
                                                         merged, issues);
        included["children"] = childrenToJson(nested);
    }
    return included;
}

std::vector<ChildEntry> CodexImploder::resolveChildren(const std::vector<ChildEntry>& children,
                                                       const ResolutionContext& context, bool recursive,
                                                       const fs::path& root, std::vector<fs::path>* merged,
                                                       std::vector<Issue>* issues) const {
    std::vector<ChildEntry> resolved;
    resolved.reserve(children.size());
    for (const auto& child : children) {
        if (const auto* stub = std::get_if<IncludeStub>(&child)) {
            std::optional<json> content = resolveInclude(stub->include, context, recursive, root, merged, issues);
            if (content) {
                resolved.emplace_back(ContentNode{std::move(*content)});
            } else {
                resolved.push_back(child);
            }
            continue;
        }

        const ContentNode& node = std::get<ContentNode>(child);
        if (recursive && node.hasChildren()) {
            ContentNode copy = node;
            copy.value["children"] = childrenToJson(
                resolveChildren(classifyChildren(node.value["children"]), context, recursive, root, merged, issues));
            resolved.emplace_back(std::move(copy));
        } else {
            resolved.push_back(child);
        }
    }
    return resolved;
}

ImplodeResult CodexImploder::implode(const fs::path& file, const ImplodeOptions& options,
                                     const ProgressCallback& progress) const {
    ImplodeResult result;

    CodexDocument doc;
    try {
        doc = loadDocument(file);
        if (!doc.hasChildrenArray()) {
            throw CodexError(ErrorKind::StructureError, "No 'children' array found in codex file");
        }
    } catch (const CodexError& e) {
        result.errors.push_back({e.kind(), e.what()});
        fprintf(stderr, "[implode] %s\n", e.what());
        return result;
    }

    if (countIncludes(doc.root, options.recursive) == 0) {
        result.success = true;
        result.errors.push_back({ErrorKind::NothingToDo, "No include directives found - nothing to merge"});
        return result;
    }

    const fs::path absFile = PathResolver::normalize(file);
    ResolutionContext context;
    context.chain.push_back(absFile);
    context.baseDir = absFile.parent_path();
    const fs::path root = containmentRoot(m_settings, context.baseDir);

    const std::vector<ChildEntry> children = doc.children();
    std::vector<fs::path> merged;

    auto labelOf = [](const ChildEntry& child) {
        if (const auto* stub = std::get_if<IncludeStub>(&child)) return stub->include;
        return std::get<ContentNode>(child).displayName();
    };

    auto resolveOne = [&](size_t, const ChildEntry& child) -> ItemResult<ChildEntry> {
        std::vector<Issue> local;
        std::vector<ChildEntry> one = resolveChildren({child}, context, options.recursive, root, &merged, &local);
        const bool unresolvedStub = std::holds_alternative<IncludeStub>(child) &&
                                    std::holds_alternative<IncludeStub>(one.front());
        if (unresolvedStub && !local.empty()) {
            Issue cause = local.back();
            local.pop_back();
            result.errors.insert(result.errors.end(), local.begin(), local.end());
            return ItemResult<ChildEntry>::fail(cause.kind, cause.message);
        }
        result.errors.insert(result.errors.end(), local.begin(), local.end());
        return ItemResult<ChildEntry>::ok(std::move(one.front()));
    };

    BatchOutcome<ChildEntry> outcome = foldBatch<ChildEntry>(children, labelOf, resolveOne, progress);
    appendBatchIssues(outcome, children.size(), "children", &result.errors);
    result.summary = batchSummary(outcome, "includes");

    for (const auto& failure : outcome.failures) {
        fprintf(stderr, "[implode] %s\n", failure.issue.message.c_str());
    }

    result.mergedFiles = merged;
    result.mergedCount = merged.size();

    if (options.dryRun) {
        if (options.deleteSourceFiles) result.deletedFiles = merged;
        result.success = true;
        return result;
    }

    std::vector<ChildEntry> resolved;
    resolved.reserve(children.size());
    size_t next = 0;
    for (size_t i = 0; i < children.size(); ++i) {
        if (next < outcome.successes.size() && outcome.successes[next].first == i) {
            resolved.push_back(outcome.successes[next].second);
            ++next;
        } else {
            resolved.push_back(children[i]);
        }
    }
    doc.setChildren(resolved);

    json& metadata = doc.metadata();
    const std::string now = currentTimestamp();
    metadata["updated"] = now;
    metadata.erase("exploded");
    json summary = json::object();
    summary["timestamp"] = now;
    summary["mergedCount"] = result.mergedCount;
    metadata["imploded"] = summary;

    try {
        if (options.backup) {
            result.backupFile = writeBackup(file);
        }
        saveDocument(doc);
    } catch (const CodexError& e) {
        result.errors.insert(result.errors.begin(), Issue{e.kind(), e.what()});
        fprintf(stderr, "[implode] %s\n", e.what());
        return result;
    }

    if (options.deleteSourceFiles && !merged.empty()) {
        deleteSourceFiles(merged, options.deleteEmptyFolders, &result);
    }

    result.success = true;
    return result;
}

void CodexImploder::deleteSourceFiles(const std::vector<fs::path>& files, bool deleteEmptyFolders,
                                      ImplodeResult* result) const {
    std::set<fs::path> foldersToCheck;
    std::set<fs::path> seen;

    for (const auto& filePath : files) {
        if (!seen.insert(filePath).second) continue;
        std::error_code ec;
        if (!fs::exists(filePath, ec)) continue;
        if (fs::remove(filePath, ec)) {
            result->deletedFiles.push_back(filePath);
            foldersToCheck.insert(filePath.parent_path());
        } else {
            result->errors.push_back({ErrorKind::IoError,
                                      "Failed to delete file \"" + filePath.string() + "\": " + ec.message()});
        }
    }

    if (!deleteEmptyFolders) return;

    std::vector<fs::path> sorted(foldersToCheck.begin(), foldersToCheck.end());
    std::sort(sorted.begin(), sorted.end(), [](const fs::path& a, const fs::path& b) {
        return pathDepth(a) > pathDepth(b);
    });

    for (const auto& folder : sorted) {
        std::error_code ec;
        if (fs::is_directory(folder, ec) && fs::is_empty(folder, ec) && !ec) {
            if (fs::remove(folder, ec)) {
                result->deletedFolders.push_back(folder);
                if (m_settings.verbose) {
                    fprintf(stderr, "[implode] deleted empty folder: %s\n", folder.string().c_str());
                }
                continue;
            }
        }
        if (ec) {
            fprintf(stderr, "[implode] could not delete folder \"%s\": %s\n", folder.string().c_str(),
                    ec.message().c_str());
        }
    }
}

} // namespace Codexforge
