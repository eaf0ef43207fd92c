#include "codex_exploder.h"
#include "codex_imploder.h"
#include "index_editor.h"
#include "index_generator.h"
#include "index_resolver.h"
#include "path_resolver.h"
#include "settings.h"
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <string>
#include <vector>

using namespace Codexforge;
namespace fs = std::filesystem;

namespace {

constexpr int kExitOk = 0;
constexpr int kExitFailed = 1;
constexpr int kExitUsage = 2;

void printUsage() {
    fprintf(stderr,
            "Usage: codexforge [--project DIR] [--verbose] <command> [options] <args>\n"
            "\n"
            "Commands:\n"
            "  explode <file>        Extract children into standalone files\n"
            "      --types a,b       Only children of these types\n"
            "      --pattern P       Output pattern ({type} {name} {id} {index})\n"
            "      --format yaml|json\n"
            "      --dry-run  --force  --no-backup\n"
            "  implode <file>        Merge included files back inline\n"
            "      --dry-run  --no-recursive  --no-backup\n"
            "      --delete-sources  --delete-empty-folders\n"
            "  resolve-index <index> Print the composed navigation tree as JSON\n"
            "  reorder <index> <file> <order>\n"
            "                        Set the order of a top-level entry\n"
            "  move <index> before|after|inside <target> <file>...\n"
            "                        Drop entries relative to target\n"
            "  renormalize <index> [folder]\n"
            "                        Renumber a folder's children 0..n-1\n"
            "  generate-index <dir>  Scan a folder and write its index.codex.yaml\n"
            "      --name N  --status private|draft|published  --regenerate\n"
            "  types <file>          List the types of the direct children\n");
}

std::vector<std::string> splitList(const std::string& text) {
    std::vector<std::string> out;
    size_t start = 0;
    while (start <= text.size()) {
        size_t comma = text.find(',', start);
        if (comma == std::string::npos) comma = text.size();
        std::string item = text.substr(start, comma - start);
        if (!item.empty()) out.push_back(item);
        start = comma + 1;
    }
    return out;
}

void printIssues(const std::vector<Issue>& issues) {
    for (const auto& issue : issues) {
        fprintf(stderr, "[codexforge] %s\n", issue.toString().c_str());
    }
}

void printSummary(const std::optional<Issue>& summary) {
    if (summary) fprintf(stderr, "[codexforge] %s\n", summary->toString().c_str());
}

bool logProgress(size_t index, size_t total, const std::string& label) {
    fprintf(stderr, "[codexforge] (%zu/%zu) %s\n", index + 1, total, label.c_str());
    return true;
}

int runExplode(const Settings& settings, const std::vector<std::string>& args) {
    ExplodeOptions options = ExplodeOptions::fromSettings(settings);
    std::string file;
    for (size_t i = 0; i < args.size(); ++i) {
        const std::string& arg = args[i];
        if (arg == "--types" && i + 1 < args.size()) {
            options.types = splitList(args[++i]);
        } else if (arg == "--pattern" && i + 1 < args.size()) {
            options.outputPattern = args[++i];
        } else if (arg == "--format" && i + 1 < args.size()) {
            const std::string& format = args[++i];
            if (format == "yaml") options.format = Format::Yaml;
            else if (format == "json") options.format = Format::Json;
            else {
                fprintf(stderr, "[codexforge] Unknown format: %s\n", format.c_str());
                return kExitUsage;
            }
        } else if (arg == "--dry-run") {
            options.dryRun = true;
        } else if (arg == "--force") {
            options.force = true;
        } else if (arg == "--no-backup") {
            options.backup = false;
        } else if (file.empty() && arg[0] != '-') {
            file = arg;
        } else {
            fprintf(stderr, "[codexforge] Unexpected argument: %s\n", arg.c_str());
            return kExitUsage;
        }
    }
    if (file.empty()) {
        printUsage();
        return kExitUsage;
    }

    CodexExploder exploder(settings);
    ExplodeResult result = exploder.explode(file, options, settings.verbose ? ProgressCallback(logProgress) : ProgressCallback());
    printIssues(result.errors);
    printSummary(result.summary);
    if (!result.success) return kExitFailed;

    for (const auto& entry : result.extractionMap) {
        printf("%s\t%s\n", entry.first.c_str(), entry.second.string().c_str());
    }
    fprintf(stderr, "[codexforge] %s%zu children extracted\n", options.dryRun ? "[dry run] " : "",
            result.extractedCount);
    if (result.backupFile) {
        fprintf(stderr, "[codexforge] Backup written to %s\n", result.backupFile->string().c_str());
    }
    return kExitOk;
}

int runImplode(const Settings& settings, const std::vector<std::string>& args) {
    ImplodeOptions options = ImplodeOptions::fromSettings(settings);
    std::string file;
    for (const auto& arg : args) {
        if (arg == "--dry-run") options.dryRun = true;
        else if (arg == "--no-recursive") options.recursive = false;
        else if (arg == "--no-backup") options.backup = false;
        else if (arg == "--delete-sources") options.deleteSourceFiles = true;
        else if (arg == "--delete-empty-folders") options.deleteEmptyFolders = true;
        else if (file.empty() && arg[0] != '-') file = arg;
        else {
            fprintf(stderr, "[codexforge] Unexpected argument: %s\n", arg.c_str());
            return kExitUsage;
        }
    }
    if (file.empty()) {
        printUsage();
        return kExitUsage;
    }

    CodexImploder imploder(settings);
    ImplodeResult result = imploder.implode(file, options, settings.verbose ? ProgressCallback(logProgress) : ProgressCallback());
    printIssues(result.errors);
    printSummary(result.summary);
    if (!result.success) return kExitFailed;

    for (const auto& merged : result.mergedFiles) {
        printf("%s\n", merged.string().c_str());
    }
    fprintf(stderr, "[codexforge] %s%zu files merged, %zu deleted, %zu folders removed\n",
            options.dryRun ? "[dry run] " : "", result.mergedCount, result.deletedFiles.size(),
            result.deletedFolders.size());
    return kExitOk;
}

int runResolveIndex(const Settings& settings, const std::vector<std::string>& args) {
    if (args.size() != 1) {
        printUsage();
        return kExitUsage;
    }
    IndexResolver resolver(settings);
    IndexResolveResult result = resolver.resolveFile(args[0]);
    printIssues(result.errors);
    if (!result.success) return kExitFailed;

    printf("%s\n", IndexResolver::toJson(result.document).dump(2).c_str());
    if (settings.verbose) {
        fprintf(stderr, "[codexforge] %zu files, %zu sub-indexes\n", countFiles(result.document.children),
                result.subIndexes.size());
    }
    return kExitOk;
}

int runReorder(const Settings& settings, const std::vector<std::string>& args) {
    if (args.size() != 3) {
        printUsage();
        return kExitUsage;
    }
    char* end = nullptr;
    double order = std::strtod(args[2].c_str(), &end);
    if (end == args[2].c_str() || *end != '\0') {
        fprintf(stderr, "[codexforge] Order must be a number: %s\n", args[2].c_str());
        return kExitUsage;
    }
    IndexEditor editor(settings);
    IndexEditResult result = editor.reorderFileInIndex(args[0], args[1], order);
    printIssues(result.errors);
    return result.success ? kExitOk : kExitFailed;
}

int runMove(const Settings& settings, const std::vector<std::string>& args) {
    DropPosition position = DropPosition::After;
    if (args.size() < 4 || !parseDropPosition(args[1], &position)) {
        printUsage();
        return kExitUsage;
    }
    std::vector<std::string> dragged(args.begin() + 3, args.end());
    IndexEditor editor(settings);
    IndexEditResult result = editor.moveRelative(args[0], dragged, args[2], position,
                                                 settings.verbose ? ProgressCallback(logProgress) : ProgressCallback());
    printIssues(result.errors);
    printSummary(result.summary);
    if (result.renormalized) {
        fprintf(stderr, "[codexforge] Sibling order was renumbered\n");
    }
    return result.success ? kExitOk : kExitFailed;
}

int runRenormalize(const Settings& settings, const std::vector<std::string>& args) {
    if (args.empty() || args.size() > 2) {
        printUsage();
        return kExitUsage;
    }
    IndexEditor editor(settings);
    IndexEditResult result = editor.renormalizeFolderOrder(args[0], args.size() == 2 ? args[1] : std::string());
    printIssues(result.errors);
    return result.success ? kExitOk : kExitFailed;
}

int runGenerateIndex(const Settings& settings, const std::vector<std::string>& args) {
    GenerateIndexOptions options;
    bool regenerate = false;
    std::string dir;
    for (size_t i = 0; i < args.size(); ++i) {
        const std::string& arg = args[i];
        if (arg == "--name" && i + 1 < args.size()) {
            options.projectName = args[++i];
        } else if (arg == "--status" && i + 1 < args.size()) {
            options.status = args[++i];
            if (options.status != "private" && options.status != "draft" && options.status != "published") {
                fprintf(stderr, "[codexforge] Unknown status: %s\n", options.status.c_str());
                return kExitUsage;
            }
        } else if (arg == "--regenerate") {
            regenerate = true;
        } else if (dir.empty() && arg[0] != '-') {
            dir = arg;
        } else {
            fprintf(stderr, "[codexforge] Unexpected argument: %s\n", arg.c_str());
            return kExitUsage;
        }
    }
    if (dir.empty()) {
        printUsage();
        return kExitUsage;
    }

    IndexGenerator generator(settings);
    IndexGenerateResult result = generator.writeIndex(dir, options, regenerate);
    printIssues(result.errors);
    if (!result.success) return kExitFailed;
    printf("%s\n", result.indexFile.string().c_str());
    fprintf(stderr, "[codexforge] %s index with %zu items\n", result.regenerated ? "Regenerated" : "Generated",
            result.itemCount);
    return kExitOk;
}

int runTypes(const std::vector<std::string>& args) {
    if (args.size() != 1) {
        printUsage();
        return kExitUsage;
    }
    try {
        CodexDocument doc = loadDocument(args[0]);
        for (const auto& type : CodexExploder::listChildTypes(doc.root)) {
            printf("%s\n", type.c_str());
        }
    } catch (const CodexError& e) {
        fprintf(stderr, "[codexforge] %s\n", e.what());
        return kExitFailed;
    }
    return kExitOk;
}

} // namespace

int main(int argc, char* argv[]) {
    fs::path projectDir;
    bool verbose = false;
    int i = 1;
    for (; i < argc && argv[i][0] == '-'; ++i) {
        if (std::strcmp(argv[i], "--project") == 0 && i + 1 < argc) {
            projectDir = argv[++i];
        } else if (std::strcmp(argv[i], "--verbose") == 0 || std::strcmp(argv[i], "-v") == 0) {
            verbose = true;
        } else if (std::strcmp(argv[i], "--help") == 0 || std::strcmp(argv[i], "-h") == 0) {
            printUsage();
            return kExitOk;
        } else {
            fprintf(stderr, "[codexforge] Unknown option: %s\n", argv[i]);
            printUsage();
            return kExitUsage;
        }
    }
    if (i >= argc) {
        printUsage();
        return kExitUsage;
    }

    const std::string command = argv[i++];
    std::vector<std::string> args(argv + i, argv + argc);
    for (const auto& arg : args) {
        if (arg.empty()) {
            printUsage();
            return kExitUsage;
        }
    }

    // Without --project, the directory of the first file argument holds the project settings
    if (projectDir.empty()) {
        for (const auto& arg : args) {
            std::error_code ec;
            if (arg[0] == '-') continue;
            if (fs::is_regular_file(arg, ec)) {
                projectDir = PathResolver::normalize(arg).parent_path();
                break;
            }
            if (command == "generate-index" && fs::is_directory(arg, ec)) {
                projectDir = PathResolver::normalize(arg);
                break;
            }
        }
    }

    Settings settings = loadSettings(projectDir);
    if (verbose) settings.verbose = true;

    if (command == "explode") return runExplode(settings, args);
    if (command == "implode") return runImplode(settings, args);
    if (command == "resolve-index") return runResolveIndex(settings, args);
    if (command == "reorder") return runReorder(settings, args);
    if (command == "move") return runMove(settings, args);
    if (command == "renormalize") return runRenormalize(settings, args);
    if (command == "generate-index") return runGenerateIndex(settings, args);
    if (command == "types") return runTypes(args);

    fprintf(stderr, "[codexforge] Unknown command: %s\n", command.c_str());
    printUsage();
    return kExitUsage;
}
