#pragma once

#include "test_harness.h"
#include "test_support.h"
#include "codex_exploder.h"

namespace Codexforge::Tests {

inline const char* kBookYaml =
    "metadata:\n"
    "  formatVersion: \"1.1\"\n"
    "  author: Ann Writer\n"
    "  license: CC-BY-4.0\n"
    "id: book-1\n"
    "type: book\n"
    "name: The Book\n"
    "children:\n"
    "  - id: c1\n"
    "    type: chapter\n"
    "    name: Chapter One\n"
    "    body: Once upon a time\n"
    "  - id: n1\n"
    "    type: note\n"
    "    name: Research\n"
    "  - id: c2\n"
    "    type: chapter\n"
    "    name: Chapter Two\n"
    "    children:\n"
    "      - id: s1\n"
    "        type: scene\n"
    "        name: Opening\n"
    "  - include: /appendix.codex.yaml\n";

inline ExplodeOptions chapterOptions() {
    ExplodeOptions options;
    options.types = {"chapter"};
    return options;
}

inline bool explode_extracts_matching_children() {
    TempDir dir;
    writeFile(dir / "book.codex.yaml", kBookYaml);

    ExplodeResult result = CodexExploder().explode(dir / "book.codex.yaml", chapterOptions());
    EXPECT(result.success, "explode should succeed");
    EXPECT(result.extractedCount == 2, "two chapters expected");
    EXPECT(result.errors.empty(), "no errors expected");
    EXPECT(fileExists(dir / "chapters/Chapter-One.codex.yaml"), "first chapter file missing");
    EXPECT(fileExists(dir / "chapters/Chapter-Two.codex.yaml"), "second chapter file missing");
    EXPECT(result.extractionMap.size() == 2 && result.extractionMap[0].first == "c1", "map keyed by child id");
    EXPECT(result.backupFile && fileExists(*result.backupFile), "backup should be written");
    EXPECT(readFile(*result.backupFile) == kBookYaml, "backup should hold the original bytes");

    CodexDocument parent = loadDocument(dir / "book.codex.yaml");
    const json& children = parent.root["children"];
    EXPECT(children.size() == 4, "parent should keep four entries");
    EXPECT(isIncludeStub(children[0]) && children[0]["include"] == "/chapters/Chapter-One.codex.yaml",
           "first entry should be a stub for chapter one");
    EXPECT(isIncludeStub(children[1]) && children[1]["include"] == "/chapters/Chapter-Two.codex.yaml",
           "second entry should be a stub for chapter two");
    EXPECT(children[2]["id"] == "n1", "unextracted note should follow");
    EXPECT(isIncludeStub(children[3]), "existing stub should be kept");

    const json& exploded = parent.root["metadata"]["exploded"];
    EXPECT(exploded["extractedCount"] == 2, "exploded summary count");
    EXPECT(exploded["extractedTypes"] == json::array({"chapter"}), "exploded summary types");
    EXPECT(parent.root["metadata"].contains("updated"), "updated timestamp");
    return true;
}

inline bool standalone_files_carry_fresh_metadata() {
    TempDir dir;
    writeFile(dir / "book.codex.yaml", kBookYaml);
    ExplodeResult result = CodexExploder().explode(dir / "book.codex.yaml", chapterOptions());
    EXPECT(result.success, "explode should succeed");

    CodexDocument chapter = loadDocument(dir / "chapters/Chapter-Two.codex.yaml");
    const json& meta = chapter.root["metadata"];
    EXPECT(meta["formatVersion"] == "1.1" && meta["documentVersion"] == "1.0.0", "format and document versions");
    EXPECT(meta["author"] == "Ann Writer" && meta["license"] == "CC-BY-4.0", "author and license inherited");
    EXPECT(meta["extractedFrom"] == (dir / "book.codex.yaml").generic_string(), "source path recorded");
    EXPECT(meta.contains("created"), "created timestamp");
    EXPECT(chapter.root["children"][0]["id"] == "s1", "nested children travel with the chapter");
    return true;
}

inline bool type_filter_ignores_case() {
    TempDir dir;
    writeFile(dir / "book.codex.yaml", kBookYaml);
    ExplodeOptions options;
    options.types = {"NOTE"};
    ExplodeResult result = CodexExploder().explode(dir / "book.codex.yaml", options);
    EXPECT(result.success && result.extractedCount == 1, "the note should be extracted");
    EXPECT(fileExists(dir / "notes/Research.codex.yaml"), "note file missing");
    return true;
}

inline bool dry_run_touches_nothing() {
    TempDir dir;
    const std::string text =
        "type: book\n"
        "children:\n"
        "  - {id: a, type: chapter, name: Alpha}\n"
        "  - {id: b, type: chapter, name: Beta}\n"
        "  - {id: c, type: scene, name: Gamma}\n";
    writeFile(dir / "book.codex.yaml", text);

    ExplodeOptions options;
    options.dryRun = true;
    ExplodeResult result = CodexExploder().explode(dir / "book.codex.yaml", options);
    EXPECT(result.success, "dry run should succeed");
    EXPECT(result.extractedCount == 3, "three children would be extracted");
    EXPECT(result.extractedFiles.size() == 3, "three would-be paths reported");
    EXPECT(result.extractedFiles[2] == dir / "scenes/Gamma.codex.yaml", "would-be path for the scene");
    EXPECT(fileCount(dir.path()) == 1, "no files should be created");
    EXPECT(readFile(dir / "book.codex.yaml") == text, "parent should be unchanged");
    EXPECT(!result.backupFile, "no backup in a dry run");
    return true;
}

inline bool existing_output_fails_only_that_child() {
    TempDir dir;
    writeFile(dir / "book.codex.yaml",
              "type: book\n"
              "children:\n"
              "  - {id: a, type: chapter, name: Alpha}\n"
              "  - {id: b, type: chapter, name: Beta}\n"
              "  - {id: c, type: chapter, name: Gamma}\n");
    writeFile(dir / "chapters/Beta.codex.yaml", "keep: me\n");

    ExplodeResult result = CodexExploder().explode(dir / "book.codex.yaml", ExplodeOptions());
    EXPECT(result.success, "a partial batch still succeeds");
    EXPECT(result.extractedCount == 2, "two children extracted");
    EXPECT(result.errors.size() == 1, "exactly one error recorded");
    EXPECT(result.errors[0].kind == ErrorKind::OutputExists, "the failure should be OutputExists");
    EXPECT(result.summary && result.summary->kind == ErrorKind::PartialBatchFailure, "partial summary expected");
    EXPECT(readFile(dir / "chapters/Beta.codex.yaml") == "keep: me\n", "existing file must not be touched");

    const json children = loadDocument(dir / "book.codex.yaml").root["children"];
    EXPECT(children.size() == 3, "three entries expected");
    EXPECT(isIncludeStub(children[0]), "alpha should be a stub");
    EXPECT(!isIncludeStub(children[1]) && children[1]["name"] == "Beta", "beta should stay inline");
    EXPECT(isIncludeStub(children[2]), "gamma should be a stub");
    return true;
}

inline bool force_overwrites_existing_output() {
    TempDir dir;
    writeFile(dir / "book.codex.yaml", "type: book\nchildren:\n  - {id: a, type: chapter, name: Alpha}\n");
    writeFile(dir / "chapters/Alpha.codex.yaml", "stale: true\n");
    ExplodeOptions options;
    options.force = true;
    options.backup = false;
    ExplodeResult result = CodexExploder().explode(dir / "book.codex.yaml", options);
    EXPECT(result.success && result.extractedCount == 1, "forced extraction should succeed");
    EXPECT(!result.backupFile && !fileExists(dir / "book.codex.yaml.backup"), "backup disabled");
    EXPECT(loadDocument(dir / "chapters/Alpha.codex.yaml").root["id"] == "a", "file should be overwritten");
    return true;
}

inline bool same_name_children_do_not_collide() {
    TempDir dir;
    writeFile(dir / "book.codex.yaml",
              "type: book\n"
              "children:\n"
              "  - {id: a, type: chapter, name: Same}\n"
              "  - {id: b, type: chapter, name: Same}\n");
    ExplodeResult result = CodexExploder().explode(dir / "book.codex.yaml", ExplodeOptions());
    EXPECT(result.extractedCount == 1, "only the first may claim the path");
    EXPECT(result.errors.size() == 1 && result.errors[0].kind == ErrorKind::OutputExists, "second should fail");
    EXPECT(loadDocument(dir / "chapters/Same.codex.yaml").root["id"] == "a", "first child owns the file");
    return true;
}

inline bool outputs_outside_the_root_are_refused() {
    TempDir dir;
    const std::string text = "type: book\nchildren:\n  - {id: a, type: chapter, name: Alpha}\n";
    writeFile(dir / "book/book.codex.yaml", text);
    ExplodeOptions options;
    options.outputPattern = "../escaped/{name}.codex.yaml";
    ExplodeResult result = CodexExploder().explode(dir / "book/book.codex.yaml", options);
    EXPECT(result.extractedCount == 0, "nothing should be extracted");
    EXPECT(result.errors.size() == 1 && result.errors[0].kind == ErrorKind::IoError, "escape should be an IoError");
    EXPECT(!fileExists(dir / "escaped"), "no directory outside the root");
    EXPECT(readFile(dir / "book/book.codex.yaml") == text, "parent unchanged when nothing succeeded");
    return true;
}

inline bool json_output_format() {
    TempDir dir;
    writeFile(dir / "book.codex.yaml", "type: book\nchildren:\n  - {id: a, type: chapter, name: Alpha}\n");
    ExplodeOptions options;
    options.format = Format::Json;
    ExplodeResult result = CodexExploder().explode(dir / "book.codex.yaml", options);
    EXPECT(result.success && fileExists(dir / "chapters/Alpha.codex.json"), "json file expected");
    json standalone = json::parse(readFile(dir / "chapters/Alpha.codex.json"));
    EXPECT(standalone["id"] == "a", "json file should parse as json");
    EXPECT(loadDocument(dir / "book.codex.yaml").root["children"][0]["include"] == "/chapters/Alpha.codex.json",
           "stub should point at the json file");
    return true;
}

inline bool nothing_to_extract_is_a_warning() {
    TempDir dir;
    writeFile(dir / "book.codex.yaml", kBookYaml);
    ExplodeOptions options;
    options.types = {"glossary"};
    ExplodeResult result = CodexExploder().explode(dir / "book.codex.yaml", options);
    EXPECT(result.success, "no matches is not a failure");
    EXPECT(result.errors.size() == 1 && result.errors[0].kind == ErrorKind::NothingToDo, "warning expected");
    EXPECT(readFile(dir / "book.codex.yaml") == kBookYaml, "parent unchanged");
    return true;
}

inline bool structural_failures() {
    TempDir dir;
    writeFile(dir / "flat.codex.yaml", "type: note\nbody: no children here\n");
    ExplodeResult noChildren = CodexExploder().explode(dir / "flat.codex.yaml", ExplodeOptions());
    EXPECT(!noChildren.success && noChildren.errors[0].kind == ErrorKind::StructureError, "missing children array");

    ExplodeResult missing = CodexExploder().explode(dir / "nope.codex.yaml", ExplodeOptions());
    EXPECT(!missing.success && missing.errors[0].kind == ErrorKind::FileNotFound, "missing input file");

    writeFile(dir / "broken.codex.yaml", "children: [\n");
    ExplodeResult broken = CodexExploder().explode(dir / "broken.codex.yaml", ExplodeOptions());
    EXPECT(!broken.success && broken.errors[0].kind == ErrorKind::ParseError, "unparsable input");
    return true;
}

inline bool progress_can_cancel_between_children() {
    TempDir dir;
    writeFile(dir / "book.codex.yaml", kBookYaml);
    ProgressCallback stopAtSecond = [](size_t index, size_t, const std::string&) { return index < 1; };
    ExplodeResult result = CodexExploder().explode(dir / "book.codex.yaml", chapterOptions(), stopAtSecond);
    EXPECT(result.extractedCount == 1, "only the first chapter should be extracted");
    EXPECT(!result.errors.empty() && result.errors.back().kind == ErrorKind::Cancelled, "cancellation recorded");
    EXPECT(!fileExists(dir / "chapters/Chapter-Two.codex.yaml"), "second chapter not written");
    return true;
}

inline bool standalone_document_backfills_identity() {
    json child = json::parse(R"({"body": "text", "metadata": {"stale": true}})");
    json doc = CodexExploder::buildStandaloneDocument(child, json::object(), "/p/book.codex.yaml");
    EXPECT(doc["id"].is_string() && doc["id"].get<std::string>().size() == 36, "uuid id expected");
    EXPECT(doc["type"] == "node" && doc["name"] == "Untitled", "type and name defaults");
    EXPECT(!doc["metadata"].contains("stale"), "child metadata is replaced");
    EXPECT(!doc["metadata"].contains("author"), "nothing to inherit");
    return true;
}

inline bool child_types_are_listed() {
    std::vector<std::string> types = CodexExploder::listChildTypes(parseDocumentText(kBookYaml, Format::Yaml));
    EXPECT(types == std::vector<std::string>({"chapter", "note"}), "sorted unique direct child types");
    return true;
}

inline bool unfiltered_explode_keeps_stub_positions() {
    TempDir dir;
    writeFile(dir / "book.codex.yaml",
              "type: book\n"
              "children:\n"
              "  - include: /chapters/Alpha.codex.yaml\n"
              "  - {id: b, type: chapter, name: Beta}\n"
              "  - include: /chapters/Gamma.codex.yaml\n"
              "  - 42\n");
    ExplodeResult result = CodexExploder().explode(dir / "book.codex.yaml", ExplodeOptions());
    EXPECT(result.success && result.extractedCount == 1, "the one inline child is extracted");

    const json children = loadDocument(dir / "book.codex.yaml").root["children"];
    EXPECT(children.size() == 4, "every entry kept");
    EXPECT(children[0]["include"] == "/chapters/Alpha.codex.yaml", "leading stub stays first");
    EXPECT(children[1]["include"] == "/chapters/Beta.codex.yaml", "extracted child keeps its slot");
    EXPECT(children[2]["include"] == "/chapters/Gamma.codex.yaml", "trailing stub stays third");
    EXPECT(children[3] == 42, "scalar entry stays last");
    return true;
}

inline bool rerun_after_partial_failure_keeps_order() {
    TempDir dir;
    writeFile(dir / "book.codex.yaml",
              "type: book\n"
              "children:\n"
              "  - {id: a, type: chapter, name: Alpha}\n"
              "  - {id: b, type: chapter, name: Beta}\n"
              "  - {id: c, type: chapter, name: Gamma}\n");
    writeFile(dir / "chapters/Beta.codex.yaml", "taken: true\n");
    ExplodeResult first = CodexExploder().explode(dir / "book.codex.yaml", ExplodeOptions());
    EXPECT(first.extractedCount == 2 && first.errors.size() == 1, "Beta fails on the first run");

    std::filesystem::remove(dir / "chapters/Beta.codex.yaml");
    ExplodeResult second = CodexExploder().explode(dir / "book.codex.yaml", ExplodeOptions());
    EXPECT(second.success && second.extractedCount == 1, "Beta extracted on the second run");

    const json children = loadDocument(dir / "book.codex.yaml").root["children"];
    EXPECT(children[0]["include"] == "/chapters/Alpha.codex.yaml", "Alpha first");
    EXPECT(children[1]["include"] == "/chapters/Beta.codex.yaml", "Beta second");
    EXPECT(children[2]["include"] == "/chapters/Gamma.codex.yaml", "Gamma third");
    return true;
}

inline bool output_onto_the_source_is_refused() {
    TempDir dir;
    const std::string text =
        "type: book\n"
        "children:\n"
        "  - {id: c1, type: chapter, name: book, body: precious text}\n"
        "  - {id: c2, type: chapter, name: other}\n";
    writeFile(dir / "book.codex.yaml", text);
    ExplodeOptions options;
    options.outputPattern = "./{name}.codex.yaml";
    options.force = true;
    options.backup = false;
    ExplodeResult result = CodexExploder().explode(dir / "book.codex.yaml", options);
    EXPECT(result.success && result.extractedCount == 1, "only the other child is extracted");
    EXPECT(result.errors.size() == 1 && result.errors[0].kind == ErrorKind::OutputExists,
           "the clashing child fails even under force");

    const json children = loadDocument(dir / "book.codex.yaml").root["children"];
    EXPECT(children[0]["body"] == "precious text", "clashing child stays inline");
    EXPECT(children[1]["include"] == "/other.codex.yaml", "other child becomes a stub");
    return true;
}

inline bool backup_precedes_extracted_writes() {
    TempDir dir;
    writeFile(dir / "book.codex.yaml", kBookYaml);
    ProgressCallback stopAtSecond = [](size_t index, size_t, const std::string&) { return index < 1; };
    ExplodeResult result = CodexExploder().explode(dir / "book.codex.yaml", chapterOptions(), stopAtSecond);
    EXPECT(result.backupFile && readFile(*result.backupFile) == kBookYaml, "backup holds the original");

    // A backup that cannot be written stops every extraction
    TempDir other;
    writeFile(other / "book.codex.yaml", kBookYaml);
    std::filesystem::create_directories(other / "book.codex.yaml.backup/blocker");
    ExplodeResult blocked = CodexExploder().explode(other / "book.codex.yaml", chapterOptions());
    EXPECT(blocked.extractedCount == 0, "nothing extracted without a backup");
    EXPECT(!fileExists(other / "chapters"), "no extracted files written");
    EXPECT(readFile(other / "book.codex.yaml") == kBookYaml, "parent untouched");
    return true;
}

inline void runExploderTests() {
    SUBCAT("Extraction");
    RUN_TEST(explode_extracts_matching_children);
    RUN_TEST(standalone_files_carry_fresh_metadata);
    RUN_TEST(type_filter_ignores_case);
    RUN_TEST(json_output_format);
    RUN_TEST(standalone_document_backfills_identity);
    RUN_TEST(child_types_are_listed);

    SUBCAT("Dry run and failures");
    RUN_TEST(dry_run_touches_nothing);
    RUN_TEST(existing_output_fails_only_that_child);
    RUN_TEST(force_overwrites_existing_output);
    RUN_TEST(same_name_children_do_not_collide);
    RUN_TEST(outputs_outside_the_root_are_refused);
    RUN_TEST(nothing_to_extract_is_a_warning);
    RUN_TEST(structural_failures);
    RUN_TEST(progress_can_cancel_between_children);
    RUN_TEST(output_onto_the_source_is_refused);
    RUN_TEST(backup_precedes_extracted_writes);

    SUBCAT("Ordering");
    RUN_TEST(unfiltered_explode_keeps_stub_positions);
    RUN_TEST(rerun_after_partial_failure_keeps_order);
}

} // namespace Codexforge::Tests
