#pragma once

#include <nlohmann/json.hpp>
#include <functional>
#include <stdexcept>
#include <string>
#include <vector>

namespace Codexforge {

// Ordered so that rewritten files keep the author's key order
using json = nlohmann::ordered_json;

enum class Format {
    Yaml,
    Json
};

const char* formatName(Format format);

enum class ErrorKind {
    FileNotFound,
    ParseError,
    StructureError,
    OutputExists,
    CircularReference,
    UnresolvedInclude,
    PartialBatchFailure,
    IoError,
    Cancelled,
    // Informational: the operation found nothing to do
    NothingToDo
};

const char* errorKindName(ErrorKind kind);

// A single reported problem. Results collect these even when the
// operation as a whole succeeded.
struct Issue {
    ErrorKind kind = ErrorKind::IoError;
    std::string message;

    std::string toString() const;
};

std::vector<std::string> issueMessages(const std::vector<Issue>& issues);

// Thrown by the loaders for structural failures; caught at operation boundaries.
class CodexError : public std::runtime_error {
public:
    CodexError(ErrorKind kind, const std::string& message)
        : std::runtime_error(message), m_kind(kind) {}

    ErrorKind kind() const { return m_kind; }

private:
    ErrorKind m_kind;
};

// Called before each batch item: (index, total, label). Return false to stop
// at the item boundary.
using ProgressCallback = std::function<bool(size_t, size_t, const std::string&)>;

} // namespace Codexforge
