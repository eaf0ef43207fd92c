#include "codex_types.h"

namespace Codexforge {

const char* formatName(Format format) {
    return format == Format::Json ? "json" : "yaml";
}

const char* errorKindName(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::FileNotFound: return "FileNotFound";
        case ErrorKind::ParseError: return "ParseError";
        case ErrorKind::StructureError: return "StructureError";
        case ErrorKind::OutputExists: return "OutputExists";
        case ErrorKind::CircularReference: return "CircularReference";
        case ErrorKind::UnresolvedInclude: return "UnresolvedInclude";
        case ErrorKind::PartialBatchFailure: return "PartialBatchFailure";
        case ErrorKind::IoError: return "IoError";
        case ErrorKind::Cancelled: return "Cancelled";
        case ErrorKind::NothingToDo: return "NothingToDo";
    }
    return "Unknown";
}

std::string Issue::toString() const {
    return std::string(errorKindName(kind)) + ": " + message;
}

std::vector<std::string> issueMessages(const std::vector<Issue>& issues) {
    std::vector<std::string> out;
    out.reserve(issues.size());
    for (const auto& issue : issues) {
        out.push_back(issue.toString());
    }
    return out;
}

} // namespace Codexforge
