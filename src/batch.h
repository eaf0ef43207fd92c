#pragma once

#include "codex_types.h"
#include <exception>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace Codexforge {

// Outcome of processing one batch item
template <typename R>
struct ItemResult {
    std::optional<R> value;
    Issue issue;

    static ItemResult ok(R v) {
        ItemResult r;
        r.value = std::move(v);
        return r;
    }
    static ItemResult fail(ErrorKind kind, std::string message) {
        ItemResult r;
        r.issue = Issue{kind, std::move(message)};
        return r;
    }
};

struct BatchFailure {
    size_t index = 0;
    Issue issue;
};

template <typename R>
struct BatchOutcome {
    std::vector<std::pair<size_t, R>> successes;  // (item index, value), in item order
    std::vector<BatchFailure> failures;
    size_t processed = 0;
    bool cancelled = false;

    bool succeeded(size_t index) const {
        for (const auto& s : successes) {
            if (s.first == index) return true;
        }
        return false;
    }
};

// Best-effort fold over items. A failing item (returned or thrown) is recorded
// and processing moves on; only the progress callback can stop the fold, and
// only between items.
template <typename R, typename Item, typename LabelFn, typename Fn>
BatchOutcome<R> foldBatch(const std::vector<Item>& items, LabelFn&& labelOf, Fn&& process,
                          const ProgressCallback& progress) {
    BatchOutcome<R> outcome;
    for (size_t i = 0; i < items.size(); ++i) {
        if (progress && !progress(i, items.size(), labelOf(items[i]))) {
            outcome.cancelled = true;
            break;
        }
        try {
            ItemResult<R> result = process(i, items[i]);
            if (result.value) {
                outcome.successes.emplace_back(i, std::move(*result.value));
            } else {
                outcome.failures.push_back({i, std::move(result.issue)});
            }
        } catch (const CodexError& e) {
            outcome.failures.push_back({i, Issue{e.kind(), e.what()}});
        } catch (const std::exception& e) {
            outcome.failures.push_back({i, Issue{ErrorKind::IoError, e.what()}});
        }
        ++outcome.processed;
    }
    return outcome;
}

// Copy the fold's failures into issues, plus a note when it was cancelled
template <typename R>
void appendBatchIssues(const BatchOutcome<R>& outcome, size_t total, const std::string& what,
                       std::vector<Issue>* issues) {
    for (const auto& failure : outcome.failures) {
        issues->push_back(failure.issue);
    }
    if (outcome.cancelled) {
        issues->push_back({ErrorKind::Cancelled,
                           "Cancelled after " + std::to_string(outcome.processed) + " of " +
                           std::to_string(total) + " " + what});
    }
}

// Aggregate "N succeeded, M failed" when the batch partially failed
template <typename R>
std::optional<Issue> batchSummary(const BatchOutcome<R>& outcome, const std::string& what) {
    if (outcome.successes.empty() || outcome.failures.empty()) return std::nullopt;
    return Issue{ErrorKind::PartialBatchFailure,
                 std::to_string(outcome.successes.size()) + " " + what + " succeeded, " +
                 std::to_string(outcome.failures.size()) + " failed"};
}

} // namespace Codexforge
