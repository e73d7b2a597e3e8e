#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <vector>

#include "common/enums.hpp"

namespace pagewatch {

// One monitored page. The url doubles as the snapshot identity.
struct Target {
    std::string url;
    std::vector<std::string> keywords;
};

struct Snapshot {
    std::chrono::system_clock::time_point timestamp;
    std::string text;
};

struct CheckResult {
    std::string url;
    CheckStatus status = CheckStatus::Error;

    // Set for CheckStatus::Error only.
    std::optional<std::string> details;

    // Non-empty for CheckStatus::KeywordChange only.
    std::vector<std::string> matchedKeywords;
};

struct SnapshotAction {
    SnapshotActionKind kind = SnapshotActionKind::None;
    std::string text;
};

struct Classification {
    CheckResult result;
    SnapshotAction action;
};

struct LogEntry {
    std::string timestamp;
    std::string message;
};

// Side-channel report of the last cycle. Results travel separately.
struct CycleDiagnostics {
    std::string cycleId;
    std::vector<std::string> warnings;
    std::optional<std::string> fatalError;
};

} // namespace pagewatch
