#pragma once

namespace pagewatch {

enum class CheckStatus {
    Error,
    Initialized,
    NoChange,
    KeywordChange,
    ChangedButNoKeywords
};

enum class SnapshotActionKind {
    None,
    Write
};

enum class StoreBackend {
    Files,
    Sqlite
};

} // namespace pagewatch
