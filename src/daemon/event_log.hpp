#pragma once

#include <cstddef>
#include <mutex>
#include <string>
#include <vector>

#include <QString>

#include "common/models.hpp"

namespace pagewatch {

// EventLog is the append-only, human-readable record of cycle outcomes.
// Lines look like "[2025-01-31 08:00:00] NO CHANGE | https://example.com".
class EventLog
{
public:
    explicit EventLog(const QString &path);

    // Appends one timestamped line. Returns false if the sink could not be
    // written; the entry is then lost and lastError() says why.
    bool append(const std::string &message);

    // Last n entries in file order. Lines that do not carry a timestamp
    // prefix come back with an empty timestamp.
    std::vector<LogEntry> tail(std::size_t count) const;

    QString lastError() const;
    const QString &path() const;

    static std::string formatLine(const std::string &timestamp, const std::string &message);

private:
    QString m_path;
    mutable std::mutex m_mutex;
    QString m_lastError;
};

} // namespace pagewatch
