#include "daemon/event_log.hpp"

#include <QDateTime>
#include <QFile>

#include <deque>

namespace pagewatch {

namespace {

LogEntry parseLine(const QByteArray &raw)
{
    LogEntry entry;
    std::string line = raw.toStdString();
    while (!line.empty() && (line.back() == '\n' || line.back() == '\r')) {
        line.pop_back();
    }

    if (line.size() > 2 && line.front() == '[') {
        const auto close = line.find("] ");
        if (close != std::string::npos) {
            entry.timestamp = line.substr(1, close - 1);
            entry.message = line.substr(close + 2);
            return entry;
        }
    }
    entry.message = line;
    return entry;
}

} // namespace

EventLog::EventLog(const QString &path)
    : m_path(path)
{
}

std::string EventLog::formatLine(const std::string &timestamp, const std::string &message)
{
    return "[" + timestamp + "] " + message + "\n";
}

bool EventLog::append(const std::string &message)
{
    std::lock_guard<std::mutex> lock(m_mutex);

    const std::string timestamp = QDateTime::currentDateTime()
                                      .toString(QStringLiteral("yyyy-MM-dd HH:mm:ss"))
                                      .toStdString();
    const std::string line = formatLine(timestamp, message);

    QFile file(m_path);
    if (!file.open(QIODevice::WriteOnly | QIODevice::Append)) {
        m_lastError = file.errorString();
        return false;
    }

    // One write per line so concurrent appenders in other processes never
    // split a line (O_APPEND).
    const qint64 written = file.write(line.data(), static_cast<qint64>(line.size()));
    if (written != static_cast<qint64>(line.size()) || !file.flush()) {
        m_lastError = file.errorString();
        return false;
    }

    m_lastError.clear();
    return true;
}

std::vector<LogEntry> EventLog::tail(std::size_t count) const
{
    std::lock_guard<std::mutex> lock(m_mutex);

    std::vector<LogEntry> entries;
    if (count == 0) {
        return entries;
    }

    QFile file(m_path);
    if (!file.open(QIODevice::ReadOnly)) {
        return entries;
    }

    std::deque<QByteArray> window;
    while (!file.atEnd()) {
        window.push_back(file.readLine());
        if (window.size() > count) {
            window.pop_front();
        }
    }

    entries.reserve(window.size());
    for (const auto &line : window) {
        entries.push_back(parseLine(line));
    }
    return entries;
}

QString EventLog::lastError() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_lastError;
}

const QString &EventLog::path() const
{
    return m_path;
}

} // namespace pagewatch
