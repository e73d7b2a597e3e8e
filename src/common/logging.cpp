#include "common/logging.hpp"

#include <QCoreApplication>
#include <QDateTime>
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QThread>

#include <unistd.h>

#include <cstdio>
#include <mutex>

namespace pagewatch::logging {

namespace {

constexpr qint64 kMaxLogSizeBytes = 5 * 1024 * 1024;
// Rotated files kept beside the live one: <name>.1 (newest) .. <name>.3.
constexpr int kRotatedGenerations = 3;

std::mutex g_logMutex;
bool g_traceEnabled = false;
LogLevel g_minimumLevel = LogLevel::Info;
QString g_processName;
QString g_logsDir;

thread_local QString t_corrId;

QString homeLogsDir()
{
    const QString home = qEnvironmentVariable("HOME");
    if (home.isEmpty()) {
        return QStringLiteral(".local/share/pagewatch/logs");
    }
    return home + QStringLiteral("/.local/share/pagewatch/logs");
}

// Callers hold g_logMutex.
QString currentLogsDir()
{
    return g_logsDir.isEmpty() ? homeLogsDir() : g_logsDir;
}

QString levelToString(LogLevel level)
{
    switch (level) {
    case LogLevel::Debug:
        return QStringLiteral("DEBUG");
    case LogLevel::Info:
        return QStringLiteral("INFO");
    case LogLevel::Warn:
        return QStringLiteral("WARN");
    case LogLevel::Error:
        return QStringLiteral("ERROR");
    }
    return QStringLiteral("INFO");
}

void rotateIfNeeded(const QString &path)
{
    QFileInfo info(path);
    if (!info.exists() || info.size() < kMaxLogSizeBytes) {
        return;
    }

    const QString oldest = path + QStringLiteral(".%1").arg(kRotatedGenerations);
    QFile::remove(oldest);
    for (int generation = kRotatedGenerations - 1; generation >= 1; --generation) {
        QFile::rename(path + QStringLiteral(".%1").arg(generation),
                      path + QStringLiteral(".%1").arg(generation + 1));
    }
    QFile::rename(path, path + QStringLiteral(".1"));
}

void writeLine(const QString &dir, const QString &path, const QByteArray &line)
{
    QDir().mkpath(dir);
    rotateIfNeeded(path);

    QFile file(path);
    if (!file.open(QIODevice::WriteOnly | QIODevice::Append | QIODevice::Text)) {
        fprintf(stderr, "%s\n", line.constData());
        return;
    }

    file.write(line);
    file.write("\n");
}

QString threadIdString()
{
    return QStringLiteral("0x%1")
        .arg(reinterpret_cast<quintptr>(QThread::currentThreadId()), 0, 16);
}

} // namespace

void initLogging(const QString &processName, bool traceEnabled)
{
    std::lock_guard<std::mutex> lock(g_logMutex);
    g_processName = processName;
    g_traceEnabled = traceEnabled;
}

void configure(const QString &logsDir, LogLevel minimumLevel)
{
    std::lock_guard<std::mutex> lock(g_logMutex);
    g_logsDir = logsDir;
    g_minimumLevel = minimumLevel;
}

bool isTraceEnabled()
{
    std::lock_guard<std::mutex> lock(g_logMutex);
    return g_traceEnabled;
}

LogLevel minimumLevel()
{
    std::lock_guard<std::mutex> lock(g_logMutex);
    return g_minimumLevel;
}

QString logsDirPath()
{
    std::lock_guard<std::mutex> lock(g_logMutex);
    return currentLogsDir();
}

std::optional<LogLevel> parseLogLevel(const QString &value)
{
    const QString lowered = value.trimmed().toLower();
    if (lowered == QStringLiteral("debug")) {
        return LogLevel::Debug;
    }
    if (lowered == QStringLiteral("info")) {
        return LogLevel::Info;
    }
    if (lowered == QStringLiteral("warn") || lowered == QStringLiteral("warning")) {
        return LogLevel::Warn;
    }
    if (lowered == QStringLiteral("error")) {
        return LogLevel::Error;
    }
    return std::nullopt;
}

QString levelName(LogLevel level)
{
    return levelToString(level).toLower();
}

void setCorrelationId(const QString &corrId)
{
    t_corrId = corrId;
}

QString currentCorrelationId()
{
    return t_corrId;
}

CorrelationScope::CorrelationScope(const QString &corrId)
    : m_prev(t_corrId)
{
    t_corrId = corrId;
}

CorrelationScope::~CorrelationScope()
{
    t_corrId = m_prev;
}

QString defaultProcessName()
{
    {
        std::lock_guard<std::mutex> lock(g_logMutex);
        if (!g_processName.isEmpty()) {
            return g_processName;
        }
    }
    if (QCoreApplication::instance()) {
        const QString appName = QCoreApplication::applicationName();
        if (!appName.isEmpty()) {
            return appName;
        }
    }
    return QStringLiteral("pagewatch");
}

QString defaultWho()
{
    static const QString who = []() {
        char hostname[256] = {};
        if (gethostname(hostname, sizeof(hostname) - 1) != 0) {
            hostname[0] = '\0';
        }
        return QStringLiteral("host:%1,uid:%2")
            .arg(QString::fromUtf8(hostname))
            .arg(static_cast<int>(getuid()));
    }();
    return who;
}

void logEvent(LogLevel level,
              const QString &processName,
              const QString &component,
              const QString &where,
              const QString &what,
              const QString &why,
              const QString &how,
              const QString &who,
              const QString &correlationId,
              const nlohmann::json &context)
{
    const QString process = processName.isEmpty() ? defaultProcessName() : processName;
    const QString corr = correlationId.isEmpty() ? currentCorrelationId() : correlationId;

    std::lock_guard<std::mutex> lock(g_logMutex);
    if (!g_traceEnabled && level < g_minimumLevel) {
        return;
    }

    nlohmann::json payload = {
        {"ts", QDateTime::currentDateTimeUtc().toString(Qt::ISODateWithMs).toStdString()},
        {"level", levelToString(level).toStdString()},
        {"process", process.toStdString()},
        {"thread", threadIdString().toStdString()},
        {"component", component.toStdString()},
        {"where", where.toStdString()},
        {"what", what.toStdString()},
        {"why", why.toStdString()},
        {"how", how.toStdString()},
        {"who", who.toStdString()},
        {"corr", corr.toStdString()},
        {"context", context}
    };

    // Page text and URLs may carry invalid UTF-8; never let a log line throw.
    const QByteArray line = QByteArray::fromStdString(
        payload.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace));

    const QString dir = currentLogsDir();
    const QString mainPath = dir + QDir::separator() + process + QStringLiteral(".log");
    writeLine(dir, mainPath, line);
    if (g_traceEnabled) {
        writeLine(dir, dir + QDir::separator() + process + QStringLiteral("-trace.log"), line);
    }
}

} // namespace pagewatch::logging
