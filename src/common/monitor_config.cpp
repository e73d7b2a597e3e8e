#include "common/monitor_config.hpp"

#include <QDir>
#include <QFile>
#include <QFileInfo>

#include <nlohmann/json.hpp>

#include "common/logging.hpp"

namespace pagewatch {

namespace {

void warnInvalid(const QString &source, const QString &key, const QString &value)
{
    PWLOG_WARN(QStringLiteral("MonitorConfig"),
               QStringLiteral("resolveMonitorConfig"),
               QStringLiteral("config_value_ignored"),
               QStringLiteral("invalid_value"),
               QStringLiteral("keep_previous"),
               logging::defaultWho(),
               QString(),
               (nlohmann::json{{"source", source.toStdString()},
                               {"key", key.toStdString()},
                               {"value", value.toStdString()}}));
}

QString defaultDataDir()
{
    const QString home = qEnvironmentVariable("HOME");
    if (home.isEmpty()) {
        return QStringLiteral(".local/share/pagewatch");
    }
    return home + QStringLiteral("/.local/share/pagewatch");
}

std::optional<int> parsePositive(const QString &value, int maxValue)
{
    bool ok = false;
    const int parsed = value.trimmed().toInt(&ok);
    if (!ok || parsed <= 0 || parsed > maxValue) {
        return std::nullopt;
    }
    return parsed;
}

// Tracks which derived paths were set explicitly so the defaults can follow
// dataDir and snapshotDir until then.
struct PathChoice {
    std::optional<QString> sitesFile;
    std::optional<QString> snapshotDir;
    std::optional<QString> eventLogFile;
};

void applySettingsFile(const QString &path, MonitorConfig &config, PathChoice &paths)
{
    QFile file(path);
    if (!file.exists()) {
        return;
    }
    if (!file.open(QIODevice::ReadOnly)) {
        warnInvalid(QStringLiteral("settings.json"), QStringLiteral("<file>"), path);
        return;
    }

    nlohmann::json settings;
    try {
        settings = nlohmann::json::parse(file.readAll().toStdString());
    } catch (const nlohmann::json::parse_error &) {
        warnInvalid(QStringLiteral("settings.json"), QStringLiteral("<parse>"), path);
        return;
    }
    if (!settings.is_object()) {
        warnInvalid(QStringLiteral("settings.json"), QStringLiteral("<root>"), path);
        return;
    }

    auto stringValue = [&settings](const char *key) -> std::optional<QString> {
        auto it = settings.find(key);
        if (it == settings.end() || !it->is_string()) {
            return std::nullopt;
        }
        return QString::fromStdString(it->get<std::string>());
    };

    if (const auto value = stringValue("sitesFile")) {
        paths.sitesFile = *value;
    }
    if (const auto value = stringValue("snapshotDir")) {
        paths.snapshotDir = *value;
    }
    if (const auto value = stringValue("eventLogFile")) {
        paths.eventLogFile = *value;
    }
    if (const auto value = stringValue("storeBackend")) {
        if (const auto backend = parseStoreBackend(*value)) {
            config.storeBackend = *backend;
        } else {
            warnInvalid(QStringLiteral("settings.json"), QStringLiteral("storeBackend"), *value);
        }
    }
    if (const auto value = stringValue("logLevel")) {
        if (const auto level = logging::parseLogLevel(*value)) {
            config.logLevel = *level;
        } else {
            warnInvalid(QStringLiteral("settings.json"), QStringLiteral("logLevel"), *value);
        }
    }
    if (const auto value = stringValue("userAgent")) {
        if (!value->trimmed().isEmpty()) {
            config.userAgent = value->toStdString();
        }
    }

    auto intValue = [&settings](const char *key) -> std::optional<int> {
        auto it = settings.find(key);
        if (it == settings.end() || !it->is_number_integer()) {
            return std::nullopt;
        }
        return it->get<int>();
    };

    if (const auto value = intValue("timeoutSeconds")) {
        if (*value > 0 && *value <= kMaxTimeoutSeconds) {
            config.fetchTimeout = std::chrono::seconds(*value);
        } else {
            warnInvalid(QStringLiteral("settings.json"), QStringLiteral("timeoutSeconds"),
                        QString::number(*value));
        }
    }
    if (const auto value = intValue("workers")) {
        if (*value > 0 && *value <= kMaxWorkers) {
            config.workers = *value;
        } else {
            warnInvalid(QStringLiteral("settings.json"), QStringLiteral("workers"),
                        QString::number(*value));
        }
    }
    if (const auto value = intValue("intervalMinutes")) {
        if (*value > 0 && *value <= kMaxIntervalMinutes) {
            config.checkInterval = std::chrono::minutes(*value);
        } else {
            warnInvalid(QStringLiteral("settings.json"), QStringLiteral("intervalMinutes"),
                        QString::number(*value));
        }
    }
}

void applyEnvironment(MonitorConfig &config, PathChoice &paths)
{
    const QString env = QStringLiteral("environment");

    const QString sites = qEnvironmentVariable("PAGEWATCH_SITES");
    if (!sites.isEmpty()) {
        paths.sitesFile = sites;
    }
    const QString snapshots = qEnvironmentVariable("PAGEWATCH_SNAPSHOTS");
    if (!snapshots.isEmpty()) {
        paths.snapshotDir = snapshots;
    }
    const QString eventLog = qEnvironmentVariable("PAGEWATCH_EVENT_LOG");
    if (!eventLog.isEmpty()) {
        paths.eventLogFile = eventLog;
    }

    const QString store = qEnvironmentVariable("PAGEWATCH_STORE");
    if (!store.isEmpty()) {
        if (const auto backend = parseStoreBackend(store)) {
            config.storeBackend = *backend;
        } else {
            warnInvalid(env, QStringLiteral("PAGEWATCH_STORE"), store);
        }
    }

    const QString logLevel = qEnvironmentVariable("PAGEWATCH_LOG_LEVEL");
    if (!logLevel.isEmpty()) {
        if (const auto level = logging::parseLogLevel(logLevel)) {
            config.logLevel = *level;
        } else {
            warnInvalid(env, QStringLiteral("PAGEWATCH_LOG_LEVEL"), logLevel);
        }
    }

    const QString timeout = qEnvironmentVariable("PAGEWATCH_TIMEOUT_SECONDS");
    if (!timeout.isEmpty()) {
        if (const auto value = parsePositive(timeout, kMaxTimeoutSeconds)) {
            config.fetchTimeout = std::chrono::seconds(*value);
        } else {
            warnInvalid(env, QStringLiteral("PAGEWATCH_TIMEOUT_SECONDS"), timeout);
        }
    }

    const QString workers = qEnvironmentVariable("PAGEWATCH_WORKERS");
    if (!workers.isEmpty()) {
        if (const auto value = parsePositive(workers, kMaxWorkers)) {
            config.workers = *value;
        } else {
            warnInvalid(env, QStringLiteral("PAGEWATCH_WORKERS"), workers);
        }
    }

    const QString interval = qEnvironmentVariable("PAGEWATCH_INTERVAL_MINUTES");
    if (!interval.isEmpty()) {
        if (const auto value = parsePositive(interval, kMaxIntervalMinutes)) {
            config.checkInterval = std::chrono::minutes(*value);
        } else {
            warnInvalid(env, QStringLiteral("PAGEWATCH_INTERVAL_MINUTES"), interval);
        }
    }
}

} // namespace

QString MonitorConfig::sqlitePath() const
{
    return snapshotDir + QStringLiteral("/snapshots.db");
}

QString MonitorConfig::cycleLockPath() const
{
    return dataDir + QStringLiteral("/cycle.lock");
}

QString MonitorConfig::logsDir() const
{
    return dataDir + QStringLiteral("/logs");
}

void applyLoggingConfig(const MonitorConfig &config)
{
    logging::configure(config.logsDir(), config.logLevel);
}

std::optional<StoreBackend> parseStoreBackend(const QString &value)
{
    const QString lowered = value.trimmed().toLower();
    if (lowered == QStringLiteral("files")) {
        return StoreBackend::Files;
    }
    if (lowered == QStringLiteral("sqlite")) {
        return StoreBackend::Sqlite;
    }
    return std::nullopt;
}

MonitorConfig resolveMonitorConfig(const ConfigOverrides &overrides)
{
    MonitorConfig config;

    config.dataDir = defaultDataDir();
    const QString envHome = qEnvironmentVariable("PAGEWATCH_HOME");
    if (!envHome.isEmpty()) {
        config.dataDir = envHome;
    }
    if (overrides.dataDir.has_value() && !overrides.dataDir->isEmpty()) {
        config.dataDir = *overrides.dataDir;
    }
    config.dataDir = QDir::cleanPath(config.dataDir);

    PathChoice paths;
    applySettingsFile(config.dataDir + QStringLiteral("/settings.json"), config, paths);
    applyEnvironment(config, paths);

    if (overrides.sitesFile.has_value() && !overrides.sitesFile->isEmpty()) {
        paths.sitesFile = *overrides.sitesFile;
    }
    if (overrides.storeBackend.has_value()) {
        config.storeBackend = *overrides.storeBackend;
    }
    if (overrides.workers.has_value()) {
        if (*overrides.workers > 0 && *overrides.workers <= kMaxWorkers) {
            config.workers = *overrides.workers;
        } else {
            warnInvalid(QStringLiteral("command line"), QStringLiteral("--workers"),
                        QString::number(*overrides.workers));
        }
    }
    if (overrides.timeoutSeconds.has_value()) {
        if (*overrides.timeoutSeconds > 0 && *overrides.timeoutSeconds <= kMaxTimeoutSeconds) {
            config.fetchTimeout = std::chrono::seconds(*overrides.timeoutSeconds);
        } else {
            warnInvalid(QStringLiteral("command line"), QStringLiteral("--timeout"),
                        QString::number(*overrides.timeoutSeconds));
        }
    }

    config.sitesFile = QDir::cleanPath(
        paths.sitesFile.value_or(config.dataDir + QStringLiteral("/sites.json")));
    config.snapshotDir = QDir::cleanPath(
        paths.snapshotDir.value_or(config.dataDir + QStringLiteral("/snapshots")));
    config.eventLogFile = QDir::cleanPath(
        paths.eventLogFile.value_or(config.snapshotDir + QStringLiteral("/log.txt")));

    PWLOG_DEBUG(QStringLiteral("MonitorConfig"),
                QStringLiteral("resolveMonitorConfig"),
                QStringLiteral("config_resolved"),
                QStringLiteral("startup"),
                QStringLiteral("defaults_settings_env_cli"),
                logging::defaultWho(),
                QString(),
                (nlohmann::json{{"dataDir", config.dataDir.toStdString()},
                                {"sitesFile", config.sitesFile.toStdString()},
                                {"snapshotDir", config.snapshotDir.toStdString()},
                                {"eventLogFile", config.eventLogFile.toStdString()},
                                {"workers", config.workers},
                                {"logLevel", logging::levelName(config.logLevel).toStdString()},
                                {"timeoutSeconds", config.fetchTimeout.count()}}));
    return config;
}

bool ensureDirectories(const MonitorConfig &config)
{
    QDir dir;
    bool ok = dir.mkpath(config.dataDir);
    ok = dir.mkpath(config.snapshotDir) && ok;
    const QString logDir = QFileInfo(config.eventLogFile).absolutePath();
    ok = dir.mkpath(logDir) && ok;
    const QString sitesDir = QFileInfo(config.sitesFile).absolutePath();
    ok = dir.mkpath(sitesDir) && ok;
    return ok;
}

} // namespace pagewatch
