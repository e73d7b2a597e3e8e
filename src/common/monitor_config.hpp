#pragma once

#include <chrono>
#include <optional>
#include <string>

#include <QString>

#include "common/enums.hpp"
#include "common/logging.hpp"

namespace pagewatch {

// Upper bounds for every configuration layer.
constexpr int kMaxWorkers = 64;
constexpr int kMaxTimeoutSeconds = 3600;
constexpr int kMaxIntervalMinutes = 7 * 24 * 60;

constexpr const char *kDefaultUserAgent =
    "Mozilla/5.0 (X11; Linux x86_64) AppleWebKit/537.36 (KHTML, like Gecko) "
    "Chrome/120.0 Safari/537.36 Pagewatch/1.0";

/**
 * MonitorConfig holds every location and tunable a cycle needs. It is
 * resolved once at process start and handed to the components explicitly;
 * nothing below main() reads the environment for paths.
 */
struct MonitorConfig {
    QString dataDir;
    QString sitesFile;
    QString snapshotDir;
    QString eventLogFile;

    StoreBackend storeBackend = StoreBackend::Files;
    std::chrono::seconds fetchTimeout{10};
    std::string userAgent = kDefaultUserAgent;
    int workers = 1;
    std::chrono::minutes checkInterval{30};
    logging::LogLevel logLevel = logging::LogLevel::Info;

    // Sqlite backend database file, inside snapshotDir.
    QString sqlitePath() const;
    // Cross-process cycle lock, inside dataDir.
    QString cycleLockPath() const;
    // Diagnostic logs follow the data directory.
    QString logsDir() const;
};

// Command-line values; they win over settings.json and the environment.
struct ConfigOverrides {
    std::optional<QString> dataDir;
    std::optional<QString> sitesFile;
    std::optional<StoreBackend> storeBackend;
    std::optional<int> workers;
    std::optional<int> timeoutSeconds;
};

// Defaults -> <dataDir>/settings.json -> PAGEWATCH_* environment -> overrides.
// Invalid values keep the previous layer's value and are logged at WARN.
MonitorConfig resolveMonitorConfig(const ConfigOverrides &overrides = {});

// Points diagnostic logging at logsDir() with the configured level.
void applyLoggingConfig(const MonitorConfig &config);

// Creates the data and snapshot directories. Returns false on failure.
bool ensureDirectories(const MonitorConfig &config);

std::optional<StoreBackend> parseStoreBackend(const QString &value);

} // namespace pagewatch
