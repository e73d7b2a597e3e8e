#include "cli/MonitorCli.hpp"

#include <iostream>

#include <nlohmann/json.hpp>

#include "common/json_utils.hpp"
#include "common/logging.hpp"
#include "daemon/check_cycle.hpp"
#include "daemon/event_log.hpp"
#include "daemon/snapshot_store.hpp"
#include "daemon/target_registry.hpp"

namespace pagewatch {

namespace {

constexpr int kExitOk = 0;
constexpr int kExitFailure = 1;
constexpr int kExitUsage = 2;
constexpr int kDefaultTail = 20;

QString usageText()
{
    return QStringLiteral(
        "Usage:\n"
        "  pagewatch check [--format text|json]\n"
        "  pagewatch add --url URL [--keywords a,b,c]\n"
        "  pagewatch remove --url URL\n"
        "  pagewatch list [--format text|json]\n"
        "  pagewatch log [--tail N]\n"
        "\n"
        "Global options:\n"
        "  --data-dir PATH  --sites PATH  --store files|sqlite\n"
        "  --workers N  --timeout SECONDS  --trace\n");
}

QString getArgValue(const QStringList &args, const QString &key)
{
    const int idx = args.indexOf(key);
    if (idx < 0 || idx + 1 >= args.size()) {
        return {};
    }
    return args.at(idx + 1);
}

QString getFormat(const QStringList &args)
{
    const QString value = getArgValue(args, QStringLiteral("--format"));
    if (value.isEmpty()) {
        return QStringLiteral("text");
    }
    return value.toLower();
}

// Removes "--key value" from args and returns the value.
std::optional<QString> takeOption(QStringList &args, const QString &key)
{
    const int idx = args.indexOf(key);
    if (idx < 0) {
        return std::nullopt;
    }
    if (idx + 1 >= args.size()) {
        args.removeAt(idx);
        return QString();
    }
    const QString value = args.at(idx + 1);
    args.removeAt(idx + 1);
    args.removeAt(idx);
    return value;
}

std::vector<std::string> splitKeywords(const QString &value)
{
    std::vector<std::string> keywords;
    const QStringList parts = value.split(QLatin1Char(','), Qt::SkipEmptyParts);
    for (const QString &part : parts) {
        const QString keyword = part.trimmed();
        if (!keyword.isEmpty()) {
            keywords.push_back(keyword.toStdString());
        }
    }
    return keywords;
}

void renderResultsText(const std::vector<CheckResult> &results)
{
    if (results.empty()) {
        std::cout << "No targets configured.\n";
        return;
    }
    for (const auto &result : results) {
        std::cout << toStatusString(result.status) << "  " << result.url;
        if (result.status == CheckStatus::KeywordChange) {
            std::cout << "  keywords:";
            for (const auto &keyword : result.matchedKeywords) {
                std::cout << " " << keyword;
            }
        }
        if (result.details.has_value()) {
            std::cout << "  (" << *result.details << ")";
        }
        std::cout << "\n";
    }
}

void renderTargetsText(const std::vector<Target> &targets)
{
    if (targets.empty()) {
        std::cout << "No targets configured.\n";
        return;
    }
    for (const auto &target : targets) {
        std::cout << target.url;
        if (!target.keywords.empty()) {
            std::cout << "  [";
            for (std::size_t i = 0; i < target.keywords.size(); ++i) {
                std::cout << (i ? ", " : "") << target.keywords[i];
            }
            std::cout << "]";
        }
        std::cout << "\n";
    }
}

} // namespace

MonitorCli::MonitorCli() = default;

MonitorCli::MonitorCli(std::unique_ptr<PageFetcher> fetcher)
    : m_fetcher(std::move(fetcher))
{
}

MonitorCli::~MonitorCli() = default;

bool MonitorCli::parseGlobalOptions(QStringList &args, ConfigOverrides &overrides) const
{
    if (const auto value = takeOption(args, QStringLiteral("--data-dir"))) {
        if (value->isEmpty()) {
            return false;
        }
        overrides.dataDir = *value;
    }
    if (const auto value = takeOption(args, QStringLiteral("--sites"))) {
        if (value->isEmpty()) {
            return false;
        }
        overrides.sitesFile = *value;
    }
    if (const auto value = takeOption(args, QStringLiteral("--store"))) {
        const auto backend = parseStoreBackend(*value);
        if (!backend.has_value()) {
            return false;
        }
        overrides.storeBackend = *backend;
    }
    if (const auto value = takeOption(args, QStringLiteral("--workers"))) {
        bool ok = false;
        const int workers = value->toInt(&ok);
        if (!ok || workers <= 0 || workers > kMaxWorkers) {
            return false;
        }
        overrides.workers = workers;
    }
    if (const auto value = takeOption(args, QStringLiteral("--timeout"))) {
        bool ok = false;
        const int seconds = value->toInt(&ok);
        if (!ok || seconds <= 0 || seconds > kMaxTimeoutSeconds) {
            return false;
        }
        overrides.timeoutSeconds = seconds;
    }
    return true;
}

int MonitorCli::run(int argc, char *argv[])
{
    // CLI entry: parse the subcommand and delegate to its handler.
    QStringList args;
    args.reserve(argc);
    for (int i = 0; i < argc; ++i) {
        args.push_back(QString::fromLocal8Bit(argv[i]));
    }
    args.removeAll(QStringLiteral("--trace"));

    ConfigOverrides overrides;
    if (!parseGlobalOptions(args, overrides)) {
        std::cerr << usageText().toStdString();
        return kExitUsage;
    }

    if (args.size() < 2) {
        std::cerr << usageText().toStdString();
        return kExitUsage;
    }

    m_config = resolveMonitorConfig(overrides);
    applyLoggingConfig(m_config);

    const QString command = args.at(1);
    PWLOG_INFO(QStringLiteral("MonitorCli"),
               QStringLiteral("run"),
               QStringLiteral("cli_command"),
               QStringLiteral("user_invocation"),
               QStringLiteral("cli"),
               logging::defaultWho(),
               QString(),
               (nlohmann::json{{"command", command.toStdString()}}));
    if (command == QStringLiteral("check")) {
        return runCheck(args);
    }
    if (command == QStringLiteral("add")) {
        return runAdd(args);
    }
    if (command == QStringLiteral("remove")) {
        return runRemove(args);
    }
    if (command == QStringLiteral("list")) {
        return runList(args);
    }
    if (command == QStringLiteral("log")) {
        return runLog(args);
    }

    std::cerr << usageText().toStdString();
    return kExitUsage;
}

int MonitorCli::runCheck(const QStringList &args)
{
    const QString format = getFormat(args);
    if (format != QStringLiteral("text") && format != QStringLiteral("json")) {
        std::cerr << "Invalid format. Use text or json." << std::endl;
        return kExitUsage;
    }

    if (!ensureDirectories(m_config)) {
        std::cerr << "Cannot create data directories under "
                  << m_config.dataDir.toStdString() << std::endl;
        return kExitFailure;
    }

    TargetRegistry registry(m_config.sitesFile);
    registry.ensureExists();

    std::unique_ptr<SnapshotStore> store;
    try {
        store = makeSnapshotStore(m_config);
    } catch (const StorageError &ex) {
        std::cerr << "Cannot open snapshot store: " << ex.what() << std::endl;
        return kExitFailure;
    }

    if (!m_fetcher) {
        m_fetcher = std::make_unique<HttpPageFetcher>(
            m_config.userAgent,
            std::chrono::duration_cast<std::chrono::milliseconds>(m_config.fetchTimeout));
    }
    EventLog eventLog(m_config.eventLogFile);

    CycleOptions options;
    options.workers = m_config.workers;
    options.lockPath = m_config.cycleLockPath();
    CheckCycle cycle(registry, *m_fetcher, *store, eventLog, options);
    const CycleReport report = cycle.runCycle();

    for (const auto &warning : report.diagnostics.warnings) {
        std::cerr << "warning: " << warning << "\n";
    }
    if (report.diagnostics.fatalError.has_value()) {
        std::cerr << "error: " << *report.diagnostics.fatalError << std::endl;
        return kExitFailure;
    }

    if (format == QStringLiteral("json")) {
        std::cout << nlohmann::json(report.results).dump(2) << std::endl;
    } else {
        renderResultsText(report.results);
    }
    return kExitOk;
}

int MonitorCli::runAdd(const QStringList &args)
{
    const QString url = getArgValue(args, QStringLiteral("--url")).trimmed();
    if (url.isEmpty()) {
        std::cerr << "URL cannot be empty" << std::endl;
        return kExitUsage;
    }
    const auto keywords = splitKeywords(getArgValue(args, QStringLiteral("--keywords")));

    if (!ensureDirectories(m_config)) {
        std::cerr << "Cannot create data directories under "
                  << m_config.dataDir.toStdString() << std::endl;
        return kExitFailure;
    }

    TargetRegistry registry(m_config.sitesFile);
    try {
        registry.addTarget(url.toStdString(), keywords);
    } catch (const std::exception &ex) {
        std::cerr << "Cannot add site: " << ex.what() << std::endl;
        return kExitFailure;
    }

    std::cout << "Site added: " << url.toStdString() << std::endl;
    return kExitOk;
}

int MonitorCli::runRemove(const QStringList &args)
{
    const QString url = getArgValue(args, QStringLiteral("--url")).trimmed();
    if (url.isEmpty()) {
        std::cerr << usageText().toStdString();
        return kExitUsage;
    }

    TargetRegistry registry(m_config.sitesFile);
    try {
        if (!registry.removeTarget(url.toStdString())) {
            std::cerr << "No such site: " << url.toStdString() << std::endl;
            return kExitFailure;
        }
    } catch (const std::exception &ex) {
        std::cerr << "Cannot remove site: " << ex.what() << std::endl;
        return kExitFailure;
    }

    std::cout << "Site removed: " << url.toStdString() << std::endl;
    return kExitOk;
}

int MonitorCli::runList(const QStringList &args)
{
    const QString format = getFormat(args);
    if (format != QStringLiteral("text") && format != QStringLiteral("json")) {
        std::cerr << "Invalid format. Use text or json." << std::endl;
        return kExitUsage;
    }

    TargetRegistry registry(m_config.sitesFile);
    const RegistryLoadResult loaded = registry.load();
    if (loaded.ioError.has_value()) {
        std::cerr << "error: " << *loaded.ioError << std::endl;
        return kExitFailure;
    }
    for (const auto &warning : loaded.warnings) {
        std::cerr << "warning: " << warning << "\n";
    }

    if (format == QStringLiteral("json")) {
        std::cout << nlohmann::json(loaded.targets).dump(2) << std::endl;
    } else {
        renderTargetsText(loaded.targets);
    }
    return kExitOk;
}

int MonitorCli::runLog(const QStringList &args)
{
    int count = kDefaultTail;
    const QString tail = getArgValue(args, QStringLiteral("--tail"));
    if (!tail.isEmpty()) {
        bool ok = false;
        count = tail.toInt(&ok);
        if (!ok || count <= 0) {
            std::cerr << "Invalid --tail value." << std::endl;
            return kExitUsage;
        }
    }

    const EventLog eventLog(m_config.eventLogFile);
    for (const auto &entry : eventLog.tail(static_cast<std::size_t>(count))) {
        if (entry.timestamp.empty()) {
            std::cout << entry.message << "\n";
        } else {
            std::cout << "[" << entry.timestamp << "] " << entry.message << "\n";
        }
    }
    std::cout.flush();
    return kExitOk;
}

} // namespace pagewatch
