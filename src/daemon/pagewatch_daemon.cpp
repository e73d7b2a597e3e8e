#include "daemon/pagewatch_daemon.hpp"

#include <chrono>

#include <QTimer>
#include <QDebug>

#include "common/logging.hpp"
#include "common/json_utils.hpp"
#include "common/pagewatch_version.hpp"

namespace pagewatch {

namespace {

constexpr int kFatalWarnThreshold = 3;

} // namespace

PagewatchDaemon::PagewatchDaemon(MonitorConfig config, QObject *parent)
    : QObject(parent)
    , m_config(std::move(config))
{
    if (!ensureDirectories(m_config)) {
        qWarning() << "Pagewatch: could not create data directories under" << m_config.dataDir;
    }

    m_registry = std::make_unique<TargetRegistry>(m_config.sitesFile);
    if (!m_registry->ensureExists()) {
        qWarning() << "Pagewatch: could not create" << m_config.sitesFile;
    }

    m_fetcher = std::make_unique<HttpPageFetcher>(
        m_config.userAgent,
        std::chrono::duration_cast<std::chrono::milliseconds>(m_config.fetchTimeout));
    m_store = makeSnapshotStore(m_config);
    m_eventLog = std::make_unique<EventLog>(m_config.eventLogFile);

    CycleOptions options;
    options.workers = m_config.workers;
    options.lockPath = m_config.cycleLockPath();
    m_cycle = std::make_unique<CheckCycle>(*m_registry, *m_fetcher, *m_store, *m_eventLog,
                                           options);
}

PagewatchDaemon::~PagewatchDaemon() = default;

void PagewatchDaemon::start()
{
    qInfo() << "Pagewatch: daemon starting (version" << PAGEWATCH_VERSION << ")";

    const std::chrono::milliseconds interval = m_config.checkInterval;

    PWLOG_INFO(QStringLiteral("PagewatchDaemon"),
               QStringLiteral("start"),
               QStringLiteral("daemon_start"),
               QStringLiteral("scheduled_monitoring"),
               QStringLiteral("qtimer"),
               logging::defaultWho(),
               QString(),
               (nlohmann::json{{"intervalMs", interval.count()},
                               {"sitesFile", m_config.sitesFile.toStdString()},
                               {"store", toStoreBackendString(m_config.storeBackend)}}));

    auto *timer = new QTimer(this);
    timer->setInterval(interval);
    connect(timer, &QTimer::timeout, this, &PagewatchDaemon::runCheckCycle);
    timer->start();

    runCheckCycle();
}

CycleReport PagewatchDaemon::lastReport() const
{
    return m_lastReport;
}

void PagewatchDaemon::runCheckCycle()
{
    m_lastReport = m_cycle->runCycle();

    for (const auto &warning : m_lastReport.diagnostics.warnings) {
        qWarning() << "Pagewatch:" << QString::fromStdString(warning);
    }

    if (m_lastReport.diagnostics.fatalError.has_value()) {
        ++m_consecutiveFatal;
        qWarning() << "Pagewatch: check cycle failed:"
                   << QString::fromStdString(*m_lastReport.diagnostics.fatalError);
        if (m_consecutiveFatal == kFatalWarnThreshold) {
            qWarning() << "Pagewatch: check cycles failed" << kFatalWarnThreshold
                       << "times in a row; will keep retrying on schedule.";
        }
        return;
    }
    m_consecutiveFatal = 0;

    int changed = 0;
    for (const auto &result : m_lastReport.results) {
        if (result.status == CheckStatus::KeywordChange) {
            qInfo().noquote() << "Pagewatch: keyword change at"
                              << QString::fromStdString(result.url);
        }
        if (result.status == CheckStatus::KeywordChange
            || result.status == CheckStatus::ChangedButNoKeywords) {
            ++changed;
        }
    }
    qInfo() << "Pagewatch: cycle checked" << m_lastReport.results.size() << "targets,"
            << changed << "changed";
}

} // namespace pagewatch
