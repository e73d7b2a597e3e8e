#pragma once

#include <memory>

#include <QObject>

#include "common/monitor_config.hpp"
#include "daemon/check_cycle.hpp"
#include "daemon/event_log.hpp"
#include "daemon/page_fetcher.hpp"
#include "daemon/snapshot_store.hpp"
#include "daemon/target_registry.hpp"

namespace pagewatch {

/**
 * PagewatchDaemon is the scheduler: it runs one check cycle on start and
 * then one per configured interval. Cycles run on the daemon's thread, so
 * they never overlap within the process; the cycle lock file keeps other
 * processes (a manual `pagewatch check`) out while one is running.
 *
 * It is designed to be owned from main() and driven by Qt's event loop.
 */
class PagewatchDaemon : public QObject
{
    Q_OBJECT
public:
    // Throws StorageError when the snapshot backend cannot be opened.
    explicit PagewatchDaemon(MonitorConfig config, QObject *parent = nullptr);
    ~PagewatchDaemon() override;

    void start();

    CycleReport lastReport() const;

private slots:
    void runCheckCycle();

private:
    MonitorConfig m_config;
    std::unique_ptr<TargetRegistry> m_registry;
    std::unique_ptr<PageFetcher> m_fetcher;
    std::unique_ptr<SnapshotStore> m_store;
    std::unique_ptr<EventLog> m_eventLog;
    std::unique_ptr<CheckCycle> m_cycle;
    CycleReport m_lastReport;
    int m_consecutiveFatal = 0;
};

} // namespace pagewatch
