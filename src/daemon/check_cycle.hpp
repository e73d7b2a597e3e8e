#pragma once

#include <atomic>
#include <mutex>
#include <string>
#include <vector>

#include <QString>

#include "common/models.hpp"
#include "daemon/event_log.hpp"
#include "daemon/page_fetcher.hpp"
#include "daemon/snapshot_store.hpp"
#include "daemon/target_registry.hpp"

namespace pagewatch {

struct CycleOptions {
    // Targets processed in parallel; 1 means strictly sequential.
    int workers = 1;
    // QLockFile guarding against a concurrent cycle in another process.
    // Empty disables the cross-process guard.
    QString lockPath;
};

struct CycleReport {
    std::vector<CheckResult> results;
    CycleDiagnostics diagnostics;
};

/**
 * CheckCycle runs one pass over the registry: fetch, extract, classify,
 * persist and log every target, returning one CheckResult per target in
 * registry order.
 *
 * Precondition: no two cycles run against the same snapshot store at the
 * same time. The scheduler is expected to serialize cycles; a re-entrant call
 * or a second process holding the cycle lock gets an empty report with
 * fatalError set instead of running.
 *
 * Failures stay inside their target. A failed fetch or a storage fault turns
 * that target's result into CheckStatus::Error and the cycle moves on. A
 * broken event log only adds a warning.
 */
class CheckCycle
{
public:
    CheckCycle(TargetRegistry &registry,
               const PageFetcher &fetcher,
               SnapshotStore &store,
               EventLog &eventLog,
               CycleOptions options = {});

    std::vector<CheckResult> runCheck();
    CycleReport runCycle();

    CycleDiagnostics lastDiagnostics() const;

private:
    CheckResult runTarget(const Target &target);
    CheckResult processTarget(const Target &target);
    CheckResult failTarget(const Target &target, const std::string &cause);
    void appendEvent(const std::string &message);
    void addWarning(const std::string &warning);
    std::vector<CheckResult> runTargets(const std::vector<Target> &targets);

    TargetRegistry &m_registry;
    const PageFetcher &m_fetcher;
    SnapshotStore &m_store;
    EventLog &m_eventLog;
    CycleOptions m_options;

    std::atomic<bool> m_running{false};
    QString m_cycleId;

    mutable std::mutex m_diagnosticsMutex;
    CycleDiagnostics m_current;
    CycleDiagnostics m_last;
    bool m_eventLogWarned = false;
};

// Event log line for a finished target, e.g. "NO CHANGE | https://example.com".
std::string eventMessage(const CheckResult &result);

} // namespace pagewatch
