#include "daemon/check_cycle.hpp"

#include <algorithm>
#include <exception>
#include <map>
#include <memory>
#include <stdexcept>

#include <QElapsedTimer>
#include <QLockFile>
#include <QThreadPool>
#include <QUuid>

#include "common/json_utils.hpp"
#include "common/logging.hpp"
#include "daemon/change_classifier.hpp"
#include "daemon/text_extractor.hpp"

namespace pagewatch {

namespace {

std::string joinKeywords(const std::vector<std::string> &keywords)
{
    std::string joined;
    for (const auto &keyword : keywords) {
        if (!joined.empty()) {
            joined += ", ";
        }
        joined += keyword;
    }
    return joined;
}

CheckResult errorResult(const std::string &url, const std::string &details)
{
    CheckResult result;
    result.url = url;
    result.status = CheckStatus::Error;
    result.details = details;
    return result;
}

} // namespace

std::string eventMessage(const CheckResult &result)
{
    switch (result.status) {
    case CheckStatus::Error:
        return "ERROR | " + result.url + " | " + result.details.value_or("unknown error");
    case CheckStatus::Initialized:
        return "INIT | " + result.url;
    case CheckStatus::NoChange:
        return "NO CHANGE | " + result.url;
    case CheckStatus::KeywordChange:
        return "KEYWORD CHANGE | " + result.url + " | keywords: ["
            + joinKeywords(result.matchedKeywords) + "]";
    case CheckStatus::ChangedButNoKeywords:
        return "CHANGE BUT NO KEYWORDS | " + result.url;
    }
    return "ERROR | " + result.url + " | unknown status";
}

CheckCycle::CheckCycle(TargetRegistry &registry,
                       const PageFetcher &fetcher,
                       SnapshotStore &store,
                       EventLog &eventLog,
                       CycleOptions options)
    : m_registry(registry)
    , m_fetcher(fetcher)
    , m_store(store)
    , m_eventLog(eventLog)
    , m_options(std::move(options))
{
}

std::vector<CheckResult> CheckCycle::runCheck()
{
    return runCycle().results;
}

CycleDiagnostics CheckCycle::lastDiagnostics() const
{
    std::lock_guard<std::mutex> lock(m_diagnosticsMutex);
    return m_last;
}

CycleReport CheckCycle::runCycle()
{
    CycleReport report;
    report.diagnostics.cycleId = QUuid::createUuid().toString(QUuid::WithoutBraces).toStdString();

    bool expected = false;
    if (!m_running.compare_exchange_strong(expected, true)) {
        report.diagnostics.fatalError = "a check cycle is already running in this process";
        PWLOG_ERROR(QStringLiteral("CheckCycle"),
                    QStringLiteral("runCycle"),
                    QStringLiteral("cycle_rejected"),
                    QStringLiteral("overlapping_cycle"),
                    QStringLiteral("in_process_guard"),
                    logging::defaultWho(),
                    QString::fromStdString(report.diagnostics.cycleId),
                    nlohmann::json::object());
        return report;
    }

    m_cycleId = QString::fromStdString(report.diagnostics.cycleId);
    logging::CorrelationScope corrScope(m_cycleId);
    {
        std::lock_guard<std::mutex> lock(m_diagnosticsMutex);
        m_current = CycleDiagnostics{};
        m_current.cycleId = report.diagnostics.cycleId;
        m_eventLogWarned = false;
    }

    QElapsedTimer elapsed;
    elapsed.start();

    try {
        std::unique_ptr<QLockFile> cycleLock;
        if (!m_options.lockPath.isEmpty()) {
            cycleLock = std::make_unique<QLockFile>(m_options.lockPath);
            // Cycles can outlast any fixed age; only a dead owner frees the lock.
            cycleLock->setStaleLockTime(0);
            if (!cycleLock->tryLock(0)) {
                throw std::runtime_error("another check cycle holds "
                                         + m_options.lockPath.toStdString());
            }
        }

        const RegistryLoadResult registry = m_registry.load();
        if (registry.ioError.has_value()) {
            throw std::runtime_error(*registry.ioError);
        }
        for (const auto &warning : registry.warnings) {
            addWarning("sites config: " + warning);
        }

        PWLOG_INFO(QStringLiteral("CheckCycle"),
                   QStringLiteral("runCycle"),
                   QStringLiteral("cycle_started"),
                   QStringLiteral("run_check"),
                   m_options.workers > 1 ? QStringLiteral("thread_pool") : QStringLiteral("sequential"),
                   logging::defaultWho(),
                   QString(),
                   (nlohmann::json{{"targets", registry.targets.size()},
                                   {"workers", m_options.workers}}));

        report.results = runTargets(registry.targets);
    } catch (const std::exception &ex) {
        report.results.clear();
        std::lock_guard<std::mutex> lock(m_diagnosticsMutex);
        m_current.fatalError = ex.what();
    }

    {
        std::lock_guard<std::mutex> lock(m_diagnosticsMutex);
        report.diagnostics = m_current;
        m_last = m_current;
    }

    std::map<std::string, int> counts;
    for (const auto &result : report.results) {
        counts[toStatusString(result.status)]++;
    }

    if (report.diagnostics.fatalError.has_value()) {
        PWLOG_ERROR(QStringLiteral("CheckCycle"),
                    QStringLiteral("runCycle"),
                    QStringLiteral("cycle_failed"),
                    QStringLiteral("fatal_condition"),
                    QStringLiteral("empty_results"),
                    logging::defaultWho(),
                    QString(),
                    (nlohmann::json{{"error", *report.diagnostics.fatalError},
                                    {"elapsedMs", elapsed.elapsed()}}));
    } else {
        PWLOG_INFO(QStringLiteral("CheckCycle"),
                   QStringLiteral("runCycle"),
                   QStringLiteral("cycle_finished"),
                   QStringLiteral("run_check"),
                   QStringLiteral("aggregate_results"),
                   logging::defaultWho(),
                   QString(),
                   (nlohmann::json{{"statusCounts", counts},
                                   {"warnings", report.diagnostics.warnings.size()},
                                   {"elapsedMs", elapsed.elapsed()}}));
    }

    m_running.store(false);
    return report;
}

std::vector<CheckResult> CheckCycle::runTargets(const std::vector<Target> &targets)
{
    // Every target owns its slot, so completion order cannot reorder results.
    std::vector<CheckResult> results(targets.size());

    const int workers = std::min<int>(m_options.workers, static_cast<int>(targets.size()));
    if (workers <= 1) {
        for (std::size_t i = 0; i < targets.size(); ++i) {
            results[i] = runTarget(targets[i]);
        }
        return results;
    }

    QThreadPool pool;
    pool.setMaxThreadCount(workers);
    const QString cycleId = m_cycleId;
    for (std::size_t i = 0; i < targets.size(); ++i) {
        pool.start([this, &targets, &results, i, cycleId]() {
            logging::CorrelationScope corrScope(cycleId);
            results[i] = runTarget(targets[i]);
        });
    }
    pool.waitForDone();
    return results;
}

CheckResult CheckCycle::runTarget(const Target &target)
{
    try {
        return processTarget(target);
    } catch (const std::exception &ex) {
        PWLOG_ERROR(QStringLiteral("CheckCycle"),
                    QStringLiteral("runTarget"),
                    QStringLiteral("target_failed"),
                    QStringLiteral("unexpected_exception"),
                    QStringLiteral("contain_to_target"),
                    logging::defaultWho(),
                    QString(),
                    (nlohmann::json{{"url", target.url}, {"error", ex.what()}}));
        return failTarget(target, std::string("internal: ") + ex.what());
    }
}

CheckResult CheckCycle::processTarget(const Target &target)
{
    const FetchResult fetched = m_fetcher.fetch(target.url);
    if (!fetched.ok) {
        return failTarget(target, fetched.error);
    }

    const std::string text = extractVisibleText(fetched.body);
    const std::string key = identityKey(target.url);

    std::optional<Snapshot> prior;
    try {
        prior = m_store.load(key);
    } catch (const StorageError &ex) {
        return failTarget(target, std::string("storage: ") + ex.what());
    }

    Classification classification = ChangeClassifier::classify(target, text, prior);

    if (classification.action.kind == SnapshotActionKind::Write) {
        try {
            m_store.save(key, classification.action.text);
        } catch (const StorageError &ex) {
            // The new state is not durable, so it is not reported as such.
            return failTarget(target, std::string("storage: ") + ex.what());
        }
    }

    PWLOG_DEBUG(QStringLiteral("CheckCycle"),
                QStringLiteral("processTarget"),
                QStringLiteral("target_classified"),
                QStringLiteral("run_check"),
                QStringLiteral("change_classifier"),
                logging::defaultWho(),
                QString(),
                (nlohmann::json{{"url", target.url},
                                {"key", key},
                                {"status", classification.result.status},
                                {"textBytes", text.size()},
                                {"contentType", fetched.contentType}}));

    appendEvent(eventMessage(classification.result));
    return classification.result;
}

CheckResult CheckCycle::failTarget(const Target &target, const std::string &cause)
{
    CheckResult result = errorResult(target.url, cause);
    appendEvent(eventMessage(result));
    return result;
}

void CheckCycle::appendEvent(const std::string &message)
{
    if (m_eventLog.append(message)) {
        return;
    }

    const std::string warning = "event log unavailable at " + m_eventLog.path().toStdString()
        + ": " + m_eventLog.lastError().toStdString();
    {
        std::lock_guard<std::mutex> lock(m_diagnosticsMutex);
        if (m_eventLogWarned) {
            return;
        }
        m_eventLogWarned = true;
    }
    addWarning(warning);
}

void CheckCycle::addWarning(const std::string &warning)
{
    PWLOG_WARN(QStringLiteral("CheckCycle"),
               QStringLiteral("addWarning"),
               QStringLiteral("cycle_degraded"),
               QStringLiteral("tolerated_failure"),
               QStringLiteral("continue_cycle"),
               logging::defaultWho(),
               QString(),
               (nlohmann::json{{"warning", warning}}));

    std::lock_guard<std::mutex> lock(m_diagnosticsMutex);
    m_current.warnings.push_back(warning);
}

} // namespace pagewatch
