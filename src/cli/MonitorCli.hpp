#pragma once

#include <memory>
#include <optional>

#include <QString>
#include <QStringList>

#include "common/monitor_config.hpp"
#include "daemon/page_fetcher.hpp"

namespace pagewatch {

class MonitorCli
{
public:
    MonitorCli();
    // Uses the given fetcher for `check` instead of the HTTP one.
    explicit MonitorCli(std::unique_ptr<PageFetcher> fetcher);
    ~MonitorCli();

    // CLI dispatcher for checks and target management.
    // returns exit code
    int run(int argc, char *argv[]);

private:
    int runCheck(const QStringList &args);
    int runAdd(const QStringList &args);
    int runRemove(const QStringList &args);
    int runList(const QStringList &args);
    int runLog(const QStringList &args);

    // Consumes the global flags from args. Returns false on a malformed value.
    bool parseGlobalOptions(QStringList &args, ConfigOverrides &overrides) const;

    std::unique_ptr<PageFetcher> m_fetcher;
    MonitorConfig m_config;
};

} // namespace pagewatch
