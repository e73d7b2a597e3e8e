#include <QCoreApplication>
#include <QDebug>

#include <exception>
#include <memory>

#include <nlohmann/json.hpp>

#include "daemon/pagewatch_daemon.hpp"
#include "common/logging.hpp"
#include "common/monitor_config.hpp"

int main(int argc, char *argv[])
{
    QCoreApplication app(argc, argv);

    QCoreApplication::setApplicationName(QStringLiteral("pagewatch-daemon"));
    qInfo() << "Pagewatch daemon starting...";

    bool trace = qEnvironmentVariableIntValue("PAGEWATCH_TRACE") == 1;
    pagewatch::ConfigOverrides overrides;
    const QStringList args = QCoreApplication::arguments();
    for (int i = 1; i < args.size(); ++i) {
        const QString &arg = args.at(i);
        if (arg == QStringLiteral("--trace")) {
            trace = true;
        } else if (arg == QStringLiteral("--data-dir") && i + 1 < args.size()) {
            overrides.dataDir = args.at(++i);
        }
    }
    pagewatch::logging::initLogging(QStringLiteral("pagewatch-daemon"), trace);

    const pagewatch::MonitorConfig config = pagewatch::resolveMonitorConfig(overrides);
    pagewatch::applyLoggingConfig(config);

    // The daemon lives for the lifetime of the process.
    std::unique_ptr<pagewatch::PagewatchDaemon> daemon;
    try {
        daemon = std::make_unique<pagewatch::PagewatchDaemon>(config);
    } catch (const std::exception &ex) {
        qCritical() << "Pagewatch: cannot start:" << ex.what();
        PWLOG_ERROR(QStringLiteral("main"),
                    QStringLiteral("main"),
                    QStringLiteral("daemon_start_failed"),
                    QStringLiteral("store_unavailable"),
                    QStringLiteral("exit"),
                    pagewatch::logging::defaultWho(),
                    QString(),
                    (nlohmann::json{{"error", ex.what()}}));
        return 1;
    }
    daemon->start();

    return app.exec();
}
