#include <QCoreApplication>

#include "cli/MonitorCli.hpp"
#include "common/logging.hpp"

#include <nlohmann/json.hpp>

int main(int argc, char *argv[])
{
    QCoreApplication app(argc, argv);
    QCoreApplication::setApplicationName(QStringLiteral("pagewatch"));

    bool trace = qEnvironmentVariableIntValue("PAGEWATCH_TRACE") == 1;
    for (int i = 1; i < argc; ++i) {
        if (QString::fromLocal8Bit(argv[i]) == QStringLiteral("--trace")) {
            trace = true;
        }
    }
    pagewatch::logging::initLogging(QStringLiteral("pagewatch"), trace);
    PWLOG_INFO(QStringLiteral("main"),
               QStringLiteral("main"),
               QStringLiteral("cli_start"),
               QStringLiteral("user_invocation"),
               QStringLiteral("cli"),
               pagewatch::logging::defaultWho(),
               QString(),
               (nlohmann::json{{"args", argc}}));

    // CLI entry point: delegate to MonitorCli for argument parsing and output.
    pagewatch::MonitorCli cli;
    return cli.run(argc, argv);
}
