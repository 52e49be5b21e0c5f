#include <QCoreApplication>

#include "AuditLogger.h"
#include "Logger.h"

#define CATCH_CONFIG_RUNNER
#include <catch2/catch.hpp>

static void silentHandler(QtMsgType, const QMessageLogContext&, const QString&)
{
}

int main(int argc, char* argv[])
{
    using namespace Catch::clara;

    // QProcess and QStandardPaths want an application instance
    QCoreApplication app(argc, argv);
    QCoreApplication::setOrganizationName("ssh-keyreg-tests");
    QCoreApplication::setApplicationName("ssh-keyreg-tests");

    Catch::Session session;
    bool showLog = false;

    auto cli = session.cli()
        | Opt(showLog)
             ["--show-log"]
             ("Show ssh-keyreg log output");

    session.cli(cli);

    const int ret = session.applyCommandLine(argc, argv);
    if (ret) {
        return ret;
    }

    // Tests that check the audit trail turn it on with their own directory
    AuditLogger::setEnabled(false);

    if (showLog) {
        Logger::install("ssh-keyreg-tests");
        Logger::setLogLevel(2);
        Logger::setColorEnabled(false);
    } else {
        qInstallMessageHandler(silentHandler);
    }

    return session.run();
}
