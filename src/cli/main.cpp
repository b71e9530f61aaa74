#include <csignal>
#include <vector>

#include <QCoreApplication>

#include "cli/BackupCli.hpp"
#include "common/logging.hpp"

#include <nlohmann/json.hpp>

namespace {

volatile std::sig_atomic_t g_interrupted = 0;

void onInterrupt(int)
{
    g_interrupted = 1;
}

} // namespace

int main(int argc, char *argv[])
{
    QCoreApplication app(argc, argv);

    bool trace = qEnvironmentVariableIntValue("DRVKEEP_TRACE") == 1;
    QStringList filteredArgs;
    filteredArgs.reserve(argc);
    for (int i = 0; i < argc; ++i) {
        const QString arg = QString::fromLocal8Bit(argv[i]);
        if (arg == QStringLiteral("--trace")) {
            trace = true;
            continue;
        }
        filteredArgs.push_back(arg);
    }
    drvkeep::logging::initLogging(QStringLiteral("drvkeep"), trace);
    DKLOG_INFO(QStringLiteral("main"),
               QStringLiteral("main"),
               QStringLiteral("backup_cli_start"),
               QStringLiteral("user_invocation"),
               QStringLiteral("cli"),
               drvkeep::logging::defaultWho(),
               QString(),
               (nlohmann::json{{"args", filteredArgs.size()}}));

    std::signal(SIGINT, onInterrupt);
    std::signal(SIGTERM, onInterrupt);

    drvkeep::BackupCli cli;
    cli.setCancellationCheck([] { return g_interrupted != 0; });

    std::vector<QByteArray> localArgs;
    std::vector<char *> rawArgs;
    for (const QString &arg : filteredArgs) {
        localArgs.push_back(arg.toLocal8Bit());
    }
    for (auto &arg : localArgs) {
        rawArgs.push_back(arg.data());
    }
    return cli.run(static_cast<int>(rawArgs.size()), rawArgs.data());
}
