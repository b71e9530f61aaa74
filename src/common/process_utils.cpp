#include "common/process_utils.hpp"

#include <QDir>
#include <QFile>
#include <QProcess>

#ifndef Q_OS_WIN
#include <unistd.h>
#endif

#include "common/logging.hpp"
#include <nlohmann/json.hpp>

namespace drvkeep {

ProcessResult runProcess(const QString &program, const QStringList &arguments,
                         int timeoutMs)
{
    ProcessResult result;

    QProcess process;
    process.start(program, arguments);
    if (!process.waitForStarted()) {
        result.errorString = process.errorString();
        DKLOG_WARN(QStringLiteral("ProcessUtils"),
                   QStringLiteral("runProcess"),
                   QStringLiteral("process_start_failed"),
                   QStringLiteral("launch_error"),
                   QStringLiteral("qprocess"),
                   logging::defaultWho(),
                   QString(),
                   (nlohmann::json{{"program", program.toStdString()},
                                   {"error", result.errorString.toStdString()}}));
        return result;
    }
    result.started = true;

    process.closeWriteChannel();

    if (!process.waitForFinished(timeoutMs)) {
        result.errorString = process.errorString();
        process.kill();
        process.waitForFinished();
        return result;
    }

    result.finished = process.exitStatus() == QProcess::NormalExit;
    result.exitCode = process.exitCode();
    result.rawStandardOutput = process.readAllStandardOutput();
    result.standardOutput = QString::fromLocal8Bit(result.rawStandardOutput);
    result.standardError = QString::fromLocal8Bit(process.readAllStandardError());
    if (!result.finished) {
        result.errorString = process.errorString();
    }

    DKLOG_DEBUG(QStringLiteral("ProcessUtils"),
                QStringLiteral("runProcess"),
                QStringLiteral("process_finished"),
                QStringLiteral("external_tool"),
                QStringLiteral("qprocess"),
                logging::defaultWho(),
                QString(),
                (nlohmann::json{{"program", program.toStdString()},
                                {"args", arguments.join(QChar(' ')).toStdString()},
                                {"exitCode", result.exitCode}}));
    return result;
}

bool hasAdministratorPrivileges()
{
#ifdef Q_OS_WIN
    // Only elevated processes may write into the system temp directory.
    const QString systemRoot = qEnvironmentVariable("SystemRoot", QStringLiteral("C:\\Windows"));
    const QString probePath = QDir(systemRoot).filePath(QStringLiteral("Temp/drvkeep_admin_probe"));
    QFile probe(probePath);
    if (!probe.open(QIODevice::WriteOnly | QIODevice::Truncate)) {
        return false;
    }
    probe.write("probe");
    probe.close();
    probe.remove();
    return true;
#else
    return geteuid() == 0;
#endif
}

} // namespace drvkeep
