#pragma once

#include <QByteArray>
#include <QString>
#include <QStringList>

namespace drvkeep {

struct ProcessResult {
    bool started = false;
    bool finished = false;
    int exitCode = -1;
    // Undecoded stdout, for tools that write UTF-8 regardless of the locale.
    QByteArray rawStandardOutput;
    QString standardOutput;
    QString standardError;
    QString errorString;

    bool succeeded() const { return started && finished && exitCode == 0; }
};

// Run a program to completion and capture its output. A negative timeout
// waits forever, which is what the driver tools need: an export has no
// bounded duration.
ProcessResult runProcess(const QString &program, const QStringList &arguments,
                         int timeoutMs = -1);

// Administrator on Windows, effective uid 0 elsewhere.
bool hasAdministratorPrivileges();

} // namespace drvkeep
