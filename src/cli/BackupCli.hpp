#pragma once

#include <functional>

#include <QString>
#include <QStringList>

namespace drvkeep {

class BackupCli
{
public:
    // Parses the command line, runs one backup and renders the result.
    // returns exit code
    int run(int argc, char *argv[]);

    // Polled between packages; true stops the run.
    void setCancellationCheck(std::function<bool()> check);

    static constexpr int kExitOk = 0;
    static constexpr int kExitFailure = 1;
    static constexpr int kExitInterrupted = 130;

private:
    std::function<bool()> m_cancelled;
};

} // namespace drvkeep
