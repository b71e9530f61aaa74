#pragma once

#include <filesystem>
#include <functional>
#include <iosfwd>
#include <system_error>

#include "common/models.hpp"
#include "core/driver_exporter.hpp"

namespace drvkeep {

// Maps a filesystem error from directory creation to an export failure kind.
ExportFailureKind classifyFilesystemError(const std::error_code &error);

class ExportOrchestrator
{
public:
    // Skip reason of packages left untouched after cancellation.
    static constexpr const char *kInterruptedReason = "run interrupted";

    // console receives failure notices, and progress lines when verbose.
    // It may be null.
    ExportOrchestrator(DriverExporter &exporter, std::ostream *console = nullptr,
                       bool verbose = false);

    // Polled between packages. Once it returns true the remaining packages
    // are skipped and session.interrupted is set.
    void setCancellationCheck(std::function<bool()> check);

    // Gives every package of the session exactly one outcome and updates the
    // session counters. Packages run one at a time in bucket order and the
    // exporter is called at most once per INF name. INFs the exporter cannot
    // handle are skipped in dry and live runs alike.
    void run(BackupSession &session);

    static std::filesystem::path packageDirectory(const BackupSession &session,
                                                  const ClassBucket &bucket,
                                                  const DriverPackage &package);

private:
    void printMembers(const DriverPackage &package) const;
    ExportOutcome exportPackage(const BackupSession &session,
                                const ClassBucket &bucket,
                                const DriverPackage &package);
    void record(BackupSession &session, DriverPackage &package, ExportOutcome outcome);

    DriverExporter &m_exporter;
    std::ostream *m_console = nullptr;
    bool m_verbose = false;
    std::function<bool()> m_cancelled;
};

} // namespace drvkeep
