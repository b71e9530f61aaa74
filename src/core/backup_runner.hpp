#pragma once

#include <chrono>
#include <filesystem>
#include <functional>
#include <iosfwd>
#include <stdexcept>
#include <string>
#include <vector>

#include "common/models.hpp"
#include "core/driver_exporter.hpp"
#include "core/record_normalizer.hpp"
#include "core/driver_source.hpp"

namespace drvkeep {

// A condition that ends the run before or after the export phase.
class BackupError : public std::runtime_error {
public:
    enum class Stage {
        Privilege,
        Enumeration,
        OutputRoot,
        Report
    };

    BackupError(Stage stage, const std::string &message);

    Stage stage() const { return m_stage; }
    // Short operator advice for the stage, e.g. to run elevated.
    std::string hint() const;

private:
    Stage m_stage;
};

std::string toStageString(BackupError::Stage stage);

struct BackupOptions {
    std::filesystem::path outputRoot = "driver_backup";
    bool verbose = false;
    bool dryRun = false;
    // Whether the run needs an elevated process: true whenever the system
    // driver database or the live exporter is used.
    bool requirePrivilege = true;
    std::vector<std::string> excludedProviders = RecordNormalizer::defaultExcludedProviders();
};

class BackupRunner
{
public:
    // console receives progress and the dry-run plan. It may be null.
    BackupRunner(DriverSource &source, DriverExporter &exporter,
                 std::ostream *console = nullptr);

    void setCancellationCheck(std::function<bool()> check);
    void setPrivilegeCheck(std::function<bool()> check);
    void setClock(std::function<std::chrono::system_clock::time_point()> clock);

    // Enumerate, normalize, group, name, export and report. Per-record and
    // per-package problems are counted in the result; fatal conditions throw
    // BackupError.
    BackupResult backup(const BackupOptions &options);

    // The session of the last backup() call, for inspection.
    const BackupSession &session() const { return m_session; }

private:
    void prepareOutputRoot(const BackupOptions &options);
    std::filesystem::path createBackupDirectory();

    DriverSource &m_source;
    DriverExporter &m_exporter;
    std::ostream *m_console = nullptr;
    std::function<bool()> m_cancelled;
    std::function<bool()> m_privileged;
    std::function<std::chrono::system_clock::time_point()> m_clock;
    BackupSession m_session;
};

} // namespace drvkeep
