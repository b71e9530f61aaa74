#include "core/backup_runner.hpp"

#include <ostream>
#include <system_error>
#include <utility>

#include <QFile>
#include <QString>

#include "common/json_utils.hpp"
#include "common/logging.hpp"
#include "common/process_utils.hpp"
#include "core/export_orchestrator.hpp"
#include "core/name_resolver.hpp"
#include "core/package_grouper.hpp"
#include "core/report_writer.hpp"

namespace drvkeep {

BackupError::BackupError(Stage stage, const std::string &message)
    : std::runtime_error(message)
    , m_stage(stage)
{
}

std::string BackupError::hint() const
{
    switch (m_stage) {
    case Stage::Privilege:
        return "Run drvkeep from an elevated (Administrator) prompt.";
    case Stage::Enumeration:
        return "Check that the WMI service is running, or pass --input with a saved driver list.";
    case Stage::OutputRoot:
    case Stage::Report:
        return "Choose an output directory you can write to with --output.";
    }
    return {};
}

std::string toStageString(BackupError::Stage stage)
{
    switch (stage) {
    case BackupError::Stage::Privilege:
        return "privilege";
    case BackupError::Stage::Enumeration:
        return "enumeration";
    case BackupError::Stage::OutputRoot:
        return "output";
    case BackupError::Stage::Report:
        return "report";
    }
    return "unknown";
}

BackupRunner::BackupRunner(DriverSource &source, DriverExporter &exporter,
                           std::ostream *console)
    : m_source(source)
    , m_exporter(exporter)
    , m_console(console)
    , m_privileged(&hasAdministratorPrivileges)
    , m_clock([] { return std::chrono::system_clock::now(); })
{
}

void BackupRunner::setCancellationCheck(std::function<bool()> check)
{
    m_cancelled = std::move(check);
}

void BackupRunner::setPrivilegeCheck(std::function<bool()> check)
{
    m_privileged = std::move(check);
}

void BackupRunner::setClock(std::function<std::chrono::system_clock::time_point()> clock)
{
    m_clock = std::move(clock);
}

BackupResult BackupRunner::backup(const BackupOptions &options)
{
    m_session = BackupSession{};
    m_session.startedAt = m_clock();
    m_session.id = toSessionId(m_session.startedAt);
    m_session.outputRoot = options.outputRoot;
    m_session.dryRun = options.dryRun;
    m_session.backupDir = options.outputRoot / ("drivers_" + m_session.id);

    logging::CorrelationScope correlation(QString::fromStdString(m_session.id));
    DKLOG_INFO(QStringLiteral("BackupRunner"),
               QStringLiteral("backup"),
               QStringLiteral("backup_start"),
               QStringLiteral("user_invocation"),
               options.dryRun ? QStringLiteral("dry_run") : QStringLiteral("live"),
               logging::defaultWho(),
               QString(),
               (nlohmann::json{{"outputRoot", options.outputRoot.u8string()},
                               {"source", m_source.describe()}}));

    if (options.requirePrivilege && !m_privileged()) {
        throw BackupError(BackupError::Stage::Privilege,
                          "administrative privileges are required to query and export drivers");
    }

    prepareOutputRoot(options);

    std::vector<RawDriverRecord> raws;
    try {
        raws = m_source.enumerate();
    } catch (const EnumerationError &ex) {
        throw BackupError(BackupError::Stage::Enumeration,
                          m_source.describe() + ": " + ex.what());
    }
    m_session.counters.recordsSeen = raws.size();

    const RecordNormalizer normalizer(options.excludedProviders);
    NormalizeResult normalized = normalizer.normalizeAll(raws);
    m_session.counters.recordsRejected = normalized.rejected;
    m_session.counters.recordsExcluded = normalized.excluded;

    BackupResult result;
    result.dryRun = options.dryRun;
    result.sessionId = m_session.id;

    if (normalized.records.empty()) {
        if (m_console) {
            *m_console << "No third-party drivers found to export.\n";
        }
        result.success = true;
        result.counters = m_session.counters;
        return result;
    }

    m_session.buckets = groupPackages(normalized.records);
    NameResolver resolver;
    resolver.resolve(m_session.buckets);

    if (!options.dryRun) {
        m_session.backupDir = createBackupDirectory();
    }

    ExportOrchestrator orchestrator(m_exporter, m_console, options.verbose);
    if (m_cancelled) {
        orchestrator.setCancellationCheck(m_cancelled);
    }
    orchestrator.run(m_session);

    if (options.dryRun) {
        if (m_console) {
            *m_console << ReportWriter::summaryText(m_session, m_clock());
        }
    } else {
        ReportWriter writer;
        try {
            const std::size_t csvFailures = writer.writeAll(m_session);
            if (csvFailures > 0 && m_console) {
                *m_console << "Warning: " << csvFailures
                           << " package inventory file(s) could not be written.\n";
            }
        } catch (const ReportWriteError &ex) {
            throw BackupError(BackupError::Stage::Report, ex.what());
        }
    }

    result.success = true;
    result.interrupted = m_session.interrupted;
    result.backupDir = m_session.backupDir;
    result.packagesTotal = m_session.packageCount();
    result.counters = m_session.counters;

    DKLOG_INFO(QStringLiteral("BackupRunner"),
               QStringLiteral("backup"),
               QStringLiteral("backup_complete"),
               QStringLiteral("user_invocation"),
               options.dryRun ? QStringLiteral("dry_run") : QStringLiteral("live"),
               logging::defaultWho(),
               QString(),
               (nlohmann::json{{"result", result}}));
    return result;
}

void BackupRunner::prepareOutputRoot(const BackupOptions &options)
{
    const std::filesystem::path &root = options.outputRoot;

    std::error_code error;
    const bool exists = std::filesystem::exists(root, error);
    if (exists && !std::filesystem::is_directory(root, error)) {
        throw BackupError(BackupError::Stage::OutputRoot,
                          "output path exists but is not a directory: " + root.u8string());
    }
    if (options.dryRun) {
        return;
    }

    if (!exists) {
        std::filesystem::create_directories(root, error);
        if (error) {
            throw BackupError(BackupError::Stage::OutputRoot,
                              "cannot create output directory " + root.u8string() + ": "
                                  + error.message());
        }
    }

    const std::filesystem::path probePath = root / ".drvkeep_write_test";
    QFile probe(QString::fromStdString(probePath.u8string()));
    if (!probe.open(QIODevice::WriteOnly | QIODevice::Truncate)) {
        throw BackupError(BackupError::Stage::OutputRoot,
                          "cannot write to output directory " + root.u8string() + ": "
                              + probe.errorString().toStdString());
    }
    probe.close();
    probe.remove();
}

std::filesystem::path BackupRunner::createBackupDirectory()
{
    const std::filesystem::path base = m_session.backupDir;
    std::filesystem::path candidate = base;
    std::error_code error;
    for (int suffix = 2; std::filesystem::exists(candidate, error); ++suffix) {
        candidate = base;
        candidate += "_" + std::to_string(suffix);
    }
    if (error) {
        throw BackupError(BackupError::Stage::OutputRoot,
                          "cannot inspect backup directory " + candidate.u8string() + ": "
                              + error.message());
    }

    std::filesystem::create_directories(candidate, error);
    if (error) {
        throw BackupError(BackupError::Stage::OutputRoot,
                          "cannot create backup directory " + candidate.u8string() + ": "
                              + error.message());
    }
    return candidate;
}

} // namespace drvkeep
