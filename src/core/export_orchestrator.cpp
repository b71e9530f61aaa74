#include "core/export_orchestrator.hpp"

#include <map>
#include <ostream>
#include <string>
#include <utility>

#include "common/json_utils.hpp"
#include "common/logging.hpp"
#include "core/name_resolver.hpp"

namespace drvkeep {

namespace {

const char *operatorHint(ExportFailureKind kind)
{
    switch (kind) {
    case ExportFailureKind::PermissionDenied:
        return "This might be a permissions issue. Try running as Administrator.";
    case ExportFailureKind::NotFound:
        return "Driver package might be corrupted or already removed.";
    case ExportFailureKind::PathTooLong:
        return "Path too long or invalid. Try a shorter output directory.";
    case ExportFailureKind::Other:
        return nullptr;
    }
    return nullptr;
}

} // namespace

ExportFailureKind classifyFilesystemError(const std::error_code &error)
{
    if (error == std::errc::permission_denied
        || error == std::errc::operation_not_permitted
        || error == std::errc::read_only_file_system) {
        return ExportFailureKind::PermissionDenied;
    }
    if (error == std::errc::filename_too_long) {
        return ExportFailureKind::PathTooLong;
    }
    if (error == std::errc::no_such_file_or_directory
        || error == std::errc::not_a_directory) {
        return ExportFailureKind::NotFound;
    }
    return ExportFailureKind::Other;
}

ExportOrchestrator::ExportOrchestrator(DriverExporter &exporter, std::ostream *console,
                                       bool verbose)
    : m_exporter(exporter)
    , m_console(console)
    , m_verbose(verbose)
{
}

void ExportOrchestrator::setCancellationCheck(std::function<bool()> check)
{
    m_cancelled = std::move(check);
}

std::filesystem::path ExportOrchestrator::packageDirectory(const BackupSession &session,
                                                           const ClassBucket &bucket,
                                                           const DriverPackage &package)
{
    return session.backupDir
        / std::filesystem::u8path(bucket.classSegment)
        / std::filesystem::u8path(package.folderName);
}

void ExportOrchestrator::run(BackupSession &session)
{
    // INF name -> folder of the package that first claimed it.
    std::map<std::string, std::string> attempted;

    for (auto &bucket : session.buckets) {
        if (m_verbose && m_console) {
            *m_console << "Processing Device Class: " << bucket.deviceClass << "\n"
                       << "  Class Folder: " << bucket.classSegment << "\n"
                       << "  Number of driver packages in this class: "
                       << bucket.packages.size() << "\n\n";
        }

        for (auto &package : bucket.packages) {
            if (!session.interrupted && m_cancelled && m_cancelled()) {
                session.interrupted = true;
                DKLOG_WARN(QStringLiteral("ExportOrchestrator"),
                           QStringLiteral("run"),
                           QStringLiteral("export_interrupted"),
                           QStringLiteral("cancel_requested"),
                           QStringLiteral("skip_remaining"),
                           logging::defaultWho(),
                           QString(),
                           (nlohmann::json{{"nextPackage", package.groupKey}}));
            }

            const std::string relativePath = packageRelativePath(bucket, package);
            const DriverRecord &primary = package.primary();
            if (m_verbose && m_console) {
                *m_console << "  Processing driver package: " << primary.deviceName
                           << " v" << primary.driverVersion
                           << " (" << package.definitionFile << ")\n"
                           << "    Folder: " << package.folderName << "\n"
                           << "    Number of devices in this package: "
                           << package.records.size() << "\n\n";
                printMembers(package);
            }

            if (session.interrupted) {
                record(session, package, ExportOutcome::skipped(kInterruptedReason));
                continue;
            }
            if (!package.hasKnownDefinitionFile()) {
                record(session, package, ExportOutcome::skipped("definition file unknown"));
                continue;
            }
            if (!m_exporter.canExport(package.definitionFile)) {
                record(session, package,
                       ExportOutcome::skipped("not a published driver-store package"));
                continue;
            }
            const auto previous = attempted.find(package.definitionFile);
            if (previous != attempted.end()) {
                // One INF can serve devices of several classes.
                record(session, package,
                       ExportOutcome::skipped("definition file already exported to "
                                              + previous->second));
                continue;
            }
            attempted.emplace(package.definitionFile, relativePath);

            if (session.dryRun) {
                record(session, package, ExportOutcome::success(0));
                continue;
            }
            record(session, package, exportPackage(session, bucket, package));
        }
    }
}

void ExportOrchestrator::printMembers(const DriverPackage &package) const
{
    std::size_t index = 1;
    for (const DriverRecord &member : package.records) {
        *m_console << "      " << index++ << ". Device: " << member.deviceName << "\n"
                   << "         INF: " << member.infName << "\n"
                   << "         Hardware ID: " << member.hardwareId << "\n"
                   << "         Device ID: " << member.deviceId << "\n"
                   << "         Description: " << member.description << "\n"
                   << "         Provider: " << member.provider << "\n"
                   << "         Version: " << member.driverVersion << "\n"
                   << "         Date: " << member.driverDate << "\n\n";
    }
}

ExportOutcome ExportOrchestrator::exportPackage(const BackupSession &session,
                                                const ClassBucket &bucket,
                                                const DriverPackage &package)
{
    const std::filesystem::path destination = packageDirectory(session, bucket, package);

    std::error_code error;
    std::filesystem::create_directories(destination, error);
    if (error) {
        return ExportOutcome::failed(classifyFilesystemError(error),
                                     "cannot create " + destination.u8string() + ": "
                                         + error.message());
    }

    if (m_verbose && m_console) {
        *m_console << "    Exporting " << package.definitionFile << " to "
                   << destination.u8string() << "...\n";
    }
    return m_exporter.exportDriver(package.definitionFile, destination);
}

void ExportOrchestrator::record(BackupSession &session, DriverPackage &package,
                                ExportOutcome outcome)
{
    switch (outcome.status) {
    case ExportStatus::Success:
        ++session.counters.packagesExported;
        if (m_verbose && m_console) {
            *m_console << "    Exported " << package.definitionFile << " ("
                       << outcome.fileCount << " files)\n\n";
        }
        break;
    case ExportStatus::Skipped:
        ++session.counters.packagesSkipped;
        if (m_verbose && m_console) {
            *m_console << "    Skipped: " << outcome.detail << "\n\n";
        }
        break;
    case ExportStatus::Failed: {
        ++session.counters.exportFailures;
        if (m_console) {
            *m_console << "Failed to export " << package.definitionFile << ": "
                       << outcome.detail << "\n";
            if (const char *hint = operatorHint(outcome.failureKind)) {
                *m_console << "  -> " << hint << "\n";
            }
            if (m_verbose) {
                *m_console << "\n";
            }
        }
        DKLOG_WARN(QStringLiteral("ExportOrchestrator"),
                   QStringLiteral("record"),
                   QStringLiteral("package_export_failed"),
                   QString::fromStdString(toFailureKindString(outcome.failureKind)),
                   QStringLiteral("continue_with_next"),
                   logging::defaultWho(),
                   QString(),
                   (nlohmann::json{{"inf", package.definitionFile},
                                   {"folder", package.folderName},
                                   {"detail", outcome.detail}}));
        break;
    }
    }

    DKLOG_DEBUG(QStringLiteral("ExportOrchestrator"),
                QStringLiteral("record"),
                QStringLiteral("package_outcome"),
                QStringLiteral("backup_run"),
                session.dryRun ? QStringLiteral("dry_run") : QStringLiteral("export"),
                logging::defaultWho(),
                QString(),
                (nlohmann::json{{"group", package.groupKey},
                                {"members", package.records.size()},
                                {"outcome", outcome}}));
    package.outcome = std::move(outcome);
}

} // namespace drvkeep
