#include "core/report_writer.hpp"

#include <algorithm>
#include <sstream>

#include <QDateTime>
#include <QFile>
#include <QString>

#include "common/csv_utils.hpp"
#include "common/drvkeep_version.hpp"
#include "common/json_utils.hpp"
#include "common/logging.hpp"
#include "core/export_orchestrator.hpp"
#include "core/name_resolver.hpp"

namespace drvkeep {

namespace {

std::string formatUtc(std::chrono::system_clock::time_point timestamp)
{
    const QDateTime dt = QDateTime::fromMSecsSinceEpoch(
        std::chrono::duration_cast<std::chrono::milliseconds>(
            timestamp.time_since_epoch())
            .count(),
        Qt::UTC);
    return dt.toString(QStringLiteral("yyyy-MM-dd HH:mm:ss")).toStdString() + " UTC";
}

std::string describeOutcome(const BackupSession &session, const DriverPackage &package)
{
    if (!package.outcome) {
        return "not processed";
    }
    const ExportOutcome &outcome = *package.outcome;
    switch (outcome.status) {
    case ExportStatus::Success:
        if (session.dryRun) {
            return "planned (dry run)";
        }
        return "exported (" + std::to_string(outcome.fileCount) + " files)";
    case ExportStatus::Skipped:
        return "skipped, " + outcome.detail;
    case ExportStatus::Failed:
        return "FAILED (" + toFailureKindString(outcome.failureKind) + "), " + outcome.detail;
    }
    return "not processed";
}

} // namespace

std::vector<ReportWriter::Entry> ReportWriter::reportOrder(const BackupSession &session)
{
    std::vector<const ClassBucket *> buckets;
    buckets.reserve(session.buckets.size());
    for (const auto &bucket : session.buckets) {
        buckets.push_back(&bucket);
    }
    std::stable_sort(buckets.begin(), buckets.end(),
                     [](const ClassBucket *a, const ClassBucket *b) {
                         if (a->classSegment != b->classSegment) {
                             return a->classSegment < b->classSegment;
                         }
                         return a->deviceClass < b->deviceClass;
                     });

    std::vector<Entry> entries;
    for (const ClassBucket *bucket : buckets) {
        for (const auto &package : bucket->packages) {
            entries.emplace_back(bucket, &package);
        }
    }
    return entries;
}

std::vector<std::string> ReportWriter::csvHeader(bool withFolderName)
{
    std::vector<std::string> header = {
        "Device Name", "Driver Version", "Driver Date", "Hardware ID", "Device ID",
        "INF Name", "Description", "Provider", "Device Class", "Class GUID",
    };
    if (withFolderName) {
        header.push_back("Folder Name");
    }
    return header;
}

std::vector<std::string> ReportWriter::csvFields(const DriverRecord &record)
{
    return {
        record.deviceName,
        record.driverVersion,
        record.driverDate,
        record.hardwareId,
        record.deviceId,
        record.infName,
        record.description,
        record.provider,
        record.deviceClass,
        record.classGuid,
    };
}

std::string ReportWriter::packageCsv(const DriverPackage &package)
{
    std::string csv = formatCsvRow(csvHeader(false));
    for (const auto &record : package.records) {
        csv += formatCsvRow(csvFields(record));
    }
    return csv;
}

std::string ReportWriter::masterCsv(const BackupSession &session)
{
    std::string csv = formatCsvRow(csvHeader(true));
    for (const auto &[bucket, package] : reportOrder(session)) {
        const std::string folder = packageRelativePath(*bucket, *package);
        for (const auto &record : package->records) {
            std::vector<std::string> fields = csvFields(record);
            fields.push_back(folder);
            csv += formatCsvRow(fields);
        }
    }
    return csv;
}

std::string ReportWriter::summaryText(const BackupSession &session,
                                      std::chrono::system_clock::time_point generatedAt)
{
    const BackupCounters &counters = session.counters;
    std::ostringstream out;

    out << "Driver Export Summary\n";
    out << "Generated: " << formatUtc(generatedAt) << "\n";
    out << "Tool version: " << DRVKEEP_VERSION << "\n";
    out << "Mode: " << (session.dryRun ? "dry run (nothing written)" : "backup") << "\n";
    out << "Output: " << session.backupDir.u8string() << "\n";
    out << "Records seen: " << counters.recordsSeen
        << " (excluded OS vendor: " << counters.recordsExcluded
        << ", rejected: " << counters.recordsRejected << ")\n";
    out << "Driver packages: " << session.packageCount()
        << " (exported: " << counters.packagesExported
        << ", skipped: " << counters.packagesSkipped
        << ", failed: " << counters.exportFailures << ")\n";
    if (session.interrupted) {
        out << "Run was interrupted; remaining packages were skipped.\n";
    }
    out << "\n";

    out << "Drivers by Device Class and Package:\n";
    out << "=====================================\n\n";

    const std::vector<Entry> entries = reportOrder(session);
    std::size_t packageNumber = 1;
    std::size_t recordNumber = 1;
    const ClassBucket *currentBucket = nullptr;
    for (const auto &[bucket, package] : entries) {
        if (bucket != currentBucket) {
            if (currentBucket) {
                out << "\n";
            }
            currentBucket = bucket;
            out << "=== " << bucket->deviceClass << " (" << bucket->packages.size()
                << " packages) ===\n\n";
        }

        const DriverRecord &primary = package->primary();
        out << packageNumber << ". " << package->definitionFile << " ("
            << package->records.size() << " devices in package):\n";
        if (!package->hasKnownDefinitionFile()) {
            out << "   Group: " << package->groupKey << "\n";
        }
        out << "   Folder: " << packageRelativePath(*bucket, *package) << "\n";
        out << "   Status: " << describeOutcome(session, *package) << "\n";
        out << "   Provider: " << primary.provider << "\n";
        out << "   Version: " << primary.driverVersion << "\n";
        out << "   Date: " << primary.driverDate << "\n";

        out << "\n   Devices in this package:\n";
        std::size_t memberNumber = 1;
        for (const auto &record : package->records) {
            out << "   " << memberNumber << ". " << record.deviceName
                << " (record #" << recordNumber << ")\n";
            out << "      Hardware ID: " << record.hardwareId << "\n";
            out << "      Device ID: " << record.deviceId << "\n";
            out << "      Description: " << record.description << "\n";
            ++memberNumber;
            ++recordNumber;
        }
        out << "\n";
        ++packageNumber;
    }
    if (currentBucket) {
        out << "\n";
    }

    return out.str();
}

void ReportWriter::writeTextFile(const std::filesystem::path &path, const std::string &content)
{
    QFile file(QString::fromStdString(path.u8string()));
    if (!file.open(QIODevice::WriteOnly | QIODevice::Truncate)) {
        throw ReportWriteError("cannot open " + path.u8string() + ": "
                               + file.errorString().toStdString());
    }
    const QByteArray data = QByteArray::fromStdString(content);
    if (file.write(data) != data.size()) {
        throw ReportWriteError("cannot write " + path.u8string() + ": "
                               + file.errorString().toStdString());
    }
}

std::size_t ReportWriter::writeAll(const BackupSession &session)
{
    std::size_t packageFailures = 0;

    for (const auto &bucket : session.buckets) {
        for (const auto &package : bucket.packages) {
            // Nothing is created for packages the run never reached.
            if (package.outcome
                && package.outcome->status == ExportStatus::Skipped
                && package.outcome->detail == ExportOrchestrator::kInterruptedReason) {
                continue;
            }
            const std::filesystem::path directory =
                ExportOrchestrator::packageDirectory(session, bucket, package);
            try {
                std::error_code error;
                std::filesystem::create_directories(directory, error);
                if (error) {
                    throw ReportWriteError("cannot create " + directory.u8string() + ": "
                                           + error.message());
                }
                writeTextFile(directory / kPackageCsvName, packageCsv(package));
            } catch (const ReportWriteError &ex) {
                ++packageFailures;
                DKLOG_WARN(QStringLiteral("ReportWriter"),
                           QStringLiteral("writeAll"),
                           QStringLiteral("package_csv_failed"),
                           QString::fromUtf8(ex.what()),
                           QStringLiteral("continue_with_next"),
                           logging::defaultWho(),
                           QString(),
                           (nlohmann::json{{"folder", packageRelativePath(bucket, package)}}));
            }
        }
    }

    writeTextFile(session.backupDir / kMasterCsvName, masterCsv(session));
    writeTextFile(session.backupDir / kSummaryName,
                  summaryText(session, std::chrono::system_clock::now()));

    DKLOG_INFO(QStringLiteral("ReportWriter"),
               QStringLiteral("writeAll"),
               QStringLiteral("reports_written"),
               QStringLiteral("backup_run"),
               QStringLiteral("csv_and_text"),
               logging::defaultWho(),
               QString(),
               (nlohmann::json{{"backupDir", session.backupDir.u8string()},
                               {"packageCsvFailures", packageFailures}}));
    return packageFailures;
}

} // namespace drvkeep
