#pragma once

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "common/enums.hpp"

namespace drvkeep {

// Placeholder for any field the device database did not report.
inline const std::string kUnknown = "Unknown";

// One row as delivered by device enumeration. Every field may be missing.
struct RawDriverRecord {
    std::optional<std::string> deviceName;
    std::optional<std::string> description;
    std::optional<std::string> manufacturer;
    std::optional<std::string> provider;
    std::optional<std::string> driverVersion;
    std::optional<std::string> driverDate;
    std::optional<std::string> deviceClass;
    std::optional<std::string> classGuid;
    std::optional<std::string> hardwareId;
    std::optional<std::string> deviceId;
    std::optional<std::string> infName;
};

// Canonical per-device record. Missing fields hold kUnknown, the date is
// YYYY-MM-DD when it could be parsed and the INF name is lower-case.
struct DriverRecord {
    std::string deviceName;
    std::string description;
    std::string provider;
    std::string driverVersion;
    std::string driverDate;
    std::string deviceClass;
    std::string classGuid;
    std::string hardwareId;
    std::string deviceId;
    std::string infName;

    // Position in the enumeration batch the record came from.
    std::size_t discoveryIndex = 0;
};

struct ExportOutcome {
    ExportStatus status = ExportStatus::Skipped;
    std::size_t fileCount = 0;
    ExportFailureKind failureKind = ExportFailureKind::Other;
    // Skip reason or failure detail.
    std::string detail;

    static ExportOutcome success(std::size_t files)
    {
        ExportOutcome outcome;
        outcome.status = ExportStatus::Success;
        outcome.fileCount = files;
        return outcome;
    }

    static ExportOutcome skipped(std::string reason)
    {
        ExportOutcome outcome;
        outcome.status = ExportStatus::Skipped;
        outcome.detail = std::move(reason);
        return outcome;
    }

    static ExportOutcome failed(ExportFailureKind kind, std::string detail)
    {
        ExportOutcome outcome;
        outcome.status = ExportStatus::Failed;
        outcome.failureKind = kind;
        outcome.detail = std::move(detail);
        return outcome;
    }
};

struct DriverPackage {
    std::string deviceClass;
    // INF name shared by all members, kUnknown when the members have none.
    std::string definitionFile;
    // Grouping key: the INF name, or a per-device key for unknown INFs.
    std::string groupKey;
    std::vector<DriverRecord> records;

    // Resolved package segment, relative to the class segment.
    std::string folderName;
    std::optional<ExportOutcome> outcome;

    bool hasKnownDefinitionFile() const { return definitionFile != kUnknown; }
    const DriverRecord &primary() const { return records.front(); }
};

struct ClassBucket {
    std::string deviceClass;
    std::string classSegment;
    std::vector<DriverPackage> packages;
};

struct BackupCounters {
    std::size_t recordsSeen = 0;
    std::size_t recordsRejected = 0;
    std::size_t recordsExcluded = 0;
    std::size_t packagesExported = 0;
    std::size_t packagesSkipped = 0;
    std::size_t exportFailures = 0;
};

struct BackupSession {
    std::chrono::system_clock::time_point startedAt;
    // UTC timestamp, YYYYMMDD_HHMMSS. Also the log correlation id.
    std::string id;
    std::filesystem::path outputRoot;
    std::filesystem::path backupDir;
    bool dryRun = false;
    bool interrupted = false;

    std::vector<ClassBucket> buckets;
    BackupCounters counters;

    std::size_t packageCount() const
    {
        std::size_t total = 0;
        for (const auto &bucket : buckets) {
            total += bucket.packages.size();
        }
        return total;
    }
};

struct BackupResult {
    bool success = false;
    bool dryRun = false;
    bool interrupted = false;
    std::string sessionId;
    std::filesystem::path backupDir;
    std::size_t packagesTotal = 0;
    BackupCounters counters;
};

} // namespace drvkeep
