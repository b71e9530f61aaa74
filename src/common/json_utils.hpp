#pragma once

#include <cctype>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <optional>
#include <sstream>
#include <string>

#include <nlohmann/json.hpp>

#include "common/models.hpp"

namespace drvkeep {

namespace detail {

inline std::tm toUtcTm(std::chrono::system_clock::time_point timestamp)
{
    std::time_t time = std::chrono::system_clock::to_time_t(timestamp);
    std::tm tm{};
#if defined(_WIN32)
    gmtime_s(&tm, &time);
#else
    gmtime_r(&time, &tm);
#endif
    return tm;
}

inline std::string lowerAscii(std::string value)
{
    for (auto &ch : value) {
        ch = static_cast<char>(std::tolower(static_cast<unsigned char>(ch)));
    }
    return value;
}

} // namespace detail

inline std::string toIso8601Utc(std::chrono::system_clock::time_point timestamp)
{
    const std::tm tm = detail::toUtcTm(timestamp);
    std::ostringstream out;
    out << std::put_time(&tm, "%Y-%m-%dT%H:%M:%SZ");
    return out.str();
}

// Folder-friendly run id, e.g. 20261019_101500.
inline std::string toSessionId(std::chrono::system_clock::time_point timestamp)
{
    const std::tm tm = detail::toUtcTm(timestamp);
    std::ostringstream out;
    out << std::put_time(&tm, "%Y%m%d_%H%M%S");
    return out.str();
}

inline std::string toStatusString(ExportStatus status)
{
    switch (status) {
    case ExportStatus::Success:
        return "success";
    case ExportStatus::Skipped:
        return "skipped";
    case ExportStatus::Failed:
        return "failed";
    }
    return "skipped";
}

inline std::string toFailureKindString(ExportFailureKind kind)
{
    switch (kind) {
    case ExportFailureKind::PermissionDenied:
        return "permission_denied";
    case ExportFailureKind::NotFound:
        return "not_found";
    case ExportFailureKind::PathTooLong:
        return "path_too_long";
    case ExportFailureKind::Other:
        return "other";
    }
    return "other";
}

inline ExportStatus parseStatusString(const std::string &value)
{
    if (value == "success") {
        return ExportStatus::Success;
    }
    if (value == "failed") {
        return ExportStatus::Failed;
    }
    return ExportStatus::Skipped;
}

inline ExportFailureKind parseFailureKindString(const std::string &value)
{
    if (value == "permission_denied") {
        return ExportFailureKind::PermissionDenied;
    }
    if (value == "not_found") {
        return ExportFailureKind::NotFound;
    }
    if (value == "path_too_long") {
        return ExportFailureKind::PathTooLong;
    }
    return ExportFailureKind::Other;
}

// Looks a key up the way WMI does: case-insensitively. PowerShell keeps the
// casing of the Select-Object argument, which differs between hosts.
inline const nlohmann::json *findField(const nlohmann::json &j, const std::string &key)
{
    const auto exact = j.find(key);
    if (exact != j.end()) {
        return &*exact;
    }
    const std::string wanted = detail::lowerAscii(key);
    for (auto it = j.begin(); it != j.end(); ++it) {
        if (detail::lowerAscii(it.key()) == wanted) {
            return &it.value();
        }
    }
    return nullptr;
}

inline std::optional<std::string> optionalStringField(const nlohmann::json &j,
                                                      const std::string &key)
{
    const nlohmann::json *value = findField(j, key);
    if (!value || value->is_null()) {
        return std::nullopt;
    }
    if (value->is_string()) {
        return value->get<std::string>();
    }
    if (value->is_array()) {
        // Multi-string properties: the first entry is the most specific id.
        for (const auto &entry : *value) {
            if (entry.is_string()) {
                return entry.get<std::string>();
            }
        }
        return std::nullopt;
    }
    if (value->is_object()) {
        return std::nullopt;
    }
    return value->dump();
}

inline void to_json(nlohmann::json &j, const ExportStatus &status)
{
    j = toStatusString(status);
}

inline void from_json(const nlohmann::json &j, ExportStatus &status)
{
    if (j.is_string()) {
        status = parseStatusString(j.get<std::string>());
    } else {
        status = ExportStatus::Skipped;
    }
}

inline void to_json(nlohmann::json &j, const ExportFailureKind &kind)
{
    j = toFailureKindString(kind);
}

inline void from_json(const nlohmann::json &j, ExportFailureKind &kind)
{
    if (j.is_string()) {
        kind = parseFailureKindString(j.get<std::string>());
    } else {
        kind = ExportFailureKind::Other;
    }
}

// Field names follow the Win32_PnPSignedDriver WMI class.
inline void to_json(nlohmann::json &j, const RawDriverRecord &record)
{
    const auto field = [](const std::optional<std::string> &value) {
        return value ? nlohmann::json(*value) : nlohmann::json(nullptr);
    };
    j = nlohmann::json{
        {"DeviceName", field(record.deviceName)},
        {"Description", field(record.description)},
        {"Manufacturer", field(record.manufacturer)},
        {"DriverProviderName", field(record.provider)},
        {"DriverVersion", field(record.driverVersion)},
        {"DriverDate", field(record.driverDate)},
        {"DeviceClass", field(record.deviceClass)},
        {"ClassGuid", field(record.classGuid)},
        {"HardWareID", field(record.hardwareId)},
        {"DeviceID", field(record.deviceId)},
        {"InfName", field(record.infName)}
    };
}

inline void from_json(const nlohmann::json &j, RawDriverRecord &record)
{
    record.deviceName = optionalStringField(j, "DeviceName");
    record.description = optionalStringField(j, "Description");
    record.manufacturer = optionalStringField(j, "Manufacturer");
    record.provider = optionalStringField(j, "DriverProviderName");
    record.driverVersion = optionalStringField(j, "DriverVersion");
    record.driverDate = optionalStringField(j, "DriverDate");
    record.deviceClass = optionalStringField(j, "DeviceClass");
    record.classGuid = optionalStringField(j, "ClassGuid");
    record.hardwareId = optionalStringField(j, "HardWareID");
    record.deviceId = optionalStringField(j, "DeviceID");
    record.infName = optionalStringField(j, "InfName");
}

inline void to_json(nlohmann::json &j, const ExportOutcome &outcome)
{
    j = nlohmann::json{
        {"status", outcome.status},
        {"fileCount", outcome.fileCount},
        {"detail", outcome.detail}
    };
    if (outcome.status == ExportStatus::Failed) {
        j["failureKind"] = outcome.failureKind;
    }
}

inline void from_json(const nlohmann::json &j, ExportOutcome &outcome)
{
    if (j.contains("status")) {
        outcome.status = j.at("status").get<ExportStatus>();
    } else {
        outcome.status = ExportStatus::Skipped;
    }
    outcome.fileCount = j.value("fileCount", static_cast<std::size_t>(0));
    if (j.contains("failureKind")) {
        outcome.failureKind = j.at("failureKind").get<ExportFailureKind>();
    } else {
        outcome.failureKind = ExportFailureKind::Other;
    }
    outcome.detail = j.value("detail", "");
}

inline void to_json(nlohmann::json &j, const BackupCounters &counters)
{
    j = nlohmann::json{
        {"recordsSeen", counters.recordsSeen},
        {"recordsRejected", counters.recordsRejected},
        {"recordsExcluded", counters.recordsExcluded},
        {"packagesExported", counters.packagesExported},
        {"packagesSkipped", counters.packagesSkipped},
        {"exportFailures", counters.exportFailures}
    };
}

inline void from_json(const nlohmann::json &j, BackupCounters &counters)
{
    counters.recordsSeen = j.value("recordsSeen", static_cast<std::size_t>(0));
    counters.recordsRejected = j.value("recordsRejected", static_cast<std::size_t>(0));
    counters.recordsExcluded = j.value("recordsExcluded", static_cast<std::size_t>(0));
    counters.packagesExported = j.value("packagesExported", static_cast<std::size_t>(0));
    counters.packagesSkipped = j.value("packagesSkipped", static_cast<std::size_t>(0));
    counters.exportFailures = j.value("exportFailures", static_cast<std::size_t>(0));
}

inline void to_json(nlohmann::json &j, const BackupResult &result)
{
    j = nlohmann::json{
        {"success", result.success},
        {"dryRun", result.dryRun},
        {"interrupted", result.interrupted},
        {"sessionId", result.sessionId},
        {"backupDir", result.backupDir.generic_string()},
        {"packagesTotal", result.packagesTotal},
        {"counters", result.counters}
    };
}

inline void from_json(const nlohmann::json &j, BackupResult &result)
{
    result.success = j.value("success", false);
    result.dryRun = j.value("dryRun", false);
    result.interrupted = j.value("interrupted", false);
    result.sessionId = j.value("sessionId", "");
    result.backupDir = std::filesystem::path(j.value("backupDir", ""));
    result.packagesTotal = j.value("packagesTotal", static_cast<std::size_t>(0));
    if (j.contains("counters") && j.at("counters").is_object()) {
        result.counters = j.at("counters").get<BackupCounters>();
    } else {
        result.counters = BackupCounters{};
    }
}

} // namespace drvkeep
