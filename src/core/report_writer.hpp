#pragma once

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include "common/models.hpp"

namespace drvkeep {

// A session-level report (master CSV or summary) could not be written.
class ReportWriteError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

class ReportWriter
{
public:
    static constexpr const char *kPackageCsvName = "driver_info.csv";
    static constexpr const char *kMasterCsvName = "all_drivers.csv";
    static constexpr const char *kSummaryName = "driver_backup_summary.txt";

    // Buckets and packages in report order: by class segment, then class
    // name, packages in session order.
    using Entry = std::pair<const ClassBucket *, const DriverPackage *>;
    static std::vector<Entry> reportOrder(const BackupSession &session);

    static std::vector<std::string> csvHeader(bool withFolderName);
    static std::vector<std::string> csvFields(const DriverRecord &record);

    static std::string packageCsv(const DriverPackage &package);
    static std::string masterCsv(const BackupSession &session);
    static std::string summaryText(const BackupSession &session,
                                   std::chrono::system_clock::time_point generatedAt);

    // Writes driver_info.csv into every package folder, then all_drivers.csv
    // and the summary into the backup directory. A package CSV that cannot
    // be written is logged and counted in the return value; the two session
    // files throw ReportWriteError.
    std::size_t writeAll(const BackupSession &session);

private:
    static void writeTextFile(const std::filesystem::path &path, const std::string &content);
};

} // namespace drvkeep
