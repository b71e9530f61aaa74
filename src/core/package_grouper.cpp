#include "core/package_grouper.hpp"

#include <algorithm>
#include <cstddef>
#include <map>
#include <unordered_map>
#include <utility>

#include "common/logging.hpp"
#include <nlohmann/json.hpp>

namespace drvkeep {

std::string packageGroupKey(const DriverRecord &record)
{
    if (record.infName != kUnknown) {
        return record.infName;
    }
    if (record.deviceId != kUnknown) {
        return "device:" + record.deviceId;
    }
    return "record:" + std::to_string(record.discoveryIndex);
}

std::vector<ClassBucket> groupPackages(const std::vector<DriverRecord> &records)
{
    std::vector<ClassBucket> buckets;
    std::map<std::string, std::size_t> bucketIndex;
    std::vector<std::unordered_map<std::string, std::size_t>> packageIndex;

    for (const auto &record : records) {
        auto classIt = bucketIndex.find(record.deviceClass);
        if (classIt == bucketIndex.end()) {
            ClassBucket bucket;
            bucket.deviceClass = record.deviceClass;
            buckets.push_back(std::move(bucket));
            packageIndex.emplace_back();
            classIt = bucketIndex.emplace(record.deviceClass, buckets.size() - 1).first;
        }

        ClassBucket &bucket = buckets[classIt->second];
        auto &packagesByKey = packageIndex[classIt->second];

        const std::string key = packageGroupKey(record);
        auto packageIt = packagesByKey.find(key);
        if (packageIt == packagesByKey.end()) {
            DriverPackage package;
            package.deviceClass = record.deviceClass;
            package.definitionFile = record.infName;
            package.groupKey = key;
            bucket.packages.push_back(std::move(package));
            packageIt = packagesByKey.emplace(key, bucket.packages.size() - 1).first;
        }

        bucket.packages[packageIt->second].records.push_back(record);
    }

    std::stable_sort(buckets.begin(), buckets.end(),
                     [](const ClassBucket &a, const ClassBucket &b) {
                         return a.deviceClass < b.deviceClass;
                     });

    std::size_t packageCount = 0;
    for (const auto &bucket : buckets) {
        packageCount += bucket.packages.size();
    }
    DKLOG_INFO(QStringLiteral("PackageGrouper"),
               QStringLiteral("groupPackages"),
               QStringLiteral("packages_grouped"),
               QStringLiteral("backup_run"),
               QStringLiteral("class_then_inf"),
               logging::defaultWho(),
               QString(),
               (nlohmann::json{{"records", records.size()},
                               {"classes", buckets.size()},
                               {"packages", packageCount}}));
    return buckets;
}

} // namespace drvkeep
