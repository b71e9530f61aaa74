#pragma once

#include <cstddef>
#include <map>
#include <set>
#include <string>
#include <vector>

#include "common/models.hpp"

namespace drvkeep {

// Derives the on-disk folder layout: one class segment per bucket and one
// package segment per package, unique within a backup session.
class NameResolver
{
public:
    static constexpr std::size_t kMaxDeviceNameLength = 64;
    static constexpr std::size_t kMaxClassSegmentLength = 64;
    static constexpr char kPlaceholder = '_';

    // The class name itself when it is a safe path component, else "Unknown".
    static std::string classSegment(const std::string &deviceClass);

    // "{PrimaryDeviceName}_{Version} Package", sanitized and length-bounded,
    // before collision handling.
    static std::string baseFolderName(const DriverRecord &primary);

    // Replaces path-illegal and control characters with kPlaceholder and
    // trims surrounding whitespace.
    static std::string sanitizeComponent(const std::string &value);

    // Issues the folder name for a package under classSegment. The first
    // request for a name gets it verbatim; later colliding requests get
    // " (2)", " (3)", ... Comparison ignores case.
    std::string issue(const std::string &classSegment, const std::string &baseName);

    // Resolves every bucket and package in order.
    void resolve(std::vector<ClassBucket> &buckets);

private:
    // Lower-cased class segment -> lower-cased names already issued.
    std::map<std::string, std::set<std::string>> m_issued;
};

// Relative folder of a resolved package, "classSegment/packageSegment".
std::string packageRelativePath(const ClassBucket &bucket, const DriverPackage &package);

} // namespace drvkeep
