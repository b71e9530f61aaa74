#pragma once

#include <cstddef>
#include <stdexcept>
#include <string>
#include <vector>

#include "common/models.hpp"

namespace drvkeep {

// Raised for a record that cannot be attributed to any device. Never fatal:
// normalizeAll() drops the record and counts it.
class RecordRejected : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

struct NormalizeResult {
    std::vector<DriverRecord> records;
    std::size_t rejected = 0;
    std::size_t excluded = 0;
};

class RecordNormalizer
{
public:
    // Lower-case provider prefixes treated as the operating system vendor.
    static std::vector<std::string> defaultExcludedProviders();

    explicit RecordNormalizer(
        std::vector<std::string> excludedProviders = defaultExcludedProviders());

    // True when the record was shipped by the OS vendor. Matches the
    // provider, or the manufacturer when no provider was reported.
    bool isExcludedProvider(const RawDriverRecord &raw) const;

    // Throws RecordRejected when name, hardware id and device id are all missing.
    DriverRecord normalize(const RawDriverRecord &raw, std::size_t discoveryIndex) const;

    // Filters OS vendor records, normalizes the rest in input order.
    NormalizeResult normalizeAll(const std::vector<RawDriverRecord> &raws) const;

    // Converts WMI/DMTF, ISO, /Date(ms)/ and M/D/YYYY dates to YYYY-MM-DD.
    static std::string normalizeDate(const std::string &value);

private:
    std::vector<std::string> m_excludedProviders;
};

} // namespace drvkeep
