#pragma once

#include <string>
#include <vector>

#include "common/models.hpp"

namespace drvkeep {

/**
 * Partition normalized records into driver packages.
 *
 * Records are keyed by device class, then by INF name. Records sharing a
 * known INF within a class become one package whose members keep input
 * order; the first member is the package's primary record. Records with an
 * unknown INF are keyed by their device id instead, so they are never merged
 * by coincidence.
 *
 * Buckets come back sorted by class name, packages in first-seen order. The
 * result depends only on the input sequence. Folder names are not resolved
 * here.
 */
std::vector<ClassBucket> groupPackages(const std::vector<DriverRecord> &records);

// Inner grouping key for one record.
std::string packageGroupKey(const DriverRecord &record);

} // namespace drvkeep
