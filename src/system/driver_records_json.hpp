#pragma once

#include <filesystem>
#include <string>
#include <vector>

#include "common/models.hpp"

namespace drvkeep {

/**
 * Parse Win32_PnPSignedDriver rows serialized as JSON.
 *
 * Accepts an array of objects, a single object (ConvertTo-Json emits one
 * for a single result) or empty input. Keys are matched case-insensitively.
 * Throws EnumerationError on malformed JSON or on non-object rows.
 */
std::vector<RawDriverRecord> parseDriverRecordsJson(const std::string &text);

// Writes records in the format parseDriverRecordsJson() reads.
// Returns false when the file cannot be written.
bool writeDriverRecordsJson(const std::filesystem::path &path,
                            const std::vector<RawDriverRecord> &records);

} // namespace drvkeep
