#pragma once

#include <filesystem>
#include <string>

#include "common/models.hpp"

namespace drvkeep {

// Copies one driver package (an INF and the files it references) into a
// directory. Implementations return Success with the number of files written
// or Failed with a classified kind; they never throw for an export failure.
class DriverExporter
{
public:
    virtual ~DriverExporter() = default;

    // False for definition files the exporter has no way to copy, such as
    // inbox INFs that were never published to the driver store.
    virtual bool canExport(const std::string &definitionFile) const = 0;

    virtual ExportOutcome exportDriver(const std::string &definitionFile,
                                       const std::filesystem::path &destination) = 0;
};

} // namespace drvkeep
