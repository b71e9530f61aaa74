#pragma once

#include <cstddef>
#include <filesystem>
#include <string>

#include <QString>

#include "core/driver_exporter.hpp"

namespace drvkeep {

// Exports a published driver package with `pnputil /export-driver`.
class PnpUtilExporter : public DriverExporter
{
public:
    // Empty program means $DRVKEEP_PNPUTIL, falling back to pnputil.
    explicit PnpUtilExporter(QString program = QString());

    bool canExport(const std::string &definitionFile) const override;

    ExportOutcome exportDriver(const std::string &definitionFile,
                               const std::filesystem::path &destination) override;

    // pnputil only exports driver store names of the form oem<N>.inf.
    static bool isPublishedName(const std::string &definitionFile);

    static ExportFailureKind classifyFailure(int exitCode,
                                             const QString &standardOutput,
                                             const QString &standardError);

    // Regular files below directory, recursively.
    static std::size_t countFiles(const std::filesystem::path &directory);

private:
    QString m_program;
};

} // namespace drvkeep
