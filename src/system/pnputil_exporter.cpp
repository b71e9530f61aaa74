#include "system/pnputil_exporter.hpp"

#include <cctype>
#include <utility>

#include <QDir>
#include <QDirIterator>
#include <QStringList>

#include "common/logging.hpp"
#include "common/process_utils.hpp"
#include <nlohmann/json.hpp>

namespace drvkeep {

namespace {

// Win32 error codes pnputil returns as its exit status.
constexpr int kErrorFileNotFound = 2;
constexpr int kErrorPathNotFound = 3;
constexpr int kErrorAccessDenied = 5;
constexpr int kErrorInvalidParameter = 87;
constexpr int kErrorFilenameExcedRange = 206;

QString firstNonEmptyLine(const QString &text)
{
    const QStringList lines = text.split(QChar('\n'), Qt::SkipEmptyParts);
    for (const QString &line : lines) {
        const QString trimmed = line.trimmed();
        if (!trimmed.isEmpty()) {
            return trimmed;
        }
    }
    return QString();
}

} // namespace

PnpUtilExporter::PnpUtilExporter(QString program)
    : m_program(std::move(program))
{
    if (m_program.isEmpty()) {
        m_program = qEnvironmentVariable("DRVKEEP_PNPUTIL", QStringLiteral("pnputil"));
    }
}

bool PnpUtilExporter::isPublishedName(const std::string &definitionFile)
{
    const std::string prefix = "oem";
    const std::string suffix = ".inf";
    if (definitionFile.size() <= prefix.size() + suffix.size()
        || definitionFile.compare(0, prefix.size(), prefix) != 0
        || definitionFile.compare(definitionFile.size() - suffix.size(), suffix.size(),
                                  suffix) != 0) {
        return false;
    }
    for (const char ch : definitionFile) {
        const auto uch = static_cast<unsigned char>(ch);
        if (!std::islower(uch) && !std::isdigit(uch) && ch != '.' && ch != '_') {
            return false;
        }
    }
    return true;
}

ExportFailureKind PnpUtilExporter::classifyFailure(int exitCode,
                                                   const QString &standardOutput,
                                                   const QString &standardError)
{
    const QString out = standardOutput.toLower();
    const QString err = standardError.toLower();

    if (exitCode == kErrorAccessDenied
        || err.contains(QStringLiteral("access")) || err.contains(QStringLiteral("denied"))
        || out.contains(QStringLiteral("access is denied"))) {
        return ExportFailureKind::PermissionDenied;
    }
    if (exitCode == kErrorFileNotFound || exitCode == kErrorPathNotFound
        || err.contains(QStringLiteral("not found")) || err.contains(QStringLiteral("cannot find"))
        || out.contains(QStringLiteral("not found")) || out.contains(QStringLiteral("cannot find"))) {
        return ExportFailureKind::NotFound;
    }
    if (exitCode == kErrorInvalidParameter || exitCode == kErrorFilenameExcedRange
        || out.contains(QStringLiteral("missing or invalid target directory"))) {
        return ExportFailureKind::PathTooLong;
    }
    return ExportFailureKind::Other;
}

std::size_t PnpUtilExporter::countFiles(const std::filesystem::path &directory)
{
    std::size_t count = 0;
    QDirIterator it(QString::fromStdString(directory.u8string()),
                    QDir::Files | QDir::Hidden | QDir::System | QDir::NoDotAndDotDot,
                    QDirIterator::Subdirectories);
    while (it.hasNext()) {
        it.next();
        ++count;
    }
    return count;
}

bool PnpUtilExporter::canExport(const std::string &definitionFile) const
{
    return isPublishedName(definitionFile);
}

ExportOutcome PnpUtilExporter::exportDriver(const std::string &definitionFile,
                                            const std::filesystem::path &destination)
{
    if (!isPublishedName(definitionFile)) {
        return ExportOutcome::failed(ExportFailureKind::NotFound,
                                     definitionFile + " is not a published oem*.inf driver package");
    }

    const QString target = QDir::toNativeSeparators(
        QString::fromStdString(destination.u8string()));
    const ProcessResult result = runProcess(
        m_program,
        {QStringLiteral("/export-driver"), QString::fromStdString(definitionFile), target});

    if (!result.started) {
        return ExportOutcome::failed(ExportFailureKind::NotFound,
                                     "cannot start " + m_program.toStdString() + ": "
                                         + result.errorString.toStdString());
    }
    if (result.succeeded()) {
        return ExportOutcome::success(countFiles(destination));
    }

    const ExportFailureKind kind =
        classifyFailure(result.exitCode, result.standardOutput, result.standardError);
    QString detail = firstNonEmptyLine(result.standardError);
    if (detail.isEmpty()) {
        detail = firstNonEmptyLine(result.standardOutput);
    }
    if (detail.isEmpty()) {
        detail = result.errorString;
    }

    DKLOG_WARN(QStringLiteral("PnpUtilExporter"),
               QStringLiteral("exportDriver"),
               QStringLiteral("pnputil_failed"),
               QStringLiteral("nonzero_exit"),
               QStringLiteral("export_driver"),
               logging::defaultWho(),
               QString(),
               (nlohmann::json{{"inf", definitionFile},
                               {"exitCode", result.exitCode},
                               {"stdout", result.standardOutput.trimmed().toStdString()},
                               {"stderr", result.standardError.trimmed().toStdString()}}));

    return ExportOutcome::failed(kind, "pnputil exit code " + std::to_string(result.exitCode)
                                           + (detail.isEmpty() ? std::string()
                                                               : ": " + detail.toStdString()));
}

} // namespace drvkeep
