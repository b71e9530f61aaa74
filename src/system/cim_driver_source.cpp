#include "system/cim_driver_source.hpp"

#include <utility>

#include <QStringList>

#include "common/logging.hpp"
#include "system/driver_records_json.hpp"
#include "common/process_utils.hpp"
#include <nlohmann/json.hpp>

namespace drvkeep {

CimDriverSource::CimDriverSource(QString powershellProgram)
    : m_program(std::move(powershellProgram))
{
    if (m_program.isEmpty()) {
        m_program = qEnvironmentVariable("DRVKEEP_POWERSHELL",
                                         QStringLiteral("powershell.exe"));
    }
}

QString CimDriverSource::queryScript()
{
    // DriverDate is a DateTime on the CIM instance; render it as ISO text so
    // the result does not depend on the PowerShell version's JSON dates.
    return QStringLiteral(
        "[Console]::OutputEncoding = [System.Text.Encoding]::UTF8; "
        "Get-CimInstance -ClassName Win32_PnPSignedDriver | "
        "Select-Object ClassGuid, Description, DeviceClass, DeviceName, "
        "@{Name='DriverDate'; Expression={ if ($_.DriverDate) { $_.DriverDate.ToString('yyyy-MM-dd') } }}, "
        "DriverProviderName, DriverVersion, InfName, HardWareID, DeviceID, Manufacturer | "
        "ConvertTo-Json -Depth 2 -Compress");
}

std::vector<RawDriverRecord> CimDriverSource::enumerate()
{
    const QStringList arguments = {
        QStringLiteral("-NoProfile"),
        QStringLiteral("-NonInteractive"),
        QStringLiteral("-ExecutionPolicy"), QStringLiteral("Bypass"),
        QStringLiteral("-Command"), queryScript(),
    };

    const ProcessResult result = runProcess(m_program, arguments);
    if (!result.started) {
        throw EnumerationError("cannot start " + m_program.toStdString() + ": "
                               + result.errorString.toStdString());
    }
    if (!result.succeeded()) {
        const QString detail = result.standardError.trimmed().isEmpty()
            ? result.errorString
            : result.standardError.trimmed();
        throw EnumerationError("driver query failed (exit code "
                               + std::to_string(result.exitCode) + "): "
                               + detail.toStdString());
    }

    std::vector<RawDriverRecord> records =
        parseDriverRecordsJson(result.rawStandardOutput.toStdString());

    DKLOG_INFO(QStringLiteral("CimDriverSource"),
               QStringLiteral("enumerate"),
               QStringLiteral("drivers_enumerated"),
               QStringLiteral("backup_run"),
               QStringLiteral("get_ciminstance"),
               logging::defaultWho(),
               QString(),
               (nlohmann::json{{"records", records.size()}}));
    return records;
}

std::string CimDriverSource::describe() const
{
    return "Win32_PnPSignedDriver via " + m_program.toStdString();
}

} // namespace drvkeep
