#pragma once

#include <QString>

#include "core/driver_source.hpp"

namespace drvkeep {

// Queries Win32_PnPSignedDriver through PowerShell's Get-CimInstance and
// reads the ConvertTo-Json output.
class CimDriverSource : public DriverSource
{
public:
    // Empty program means $DRVKEEP_POWERSHELL, falling back to powershell.exe.
    explicit CimDriverSource(QString powershellProgram = QString());

    std::vector<RawDriverRecord> enumerate() override;
    std::string describe() const override;

    // The PowerShell pipeline that produces the driver list.
    static QString queryScript();

private:
    QString m_program;
};

} // namespace drvkeep
