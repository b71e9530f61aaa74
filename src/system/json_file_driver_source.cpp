#include "system/json_file_driver_source.hpp"

#include <utility>

#include <QFile>
#include <QString>

#include "common/logging.hpp"
#include "system/driver_records_json.hpp"
#include <nlohmann/json.hpp>

namespace drvkeep {

JsonFileDriverSource::JsonFileDriverSource(std::filesystem::path path)
    : m_path(std::move(path))
{
}

std::vector<RawDriverRecord> JsonFileDriverSource::enumerate()
{
    QFile file(QString::fromStdString(m_path.u8string()));
    if (!file.open(QIODevice::ReadOnly)) {
        throw EnumerationError("cannot read " + m_path.u8string() + ": "
                               + file.errorString().toStdString());
    }
    const QByteArray data = file.readAll();

    std::vector<RawDriverRecord> records = parseDriverRecordsJson(data.toStdString());

    DKLOG_INFO(QStringLiteral("JsonFileDriverSource"),
               QStringLiteral("enumerate"),
               QStringLiteral("drivers_loaded"),
               QStringLiteral("backup_run"),
               QStringLiteral("json_file"),
               logging::defaultWho(),
               QString(),
               (nlohmann::json{{"path", m_path.u8string()},
                               {"records", records.size()}}));
    return records;
}

std::string JsonFileDriverSource::describe() const
{
    return "driver list " + m_path.u8string();
}

} // namespace drvkeep
