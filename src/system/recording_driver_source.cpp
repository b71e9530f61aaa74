#include "system/recording_driver_source.hpp"

#include <utility>

#include <QString>

#include "common/logging.hpp"
#include "system/driver_records_json.hpp"
#include <nlohmann/json.hpp>

namespace drvkeep {

RecordingDriverSource::RecordingDriverSource(DriverSource &inner,
                                             std::filesystem::path path)
    : m_inner(inner)
    , m_path(std::move(path))
{
}

std::vector<RawDriverRecord> RecordingDriverSource::enumerate()
{
    std::vector<RawDriverRecord> records = m_inner.enumerate();

    if (!writeDriverRecordsJson(m_path, records)) {
        throw EnumerationError("cannot save driver list to " + m_path.u8string());
    }

    DKLOG_INFO(QStringLiteral("RecordingDriverSource"),
               QStringLiteral("enumerate"),
               QStringLiteral("drivers_saved"),
               QStringLiteral("save_records"),
               QStringLiteral("json_file"),
               logging::defaultWho(),
               QString(),
               (nlohmann::json{{"path", m_path.u8string()},
                               {"records", records.size()}}));
    return records;
}

std::string RecordingDriverSource::describe() const
{
    return m_inner.describe();
}

} // namespace drvkeep
