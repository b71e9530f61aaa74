#include "system/driver_records_json.hpp"

#include <QFile>
#include <QString>

#include "common/json_utils.hpp"
#include "core/driver_source.hpp"

namespace drvkeep {

std::vector<RawDriverRecord> parseDriverRecordsJson(const std::string &input)
{
    // PowerShell may prefix UTF-8 output with a byte order mark.
    const std::string bom = "\xEF\xBB\xBF";
    const std::string text = input.rfind(bom, 0) == 0 ? input.substr(bom.size()) : input;
    if (text.find_first_not_of(" \t\r\n") == std::string::npos) {
        return {};
    }

    nlohmann::json document;
    try {
        document = nlohmann::json::parse(text);
    } catch (const nlohmann::json::parse_error &ex) {
        throw EnumerationError(std::string("driver list is not valid JSON: ") + ex.what());
    }

    if (document.is_null()) {
        return {};
    }
    if (document.is_object()) {
        return {document.get<RawDriverRecord>()};
    }
    if (!document.is_array()) {
        throw EnumerationError("driver list must be a JSON array of objects");
    }

    std::vector<RawDriverRecord> records;
    records.reserve(document.size());
    for (const auto &row : document) {
        if (!row.is_object()) {
            throw EnumerationError("driver list contains a non-object entry");
        }
        records.push_back(row.get<RawDriverRecord>());
    }
    return records;
}

bool writeDriverRecordsJson(const std::filesystem::path &path,
                            const std::vector<RawDriverRecord> &records)
{
    QFile file(QString::fromStdString(path.u8string()));
    if (!file.open(QIODevice::WriteOnly | QIODevice::Truncate)) {
        return false;
    }
    const nlohmann::json payload = records;
    const QByteArray data = QByteArray::fromStdString(
        payload.dump(2, ' ', false, nlohmann::json::error_handler_t::replace));
    return file.write(data) == data.size();
}

} // namespace drvkeep
