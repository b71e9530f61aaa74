#include "core/record_normalizer.hpp"

#include <optional>
#include <utility>

#include <QDate>
#include <QDateTime>
#include <QRegularExpression>
#include <QString>

#include "common/logging.hpp"
#include <nlohmann/json.hpp>

namespace drvkeep {

namespace {

std::optional<std::string> cleanText(const std::optional<std::string> &value)
{
    if (!value) {
        return std::nullopt;
    }
    const QString simplified = QString::fromStdString(*value).simplified();
    if (simplified.isEmpty()) {
        return std::nullopt;
    }
    return simplified.toStdString();
}

std::string orUnknown(const std::optional<std::string> &value)
{
    return value ? *value : kUnknown;
}

std::string isoDate(int year, int month, int day)
{
    const QDate date(year, month, day);
    if (!date.isValid()) {
        return {};
    }
    return date.toString(Qt::ISODate).toStdString();
}

std::string lowered(const std::string &value)
{
    return QString::fromStdString(value).toLower().toStdString();
}

} // namespace

std::vector<std::string> RecordNormalizer::defaultExcludedProviders()
{
    return {"microsoft"};
}

RecordNormalizer::RecordNormalizer(std::vector<std::string> excludedProviders)
{
    for (const auto &provider : excludedProviders) {
        const QString prefix = QString::fromStdString(provider).simplified().toLower();
        if (!prefix.isEmpty()) {
            m_excludedProviders.push_back(prefix.toStdString());
        }
    }
}

bool RecordNormalizer::isExcludedProvider(const RawDriverRecord &raw) const
{
    std::optional<std::string> vendor = cleanText(raw.provider);
    if (!vendor) {
        vendor = cleanText(raw.manufacturer);
    }
    if (!vendor) {
        return false;
    }

    const std::string candidate = lowered(*vendor);
    for (const auto &prefix : m_excludedProviders) {
        if (candidate.rfind(prefix, 0) == 0) {
            return true;
        }
    }
    return false;
}

DriverRecord RecordNormalizer::normalize(const RawDriverRecord &raw,
                                         std::size_t discoveryIndex) const
{
    const auto deviceName = cleanText(raw.deviceName);
    const auto hardwareId = cleanText(raw.hardwareId);
    const auto deviceId = cleanText(raw.deviceId);
    if (!deviceName && !hardwareId && !deviceId) {
        throw RecordRejected("record has no device name, hardware id or device id");
    }

    DriverRecord record;
    record.deviceName = orUnknown(deviceName);
    record.description = orUnknown(cleanText(raw.description));
    record.provider = orUnknown(cleanText(raw.provider));
    record.driverVersion = orUnknown(cleanText(raw.driverVersion));
    record.driverDate = raw.driverDate ? normalizeDate(*raw.driverDate) : kUnknown;
    record.deviceClass = orUnknown(cleanText(raw.deviceClass));
    record.classGuid = orUnknown(cleanText(raw.classGuid));
    record.hardwareId = orUnknown(hardwareId);
    record.deviceId = orUnknown(deviceId);

    const auto infName = cleanText(raw.infName);
    record.infName = infName ? lowered(*infName) : kUnknown;
    if (record.infName == lowered(kUnknown)) {
        record.infName = kUnknown;
    }

    record.discoveryIndex = discoveryIndex;
    return record;
}

NormalizeResult RecordNormalizer::normalizeAll(const std::vector<RawDriverRecord> &raws) const
{
    NormalizeResult result;
    result.records.reserve(raws.size());

    for (std::size_t i = 0; i < raws.size(); ++i) {
        const RawDriverRecord &raw = raws[i];
        if (isExcludedProvider(raw)) {
            ++result.excluded;
            continue;
        }

        try {
            result.records.push_back(normalize(raw, i));
        } catch (const RecordRejected &ex) {
            ++result.rejected;
            DKLOG_WARN(QStringLiteral("RecordNormalizer"),
                       QStringLiteral("normalizeAll"),
                       QStringLiteral("record_rejected"),
                       QString::fromUtf8(ex.what()),
                       QStringLiteral("drop_and_count"),
                       logging::defaultWho(),
                       QString(),
                       (nlohmann::json{{"index", i},
                                       {"infName", raw.infName.value_or("")}}));
        }
    }

    DKLOG_INFO(QStringLiteral("RecordNormalizer"),
               QStringLiteral("normalizeAll"),
               QStringLiteral("records_normalized"),
               QStringLiteral("backup_run"),
               QStringLiteral("filter_and_clean"),
               logging::defaultWho(),
               QString(),
               (nlohmann::json{{"input", raws.size()},
                               {"kept", result.records.size()},
                               {"excluded", result.excluded},
                               {"rejected", result.rejected}}));
    return result;
}

std::string RecordNormalizer::normalizeDate(const std::string &value)
{
    const QString text = QString::fromStdString(value).simplified();
    if (text.isEmpty()) {
        return kUnknown;
    }

    // ConvertTo-Json on Windows PowerShell 5 renders DateTime as /Date(ms)/.
    static const QRegularExpression jsonDate(
        QStringLiteral("^/Date\\((-?\\d+)(?:[+-]\\d{4})?\\)/$"));
    const auto jsonMatch = jsonDate.match(text);
    if (jsonMatch.hasMatch()) {
        const qint64 ms = jsonMatch.captured(1).toLongLong();
        return QDateTime::fromMSecsSinceEpoch(ms, Qt::UTC)
            .date()
            .toString(Qt::ISODate)
            .toStdString();
    }

    // WMI CIM_DATETIME: yyyymmddHHMMSS.mmmmmmsUUU
    static const QRegularExpression dmtfDate(QStringLiteral("^(\\d{4})(\\d{2})(\\d{2})"));
    const auto dmtfMatch = dmtfDate.match(text);
    if (dmtfMatch.hasMatch()) {
        const std::string iso = isoDate(dmtfMatch.captured(1).toInt(),
                                        dmtfMatch.captured(2).toInt(),
                                        dmtfMatch.captured(3).toInt());
        if (!iso.empty()) {
            return iso;
        }
    }

    static const QRegularExpression isoPrefix(QStringLiteral("^(\\d{4})-(\\d{2})-(\\d{2})"));
    const auto isoMatch = isoPrefix.match(text);
    if (isoMatch.hasMatch()) {
        const std::string iso = isoDate(isoMatch.captured(1).toInt(),
                                        isoMatch.captured(2).toInt(),
                                        isoMatch.captured(3).toInt());
        if (!iso.empty()) {
            return iso;
        }
    }

    static const QRegularExpression usDate(QStringLiteral("^(\\d{1,2})/(\\d{1,2})/(\\d{4})\\b"));
    const auto usMatch = usDate.match(text);
    if (usMatch.hasMatch()) {
        const std::string iso = isoDate(usMatch.captured(3).toInt(),
                                        usMatch.captured(1).toInt(),
                                        usMatch.captured(2).toInt());
        if (!iso.empty()) {
            return iso;
        }
    }

    return text.toStdString();
}

} // namespace drvkeep
