#include "core/name_resolver.hpp"

#include <QChar>
#include <QString>
#include <QStringList>

#include "common/logging.hpp"
#include <nlohmann/json.hpp>

namespace drvkeep {

namespace {

const QString kIllegalPathChars = QStringLiteral("\\/:*?\"<>|");

bool isUnsafeChar(QChar ch)
{
    return ch.unicode() < 0x20 || ch.unicode() == 0x7f || kIllegalPathChars.contains(ch);
}

// DOS device names cannot be used as folder names on the target system,
// with or without an extension.
bool isReservedDeviceName(const QString &segment)
{
    static const QStringList reserved = {
        QStringLiteral("con"), QStringLiteral("prn"), QStringLiteral("aux"),
        QStringLiteral("nul"),
        QStringLiteral("com1"), QStringLiteral("com2"), QStringLiteral("com3"),
        QStringLiteral("com4"), QStringLiteral("com5"), QStringLiteral("com6"),
        QStringLiteral("com7"), QStringLiteral("com8"), QStringLiteral("com9"),
        QStringLiteral("lpt1"), QStringLiteral("lpt2"), QStringLiteral("lpt3"),
        QStringLiteral("lpt4"), QStringLiteral("lpt5"), QStringLiteral("lpt6"),
        QStringLiteral("lpt7"), QStringLiteral("lpt8"), QStringLiteral("lpt9"),
    };
    const QString stem = segment.section(QChar('.'), 0, 0).trimmed().toLower();
    return reserved.contains(stem);
}

std::string foldCase(const std::string &value)
{
    return QString::fromStdString(value).toCaseFolded().toStdString();
}

} // namespace

std::string NameResolver::classSegment(const std::string &deviceClass)
{
    const QString segment = QString::fromStdString(deviceClass);
    if (segment.isEmpty()
        || static_cast<std::size_t>(segment.size()) > kMaxClassSegmentLength
        || segment != segment.trimmed()
        || segment.endsWith(QChar('.'))
        || segment == QStringLiteral(".")
        || segment == QStringLiteral("..")
        || isReservedDeviceName(segment)) {
        return kUnknown;
    }
    for (const QChar ch : segment) {
        if (isUnsafeChar(ch)) {
            return kUnknown;
        }
    }
    return deviceClass;
}

std::string NameResolver::sanitizeComponent(const std::string &value)
{
    QString sanitized = QString::fromStdString(value);
    for (auto &ch : sanitized) {
        if (isUnsafeChar(ch)) {
            ch = QChar(kPlaceholder);
        }
    }
    return sanitized.trimmed().toStdString();
}

std::string NameResolver::baseFolderName(const DriverRecord &primary)
{
    QString name = QString::fromStdString(sanitizeComponent(primary.deviceName));
    if (static_cast<std::size_t>(name.size()) > kMaxDeviceNameLength) {
        name.truncate(static_cast<int>(kMaxDeviceNameLength));
        if (name.back().isHighSurrogate()) {
            name.chop(1);
        }
        name = name.trimmed();
    }
    if (name.isEmpty()) {
        name = QString::fromStdString(kUnknown);
    }

    std::string version = sanitizeComponent(primary.driverVersion);
    if (version.empty()) {
        version = kUnknown;
    }

    return name.toStdString() + "_" + version + " Package";
}

std::string NameResolver::issue(const std::string &classSegment, const std::string &baseName)
{
    auto &issued = m_issued[foldCase(classSegment)];
    if (issued.insert(foldCase(baseName)).second) {
        return baseName;
    }

    for (int suffix = 2;; ++suffix) {
        const std::string candidate = baseName + " (" + std::to_string(suffix) + ")";
        if (issued.insert(foldCase(candidate)).second) {
            DKLOG_DEBUG(QStringLiteral("NameResolver"),
                        QStringLiteral("issue"),
                        QStringLiteral("folder_name_disambiguated"),
                        QStringLiteral("name_collision"),
                        QStringLiteral("numeric_suffix"),
                        logging::defaultWho(),
                        QString(),
                        (nlohmann::json{{"classSegment", classSegment},
                                        {"base", baseName},
                                        {"issued", candidate}}));
            return candidate;
        }
    }
}

void NameResolver::resolve(std::vector<ClassBucket> &buckets)
{
    for (auto &bucket : buckets) {
        bucket.classSegment = classSegment(bucket.deviceClass);
        for (auto &package : bucket.packages) {
            package.folderName = issue(bucket.classSegment, baseFolderName(package.primary()));
        }
    }
}

std::string packageRelativePath(const ClassBucket &bucket, const DriverPackage &package)
{
    return bucket.classSegment + "/" + package.folderName;
}

} // namespace drvkeep
