#include "collector/metadata_collector.hpp"

#include <sys/utsname.h>

#include <algorithm>

#include <QSysInfo>
#include <QThread>
#include <QtGlobal>

#include "common/logging.hpp"
#include "common/os_release.hpp"

namespace pkgsnap {

namespace {

std::string orUnknown(const std::string &value)
{
    return value.empty() ? std::string(kUnknownFact) : value;
}

std::string orUnknown(const QString &value)
{
    const QString trimmed = value.trimmed();
    if (trimmed.isEmpty() || trimmed == QStringLiteral("unknown")) {
        return kUnknownFact;
    }
    return trimmed.toStdString();
}

std::string fieldOrEmpty(const OsReleaseFields &fields, const std::string &key)
{
    const auto it = fields.find(key);
    return it == fields.end() ? std::string() : it->second;
}

} // namespace

SystemMetadata collectSystemMetadata(const QString &osReleasePath)
{
    SystemMetadata metadata;

    metadata.hostname = orUnknown(QSysInfo::machineHostName());

    struct utsname uts {};
    if (uname(&uts) == 0) {
        metadata.osName = orUnknown(std::string(uts.sysname));
        metadata.osRelease = orUnknown(std::string(uts.release));
        metadata.kernelVersion = orUnknown(std::string(uts.version));
        metadata.machine = orUnknown(std::string(uts.machine));
    } else {
        metadata.osName = orUnknown(QSysInfo::kernelType());
        metadata.osRelease = orUnknown(QSysInfo::kernelVersion());
        metadata.kernelVersion = kUnknownFact;
        metadata.machine = kUnknownFact;
    }

    const auto osRelease = readOsRelease(osReleasePath);
    if (osRelease.has_value()) {
        metadata.distributionId = orUnknown(fieldOrEmpty(*osRelease, "ID"));
        metadata.distributionName = orUnknown(fieldOrEmpty(*osRelease, "NAME"));
        metadata.distributionVersion = orUnknown(fieldOrEmpty(*osRelease, "VERSION_ID"));
        metadata.distributionCodename = orUnknown(fieldOrEmpty(*osRelease, "VERSION_CODENAME"));
    } else {
        metadata.distributionId = orUnknown(QSysInfo::productType());
        metadata.distributionName = orUnknown(QSysInfo::prettyProductName());
        metadata.distributionVersion = orUnknown(QSysInfo::productVersion());
        metadata.distributionCodename = kUnknownFact;
    }

    metadata.runtimeVersion = orUnknown(QString::fromLatin1(qVersion()));
    metadata.runtimeImplementation = orUnknown(QSysInfo::buildAbi());

    metadata.cpuCount = std::max(0, QThread::idealThreadCount());
    metadata.cpuArchitecture = orUnknown(QSysInfo::currentCpuArchitecture());

    PKGSNAP_LOG_DEBUG(QStringLiteral("MetadataCollector"),
                      QStringLiteral("collectSystemMetadata"),
                      QStringLiteral("metadata_collected"),
                      QStringLiteral("snapshot_run"),
                      QStringLiteral("qsysinfo_uname_os_release"),
                      pkgsnap::logging::defaultWho(),
                      QString(),
                      nlohmann::json{{"hostname", metadata.hostname},
                                     {"distribution", metadata.distributionId},
                                     {"osReleaseRead", osRelease.has_value()}});
    return metadata;
}

} // namespace pkgsnap
