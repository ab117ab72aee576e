#include "collector/manager_detector.hpp"

#include <cctype>
#include <utility>

#include <QString>
#include <QStringList>
#include <QSysInfo>

#include "common/json_utils.hpp"
#include "common/logging.hpp"
#include "common/os_release.hpp"

namespace pkgsnap {

namespace {

struct DetectionRule {
    std::vector<std::string> needles;
    PackageManagerKind kind;
};

const std::vector<DetectionRule> &detectionRules()
{
    static const std::vector<DetectionRule> rules{
        {{"ubuntu", "debian"}, PackageManagerKind::Apt},
        {{"centos", "redhat", "rhel", "fedora"}, PackageManagerKind::Yum},
        {{"arch"}, PackageManagerKind::Pacman},
        {{"suse"}, PackageManagerKind::Zypper},
    };
    return rules;
}

std::string toLower(std::string value)
{
    for (auto &ch : value) {
        ch = static_cast<char>(std::tolower(static_cast<unsigned char>(ch)));
    }
    return value;
}

PackageManagerKind matchToken(const std::string &token)
{
    const std::string lowered = toLower(token);
    if (lowered.empty()) {
        return PackageManagerKind::Unknown;
    }
    for (const auto &rule : detectionRules()) {
        for (const auto &needle : rule.needles) {
            if (lowered.find(needle) != std::string::npos) {
                return rule.kind;
            }
        }
    }
    return PackageManagerKind::Unknown;
}

} // namespace

PackageManagerKind detectFromIdentity(const DistributionIdentity &identity)
{
    const PackageManagerKind byId = matchToken(identity.id);
    if (byId != PackageManagerKind::Unknown) {
        return byId;
    }

    for (const auto &like : identity.idLike) {
        const PackageManagerKind byLike = matchToken(like);
        if (byLike != PackageManagerKind::Unknown) {
            return byLike;
        }
    }
    return PackageManagerKind::Unknown;
}

HostManagerDetector::HostManagerDetector(std::string osReleasePath)
    : m_osReleasePath(std::move(osReleasePath))
{
}

DistributionIdentity HostManagerDetector::readIdentity() const
{
    DistributionIdentity identity;

    const auto fields = readOsRelease(QString::fromStdString(m_osReleasePath));
    if (fields.has_value()) {
        if (const auto it = fields->find("ID"); it != fields->end()) {
            identity.id = it->second;
        }
        if (const auto it = fields->find("ID_LIKE"); it != fields->end()) {
            const QStringList tokens = QString::fromStdString(it->second)
                                           .split(QChar(' '), Qt::SkipEmptyParts);
            for (const QString &token : tokens) {
                identity.idLike.push_back(token.toStdString());
            }
        }
    }

    if (identity.id.empty()) {
        // Qt reads the same file but also knows the lsb-release fallbacks.
        const QString productType = QSysInfo::productType();
        if (productType != QStringLiteral("unknown")) {
            identity.id = productType.toStdString();
        }
    }

    return identity;
}

PackageManagerKind HostManagerDetector::detect() const
{
    const DistributionIdentity identity = readIdentity();
    const PackageManagerKind kind = detectFromIdentity(identity);

    nlohmann::json idLike = identity.idLike;
    PKGSNAP_LOG_INFO(QStringLiteral("ManagerDetector"),
                     QStringLiteral("detect"),
                     QStringLiteral("package_manager_detected"),
                     QStringLiteral("snapshot_run"),
                     QStringLiteral("os_release"),
                     pkgsnap::logging::defaultWho(),
                     QString(),
                     nlohmann::json{{"id", identity.id},
                                    {"idLike", idLike},
                                    {"kind", toKindString(kind)}});
    return kind;
}

FixedManagerDetector::FixedManagerDetector(PackageManagerKind kind)
    : m_kind(kind)
{
}

PackageManagerKind FixedManagerDetector::detect() const
{
    return m_kind;
}

} // namespace pkgsnap
