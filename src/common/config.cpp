#include "common/config.hpp"

#include <QString>
#include <QtGlobal>

#include "common/json_utils.hpp"
#include "common/logging.hpp"

namespace pkgsnap {

RunConfig loadRunConfig()
{
    RunConfig config;
    config.traceEnabled = qEnvironmentVariableIntValue("PKGSNAP_TRACE") == 1;

    const QString forced = qEnvironmentVariable("PKGSNAP_FORCE_MANAGER").trimmed().toLower();
    if (!forced.isEmpty()) {
        const PackageManagerKind kind = parseKindString(forced.toStdString());
        if (kind != PackageManagerKind::Unknown) {
            config.forcedManager = kind;
        } else {
            PKGSNAP_LOG_WARN(QStringLiteral("Config"),
                             QStringLiteral("loadRunConfig"),
                             QStringLiteral("ignored_forced_manager"),
                             QStringLiteral("environment"),
                             QStringLiteral("PKGSNAP_FORCE_MANAGER"),
                             pkgsnap::logging::defaultWho(),
                             QString(),
                             nlohmann::json{{"value", forced.toStdString()}});
        }
    }

    bool ok = false;
    const int timeoutMs = qEnvironmentVariableIntValue("PKGSNAP_COMMAND_TIMEOUT_MS", &ok);
    if (ok && timeoutMs > 0) {
        config.commandTimeout = std::chrono::milliseconds(timeoutMs);
    }

    return config;
}

} // namespace pkgsnap
