#pragma once

#include <QString>

#include <nlohmann/json.hpp>

namespace pkgsnap::logging {

enum class LogLevel {
    Debug,
    Info,
    Warn,
    Error
};

// A log file grows to this size before it is shifted to <file>.1.
constexpr qint64 kRotateAtBytes = 5 * 1024 * 1024;
// Rotated generations kept beside the live file (<file>.1 .. <file>.N).
constexpr int kRotatedGenerations = 3;

// One structured event, serialized as a single JSON line.
struct LogEvent {
    LogLevel level = LogLevel::Info;
    QString process;
    QString component;
    QString where;
    QString what;
    QString why;
    QString how;
    QString who;
    QString correlationId;
    nlohmann::json context = nlohmann::json::object();
};

nlohmann::json toJson(const LogEvent &event);

void initLogging(const QString &processName, bool traceEnabled);
bool isTraceEnabled();

// Dry runs switch this off: no log directory or file is created. Trace
// events then go to stderr instead.
void setFileLoggingEnabled(bool enabled);
bool isFileLoggingEnabled();

// $HOME/.local/share/pkgsnap/logs
QString logsDirPath();

// Shifts <path>.N-1 -> <path>.N down to <path> -> <path>.1 once path has
// reached maxBytes. The oldest generation past kRotatedGenerations is dropped.
void rotateLogFile(const QString &path, qint64 maxBytes = kRotateAtBytes);

void setCorrelationId(const QString &corrId);
QString currentCorrelationId();

// Restores the previous id on scope exit.
class CorrelationScope {
public:
    explicit CorrelationScope(const QString &corrId);
    ~CorrelationScope();

private:
    QString m_prev;
};

void emitEvent(LogEvent event);

// Field-wise convenience used by the PKGSNAP_LOG_* macros. An empty
// correlationId picks up the current scope's id.
void logEvent(LogLevel level,
              const QString &processName,
              const QString &component,
              const QString &where,
              const QString &what,
              const QString &why,
              const QString &how,
              const QString &who,
              const QString &correlationId,
              const nlohmann::json &context = nlohmann::json::object());

QString defaultProcessName();
QString defaultWho();

} // namespace pkgsnap::logging

#define PKGSNAP_LOG(level, component, where, what, why, how, who, corr, ctxJson) \
    ::pkgsnap::logging::logEvent((level), ::pkgsnap::logging::defaultProcessName(), \
                                 (component), (where), (what), (why), (how), (who), (corr), (ctxJson))

#define PKGSNAP_LOG_DEBUG(...) PKGSNAP_LOG(::pkgsnap::logging::LogLevel::Debug, __VA_ARGS__)
#define PKGSNAP_LOG_INFO(...) PKGSNAP_LOG(::pkgsnap::logging::LogLevel::Info, __VA_ARGS__)
#define PKGSNAP_LOG_WARN(...) PKGSNAP_LOG(::pkgsnap::logging::LogLevel::Warn, __VA_ARGS__)
#define PKGSNAP_LOG_ERROR(...) PKGSNAP_LOG(::pkgsnap::logging::LogLevel::Error, __VA_ARGS__)
