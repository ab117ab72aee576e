#include "common/logging.hpp"

#include <QCoreApplication>
#include <QDateTime>
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QThread>

#include <unistd.h>

#include <cstdio>
#include <mutex>
#include <utility>

namespace pkgsnap::logging {

namespace {

struct LogSettings {
    QString processName;
    bool trace = false;
    bool toFile = true;
};

std::mutex &settingsMutex()
{
    static std::mutex mutex;
    return mutex;
}

LogSettings &settings()
{
    static LogSettings instance;
    return instance;
}

thread_local QString t_correlationId;

const char *levelName(LogLevel level)
{
    switch (level) {
    case LogLevel::Debug:
        return "DEBUG";
    case LogLevel::Info:
        return "INFO";
    case LogLevel::Warn:
        return "WARN";
    case LogLevel::Error:
        return "ERROR";
    }
    return "INFO";
}

void printToStderr(const QByteArray &line)
{
    std::fprintf(stderr, "%s\n", line.constData());
}

// Appends JSON lines to one file under logsDirPath(). Opened per line so a
// removed log directory is recreated on the next event.
class LogSink {
public:
    explicit LogSink(const QString &fileName)
        : m_path(QDir(logsDirPath()).filePath(fileName))
    {
    }

    void append(const QByteArray &line) const
    {
        if (!QDir().mkpath(logsDirPath())) {
            printToStderr(line);
            return;
        }
        rotateLogFile(m_path);

        QFile file(m_path);
        if (!file.open(QIODevice::WriteOnly | QIODevice::Append)) {
            printToStderr(line);
            return;
        }
        file.write(line + '\n');
    }

private:
    QString m_path;
};

} // namespace

nlohmann::json toJson(const LogEvent &event)
{
    const QString thread = QStringLiteral("0x%1")
        .arg(reinterpret_cast<quintptr>(QThread::currentThreadId()), 0, 16);

    return {
        {"ts", QDateTime::currentDateTimeUtc().toString(Qt::ISODateWithMs).toStdString()},
        {"level", levelName(event.level)},
        {"process", event.process.toStdString()},
        {"thread", thread.toStdString()},
        {"component", event.component.toStdString()},
        {"where", event.where.toStdString()},
        {"what", event.what.toStdString()},
        {"why", event.why.toStdString()},
        {"how", event.how.toStdString()},
        {"who", event.who.toStdString()},
        {"corr", event.correlationId.toStdString()},
        {"context", event.context}
    };
}

void initLogging(const QString &processName, bool traceEnabled)
{
    std::lock_guard<std::mutex> lock(settingsMutex());
    settings().processName = processName;
    settings().trace = traceEnabled;
}

bool isTraceEnabled()
{
    std::lock_guard<std::mutex> lock(settingsMutex());
    return settings().trace;
}

void setFileLoggingEnabled(bool enabled)
{
    std::lock_guard<std::mutex> lock(settingsMutex());
    settings().toFile = enabled;
}

bool isFileLoggingEnabled()
{
    std::lock_guard<std::mutex> lock(settingsMutex());
    return settings().toFile;
}

QString logsDirPath()
{
    const QString relative = QStringLiteral(".local/share/pkgsnap/logs");
    const QString home = qEnvironmentVariable("HOME");
    return home.isEmpty() ? relative : QDir(home).filePath(relative);
}

void rotateLogFile(const QString &path, qint64 maxBytes)
{
    const QFileInfo info(path);
    if (!info.exists() || info.size() < maxBytes) {
        return;
    }

    const auto generation = [&path](int n) {
        return path + QLatin1Char('.') + QString::number(n);
    };
    QFile::remove(generation(kRotatedGenerations));
    for (int n = kRotatedGenerations - 1; n >= 1; --n) {
        if (QFile::exists(generation(n))) {
            QFile::rename(generation(n), generation(n + 1));
        }
    }
    QFile::rename(path, generation(1));
}

void setCorrelationId(const QString &corrId)
{
    t_correlationId = corrId;
}

QString currentCorrelationId()
{
    return t_correlationId;
}

CorrelationScope::CorrelationScope(const QString &corrId)
    : m_prev(t_correlationId)
{
    t_correlationId = corrId;
}

CorrelationScope::~CorrelationScope()
{
    t_correlationId = m_prev;
}

QString defaultProcessName()
{
    {
        std::lock_guard<std::mutex> lock(settingsMutex());
        if (!settings().processName.isEmpty()) {
            return settings().processName;
        }
    }
    if (QCoreApplication::instance() && !QCoreApplication::applicationName().isEmpty()) {
        return QCoreApplication::applicationName();
    }
    return QStringLiteral("pkgsnap");
}

QString defaultWho()
{
    char hostname[256] = {};
    if (gethostname(hostname, sizeof(hostname) - 1) != 0) {
        hostname[0] = '\0';
    }
    return QStringLiteral("host:%1,uid:%2")
        .arg(QString::fromLocal8Bit(hostname))
        .arg(static_cast<qulonglong>(getuid()));
}

void emitEvent(LogEvent event)
{
    if (event.process.isEmpty()) {
        event.process = defaultProcessName();
    }
    if (event.correlationId.isEmpty()) {
        event.correlationId = currentCorrelationId();
    }
    const QByteArray line = QByteArray::fromStdString(toJson(event).dump());

    std::lock_guard<std::mutex> lock(settingsMutex());
    const LogSettings &current = settings();
    if (!current.toFile) {
        if (current.trace) {
            printToStderr(line);
        }
        return;
    }

    if (event.level != LogLevel::Debug || current.trace) {
        LogSink(event.process + QStringLiteral(".log")).append(line);
    }
    if (current.trace) {
        LogSink(event.process + QStringLiteral("-trace.log")).append(line);
    }
}

void logEvent(LogLevel level,
              const QString &processName,
              const QString &component,
              const QString &where,
              const QString &what,
              const QString &why,
              const QString &how,
              const QString &who,
              const QString &correlationId,
              const nlohmann::json &context)
{
    LogEvent event;
    event.level = level;
    event.process = processName;
    event.component = component;
    event.where = where;
    event.what = what;
    event.why = why;
    event.how = how;
    event.who = who;
    event.correlationId = correlationId;
    event.context = context;
    emitEvent(std::move(event));
}

} // namespace pkgsnap::logging
