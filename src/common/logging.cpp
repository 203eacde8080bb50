#include "common/logging.hpp"

#include <QCoreApplication>
#include <QDateTime>
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QThread>
#include <QUuid>

#include <unistd.h>

#include <cstdio>
#include <mutex>

namespace noura::logging {

namespace {

constexpr qint64 kMaxLogSizeBytes = 5 * 1024 * 1024;
constexpr int kRotatedGenerations = 3;

std::mutex g_logMutex;
bool g_traceEnabled = false;
QString g_processName;

thread_local QString t_corrId;

QString levelToString(LogLevel level)
{
    switch (level) {
    case LogLevel::Debug:
        return QStringLiteral("DEBUG");
    case LogLevel::Info:
        return QStringLiteral("INFO");
    case LogLevel::Warn:
        return QStringLiteral("WARN");
    case LogLevel::Error:
        return QStringLiteral("ERROR");
    }
    return QStringLiteral("INFO");
}

QString logFilePath(const QString &processName, const QString &suffix)
{
    const QString base = processName.isEmpty()
        ? QStringLiteral("noura")
        : processName;
    return logsDirPath() + QDir::separator() + base + suffix;
}

void rotateIfNeeded(const QString &path)
{
    QFileInfo info(path);
    if (!info.exists() || info.size() < kMaxLogSizeBytes) {
        return;
    }

    // <path>.1 is the newest rotated file, <path>.N the oldest kept.
    QFile::remove(path + QStringLiteral(".%1").arg(kRotatedGenerations));
    for (int generation = kRotatedGenerations - 1; generation >= 1; --generation) {
        QFile::rename(path + QStringLiteral(".%1").arg(generation),
                      path + QStringLiteral(".%1").arg(generation + 1));
    }
    QFile::rename(path, path + QStringLiteral(".1"));
}

// Invoice numbers, product names and sqlite messages reach the log unchecked.
// Invalid UTF-8 is replaced with U+FFFD so logging never throws into a caller
// that has already committed.
std::string serialize(const nlohmann::json &payload)
{
    return payload.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

QString outcomeToString(MutationOutcome outcome)
{
    switch (outcome) {
    case MutationOutcome::Committed:
        return QStringLiteral("committed");
    case MutationOutcome::Rejected:
        return QStringLiteral("rejected");
    case MutationOutcome::Failed:
        return QStringLiteral("failed");
    }
    return QStringLiteral("committed");
}

void writeLine(const QString &path, const QString &line)
{
    QDir().mkpath(logsDirPath());
    rotateIfNeeded(path);

    QFile file(path);
    if (!file.open(QIODevice::WriteOnly | QIODevice::Append | QIODevice::Text)) {
        fprintf(stderr, "%s\n", line.toUtf8().constData());
        return;
    }

    file.write(line.toUtf8());
    file.write("\n");
}

QString threadIdString()
{
    return QStringLiteral("0x%1")
        .arg(reinterpret_cast<quintptr>(QThread::currentThreadId()), 0, 16);
}

} // namespace

QString logsDirPath()
{
    const QString home = qEnvironmentVariable("HOME");
    if (home.isEmpty()) {
        return QStringLiteral(".local/share/noura/logs");
    }
    return home + QStringLiteral("/.local/share/noura/logs");
}

void initLogging(const QString &processName, bool traceEnabled)
{
    std::lock_guard<std::mutex> lock(g_logMutex);
    g_processName = processName;
    g_traceEnabled = traceEnabled;
}

bool isTraceEnabled()
{
    return g_traceEnabled;
}

void setCorrelationId(const QString &corrId)
{
    t_corrId = corrId;
}

QString currentCorrelationId()
{
    return t_corrId;
}

QString newCorrelationId()
{
    return QUuid::createUuid().toString(QUuid::WithoutBraces);
}

CorrelationScope::CorrelationScope(const QString &corrId)
    : m_prev(t_corrId)
{
    t_corrId = corrId;
}

CorrelationScope::~CorrelationScope()
{
    t_corrId = m_prev;
}

QString defaultProcessName()
{
    if (!g_processName.isEmpty()) {
        return g_processName;
    }
    if (QCoreApplication::instance()) {
        const QString appName = QCoreApplication::applicationName();
        if (!appName.isEmpty()) {
            return appName;
        }
    }
    return QStringLiteral("noura");
}

QString defaultWho()
{
    const QString user = qEnvironmentVariable("USER");
    return QStringLiteral("user:%1,uid:%2")
        .arg(user.isEmpty() ? QStringLiteral("unknown") : user)
        .arg(static_cast<int>(getuid()));
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
    const QString corr = correlationId.isEmpty() ? currentCorrelationId() : correlationId;
    nlohmann::json payload = {
        {"ts", QDateTime::currentDateTimeUtc().toString(Qt::ISODateWithMs).toStdString()},
        {"level", levelToString(level).toStdString()},
        {"process", processName.toStdString()},
        {"thread", threadIdString().toStdString()},
        {"component", component.toStdString()},
        {"where", where.toStdString()},
        {"what", what.toStdString()},
        {"why", why.toStdString()},
        {"how", how.toStdString()},
        {"who", who.toStdString()},
        {"corr", corr.toStdString()},
        {"context", context}
    };

    const QString line = QString::fromStdString(serialize(payload));

    const QString process = processName.isEmpty() ? defaultProcessName() : processName;
    const QString mainPath = logFilePath(process, QStringLiteral(".log"));
    const QString tracePath = logFilePath(process, QStringLiteral("-trace.log"));

    std::lock_guard<std::mutex> lock(g_logMutex);
    if (level != LogLevel::Debug || g_traceEnabled) {
        writeLine(mainPath, line);
    }

    if (g_traceEnabled) {
        writeLine(tracePath, line);
    }
}

void logMutation(const MutationEvent &event)
{
    nlohmann::json context = event.details.is_object() ? event.details : nlohmann::json::object();
    context["entity"] = event.entity;
    context["entityId"] = event.entityId.has_value() ? nlohmann::json(*event.entityId)
                                                     : nlohmann::json(nullptr);
    context["outcome"] = outcomeToString(event.outcome).toStdString();
    if (!event.error.empty()) {
        context["error"] = event.error;
    }

    const QString entity = QString::fromStdString(event.entity);
    switch (event.outcome) {
    case MutationOutcome::Committed:
        logEvent(LogLevel::Info, defaultProcessName(), event.component, event.operation,
                 event.action.isEmpty() ? entity + QStringLiteral("_changed") : event.action,
                 QStringLiteral("user_request"), QStringLiteral("sqlite_transaction"),
                 defaultWho(), QString(), context);
        break;
    case MutationOutcome::Rejected:
        logEvent(LogLevel::Warn, defaultProcessName(), event.component, event.operation,
                 entity + QStringLiteral("_rejected"),
                 QStringLiteral("validation_failed"), QStringLiteral("transaction_rolled_back"),
                 defaultWho(), QString(), context);
        break;
    case MutationOutcome::Failed:
        logEvent(LogLevel::Error, defaultProcessName(), event.component, event.operation,
                 entity + QStringLiteral("_storage_failure"),
                 QStringLiteral("sqlite_error"), QStringLiteral("transaction_rolled_back"),
                 defaultWho(), QString(), context);
        break;
    }
}

} // namespace noura::logging
