#pragma once

#include <QString>

#include <cstdint>
#include <optional>
#include <string>

#include <nlohmann/json.hpp>

namespace noura::logging {

enum class LogLevel {
    Debug,
    Info,
    Warn,
    Error
};

// Initialize logging for the current process. Call early in main().
void initLogging(const QString &processName, bool traceEnabled);

bool isTraceEnabled();

// Directory holding <process>.log and <process>-trace.log.
QString logsDirPath();

// Thread-local correlation support for linking the events of one command.
void setCorrelationId(const QString &corrId);
QString currentCorrelationId();
QString newCorrelationId();

class CorrelationScope {
public:
    explicit CorrelationScope(const QString &corrId);
    ~CorrelationScope();

private:
    QString m_prev;
};

// Structured log event. All fields are required; use empty strings where unknown.
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

enum class MutationOutcome {
    Committed,
    Rejected,   // validation or stock check refused the write
    Failed      // storage error, transaction rolled back
};

// A write against a customer, product, invoice or settings row.
// Committed events log at INFO, rejected ones at WARN and failed ones at ERROR.
// The context of the resulting line always carries entity, entityId and outcome.
struct MutationEvent {
    QString component;
    QString operation;
    QString action;              // e.g. "invoice_created"; used when committed
    std::string entity;
    std::optional<int64_t> entityId;
    MutationOutcome outcome = MutationOutcome::Committed;
    std::string error;
    nlohmann::json details = nlohmann::json::object();
};

void logMutation(const MutationEvent &event);

} // namespace noura::logging

#define NLOG_DEBUG(component, where, what, why, how, who, corr, ctxJson) \
    ::noura::logging::logEvent(::noura::logging::LogLevel::Debug, \
                               ::noura::logging::defaultProcessName(), \
                               (component), (where), (what), (why), (how), (who), (corr), (ctxJson))

#define NLOG_INFO(component, where, what, why, how, who, corr, ctxJson) \
    ::noura::logging::logEvent(::noura::logging::LogLevel::Info, \
                               ::noura::logging::defaultProcessName(), \
                               (component), (where), (what), (why), (how), (who), (corr), (ctxJson))

#define NLOG_WARN(component, where, what, why, how, who, corr, ctxJson) \
    ::noura::logging::logEvent(::noura::logging::LogLevel::Warn, \
                               ::noura::logging::defaultProcessName(), \
                               (component), (where), (what), (why), (how), (who), (corr), (ctxJson))

#define NLOG_ERROR(component, where, what, why, how, who, corr, ctxJson) \
    ::noura::logging::logEvent(::noura::logging::LogLevel::Error, \
                               ::noura::logging::defaultProcessName(), \
                               (component), (where), (what), (why), (how), (who), (corr), (ctxJson))
