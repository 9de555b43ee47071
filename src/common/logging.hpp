#pragma once

#include <QString>

#include <nlohmann/json.hpp>

namespace patchfleet::logging {

enum class LogLevel {
    Debug,
    Info,
    Warn,
    Error
};

// Events go to $HOME/.local/share/patchfleet/logs/<processName>.log as JSON
// lines, rotated at 5 MiB with three generations kept. Debug events are
// dropped unless trace is enabled; trace mode also writes
// <processName>-trace.log and echoes a short line per event to stderr.
void initLogging(const QString &processName, bool traceEnabled);

bool isTraceEnabled();

// Thread-local correlation support. Scheduler workers inherit the id of the
// operation that dispatched them.
void setCorrelationId(const QString &corrId);
QString currentCorrelationId();
QString newCorrelationId();

class CorrelationScope {
public:
    explicit CorrelationScope(const QString &corrId);
    ~CorrelationScope();

    CorrelationScope(const CorrelationScope &) = delete;
    CorrelationScope &operator=(const CorrelationScope &) = delete;

private:
    QString m_prev;
};

// All fields are required; use empty strings where unknown. A "host" key in
// the context names the fleet host the event concerns.
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

QString logsDirPath();
QString defaultProcessName();
QString defaultWho();

} // namespace patchfleet::logging

#define PFLOG_DEBUG(component, where, what, why, how, who, corr, ctxJson) \
    ::patchfleet::logging::logEvent(::patchfleet::logging::LogLevel::Debug, \
                                    ::patchfleet::logging::defaultProcessName(), \
                                    (component), (where), (what), (why), (how), (who), (corr), (ctxJson))

#define PFLOG_INFO(component, where, what, why, how, who, corr, ctxJson) \
    ::patchfleet::logging::logEvent(::patchfleet::logging::LogLevel::Info, \
                                    ::patchfleet::logging::defaultProcessName(), \
                                    (component), (where), (what), (why), (how), (who), (corr), (ctxJson))

#define PFLOG_WARN(component, where, what, why, how, who, corr, ctxJson) \
    ::patchfleet::logging::logEvent(::patchfleet::logging::LogLevel::Warn, \
                                    ::patchfleet::logging::defaultProcessName(), \
                                    (component), (where), (what), (why), (how), (who), (corr), (ctxJson))

#define PFLOG_ERROR(component, where, what, why, how, who, corr, ctxJson) \
    ::patchfleet::logging::logEvent(::patchfleet::logging::LogLevel::Error, \
                                    ::patchfleet::logging::defaultProcessName(), \
                                    (component), (where), (what), (why), (how), (who), (corr), (ctxJson))
