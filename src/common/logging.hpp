#pragma once

#include <QString>

#include <nlohmann/json.hpp>

namespace blastd::logging {

enum class LogLevel {
    Debug,
    Info,
    Warn,
    Error
};

// Initialize logging for the current process. Call early in main().
// Trace mode records Debug events and mirrors everything to <process>-trace.log.
void initLogging(const QString &processName, bool traceEnabled);

bool isTraceEnabled();

// Directory holding the JSON-lines log files ($HOME/.local/share/blastd/logs).
QString logsDirPath();

// Thread-local correlation support for linking related log events.
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

} // namespace blastd::logging

#define BLASTD_LOG_DEBUG(component, where, what, why, how, who, corr, ctxJson) \
    ::blastd::logging::logEvent(::blastd::logging::LogLevel::Debug, \
                                ::blastd::logging::defaultProcessName(), \
                                (component), (where), (what), (why), (how), (who), (corr), (ctxJson))

#define BLASTD_LOG_INFO(component, where, what, why, how, who, corr, ctxJson) \
    ::blastd::logging::logEvent(::blastd::logging::LogLevel::Info, \
                                ::blastd::logging::defaultProcessName(), \
                                (component), (where), (what), (why), (how), (who), (corr), (ctxJson))

#define BLASTD_LOG_WARN(component, where, what, why, how, who, corr, ctxJson) \
    ::blastd::logging::logEvent(::blastd::logging::LogLevel::Warn, \
                                ::blastd::logging::defaultProcessName(), \
                                (component), (where), (what), (why), (how), (who), (corr), (ctxJson))

#define BLASTD_LOG_ERROR(component, where, what, why, how, who, corr, ctxJson) \
    ::blastd::logging::logEvent(::blastd::logging::LogLevel::Error, \
                                ::blastd::logging::defaultProcessName(), \
                                (component), (where), (what), (why), (how), (who), (corr), (ctxJson))
