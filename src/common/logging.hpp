#pragma once

#include <QString>

#include <nlohmann/json.hpp>

namespace drvkeep::logging {

enum class LogLevel {
    Debug,
    Info,
    Warn,
    Error
};

// Initialize logging for the current process. Call early in main().
void initLogging(const QString &processName, bool traceEnabled);

bool isTraceEnabled();

// Directory holding the JSON-lines log files for this process.
QString logsDirPath();

// Thread-local correlation support for linking the events of one backup run.
void setCorrelationId(const QString &corrId);
QString currentCorrelationId();

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

} // namespace drvkeep::logging

#define DKLOG_DEBUG(component, where, what, why, how, who, corr, ctxJson) \
    ::drvkeep::logging::logEvent(::drvkeep::logging::LogLevel::Debug, \
                                 ::drvkeep::logging::defaultProcessName(), \
                                 (component), (where), (what), (why), (how), (who), (corr), (ctxJson))

#define DKLOG_INFO(component, where, what, why, how, who, corr, ctxJson) \
    ::drvkeep::logging::logEvent(::drvkeep::logging::LogLevel::Info, \
                                 ::drvkeep::logging::defaultProcessName(), \
                                 (component), (where), (what), (why), (how), (who), (corr), (ctxJson))

#define DKLOG_WARN(component, where, what, why, how, who, corr, ctxJson) \
    ::drvkeep::logging::logEvent(::drvkeep::logging::LogLevel::Warn, \
                                 ::drvkeep::logging::defaultProcessName(), \
                                 (component), (where), (what), (why), (how), (who), (corr), (ctxJson))

#define DKLOG_ERROR(component, where, what, why, how, who, corr, ctxJson) \
    ::drvkeep::logging::logEvent(::drvkeep::logging::LogLevel::Error, \
                                 ::drvkeep::logging::defaultProcessName(), \
                                 (component), (where), (what), (why), (how), (who), (corr), (ctxJson))
