#include "common/logging.hpp"

#include <QCoreApplication>
#include <QDateTime>
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QThread>
#include <QUuid>

#include <unistd.h>

#include <atomic>
#include <cstdio>
#include <memory>
#include <mutex>

namespace patchfleet::logging {

namespace {

constexpr qint64 kMaxLogSizeBytes = 5 * 1024 * 1024;
constexpr int kRotatedGenerations = 3;

// One append-only JSON-lines file. The handle stays open between events and
// is reopened after rotation.
class LogSink
{
public:
    void reset(const QString &path)
    {
        m_file.reset();
        m_path = path;
    }

    bool write(const QByteArray &line)
    {
        if (m_path.isEmpty()) {
            return false;
        }
        if (m_file && m_file->size() + line.size() > kMaxLogSizeBytes) {
            m_file.reset();
            rotate();
        }
        if (!m_file && !open()) {
            return false;
        }
        if (m_file->write(line) != line.size()) {
            m_file.reset();
            return false;
        }
        m_file->flush();
        return true;
    }

private:
    bool open()
    {
        QDir().mkpath(QFileInfo(m_path).absolutePath());
        if (QFileInfo(m_path).size() >= kMaxLogSizeBytes) {
            rotate();
        }
        auto file = std::make_unique<QFile>(m_path);
        if (!file->open(QIODevice::WriteOnly | QIODevice::Append | QIODevice::Text)) {
            return false;
        }
        m_file = std::move(file);
        return true;
    }

    // <name>.log -> <name>.log.1 -> ... -> <name>.log.N, oldest dropped.
    void rotate()
    {
        QFile::remove(m_path + QStringLiteral(".%1").arg(kRotatedGenerations));
        for (int generation = kRotatedGenerations - 1; generation >= 1; --generation) {
            QFile::rename(m_path + QStringLiteral(".%1").arg(generation),
                          m_path + QStringLiteral(".%1").arg(generation + 1));
        }
        QFile::rename(m_path, m_path + QStringLiteral(".1"));
    }

    QString m_path;
    std::unique_ptr<QFile> m_file;
};

struct LogState {
    std::mutex mutex;
    QString processName;
    LogSink main;
    LogSink trace;
};

LogState &state()
{
    static LogState instance;
    return instance;
}

std::atomic<bool> g_traceEnabled{false};

thread_local QString t_corrId;

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

QString logFilePath(const QString &processName, const QString &suffix)
{
    const QString base = processName.isEmpty()
        ? QStringLiteral("patchfleet")
        : processName;
    return logsDirPath() + QDir::separator() + base + suffix;
}

QString threadIdString()
{
    return QStringLiteral("0x%1")
        .arg(reinterpret_cast<quintptr>(QThread::currentThreadId()), 0, 16);
}

// Short form for the terminal in trace mode: level, component, event and
// the host it concerns.
void echoToStderr(LogLevel level,
                  const QString &component,
                  const QString &what,
                  const nlohmann::json &context)
{
    std::string host;
    if (context.is_object() && context.contains("host") && context.at("host").is_string()) {
        host = context.at("host").get<std::string>();
    }
    fprintf(stderr, "[%s] %s %s%s%s\n",
            levelName(level),
            component.toUtf8().constData(),
            what.toUtf8().constData(),
            host.empty() ? "" : " host=",
            host.c_str());
}

} // namespace

void initLogging(const QString &processName, bool traceEnabled)
{
    LogState &logState = state();
    std::lock_guard<std::mutex> lock(logState.mutex);
    logState.processName = processName;
    // Paths follow HOME at init time; sinks reopen lazily on the next event.
    logState.main.reset(logFilePath(processName, QStringLiteral(".log")));
    logState.trace.reset(logFilePath(processName, QStringLiteral("-trace.log")));
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

QString logsDirPath()
{
    const QString home = qEnvironmentVariable("HOME");
    if (home.isEmpty()) {
        return QStringLiteral(".local/share/patchfleet/logs");
    }
    return home + QStringLiteral("/.local/share/patchfleet/logs");
}

QString defaultProcessName()
{
    {
        LogState &logState = state();
        std::lock_guard<std::mutex> lock(logState.mutex);
        if (!logState.processName.isEmpty()) {
            return logState.processName;
        }
    }
    if (QCoreApplication::instance()) {
        const QString appName = QCoreApplication::applicationName();
        if (!appName.isEmpty()) {
            return appName;
        }
    }
    return QStringLiteral("patchfleet");
}

QString defaultWho()
{
    static const QString who = []() {
        char hostname[256] = {};
        if (gethostname(hostname, sizeof(hostname)) != 0) {
            hostname[0] = '\0';
        }
        return QStringLiteral("host:%1,uid:%2")
            .arg(QString::fromUtf8(hostname))
            .arg(static_cast<int>(getuid()));
    }();
    return who;
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
    const bool trace = g_traceEnabled;
    if (level == LogLevel::Debug && !trace) {
        return;
    }

    const QString corr = correlationId.isEmpty() ? currentCorrelationId() : correlationId;
    const nlohmann::json payload = {
        {"ts", QDateTime::currentDateTimeUtc().toString(Qt::ISODateWithMs).toStdString()},
        {"level", levelName(level)},
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
    const QByteArray line = QByteArray::fromStdString(payload.dump()) + '\n';

    LogState &logState = state();
    std::lock_guard<std::mutex> lock(logState.mutex);
    if (logState.processName.isEmpty() && !processName.isEmpty()) {
        // Events before initLogging() still land in the process's file.
        logState.processName = processName;
        logState.main.reset(logFilePath(processName, QStringLiteral(".log")));
        logState.trace.reset(logFilePath(processName, QStringLiteral("-trace.log")));
    }

    if (!logState.main.write(line)) {
        fprintf(stderr, "%s", line.constData());
    }
    if (trace) {
        logState.trace.write(line);
        echoToStderr(level, component, what, context);
    }
}

} // namespace patchfleet::logging
