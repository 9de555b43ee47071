#include "transport/openssh_transport.hpp"

#include <algorithm>
#include <chrono>
#include <limits>
#include <utility>

#include <QElapsedTimer>
#include <QProcess>
#include <QTemporaryDir>

#include <nlohmann/json.hpp>

#include "common/errors.hpp"
#include "common/logging.hpp"

namespace patchfleet {

namespace {

// ssh reserves this exit status for its own failures.
constexpr int kSshFailureExit = 255;

constexpr int kMasterPollMs = 100;
constexpr int kCloseWaitMs = 2000;

// QProcess waits take int milliseconds.
int waitMsecs(std::chrono::milliseconds timeout)
{
    return static_cast<int>(std::clamp<long long>(timeout.count(), 0,
                                                  std::numeric_limits<int>::max()));
}

QString destination(const HostConfig &host)
{
    return QString::fromStdString(host.address);
}

} // namespace

bool isAuthenticationFailure(const QString &stderrText)
{
    return stderrText.contains(QStringLiteral("Permission denied"))
        || stderrText.contains(QStringLiteral("Host key verification failed"))
        || stderrText.contains(QStringLiteral("REMOTE HOST IDENTIFICATION HAS CHANGED"))
        || stderrText.contains(QStringLiteral("Too many authentication failures"));
}

OpenSshTransport::OpenSshTransport(HostConfig host, QString sshBinary)
    : m_host(std::move(host))
    , m_sshBinary(std::move(sshBinary))
{
}

OpenSshTransport::~OpenSshTransport()
{
    close();
}

QStringList OpenSshTransport::baseArguments(std::chrono::milliseconds connectTimeout) const
{
    const auto seconds = std::max<long long>(
        1, std::chrono::duration_cast<std::chrono::seconds>(connectTimeout).count());

    QStringList args{
        QStringLiteral("-o"), QStringLiteral("BatchMode=yes"),
        QStringLiteral("-o"), QStringLiteral("ConnectTimeout=%1").arg(seconds),
        QStringLiteral("-o"), QStringLiteral("ControlPath=%1").arg(m_controlPath),
        QStringLiteral("-p"), QString::number(m_host.port),
    };
    if (!m_host.username.empty()) {
        args << QStringLiteral("-l") << QString::fromStdString(m_host.username);
    }
    return args;
}

void OpenSshTransport::throwForSshFailure(const QString &stderrText, const std::string &what) const
{
    const std::string detail = what + " " + m_host.name + ": " + stderrText.trimmed().toStdString();
    if (isAuthenticationFailure(stderrText)) {
        throw AuthenticationError(detail);
    }
    throw ConnectionError(detail);
}

bool OpenSshTransport::masterReady()
{
    QProcess check;
    QStringList args{QStringLiteral("-O"), QStringLiteral("check"),
                     QStringLiteral("-o"), QStringLiteral("ControlPath=%1").arg(m_controlPath),
                     destination(m_host)};
    check.start(m_sshBinary, args);
    if (!check.waitForStarted() || !check.waitForFinished(kCloseWaitMs)) {
        check.kill();
        check.waitForFinished();
        return false;
    }
    return check.exitStatus() == QProcess::NormalExit && check.exitCode() == 0;
}

void OpenSshTransport::connect(std::chrono::milliseconds timeout)
{
    if (m_open) {
        return;
    }

    m_controlDir = std::make_unique<QTemporaryDir>(QStringLiteral("/tmp/patchfleet-XXXXXX"));
    if (!m_controlDir->isValid()) {
        throw ConnectionError("cannot create control socket directory for " + m_host.name);
    }
    m_controlPath = m_controlDir->filePath(QStringLiteral("cm"));

    QStringList args{QStringLiteral("-M"), QStringLiteral("-N"), QStringLiteral("-T")};
    args << baseArguments(timeout) << destination(m_host);

    PFLOG_DEBUG(QStringLiteral("OpenSshTransport"),
                QStringLiteral("OpenSshTransport::connect"),
                QStringLiteral("master_start"),
                QStringLiteral("open_session"),
                QStringLiteral("ssh_control_master"),
                logging::defaultWho(),
                logging::currentCorrelationId(),
                (nlohmann::json{
                    {"host", m_host.name},
                    {"address", m_host.address},
                    {"port", m_host.port},
                    {"timeoutMs", timeout.count()}
                }));

    m_master = std::make_unique<QProcess>();
    m_master->start(m_sshBinary, args);
    if (!m_master->waitForStarted()) {
        const std::string error = m_master->errorString().toStdString();
        m_master.reset();
        throw ConnectionError("cannot start ssh client for " + m_host.name + ": " + error);
    }
    m_master->closeWriteChannel();

    QElapsedTimer elapsed;
    elapsed.start();
    while (elapsed.elapsed() < timeout.count()) {
        // Doubles as the poll interval while the master authenticates.
        if (m_master->state() == QProcess::NotRunning
            || m_master->waitForFinished(kMasterPollMs)) {
            const QString stderrText = QString::fromUtf8(m_master->readAllStandardError());
            m_master.reset();
            throwForSshFailure(stderrText, "ssh connection failed for");
        }
        if (masterReady()) {
            m_open = true;
            return;
        }
    }

    m_master->kill();
    m_master->waitForFinished();
    m_master.reset();
    throw TimeoutError("ssh connection to " + m_host.name + " timed out after "
                       + std::to_string(timeout.count()) + " ms");
}

CommandResult OpenSshTransport::run(const std::string &command, std::chrono::milliseconds timeout)
{
    if (!m_open) {
        throw ConnectionError("no open session to " + m_host.name);
    }

    QStringList args{QStringLiteral("-T")};
    args << baseArguments(timeout) << destination(m_host) << QString::fromStdString(command);

    QProcess process;
    process.start(m_sshBinary, args);
    if (!process.waitForStarted()) {
        throw ConnectionError("cannot start ssh client for " + m_host.name + ": "
                              + process.errorString().toStdString());
    }
    // Nothing may wait on input; a prompt would otherwise hang until the
    // timeout.
    process.closeWriteChannel();

    if (!process.waitForFinished(waitMsecs(timeout))) {
        process.kill();
        process.waitForFinished();
        throw TimeoutError("'" + command + "' on " + m_host.name + " timed out after "
                           + std::to_string(timeout.count()) + " ms");
    }

    CommandResult result;
    result.exitCode = process.exitCode();
    result.stdoutText = process.readAllStandardOutput().toStdString();
    result.stderrText = process.readAllStandardError().toStdString();

    if (process.exitStatus() != QProcess::NormalExit) {
        throw ConnectionError("ssh client for " + m_host.name + " crashed");
    }
    if (result.exitCode == kSshFailureExit) {
        throwForSshFailure(QString::fromStdString(result.stderrText), "ssh failed for");
    }
    return result;
}

void OpenSshTransport::close() noexcept
{
    if (!m_master) {
        m_open = false;
        return;
    }

    if (m_master->state() != QProcess::NotRunning) {
        QProcess stop;
        stop.start(m_sshBinary, {QStringLiteral("-O"), QStringLiteral("exit"),
                                 QStringLiteral("-o"),
                                 QStringLiteral("ControlPath=%1").arg(m_controlPath),
                                 destination(m_host)});
        if (stop.waitForStarted()) {
            stop.waitForFinished(kCloseWaitMs);
        }
        if (stop.state() != QProcess::NotRunning) {
            stop.kill();
            stop.waitForFinished();
        }

        if (!m_master->waitForFinished(kCloseWaitMs)) {
            m_master->kill();
            m_master->waitForFinished();
        }
    }

    m_master.reset();
    m_controlDir.reset();
    m_open = false;
}

bool OpenSshTransport::isOpen() const
{
    return m_open && m_master && m_master->state() == QProcess::Running;
}

OpenSshTransportFactory::OpenSshTransportFactory(std::string sshBinary)
    : m_sshBinary(QString::fromStdString(sshBinary))
{
}

std::unique_ptr<Transport> OpenSshTransportFactory::create(const HostConfig &host)
{
    return std::make_unique<OpenSshTransport>(host, m_sshBinary);
}

} // namespace patchfleet
