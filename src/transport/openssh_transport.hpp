#pragma once

#include <memory>
#include <string>

#include <QString>
#include <QStringList>

#include "transport/transport.hpp"

class QProcess;
class QTemporaryDir;

namespace patchfleet {

// Drives the system OpenSSH client. connect() starts a ControlMaster in
// BatchMode so that authentication can never prompt, and run() multiplexes
// each command over it with stdin closed.
class OpenSshTransport : public Transport
{
public:
    OpenSshTransport(HostConfig host, QString sshBinary);
    ~OpenSshTransport() override;

    OpenSshTransport(const OpenSshTransport &) = delete;
    OpenSshTransport &operator=(const OpenSshTransport &) = delete;

    void connect(std::chrono::milliseconds timeout) override;
    CommandResult run(const std::string &command, std::chrono::milliseconds timeout) override;
    void close() noexcept override;
    bool isOpen() const override;

    // Arguments shared by the master and every multiplexed client.
    QStringList baseArguments(std::chrono::milliseconds connectTimeout) const;

private:
    bool masterReady();
    [[noreturn]] void throwForSshFailure(const QString &stderrText, const std::string &what) const;

    HostConfig m_host;
    QString m_sshBinary;
    std::unique_ptr<QTemporaryDir> m_controlDir;
    QString m_controlPath;
    std::unique_ptr<QProcess> m_master;
    bool m_open = false;
};

class OpenSshTransportFactory : public TransportFactory
{
public:
    explicit OpenSshTransportFactory(std::string sshBinary = "ssh");

    std::unique_ptr<Transport> create(const HostConfig &host) override;

private:
    QString m_sshBinary;
};

// True when ssh's stderr says the server rejected us rather than being
// unreachable.
bool isAuthenticationFailure(const QString &stderrText);

} // namespace patchfleet
