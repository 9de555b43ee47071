#pragma once

#include <chrono>
#include <memory>
#include <string>

#include "common/models.hpp"

namespace patchfleet {

struct CommandResult {
    int exitCode = -1;
    std::string stdoutText;
    std::string stderrText;

    bool ok() const { return exitCode == 0; }
};

// One SSH session to one host. Implementations throw ConnectionError,
// TimeoutError or AuthenticationError; a remote command that merely exits
// non-zero is reported through CommandResult, not an exception.
class Transport {
public:
    virtual ~Transport() = default;

    virtual void connect(std::chrono::milliseconds timeout) = 0;
    virtual CommandResult run(const std::string &command,
                              std::chrono::milliseconds timeout) = 0;
    // Idempotent.
    virtual void close() noexcept = 0;
    virtual bool isOpen() const = 0;
};

class TransportFactory {
public:
    virtual ~TransportFactory() = default;

    virtual std::unique_ptr<Transport> create(const HostConfig &host) = 0;
};

// Connects on construction and closes on every exit path.
class TransportSession {
public:
    TransportSession(TransportFactory &factory,
                     const HostConfig &host,
                     std::chrono::milliseconds connectTimeout)
        : m_transport(factory.create(host))
    {
        m_transport->connect(connectTimeout);
    }

    ~TransportSession()
    {
        if (m_transport) {
            m_transport->close();
        }
    }

    TransportSession(const TransportSession &) = delete;
    TransportSession &operator=(const TransportSession &) = delete;

    Transport &transport() { return *m_transport; }

    CommandResult run(const std::string &command, std::chrono::milliseconds timeout)
    {
        return m_transport->run(command, timeout);
    }

private:
    std::unique_ptr<Transport> m_transport;
};

} // namespace patchfleet
