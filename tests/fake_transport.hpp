#pragma once

#include <algorithm>
#include <chrono>
#include <condition_variable>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <utility>
#include <vector>

#include "common/errors.hpp"
#include "transport/transport.hpp"

namespace patchfleet::testing {

enum class FakeFailure {
    None,
    Connection,
    Timeout,
    Authentication
};

// What one host answers. Commands are matched verbatim, including any
// "sudo -n " prefix; anything unscripted exits 127.
struct FakeHostScript {
    std::map<std::string, CommandResult> commands;
    std::map<std::string, FakeFailure> commandFailures;
    FakeFailure connectFailure = FakeFailure::None;
    std::chrono::milliseconds connectDelay{0};
    std::chrono::milliseconds commandDelay{0};
    // Every command waits until FakeTransportFactory::release().
    bool blockUntilReleased = false;

    FakeHostScript &on(const std::string &command, int exitCode,
                       std::string stdoutText = {}, std::string stderrText = {})
    {
        commands[command] = CommandResult{exitCode, std::move(stdoutText), std::move(stderrText)};
        return *this;
    }
};

inline FakeHostScript linuxHost(const std::string &id,
                                const std::string &versionId,
                                const std::string &idLike = {})
{
    FakeHostScript script;
    script.on("uname -s", 0, "Linux\n");
    script.on("grep ^ID= /etc/os-release", 0, "ID=" + id + "\n");
    script.on("grep ^VERSION_ID= /etc/os-release", 0, "VERSION_ID=\"" + versionId + "\"\n");
    if (idLike.empty()) {
        script.on("grep ^ID_LIKE= /etc/os-release", 1);
    } else {
        script.on("grep ^ID_LIKE= /etc/os-release", 0, "ID_LIKE=\"" + idLike + "\"\n");
    }
    script.on("command -v dnf", 0, "/usr/bin/dnf\n");
    script.on("command -v yum", 0, "/usr/bin/yum\n");
    script.on("true", 0);
    return script;
}

class FakeTransportFactory;

class FakeTransport : public Transport
{
public:
    FakeTransport(FakeTransportFactory &factory, std::string host, FakeHostScript script)
        : m_factory(factory)
        , m_host(std::move(host))
        , m_script(std::move(script))
    {
    }

    ~FakeTransport() override { close(); }

    void connect(std::chrono::milliseconds timeout) override;
    CommandResult run(const std::string &command, std::chrono::milliseconds timeout) override;
    void close() noexcept override;
    bool isOpen() const override { return m_open; }

private:
    FakeTransportFactory &m_factory;
    std::string m_host;
    FakeHostScript m_script;
    bool m_open = false;
};

class FakeTransportFactory : public TransportFactory
{
public:
    FakeHostScript &host(const std::string &name)
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_scripts[name];
    }

    void script(const std::string &name, FakeHostScript script)
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_scripts[name] = std::move(script);
    }

    std::unique_ptr<Transport> create(const HostConfig &host) override
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        ++m_created;
        return std::make_unique<FakeTransport>(*this, host.name, m_scripts[host.name]);
    }

    // Wakes every blocked or delayed command.
    void release()
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_released = true;
        m_wake.notify_all();
    }

    int openSessions() const
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_open;
    }

    int maxOpenSessions() const
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_maxOpen;
    }

    int sessionsCreated() const
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_created;
    }

    std::vector<std::string> commandsRun(const std::string &host) const
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        auto it = m_log.find(host);
        return it == m_log.end() ? std::vector<std::string>{} : it->second;
    }

    bool ran(const std::string &host, const std::string &command) const
    {
        const auto commands = commandsRun(host);
        return std::find(commands.begin(), commands.end(), command) != commands.end();
    }

private:
    friend class FakeTransport;

    void sessionOpened()
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        ++m_open;
        m_maxOpen = std::max(m_maxOpen, m_open);
    }

    void sessionClosed()
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        --m_open;
    }

    void record(const std::string &host, const std::string &command)
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_log[host].push_back(command);
    }

    // Sleeps for delay, or until release() when block is set. Returns early
    // once released.
    void wait(std::chrono::milliseconds delay, bool block)
    {
        std::unique_lock<std::mutex> lock(m_mutex);
        if (block) {
            // Bounded so that a broken test cannot hang the suite.
            m_wake.wait_for(lock, std::chrono::seconds(30), [this]() { return m_released; });
        } else if (delay.count() > 0) {
            m_wake.wait_for(lock, delay, [this]() { return m_released; });
        }
    }

    mutable std::mutex m_mutex;
    std::condition_variable m_wake;
    bool m_released = false;
    std::map<std::string, FakeHostScript> m_scripts;
    std::map<std::string, std::vector<std::string>> m_log;
    int m_open = 0;
    int m_maxOpen = 0;
    int m_created = 0;
};

inline void throwFakeFailure(FakeFailure failure, const std::string &what)
{
    switch (failure) {
    case FakeFailure::None:
        return;
    case FakeFailure::Connection:
        throw ConnectionError(what + ": Connection refused");
    case FakeFailure::Timeout:
        throw TimeoutError(what + ": timed out");
    case FakeFailure::Authentication:
        throw AuthenticationError(what + ": Permission denied (publickey)");
    }
}

inline void FakeTransport::connect(std::chrono::milliseconds)
{
    m_factory.wait(m_script.connectDelay, false);
    throwFakeFailure(m_script.connectFailure, "connect " + m_host);
    m_open = true;
    m_factory.sessionOpened();
}

inline CommandResult FakeTransport::run(const std::string &command, std::chrono::milliseconds)
{
    if (!m_open) {
        throw ConnectionError("no open session to " + m_host);
    }
    m_factory.record(m_host, command);
    m_factory.wait(m_script.commandDelay, m_script.blockUntilReleased);

    auto failure = m_script.commandFailures.find(command);
    if (failure != m_script.commandFailures.end()) {
        throwFakeFailure(failure->second, command + " on " + m_host);
    }

    auto it = m_script.commands.find(command);
    if (it == m_script.commands.end()) {
        return CommandResult{127, {}, "sh: " + command + ": not found\n"};
    }
    return it->second;
}

inline void FakeTransport::close() noexcept
{
    if (m_open) {
        m_open = false;
        m_factory.sessionClosed();
    }
}

} // namespace patchfleet::testing
