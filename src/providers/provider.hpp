#pragma once

#include <chrono>
#include <memory>
#include <string>
#include <utility>
#include <vector>

#include "common/models.hpp"
#include "transport/transport.hpp"

namespace patchfleet {

enum class StepStatus {
    Ok,
    SkippedPrivileged
};

struct SyncResult {
    StepStatus status = StepStatus::Ok;
    std::string message;
};

struct FetchResult {
    StepStatus status = StepStatus::Ok;
    std::vector<Update> updates;
    std::string message;
};

// Everything a provider needs to run one command on a host: the open
// session, the resolved sudo policy and the execution timeout.
class CommandContext
{
public:
    CommandContext(Transport &transport,
                   SudoPolicy policy,
                   std::chrono::milliseconds timeout,
                   std::string hostName)
        : m_transport(transport)
        , m_policy(policy)
        , m_timeout(timeout)
        , m_hostName(std::move(hostName))
    {
    }

    SudoPolicy policy() const { return m_policy; }
    const std::string &hostName() const { return m_hostName; }

    // Elevated commands are prefixed with "sudo -n" so they fail instead of
    // prompting. A sudo refusal is reported as PrivilegeError.
    CommandResult run(const std::string &command, bool elevated = false);

private:
    Transport &m_transport;
    SudoPolicy m_policy;
    std::chrono::milliseconds m_timeout;
    std::string m_hostName;
};

// Package manager capability. The public operations consult
// SudoPolicyResolver before building any command and return
// SkippedPrivileged rather than attempt something the policy forbids.
class Provider
{
public:
    virtual ~Provider() = default;

    virtual ProviderKind kind() const = 0;
    virtual std::string displayName() const = 0;

    // Commands this provider runs with "sudo -n". Used to print a sudoers
    // snippet for operators.
    virtual std::vector<std::string> privilegedCommands() const { return {}; }

    SyncResult syncRepositories(CommandContext &context);
    // Full update list with security flags already attributed.
    FetchResult fetchUpdates(CommandContext &context);
    // Subset of fetchUpdates() flagged as security.
    FetchResult fetchSecurityUpdates(CommandContext &context);

protected:
    virtual void doSync(CommandContext &context) = 0;
    virtual std::vector<Update> doFetchUpdates(CommandContext &context) = 0;
};

// Marks entries whose key appears in securityKeys. Never appends: keys with
// no entry in the general list are logged and dropped.
std::vector<Update> reconcileSecurity(const std::vector<Update> &updates,
                                      const std::vector<std::string> &securityKeys,
                                      std::string (*keyOf)(const Update &),
                                      const std::string &hostName);

std::unique_ptr<Provider> createProvider(ProviderKind kind);

} // namespace patchfleet
