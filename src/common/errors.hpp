#pragma once

#include <stdexcept>
#include <string>
#include <utility>

#include "common/enums.hpp"

namespace patchfleet {

// Base of every failure the core reports. Per-host failures are caught at the
// scheduler task boundary and turned into HostResult entries by kind().
class Error : public std::runtime_error {
public:
    Error(ErrorKind kind, const std::string &message)
        : std::runtime_error(message)
        , m_kind(kind)
    {
    }

    ErrorKind kind() const noexcept { return m_kind; }

private:
    ErrorKind m_kind;
};

class ConnectionError : public Error {
public:
    explicit ConnectionError(const std::string &message)
        : Error(ErrorKind::Connection, message)
    {
    }
};

class TimeoutError : public ConnectionError {
public:
    explicit TimeoutError(const std::string &message)
        : ConnectionError(message)
    {
    }
};

class AuthenticationError : public Error {
public:
    explicit AuthenticationError(const std::string &message)
        : Error(ErrorKind::Authentication, message)
    {
    }
};

// Raised by platform detection when the remote side does not behave like a
// POSIX system at all.
class UnsupportedPlatformError : public Error {
public:
    explicit UnsupportedPlatformError(const std::string &message)
        : Error(ErrorKind::UnsupportedPlatform, message)
    {
    }
};

class PrivilegeError : public Error {
public:
    explicit PrivilegeError(const std::string &message)
        : Error(ErrorKind::Privilege, message)
    {
    }
};

class ParseError : public Error {
public:
    explicit ParseError(const std::string &message)
        : Error(ErrorKind::Parse, message)
    {
    }
};

class CacheCorruptionError : public Error {
public:
    explicit CacheCorruptionError(const std::string &message)
        : Error(ErrorKind::CacheCorruption, message)
    {
    }
};

class OperationNotSupportedError : public Error {
public:
    explicit OperationNotSupportedError(const std::string &message)
        : Error(ErrorKind::OperationNotSupported, message)
    {
    }
};

// A host already has an operation in flight that this one may not overlap.
class BusyError : public Error {
public:
    explicit BusyError(const std::string &message)
        : Error(ErrorKind::Busy, message)
    {
    }
};

class UnknownHostError : public Error {
public:
    explicit UnknownHostError(const std::string &name)
        : Error(ErrorKind::UnknownHost, "no host named '" + name + "' in inventory")
    {
    }
};

class CommandFailedError : public Error {
public:
    CommandFailedError(const std::string &message, int exitCode, std::string stderrText)
        : Error(ErrorKind::CommandFailed, message)
        , m_exitCode(exitCode)
        , m_stderr(std::move(stderrText))
    {
    }

    int exitCode() const noexcept { return m_exitCode; }
    const std::string &stderrText() const noexcept { return m_stderr; }

private:
    int m_exitCode;
    std::string m_stderr;
};

class ConfigError : public std::runtime_error {
public:
    explicit ConfigError(const std::string &message)
        : std::runtime_error(message)
    {
    }
};

} // namespace patchfleet
