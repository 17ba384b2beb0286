#pragma once

#include <stdexcept>
#include <string>

// Fatal errors raised by the refresh pipeline. Each carries the context of the
// failing step (host, helper, captured stderr) in its message. Teardown
// problems are never thrown; SshSession::cleanup() logs them as warnings.
class ReauthError : public std::runtime_error {
public:
    explicit ReauthError(const std::string& msg) : std::runtime_error(msg) {}
};

// Control master / session setup failed.
class ConnectionError : public ReauthError {
public:
    using ReauthError::ReauthError;
};

// Credential helper "get" failed for a reason other than "needs login".
class HelperProtocolError : public ReauthError {
public:
    using ReauthError::ReauthError;
};

// Credential helper "login" failed.
class LoginError : public ReauthError {
public:
    using ReauthError::ReauthError;
};

// Local keychain read or write failed.
class KeychainError : public ReauthError {
public:
    using ReauthError::ReauthError;
};

// Remote keyctl padd failed, or the remote still reports a stale credential.
class RemoteSyncError : public ReauthError {
public:
    using ReauthError::ReauthError;
};

// Bad configuration file or environment.
class ConfigError : public ReauthError {
public:
    using ReauthError::ReauthError;
};
