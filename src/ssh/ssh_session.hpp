#pragma once

#include <optional>
#include <string>
#include <vector>
#include <core/types.hpp>
#include <platform/process.hpp>
#include "control_socket.hpp"
#include "socket_policy.hpp"

class ProcessRunner;

// A batched SSH command multiplexer over the system `ssh`.
//
// Every command built by the session carries a restrictive option set suited
// to non-interactive use. When the resolved socket policy calls for it, the
// session also stands up a private control master in a fresh 0700 temp
// directory so later commands skip connection setup.
//
// Lifecycle: constructed → Active (master reachable, or construction throws
// ConnectionError) → Closed by cleanup(). The destructor calls cleanup(), so
// teardown runs exactly once on every exit path.
class SshSession {
public:
    SshSession(std::string host, std::vector<std::string> ssh_args, SocketPolicy policy,
               ProcessRunner& runner, std::string ssh_program = "ssh");

    // As above, with an explicit configuration query for SocketPolicy::Infer.
    SshSession(std::string host, std::vector<std::string> ssh_args, SocketPolicy policy,
               ProcessRunner& runner, std::string ssh_program, const SshConfigQuery& query);

    ~SshSession();

    SshSession(const SshSession&) = delete;
    SshSession& operator=(const SshSession&) = delete;

    // ssh <args> [-S <sock>] -xT <batch opts> -- <host> <remote_command>
    // Callers append the remote command's arguments and wire its streams.
    // Throws ConnectionError once the session has been cleaned up.
    platform::ProcessSpec command(const std::string& remote_command) const;

    // Tell our control master to exit and remove the socket directory.
    // Idempotent; failures are logged as warnings, never thrown.
    void cleanup() noexcept;

    const std::string& host() const { return host_; }
    bool active() const { return active_; }
    bool owns_socket() const { return socket_.has_value() && socket_->exists(); }
    const ControlSocket* socket() const { return socket_ ? &*socket_ : nullptr; }

private:
    std::string host_;
    std::vector<std::string> ssh_args_;
    std::string ssh_program_;
    ProcessRunner& runner_;
    std::optional<ControlSocket> socket_;
    bool active_ = false;

    void establish(SocketPolicy policy, const SshConfigQuery& query);
};
