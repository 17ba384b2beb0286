#include "ssh_session.hpp"
#include <core/constants.hpp>
#include <core/errors.hpp>
#include <core/log.hpp>
#include <core/utils.hpp>
#include <platform/process_runner.hpp>
#include <fmt/format.h>

using platform::ProcessSpec;
using platform::Stdio;

SshSession::SshSession(std::string host, std::vector<std::string> ssh_args, SocketPolicy policy,
                       ProcessRunner& runner, std::string ssh_program)
    : host_(std::move(host)), ssh_args_(std::move(ssh_args)),
      ssh_program_(std::move(ssh_program)), runner_(runner) {
    establish(policy, make_ssh_config_query(runner_, ssh_program_, ssh_args_));
}

SshSession::SshSession(std::string host, std::vector<std::string> ssh_args, SocketPolicy policy,
                       ProcessRunner& runner, std::string ssh_program,
                       const SshConfigQuery& query)
    : host_(std::move(host)), ssh_args_(std::move(ssh_args)),
      ssh_program_(std::move(ssh_program)), runner_(runner) {
    establish(policy, query);
}

SshSession::~SshSession() {
    cleanup();
}

void SshSession::establish(SocketPolicy policy, const SshConfigQuery& query) {
    bool own_socket = resolve_socket_policy(policy, host_, query);

    if (own_socket) {
        auto sock = ControlSocket::create(SOCKET_DIR_PREFIX);
        if (sock.is_err()) {
            throw ConnectionError("failed to create control socket: " + sock.error);
        }
        socket_ = std::move(sock.value);
    }

    ProcessSpec spec(ssh_program_);
    spec.add_args(ssh_args_);
    if (socket_) {
        // cf. scp.c in openssh-portable.
        spec.add_args({"-xMTS", socket_->path().string(), "-oControlPersist=yes"});
        for (const char* opt : SSH_BATCH_OPTS) spec.arg(opt);
    }
    // Without our own socket we still open one plain session: a host with
    // ControlMaster=auto and no live master gets a master with its normal
    // options rather than our restrictive batch set.
    spec.add_args({"--", host_, "true"});
    spec.stdin_mode = Stdio::Null;
    spec.stdout_mode = Stdio::Null;
    spec.stderr_mode = Stdio::Pipe;

    reauth_log(fmt::format("ssh {}: {}", host_,
                           socket_ ? "starting control master at " + socket_->path().string()
                                   : std::string("reusing host multiplexing")));

    auto r = runner_.run(spec);
    if (r.is_err()) {
        socket_.reset();
        throw ConnectionError(fmt::format("failed to start SSH control master for {}: {}",
                                          host_, r.error));
    }
    if (r.value.failed()) {
        socket_.reset();
        throw ConnectionError(fmt::format("ssh {}: {}\n\n{}", host_, r.value.describe(),
                                          trimmed(r.value.stderr_data)));
    }
    active_ = true;
}

ProcessSpec SshSession::command(const std::string& remote_command) const {
    if (!active_) {
        throw ConnectionError(fmt::format("ssh {}: session already closed", host_));
    }
    ProcessSpec spec(ssh_program_);
    spec.add_args(ssh_args_);
    if (socket_ && socket_->exists()) {
        spec.add_args({"-S", socket_->path().string()});
    }
    spec.arg("-xT");
    for (const char* opt : SSH_BATCH_OPTS) spec.arg(opt);
    spec.add_args({"--", host_, remote_command});
    return spec;
}

void SshSession::cleanup() noexcept {
    if (!active_) return;
    active_ = false;

    if (!socket_ || !socket_->exists()) return;

    try {
        ProcessSpec spec(ssh_program_);
        spec.add_args(ssh_args_);
        spec.add_args({"-S", socket_->path().string(), "-Oexit", "--", host_});
        spec.stdin_mode = Stdio::Null;
        spec.stdout_mode = Stdio::Null;
        spec.stderr_mode = Stdio::Null;

        auto r = runner_.run(spec);
        if (r.is_err()) {
            reauth_warn("failed to cleanup SSH control master: " + r.error);
        } else if (r.value.failed()) {
            reauth_warn(fmt::format("ssh -O exit {}: {}", host_, r.value.describe()));
        }

        auto removed = socket_->destroy();
        if (removed.is_err()) {
            reauth_warn("cleanup ssh: " + removed.error);
        }
    } catch (const std::exception& e) {
        // cleanup() runs from the destructor and must not throw; still make
        // sure the socket directory goes away.
        reauth_log(std::string("cleanup ssh: ") + e.what());
        socket_.reset();
    }
}
