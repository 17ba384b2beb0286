#include "refresh_orchestrator.hpp"
#include <core/credentials.hpp>
#include <core/constants.hpp>
#include <core/errors.hpp>
#include <core/log.hpp>
#include <core/utils.hpp>
#include <platform/process_runner.hpp>
#include <ssh/ssh_session.hpp>
#include <fmt/format.h>
#include <cctype>
#include <exception>
#include <future>

using platform::ProcessSpec;
using platform::Stdio;

static std::string ascii_lower(std::string s) {
    for (char& c : s) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    return s;
}

// End offset of the first "<first><whitespace+><second>" at or after `from`,
// or npos. Linear in the text apart from whitespace runs.
static size_t find_phrase(const std::string& text, const std::string& first,
                          const std::string& second, size_t from) {
    for (size_t p = text.find(first, from); p != std::string::npos;
         p = text.find(first, p + 1)) {
        size_t gap = p + first.size();
        size_t q = gap;
        while (q < text.size() && std::isspace(static_cast<unsigned char>(text[q]))) q++;
        if (q == gap) continue;
        if (text.compare(q, second.size(), second) == 0) return q + second.size();
    }
    return std::string::npos;
}

bool stderr_requests_login(const std::string& stderr_text, const std::string& helper) {
    std::string text = ascii_lower(stderr_text);
    size_t after_run = find_phrase(text, "please", "run", 0);
    if (after_run == std::string::npos) return false;
    return find_phrase(text, ascii_lower(program_basename(helper)), "login", after_run) !=
           std::string::npos;
}

RefreshOrchestrator::RefreshOrchestrator(const RunOptions& opts, ProcessRunner& runner,
                                         CredentialStore& store, StatusCallback status)
    : opts_(opts), runner_(runner), store_(store), status_(std::move(status)) {}

void RefreshOrchestrator::report(const std::string& msg) const {
    reauth_log(msg);
    if (status_) status_(msg);
}

// ── Commands ──────────────────────────────────────────────────

ProcessSpec RefreshOrchestrator::local_get_command() const {
    ProcessSpec spec(opts_.credential_helper);
    spec.arg("get");
    return spec;
}

ProcessSpec RefreshOrchestrator::remote_get_command(const SshSession& session) const {
    ProcessSpec spec = session.command(opts_.credential_helper);
    spec.arg("get");
    return spec;
}

std::string RefreshOrchestrator::request_line() const {
    return fmt::format("{{\"uri\":\"https://{}\"}}\n", opts_.remote);
}

std::string RefreshOrchestrator::key_name() const {
    return fmt::format("{}:{}@{}", opts_.key_prefix, opts_.remote, opts_.keychain_service);
}

const char* RefreshOrchestrator::keyring_selector() const {
    return opts_.session_keyring ? SESSION_KEYRING : USER_KEYRING;
}

// ── Steps ─────────────────────────────────────────────────────

bool RefreshOrchestrator::needs_refresh(const ProcessSpec& get_command,
                                        const std::string& where) const {
    ProcessSpec spec = get_command;
    spec.stdin_mode = Stdio::Pipe;
    spec.input = request_line();
    spec.stdout_mode = Stdio::Null;
    spec.stderr_mode = Stdio::Pipe;

    auto r = runner_.run(spec);
    if (r.is_err()) {
        throw HelperProtocolError(fmt::format("failed to run {} on {}: {}",
                                              opts_.credential_helper, where, r.error));
    }
    if (r.value.success()) {
        reauth_log(fmt::format("{}: credential for {} is valid", where, opts_.remote));
        return false;
    }
    if (stderr_requests_login(r.value.stderr_data, opts_.credential_helper)) {
        reauth_log(fmt::format("{}: credential for {} needs login", where, opts_.remote));
        return true;
    }
    throw HelperProtocolError(fmt::format("{} get ({}): {}\n\n{}", opts_.credential_helper, where,
                                          r.value.describe(), trimmed(r.value.stderr_data)));
}

void RefreshOrchestrator::run_login() const {
    ProcessSpec spec(opts_.credential_helper);
    spec.add_args({"login", opts_.remote});
    spec.stdin_mode = Stdio::Null;
    spec.stdout_mode = Stdio::Inherit;
    spec.stderr_mode = Stdio::Inherit;

    report(fmt::format("Logging in to {}", opts_.remote));
    auto r = runner_.run(spec);
    if (r.is_err()) {
        throw LoginError(fmt::format("failed to spawn {}: {}", opts_.credential_helper, r.error));
    }
    if (r.value.failed()) {
        throw LoginError(fmt::format("{} login: {}", opts_.credential_helper, r.value.describe()));
    }
}

std::string RefreshOrchestrator::fetch_credential() const {
    auto r = store_.get(opts_.keychain_service, opts_.remote);
    if (r.is_err()) {
        throw KeychainError(fmt::format("failed to get credential {}/{} from keychain: {}",
                                        opts_.keychain_service, opts_.remote, r.error));
    }
    return std::move(r.value);
}

void RefreshOrchestrator::store_credential(const std::string& value) const {
    auto r = store_.set(opts_.keychain_service, opts_.remote, value);
    if (r.is_err()) {
        throw KeychainError(fmt::format("failed to store credential {}/{} in keychain: {}",
                                        opts_.keychain_service, opts_.remote, r.error));
    }
}

void RefreshOrchestrator::push_credential(const SshSession& session,
                                          const std::string& credential) const {
    ProcessSpec spec = session.command("keyctl");
    spec.add_args({"padd", "user", key_name(), keyring_selector()});
    spec.stdin_mode = Stdio::Pipe;
    spec.input = credential;
    spec.stdout_mode = Stdio::Null;
    spec.stderr_mode = Stdio::Pipe;

    report(fmt::format("Pushing credential to {} ({})", session.host(), keyring_selector()));
    auto r = runner_.run(spec);
    if (r.is_err()) {
        throw RemoteSyncError(fmt::format("failed to run keyctl on {}: {}", session.host(), r.error));
    }
    if (r.value.failed()) {
        throw RemoteSyncError(fmt::format("ssh {} keyctl padd: {}\n\n{}", session.host(),
                                          r.value.describe(), trimmed(r.value.stderr_data)));
    }
}

// ── Pipeline ──────────────────────────────────────────────────

bool RefreshOrchestrator::refresh_local() const {
    if (!opts_.force_local && !needs_refresh(local_get_command(), "local")) {
        return false;
    }
    run_login();
    return true;
}

bool RefreshOrchestrator::remote_is_stale(const SshSession& session) const {
    if (opts_.force_remote) return true;
    return needs_refresh(remote_get_command(session), session.host());
}

RefreshOutcome RefreshOrchestrator::run(const SshSession& session) const {
    auto local = std::async(std::launch::async, [this]() { return refresh_local(); });
    auto remote = std::async(std::launch::async, [this, &session]() {
        return remote_is_stale(session);
    });

    // Wait for both before reporting either, so no task outlives the session.
    bool logged_in = false;
    bool remote_stale = false;
    std::exception_ptr local_error;
    std::exception_ptr remote_error;
    try {
        logged_in = local.get();
    } catch (...) {
        local_error = std::current_exception();
    }
    try {
        remote_stale = remote.get();
    } catch (...) {
        remote_error = std::current_exception();
    }
    // Local errors take priority.
    if (local_error) std::rethrow_exception(local_error);
    if (remote_error) std::rethrow_exception(remote_error);

    if (!logged_in && !remote_stale) {
        return RefreshOutcome::NotNeeded;
    }

    push_credential(session, fetch_credential());

    if (opts_.verify_after_push) {
        // Re-checked exactly once; there is no retry loop.
        if (needs_refresh(remote_get_command(session), session.host())) {
            throw RemoteSyncError(fmt::format(
                "credential on {} still needs a refresh after sync; retry with --force",
                session.host()));
        }
    }
    return RefreshOutcome::Synced;
}
