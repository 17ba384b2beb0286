#pragma once

#include <string>
#include <core/config.hpp>
#include <core/types.hpp>
#include <platform/process.hpp>

class CredentialStore;
class ProcessRunner;
class SshSession;

// True if a failed `<helper> get` printed "please run ... <helper> login"
// (case-insensitive, may span lines, whitespace runs between words). `helper`
// may be a path; only its basename is matched, literally. Runs in linear time
// so arbitrarily large stderr is safe.
bool stderr_requests_login(const std::string& stderr_text, const std::string& helper);

// Decides whether the local and remote credentials are stale, re-runs the
// helper's login when needed, and pushes the keychain credential into the
// remote kernel keyring through the session.
//
// run() executes the local and remote freshness paths concurrently. They
// share only the const RunOptions and the (thread-safe) runner. Every child
// that takes stdin is fed from a writer thread inside the runner, never
// inline with reading its output.
class RefreshOrchestrator {
public:
    RefreshOrchestrator(const RunOptions& opts, ProcessRunner& runner, CredentialStore& store,
                        StatusCallback status = nullptr);

    // Full pipeline. Throws a ReauthError subclass on any fatal failure.
    RefreshOutcome run(const SshSession& session) const;

    // ── Individual steps ──────────────────────────────────────

    // `<helper> get` locally / on the session's host.
    platform::ProcessSpec local_get_command() const;
    platform::ProcessSpec remote_get_command(const SshSession& session) const;

    // Runs a helper "get" command, writing the uri request to its stdin.
    // false: credential valid. true: helper asks for a login.
    // Throws HelperProtocolError on any other failure. `where` labels errors.
    bool needs_refresh(const platform::ProcessSpec& get_command,
                       const std::string& where = "local") const;

    // `<helper> login <remote>`, interactive. Throws LoginError.
    void run_login() const;

    // Keychain access by (keychain_service, remote). Throws KeychainError.
    std::string fetch_credential() const;
    void store_credential(const std::string& value) const;

    // keyctl padd user <key_name> <@u|@s> on the remote, credential on stdin.
    // Throws RemoteSyncError.
    void push_credential(const SshSession& session, const std::string& credential) const;

    // {"uri":"https://<remote>"} plus newline
    std::string request_line() const;

    // "<prefix>:<remote>@<service>"
    std::string key_name() const;

    // "@s" with session_keyring, else "@u"
    const char* keyring_selector() const;

private:
    const RunOptions& opts_;
    ProcessRunner& runner_;
    CredentialStore& store_;
    StatusCallback status_;

    // Local path: check, then log in if needed. Returns whether a login ran.
    bool refresh_local() const;
    // Remote path: whether the remote needs a new credential.
    bool remote_is_stale(const SshSession& session) const;

    void report(const std::string& msg) const;
};
