#include "reauth_cli.hpp"
#include "theme.hpp"
#include <core/credentials.hpp>
#include <core/errors.hpp>
#include <core/log.hpp>
#include <managers/refresh_orchestrator.hpp>
#include <platform/process_runner.hpp>
#include <ssh/ssh_session.hpp>
#include <fmt/format.h>

ReauthCLI::ReauthCLI(CliArgs args, std::ostream& out, std::ostream& err)
    : args_(std::move(args)), out_(out), err_(err) {}

RunOptions ReauthCLI::resolve_options(const EnvLookup& env) const {
    auto config = args_.config_path ? Config::load(*args_.config_path) : Config::load_global();
    if (config.is_err()) {
        throw ConfigError(config.error);
    }
    RunOptions opts = config.value.resolve(env);
    apply_cli_args(opts, args_);
    return opts;
}

void ReauthCLI::print_status(const std::string& msg) {
    // Called from both refresh paths at once.
    std::lock_guard<std::mutex> lock(output_mutex_);
    out_ << theme::info(msg) << std::flush;
}

int ReauthCLI::report_failure(const std::exception& e) {
    std::lock_guard<std::mutex> lock(output_mutex_);
    err_ << theme::fail(std::string(e.what())) << std::flush;
    return 1;
}

int ReauthCLI::execute() {
    SubprocessRunner runner;
    try {
        RunOptions opts = resolve_options(process_env());
        set_log_verbose(opts.verbose);

        auto store = make_credential_store(opts.keychain_backend, opts.credentials_file, runner);
        if (store.is_err()) {
            throw ConfigError(store.error);
        }
        run(opts, runner, *store.value);
        return 0;
    } catch (const std::exception& e) {
        return report_failure(e);
    }
}

int ReauthCLI::execute(const RunOptions& opts, ProcessRunner& runner, CredentialStore& store) {
    try {
        run(opts, runner, store);
        return 0;
    } catch (const std::exception& e) {
        return report_failure(e);
    }
}

RefreshOutcome ReauthCLI::run(const RunOptions& opts, ProcessRunner& runner,
                              CredentialStore& store) {
    reauth_log(fmt::format("run: host={} remote={} helper={} socket={}", opts.host, opts.remote,
                           opts.credential_helper, socket_policy_name(opts.socket_policy)));

    print_status(fmt::format("Connecting to {}", opts.host));
    SshSession session(opts.host, opts.ssh_args, opts.socket_policy, runner, opts.ssh_program);

    RefreshOrchestrator orchestrator(opts, runner, store,
                                     [this](const std::string& msg) { print_status(msg); });
    RefreshOutcome outcome = orchestrator.run(session);
    session.cleanup();

    if (outcome == RefreshOutcome::NotNeeded) {
        out_ << theme::ok("Credential refresh not needed. Have a nice day.");
    } else {
        out_ << theme::ok(fmt::format("Aspect credentials synced to {}. Have a nice day.",
                                      opts.host));
    }
    return outcome;
}
