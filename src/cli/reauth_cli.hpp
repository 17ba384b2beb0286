#pragma once

#include <iostream>
#include <mutex>
#include <string>
#include <core/config.hpp>
#include "args.hpp"

class CredentialStore;
class ProcessRunner;

// One aspect-reauth run: resolve options, open the SSH session, refresh.
class ReauthCLI {
public:
    explicit ReauthCLI(CliArgs args, std::ostream& out = std::cout, std::ostream& err = std::cerr);

    // Compiled defaults < config file < environment < command line.
    // Throws ConfigError if the config file is malformed.
    RunOptions resolve_options(const EnvLookup& env) const;

    // Resolve options, then run against real processes and the configured
    // keychain. Failures are printed to `err`; returns the exit code.
    int execute();
    int execute(const RunOptions& opts, ProcessRunner& runner, CredentialStore& store);

    // Throws a ReauthError subclass on failure.
    RefreshOutcome run(const RunOptions& opts, ProcessRunner& runner, CredentialStore& store);

private:
    CliArgs args_;
    std::ostream& out_;
    std::ostream& err_;
    std::mutex output_mutex_;

    void print_status(const std::string& msg);
    int report_failure(const std::exception& e);
};
