#pragma once

#include <optional>
#include <string>
#include <vector>
#include <core/config.hpp>
#include <core/types.hpp>

// Command-line overrides. Unset fields leave the config/env value alone.
struct CliArgs {
    std::optional<std::string> host;
    std::optional<std::string> remote;
    std::optional<std::string> credential_helper;
    std::optional<std::string> config_path;

    bool force = false;
    bool force_local = false;
    bool force_remote = false;
    bool session_keyring = false;
    bool no_verify = false;
    bool verbose = false;

    std::optional<SocketPolicy> create_socket;
    bool no_create_socket = false;
    std::vector<std::string> ssh_args;

    bool show_help = false;
    bool show_version = false;
};

// Parses argv without the program name. Errors are usage errors.
Result<CliArgs> parse_args(const std::vector<std::string>& args);

// Layer command-line values over config/env-resolved options.
void apply_cli_args(RunOptions& opts, const CliArgs& cli);

void print_usage();
