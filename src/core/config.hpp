#pragma once

#include <string>
#include <optional>
#include <vector>
#include <functional>
#include <filesystem>
#include "types.hpp"

namespace fs = std::filesystem;

// Everything a run needs, merged once at startup (compiled defaults < config
// file < environment < command line) and passed by const reference from then on.
struct RunOptions {
    std::string host;
    std::string remote;
    std::string credential_helper;

    std::string ssh_program;
    std::vector<std::string> ssh_args;
    SocketPolicy socket_policy = SocketPolicy::Infer;

    bool force_local = false;
    bool force_remote = false;
    bool session_keyring = false;
    bool verify_after_push = true;

    std::string keychain_service;
    std::string key_prefix;
    std::string keychain_backend;   // "system" or "file"
    fs::path credentials_file;

    bool verbose = false;
};

// Environment accessor; returns nullopt for unset variables.
using EnvLookup = std::function<std::optional<std::string>(const std::string&)>;
EnvLookup process_env();

class Config {
public:
    // Load ~/.aspect-reauth/config.yaml (or `path`). A missing file yields an
    // empty config; a malformed one is an error naming the file.
    static Result<Config> load(const fs::path& path);
    static Result<Config> load_global();

    // Parse YAML text. `origin` names the source in error messages.
    static Result<Config> parse(const std::string& yaml, const std::string& origin = "<config>");

    // Compiled defaults, overlaid with this file, overlaid with environment.
    RunOptions resolve(const EnvLookup& env) const;

    const std::optional<std::string>& host() const { return host_; }
    const std::optional<std::string>& remote() const { return remote_; }
    const std::optional<std::string>& credential_helper() const { return credential_helper_; }
    const std::vector<std::string>& ssh_args() const { return ssh_args_; }
    const std::optional<SocketPolicy>& create_socket() const { return create_socket_; }

public:
    Config() = default;

private:
    std::optional<std::string> host_;
    std::optional<std::string> remote_;
    std::optional<std::string> credential_helper_;
    std::optional<bool> session_keyring_;
    std::optional<bool> verify_after_push_;

    std::optional<std::string> ssh_program_;
    std::vector<std::string> ssh_args_;
    std::optional<SocketPolicy> create_socket_;

    std::optional<std::string> keychain_service_;
    std::optional<std::string> key_prefix_;
    std::optional<std::string> keychain_backend_;
    std::optional<std::string> keychain_file_;
};

// Get paths
fs::path get_global_config_dir();
fs::path get_global_config_path();
fs::path get_default_credentials_file();
