#include "config.hpp"
#include "constants.hpp"
#include <platform/platform.hpp>
#include <yaml-cpp/yaml.h>
#include <fmt/format.h>
#include <cstdlib>
#include <fstream>
#include <sstream>
#include <stdexcept>

namespace fs = std::filesystem;

// ── Paths ─────────────────────────────────────────────────────

fs::path get_global_config_dir() {
    return platform::home_dir() / ".aspect-reauth";
}

fs::path get_global_config_path() {
    return get_global_config_dir() / "config.yaml";
}

fs::path get_default_credentials_file() {
    return get_global_config_dir() / "credentials";
}

EnvLookup process_env() {
    return [](const std::string& name) -> std::optional<std::string> {
        const char* v = std::getenv(name.c_str());
        if (!v) return std::nullopt;
        return std::string(v);
    };
}

// ── Parsing ───────────────────────────────────────────────────

static std::optional<std::string> opt_string(const YAML::Node& node) {
    if (!node || node.IsNull()) return std::nullopt;
    return node.as<std::string>();
}

static std::optional<bool> opt_bool(const YAML::Node& node) {
    if (!node || node.IsNull()) return std::nullopt;
    return node.as<bool>();
}

// Accepts `create_socket: infer` as well as YAML booleans.
static std::optional<SocketPolicy> opt_policy(const YAML::Node& node) {
    if (!node || node.IsNull()) return std::nullopt;
    std::string raw = node.as<std::string>();
    auto policy = parse_socket_policy(raw);
    if (!policy) {
        throw std::runtime_error(fmt::format(
            "ssh.create_socket: unknown value '{}' (expected true, false or infer)", raw));
    }
    return policy;
}

Result<Config> Config::parse(const std::string& yaml, const std::string& origin) {
    try {
        YAML::Node root = YAML::Load(yaml);
        Config config;
        if (!root || root.IsNull()) {
            return Result<Config>::Ok(config);
        }
        if (!root.IsMap()) {
            return Result<Config>::Err(fmt::format("Failed to parse {}: top level must be a mapping", origin));
        }

        config.host_ = opt_string(root["host"]);
        config.remote_ = opt_string(root["remote"]);
        config.credential_helper_ = opt_string(root["credential_helper"]);
        config.session_keyring_ = opt_bool(root["session_keyring"]);
        config.verify_after_push_ = opt_bool(root["verify_after_push"]);

        if (const YAML::Node ssh = root["ssh"]) {
            config.ssh_program_ = opt_string(ssh["program"]);
            if (ssh["args"]) {
                if (ssh["args"].IsSequence()) {
                    config.ssh_args_ = ssh["args"].as<std::vector<std::string>>();
                } else if (ssh["args"].IsScalar()) {
                    config.ssh_args_.push_back(ssh["args"].as<std::string>());
                }
            }
            config.create_socket_ = opt_policy(ssh["create_socket"]);
        }

        if (const YAML::Node kc = root["keychain"]) {
            config.keychain_service_ = opt_string(kc["service"]);
            config.key_prefix_ = opt_string(kc["key_prefix"]);
            config.keychain_backend_ = opt_string(kc["backend"]);
            config.keychain_file_ = opt_string(kc["file"]);
        }

        return Result<Config>::Ok(config);
    } catch (const std::exception& e) {
        return Result<Config>::Err(fmt::format("Failed to parse {}: {}", origin, e.what()));
    }
}

Result<Config> Config::load(const fs::path& path) {
    std::error_code ec;
    if (!fs::exists(path, ec)) {
        return Result<Config>::Ok(Config{});
    }

    std::ifstream in(path);
    if (!in) {
        return Result<Config>::Err("Failed to open config file " + path.string());
    }
    std::stringstream buf;
    buf << in.rdbuf();
    return parse(buf.str(), path.string());
}

Result<Config> Config::load_global() {
    return load(get_global_config_path());
}

// ── Resolution ────────────────────────────────────────────────

RunOptions Config::resolve(const EnvLookup& env) const {
    RunOptions o;
    o.host = host_.value_or(DEFAULT_HOST);
    o.remote = remote_.value_or(DEFAULT_REMOTE);
    o.credential_helper = credential_helper_.value_or(DEFAULT_CREDENTIAL_HELPER);
    o.session_keyring = session_keyring_.value_or(false);
    o.verify_after_push = verify_after_push_.value_or(true);

    o.ssh_program = ssh_program_.value_or(DEFAULT_SSH_PROGRAM);
    o.ssh_args = ssh_args_;
    o.socket_policy = create_socket_.value_or(SocketPolicy::Infer);

    o.keychain_service = keychain_service_.value_or(DEFAULT_KEYCHAIN_SERVICE);
    o.key_prefix = key_prefix_.value_or(DEFAULT_KEY_PREFIX);
    o.keychain_backend = keychain_backend_.value_or("system");
    o.credentials_file = keychain_file_ ? fs::path(*keychain_file_) : get_default_credentials_file();

    if (env) {
        if (auto v = env(ENV_REMOTE); v && !v->empty()) o.remote = *v;
        if (auto v = env(ENV_CREDENTIAL_HELPER); v && !v->empty()) o.credential_helper = *v;
    }
    return o;
}
