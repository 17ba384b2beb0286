#include "args.hpp"
#include "theme.hpp"
#include <core/constants.hpp>
#include <fmt/format.h>
#include <iostream>

using R = Result<CliArgs>;

// Splits "--name=value" into name and value; value is nullopt without '='.
static std::pair<std::string, std::optional<std::string>> split_eq(const std::string& arg) {
    auto eq = arg.find('=');
    if (eq == std::string::npos) return {arg, std::nullopt};
    return {arg.substr(0, eq), arg.substr(eq + 1)};
}

Result<CliArgs> parse_args(const std::vector<std::string>& args) {
    CliArgs cli;
    bool options_done = false;

    for (size_t i = 0; i < args.size(); i++) {
        const std::string& arg = args[i];

        // Value for an option that takes one, from "=value" or the next argv slot.
        auto take_value = [&](const std::optional<std::string>& inline_value) -> std::optional<std::string> {
            if (inline_value) return inline_value;
            if (i + 1 < args.size()) return args[++i];
            return std::nullopt;
        };

        if (options_done || arg.empty() || arg[0] != '-' || arg == "-") {
            if (cli.host) {
                return R::Err(fmt::format("unexpected argument '{}'", arg));
            }
            cli.host = arg;
            continue;
        }
        if (arg == "--") {
            options_done = true;
            continue;
        }

        if (arg.rfind("--", 0) == 0) {
            auto [name, value] = split_eq(arg);

            if (name == "--help") {
                cli.show_help = true;
            } else if (name == "--version") {
                cli.show_version = true;
            } else if (name == "--force") {
                cli.force = true;
            } else if (name == "--force-local") {
                cli.force_local = true;
            } else if (name == "--force-remote") {
                cli.force_remote = true;
            } else if (name == "--session-keyring") {
                cli.session_keyring = true;
            } else if (name == "--no-verify") {
                cli.no_verify = true;
            } else if (name == "--verbose") {
                cli.verbose = true;
            } else if (name == "--no-create-socket") {
                cli.no_create_socket = true;
            } else if (name == "--create-socket") {
                // Value must be attached with '='; the bare flag means true.
                if (!value) {
                    cli.create_socket = SocketPolicy::CreateAlways;
                } else {
                    auto policy = parse_socket_policy(*value);
                    if (!policy) {
                        return R::Err(fmt::format(
                            "invalid value '{}' for --create-socket (expected true, false or infer)", *value));
                    }
                    cli.create_socket = policy;
                }
            } else if (name == "--remote" || name == "--credential-helper" ||
                       name == "--ssh-arg" || name == "--ssh_arg" || name == "--config") {
                auto v = take_value(value);
                if (!v) return R::Err(fmt::format("{} requires a value", name));
                if (name == "--remote") cli.remote = *v;
                else if (name == "--credential-helper") cli.credential_helper = *v;
                else if (name == "--config") cli.config_path = *v;
                else cli.ssh_args.push_back(*v);
            } else {
                return R::Err(fmt::format("unknown option '{}'", name));
            }
            continue;
        }

        // Short options, bundled or not: -f -s -v -h -C, -c[=VAL], -A VAL / -AVAL.
        // -c=VAL and -A consume the rest of the bundle.
        for (size_t j = 1; j < arg.size(); j++) {
            char opt = arg[j];
            std::string rest = arg.substr(j + 1);
            bool consumed_rest = false;
            switch (opt) {
                case 'f': cli.force = true; break;
                case 's': cli.session_keyring = true; break;
                case 'v': cli.verbose = true; break;
                case 'h': cli.show_help = true; break;
                case 'C': cli.no_create_socket = true; break;
                case 'c':
                    if (rest.empty() || rest[0] != '=') {
                        cli.create_socket = SocketPolicy::CreateAlways;
                    } else {
                        auto policy = parse_socket_policy(rest.substr(1));
                        if (!policy) {
                            return R::Err(fmt::format(
                                "invalid value '{}' for --create-socket (expected true, false or infer)",
                                rest.substr(1)));
                        }
                        cli.create_socket = policy;
                        consumed_rest = true;
                    }
                    break;
                case 'A': {
                    auto v = take_value(rest.empty() ? std::nullopt : std::optional<std::string>(rest));
                    if (!v) return R::Err("-A requires a value");
                    cli.ssh_args.push_back(*v);
                    consumed_rest = true;
                    break;
                }
                default:
                    return R::Err(fmt::format("unknown option '-{}' in '{}'", opt, arg));
            }
            if (consumed_rest) break;
        }
    }

    if (cli.create_socket && cli.no_create_socket) {
        return R::Err("--create-socket cannot be used with --no-create-socket");
    }
    return R::Ok(cli);
}

void apply_cli_args(RunOptions& opts, const CliArgs& cli) {
    if (cli.host) opts.host = *cli.host;
    if (cli.remote) opts.remote = *cli.remote;
    if (cli.credential_helper) opts.credential_helper = *cli.credential_helper;

    opts.force_local = cli.force || cli.force_local;
    opts.force_remote = cli.force || cli.force_remote;
    if (cli.session_keyring) opts.session_keyring = true;
    if (cli.no_verify) opts.verify_after_push = false;
    opts.verbose = cli.verbose;

    if (cli.no_create_socket) {
        opts.socket_policy = SocketPolicy::ReuseAlways;
    } else if (cli.create_socket) {
        opts.socket_policy = *cli.create_socket;
    }
    opts.ssh_args.insert(opts.ssh_args.end(), cli.ssh_args.begin(), cli.ssh_args.end());
}

void print_usage() {
    std::cout << theme::bold("aspect-reauth") << theme::dim(" " ASPECT_REAUTH_VERSION) << "\n"
              << theme::dim("  Sync the Aspect remote-build credential into a dev host's kernel keyring.")
              << "\n\n"
              << "  Usage: aspect-reauth [options] [host]   " << theme::dim("(host defaults to devbox)")
              << "\n\n";
    std::cout << theme::option("--remote=<dns>", "Aspect remote DNS name")
              << theme::option("--credential-helper=<exe>", "Credential helper executable")
              << theme::option("-f, --force", "Re-login and push even if credentials are valid")
              << theme::option("    --force-local", "Re-login even if the local credential is valid")
              << theme::option("    --force-remote", "Push even if the remote credential is valid")
              << theme::option("-s, --session-keyring", "Use the session (not user) keyring on the host")
              << theme::option("-c, --create-socket[=true|false|infer]", "Create a temporary SSH control socket")
              << theme::option("-C, --no-create-socket", "Do not create a temporary control socket")
              << theme::option("-A, --ssh-arg=<arg>", "Extra ssh argument (repeatable)")
              << theme::option("    --no-verify", "Skip the remote re-check after pushing")
              << theme::option("    --config=<path>", "Config file (default ~/.aspect-reauth/config.yaml)")
              << theme::option("-v, --verbose", "Echo debug log lines to stderr")
              << theme::option("    --version", "Show version")
              << theme::option("-h, --help", "Show this help")
              << "\n";
}
