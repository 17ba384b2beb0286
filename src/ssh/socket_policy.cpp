#include "socket_policy.hpp"
#include <core/log.hpp>
#include <core/utils.hpp>
#include <platform/process_runner.hpp>
#include <fmt/format.h>
#include <sstream>

bool declares_own_multiplexing(const std::string& config_dump) {
    // `ssh -G` prints one lowercase "<key> <value>" pair per line, so a plain
    // line match is enough. It always prints a controlpersist line, so that
    // key says nothing about whether the host multiplexes.
    std::istringstream in(config_dump);
    std::string line;
    while (std::getline(in, line)) {
        trim(line);
        if (line == "controlmaster auto") return true;
    }
    return false;
}

bool resolve_socket_policy(SocketPolicy policy, const std::string& host,
                           const SshConfigQuery& query) {
    switch (policy) {
        case SocketPolicy::CreateAlways: return true;
        case SocketPolicy::ReuseAlways:  return false;
        case SocketPolicy::Infer:        break;
    }

    auto dump = query(host);
    if (dump.is_err()) {
        reauth_log(fmt::format("ssh -G {} failed, creating own socket: {}", host, dump.error));
        return true;
    }
    bool own_mux = declares_own_multiplexing(dump.value);
    reauth_log(fmt::format("{} {} its own multiplexing", host,
                           own_mux ? "declares" : "does not declare"));
    return !own_mux;
}

SshConfigQuery make_ssh_config_query(ProcessRunner& runner, const std::string& ssh_program,
                                     const std::vector<std::string>& ssh_args) {
    return [&runner, ssh_program, ssh_args](const std::string& host) -> Result<std::string> {
        platform::ProcessSpec spec(ssh_program);
        spec.add_args(ssh_args).add_args({"-G", host});
        spec.stdout_mode = platform::Stdio::Pipe;
        spec.stderr_mode = platform::Stdio::Pipe;

        auto r = runner.run(spec);
        if (r.is_err()) {
            return Result<std::string>::Err(r.error);
        }
        if (r.value.failed()) {
            return Result<std::string>::Err(fmt::format(
                "failed to check for existing control socket: {}\n\n{}",
                r.value.describe(), trimmed(r.value.stderr_data)));
        }
        return Result<std::string>::Ok(std::move(r.value.stdout_data));
    };
}
