#pragma once

#include <functional>
#include <string>
#include <vector>
#include <core/types.hpp>

class ProcessRunner;

// Returns the effective client configuration dump for a host (`ssh -G host`).
using SshConfigQuery = std::function<Result<std::string>(const std::string& host)>;

// True if an `ssh -G` dump shows the host runs its own multiplexing
// ("controlmaster auto").
bool declares_own_multiplexing(const std::string& config_dump);

// Decide whether this run should create its own control socket.
// CreateAlways/ReuseAlways are taken as given. Infer asks `query` and creates
// a socket unless the host already multiplexes; a failed query counts as
// "does not multiplex".
bool resolve_socket_policy(SocketPolicy policy, const std::string& host,
                           const SshConfigQuery& query);

// Query backed by `<ssh_program> <ssh_args> -G <host>`.
SshConfigQuery make_ssh_config_query(ProcessRunner& runner, const std::string& ssh_program,
                                     const std::vector<std::string>& ssh_args);
