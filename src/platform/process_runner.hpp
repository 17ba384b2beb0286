#pragma once

#include "process.hpp"

// Executes a ProcessSpec to completion. The seam between code that decides
// *what* to run (ssh session, refresh orchestrator, keychain) and the OS;
// tests substitute a scripted runner. Implementations must be safe to call
// from several threads at once.
class ProcessRunner {
public:
    virtual ~ProcessRunner() = default;

    // Fails only when the process could not be started or reaped; a non-zero
    // exit is a successful Result carrying that exit status.
    virtual Result<platform::ProcessResult> run(const platform::ProcessSpec& spec) = 0;
};

// Runs real child processes via platform::run_process, logging each one.
class SubprocessRunner : public ProcessRunner {
public:
    Result<platform::ProcessResult> run(const platform::ProcessSpec& spec) override;
};
