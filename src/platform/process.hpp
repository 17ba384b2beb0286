#pragma once

#include <initializer_list>
#include <string>
#include <vector>
#include <core/types.hpp>

namespace platform {

// How one of a child's standard streams is wired.
//   Null    /dev/null
//   Inherit shares the parent's descriptor (interactive helpers)
//   Pipe    stdin: fed from ProcessSpec::input; stdout/stderr: captured
enum class Stdio {
    Null,
    Inherit,
    Pipe,
};

// Everything needed to launch a child process. Built by callers (e.g.
// SshSession::command) and handed to a ProcessRunner to execute.
struct ProcessSpec {
    std::string program;
    std::vector<std::string> args;

    Stdio stdin_mode = Stdio::Null;
    std::string input;              // written to stdin when stdin_mode == Pipe
    Stdio stdout_mode = Stdio::Null;
    Stdio stderr_mode = Stdio::Pipe;

    ProcessSpec() = default;
    explicit ProcessSpec(std::string prog) : program(std::move(prog)) {}

    ProcessSpec& arg(std::string a) {
        args.push_back(std::move(a));
        return *this;
    }

    ProcessSpec& add_args(std::initializer_list<std::string> list) {
        args.insert(args.end(), list.begin(), list.end());
        return *this;
    }

    ProcessSpec& add_args(const std::vector<std::string>& list) {
        args.insert(args.end(), list.begin(), list.end());
        return *this;
    }

    // "program arg1 arg2 ..." for logs and error messages. Never includes input.
    std::string display() const;
};

// Exit information plus whatever streams were captured.
struct ProcessResult {
    int exit_code = -1;     // valid when term_signal == 0
    int term_signal = 0;    // non-zero if the child was killed by a signal
    std::string stdout_data;
    std::string stderr_data;

    bool success() const { return term_signal == 0 && exit_code == 0; }
    bool failed() const { return !success(); }

    // "exit status 1" or "killed by signal 9"
    std::string describe() const;
};

// Opaque handle to a spawned child process and the parent ends of its pipes.
class ProcessHandle {
public:
    ProcessHandle();
    ~ProcessHandle();

    ProcessHandle(ProcessHandle&& other) noexcept;
    ProcessHandle& operator=(ProcessHandle&& other) noexcept;
    ProcessHandle(const ProcessHandle&) = delete;
    ProcessHandle& operator=(const ProcessHandle&) = delete;

    // True if the process handle is valid (was successfully spawned).
    bool valid() const;

    // Block until the process exits and return its raw wait status.
    // Returns -1 if the handle is invalid or already reaped.
    int wait_status();

    int native_handle() const { return pid_; }

    // Transfer ownership of the parent pipe ends to the caller.
    // Each returns -1 when that stream is not piped.
    int release_stdin();
    int release_stdout();
    int release_stderr();

private:
    int pid_ = -1;
    int stdin_fd_ = -1;
    int stdout_fd_ = -1;
    int stderr_fd_ = -1;

    void close_fds();

    friend Result<ProcessHandle> spawn(const ProcessSpec& spec);
};

// Spawn a child process wired as described by spec. Fails if pipes cannot be
// created, fork fails, or the program cannot be executed.
Result<ProcessHandle> spawn(const ProcessSpec& spec);

// Spawn, feed stdin from a dedicated writer thread while this thread drains
// stdout/stderr, then reap. Never blocks on a full pipe in either direction.
Result<ProcessResult> run_process(const ProcessSpec& spec);

} // namespace platform
