#include "process.hpp"
#include <core/constants.hpp>
#include <fmt/format.h>

#include <cerrno>
#include <csignal>
#include <cstring>
#include <thread>
#include <fcntl.h>
#include <poll.h>
#include <pthread.h>
#include <sys/wait.h>
#include <unistd.h>

namespace platform {

// ── helpers ──────────────────────────────────────────────────

static void close_fd(int& fd) {
    if (fd >= 0) {
        close(fd);
        fd = -1;
    }
}

// Both ends close-on-exec so concurrently spawned children never inherit
// another child's pipe (which would hold its EOF hostage).
static bool make_pipe(int fds[2]) {
#ifdef __linux__
    return pipe2(fds, O_CLOEXEC) == 0;
#else
    if (pipe(fds) != 0) return false;
    fcntl(fds[0], F_SETFD, FD_CLOEXEC);
    fcntl(fds[1], F_SETFD, FD_CLOEXEC);
    return true;
#endif
}

// Child side only: point `target` at the pipe end or /dev/null.
static void wire_child_stream(Stdio mode, int pipe_end, int target, int null_flags) {
    if (mode == Stdio::Pipe) {
        dup2(pipe_end, target);
    } else if (mode == Stdio::Null) {
        int fd = open("/dev/null", null_flags);
        if (fd >= 0) {
            dup2(fd, target);
            if (fd != target) close(fd);
        }
    }
}

// Writes the whole payload, then closes fd. SIGPIPE is blocked on the calling
// thread so a child that exits without reading stdin yields EPIPE instead of
// terminating us.
static void write_input(int fd, const std::string& input) {
    sigset_t set;
    sigemptyset(&set);
    sigaddset(&set, SIGPIPE);
    pthread_sigmask(SIG_BLOCK, &set, nullptr);

    const char* p = input.data();
    size_t left = input.size();
    while (left > 0) {
        ssize_t n = write(fd, p, left);
        if (n < 0) {
            if (errno == EINTR) continue;
            break;  // EPIPE: reader went away
        }
        p += n;
        left -= static_cast<size_t>(n);
    }
    close(fd);
}

// Joins on scope exit so an exception while draining cannot leak a joinable thread.
struct JoinGuard {
    std::thread& t;
    ~JoinGuard() { if (t.joinable()) t.join(); }
};

// Read stdout/stderr until both reach EOF. Takes ownership of both descriptors.
static void drain(int out_fd, int err_fd, std::string& out, std::string& err) {
    char buf[PROCESS_READ_BUF_SIZE];
    struct pollfd pfds[2];
    std::string* sinks[2];

    for (;;) {
        int n = 0;
        if (out_fd >= 0) { pfds[n] = {out_fd, POLLIN, 0}; sinks[n] = &out; n++; }
        if (err_fd >= 0) { pfds[n] = {err_fd, POLLIN, 0}; sinks[n] = &err; n++; }
        if (n == 0) return;

        int pr = poll(pfds, n, -1);
        if (pr < 0) {
            if (errno == EINTR) continue;
            close_fd(out_fd);
            close_fd(err_fd);
            return;
        }

        for (int i = 0; i < n; i++) {
            if (pfds[i].revents == 0) continue;
            ssize_t r = read(pfds[i].fd, buf, sizeof(buf));
            if (r > 0) {
                sinks[i]->append(buf, static_cast<size_t>(r));
            } else if (r == 0 || (errno != EINTR && errno != EAGAIN)) {
                if (pfds[i].fd == out_fd) close_fd(out_fd);
                else close_fd(err_fd);
            }
        }
    }
}

// ── ProcessSpec / ProcessResult ──────────────────────────────

std::string ProcessSpec::display() const {
    std::string s = program;
    for (const auto& a : args) {
        s += ' ';
        s += a;
    }
    return s;
}

std::string ProcessResult::describe() const {
    if (term_signal != 0) return fmt::format("killed by signal {}", term_signal);
    return fmt::format("exit status {}", exit_code);
}

// ── ProcessHandle ────────────────────────────────────────────

ProcessHandle::ProcessHandle() = default;

ProcessHandle::~ProcessHandle() {
    close_fds();
}

ProcessHandle::ProcessHandle(ProcessHandle&& other) noexcept
    : pid_(other.pid_), stdin_fd_(other.stdin_fd_),
      stdout_fd_(other.stdout_fd_), stderr_fd_(other.stderr_fd_) {
    other.pid_ = -1;
    other.stdin_fd_ = other.stdout_fd_ = other.stderr_fd_ = -1;
}

ProcessHandle& ProcessHandle::operator=(ProcessHandle&& other) noexcept {
    if (this != &other) {
        close_fds();
        pid_ = other.pid_;
        stdin_fd_ = other.stdin_fd_;
        stdout_fd_ = other.stdout_fd_;
        stderr_fd_ = other.stderr_fd_;
        other.pid_ = -1;
        other.stdin_fd_ = other.stdout_fd_ = other.stderr_fd_ = -1;
    }
    return *this;
}

bool ProcessHandle::valid() const {
    return pid_ > 0;
}

int ProcessHandle::wait_status() {
    if (pid_ <= 0) return -1;
    int status = 0;
    while (waitpid(pid_, &status, 0) < 0) {
        if (errno != EINTR) {
            pid_ = -1;
            return -1;
        }
    }
    pid_ = -1;
    return status;
}

int ProcessHandle::release_stdin() {
    int fd = stdin_fd_;
    stdin_fd_ = -1;
    return fd;
}

int ProcessHandle::release_stdout() {
    int fd = stdout_fd_;
    stdout_fd_ = -1;
    return fd;
}

int ProcessHandle::release_stderr() {
    int fd = stderr_fd_;
    stderr_fd_ = -1;
    return fd;
}

void ProcessHandle::close_fds() {
    close_fd(stdin_fd_);
    close_fd(stdout_fd_);
    close_fd(stderr_fd_);
}

// ── spawn ────────────────────────────────────────────────────

Result<ProcessHandle> spawn(const ProcessSpec& spec) {
    int in_pipe[2] = {-1, -1};
    int out_pipe[2] = {-1, -1};
    int err_pipe[2] = {-1, -1};
    int exec_pipe[2] = {-1, -1};  // carries errno from a failed exec

    auto close_all = [&]() {
        for (int* p : {in_pipe, out_pipe, err_pipe, exec_pipe}) {
            close_fd(p[0]);
            close_fd(p[1]);
        }
    };

    if ((spec.stdin_mode == Stdio::Pipe && !make_pipe(in_pipe)) ||
        (spec.stdout_mode == Stdio::Pipe && !make_pipe(out_pipe)) ||
        (spec.stderr_mode == Stdio::Pipe && !make_pipe(err_pipe)) ||
        !make_pipe(exec_pipe)) {
        int saved = errno;
        close_all();
        return Result<ProcessHandle>::Err(fmt::format(
            "failed to create pipe for {}: {}", spec.program, std::strerror(saved)));
    }

    // Build argv before forking; the child must not allocate.
    std::vector<const char*> argv;
    argv.reserve(spec.args.size() + 2);
    argv.push_back(spec.program.c_str());
    for (const auto& a : spec.args) argv.push_back(a.c_str());
    argv.push_back(nullptr);

    pid_t pid = fork();
    if (pid < 0) {
        int saved = errno;
        close_all();
        return Result<ProcessHandle>::Err(fmt::format(
            "failed to fork for {}: {}", spec.program, std::strerror(saved)));
    }

    if (pid == 0) {
        // Child process
        wire_child_stream(spec.stdin_mode, in_pipe[0], STDIN_FILENO, O_RDONLY);
        wire_child_stream(spec.stdout_mode, out_pipe[1], STDOUT_FILENO, O_WRONLY);
        wire_child_stream(spec.stderr_mode, err_pipe[1], STDERR_FILENO, O_WRONLY);

        execvp(spec.program.c_str(), const_cast<char* const*>(argv.data()));

        int err = errno;
        ssize_t ignored = write(exec_pipe[1], &err, sizeof(err));
        (void)ignored;
        _exit(127);  // exec failed
    }

    // Parent
    close_fd(in_pipe[0]);
    close_fd(out_pipe[1]);
    close_fd(err_pipe[1]);
    close_fd(exec_pipe[1]);

    ProcessHandle handle;
    handle.pid_ = pid;
    handle.stdin_fd_ = in_pipe[1];
    handle.stdout_fd_ = out_pipe[0];
    handle.stderr_fd_ = err_pipe[0];

    // exec_pipe closes on a successful exec, so a read of 0 bytes means success.
    int child_errno = 0;
    ssize_t n;
    do {
        n = read(exec_pipe[0], &child_errno, sizeof(child_errno));
    } while (n < 0 && errno == EINTR);
    close_fd(exec_pipe[0]);

    if (n == static_cast<ssize_t>(sizeof(child_errno))) {
        handle.wait_status();
        return Result<ProcessHandle>::Err(fmt::format(
            "failed to spawn {}: {}", spec.program, std::strerror(child_errno)));
    }

    return Result<ProcessHandle>::Ok(std::move(handle));
}

// ── run_process ──────────────────────────────────────────────

Result<ProcessResult> run_process(const ProcessSpec& spec) {
    auto spawned = spawn(spec);
    if (spawned.is_err()) {
        return Result<ProcessResult>::Err(spawned.error);
    }
    ProcessHandle child = std::move(spawned.value);

    std::thread writer;
    JoinGuard join_writer{writer};
    if (spec.stdin_mode == Stdio::Pipe) {
        int fd = child.release_stdin();
        const std::string& input = spec.input;
        writer = std::thread([fd, &input]() { write_input(fd, input); });
    }

    ProcessResult result;
    drain(child.release_stdout(), child.release_stderr(),
          result.stdout_data, result.stderr_data);

    int status = child.wait_status();
    if (writer.joinable()) writer.join();

    if (status == -1) {
        return Result<ProcessResult>::Err(fmt::format("failed waiting for {}", spec.program));
    }
    if (WIFEXITED(status)) {
        result.exit_code = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        result.term_signal = WTERMSIG(status);
    }
    return Result<ProcessResult>::Ok(std::move(result));
}

} // namespace platform
