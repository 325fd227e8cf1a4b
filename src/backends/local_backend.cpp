#include "backends/local_backend.hpp"

#include <algorithm>
#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <fcntl.h>
#include <memory>
#include <poll.h>
#include <signal.h>
#include <sys/wait.h>
#include <system_error>
#include <unistd.h>
#include <utility>
#include "core/logging/logger.hpp"

namespace scriptbox::backends {

using core::errors::ErrorCategory;
using core::errors::ScriptboxError;
using protocol::RawExecutionResult;

namespace {

// Owns the on-disk harness for one run and unlinks it on destruction.
class EphemeralScriptFile {
public:
    explicit EphemeralScriptFile(std::string path) : path_(std::move(path)) {}
    ~EphemeralScriptFile() { static_cast<void>(unlink(path_.c_str())); }

    EphemeralScriptFile(const EphemeralScriptFile&) = delete;
    EphemeralScriptFile& operator=(const EphemeralScriptFile&) = delete;

    const std::string& path() const { return path_; }

private:
    std::string path_;
};

struct StreamCapture {
    int fd = -1;
    bool open = true;
    std::string text;
    std::size_t dropped_bytes = 0;
};

void close_fd(int& fd) {
    if (fd >= 0) {
        static_cast<void>(close(fd));
        fd = -1;
    }
}

void set_nonblocking(const int fd) {
    const int flags = fcntl(fd, F_GETFL, 0);
    if (flags == -1) {
        return;
    }
    static_cast<void>(fcntl(fd, F_SETFL, flags | O_NONBLOCK));
}

std::filesystem::path resolve_temp_directory(const std::filesystem::path& configured) {
    if (!configured.empty()) {
        return configured;
    }
    std::error_code ec;
    auto directory = std::filesystem::temp_directory_path(ec);
    return ec ? std::filesystem::path("/tmp") : directory;
}

core::errors::Result<std::unique_ptr<EphemeralScriptFile>> write_ephemeral_script(
    const std::filesystem::path& directory, const std::string& contents) {
    std::string pattern = (directory / "scriptbox-XXXXXX.py").string();
    // mkostemps creates the file with mode 0600.
    const int fd = mkostemps(pattern.data(), 3, O_CLOEXEC);
    if (fd < 0) {
        return ScriptboxError{ErrorCategory::Internal,
                              "Failed to create temporary harness file in " +
                                  directory.string() + ": " + std::strerror(errno),
                              "tempfile_create_failed"};
    }
    auto file = std::make_unique<EphemeralScriptFile>(pattern);

    std::size_t written = 0;
    while (written < contents.size()) {
        const ssize_t n = write(fd, contents.data() + written, contents.size() - written);
        if (n < 0 && errno == EINTR) {
            continue;
        }
        if (n <= 0) {
            const int saved_errno = errno;
            static_cast<void>(close(fd));
            return ScriptboxError{ErrorCategory::Internal,
                                  "Failed to write temporary harness file: " +
                                      std::string(std::strerror(saved_errno)),
                                  "tempfile_write_failed"};
        }
        written += static_cast<std::size_t>(n);
    }
    if (close(fd) != 0) {
        return ScriptboxError{ErrorCategory::Internal,
                              "Failed to close temporary harness file: " +
                                  std::string(std::strerror(errno)),
                              "tempfile_write_failed"};
    }
    return std::move(file);
}

void drain_pipe(StreamCapture& stream, const std::size_t limit) {
    char buffer[4096];
    while (stream.open) {
        const ssize_t n = read(stream.fd, buffer, sizeof(buffer));
        if (n > 0) {
            const std::size_t received = static_cast<std::size_t>(n);
            const std::size_t room = limit - std::min(limit, stream.text.size());
            const std::size_t kept = std::min(room, received);
            stream.text.append(buffer, kept);
            stream.dropped_bytes += received - kept;
            continue;
        }
        if (n < 0 && errno == EINTR) {
            continue;
        }
        if (n < 0 && (errno == EAGAIN || errno == EWOULDBLOCK)) {
            return;
        }
        stream.open = false;
        close_fd(stream.fd);
    }
}

void wait_for_child(const pid_t pid, int& status) {
    while (waitpid(pid, &status, 0) < 0 && errno == EINTR) {
    }
}

void append_truncation_note(std::string& stderr_text, const char* stream_name,
                            const StreamCapture& stream, const std::size_t limit) {
    if (stream.dropped_bytes == 0) {
        return;
    }
    if (!stderr_text.empty() && stderr_text.back() != '\n') {
        stderr_text += "\n";
    }
    stderr_text += "[scriptbox] " + std::string(stream_name) + " truncated at " +
                   std::to_string(limit) + " bytes; " +
                   std::to_string(stream.dropped_bytes) + " bytes dropped.";
}

}  // namespace

LocalBackend::LocalBackend(LocalBackendOptions options) : options_(std::move(options)) {}

core::errors::Result<RawExecutionResult> LocalBackend::run(
    const std::string& harness_source, const std::chrono::seconds timeout) const {
    if (options_.interpreter_command.empty()) {
        return ScriptboxError{ErrorCategory::Internal,
                              "No interpreter command configured for local execution.",
                              "invalid_interpreter", "Set SCRIPTBOX_PYTHON."};
    }

    auto script_file = write_ephemeral_script(
        resolve_temp_directory(options_.temp_directory), harness_source);
    if (core::errors::is_error(script_file)) {
        return core::errors::get_error(script_file);
    }
    const auto& harness_file = core::errors::get_value(script_file);

    // argv is assembled before fork; the child only calls async-signal-safe functions.
    std::vector<std::string> arguments = options_.interpreter_command;
    arguments.push_back(harness_file->path());
    std::vector<char*> argv;
    argv.reserve(arguments.size() + 1);
    for (auto& argument : arguments) {
        argv.push_back(argument.data());
    }
    argv.push_back(nullptr);

    int stdout_pipe[2] = {-1, -1};
    int stderr_pipe[2] = {-1, -1};
    int exec_status_pipe[2] = {-1, -1};
    if (pipe2(stdout_pipe, O_CLOEXEC) != 0 || pipe2(stderr_pipe, O_CLOEXEC) != 0 ||
        pipe2(exec_status_pipe, O_CLOEXEC) != 0) {
        const int saved_errno = errno;
        for (int* fds : {stdout_pipe, stderr_pipe, exec_status_pipe}) {
            close_fd(fds[0]);
            close_fd(fds[1]);
        }
        return ScriptboxError{ErrorCategory::Internal,
                              "Failed to create process pipes: " +
                                  std::string(std::strerror(saved_errno)),
                              "pipe_creation_failed"};
    }

    const auto started = std::chrono::steady_clock::now();
    const pid_t pid = fork();
    if (pid < 0) {
        const int saved_errno = errno;
        for (int* fds : {stdout_pipe, stderr_pipe, exec_status_pipe}) {
            close_fd(fds[0]);
            close_fd(fds[1]);
        }
        return ScriptboxError{ErrorCategory::Internal,
                              "Failed to fork interpreter process: " +
                                  std::string(std::strerror(saved_errno)),
                              "fork_failed"};
    }

    if (pid == 0) {
        static_cast<void>(setpgid(0, 0));
        const int dev_null = open("/dev/null", O_RDONLY);
        if (dev_null >= 0) {
            static_cast<void>(dup2(dev_null, STDIN_FILENO));
            static_cast<void>(close(dev_null));
        }
        static_cast<void>(dup2(stdout_pipe[1], STDOUT_FILENO));
        static_cast<void>(dup2(stderr_pipe[1], STDERR_FILENO));
        execvp(argv[0], argv.data());
        const int exec_errno = errno;
        static_cast<void>(write(exec_status_pipe[1], &exec_errno, sizeof(exec_errno)));
        _exit(127);
    }

    // Also set from the parent so the group exists before any kill below.
    static_cast<void>(setpgid(pid, pid));
    close_fd(stdout_pipe[1]);
    close_fd(stderr_pipe[1]);
    close_fd(exec_status_pipe[1]);

    int exec_errno = 0;
    ssize_t status_bytes = 0;
    do {
        status_bytes = read(exec_status_pipe[0], &exec_errno, sizeof(exec_errno));
    } while (status_bytes < 0 && errno == EINTR);
    close_fd(exec_status_pipe[0]);

    int status = 0;
    if (status_bytes == static_cast<ssize_t>(sizeof(exec_errno))) {
        wait_for_child(pid, status);
        close_fd(stdout_pipe[0]);
        close_fd(stderr_pipe[0]);
        return ScriptboxError{ErrorCategory::Internal,
                              "Failed to start interpreter '" + arguments.front() +
                                  "': " + std::strerror(exec_errno),
                              "interpreter_start_failed",
                              "Check that SCRIPTBOX_PYTHON names an installed interpreter."};
    }

    StreamCapture out;
    out.fd = stdout_pipe[0];
    StreamCapture err;
    err.fd = stderr_pipe[0];
    set_nonblocking(out.fd);
    set_nonblocking(err.fd);

    const auto deadline = started + timeout;
    const std::size_t limit = options_.max_output_bytes;
    bool child_exited = false;
    bool timed_out = false;

    while (out.open || err.open || !child_exited) {
        const auto now = std::chrono::steady_clock::now();
        if (now >= deadline) {
            if (!child_exited) {
                timed_out = true;
                static_cast<void>(kill(-pid, SIGKILL));
                static_cast<void>(kill(pid, SIGKILL));
                wait_for_child(pid, status);
                child_exited = true;
            }
            break;
        }

        pollfd fds[2];
        nfds_t nfds = 0;
        for (const StreamCapture* stream : {&out, &err}) {
            if (stream->open) {
                fds[nfds].fd = stream->fd;
                fds[nfds].events = POLLIN;
                fds[nfds].revents = 0;
                ++nfds;
            }
        }
        const auto remaining =
            std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now).count();
        const int wait_ms = static_cast<int>(std::min<long long>(remaining + 1, 50));
        static_cast<void>(poll(nfds > 0 ? fds : nullptr, nfds, wait_ms));

        drain_pipe(out, limit);
        drain_pipe(err, limit);

        if (!child_exited && waitpid(pid, &status, WNOHANG) == pid) {
            child_exited = true;
        }
    }

    if (out.open || err.open) {
        // A descendant outlived the interpreter and still holds the pipes.
        static_cast<void>(kill(-pid, SIGKILL));
        close_fd(out.fd);
        close_fd(err.fd);
    }

    const auto elapsed_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                                std::chrono::steady_clock::now() - started)
                                .count();

    RawExecutionResult result;
    if (timed_out) {
        result.stdout_text = "";
        result.stderr_text =
            "Execution timed out after " + std::to_string(timeout.count()) + " seconds";
        result.exit_status = protocol::kExitTimedOut;
        LOG_DEBUG("Local interpreter killed after " + std::to_string(elapsed_ms) + " ms");
        return result;
    }

    if (WIFEXITED(status)) {
        result.exit_status = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        result.exit_status = 128 + WTERMSIG(status);
    } else {
        result.exit_status = protocol::kExitBackendFault;
    }
    result.stdout_text = std::move(out.text);
    result.stderr_text = std::move(err.text);
    append_truncation_note(result.stderr_text, "stdout", out, limit);
    append_truncation_note(result.stderr_text, "stderr", err, limit);

    LOG_DEBUG("Local interpreter exited with status " + std::to_string(result.exit_status) +
              " in " + std::to_string(elapsed_ms) + " ms");
    return result;
}

}  // namespace scriptbox::backends
