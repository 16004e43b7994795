#include "process_runner.h"
#include "constants.h"

#include <sys/wait.h>
#include <unistd.h>
#include <signal.h>
#include <fcntl.h>
#include <poll.h>
#include <cerrno>
#include <cstring>
#include <algorithm>
#include <sstream>

namespace malsand {

namespace {

void set_nonblocking(int fd) {
    int flags = fcntl(fd, F_GETFL, 0);
    if (flags != -1) {
        fcntl(fd, F_SETFL, flags | O_NONBLOCK);
    }
}

// Returns false once the pipe reached EOF
bool drain_pipe(int fd, std::string& sink) {
    char buffer[PIPE_BUFFER_SIZE];
    while (true) {
        ssize_t bytes_read = read(fd, buffer, sizeof(buffer));
        if (bytes_read > 0) {
            size_t room = MAX_CAPTURED_OUTPUT > sink.size() ? MAX_CAPTURED_OUTPUT - sink.size() : 0;
            sink.append(buffer, std::min(room, static_cast<size_t>(bytes_read)));
            continue;
        }
        if (bytes_read == 0) return false;
        if (errno == EINTR) continue;
        return true;  // EAGAIN: nothing more right now
    }
}

void terminate_group(pid_t pid) {
    kill(-pid, SIGTERM);
    auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(KILL_GRACE_MS);
    while (std::chrono::steady_clock::now() < deadline) {
        int status;
        pid_t r = waitpid(pid, &status, WNOHANG);
        if (r == pid || r == -1) {
            // Reaped already; make sure stragglers in the group go too
            kill(-pid, SIGKILL);
            return;
        }
        usleep(20 * 1000);
    }
    kill(-pid, SIGKILL);
}

} // namespace

ProcessResult ProcessRunner::run(const std::vector<std::string>& argv,
                                 std::chrono::milliseconds timeout,
                                 const std::function<bool()>& cancelled) {
    ProcessResult result;
    auto start_time = std::chrono::steady_clock::now();

    if (argv.empty()) {
        result.spawn_failed = true;
        result.error_message = "Empty command";
        return result;
    }

    int stdout_pipe[2], stderr_pipe[2], exec_pipe[2];
    if (pipe(stdout_pipe) == -1) {
        result.spawn_failed = true;
        result.error_message = "Failed to create pipes";
        return result;
    }
    if (pipe(stderr_pipe) == -1) {
        close(stdout_pipe[0]); close(stdout_pipe[1]);
        result.spawn_failed = true;
        result.error_message = "Failed to create pipes";
        return result;
    }
    if (pipe2(exec_pipe, O_CLOEXEC) == -1) {
        close(stdout_pipe[0]); close(stdout_pipe[1]);
        close(stderr_pipe[0]); close(stderr_pipe[1]);
        result.spawn_failed = true;
        result.error_message = "Failed to create pipes";
        return result;
    }

    pid_t pid = fork();
    if (pid == -1) {
        close(stdout_pipe[0]); close(stdout_pipe[1]);
        close(stderr_pipe[0]); close(stderr_pipe[1]);
        close(exec_pipe[0]); close(exec_pipe[1]);
        result.spawn_failed = true;
        result.error_message = std::string("Failed to fork process: ") + strerror(errno);
        return result;
    }

    if (pid == 0) {
        // Child: own process group so the tree can be killed as a unit
        setpgid(0, 0);
        dup2(stdout_pipe[1], STDOUT_FILENO);
        dup2(stderr_pipe[1], STDERR_FILENO);
        close(stdout_pipe[0]); close(stdout_pipe[1]);
        close(stderr_pipe[0]); close(stderr_pipe[1]);
        close(exec_pipe[0]);

        std::vector<char*> args;
        for (const auto& arg : argv) {
            args.push_back(const_cast<char*>(arg.c_str()));
        }
        args.push_back(nullptr);

        execvp(args[0], args.data());
        int err = errno;
        ssize_t ignored = write(exec_pipe[1], &err, sizeof(err));
        (void)ignored;
        _exit(127);
    }

    // Parent
    setpgid(pid, pid);
    close(stdout_pipe[1]);
    close(stderr_pipe[1]);
    close(exec_pipe[1]);

    // exec_pipe closes on successful exec; a payload means exec failed
    int exec_errno = 0;
    ssize_t n;
    do {
        n = read(exec_pipe[0], &exec_errno, sizeof(exec_errno));
    } while (n == -1 && errno == EINTR);
    close(exec_pipe[0]);
    if (n == static_cast<ssize_t>(sizeof(exec_errno))) {
        waitpid(pid, nullptr, 0);
        close(stdout_pipe[0]);
        close(stderr_pipe[0]);
        result.spawn_failed = true;
        result.error_message = "Failed to execute " + argv[0] + ": " + strerror(exec_errno);
        return result;
    }

    set_nonblocking(stdout_pipe[0]);
    set_nonblocking(stderr_pipe[0]);

    bool stdout_open = true, stderr_open = true;
    bool exited = false;
    bool wait_failed = false;
    int status = 0;
    auto deadline = start_time + timeout;

    while (!exited) {
        if (stdout_open || stderr_open) {
            struct pollfd fds[2];
            nfds_t count = 0;
            if (stdout_open) fds[count++] = {stdout_pipe[0], POLLIN, 0};
            if (stderr_open) fds[count++] = {stderr_pipe[0], POLLIN, 0};
            poll(fds, count, 100);
            if (stdout_open) stdout_open = drain_pipe(stdout_pipe[0], result.stdout_output);
            if (stderr_open) stderr_open = drain_pipe(stderr_pipe[0], result.stderr_output);
        } else {
            usleep(50 * 1000);
        }

        pid_t r = waitpid(pid, &status, WNOHANG);
        if (r == pid) {
            exited = true;
            break;
        }
        if (r == -1 && errno != EINTR) {
            wait_failed = true;
            break;
        }

        if (std::chrono::steady_clock::now() >= deadline) {
            result.timed_out = true;
        } else if (cancelled && cancelled()) {
            result.cancelled = true;
        }

        if (result.timed_out || result.cancelled) {
            terminate_group(pid);
            waitpid(pid, &status, 0);
            exited = true;
        }
    }

    // Whatever is left in the pipes after exit
    if (stdout_open) drain_pipe(stdout_pipe[0], result.stdout_output);
    if (stderr_open) drain_pipe(stderr_pipe[0], result.stderr_output);
    close(stdout_pipe[0]);
    close(stderr_pipe[0]);

    result.wall_time = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start_time);

    if (wait_failed) {
        result.exit_code = -1;
        result.error_message = "Failed to wait for child process";
        return result;
    }

    if (WIFEXITED(status)) {
        result.exit_code = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        result.exit_code = -WTERMSIG(status);
    }

    if (result.timed_out) {
        result.error_message = "Process killed after " +
            std::to_string(timeout.count()) + "ms timeout";
    } else if (result.cancelled) {
        result.error_message = "Process killed on cancellation";
    }

    return result;
}

std::string ProcessRunner::describe(const std::vector<std::string>& argv,
                                    const std::vector<std::string>& redact_after) {
    std::ostringstream out;
    bool hide_next = false;
    for (size_t i = 0; i < argv.size(); ++i) {
        if (i > 0) out << ' ';
        if (hide_next) {
            out << "<hidden>";
            hide_next = false;
            continue;
        }
        out << argv[i];
        hide_next = std::find(redact_after.begin(), redact_after.end(), argv[i]) != redact_after.end();
    }
    return out.str();
}

} // namespace malsand
