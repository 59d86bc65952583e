#include <penv/process.hpp>

#include <algorithm>
#include <chrono>
#include <cerrno>
#include <cstring>

#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>

namespace penv {

std::string CommandResult::stdout_line() const {
    std::string s = stdout_str;
    while (!s.empty() && (s.back() == '\n' || s.back() == '\r')) {
        s.pop_back();
    }
    return s;
}

std::string describe_command(const std::vector<std::string>& args) {
    std::string out;
    for (const auto& a : args) {
        if (!out.empty()) out += ' ';
        out += a;
    }
    return out;
}

std::string shell_quote(const std::string& s) {
    std::string out = "'";
    for (char c : s) {
        if (c == '\'') out += "'\\''";
        else out += c;
    }
    out += '\'';
    return out;
}

// Read whatever is available on fd into buf. Returns false at EOF.
static bool drain(int fd, std::string& buf) {
    char chunk[4096];
    for (;;) {
        ssize_t n = read(fd, chunk, sizeof(chunk));
        if (n > 0) {
            buf.append(chunk, static_cast<size_t>(n));
            continue;
        }
        if (n == 0) return false;
        if (errno == EINTR) continue;
        return true;  // EAGAIN: nothing more right now
    }
}

static void close_pipe(int p[2]) {
    if (p[0] >= 0) close(p[0]);
    if (p[1] >= 0) close(p[1]);
    p[0] = p[1] = -1;
}

// The parent still holds the read end, so a child that exits early
// cannot turn this into SIGPIPE.
static Status write_input(int fd, const std::string& input) {
    size_t off = 0;
    while (off < input.size()) {
        ssize_t n = write(fd, input.data() + off, input.size() - off);
        if (n < 0) {
            if (errno == EINTR) continue;
            return PenvError{PenvError::IO,
                std::string("cannot write to child stdin: ") + strerror(errno)};
        }
        off += static_cast<size_t>(n);
    }
    return ok_status();
}

Result<CommandResult> run_command(const std::vector<std::string>& args,
                                  const std::string& working_dir,
                                  int timeout_seconds,
                                  const std::optional<std::string>& input) {
    if (args.empty()) {
        return PenvError{PenvError::InvalidArg, "run_command: empty argument list"};
    }

    std::vector<const char*> argv;
    argv.reserve(args.size() + 1);
    for (const auto& a : args) argv.push_back(a.c_str());
    argv.push_back(nullptr);

    int out_pipe[2] = {-1, -1};
    int err_pipe[2] = {-1, -1};
    int in_pipe[2] = {-1, -1};
    if (pipe2(out_pipe, O_CLOEXEC) != 0) {
        return PenvError{PenvError::IO,
            std::string("pipe() failed: ") + strerror(errno)};
    }
    if (pipe2(err_pipe, O_CLOEXEC) != 0) {
        close_pipe(out_pipe);
        return PenvError{PenvError::IO,
            std::string("pipe() failed: ") + strerror(errno)};
    }
    if (input && pipe2(in_pipe, O_CLOEXEC) != 0) {
        close_pipe(out_pipe);
        close_pipe(err_pipe);
        return PenvError{PenvError::IO,
            std::string("pipe() failed: ") + strerror(errno)};
    }

    pid_t pid = fork();
    if (pid < 0) {
        close_pipe(out_pipe);
        close_pipe(err_pipe);
        close_pipe(in_pipe);
        return PenvError{PenvError::IO,
            std::string("fork() failed: ") + strerror(errno)};
    }

    if (pid == 0) {
        close(out_pipe[0]);
        close(err_pipe[0]);
        dup2(out_pipe[1], STDOUT_FILENO);
        dup2(err_pipe[1], STDERR_FILENO);
        close(out_pipe[1]);
        close(err_pipe[1]);

        if (input) {
            close(in_pipe[1]);
            dup2(in_pipe[0], STDIN_FILENO);
            close(in_pipe[0]);
        } else {
            int devnull = open("/dev/null", O_RDONLY);
            if (devnull >= 0) {
                dup2(devnull, STDIN_FILENO);
                close(devnull);
            }
        }

        if (!working_dir.empty() && chdir(working_dir.c_str()) != 0) {
            _exit(127);
        }
        execvp(argv[0], const_cast<char* const*>(argv.data()));
        _exit(127);
    }

    close(out_pipe[1]);
    close(err_pipe[1]);
    if (input) {
        Status written = write_input(in_pipe[1], *input);
        close_pipe(in_pipe);
        if (written.is_err()) {
            kill(pid, SIGKILL);
            waitpid(pid, nullptr, 0);
            close(out_pipe[0]);
            close(err_pipe[0]);
            return std::move(written).error();
        }
    }
    fcntl(out_pipe[0], F_SETFL, O_NONBLOCK);
    fcntl(err_pipe[0], F_SETFL, O_NONBLOCK);

    CommandResult result{-1, {}, {}};
    bool out_open = true;
    bool err_open = true;
    auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(timeout_seconds);

    while (out_open || err_open) {
        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline - std::chrono::steady_clock::now()).count();
        if (remaining <= 0) {
            kill(pid, SIGKILL);
            waitpid(pid, nullptr, 0);
            close(out_pipe[0]);
            close(err_pipe[0]);
            return PenvError{PenvError::IO,
                "'" + args[0] + "' timed out after " + std::to_string(timeout_seconds) + "s"};
        }

        pollfd fds[2] = {{out_pipe[0], POLLIN, 0}, {err_pipe[0], POLLIN, 0}};
        if (!out_open) fds[0].fd = -1;
        if (!err_open) fds[1].fd = -1;

        int rc = poll(fds, 2, static_cast<int>(std::min<long long>(remaining, 250)));
        if (rc < 0 && errno != EINTR) {
            kill(pid, SIGKILL);
            waitpid(pid, nullptr, 0);
            close(out_pipe[0]);
            close(err_pipe[0]);
            return PenvError{PenvError::IO,
                std::string("poll() failed: ") + strerror(errno)};
        }
        if (out_open && (fds[0].revents & (POLLIN | POLLHUP | POLLERR))) {
            out_open = drain(out_pipe[0], result.stdout_str);
        }
        if (err_open && (fds[1].revents & (POLLIN | POLLHUP | POLLERR))) {
            err_open = drain(err_pipe[0], result.stderr_str);
        }
    }

    close(out_pipe[0]);
    close(err_pipe[0]);

    int status = 0;
    while (waitpid(pid, &status, 0) < 0) {
        if (errno != EINTR) {
            return PenvError{PenvError::IO,
                std::string("waitpid failed: ") + strerror(errno)};
        }
    }
    result.exit_code = WIFEXITED(status) ? WEXITSTATUS(status) : -1;
    return Result<CommandResult>::ok(std::move(result));
}

} // namespace penv
