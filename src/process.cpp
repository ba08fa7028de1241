#include "process.hpp"
#include <spdlog/spdlog.h>
#include <cerrno>
#include <csignal>
#include <cstring>
#include <fcntl.h>
#include <poll.h>
#include <sys/wait.h>
#include <unistd.h>

namespace {

// What the child reports back through the status pipe when it cannot exec.
struct ChildFailure {
    int stage;  // 0: chdir, 1: exec
    int error;
};

void close_fd(int& fd) {
    if (fd >= 0) {
        close(fd);
        fd = -1;
    }
}

bool drain(int& fd, std::string& sink) {
    char buffer[4096];
    ssize_t n = read(fd, buffer, sizeof(buffer));
    if (n > 0) {
        sink.append(buffer, static_cast<std::size_t>(n));
        return true;
    }
    if (n < 0 && (errno == EINTR || errno == EAGAIN)) {
        return true;
    }
    close_fd(fd);
    return false;
}

int decode_status(int status) {
    if (WIFEXITED(status)) return WEXITSTATUS(status);
    if (WIFSIGNALED(status)) return -WTERMSIG(status);
    return -1;
}

}

ProcessResult run_process(const std::vector<std::string>& argv, const std::string& cwd, std::chrono::milliseconds timeout) {
    ProcessResult result;
    if (argv.empty()) {
        result.status = ProcessResult::Status::SpawnFailed;
        result.err = "No command given";
        return result;
    }

    int out_pipe[2];
    int err_pipe[2];
    int status_pipe[2];
    if (pipe(out_pipe) < 0) {
        result.status = ProcessResult::Status::SpawnFailed;
        result.err = std::strerror(errno);
        return result;
    }
    if (pipe(err_pipe) < 0) {
        result.status = ProcessResult::Status::SpawnFailed;
        result.err = std::strerror(errno);
        close(out_pipe[0]);
        close(out_pipe[1]);
        return result;
    }
    if (pipe(status_pipe) < 0) {
        result.status = ProcessResult::Status::SpawnFailed;
        result.err = std::strerror(errno);
        close(out_pipe[0]);
        close(out_pipe[1]);
        close(err_pipe[0]);
        close(err_pipe[1]);
        return result;
    }
    fcntl(status_pipe[1], F_SETFD, FD_CLOEXEC);

    std::vector<char*> args;
    for (const auto& arg : argv) {
        args.push_back(const_cast<char*>(arg.c_str()));
    }
    args.push_back(nullptr);

    spdlog::debug("Running {} ({} args) in '{}'", argv[0], argv.size() - 1, cwd.empty() ? "." : cwd);

    pid_t pid = fork();
    if (pid < 0) {
        result.status = ProcessResult::Status::SpawnFailed;
        result.err = std::strerror(errno);
        for (int fd : {out_pipe[0], out_pipe[1], err_pipe[0], err_pipe[1], status_pipe[0], status_pipe[1]}) {
            close(fd);
        }
        return result;
    }

    if (pid == 0) {
        close(out_pipe[0]);
        close(err_pipe[0]);
        close(status_pipe[0]);
        dup2(out_pipe[1], STDOUT_FILENO);
        dup2(err_pipe[1], STDERR_FILENO);
        close(out_pipe[1]);
        close(err_pipe[1]);
        int devnull = open("/dev/null", O_RDONLY);
        if (devnull >= 0) {
            dup2(devnull, STDIN_FILENO);
            close(devnull);
        }

        ChildFailure failure{0, 0};
        if (!cwd.empty() && chdir(cwd.c_str()) != 0) {
            failure = {0, errno};
        } else {
            execvp(args[0], args.data());
            failure = {1, errno};
        }
        ssize_t ignored = write(status_pipe[1], &failure, sizeof(failure));
        (void)ignored;
        _exit(127);
    }

    close(out_pipe[1]);
    close(err_pipe[1]);
    close(status_pipe[1]);

    // The status pipe closes on a successful exec, or carries the failure.
    ChildFailure failure{0, 0};
    ssize_t got;
    do {
        got = read(status_pipe[0], &failure, sizeof(failure));
    } while (got < 0 && errno == EINTR);
    close(status_pipe[0]);

    int out_fd = out_pipe[0];
    int err_fd = err_pipe[0];

    if (got == static_cast<ssize_t>(sizeof(failure))) {
        close_fd(out_fd);
        close_fd(err_fd);
        int status = 0;
        waitpid(pid, &status, 0);
        if (failure.stage == 1 && failure.error == ENOENT) {
            result.status = ProcessResult::Status::NotFound;
            result.exit_code = 127;
            result.err = argv[0] + ": command not found";
        } else {
            result.status = ProcessResult::Status::SpawnFailed;
            result.err = (failure.stage == 0 ? "Cannot enter " + cwd + ": " : argv[0] + ": ") + std::strerror(failure.error);
        }
        spdlog::debug("Failed to start {}: {}", argv[0], result.err);
        return result;
    }

    auto deadline = std::chrono::steady_clock::now() + timeout;
    bool timed_out = false;
    while (out_fd >= 0 || err_fd >= 0) {
        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - std::chrono::steady_clock::now());
        if (remaining.count() <= 0) {
            timed_out = true;
            break;
        }
        pollfd fds[2];
        nfds_t count = 0;
        if (out_fd >= 0) fds[count++] = {out_fd, POLLIN, 0};
        if (err_fd >= 0) fds[count++] = {err_fd, POLLIN, 0};
        int ready = poll(fds, count, static_cast<int>(remaining.count()));
        if (ready < 0) {
            if (errno == EINTR) continue;
            break;
        }
        for (nfds_t i = 0; i < count; ++i) {
            if (fds[i].revents == 0) continue;
            if (fds[i].fd == out_fd) {
                drain(out_fd, result.out);
            } else if (fds[i].fd == err_fd) {
                drain(err_fd, result.err);
            }
        }
    }
    close_fd(out_fd);
    close_fd(err_fd);

    int status = 0;
    if (timed_out) {
        kill(pid, SIGKILL);
        waitpid(pid, &status, 0);
        result.status = ProcessResult::Status::TimedOut;
        result.exit_code = -1;
        spdlog::debug("{} timed out after {} ms", argv[0], timeout.count());
        return result;
    }

    // Output is closed; give the child the rest of the budget to exit.
    while (true) {
        pid_t waited = waitpid(pid, &status, WNOHANG);
        if (waited == pid) break;
        if (waited < 0 && errno != EINTR) {
            result.status = ProcessResult::Status::SpawnFailed;
            result.err = std::strerror(errno);
            return result;
        }
        if (std::chrono::steady_clock::now() >= deadline) {
            kill(pid, SIGKILL);
            waitpid(pid, &status, 0);
            result.status = ProcessResult::Status::TimedOut;
            result.exit_code = -1;
            return result;
        }
        usleep(5000);
    }

    result.exit_code = decode_status(status);
    spdlog::debug("{} exited with {}", argv[0], result.exit_code);
    return result;
}
