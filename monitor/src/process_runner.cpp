#include "process_runner.hpp"
#include <spdlog/spdlog.h>
#include <fmt/format.h>
#include <array>
#include <cerrno>
#include <csignal>
#include <cstring>
#include <thread>
#include <fcntl.h>
#include <poll.h>
#include <sys/wait.h>
#include <unistd.h>

namespace {

void close_fd(int& fd) {
    if (fd >= 0) {
        ::close(fd);
        fd = -1;
    }
}

int remaining_ms(std::chrono::steady_clock::time_point deadline) {
    auto left = std::chrono::duration_cast<std::chrono::milliseconds>(
        deadline - std::chrono::steady_clock::now()).count();
    return left > 0 ? static_cast<int>(left) : 0;
}

int decode_status(int status) {
    if (WIFEXITED(status)) {
        return WEXITSTATUS(status);
    }
    if (WIFSIGNALED(status)) {
        return 128 + WTERMSIG(status);
    }
    return -1;
}

} // namespace

ProcessResult ProcessRunner::run(const std::vector<std::string>& argv, std::chrono::milliseconds timeout) {
    ProcessResult result;
    if (argv.empty()) {
        result.error = "empty command line";
        return result;
    }

    int out_pipe[2] = {-1, -1};
    int err_pipe[2] = {-1, -1};
    if (::pipe2(out_pipe, O_CLOEXEC) != 0) {
        result.error = fmt::format("pipe failed: {}", std::strerror(errno));
        return result;
    }
    if (::pipe2(err_pipe, O_CLOEXEC) != 0) {
        result.error = fmt::format("pipe failed: {}", std::strerror(errno));
        close_fd(out_pipe[0]);
        close_fd(out_pipe[1]);
        return result;
    }

    // Prepared before fork so the child only calls async-signal-safe functions
    std::vector<char*> c_args;
    c_args.reserve(argv.size() + 1);
    for (const auto& arg : argv) {
        c_args.push_back(const_cast<char*>(arg.c_str()));
    }
    c_args.push_back(nullptr);

    pid_t pid = ::fork();
    if (pid == -1) {
        result.error = fmt::format("fork failed: {}", std::strerror(errno));
        close_fd(out_pipe[0]);
        close_fd(out_pipe[1]);
        close_fd(err_pipe[0]);
        close_fd(err_pipe[1]);
        return result;
    }

    if (pid == 0) {
        int devnull = ::open("/dev/null", O_RDONLY);
        if (devnull >= 0) {
            ::dup2(devnull, STDIN_FILENO);
        }
        ::dup2(out_pipe[1], STDOUT_FILENO);
        ::dup2(err_pipe[1], STDERR_FILENO);
        ::execvp(c_args[0], c_args.data());
        // Same convention as a shell: 127 means the command was not found
        ::_exit(127);
    }

    result.started = true;
    close_fd(out_pipe[1]);
    close_fd(err_pipe[1]);

    auto deadline = std::chrono::steady_clock::now() + timeout;
    std::array<char, 4096> buffer{};
    int out_fd = out_pipe[0];
    int err_fd = err_pipe[0];

    while (out_fd >= 0 || err_fd >= 0) {
        int wait_ms = remaining_ms(deadline);
        if (wait_ms == 0) {
            result.timed_out = true;
            break;
        }

        std::array<pollfd, 2> fds{};
        fds[0] = {out_fd, POLLIN, 0};
        fds[1] = {err_fd, POLLIN, 0};
        int ready = ::poll(fds.data(), fds.size(), wait_ms);
        if (ready < 0) {
            if (errno == EINTR) continue;
            spdlog::warn("poll on child output failed: {}", std::strerror(errno));
            result.timed_out = true;
            break;
        }

        for (size_t i = 0; i < fds.size(); ++i) {
            if (fds[i].fd < 0 || fds[i].revents == 0) continue;
            int& fd = (i == 0) ? out_fd : err_fd;
            std::string& sink = (i == 0) ? result.stdout_text : result.stderr_text;

            ssize_t n = ::read(fd, buffer.data(), buffer.size());
            if (n > 0) {
                sink.append(buffer.data(), static_cast<size_t>(n));
            } else if (n == 0 || errno != EINTR) {
                close_fd(fd);
            }
        }
    }

    int status = 0;
    while (!result.timed_out) {
        pid_t done = ::waitpid(pid, &status, WNOHANG);
        if (done == pid) {
            result.exit_code = decode_status(status);
            break;
        }
        if (done < 0 && errno != EINTR) {
            result.error = fmt::format("waitpid failed: {}", std::strerror(errno));
            break;
        }
        if (remaining_ms(deadline) == 0) {
            result.timed_out = true;
            break;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }

    if (result.timed_out) {
        ::kill(pid, SIGKILL);
        while (::waitpid(pid, &status, 0) < 0 && errno == EINTR) {
        }
        result.exit_code = decode_status(status);
    }

    close_fd(out_fd);
    close_fd(err_fd);
    return result;
}
