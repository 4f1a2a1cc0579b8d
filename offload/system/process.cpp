/*
 * process.cpp
 *
 * Copyright (C) 2026 offload contributors
 */

/*************************************************

Date: 2026-9-5

Description: Run an external program with captured output and a timeout

**************************************************/

#include "process.hpp"

#include <array>
#include <cerrno>
#include <cstring>
#include <thread>

#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

#include <spdlog/spdlog.h>

#include "offload/error/exception.hpp"

namespace offload::system {

namespace {
constexpr size_t K_READ_BUFFER_SIZE = 4096;
constexpr auto K_REAP_POLL_INTERVAL = std::chrono::milliseconds(10);
constexpr int K_EXEC_FAILED_STATUS = 127;

void closeFd(int& fd) noexcept {
    if (fd >= 0) {
        ::close(fd);
        fd = -1;
    }
}
}  // namespace

auto runProcess(const std::string& program,
                const std::vector<std::string>& args,
                std::chrono::milliseconds timeout) -> ProcessResult {
    if (program.empty()) {
        THROW_INVALID_ARGUMENT("Program path cannot be empty");
    }

    int stdoutPipe[2] = {-1, -1};
    int stderrPipe[2] = {-1, -1};
    if (pipe2(stdoutPipe, O_CLOEXEC) == -1) {
        THROW_PROCESS_ERROR("Failed to create stdout pipe: ",
                            std::strerror(errno));
    }
    if (pipe2(stderrPipe, O_CLOEXEC) == -1) {
        const int savedErrno = errno;
        closeFd(stdoutPipe[0]);
        closeFd(stdoutPipe[1]);
        THROW_PROCESS_ERROR("Failed to create stderr pipe: ",
                            std::strerror(savedErrno));
    }

    // argv must be built before fork; the child may only call
    // async-signal-safe functions.
    std::vector<char*> execArgs;
    execArgs.reserve(args.size() + 2);
    execArgs.push_back(const_cast<char*>(program.c_str()));
    for (const auto& arg : args) {
        execArgs.push_back(const_cast<char*>(arg.c_str()));
    }
    execArgs.push_back(nullptr);

    const pid_t childPid = fork();
    if (childPid == -1) {
        const int savedErrno = errno;
        closeFd(stdoutPipe[0]);
        closeFd(stdoutPipe[1]);
        closeFd(stderrPipe[0]);
        closeFd(stderrPipe[1]);
        THROW_PROCESS_ERROR("Failed to fork process: ",
                            std::strerror(savedErrno));
    }

    if (childPid == 0) {
        int devNull = ::open("/dev/null", O_RDONLY);
        if (devNull != -1) {
            dup2(devNull, STDIN_FILENO);
        }
        if (dup2(stdoutPipe[1], STDOUT_FILENO) == -1 ||
            dup2(stderrPipe[1], STDERR_FILENO) == -1) {
            _exit(K_EXEC_FAILED_STATUS);
        }
        execvp(execArgs[0], execArgs.data());
        _exit(K_EXEC_FAILED_STATUS);
    }

    closeFd(stdoutPipe[1]);
    closeFd(stderrPipe[1]);

    ProcessResult result;
    const auto deadline = std::chrono::steady_clock::now() + timeout;

    std::array<pollfd, 2> fds{{{stdoutPipe[0], POLLIN, 0},
                               {stderrPipe[0], POLLIN, 0}}};
    std::array<std::string*, 2> sinks{&result.stdoutText, &result.stderrText};
    std::array<char, K_READ_BUFFER_SIZE> buffer{};
    int openStreams = 2;

    while (openStreams > 0) {
        const auto remaining =
            std::chrono::duration_cast<std::chrono::milliseconds>(
                deadline - std::chrono::steady_clock::now());
        if (remaining.count() <= 0) {
            result.timedOut = true;
            break;
        }

        int ready = poll(fds.data(), fds.size(),
                         static_cast<int>(remaining.count()));
        if (ready < 0) {
            if (errno == EINTR) {
                continue;
            }
            spdlog::error("poll() on child {} failed: {}", childPid,
                          std::strerror(errno));
            break;
        }
        if (ready == 0) {
            continue;
        }

        for (size_t i = 0; i < fds.size(); ++i) {
            auto& pfd = fds[i];
            if (pfd.fd < 0 || (pfd.revents & (POLLIN | POLLHUP | POLLERR)) == 0) {
                continue;
            }
            ssize_t count = ::read(pfd.fd, buffer.data(), buffer.size());
            if (count > 0) {
                sinks[i]->append(buffer.data(), static_cast<size_t>(count));
            } else if (count == 0 || (errno != EINTR && errno != EAGAIN)) {
                closeFd(pfd.fd);
                --openStreams;
            }
        }
    }

    closeFd(fds[0].fd);
    closeFd(fds[1].fd);

    if (result.timedOut) {
        spdlog::warn("Process '{}' timed out after {} ms, killing pid {}",
                     program, timeout.count(), childPid);
        ::kill(childPid, SIGKILL);
    }

    int status = 0;
    while (true) {
        pid_t waited = waitpid(childPid, &status, result.timedOut ? 0 : WNOHANG);
        if (waited == childPid) {
            break;
        }
        if (waited == -1) {
            if (errno == EINTR) {
                continue;
            }
            spdlog::error("waitpid({}) failed: {}", childPid,
                          std::strerror(errno));
            return result;
        }
        if (std::chrono::steady_clock::now() >= deadline) {
            result.timedOut = true;
            spdlog::warn("Process '{}' did not exit in time, killing pid {}",
                         program, childPid);
            ::kill(childPid, SIGKILL);
            continue;
        }
        std::this_thread::sleep_for(K_REAP_POLL_INTERVAL);
    }

    if (WIFEXITED(status)) {
        result.exitCode = WEXITSTATUS(status);
    }
    spdlog::debug("Process '{}' finished with exit code {}", program,
                  result.exitCode);
    return result;
}

}  // namespace offload::system
