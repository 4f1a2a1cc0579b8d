/*
 * process.hpp
 *
 * Copyright (C) 2026 offload contributors
 */

/*************************************************

Date: 2026-9-5

Description: Run an external program with captured output and a timeout

**************************************************/

#ifndef OFFLOAD_SYSTEM_PROCESS_HPP
#define OFFLOAD_SYSTEM_PROCESS_HPP

#include <chrono>
#include <string>
#include <vector>

namespace offload::system {

/**
 * @brief Outcome of a finished (or killed) child process.
 */
struct ProcessResult {
    int exitCode{-1};         ///< Exit status, or -1 if killed by a signal
    std::string stdoutText;   ///< Everything the child wrote to stdout
    std::string stderrText;   ///< Everything the child wrote to stderr
    bool timedOut{false};     ///< True if the child was killed on timeout

    [[nodiscard]] auto succeeded() const -> bool {
        return !timedOut && exitCode == 0;
    }
};

/**
 * @brief Runs @p program with @p args, searching PATH, and waits for it.
 *
 * Stdout and stderr are captured through pipes. If the child is still
 * running when @p timeout elapses it receives SIGKILL and the result is
 * flagged as timed out. The child's stdin is /dev/null.
 *
 * @throws offload::error::ProcessError if pipes cannot be created or the
 * fork fails. A program that cannot be executed is reported as exit code
 * 127, like a shell does.
 */
[[nodiscard]] auto runProcess(const std::string& program,
                              const std::vector<std::string>& args,
                              std::chrono::milliseconds timeout)
    -> ProcessResult;

}  // namespace offload::system

#endif  // OFFLOAD_SYSTEM_PROCESS_HPP
