/*
 * exception.hpp
 *
 * Copyright (C) 2026 offload contributors
 */

/*************************************************

Date: 2026-9-3

Description: Exception hierarchy carrying source location and thread

**************************************************/

#ifndef OFFLOAD_ERROR_EXCEPTION_HPP
#define OFFLOAD_ERROR_EXCEPTION_HPP

#include <exception>
#include <sstream>
#include <string>
#include <thread>
#include <utility>

#define OFFLOAD_FILE_NAME __FILE__
#define OFFLOAD_FILE_LINE __LINE__
#define OFFLOAD_FUNC_NAME __func__

namespace offload::error {

/**
 * @brief Base exception that records where it was raised.
 *
 * The message is assembled by streaming every trailing constructor argument,
 * so callers can write `THROW_IO_ERROR("Cannot open ", path)`.
 */
class Exception : public std::exception {
public:
    template <typename... Args>
    Exception(const char* file, int line, const char* func, Args&&... args)
        : file_(file),
          line_(line),
          func_(func),
          thread_id_(std::this_thread::get_id()) {
        std::ostringstream oss;
        ((oss << std::forward<Args>(args)), ...);
        message_ = oss.str();
    }

    /**
     * @brief Full diagnostic text including location and thread.
     */
    [[nodiscard]] auto what() const noexcept -> const char* override;

    [[nodiscard]] auto getFile() const -> std::string;
    [[nodiscard]] auto getLine() const -> int;
    [[nodiscard]] auto getFunction() const -> std::string;

    /**
     * @brief The bare message, without location decoration.
     */
    [[nodiscard]] auto getMessage() const -> std::string;
    [[nodiscard]] auto getThreadId() const -> std::thread::id;

private:
    std::string file_;
    int line_;
    std::string func_;
    std::string message_;
    std::thread::id thread_id_;
    mutable std::string full_message_;
};

class RuntimeError : public Exception {
public:
    using Exception::Exception;
};

class InvalidArgument : public Exception {
public:
    using Exception::Exception;
};

class IOError : public Exception {
public:
    using Exception::Exception;
};

class FileNotFound : public Exception {
public:
    using Exception::Exception;
};

class ProcessError : public Exception {
public:
    using Exception::Exception;
};

}  // namespace offload::error

#define THROW_RUNTIME_ERROR(...)                                   \
    throw offload::error::RuntimeError(OFFLOAD_FILE_NAME,          \
                                       OFFLOAD_FILE_LINE,          \
                                       OFFLOAD_FUNC_NAME, __VA_ARGS__)

#define THROW_INVALID_ARGUMENT(...)                                \
    throw offload::error::InvalidArgument(OFFLOAD_FILE_NAME,       \
                                          OFFLOAD_FILE_LINE,       \
                                          OFFLOAD_FUNC_NAME, __VA_ARGS__)

#define THROW_IO_ERROR(...)                                               \
    throw offload::error::IOError(OFFLOAD_FILE_NAME, OFFLOAD_FILE_LINE,   \
                                  OFFLOAD_FUNC_NAME, __VA_ARGS__)

#define THROW_FILE_NOT_FOUND(...)                                  \
    throw offload::error::FileNotFound(OFFLOAD_FILE_NAME,          \
                                       OFFLOAD_FILE_LINE,          \
                                       OFFLOAD_FUNC_NAME, __VA_ARGS__)

#define THROW_PROCESS_ERROR(...)                                   \
    throw offload::error::ProcessError(OFFLOAD_FILE_NAME,          \
                                       OFFLOAD_FILE_LINE,          \
                                       OFFLOAD_FUNC_NAME, __VA_ARGS__)

#endif  // OFFLOAD_ERROR_EXCEPTION_HPP
