/*
 * exception.cpp
 *
 * Copyright (C) 2026 offload contributors
 */

/*************************************************

Date: 2026-9-3

Description: Exception hierarchy carrying source location and thread

**************************************************/

#include "exception.hpp"

namespace offload::error {

auto Exception::what() const noexcept -> const char* {
    if (full_message_.empty()) {
        std::ostringstream oss;
        oss << message_ << " [" << file_ << ":" << line_ << " in " << func_
            << "(), thread " << thread_id_ << "]";
        full_message_ = oss.str();
    }
    return full_message_.c_str();
}

auto Exception::getFile() const -> std::string { return file_; }
auto Exception::getLine() const -> int { return line_; }
auto Exception::getFunction() const -> std::string { return func_; }
auto Exception::getMessage() const -> std::string { return message_; }
auto Exception::getThreadId() const -> std::thread::id { return thread_id_; }

}  // namespace offload::error
