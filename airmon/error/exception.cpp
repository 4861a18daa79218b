/*
 * exception.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2026-10-18

Description: Exception types carrying source location and stack trace

**************************************************/

#include "exception.hpp"

#include <new>

namespace airmon::error {

auto Exception::what() const noexcept -> const char* {
    if (summary_.empty()) {
        try {
            std::ostringstream oss;
            oss << message_ << " [" << file_ << ':' << line_ << " in " << func_
                << "()]";
            summary_ = oss.str();
        } catch (const std::bad_alloc&) {
            return message_.c_str();
        }
    }
    return summary_.c_str();
}

auto Exception::getFile() const -> std::string { return file_; }
auto Exception::getLine() const -> int { return line_; }
auto Exception::getFunction() const -> std::string { return func_; }
auto Exception::getMessage() const -> std::string { return message_; }
auto Exception::getThreadId() const -> std::thread::id { return thread_id_; }

}  // namespace airmon::error
