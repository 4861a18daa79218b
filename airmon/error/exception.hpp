/*
 * exception.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2026-10-18

Description: Exception types carrying source location and stack trace

**************************************************/

#ifndef AIRMON_ERROR_EXCEPTION_HPP
#define AIRMON_ERROR_EXCEPTION_HPP

#include <exception>
#include <sstream>
#include <string>
#include <thread>
#include <utility>

#include "airmon/error/stacktrace.hpp"
#include "airmon/macro.hpp"

namespace airmon::error {

/**
 * @brief Base exception of the project.
 *
 * Records where it was thrown, the throwing thread and a stack trace. The
 * message is built by streaming every constructor argument after the location
 * triple, so `THROW_RUNTIME_ERROR("bad value ", 42)` works as expected.
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
     * @brief One line: the message followed by "[file:line in func()]".
     */
    [[nodiscard]] auto what() const noexcept -> const char* override;

    [[nodiscard]] auto getFile() const -> std::string;
    [[nodiscard]] auto getLine() const -> int;
    [[nodiscard]] auto getFunction() const -> std::string;
    [[nodiscard]] auto getMessage() const -> std::string;
    [[nodiscard]] auto getThreadId() const -> std::thread::id;
    [[nodiscard]] auto getStackTrace() const -> const StackTrace& {
        return stack_trace_;
    }

private:
    std::string file_;
    int line_;
    std::string func_;
    std::string message_;
    std::thread::id thread_id_;
    StackTrace stack_trace_;
    mutable std::string summary_;
};

class RuntimeError : public Exception {
public:
    using Exception::Exception;
};

class InvalidArgument : public Exception {
public:
    using Exception::Exception;
};

class SystemError : public Exception {
public:
    using Exception::Exception;
};

class NotFound : public Exception {
public:
    using Exception::Exception;
};

/// A subprocess could not be started or its output could not be read.
class CommandError : public SystemError {
public:
    using SystemError::SystemError;
};

/// A subprocess exceeded its timeout and was killed.
class CommandTimeout : public CommandError {
public:
    using CommandError::CommandError;
};

/// A structured USB backend failed to initialize or enumerate.
class UsbBackendError : public SystemError {
public:
    using SystemError::SystemError;
};

/// A configuration file or value could not be used.
class ConfigError : public Exception {
public:
    using Exception::Exception;
};

}  // namespace airmon::error

#define THROW_EXCEPTION(...)                                      \
    throw airmon::error::Exception(AIRMON_FILE_NAME, AIRMON_FILE_LINE, \
                                   AIRMON_FUNC_NAME, __VA_ARGS__)

#define THROW_RUNTIME_ERROR(...)                                     \
    throw airmon::error::RuntimeError(AIRMON_FILE_NAME, AIRMON_FILE_LINE, \
                                      AIRMON_FUNC_NAME, __VA_ARGS__)

#define THROW_INVALID_ARGUMENT(...)                                     \
    throw airmon::error::InvalidArgument(AIRMON_FILE_NAME, AIRMON_FILE_LINE, \
                                         AIRMON_FUNC_NAME, __VA_ARGS__)

#define THROW_SYSTEM_ERROR(...)                                     \
    throw airmon::error::SystemError(AIRMON_FILE_NAME, AIRMON_FILE_LINE, \
                                     AIRMON_FUNC_NAME, __VA_ARGS__)

#define THROW_NOT_FOUND(...)                                     \
    throw airmon::error::NotFound(AIRMON_FILE_NAME, AIRMON_FILE_LINE, \
                                  AIRMON_FUNC_NAME, __VA_ARGS__)

#define THROW_COMMAND_ERROR(...)                                     \
    throw airmon::error::CommandError(AIRMON_FILE_NAME, AIRMON_FILE_LINE, \
                                      AIRMON_FUNC_NAME, __VA_ARGS__)

#define THROW_COMMAND_TIMEOUT(...)                                     \
    throw airmon::error::CommandTimeout(AIRMON_FILE_NAME, AIRMON_FILE_LINE, \
                                        AIRMON_FUNC_NAME, __VA_ARGS__)

#define THROW_USB_BACKEND_ERROR(...)                                     \
    throw airmon::error::UsbBackendError(AIRMON_FILE_NAME, AIRMON_FILE_LINE, \
                                         AIRMON_FUNC_NAME, __VA_ARGS__)

#define THROW_CONFIG_ERROR(...)                                     \
    throw airmon::error::ConfigError(AIRMON_FILE_NAME, AIRMON_FILE_LINE, \
                                     AIRMON_FUNC_NAME, __VA_ARGS__)

#endif  // AIRMON_ERROR_EXCEPTION_HPP
