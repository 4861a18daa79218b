/*
 * stacktrace.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2026-10-18

Description: Stack trace capture attached to exceptions

**************************************************/

#ifndef AIRMON_ERROR_STACKTRACE_HPP
#define AIRMON_ERROR_STACKTRACE_HPP

#include <string>
#include <vector>

namespace airmon::error {

/**
 * @brief Captures the call stack at construction time.
 *
 * Symbol resolution is deferred until toString() is called, so an exception
 * that is caught and discarded only pays for the raw frame capture.
 */
class StackTrace {
public:
    StackTrace();

    /**
     * @brief Render the captured frames, one per line.
     */
    [[nodiscard]] auto toString() const -> std::string;

    [[nodiscard]] auto frameCount() const -> std::size_t {
        return frames_.size();
    }

private:
    void capture();

    [[nodiscard]] auto processFrame(void* frame) const -> std::string;

    std::vector<void*> frames_;
};

}  // namespace airmon::error

#endif  // AIRMON_ERROR_STACKTRACE_HPP
