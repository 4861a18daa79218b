/*
 * stacktrace.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2026-10-18

Description: Stack trace capture attached to exceptions

**************************************************/

#include "stacktrace.hpp"

#include <cstdint>
#include <cstdlib>
#include <iomanip>
#include <memory>
#include <sstream>

#ifdef _WIN32
// clang-format off
#include <windows.h>
#include <dbghelp.h>
// clang-format on
#if !defined(__MINGW32__) && !defined(__MINGW64__)
#pragma comment(lib, "dbghelp.lib")
#endif
#elif defined(__APPLE__) || defined(__linux__)
#include <cxxabi.h>
#include <dlfcn.h>
#include <execinfo.h>
#endif

namespace airmon::error {

namespace {

constexpr int MAX_FRAMES = 64;

auto formatAddress(std::uintptr_t address) -> std::string {
    std::ostringstream oss;
    oss << "0x" << std::hex << std::setfill('0')
        << std::setw(sizeof(void*) * 2) << address;
    return oss.str();
}

auto getBaseName(const std::string& path) -> std::string {
    size_t lastSlash = path.find_last_of("/\\");
    if (lastSlash != std::string::npos) {
        return path.substr(lastSlash + 1);
    }
    return path;
}

#if defined(__APPLE__) || defined(__linux__)
auto demangle(const char* name) -> std::string {
    int status = 0;
    std::unique_ptr<char, decltype(&std::free)> demangled(
        abi::__cxa_demangle(name, nullptr, nullptr, &status), &std::free);
    if (status == 0 && demangled) {
        return demangled.get();
    }
    return name;
}
#endif

}  // namespace

StackTrace::StackTrace() { capture(); }

auto StackTrace::toString() const -> std::string {
    std::ostringstream oss;
    oss << "Stack trace:\n";
    if (frames_.empty()) {
        oss << "\tStack trace not available on this platform.\n";
        return oss.str();
    }
    for (size_t i = 0; i < frames_.size(); ++i) {
        oss << "\t[" << i << "] " << processFrame(frames_[i]) << "\n";
    }
    return oss.str();
}

#ifdef _WIN32
auto StackTrace::processFrame(void* frame) const -> std::string {
    auto address = reinterpret_cast<std::uintptr_t>(frame);

    constexpr size_t MAX_SYMBOL_LEN = 512;
    std::vector<char> buffer(sizeof(SYMBOL_INFO) + MAX_SYMBOL_LEN);
    auto* symbol = reinterpret_cast<SYMBOL_INFO*>(buffer.data());
    symbol->MaxNameLen = MAX_SYMBOL_LEN - 1;
    symbol->SizeOfStruct = sizeof(SYMBOL_INFO);

    std::string functionName = "<unknown function>";
    DWORD64 displacement = 0;
    if (SymFromAddr(GetCurrentProcess(), address, &displacement, symbol)) {
        functionName = symbol->Name;
    }

    std::ostringstream oss;
    oss << functionName << " at " << formatAddress(address);

    IMAGEHLP_LINE64 line;
    line.SizeOfStruct = sizeof(IMAGEHLP_LINE64);
    DWORD lineDisplacement = 0;
    if (SymGetLineFromAddr64(GetCurrentProcess(), address, &lineDisplacement,
                             &line)) {
        oss << " (" << getBaseName(line.FileName) << ":" << line.LineNumber
            << ")";
    }
    return oss.str();
}

void StackTrace::capture() {
    SymSetOptions(SYMOPT_UNDNAME | SYMOPT_DEFERRED_LOADS | SYMOPT_LOAD_LINES |
                  SYMOPT_FAIL_CRITICAL_ERRORS);
    SymInitialize(GetCurrentProcess(), nullptr, TRUE);

    void* framePtrs[MAX_FRAMES];
    WORD captured = CaptureStackBackTrace(1, MAX_FRAMES, framePtrs, nullptr);
    frames_.assign(framePtrs, framePtrs + captured);
}

#elif defined(__APPLE__) || defined(__linux__)
auto StackTrace::processFrame(void* frame) const -> std::string {
    auto address = reinterpret_cast<std::uintptr_t>(frame);

    std::string functionName = "<unknown function>";
    std::string moduleName;
    std::uintptr_t offset = 0;

    Dl_info dlInfo;
    if (dladdr(frame, &dlInfo) != 0) {
        if (dlInfo.dli_fname != nullptr) {
            moduleName = dlInfo.dli_fname;
        }
        if (dlInfo.dli_fbase != nullptr) {
            offset = address - reinterpret_cast<std::uintptr_t>(dlInfo.dli_fbase);
        }
        if (dlInfo.dli_sname != nullptr) {
            functionName = demangle(dlInfo.dli_sname);
        }
    }

    std::ostringstream oss;
    oss << functionName << " at " << formatAddress(address);
    if (!moduleName.empty()) {
        oss << " in " << getBaseName(moduleName);
        if (offset > 0) {
            oss << " (+" << std::hex << offset << ")";
        }
    }
    return oss.str();
}

void StackTrace::capture() {
    void* framePtrs[MAX_FRAMES];
    int count = backtrace(framePtrs, MAX_FRAMES);
    // Skip this frame.
    if (count > 1) {
        frames_.assign(framePtrs + 1, framePtrs + count);
    }
}

#else
auto StackTrace::processFrame(void* frame) const -> std::string {
    return "<frame information unavailable> at " +
           formatAddress(reinterpret_cast<std::uintptr_t>(frame));
}

void StackTrace::capture() {}
#endif

}  // namespace airmon::error
