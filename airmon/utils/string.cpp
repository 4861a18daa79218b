/*
 * string.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2026-10-18

Description: String helpers used by the command output parsers

**************************************************/

#include "string.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <utility>

#include <spdlog/fmt/fmt.h>

#ifdef _WIN32
#include <windows.h>
#endif

namespace airmon::utils {

auto toLower(std::string_view str) -> std::string {
    std::string result(str);
    std::ranges::transform(result, result.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return result;
}

auto trim(std::string_view line, std::string_view symbols) -> std::string {
    auto first = line.find_first_not_of(symbols);
    if (first == std::string_view::npos) {
        return {};
    }
    auto last = line.find_last_not_of(symbols);
    return std::string(line.substr(first, last - first + 1));
}

auto startsWith(std::string_view str, std::string_view prefix) -> bool {
    return str.starts_with(prefix);
}

auto endsWith(std::string_view str, std::string_view suffix) -> bool {
    return str.ends_with(suffix);
}

auto splitString(std::string_view str, char delimiter)
    -> std::vector<std::string> {
    std::vector<std::string> tokens;
    size_t start = 0;
    size_t end = str.find(delimiter);
    while (end != std::string_view::npos) {
        tokens.emplace_back(str.substr(start, end - start));
        start = end + 1;
        end = str.find(delimiter, start);
    }
    tokens.emplace_back(str.substr(start));
    return tokens;
}

auto splitLines(std::string_view text) -> std::vector<std::string> {
    std::vector<std::string> lines;
    if (text.empty()) {
        return lines;
    }
    for (auto& line : splitString(text, '\n')) {
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        lines.push_back(std::move(line));
    }
    if (!lines.empty() && lines.back().empty()) {
        lines.pop_back();
    }
    return lines;
}

auto splitWhitespace(std::string_view str) -> std::vector<std::string> {
    std::vector<std::string> tokens;
    size_t pos = 0;
    while (pos < str.size()) {
        while (pos < str.size() &&
               std::isspace(static_cast<unsigned char>(str[pos])) != 0) {
            ++pos;
        }
        size_t start = pos;
        while (pos < str.size() &&
               std::isspace(static_cast<unsigned char>(str[pos])) == 0) {
            ++pos;
        }
        if (pos > start) {
            tokens.emplace_back(str.substr(start, pos - start));
        }
    }
    return tokens;
}

auto joinStrings(const std::vector<std::string>& strings,
                 std::string_view delimiter, std::size_t first)
    -> std::string {
    std::string result;
    for (size_t i = first; i < strings.size(); ++i) {
        if (i > first) {
            result += delimiter;
        }
        result += strings[i];
    }
    return result;
}

auto containsAny(std::string_view haystack,
                 std::initializer_list<std::string_view> needles) -> bool {
    return std::ranges::any_of(needles, [haystack](std::string_view needle) {
        return haystack.find(needle) != std::string_view::npos;
    });
}

auto valueAfter(std::string_view line, std::string_view marker)
    -> std::optional<std::string> {
    auto pos = line.find(marker);
    if (pos == std::string_view::npos) {
        return std::nullopt;
    }
    return trim(line.substr(pos + marker.size()));
}

auto parseHex16(std::string_view text) -> std::optional<unsigned> {
    if (text.starts_with("0x") || text.starts_with("0X")) {
        text.remove_prefix(2);
    }
    if (text.empty() || text.size() > 4) {
        return std::nullopt;
    }
    unsigned value = 0;
    auto [ptr, ec] =
        std::from_chars(text.data(), text.data() + text.size(), value, 16);
    if (ec != std::errc() || ptr != text.data() + text.size()) {
        return std::nullopt;
    }
    return value;
}

auto toHex4(unsigned value) -> std::string {
    return fmt::format("{:04x}", value & 0xFFFFU);
}

#ifdef _WIN32
auto wstringToString(std::wstring_view wstr) -> std::string {
    if (wstr.empty()) {
        return {};
    }
    int size = WideCharToMultiByte(CP_UTF8, 0, wstr.data(),
                                   static_cast<int>(wstr.size()), nullptr, 0,
                                   nullptr, nullptr);
    std::string result(static_cast<size_t>(size), '\0');
    WideCharToMultiByte(CP_UTF8, 0, wstr.data(), static_cast<int>(wstr.size()),
                        result.data(), size, nullptr, nullptr);
    return result;
}

auto stringToWString(std::string_view str) -> std::wstring {
    if (str.empty()) {
        return {};
    }
    int size = MultiByteToWideChar(CP_UTF8, 0, str.data(),
                                   static_cast<int>(str.size()), nullptr, 0);
    std::wstring result(static_cast<size_t>(size), L'\0');
    MultiByteToWideChar(CP_UTF8, 0, str.data(), static_cast<int>(str.size()),
                        result.data(), size);
    return result;
}
#endif

}  // namespace airmon::utils
