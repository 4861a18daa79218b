/*
 * string.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2026-10-18

Description: String helpers used by the command output parsers

**************************************************/

#ifndef AIRMON_UTILS_STRING_HPP
#define AIRMON_UTILS_STRING_HPP

#include <initializer_list>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace airmon::utils {

/**
 * @brief Lowercase an ASCII string.
 */
[[nodiscard]] auto toLower(std::string_view str) -> std::string;

/**
 * @brief Strip leading and trailing characters in `symbols`.
 */
[[nodiscard]] auto trim(std::string_view line,
                        std::string_view symbols = " \n\r\t\f\v")
    -> std::string;

[[nodiscard]] auto startsWith(std::string_view str,
                              std::string_view prefix) -> bool;

[[nodiscard]] auto endsWith(std::string_view str,
                            std::string_view suffix) -> bool;

/**
 * @brief Split on a single delimiter. Empty fields are kept.
 */
[[nodiscard]] auto splitString(std::string_view str, char delimiter)
    -> std::vector<std::string>;

/**
 * @brief Split into lines, accepting both "\n" and "\r\n" endings.
 */
[[nodiscard]] auto splitLines(std::string_view text)
    -> std::vector<std::string>;

/**
 * @brief Split on runs of whitespace, dropping empty tokens.
 */
[[nodiscard]] auto splitWhitespace(std::string_view str)
    -> std::vector<std::string>;

[[nodiscard]] auto joinStrings(const std::vector<std::string>& strings,
                               std::string_view delimiter,
                               std::size_t first = 0) -> std::string;

/**
 * @brief True when `haystack` contains any of the needles.
 */
[[nodiscard]] auto containsAny(std::string_view haystack,
                               std::initializer_list<std::string_view> needles)
    -> bool;

/**
 * @brief Text after the first occurrence of `marker`, trimmed.
 */
[[nodiscard]] auto valueAfter(std::string_view line, std::string_view marker)
    -> std::optional<std::string>;

/**
 * @brief Parse a hexadecimal 16-bit id such as "046d" or "0x046D".
 */
[[nodiscard]] auto parseHex16(std::string_view text)
    -> std::optional<unsigned>;

/**
 * @brief Format a 16-bit id as four lowercase hex digits.
 */
[[nodiscard]] auto toHex4(unsigned value) -> std::string;

#ifdef _WIN32
[[nodiscard]] auto wstringToString(std::wstring_view wstr) -> std::string;
[[nodiscard]] auto stringToWString(std::string_view str) -> std::wstring;
#endif

}  // namespace airmon::utils

#endif  // AIRMON_UTILS_STRING_HPP
