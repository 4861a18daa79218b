/*
 * macro.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2026-10-18

Description: Source-location macros used by the THROW_* helpers

**************************************************/

#ifndef AIRMON_MACRO_HPP
#define AIRMON_MACRO_HPP

#define AIRMON_FILE_NAME __FILE__
#define AIRMON_FILE_LINE __LINE__

#if defined(_MSC_VER)
#define AIRMON_FUNC_NAME __FUNCSIG__
#elif defined(__GNUC__) || defined(__clang__)
#define AIRMON_FUNC_NAME __PRETTY_FUNCTION__
#else
#define AIRMON_FUNC_NAME __func__
#endif

#endif  // AIRMON_MACRO_HPP
