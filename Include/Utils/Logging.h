/**
 * @file Logging.h
 * @brief Logging utilities
 * @version 0.1
 * @date 2026-10-19
 *
 * @copyright Copyright (c) 2026
 *
 */

#pragma once

#include <cstdarg>
#include <cstdio>
#include <cstring>

// Set through the SHAREDBUS_ENABLE_LOGGING CMake option
#ifndef SHAREDBUS_ENABLE_LOGGING
#define SHAREDBUS_ENABLE_LOGGING 1
#endif

#define LOG_INFO(fmt, ...)  utils::Logger::log("INFO", __FILE__, __LINE__, fmt, ##__VA_ARGS__)
#define LOG_WARN(fmt, ...)  utils::Logger::log("WARN", __FILE__, __LINE__, fmt, ##__VA_ARGS__)
#define LOG_ERROR(fmt, ...) utils::Logger::log("ERROR", __FILE__, __LINE__, fmt, ##__VA_ARGS__)

namespace utils {

class Logger {
public:
    // ANSI color codes
    static constexpr const char* COLOR_RESET   = "\033[0m";
    static constexpr const char* COLOR_RED     = "\033[31m";
    static constexpr const char* COLOR_YELLOW  = "\033[33m";
    static constexpr const char* COLOR_GREEN   = "\033[32m";
    static constexpr const char* COLOR_GRAY    = "\033[90m";

    static void log(const char* level, const char* file, int line, const char* fmt, ...) {
#if SHAREDBUS_ENABLE_LOGGING
        const char* color = COLOR_RESET;
        if (std::strcmp(level, "ERROR") == 0) {
            color = COLOR_RED;
        } else if (std::strcmp(level, "WARN") == 0) {
            color = COLOR_YELLOW;
        } else if (std::strcmp(level, "INFO") == 0) {
            color = COLOR_GREEN;
        }

        // Basename only
        const char* base = std::strrchr(file, '/');
        file = (base != nullptr) ? base + 1 : file;

        // One printf per line, concurrent callers must not interleave
        char message[192];
        va_list args;
        va_start(args, fmt);
        std::vsnprintf(message, sizeof(message), fmt, args);
        va_end(args);

        std::printf("%s[%s]%s %s[%s:%d]%s %s\n",
                    color, level, COLOR_RESET,
                    COLOR_GRAY, file, line, COLOR_RESET,
                    message);
#else
        (void)level;
        (void)file;
        (void)line;
        (void)fmt;
#endif
    }
};

} // namespace utils
