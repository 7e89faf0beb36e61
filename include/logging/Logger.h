//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Logger.h
// Purpose: Process-wide logging with level filtering, optional log file and {fmt} style formatting.
//==========================================================================================================
#pragma once

#include <mutex>
#include <iostream>
#include <sstream>
#include <fstream>
#include <string>
#include <cstring>
#include <errno.h>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <cstdlib>
#include <cctype>
#include <fmt/format.h>
#include "env/EnvVars.h"

// Log level enum
enum class LogLevel {
    LOG_DEBUG_LEVEL,
    LOG_INFO_LEVEL,
    LOG_WARN_LEVEL,
    LOG_ERROR_LEVEL,
    LOG_FATAL_LEVEL
};

class Logger {
public:
    // Convert common level strings to LogLevel (case-insensitive). Unknown strings map to fallback.
    static LogLevel levelFromString(const std::string& lvl, LogLevel fallback = LogLevel::LOG_INFO_LEVEL);

    static const char* levelName(LogLevel level);

    // Variadic logging using {fmt} runtime format strings
    template <typename... Args>
    static void logf(const char* level, const char* fmtStr, const char* file, unsigned int line, Args&&... args) {
        std::string buffer;
        try {
            buffer = fmt::vformat(fmtStr, fmt::make_format_args(args...));
        } catch (const fmt::format_error& e) {
            buffer = fmt::format("Format error: {} (format: {})", e.what(), fmtStr);
        }
        log(level, buffer, file, line);
    }

    // Same as logf but with the level chosen at runtime; filtered against sLogLevel.
    template <typename... Args>
    static void logAt(LogLevel level, const char* fmtStr, const char* file, unsigned int line, Args&&... args) {
        if (sLogLevel > level) {
            return;
        }
        logf(levelName(level), fmtStr, file, line, std::forward<Args>(args)...);
    }

    static bool isEnabled(LogLevel level) { return sLogLevel <= level; }

public:
    // Configure logging
    static void setLogLevel(LogLevel level) {
        sLogLevel = level;
    }

    //==========================================================================================================
    // configureFromEnvironment
    // Purpose: Applies LMCP_LOG_LEVEL and LMCP_LOG_FILE when set. Safe to call more than once.
    //==========================================================================================================
    static void configureFromEnvironment();

    // Appends to filePath; returns false (and reports on stderr) when it cannot be opened.
    static bool setLogFile(const std::string& filePath);

    // Stops mirroring to the log file, if one is open.
    static void closeLogFile();

    //==========================================================================================================
    // log
    // Purpose: Writes one "[LEVEL] file:line: message" line to stderr and, when set, the log file.
    // Notes:
    //   The label is colored unless LMCP_LOG_COLOR is false; the log file never gets ANSI codes.
    //==========================================================================================================
    static void log(const char* level, const std::string& msg, const char* file, unsigned int line);

    static LogLevel sLogLevel;

private:
    static std::ofstream sLogFile;
    static std::mutex sLogMutex;
};

// Static members are defined in Logger.cpp

// Logging macros with log level filtering
#define LOG_DEBUG(fmt, ...) if (Logger::sLogLevel <= LogLevel::LOG_DEBUG_LEVEL) Logger::logf("DEBUG", fmt, __FILE__, __LINE__, ##__VA_ARGS__)
#define LOG_INFO(fmt, ...)  if (Logger::sLogLevel <= LogLevel::LOG_INFO_LEVEL)  Logger::logf("INFO", fmt, __FILE__, __LINE__, ##__VA_ARGS__)
#define LOG_WARN(fmt, ...)  if (Logger::sLogLevel <= LogLevel::LOG_WARN_LEVEL)  Logger::logf("WARN", fmt, __FILE__, __LINE__, ##__VA_ARGS__)
#define LOG_ERROR(fmt, ...) if (Logger::sLogLevel <= LogLevel::LOG_ERROR_LEVEL) Logger::logf("ERROR", fmt, __FILE__, __LINE__, ##__VA_ARGS__)
#define LOG_FATAL(fmt, ...) do { Logger::logf("FATAL", fmt, __FILE__, __LINE__, ##__VA_ARGS__); ::_Exit(EXIT_FAILURE); } while(0)

// Function entry/exit macros for logging
#ifdef _DEBUG
#define FUNC_ENTRY() LOG_DEBUG("ENTER: {}", __FUNCTION__)
#define FUNC_EXIT()  LOG_DEBUG("EXIT:  {}", __FUNCTION__)

// Scope-based entry/exit guard to avoid manual pairs and ensure correct function on exit
namespace {
struct FuncScopeGuard {
    const char* func;
    explicit FuncScopeGuard(const char* f) : func(f) { LOG_DEBUG("ENTER: {}", func); }
    ~FuncScopeGuard() { LOG_DEBUG("EXIT:  {}", func); }
};
}
#define FUNC_SCOPE() [[maybe_unused]] FuncScopeGuard funcScope(__FUNCTION__)
#else
#define FUNC_ENTRY() ((void)0)
#define FUNC_EXIT()  ((void)0)
#define FUNC_SCOPE() ((void)0)
#endif
