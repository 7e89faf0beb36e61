//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Logger.cpp
// Purpose: Logger state, level parsing, log file handling and line output
//==========================================================================================================

#include "logging/Logger.h"

// Initial level honours LMCP_LOG_LEVEL; the log file is opened by configureFromEnvironment().
LogLevel Logger::sLogLevel = Logger::levelFromString(GetEnvOrDefault("LMCP_LOG_LEVEL", "INFO"));
std::ofstream Logger::sLogFile;
std::mutex Logger::sLogMutex;

namespace {

const char* labelColor(const char* level) {
    if (::strncmp(level, "ERROR", 5) == 0 || ::strncmp(level, "FATAL", 5) == 0) {
        return "\033[38;5;88m"; // burgundy
    }
    if (::strncmp(level, "WARN", 4) == 0) {
        return "\033[33m";
    }
    return "\033[35m"; // purple
}

} // namespace

LogLevel Logger::levelFromString(const std::string& lvl, LogLevel fallback) {
    std::string s;
    s.reserve(lvl.size());
    for (char c : lvl) s.push_back(static_cast<char>(::toupper(static_cast<unsigned char>(c))));
    if (s == "DEBUG" || s == "TRACE") return LogLevel::LOG_DEBUG_LEVEL;
    if (s == "INFO")  return LogLevel::LOG_INFO_LEVEL;
    if (s == "WARN" || s == "WARNING")  return LogLevel::LOG_WARN_LEVEL;
    if (s == "ERROR") return LogLevel::LOG_ERROR_LEVEL;
    if (s == "FATAL" || s == "CRITICAL") return LogLevel::LOG_FATAL_LEVEL;
    return fallback;
}

const char* Logger::levelName(LogLevel level) {
    switch (level) {
        case LogLevel::LOG_DEBUG_LEVEL: return "DEBUG";
        case LogLevel::LOG_INFO_LEVEL:  return "INFO";
        case LogLevel::LOG_WARN_LEVEL:  return "WARN";
        case LogLevel::LOG_ERROR_LEVEL: return "ERROR";
        case LogLevel::LOG_FATAL_LEVEL: return "FATAL";
    }
    return "INFO";
}

void Logger::configureFromEnvironment() {
    const std::string lvl = GetEnvOrDefault("LMCP_LOG_LEVEL", "");
    if (!lvl.empty()) {
        setLogLevel(levelFromString(lvl, sLogLevel));
    }
    const std::string file = GetEnvOrDefault("LMCP_LOG_FILE", "");
    if (!file.empty()) {
        (void)setLogFile(file);
    }
}

bool Logger::setLogFile(const std::string& filePath) {
    std::lock_guard<std::mutex> lock(sLogMutex);
    if (sLogFile.is_open()) {
        sLogFile.close();
    }
    sLogFile.open(filePath, std::ios::out | std::ios::app);
    if (!sLogFile.is_open()) {
        std::cerr << "[ERROR] Failed to open log file: " << filePath << " (errno=" << errno << ")" << std::endl;
        return false;
    }
    std::time_t now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    std::tm buf{};
    ::localtime_r(&now, &buf);
    sLogFile << "\n=== lmcp log opened at " << std::put_time(&buf, "%Y-%m-%d %H:%M:%S") << " ===\n";
    sLogFile.flush();
    return true;
}

void Logger::closeLogFile() {
    std::lock_guard<std::mutex> lock(sLogMutex);
    if (sLogFile.is_open()) {
        sLogFile.close();
    }
}

void Logger::log(const char* level, const std::string& msg, const char* file, unsigned int line) {
    static const bool colorEnabled = GetEnvBoolOrDefault("LMCP_LOG_COLOR", true);
    const std::string plain = fmt::format("[{}] {}:{}: {}\n", level, file, line, msg);

    std::lock_guard<std::mutex> lock(sLogMutex);
    // Console output goes to stderr; stdout belongs to the embedding application (or a stdio server)
    if (colorEnabled) {
        std::cerr << fmt::format("[{}{}\033[0m] {}:{}: {}\n", labelColor(level), level, file, line, msg);
    } else {
        std::cerr << plain;
    }
    std::cerr.flush();

    if (sLogFile.is_open()) {
        sLogFile << plain;
        sLogFile.flush();
    }
}
