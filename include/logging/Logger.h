//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Logger.h
// Purpose: Structured JSON-lines logging on stderr with level filtering and an optional mirror file.
//==========================================================================================================
#pragma once

#include <mutex>
#include <iostream>
#include <fstream>
#include <string>
#include <fmt/format.h>
#include "env/EnvVars.h"
#include "mcptest/JSONRPCTypes.h"

// Log level enum
enum class LogLevel {
    LOG_DEBUG_LEVEL,
    LOG_INFO_LEVEL,
    LOG_WARN_LEVEL,
    LOG_ERROR_LEVEL,
    LOG_FATAL_LEVEL
};

//==========================================================================================================
// Logger
// Purpose: Process-wide logger. Every record becomes one JSON object on its own line:
//   {"level":...,"logger_name":...,"message":...,"timestamp":..., <extras>}
//   Records are written to the output stream (stderr unless replaced) and mirrored to the log file when
//   one is configured. Each line is assembled first and written under a single lock so lines never
//   interleave.
//==========================================================================================================
class Logger {
public:
    // Convert common level strings to LogLevel (case-insensitive). Unknown values map to INFO.
    static LogLevel levelFromString(const std::string& lvl);

    // Canonical level label written into the "level" field.
    static const char* levelName(LogLevel level);

    // Variadic logging using {fmt} runtime format strings
    template <typename... Args>
    static void logf(LogLevel level, const char* fmtStr, const char* file, unsigned int line, Args&&... args) {
        std::string buffer;
        try {
            buffer = fmt::vformat(fmtStr, fmt::make_format_args(args...));
        } catch (const fmt::format_error& e) {
            buffer = fmt::format("Format error: {}", e.what());
        }
        log(level, buffer, file, line);
    }

    //======================================================================================================
    // log
    // Purpose: Emits a plain record attributed to the default logger name, tagged with "source".
    // Args:
    //   level: Severity.
    //   msg: Already formatted message.
    //   file, line: Call site (file is reduced to its basename).
    //======================================================================================================
    static void log(LogLevel level, const std::string& msg, const char* file, unsigned int line);

    //======================================================================================================
    // event
    // Purpose: Emits a structured record with caller supplied extra fields.
    // Args:
    //   level: Severity; suppressed when below the configured level.
    //   loggerName: Value for "logger_name".
    //   message: Value for "message".
    //   extras: Additional top-level fields. Reserved keys (timestamp, level, logger_name, message) are
    //           not overridden.
    //======================================================================================================
    static void event(LogLevel level, const std::string& loggerName, const std::string& message,
                      const mcptest::JSONValue::Object& extras = {});

    // Configure logging
    static void setLogLevel(LogLevel level);
    static LogLevel getLogLevel();
    static bool isEnabled(LogLevel level);

    // Opens (append mode) a file that receives a copy of every record. Returns false when it cannot be opened.
    static bool setLogFile(const std::string& filePath);
    static void closeLogFile();

    // Replaces the primary sink; nullptr restores std::cerr.
    static void setOutputStream(std::ostream* out);

    // Name used for records emitted through log()/LOG_* macros.
    static void setDefaultLoggerName(const std::string& name);

    // Applies LOG_LEVEL from the environment.
    static void configureFromEnv();

    // UTC timestamp with microseconds, e.g. 2025-01-02T03:04:05.123456+00:00
    static std::string isoTimestamp();

    static LogLevel sLogLevel;

private:
    static void write(const std::string& line);

    static std::ofstream sLogFile;
    static std::mutex sLogMutex;
    static std::ostream* sOut;
    static std::string sDefaultLoggerName;
};

// Enhanced logging macros with log level filtering
#define LOG_DEBUG(fmt, ...) if (Logger::sLogLevel <= LogLevel::LOG_DEBUG_LEVEL) Logger::logf(LogLevel::LOG_DEBUG_LEVEL, fmt, __FILE__, __LINE__, ##__VA_ARGS__)
#define LOG_INFO(fmt, ...)  if (Logger::sLogLevel <= LogLevel::LOG_INFO_LEVEL)  Logger::logf(LogLevel::LOG_INFO_LEVEL, fmt, __FILE__, __LINE__, ##__VA_ARGS__)
#define LOG_WARN(fmt, ...)  if (Logger::sLogLevel <= LogLevel::LOG_WARN_LEVEL)  Logger::logf(LogLevel::LOG_WARN_LEVEL, fmt, __FILE__, __LINE__, ##__VA_ARGS__)
#define LOG_ERROR(fmt, ...) if (Logger::sLogLevel <= LogLevel::LOG_ERROR_LEVEL) Logger::logf(LogLevel::LOG_ERROR_LEVEL, fmt, __FILE__, __LINE__, ##__VA_ARGS__)

// Function entry/exit macros for logging
#ifdef _DEBUG
namespace {
struct FuncScopeGuard {
    const char* func;
    explicit FuncScopeGuard(const char* f) : func(f) { LOG_DEBUG("ENTER: {}", func); }
    ~FuncScopeGuard() { LOG_DEBUG("EXIT:  {}", func); }
};
}
#define FUNC_SCOPE() [[maybe_unused]] FuncScopeGuard funcScope(__FUNCTION__)
#else
#define FUNC_SCOPE() ((void)0)
#endif
