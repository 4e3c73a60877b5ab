//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Logger.cpp
// Purpose: Definitions for Logger static members and the JSON line writer.
//==========================================================================================================

#include "logging/Logger.h"

#include <cctype>
#include <chrono>
#include <cstring>
#include <ctime>
#include <memory>

using mcptest::JSONValue;

// Define static members
LogLevel Logger::sLogLevel = LogLevel::LOG_INFO_LEVEL;
std::ofstream Logger::sLogFile;
std::mutex Logger::sLogMutex;
std::ostream* Logger::sOut = nullptr;
std::string Logger::sDefaultLoggerName = "mcptest";

namespace {
const char* baseName(const char* path) {
    if (path == nullptr) return "";
    const char* slash = std::strrchr(path, '/');
    return slash ? slash + 1 : path;
}
} // namespace

LogLevel Logger::levelFromString(const std::string& lvl) {
    std::string s; s.reserve(lvl.size());
    for (char c : lvl) s.push_back(static_cast<char>(::toupper(static_cast<unsigned char>(c))));
    if (s == "DEBUG") return LogLevel::LOG_DEBUG_LEVEL;
    if (s == "INFO")  return LogLevel::LOG_INFO_LEVEL;
    if (s == "WARN" || s == "WARNING")  return LogLevel::LOG_WARN_LEVEL;
    if (s == "ERROR") return LogLevel::LOG_ERROR_LEVEL;
    if (s == "FATAL" || s == "CRITICAL") return LogLevel::LOG_FATAL_LEVEL;
    return LogLevel::LOG_INFO_LEVEL;
}

const char* Logger::levelName(LogLevel level) {
    switch (level) {
        case LogLevel::LOG_DEBUG_LEVEL: return "DEBUG";
        case LogLevel::LOG_INFO_LEVEL: return "INFO";
        case LogLevel::LOG_WARN_LEVEL: return "WARNING";
        case LogLevel::LOG_ERROR_LEVEL: return "ERROR";
        case LogLevel::LOG_FATAL_LEVEL: return "CRITICAL";
    }
    return "INFO";
}

std::string Logger::isoTimestamp() {
    const auto now = std::chrono::system_clock::now();
    const std::time_t secs = std::chrono::system_clock::to_time_t(now);
    const auto micros = std::chrono::duration_cast<std::chrono::microseconds>(
        now.time_since_epoch()).count() % 1000000;
    std::tm buf{};
    ::gmtime_r(&secs, &buf);
    return fmt::format("{:04d}-{:02d}-{:02d}T{:02d}:{:02d}:{:02d}.{:06d}+00:00",
                       buf.tm_year + 1900, buf.tm_mon + 1, buf.tm_mday,
                       buf.tm_hour, buf.tm_min, buf.tm_sec, static_cast<long long>(micros));
}

void Logger::setLogLevel(LogLevel level) {
    sLogLevel = level;
}

LogLevel Logger::getLogLevel() {
    return sLogLevel;
}

bool Logger::isEnabled(LogLevel level) {
    return sLogLevel <= level;
}

bool Logger::setLogFile(const std::string& filePath) {
    std::lock_guard<std::mutex> lock(sLogMutex);
    if (sLogFile.is_open()) {
        sLogFile.close();
    }
    sLogFile.open(filePath, std::ios::out | std::ios::app);
    if (!sLogFile.is_open()) {
        std::ostream& out = sOut ? *sOut : std::cerr;
        out << "{\"level\":\"ERROR\",\"logger_name\":\"" << sDefaultLoggerName
            << "\",\"message\":\"Failed to open log file\",\"timestamp\":\"" << isoTimestamp() << "\"}\n";
        out.flush();
        return false;
    }
    return true;
}

void Logger::closeLogFile() {
    std::lock_guard<std::mutex> lock(sLogMutex);
    if (sLogFile.is_open()) {
        sLogFile.close();
    }
}

void Logger::setOutputStream(std::ostream* out) {
    std::lock_guard<std::mutex> lock(sLogMutex);
    sOut = out;
}

void Logger::setDefaultLoggerName(const std::string& name) {
    std::lock_guard<std::mutex> lock(sLogMutex);
    sDefaultLoggerName = name;
}

void Logger::configureFromEnv() {
    setLogLevel(levelFromString(GetEnvOrDefault("LOG_LEVEL", "INFO")));
}

void Logger::log(LogLevel level, const std::string& msg, const char* file, unsigned int line) {
    std::string loggerName;
    {
        std::lock_guard<std::mutex> lock(sLogMutex);
        loggerName = sDefaultLoggerName;
    }
    JSONValue::Object extras;
    extras["source"] = std::make_shared<JSONValue>(fmt::format("{}:{}", baseName(file), line));
    event(level, loggerName, msg, extras);
}

void Logger::event(LogLevel level, const std::string& loggerName, const std::string& message,
                   const JSONValue::Object& extras) {
    if (!isEnabled(level)) {
        return;
    }
    JSONValue::Object record = extras;
    record["timestamp"] = std::make_shared<JSONValue>(isoTimestamp());
    record["level"] = std::make_shared<JSONValue>(levelName(level));
    record["logger_name"] = std::make_shared<JSONValue>(loggerName);
    record["message"] = std::make_shared<JSONValue>(message);
    std::string line = mcptest::serializeJSONValue(JSONValue(std::move(record)));
    line.push_back('\n');
    write(line);
}

void Logger::write(const std::string& line) {
    std::lock_guard<std::mutex> lock(sLogMutex);
    std::ostream& out = sOut ? *sOut : std::cerr;
    out << line;
    out.flush();
    if (sLogFile.is_open()) {
        sLogFile << line;
        sLogFile.flush();
    }
}
