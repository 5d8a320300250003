/**
 * @file LogLevel.h
 * @brief Centralized log level system for castspeak
 *
 * Provides 4 log levels (ERROR, WARN, INFO, DEBUG) with runtime filtering
 * via g_logLevel. Lines are written whole under g_logMutex so output from
 * worker threads does not interleave.
 *
 * Usage:
 *   LOG_ERROR("[Cast] connect failed: " << reason);
 *   LOG_WARN("[HTTP] client timed out");
 *   LOG_INFO("Playback started");
 *   LOG_DEBUG("[mDNS] detailed message");
 */

#ifndef CASTSPEAK_LOGLEVEL_H
#define CASTSPEAK_LOGLEVEL_H

#include <iostream>
#include <mutex>
#include <string>

enum class LogLevel { ERROR = 0, WARN = 1, INFO = 2, DEBUG = 3 };

extern LogLevel g_logLevel;
extern std::mutex g_logMutex;

// "error", "warn", "info", "debug" (case-insensitive). Returns false if unknown.
bool parseLogLevel(const std::string& name, LogLevel& out);

#define LOG_ERROR(x) do { \
    if (g_logLevel >= LogLevel::ERROR) { \
        std::lock_guard<std::mutex> logLock_(g_logMutex); \
        std::cerr << "[ERROR] " << x << std::endl; \
    } \
} while(0)
#define LOG_WARN(x) do { \
    if (g_logLevel >= LogLevel::WARN) { \
        std::lock_guard<std::mutex> logLock_(g_logMutex); \
        std::cout << "[WARN] " << x << std::endl; \
    } \
} while(0)
#define LOG_INFO(x) do { \
    if (g_logLevel >= LogLevel::INFO) { \
        std::lock_guard<std::mutex> logLock_(g_logMutex); \
        std::cout << x << std::endl; \
    } \
} while(0)
#define LOG_DEBUG(x) do { \
    if (g_logLevel >= LogLevel::DEBUG) { \
        std::lock_guard<std::mutex> logLock_(g_logMutex); \
        std::cout << x << std::endl; \
    } \
} while(0)

#endif // CASTSPEAK_LOGLEVEL_H
