/**
 * @file LogLevel.cpp
 * @brief Global log level state
 */

#include "LogLevel.h"

#include <algorithm>
#include <cctype>

LogLevel g_logLevel = LogLevel::INFO;
std::mutex g_logMutex;

bool parseLogLevel(const std::string& name, LogLevel& out) {
    std::string lower = name;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return std::tolower(c); });

    if (lower == "error") { out = LogLevel::ERROR; return true; }
    if (lower == "warn" || lower == "warning") { out = LogLevel::WARN; return true; }
    if (lower == "info") { out = LogLevel::INFO; return true; }
    if (lower == "debug") { out = LogLevel::DEBUG; return true; }
    return false;
}
