#define CATCH_CONFIG_MAIN
#include <catch2/catch.hpp>

#include "LogLevel.h"

// Keep test output readable; individual tests raise the level when needed
struct QuietLogs {
    QuietLogs() { g_logLevel = LogLevel::ERROR; }
};
static QuietLogs quietLogs;
