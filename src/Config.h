/**
 * @file Config.h
 * @brief Runtime configuration for castspeak
 */

#ifndef CASTSPEAK_CONFIG_H
#define CASTSPEAK_CONFIG_H

#include <string>
#include <vector>

struct Config {
    // Settings
    std::string configPath;             // empty = $XDG_CONFIG_HOME/castspeak/config.json

    // Discovery
    int discoveryTimeout = 0;           // seconds, 0 = per-action default
    bool withLocal = true;              // list the local speaker

    // Playback
    std::string localPlayer;            // empty = "mpg123 -q"
    int pollTimeout = 0;                // seconds, 0 = default (60)
    std::vector<std::string> files;     // played in order on the selected device

    // Logging
    bool verbose = false;
    bool quiet = false;
    std::string logLevel;               // overrides -v/-q when set

    // Actions
    bool listDevices = false;
    std::string selectDevice;           // index (1-based) or device id
    bool showStatus = false;
    bool connect = false;
    bool showVersion = false;
};

#endif // CASTSPEAK_CONFIG_H
