/**
 * @file main.cpp
 * @brief Main entry point for castspeak
 *
 * Plays audio files on a cast speaker (or the local host) chosen from the
 * devices found on the LAN. The selection is persisted between runs.
 */

#include "Config.h"
#include "LocalPlayer.h"
#include "LogLevel.h"
#include "MdnsBrowser.h"
#include "ScopedPaths.h"
#include "SettingsStore.h"
#include "SpeakerService.h"

#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <exception>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

#define CASTSPEAK_VERSION "0.1.0"

static constexpr int DEFAULT_LIST_TIMEOUT = 5;      // seconds
static constexpr int DEFAULT_SELECT_TIMEOUT = 15;   // seconds

// ============================================
// Signal Handling
// ============================================

std::atomic<bool> g_running{true};

void signalHandler(int signal) {
    std::cout << "\nSignal " << signal << " received, stopping after current playback..." << std::endl;
    g_running.store(false, std::memory_order_release);
}

// ============================================
// CLI Parsing
// ============================================

static int parsePositive(const std::string& option, const char* value) {
    int n = std::atoi(value);
    if (n < 1) {
        std::cerr << "Invalid value for " << option << ": " << value << " (must be >= 1)" << std::endl;
        exit(1);
    }
    return n;
}

Config parseArguments(int argc, char* argv[]) {
    Config config;

    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];

        if (arg == "--list" || arg == "-l") {
            config.listDevices = true;
        }
        else if ((arg == "--select" || arg == "-S") && i + 1 < argc) {
            config.selectDevice = argv[++i];
        }
        else if (arg == "--status") {
            config.showStatus = true;
        }
        else if (arg == "--connect" || arg == "-c") {
            config.connect = true;
        }
        else if ((arg == "--timeout" || arg == "-t") && i + 1 < argc) {
            config.discoveryTimeout = parsePositive(arg, argv[++i]);
        }
        else if (arg == "--config" && i + 1 < argc) {
            config.configPath = argv[++i];
        }
        else if (arg == "--local-player" && i + 1 < argc) {
            config.localPlayer = argv[++i];
        }
        else if (arg == "--no-local") {
            config.withLocal = false;
        }
        else if (arg == "--poll-timeout" && i + 1 < argc) {
            config.pollTimeout = parsePositive(arg, argv[++i]);
        }
        else if (arg == "--version" || arg == "-V") {
            config.showVersion = true;
        }
        else if (arg == "--verbose" || arg == "-v") {
            config.verbose = true;
        }
        else if (arg == "--quiet" || arg == "-q") {
            config.quiet = true;
        }
        else if (arg == "--log-level" && i + 1 < argc) {
            config.logLevel = argv[++i];
            LogLevel ignored;
            if (!parseLogLevel(config.logLevel, ignored)) {
                std::cerr << "Invalid log level: " << config.logLevel
                          << " (error, warn, info, debug)" << std::endl;
                exit(1);
            }
        }
        else if (arg == "--help" || arg == "-h") {
            std::cout << "castspeak - Play audio on cast speakers\n\n"
                      << "Usage: " << argv[0] << " [options] [FILE...]\n\n"
                      << "Devices:\n"
                      << "  -l, --list             Discover and list devices\n"
                      << "  -S, --select <n|id>    Select a device by list number or id\n"
                      << "  --status               Show the selected device\n"
                      << "  -c, --connect          Connect to the selected cast device (see note)\n"
                      << "  -t, --timeout <s>      Discovery timeout (default: "
                      << DEFAULT_LIST_TIMEOUT << " list, " << DEFAULT_SELECT_TIMEOUT << " select)\n"
                      << "  --no-local             Do not offer the local speaker\n"
                      << "\n"
                      << "Playback:\n"
                      << "  --local-player <cmd>   Local playback command (default: mpg123 -q)\n"
                      << "  --poll-timeout <s>     Max wait for a cast playback to finish (default: 60)\n"
                      << "\n"
                      << "Settings:\n"
                      << "  --config <path>        Settings file (default: " << SettingsStore::defaultPath() << ")\n"
                      << "\n"
                      << "Logging:\n"
                      << "  -v, --verbose          Debug output (log level: DEBUG)\n"
                      << "  -q, --quiet            Errors and warnings only (log level: WARN)\n"
                      << "  --log-level <level>    error, warn, info or debug\n"
                      << "\n"
                      << "Other:\n"
                      << "  -V, --version          Show version information\n"
                      << "  -h, --help             Show this help\n"
                      << "\n"
                      << "Note:\n"
                      << "  This build has no cast control transport. Cast devices can be\n"
                      << "  listed and selected, but --connect and playback on them fail.\n"
                      << "  Playback on the local speaker works.\n"
                      << "\n"
                      << "Examples:\n"
                      << "  " << argv[0] << " --list\n"
                      << "  " << argv[0] << " --select 2\n"
                      << "  " << argv[0] << " announcement.mp3\n"
                      << std::endl;
            exit(0);
        }
        else if (!arg.empty() && arg[0] == '-') {
            std::cerr << "Unknown option: " << arg << std::endl;
            std::cerr << "Use --help for usage information" << std::endl;
            exit(1);
        }
        else {
            config.files.push_back(arg);
        }
    }

    return config;
}

// ============================================
// Actions
// ============================================

static void printDevices(const std::vector<Device>& devices, const std::optional<Device>& selected) {
    if (devices.empty()) {
        std::cout << "No devices found" << std::endl;
        return;
    }
    for (size_t i = 0; i < devices.size(); i++) {
        const Device& d = devices[i];
        bool current = selected && selected->id == d.id;
        std::cout << (current ? " * " : "   ") << (i + 1) << ". " << d.name
                  << "  [" << deviceTypeName(d.type) << "]";
        if (d.address) std::cout << "  " << *d.address;
        std::cout << "\n      id: " << d.id << std::endl;
    }
}

static std::optional<Device> findDevice(const std::vector<Device>& devices, const std::string& key) {
    bool numeric = !key.empty() && key.find_first_not_of("0123456789") == std::string::npos;
    if (numeric) {
        size_t index = std::strtoul(key.c_str(), nullptr, 10);
        if (index >= 1 && index <= devices.size()) {
            return devices[index - 1];
        }
    }
    for (const auto& d : devices) {
        if (d.id == key) return d;
    }
    return std::nullopt;
}

static bool listAction(SpeakerService& service, const SettingsStore& settings, int timeoutSec) {
    std::cout << "Scanning for devices (" << timeoutSec << " s)..." << std::endl;
    std::vector<Device> devices = service.discover(std::chrono::seconds(timeoutSec)).get();
    printDevices(devices, settings.selectedDevice());
    return true;
}

static bool selectAction(SpeakerService& service, SettingsStore& settings,
                         const std::string& key, int timeoutSec) {
    std::cout << "Scanning for devices (" << timeoutSec << " s)..." << std::endl;
    std::vector<Device> devices = service.discover(std::chrono::seconds(timeoutSec)).get();

    std::optional<Device> device = findDevice(devices, key);
    if (!device) {
        LOG_ERROR("No device matches '" << key << "'");
        printDevices(devices, settings.selectedDevice());
        return false;
    }
    if (!settings.setSelectedDevice(*device)) {
        return false;
    }
    std::cout << "Selected: " << device->name << " (" << device->id << ")" << std::endl;
    return true;
}

static void statusAction(SpeakerService& service, const SettingsStore& settings) {
    const std::optional<Device>& selected = settings.selectedDevice();
    if (!selected) {
        std::cout << "No device selected (use --list and --select)" << std::endl;
        return;
    }
    std::cout << "Selected device:" << std::endl;
    std::cout << "  Name:    " << selected->name << std::endl;
    std::cout << "  Type:    " << deviceTypeName(selected->type) << std::endl;
    std::cout << "  Id:      " << selected->id << std::endl;
    if (selected->address) {
        std::cout << "  Address: " << *selected->address << std::endl;
    }
    if (selected->isNetworked()) {
        std::cout << "  Connected: " << (service.isConnectedTo(selected->id) ? "yes" : "no")
                  << std::endl;
        if (!service.connections().hasTransport()) {
            std::cout << "  Note:    no cast control transport in this build, "
                      << "cast playback is unavailable" << std::endl;
        }
    }
}

static bool playFile(SpeakerService& service, const Device& device, const std::string& file) {
    // Serve a private copy so the source directory is never exposed
    ScopedTempDir staging;
    if (!staging.ok()) {
        return false;
    }
    std::string staged = staging.stage(file);
    if (staged.empty()) {
        LOG_ERROR("Cannot stage " << file);
        return false;
    }

    LOG_INFO("Playing " << file << " on " << device.name);
    return service.play(device, staged).get();
}

// ============================================
// Main
// ============================================

int main(int argc, char* argv[]) {
    signal(SIGINT, signalHandler);
    signal(SIGTERM, signalHandler);

    Config config = parseArguments(argc, argv);

    // Apply log level
    if (config.verbose) {
        g_logLevel = LogLevel::DEBUG;
    } else if (config.quiet) {
        g_logLevel = LogLevel::WARN;
    }
    if (!config.logLevel.empty()) {
        parseLogLevel(config.logLevel, g_logLevel);
    }

    if (config.showVersion) {
        std::cout << "Version:  " << CASTSPEAK_VERSION << std::endl;
        std::cout << "Build:    " << __DATE__ << " " << __TIME__ << std::endl;
#ifdef ENABLE_MP3
        std::cout << "Probe:    libmpg123" << std::endl;
#else
        std::cout << "Probe:    size only" << std::endl;
#endif
        return 0;
    }

    bool anyAction = config.listDevices || !config.selectDevice.empty() ||
                     config.showStatus || config.connect || !config.files.empty();
    if (!anyAction) {
        std::cerr << "Nothing to do" << std::endl;
        std::cerr << "Use --help for usage information" << std::endl;
        return 1;
    }

    if (g_logLevel >= LogLevel::INFO) {
        std::cout << "═══════════════════════════════════════════════════════\n"
                  << "  castspeak v" << CASTSPEAK_VERSION << "\n"
                  << "═══════════════════════════════════════════════════════\n"
                  << std::endl;
    }
    LOG_DEBUG("Verbose mode enabled (log level: DEBUG)");

    SettingsStore settings(config.configPath);
    settings.load();

    ServiceOptions options;
    options.withLocal = config.withLocal;
    options.localPlayer = LocalPlayer::splitCommand(config.localPlayer);
    if (config.pollTimeout > 0) {
        options.playback.pollTimeout = std::chrono::seconds(config.pollTimeout);
    }

    MdnsBrowser connectBrowser;
    MdnsBrowser discoveryBrowser;

    // No cast control transport is linked in; cast connects report failure
    SpeakerService service(connectBrowser, discoveryBrowser, nullptr, options);

    bool ok = true;
    try {
        if (config.listDevices) {
            int timeout = config.discoveryTimeout > 0 ? config.discoveryTimeout : DEFAULT_LIST_TIMEOUT;
            ok = listAction(service, settings, timeout) && ok;
        }

        if (!config.selectDevice.empty()) {
            int timeout = config.discoveryTimeout > 0 ? config.discoveryTimeout : DEFAULT_SELECT_TIMEOUT;
            ok = selectAction(service, settings, config.selectDevice, timeout) && ok;
        }

        if (config.showStatus) {
            statusAction(service, settings);
        }

        if (config.connect || !config.files.empty()) {
            const std::optional<Device>& selected = settings.selectedDevice();
            if (!selected) {
                LOG_ERROR("No device selected (use --list and --select)");
                ok = false;
            } else {
                if (config.connect) {
                    ok = service.connect(*selected).get() && ok;
                }
                for (const auto& file : config.files) {
                    if (!g_running.load(std::memory_order_acquire)) {
                        LOG_WARN("Interrupted, skipping remaining files");
                        ok = false;
                        break;
                    }
                    ok = playFile(service, *selected, file) && ok;
                }
            }
        }
    } catch (const std::exception& e) {
        LOG_ERROR("Fatal: " << e.what());
        ok = false;
    }

    service.shutdown();
    return ok ? 0 : 1;
}
