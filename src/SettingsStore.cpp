/**
 * @file SettingsStore.cpp
 * @brief JSON settings persistence
 */

#include "SettingsStore.h"
#include "LogLevel.h"

#include <json/json.h>

#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <system_error>

#include <pwd.h>
#include <unistd.h>

namespace fs = std::filesystem;

SettingsStore::SettingsStore(std::string path)
    : m_path(path.empty() ? defaultPath() : std::move(path))
{
}

std::string SettingsStore::defaultPath() {
    const char* xdg = std::getenv("XDG_CONFIG_HOME");
    if (xdg && *xdg) {
        return (fs::path(xdg) / "castspeak" / "config.json").string();
    }

    const char* home = std::getenv("HOME");
    if (!home || !*home) {
        struct passwd* pw = getpwuid(getuid());
        home = pw ? pw->pw_dir : nullptr;
    }
    fs::path base = (home && *home) ? fs::path(home) : fs::current_path();
    return (base / ".config" / "castspeak" / "config.json").string();
}

bool SettingsStore::load() {
    m_selected.reset();

    std::error_code ec;
    if (!fs::exists(m_path, ec)) {
        LOG_DEBUG("[Settings] No settings file at " << m_path);
        return true;
    }

    std::ifstream in(m_path);
    if (!in) {
        LOG_WARN("[Settings] Cannot read " << m_path << ": " << std::strerror(errno));
        return false;
    }

    Json::CharReaderBuilder builder;
    Json::Value root;
    std::string errors;
    if (!Json::parseFromStream(builder, in, &root, &errors)) {
        LOG_WARN("[Settings] Malformed settings file " << m_path << ": " << errors);
        return false;
    }
    if (!root.isObject()) {
        LOG_WARN("[Settings] Settings file " << m_path << " is not a JSON object");
        return false;
    }

    const Json::Value& selected = root["selected_device"];
    if (selected.isNull()) {
        return true;
    }

    Device device;
    if (!Device::fromJson(selected, device)) {
        LOG_WARN("[Settings] Ignoring invalid selected_device in " << m_path);
        return false;
    }

    m_selected = std::move(device);
    LOG_DEBUG("[Settings] Selected device: " << m_selected->name);
    return true;
}

bool SettingsStore::save() const {
    Json::Value root(Json::objectValue);
    root["selected_device"] = m_selected ? m_selected->toJson() : Json::Value(Json::nullValue);

    Json::StreamWriterBuilder builder;
    builder["indentation"] = "  ";
    std::string text = Json::writeString(builder, root) + "\n";

    fs::path target(m_path);
    std::error_code ec;
    if (target.has_parent_path()) {
        fs::create_directories(target.parent_path(), ec);
        if (ec) {
            LOG_ERROR("[Settings] Cannot create " << target.parent_path().string()
                      << ": " << ec.message());
            return false;
        }
    }

    fs::path tmp = target;
    tmp += ".tmp";
    {
        std::ofstream out(tmp, std::ios::trunc);
        if (!out) {
            LOG_ERROR("[Settings] Cannot write " << tmp.string() << ": " << std::strerror(errno));
            return false;
        }
        out << text;
        out.flush();
        if (!out) {
            LOG_ERROR("[Settings] Write failed for " << tmp.string());
            fs::remove(tmp, ec);
            return false;
        }
    }

    fs::rename(tmp, target, ec);
    if (ec) {
        LOG_ERROR("[Settings] Cannot replace " << m_path << ": " << ec.message());
        std::error_code ignored;
        fs::remove(tmp, ignored);
        return false;
    }
    return true;
}

bool SettingsStore::setSelectedDevice(const Device& device) {
    m_selected = device;
    return save();
}

bool SettingsStore::clearSelectedDevice() {
    m_selected.reset();
    return save();
}
