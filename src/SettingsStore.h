/**
 * @file SettingsStore.h
 * @brief Persisted user selection (JSON file)
 *
 * File layout:
 *   { "selected_device": { "id": ..., "name": ..., "address": ..., "device_type": ... } }
 * selected_device and address may be null.
 */

#ifndef CASTSPEAK_SETTINGS_STORE_H
#define CASTSPEAK_SETTINGS_STORE_H

#include "Device.h"

#include <optional>
#include <string>

class SettingsStore {
public:
    // path empty = defaultPath()
    explicit SettingsStore(std::string path = "");

    /**
     * @brief Load the file
     *
     * A missing file is an empty selection. A malformed file or record is
     * logged and treated as no selection.
     *
     * @return false if the file existed but could not be used
     */
    bool load();

    /**
     * @brief Write the current state (temp file + rename)
     */
    bool save() const;

    const std::optional<Device>& selectedDevice() const { return m_selected; }

    // Replace the selection and save immediately
    bool setSelectedDevice(const Device& device);
    bool clearSelectedDevice();

    const std::string& path() const { return m_path; }

    // $XDG_CONFIG_HOME/castspeak/config.json, else ~/.config/castspeak/config.json
    static std::string defaultPath();

private:
    std::string m_path;
    std::optional<Device> m_selected;
};

#endif // CASTSPEAK_SETTINGS_STORE_H
