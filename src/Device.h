/**
 * @file Device.h
 * @brief Playback device description
 *
 * A Device is an immutable value identifying where audio should play:
 * a networked cast speaker (addressed by its stable cast UUID) or the
 * local host (fixed sentinel id).
 */

#ifndef CASTSPEAK_DEVICE_H
#define CASTSPEAK_DEVICE_H

#include <json/json.h>

#include <optional>
#include <string>

enum class DeviceType {
    GoogleCast,     // "googlecast" - remote speaker, cast control session
    LocalSay        // "local_say"  - host machine, OS playback utility
};

const char* deviceTypeName(DeviceType type);
bool parseDeviceType(const std::string& name, DeviceType& out);

struct Device {
    std::string id;
    std::string name;
    std::optional<std::string> address;    // absent for the local backend
    DeviceType type = DeviceType::GoogleCast;

    // Sentinel device for the local backend
    static constexpr const char* LOCAL_ID = "local_say";
    static Device local();

    bool isNetworked() const { return type == DeviceType::GoogleCast; }

    Json::Value toJson() const;

    /**
     * @brief Build a Device from its persisted record
     * @return false if a required field is missing or the type is unknown
     */
    static bool fromJson(const Json::Value& value, Device& out);

    bool operator==(const Device& other) const {
        return id == other.id && name == other.name &&
               address == other.address && type == other.type;
    }
    bool operator!=(const Device& other) const { return !(*this == other); }
};

#endif // CASTSPEAK_DEVICE_H
