/**
 * @file Device.cpp
 * @brief Device (de)serialization
 */

#include "Device.h"

const char* deviceTypeName(DeviceType type) {
    switch (type) {
        case DeviceType::GoogleCast: return "googlecast";
        case DeviceType::LocalSay:   return "local_say";
    }
    return "unknown";
}

bool parseDeviceType(const std::string& name, DeviceType& out) {
    if (name == "googlecast") {
        out = DeviceType::GoogleCast;
        return true;
    }
    if (name == "local_say") {
        out = DeviceType::LocalSay;
        return true;
    }
    return false;
}

Device Device::local() {
    Device d;
    d.id = LOCAL_ID;
    d.name = "Local Speaker";
    d.type = DeviceType::LocalSay;
    return d;
}

Json::Value Device::toJson() const {
    Json::Value v(Json::objectValue);
    v["id"] = id;
    v["name"] = name;
    v["address"] = address ? Json::Value(*address) : Json::Value(Json::nullValue);
    v["device_type"] = deviceTypeName(type);
    return v;
}

bool Device::fromJson(const Json::Value& value, Device& out) {
    if (!value.isObject()) return false;

    const Json::Value& id = value["id"];
    const Json::Value& name = value["name"];
    const Json::Value& type = value["device_type"];
    if (!id.isString() || !name.isString() || !type.isString()) return false;

    Device d;
    d.id = id.asString();
    d.name = name.asString();
    if (d.id.empty()) return false;
    if (!parseDeviceType(type.asString(), d.type)) return false;

    const Json::Value& address = value["address"];
    if (address.isString() && !address.asString().empty()) {
        d.address = address.asString();
    }

    out = std::move(d);
    return true;
}
