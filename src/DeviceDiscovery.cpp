/**
 * @file DeviceDiscovery.cpp
 * @brief Device enumeration
 */

#include "DeviceDiscovery.h"
#include "LogLevel.h"

#include <exception>

DeviceDiscovery::DeviceDiscovery(CastBrowser& browser, bool withLocal)
    : m_browser(browser)
    , m_withLocal(withLocal)
{
}

std::vector<Device> DeviceDiscovery::discover(std::chrono::milliseconds timeout) {
    std::vector<Device> devices;
    if (m_withLocal) {
        devices.push_back(Device::local());
    }

    std::vector<CastInfo> found;
    try {
        found = m_browser.browse(timeout);
    } catch (const std::exception& e) {
        LOG_ERROR("[Discovery] Browse failed: " << e.what());
        found.clear();
    }

    try {
        m_browser.stopDiscovery();
    } catch (const std::exception& e) {
        LOG_WARN("[Discovery] stopDiscovery failed: " << e.what());
    }

    for (const auto& info : found) {
        Device d;
        d.id = info.uuid;
        d.name = info.friendlyName;
        if (!info.host.empty()) d.address = info.host;
        d.type = DeviceType::GoogleCast;
        devices.push_back(std::move(d));
    }

    LOG_DEBUG("[Discovery] " << found.size() << " cast device(s) found");
    return devices;
}
