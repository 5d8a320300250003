/**
 * @file DeviceDiscovery.h
 * @brief Enumerate playable devices
 */

#ifndef CASTSPEAK_DEVICE_DISCOVERY_H
#define CASTSPEAK_DEVICE_DISCOVERY_H

#include "CastSession.h"
#include "Device.h"

#include <chrono>
#include <vector>

class DeviceDiscovery {
public:
    /**
     * @param browser   Cast browser (not owned)
     * @param withLocal List the local device first
     */
    explicit DeviceDiscovery(CastBrowser& browser, bool withLocal = true);

    /**
     * @brief Local device (if enabled) followed by every cast device seen
     *
     * Never throws: browse failures are logged and yield no cast devices.
     * stopDiscovery() is always called on the browser afterwards.
     */
    std::vector<Device> discover(std::chrono::milliseconds timeout);

private:
    CastBrowser& m_browser;
    bool m_withLocal;
};

#endif // CASTSPEAK_DEVICE_DISCOVERY_H
