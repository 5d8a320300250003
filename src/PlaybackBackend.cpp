/**
 * @file PlaybackBackend.cpp
 * @brief Backend factory and variants
 */

#include "PlaybackBackend.h"
#include "LocalPlayer.h"
#include "PlaybackController.h"

std::unique_ptr<PlaybackBackend> PlaybackBackend::create(const Device& device,
                                                         PlaybackController& controller,
                                                         const LocalPlayer& localPlayer) {
    switch (device.type) {
        case DeviceType::GoogleCast:
            return std::make_unique<CastBackend>(device, controller);
        case DeviceType::LocalSay:
            return std::make_unique<LocalBackend>(localPlayer);
    }
    return nullptr;
}

// ============================================
// CastBackend
// ============================================

CastBackend::CastBackend(Device device, PlaybackController& controller)
    : m_device(std::move(device))
    , m_controller(controller)
{
}

bool CastBackend::play(const std::string& path) {
    return m_controller.playNetworked(m_device, path);
}

// ============================================
// LocalBackend
// ============================================

LocalBackend::LocalBackend(const LocalPlayer& player)
    : m_player(player)
{
}

bool LocalBackend::play(const std::string& path) {
    return m_player.play(path);
}
