/**
 * @file PlaybackBackend.h
 * @brief Device-type specific playback strategy
 */

#ifndef CASTSPEAK_PLAYBACK_BACKEND_H
#define CASTSPEAK_PLAYBACK_BACKEND_H

#include "Device.h"

#include <memory>
#include <string>

class LocalPlayer;
class PlaybackController;

class PlaybackBackend {
public:
    virtual ~PlaybackBackend() = default;

    // Non-copyable
    PlaybackBackend() = default;
    PlaybackBackend(const PlaybackBackend&) = delete;
    PlaybackBackend& operator=(const PlaybackBackend&) = delete;

    /**
     * @brief Play a file to completion (blocking)
     * @return true on success; failures are logged
     */
    virtual bool play(const std::string& path) = 0;

    // True if playing needs the shared cast connection
    virtual bool usesConnection() const = 0;

    /**
     * @brief Create the backend for a device type
     * @return Backend instance referencing controller/localPlayer (which
     *         must outlive it)
     */
    static std::unique_ptr<PlaybackBackend> create(const Device& device,
                                                   PlaybackController& controller,
                                                   const LocalPlayer& localPlayer);
};

class CastBackend : public PlaybackBackend {
public:
    CastBackend(Device device, PlaybackController& controller);

    bool play(const std::string& path) override;
    bool usesConnection() const override { return true; }

private:
    Device m_device;
    PlaybackController& m_controller;
};

class LocalBackend : public PlaybackBackend {
public:
    explicit LocalBackend(const LocalPlayer& player);

    bool play(const std::string& path) override;
    bool usesConnection() const override { return false; }

private:
    const LocalPlayer& m_player;
};

#endif // CASTSPEAK_PLAYBACK_BACKEND_H
