/**
 * @file CastSession.cpp
 * @brief Media status name mapping
 */

#include "CastSession.h"

PlayerState parsePlayerState(const std::string& name) {
    if (name == "PLAYING") return PlayerState::PLAYING;
    if (name == "IDLE") return PlayerState::IDLE;
    if (name == "BUFFERING") return PlayerState::BUFFERING;
    if (name == "PAUSED") return PlayerState::PAUSED;
    return PlayerState::UNKNOWN;
}

IdleReason parseIdleReason(const std::string& name) {
    if (name.empty()) return IdleReason::NONE;
    if (name == "FINISHED") return IdleReason::FINISHED;
    if (name == "INTERRUPTED") return IdleReason::INTERRUPTED;
    if (name == "CANCELLED") return IdleReason::CANCELLED;
    // "ERROR" and anything a receiver invents
    return IdleReason::ERROR;
}

const char* playerStateName(PlayerState state) {
    switch (state) {
        case PlayerState::UNKNOWN:   return "UNKNOWN";
        case PlayerState::IDLE:      return "IDLE";
        case PlayerState::BUFFERING: return "BUFFERING";
        case PlayerState::PLAYING:   return "PLAYING";
        case PlayerState::PAUSED:    return "PAUSED";
    }
    return "UNKNOWN";
}

const char* idleReasonName(IdleReason reason) {
    switch (reason) {
        case IdleReason::NONE:        return "none";
        case IdleReason::FINISHED:    return "FINISHED";
        case IdleReason::INTERRUPTED: return "INTERRUPTED";
        case IdleReason::CANCELLED:   return "CANCELLED";
        case IdleReason::ERROR:       return "ERROR";
    }
    return "none";
}
