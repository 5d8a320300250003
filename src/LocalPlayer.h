/**
 * @file LocalPlayer.h
 * @brief Playback on the host through an OS audio utility
 */

#ifndef CASTSPEAK_LOCAL_PLAYER_H
#define CASTSPEAK_LOCAL_PLAYER_H

#include <string>
#include <vector>

class LocalPlayer {
public:
    /**
     * @param command Program and leading arguments; the file path is
     *                appended as the last argument. Empty = default player.
     */
    explicit LocalPlayer(std::vector<std::string> command = {});

    /**
     * @brief Play a file and block until the player exits
     * @return true if the player exited with status 0
     */
    bool play(const std::string& path) const;

    const std::vector<std::string>& command() const { return m_command; }

    // "mpg123 -q"
    static std::vector<std::string> defaultCommand();

    // Split a command line on whitespace ("afplay -v 0.5" -> 3 words)
    static std::vector<std::string> splitCommand(const std::string& line);

private:
    std::vector<std::string> m_command;
};

#endif // CASTSPEAK_LOCAL_PLAYER_H
