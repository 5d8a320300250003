/**
 * @file LocalPlayer.cpp
 * @brief fork/exec wrapper around the host audio player
 */

#include "LocalPlayer.h"
#include "LogLevel.h"
#include "ScopedPaths.h"

#include <cerrno>
#include <cstring>
#include <sstream>

#include <sys/stat.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

// Exit status of the child when execvp() fails (shell convention)
static constexpr int EXEC_FAILED = 127;

LocalPlayer::LocalPlayer(std::vector<std::string> command)
    : m_command(command.empty() ? defaultCommand() : std::move(command))
{
}

std::vector<std::string> LocalPlayer::defaultCommand() {
    return {"mpg123", "-q"};
}

std::vector<std::string> LocalPlayer::splitCommand(const std::string& line) {
    std::vector<std::string> words;
    std::istringstream in(line);
    std::string word;
    while (in >> word) {
        words.push_back(word);
    }
    return words;
}

bool LocalPlayer::play(const std::string& requested) const {
    // The player child inherits whatever directory a media server moved to
    std::string path = ScopedWorkingDirectory::absoluteFromCaller(requested);

    struct stat st;
    if (::stat(path.c_str(), &st) != 0 || !S_ISREG(st.st_mode)) {
        LOG_ERROR("[Local] Audio file not found: " << requested);
        return false;
    }

    std::vector<std::string> args = m_command;
    args.push_back(path);

    std::vector<char*> argv;
    argv.reserve(args.size() + 1);
    for (auto& a : args) {
        argv.push_back(const_cast<char*>(a.c_str()));
    }
    argv.push_back(nullptr);

    LOG_DEBUG("[Local] Running " << args[0] << " " << path);

    pid_t pid = ::fork();
    if (pid < 0) {
        LOG_ERROR("[Local] fork failed: " << std::strerror(errno));
        return false;
    }

    if (pid == 0) {
        ::execvp(argv[0], argv.data());
        // Only async-signal-safe calls past this point
        ::_exit(EXEC_FAILED);
    }

    int status = 0;
    pid_t waited;
    do {
        waited = ::waitpid(pid, &status, 0);
    } while (waited < 0 && errno == EINTR);

    if (waited < 0) {
        LOG_ERROR("[Local] waitpid failed: " << std::strerror(errno));
        return false;
    }

    if (WIFSIGNALED(status)) {
        LOG_ERROR("[Local] " << args[0] << " killed by signal " << WTERMSIG(status));
        return false;
    }
    if (!WIFEXITED(status)) {
        LOG_ERROR("[Local] " << args[0] << " ended abnormally");
        return false;
    }

    int code = WEXITSTATUS(status);
    if (code == EXEC_FAILED) {
        LOG_ERROR("[Local] Player not available: " << args[0]);
        return false;
    }
    if (code != 0) {
        LOG_ERROR("[Local] " << args[0] << " exited with status " << code);
        return false;
    }
    return true;
}
