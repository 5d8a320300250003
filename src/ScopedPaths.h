/**
 * @file ScopedPaths.h
 * @brief Scoped working directory change and temporary directory
 */

#ifndef CASTSPEAK_SCOPED_PATHS_H
#define CASTSPEAK_SCOPED_PATHS_H

#include <string>

/**
 * @brief chdir() into a directory for the lifetime of the object
 *
 * The previous working directory is restored on destruction or restore().
 * Restore failures are logged, never thrown.
 */
class ScopedWorkingDirectory {
public:
    explicit ScopedWorkingDirectory(const std::string& directory);
    ~ScopedWorkingDirectory();

    ScopedWorkingDirectory(const ScopedWorkingDirectory&) = delete;
    ScopedWorkingDirectory& operator=(const ScopedWorkingDirectory&) = delete;

    // True if the chdir() into the target succeeded
    bool ok() const { return m_changed; }

    void restore();

    /**
     * @brief Working directory as it was before any live scope changed it
     *
     * Equal to the current directory when no scope is active. Relative
     * user paths are resolved against this, not against a serve root.
     */
    static std::string callerDirectory();

    // Absolute form of path, resolved against callerDirectory()
    static std::string absoluteFromCaller(const std::string& path);

private:
    std::string m_previous;
    bool m_changed = false;
};

/**
 * @brief Private temporary directory removed (recursively) on destruction
 */
class ScopedTempDir {
public:
    explicit ScopedTempDir(const std::string& prefix = "castspeak");
    ~ScopedTempDir();

    ScopedTempDir(const ScopedTempDir&) = delete;
    ScopedTempDir& operator=(const ScopedTempDir&) = delete;

    bool ok() const { return !m_path.empty(); }
    const std::string& path() const { return m_path; }

    /**
     * @brief Copy a file into the directory, keeping its file name
     * @return Path of the copy, or empty on failure
     */
    std::string stage(const std::string& source) const;

    void remove();

private:
    std::string m_path;
};

#endif // CASTSPEAK_SCOPED_PATHS_H
