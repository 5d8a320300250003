/**
 * @file ScopedPaths.cpp
 * @brief Scoped working directory and temporary directory
 */

#include "ScopedPaths.h"
#include "LogLevel.h"

#include <unistd.h>

#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <filesystem>
#include <mutex>
#include <system_error>
#include <vector>

namespace fs = std::filesystem;

namespace {

// Live scopes share one process-wide working directory
std::mutex g_dirMutex;
int g_dirDepth = 0;
std::string g_callerDir;

} // namespace

// ============================================
// ScopedWorkingDirectory
// ============================================

ScopedWorkingDirectory::ScopedWorkingDirectory(const std::string& directory) {
    std::lock_guard<std::mutex> lock(g_dirMutex);
    std::error_code ec;
    fs::path cwd = fs::current_path(ec);
    if (ec) {
        LOG_ERROR("[Dir] Cannot read working directory: " << ec.message());
        return;
    }
    m_previous = cwd.string();

    if (::chdir(directory.c_str()) != 0) {
        LOG_ERROR("[Dir] chdir(" << directory << ") failed: " << strerror(errno));
        return;
    }
    m_changed = true;
    if (g_dirDepth++ == 0) {
        g_callerDir = m_previous;
    }
    LOG_DEBUG("[Dir] Working directory: " << directory);
}

ScopedWorkingDirectory::~ScopedWorkingDirectory() {
    restore();
}

void ScopedWorkingDirectory::restore() {
    std::lock_guard<std::mutex> lock(g_dirMutex);
    if (!m_changed) return;
    m_changed = false;
    g_dirDepth--;

    if (::chdir(m_previous.c_str()) != 0) {
        LOG_WARN("[Dir] Failed to restore working directory " << m_previous
                 << ": " << strerror(errno));
        return;
    }
    LOG_DEBUG("[Dir] Working directory restored: " << m_previous);
}

std::string ScopedWorkingDirectory::callerDirectory() {
    std::lock_guard<std::mutex> lock(g_dirMutex);
    if (g_dirDepth > 0) return g_callerDir;

    std::error_code ec;
    fs::path cwd = fs::current_path(ec);
    return ec ? std::string() : cwd.string();
}

std::string ScopedWorkingDirectory::absoluteFromCaller(const std::string& path) {
    fs::path p(path);
    if (path.empty() || p.is_absolute()) return path;

    std::string base = callerDirectory();
    if (base.empty()) return path;
    return (fs::path(base) / p).lexically_normal().string();
}

// ============================================
// ScopedTempDir
// ============================================

ScopedTempDir::ScopedTempDir(const std::string& prefix) {
    std::error_code ec;
    fs::path base = fs::temp_directory_path(ec);
    if (ec) base = "/tmp";

    std::string templ = (base / (prefix + "-XXXXXX")).string();
    std::vector<char> buf(templ.begin(), templ.end());
    buf.push_back('\0');

    if (!::mkdtemp(buf.data())) {
        LOG_ERROR("[Dir] mkdtemp(" << templ << ") failed: " << strerror(errno));
        return;
    }
    m_path = buf.data();
    LOG_DEBUG("[Dir] Created " << m_path);
}

ScopedTempDir::~ScopedTempDir() {
    remove();
}

std::string ScopedTempDir::stage(const std::string& source) const {
    if (m_path.empty()) return "";

    fs::path target = fs::path(m_path) / fs::path(source).filename();
    std::error_code ec;
    fs::copy_file(source, target, fs::copy_options::overwrite_existing, ec);
    if (ec) {
        LOG_ERROR("[Dir] Cannot stage " << source << ": " << ec.message());
        return "";
    }
    return target.string();
}

void ScopedTempDir::remove() {
    if (m_path.empty()) return;

    std::error_code ec;
    fs::remove_all(m_path, ec);
    if (ec) {
        LOG_WARN("[Dir] Failed to remove " << m_path << ": " << ec.message());
    } else {
        LOG_DEBUG("[Dir] Removed " << m_path);
    }
    m_path.clear();
}
