/**
 * @file pathguard.cpp
 * @brief Guards against bulk deletion of critical directories
 *
 * Bulk cleanup is only ever meant to run inside the storage roots owned by
 * the application. These checks refuse the obvious catastrophes before any
 * entry is touched.
 */

#include "pathguard.hpp"
#include <cstdlib>
#include <filesystem>
#include <sys/vfs.h>

/**
 * @brief Directories whose contents must never be removed in bulk
 *
 * Only exact matches are blocked. Application directories below /tmp or
 * /home remain eligible.
 */
const std::unordered_set<std::string> PathGuard::CRITICAL_PATHS = {
    "/", "/boot", "/dev", "/etc", "/lib", "/lib64",
    "/proc", "/root", "/run", "/sys", "/usr", "/var",
    "/bin", "/sbin", "/opt", "/srv", "/home", "/tmp"
};

std::string PathGuard::normalize(const std::string& path) {
    if (path.empty()) {
        return path;
    }
    std::string normal = std::filesystem::path(path).lexically_normal().string();
    while (normal.size() > 1 && normal.back() == '/') {
        normal.pop_back();
    }
    return normal;
}

/**
 * @brief Checks whether the contents of a path may be deleted in bulk
 *
 * Checks are performed in order of severity:
 * 1. Empty path (blocked, would resolve relative to the working directory)
 * 2. System paths (blocked)
 * 3. User home directory (blocked)
 * 4. Kernel pseudo filesystems like /proc, /sys (blocked)
 *
 * @param path The filesystem path to check
 *
 * @return Status indicating whether the operation is allowed or why it is
 *         blocked
 *
 * @see getStatusMessage()
 */
PathGuard::Status PathGuard::checkBulkDeletion(const std::string& path) {
    if (path.empty()) {
        return Status::BlockedEmptyPath;
    }

    std::string normal = normalize(path);

    if (isSystemPath(normal)) {
        return Status::BlockedSystemPath;
    }

    if (isUserHome(normal)) {
        return Status::BlockedHome;
    }

    if (isPseudoFilesystem(normal)) {
        return Status::BlockedVirtualFS;
    }

    return Status::Allowed;
}

std::string PathGuard::getStatusMessage(Status status, const std::string& path) {
    switch (status) {
        case Status::Allowed:
            return "Cleanup allowed";
        case Status::BlockedEmptyPath:
            return "Refusing to clean an empty path";
        case Status::BlockedSystemPath:
            return "Cannot clean system directory: " + path;
        case Status::BlockedHome:
            return "Cannot clean your home directory: " + path;
        case Status::BlockedVirtualFS:
            return "Cannot clean virtual/system filesystem: " + path;
        default:
            return "Unknown status";
    }
}

bool PathGuard::isSystemPath(const std::string& path) {
    return CRITICAL_PATHS.count(normalize(path)) > 0;
}

/**
 * @brief Checks if a path is the user's home directory
 *
 * @return true if the path matches $HOME after normalisation, false
 *         otherwise or when HOME is not set
 */
bool PathGuard::isUserHome(const std::string& path) {
    const char* home = std::getenv("HOME");
    return home && *home && normalize(path) == normalize(home);
}

/**
 * @brief Checks if a path resides on a kernel pseudo filesystem
 *
 * Uses statfs() and compares the filesystem magic against procfs, sysfs,
 * devpts, securityfs and the cgroup filesystems. tmpfs is not included
 * because temporary roots commonly live on it.
 *
 * @return true if the path is on a pseudo filesystem. A path that does not
 *         exist (statfs fails) is not considered pseudo.
 *
 * @note Magic numbers from /usr/include/linux/magic.h
 */
bool PathGuard::isPseudoFilesystem(const std::string& path) {
    struct statfs fs_info;

    if (statfs(path.c_str(), &fs_info) != 0) {
        return false;
    }

    const long PSEUDO_FS[] = {
        0x9fa0,       // PROC_SUPER_MAGIC (procfs)
        0x62656572,   // SYSFS_MAGIC (sysfs)
        0x1cd1,       // DEVPTS_SUPER_MAGIC (devpts)
        0x73636673,   // SECURITYFS_MAGIC (securityfs)
        0x27e0eb,     // CGROUP_SUPER_MAGIC (cgroup)
        0x63677270,   // CGROUP2_SUPER_MAGIC (cgroup2)
    };

    for (auto magic : PSEUDO_FS) {
        if (static_cast<long>(fs_info.f_type) == magic) {
            return true;
        }
    }

    return false;
}
