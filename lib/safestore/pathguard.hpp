#ifndef PATHGUARD_HPP
#define PATHGUARD_HPP

#include <string>
#include <unordered_set>

/**
 * @brief Safety checks for bulk destructive operations
 *
 * DirectoryJanitor consults PathGuard before emptying a directory so that a
 * misconfigured root (empty HOME, "/" as temp base) can never wipe system
 * or user data.
 */
class PathGuard {
public:
    enum class Status {
        Allowed,
        BlockedEmptyPath,
        BlockedSystemPath,
        BlockedHome,
        BlockedVirtualFS
    };

    /**
     * @brief Check whether the contents of a path may be removed in bulk
     * @param path Path to check (normalised before comparison)
     * @return Status indicating if/why the operation is blocked
     */
    static Status checkBulkDeletion(const std::string& path);

    /**
     * @brief Get human-readable message for a guard status
     */
    static std::string getStatusMessage(Status status, const std::string& path);

    /**
     * @brief Check if path is a system directory
     */
    static bool isSystemPath(const std::string& path);

    /**
     * @brief Check if path is the user's home directory
     */
    static bool isUserHome(const std::string& path);

    /**
     * @brief Check if path is on a kernel pseudo filesystem (proc, sys, ...)
     */
    static bool isPseudoFilesystem(const std::string& path);

    /**
     * @brief Lexically normalise a path and drop any trailing separator
     */
    static std::string normalize(const std::string& path);

private:
    static const std::unordered_set<std::string> CRITICAL_PATHS;
};

#endif // PATHGUARD_HPP
