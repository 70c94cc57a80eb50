#ifndef DIRECTORYJANITOR_HPP
#define DIRECTORYJANITOR_HPP

#include <optional>
#include <string>
#include <sys/types.h>
#include <vector>

#include "storageerror.hpp"

class PathResolver;

/**
 * @brief Aggregate outcome of a best-effort cleanup
 */
struct CleanupReport {
    size_t removed = 0;
    size_t failed = 0;
    std::vector<StorageError> failures;

    bool fullySucceeded() const { return failed == 0; }
};

/**
 * @brief Bulk cleanup of directory contents and abandoned temp directories
 *
 * All operations are best effort: a failure on one entry is logged and
 * recorded in the report, the remaining entries are still processed.
 * Nothing here throws.
 *
 * Lifecycle of a per-run temp directory:
 * created (current run) → stale (owner gone) → purged.
 * Only stale directories are ever removed.
 */
class DirectoryJanitor {
public:
    /**
     * @brief Delete every child of path, keep path itself
     *
     * A missing path is treated as already empty. Paths rejected by
     * PathGuard are not touched and reported as PermissionDenied.
     */
    static CleanupReport deleteContentsOfDirectory(const std::string& path);

    /**
     * @brief Remove temp directories left behind by earlier runs
     *
     * Scans the resolver's after-first-auth temp base. Candidates are
     * directories named "<temp_prefix><run id>". The current run's
     * directory is skipped, and so is any directory whose run id names a
     * different process that is still alive.
     */
    static CleanupReport clearOldTemporaryDirectories(PathResolver& resolver);

    /** @brief clearOldTemporaryDirectories() on PathResolver::shared() */
    static CleanupReport clearOldTemporaryDirectories();

    /**
     * @brief Extract the owning pid from a run directory name
     * @return std::nullopt if the name does not start with prefix followed
     *         by "<pid>-"
     */
    static std::optional<pid_t> ownerPid(const std::string& name,
                                         const std::string& prefix);

    /**
     * @brief Decide whether a temp base entry may be purged
     */
    static bool isStaleTemporaryDirectory(const std::string& name,
                                          const std::string& prefix,
                                          const std::string& current_name);

private:
    static bool isProcessAlive(pid_t pid);
};

#endif // DIRECTORYJANITOR_HPP
