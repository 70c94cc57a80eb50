/**
 * @file directoryjanitor.cpp
 * @brief Best-effort directory cleanup and stale temp directory purging
 */

#include "directoryjanitor.hpp"
#include "logger.hpp"
#include "pathguard.hpp"
#include "pathresolver.hpp"
#include <cerrno>
#include <csignal>
#include <cstdlib>
#include <filesystem>
#include <unistd.h>

namespace fs = std::filesystem;

namespace {

void recordFailure(CleanupReport& report, StorageError error) {
    LOG_WARN("Cleanup failed: " + error.message());
    report.failed++;
    report.failures.push_back(std::move(error));
}

} // namespace

/**
 * @brief Deletes all children of a directory while keeping the directory
 *
 * The child list is collected before anything is removed so that removal
 * does not disturb the enumeration. Each child (file, symlink or whole
 * subtree) is removed independently.
 *
 * @param path The directory to empty
 *
 * @return CleanupReport with the number of children removed and the
 *         failures encountered. A missing directory yields an empty,
 *         successful report.
 *
 * @see PathGuard::checkBulkDeletion()
 */
CleanupReport DirectoryJanitor::deleteContentsOfDirectory(const std::string& path) {
    CleanupReport report;

    auto guard = PathGuard::checkBulkDeletion(path);
    if (guard != PathGuard::Status::Allowed) {
        recordFailure(report, StorageError{StorageErrc::PermissionDenied, path,
                                           PathGuard::getStatusMessage(guard, path)});
        return report;
    }

    std::error_code ec;
    auto status = fs::symlink_status(path, ec);
    if (!fs::exists(status)) {
        return report;
    }
    if (!fs::is_directory(status)) {
        recordFailure(report, StorageError{StorageErrc::IOFailure, path,
                                           "not a directory"});
        return report;
    }

    std::vector<fs::path> children;
    fs::directory_iterator it(path, ec);
    if (ec) {
        recordFailure(report, makeErrnoError(ec.value(), path));
        return report;
    }
    while (it != fs::directory_iterator()) {
        children.push_back(it->path());
        it.increment(ec);
        if (ec) {
            recordFailure(report, makeErrnoError(ec.value(), path));
            break;
        }
    }

    for (const auto& child : children) {
        std::error_code remove_ec;
        fs::remove_all(child, remove_ec);
        if (remove_ec) {
            recordFailure(report, makeErrnoError(remove_ec.value(), child.string()));
        } else {
            report.removed++;
        }
    }

    LOG_DEBUG("Removed " + std::to_string(report.removed) + " entries from " + path);
    return report;
}

std::optional<pid_t> DirectoryJanitor::ownerPid(const std::string& name,
                                                const std::string& prefix) {
    if (name.compare(0, prefix.size(), prefix) != 0) {
        return std::nullopt;
    }

    std::string run_id = name.substr(prefix.size());
    auto dash = run_id.find('-');
    if (dash == std::string::npos || dash == 0) {
        return std::nullopt;
    }

    std::string digits = run_id.substr(0, dash);
    if (digits.find_first_not_of("0123456789") != std::string::npos ||
        digits.size() > 10) {
        return std::nullopt;
    }

    long long pid = std::strtoll(digits.c_str(), nullptr, 10);
    if (pid <= 0 || pid > 0x7fffffff) {
        return std::nullopt;
    }
    return static_cast<pid_t>(pid);
}

bool DirectoryJanitor::isProcessAlive(pid_t pid) {
    // EPERM: the process exists but belongs to someone else
    return kill(pid, 0) == 0 || errno == EPERM;
}

/**
 * @brief Decides whether a temp base entry is a stale run directory
 *
 * An entry is stale when:
 * 1. its name starts with the run prefix,
 * 2. it is not the current run's directory, and
 * 3. it does not name another live process.
 *
 * Directories created by this process under a different run id (an
 * earlier resolver instance) are stale as well. Names with the prefix but
 * without a pid belong to no live process and are stale.
 *
 * @note Entries without the prefix are never eligible
 */
bool DirectoryJanitor::isStaleTemporaryDirectory(const std::string& name,
                                                 const std::string& prefix,
                                                 const std::string& current_name) {
    if (prefix.empty() || name.compare(0, prefix.size(), prefix) != 0) {
        return false;
    }
    if (name == current_name) {
        return false;
    }

    auto pid = ownerPid(name, prefix);
    if (pid && *pid != getpid() && isProcessAlive(*pid)) {
        return false;
    }
    return true;
}

CleanupReport DirectoryJanitor::clearOldTemporaryDirectories(PathResolver& resolver) {
    CleanupReport report;

    std::string base;
    try {
        base = resolver.temporaryDirectoryAccessibleAfterFirstAuth();
    } catch (const StorageException& e) {
        recordFailure(report, e.error());
        return report;
    }

    const std::string& prefix = resolver.config().temp_prefix;
    const std::string current = resolver.temporaryDirectoryName();

    std::error_code ec;
    fs::directory_iterator it(base, ec);
    if (ec) {
        if (ec != std::errc::no_such_file_or_directory) {
            recordFailure(report, makeErrnoError(ec.value(), base));
        }
        return report;
    }

    std::vector<fs::path> stale;
    while (it != fs::directory_iterator()) {
        std::string name = it->path().filename().string();
        std::error_code type_ec;
        if (it->is_directory(type_ec) && !it->is_symlink(type_ec) &&
            isStaleTemporaryDirectory(name, prefix, current)) {
            stale.push_back(it->path());
        }
        it.increment(ec);
        if (ec) {
            recordFailure(report, makeErrnoError(ec.value(), base));
            break;
        }
    }

    for (const auto& dir : stale) {
        std::error_code remove_ec;
        fs::remove_all(dir, remove_ec);
        if (remove_ec) {
            recordFailure(report, makeErrnoError(remove_ec.value(), dir.string()));
        } else {
            LOG_DEBUG("Purged stale temporary directory " + dir.string());
            report.removed++;
        }
    }

    if (report.removed > 0) {
        LOG_INFO("Purged " + std::to_string(report.removed) +
                 " stale temporary directories from " + base);
    }
    return report;
}

CleanupReport DirectoryJanitor::clearOldTemporaryDirectories() {
    try {
        return clearOldTemporaryDirectories(PathResolver::shared());
    } catch (const std::exception& e) {
        CleanupReport report;
        recordFailure(report, StorageError{StorageErrc::DirectoryUnavailable, "",
                                           e.what()});
        return report;
    }
}
