/**
 * @file safefileops.cpp
 * @brief Implementation of move, rename, create and size operations
 *
 * Existence checks use lstat semantics (symlink_status) so that a dangling
 * symlink counts as an occupied path and is never silently replaced.
 */

#include "safefileops.hpp"
#include "fileurl.hpp"
#include "logger.hpp"
#include "pathresolver.hpp"
#include "utils.hpp"
#include <algorithm>
#include <cerrno>
#include <chrono>
#include <cstdio>
#include <fcntl.h>
#include <filesystem>
#include <sys/stat.h>
#include <system_error>
#include <unistd.h>

namespace fs = std::filesystem;

namespace {

bool entryExists(const std::string &path) {
  std::error_code ec;
  return fs::exists(fs::symlink_status(path, ec));
}

} // namespace

SafeFileOps::SafeFileOps(ProtectionManager protection)
    : m_protection(std::move(protection)), m_rename(&SafeFileOps::renameNoReplace),
      m_remove(&SafeFileOps::removeTree), m_suffix([] { return randomHexString(16); }) {}

/**
 * @brief Atomic rename that refuses to replace an existing destination
 *
 * Uses renameat2() with RENAME_NOREPLACE. Filesystems or kernels without
 * support (EINVAL, ENOSYS) fall back to an existence check followed by
 * rename(), which leaves a small window for a concurrent creator.
 *
 * @return 0 on success, otherwise the errno value (EEXIST when the
 *         destination is taken, EXDEV across volumes)
 */
int SafeFileOps::renameNoReplace(const std::string &from, const std::string &to) {
  if (renameat2(AT_FDCWD, from.c_str(), AT_FDCWD, to.c_str(),
                RENAME_NOREPLACE) == 0) {
    return 0;
  }
  if (errno != EINVAL && errno != ENOSYS) {
    return errno;
  }

  if (entryExists(to)) {
    return EEXIST;
  }
  if (std::rename(from.c_str(), to.c_str()) == 0) {
    return 0;
  }
  return errno;
}

int SafeFileOps::removeTree(const std::string &path) {
  std::error_code ec;
  fs::remove_all(path, ec);
  return ec ? ec.value() : 0;
}

void SafeFileOps::protectQuietly(const std::string &path) const {
  if (auto error = m_protection.protect(path)) {
    LOG_WARN("Could not protect " + path + ": " + error->message());
  }
}

bool SafeFileOps::ensureDirectoryExists(const std::string &path) const {
  std::error_code ec;
  auto status = fs::status(path, ec);

  if (fs::is_directory(status)) {
    protectQuietly(path);
    return true;
  }
  if (fs::exists(status)) {
    LOG_ERROR("Cannot create directory, a file is in the way: " + path);
    return false;
  }

  fs::create_directories(path, ec);
  if (ec || !fs::is_directory(path, ec)) {
    LOG_ERROR("Failed to create directory " + path + ": " + ec.message());
    return false;
  }

  protectQuietly(path);
  return true;
}

/**
 * @brief Creates an empty file unless one already exists
 *
 * Creation uses O_CREAT | O_EXCL, so a file created concurrently by another
 * process is accepted rather than truncated.
 *
 * @param path The file to create
 *
 * @return true if a regular file exists at path when the call returns,
 *         false if a directory or other entry occupies it or creation fails
 */
bool SafeFileOps::ensureFileExists(const std::string &path) const {
  std::error_code ec;
  auto status = fs::status(path, ec);

  if (fs::is_regular_file(status)) {
    protectQuietly(path);
    return true;
  }
  if (fs::exists(status)) {
    LOG_ERROR("Cannot create file, another entry is in the way: " + path);
    return false;
  }

  int fd = open(path.c_str(), O_WRONLY | O_CREAT | O_EXCL | O_CLOEXEC, 0644);
  if (fd < 0) {
    int err = errno;
    if (err == EEXIST && fs::is_regular_file(path, ec)) {
      protectQuietly(path);
      return true;
    }
    LOG_ERROR("Failed to create file " + path + ": " +
              makeErrnoError(err, path).detail);
    return false;
  }
  close(fd);

  protectQuietly(path);
  return true;
}

/**
 * @brief Moves a file or directory without ever overwriting
 *
 * Steps:
 * 1. Source must exist (PathNotFound otherwise)
 * 2. Destination must not exist (DestinationExists otherwise)
 * 3. Atomic rename; EXDEV switches to copy-then-delete
 * 4. The destination is re-protected with the default class
 *
 * Moves slower than SLOW_MOVE_MS are logged as warnings.
 *
 * @param old_path Current location
 * @param new_path Target location, must not exist
 *
 * @return std::nullopt on success or the first error encountered
 *
 * @see moveAcrossVolumes()
 */
StorageResult SafeFileOps::moveFilePath(const std::string &old_path,
                                        const std::string &new_path) const {
  if (!entryExists(old_path)) {
    LOG_WARN("Cannot move missing file " + old_path);
    return StorageError{StorageErrc::PathNotFound, old_path, ""};
  }
  if (entryExists(new_path)) {
    LOG_WARN("Cannot move " + old_path + " to " + new_path +
             ", destination already exists");
    return StorageError{StorageErrc::DestinationExists, new_path, ""};
  }

  auto start = std::chrono::steady_clock::now();

  int err = m_rename(old_path, new_path);
  if (err == EXDEV) {
    LOG_DEBUG("Cross-volume move " + old_path + " -> " + new_path);
    if (auto error = moveAcrossVolumes(old_path, new_path)) {
      return error;
    }
  } else if (err != 0) {
    StorageError error = makeErrnoError(err, old_path);
    if (error.kind == StorageErrc::DestinationExists) {
      error.path = new_path;
    }
    LOG_WARN("Move " + old_path + " -> " + new_path + " failed: " +
             error.message());
    return error;
  }

  auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
      std::chrono::steady_clock::now() - start);
  if (elapsed.count() > SLOW_MOVE_MS) {
    LOG_WARN("Slow file move (" + std::to_string(elapsed.count()) + " ms): " +
             old_path + " -> " + new_path);
  }

  protectQuietly(new_path);
  return std::nullopt;
}

/**
 * @brief Copy-then-delete fallback for moves between filesystems
 *
 * The source is copied into a uniquely named sibling of new_path, which is
 * then renamed onto new_path without replacement. A destination appearing
 * during the copy is therefore never overwritten or removed: the move
 * reports DestinationExists and only the sibling is cleaned up. The source
 * is untouched by any failure up to that point. A failed source removal
 * after the copy is in place is reported as CrossVolumeMoveFailed and both
 * copies remain.
 */
StorageResult SafeFileOps::moveAcrossVolumes(const std::string &old_path,
                                             const std::string &new_path) const {
  std::string staging;
  for (int attempt = 0; attempt < MAX_RENAME_ATTEMPTS; ++attempt) {
    std::string candidate = new_path + "." + randomHexString(16) + ".partial";
    if (!entryExists(candidate)) {
      staging = candidate;
      break;
    }
  }
  if (staging.empty()) {
    LOG_ERROR("No free staging name next to " + new_path);
    return StorageError{StorageErrc::RenameExhausted, new_path, ""};
  }

  std::error_code ec;
  fs::copy(old_path, staging,
           fs::copy_options::recursive | fs::copy_options::copy_symlinks, ec);
  if (ec) {
    StorageError error = makeErrnoError(ec.value(), new_path);
    LOG_ERROR("Cross-volume copy " + old_path + " -> " + new_path +
              " failed: " + ec.message());
    // file_exists means another process took the staging name first
    if (ec != std::errc::file_exists) {
      discardStaging(staging);
    }
    return error;
  }

  int err = renameNoReplace(staging, new_path);
  if (err != 0) {
    StorageError error = makeErrnoError(err, new_path);
    LOG_ERROR("Could not place copy of " + old_path + " at " + new_path +
              ": " + error.message());
    discardStaging(staging);
    return error;
  }

  err = m_remove(old_path);
  if (err != 0) {
    std::string reason = std::error_code(err, std::generic_category()).message();
    LOG_ERROR("Copied " + old_path + " to " + new_path +
              " but could not remove the source: " + reason);
    return StorageError{StorageErrc::CrossVolumeMoveFailed, old_path, reason};
  }
  return std::nullopt;
}

void SafeFileOps::discardStaging(const std::string &staging) const {
  int err = m_remove(staging);
  if (err != 0) {
    LOG_WARN("Could not remove partial copy " + staging + ": " +
             std::error_code(err, std::generic_category()).message());
  }
}

StorageResult SafeFileOps::renameFilePathUsingRandomExtension(
    const std::string &path, std::string *new_path) const {
  if (!entryExists(path)) {
    return StorageError{StorageErrc::PathNotFound, path, ""};
  }

  for (int attempt = 0; attempt < MAX_RENAME_ATTEMPTS; ++attempt) {
    std::string candidate = path + "." + m_suffix();

    int err = m_rename(path, candidate);
    if (err == 0) {
      LOG_INFO("Renamed " + path + " to " + candidate);
      if (new_path) {
        *new_path = candidate;
      }
      return std::nullopt;
    }
    if (err != EEXIST && err != ENOTEMPTY) {
      StorageError error = makeErrnoError(err, path);
      LOG_ERROR("Could not rename " + path + ": " + error.message());
      return error;
    }
    LOG_DEBUG("Random name collision for " + candidate);
  }

  LOG_ERROR("Gave up renaming " + path + " after " +
            std::to_string(MAX_RENAME_ATTEMPTS) + " collisions");
  return StorageError{StorageErrc::RenameExhausted, path, ""};
}

StorageResult SafeFileOps::deleteFile(const std::string &path) const {
  if (!entryExists(path)) {
    return StorageError{StorageErrc::PathNotFound, path, ""};
  }

  int err = m_remove(path);
  if (err != 0) {
    StorageError error = makeErrnoError(err, path);
    LOG_ERROR("Failed to delete " + path + ": " + error.message());
    return error;
  }
  return std::nullopt;
}

StorageResult SafeFileOps::deleteFileIfExists(const std::string &path) const {
  if (!entryExists(path)) {
    return std::nullopt;
  }
  return deleteFile(path);
}

std::optional<std::string>
SafeFileOps::writeDataToTemporaryFile(PathResolver &resolver,
                                      const std::string &data,
                                      const std::string &extension) const {
  std::string path;
  try {
    path = resolver.temporaryFilePath(extension);
  } catch (const StorageException &e) {
    LOG_ERROR(std::string("No temporary directory: ") + e.what());
    return std::nullopt;
  }

  int fd = open(path.c_str(), O_WRONLY | O_CREAT | O_EXCL | O_CLOEXEC, 0600);
  if (fd < 0) {
    LOG_ERROR("Cannot create temporary file " + path + ": " +
              makeErrnoError(errno, path).detail);
    return std::nullopt;
  }

  const char *cursor = data.data();
  size_t remaining = data.size();
  while (remaining > 0) {
    ssize_t written = write(fd, cursor, remaining);
    if (written < 0) {
      if (errno == EINTR)
        continue;
      LOG_ERROR("Write to " + path + " failed: " +
                makeErrnoError(errno, path).detail);
      close(fd);
      unlink(path.c_str());
      return std::nullopt;
    }
    cursor += written;
    remaining -= static_cast<size_t>(written);
  }

  if (close(fd) != 0) {
    LOG_ERROR("Closing " + path + " failed: " +
              makeErrnoError(errno, path).detail);
    unlink(path.c_str());
    return std::nullopt;
  }

  protectQuietly(path);
  return path;
}

std::optional<uintmax_t> SafeFileOps::fileSizeOfPath(const std::string &path) {
  std::error_code ec;
  if (!fs::is_regular_file(path, ec)) {
    return std::nullopt;
  }
  uintmax_t size = fs::file_size(path, ec);
  if (ec) {
    return std::nullopt;
  }
  return size;
}

std::optional<uintmax_t> SafeFileOps::fileSizeOfUrl(const std::string &url) {
  auto path = FileUrl::toPath(url);
  if (!path) {
    LOG_DEBUG("Not a local file URL: " + url);
    return std::nullopt;
  }
  return fileSizeOfPath(*path);
}

bool SafeFileOps::fileOrFolderExists(const std::string &path) {
  return entryExists(path);
}

std::optional<std::vector<std::string>>
SafeFileOps::allFilesInDirectoryRecursive(const std::string &dir) {
  std::error_code ec;
  if (!fs::is_directory(dir, ec)) {
    return std::nullopt;
  }

  std::vector<std::string> files;
  fs::recursive_directory_iterator it(dir, ec);
  if (ec) {
    LOG_WARN("Cannot enumerate " + dir + ": " + ec.message());
    return std::nullopt;
  }

  while (it != fs::recursive_directory_iterator()) {
    std::error_code entry_ec;
    if (it->is_regular_file(entry_ec)) {
      files.push_back(it->path().string());
    }
    it.increment(ec);
    if (ec) {
      LOG_WARN("Enumeration of " + dir + " stopped early: " + ec.message());
      return std::nullopt;
    }
  }

  std::sort(files.begin(), files.end());
  return files;
}
