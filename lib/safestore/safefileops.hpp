/**
 * @file safefileops.hpp
 * @brief File mutations with defined failure semantics
 */

#ifndef SAFEFILEOPS_HPP
#define SAFEFILEOPS_HPP

#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <vector>

#include "protectionmanager.hpp"
#include "storageerror.hpp"

class PathResolver;

/**
 * @class SafeFileOps
 * @brief Move, rename, create and size operations that never leave the
 *        caller guessing
 *
 * Every mutation either succeeds completely or reports a StorageError. The
 * only partial outcome is a cross-volume move whose source could not be
 * removed after a successful copy; it is reported as CrossVolumeMoveFailed
 * with the duplicate left in place.
 *
 * Created directories, files and move destinations are protected with
 * ProtectionManager::DEFAULT_CLASS. Protection failures are logged and do
 * not fail the operation.
 *
 * No state is kept between calls apart from the collaborators.
 *
 * Example usage:
 * @code
 * SafeFileOps ops(ProtectionManager::createDefault());
 * if (!ops.ensureDirectoryExists(dir)) {
 *     // storage is unusable
 * }
 * if (auto error = ops.moveFilePath(tmp, dir + "/db.sqlite")) {
 *     LOG_ERROR(error->message());
 * }
 * @endcode
 */
class SafeFileOps {
public:
  /** @brief Attempts made by renameFilePathUsingRandomExtension() */
  static constexpr int MAX_RENAME_ATTEMPTS = 8;

  /** @brief Moves taking longer than this are logged */
  static constexpr int SLOW_MOVE_MS = 100;

  /**
   * @brief Rename primitive: returns 0 or an errno value
   *
   * Must not replace an existing destination.
   */
  using RenameFunction =
      std::function<int(const std::string &from, const std::string &to)>;

  /** @brief Recursive removal primitive: returns 0 or an errno value */
  using RemoveFunction = std::function<int(const std::string &path)>;

  using SuffixGenerator = std::function<std::string()>;

  explicit SafeFileOps(ProtectionManager protection);

  /**
   * @brief Create a directory and its missing parents
   *
   * @return false only if creation was attempted and failed (a file in the
   *         way, permission denied). An existing directory is success.
   */
  bool ensureDirectoryExists(const std::string &path) const;

  /**
   * @brief Create an empty file if nothing exists at path
   *
   * The parent directory must exist.
   *
   * @return true if a regular file exists at path afterwards
   */
  bool ensureFileExists(const std::string &path) const;

  /**
   * @brief Move a file or directory to a path that does not exist yet
   *
   * Same volume: one atomic rename. Across volumes: copy, then remove the
   * source.
   *
   * @return std::nullopt on success; PathNotFound (source missing),
   *         DestinationExists, PermissionDenied, IOFailure (copy failed, the
   *         partial destination is removed) or CrossVolumeMoveFailed (data
   *         now exists twice)
   */
  StorageResult moveFilePath(const std::string &old_path,
                             const std::string &new_path) const;

  /**
   * @brief Move path aside to "<path>.<random hex>"
   *
   * @param path Entry to retire
   * @param new_path Receives the new location on success (may be nullptr)
   *
   * @return std::nullopt on success, PathNotFound, RenameExhausted after
   *         MAX_RENAME_ATTEMPTS collisions, or the rename error
   */
  StorageResult renameFilePathUsingRandomExtension(
      const std::string &path, std::string *new_path = nullptr) const;

  /**
   * @brief Remove a file or a whole directory tree
   * @return PathNotFound if nothing exists at path
   */
  StorageResult deleteFile(const std::string &path) const;

  /** @brief deleteFile() that treats a missing path as success */
  StorageResult deleteFileIfExists(const std::string &path) const;

  /**
   * @brief Write data to a new file inside the per-run temp directory
   * @return Path of the written file, std::nullopt on failure (logged)
   */
  std::optional<std::string>
  writeDataToTemporaryFile(PathResolver &resolver, const std::string &data,
                           const std::string &extension = "") const;

  /**
   * @brief Size in bytes of an existing regular file
   *
   * @return std::nullopt ("absent") if nothing exists at path or the entry
   *         is not a regular file; 0 for an existing empty file
   */
  static std::optional<uintmax_t> fileSizeOfPath(const std::string &path);

  /** @brief fileSizeOfPath() for a file:// URL; other schemes are absent */
  static std::optional<uintmax_t> fileSizeOfUrl(const std::string &url);

  /** @brief true if any entry (including a dangling symlink) exists */
  static bool fileOrFolderExists(const std::string &path);

  /**
   * @brief All regular files below dir, sorted
   * @return std::nullopt if dir is missing or cannot be enumerated
   */
  static std::optional<std::vector<std::string>>
  allFilesInDirectoryRecursive(const std::string &dir);

  /** @brief Replace the rename primitive (tests inject EXDEV this way) */
  void setRenameFunction(RenameFunction fn) { m_rename = std::move(fn); }

  /** @brief Replace the removal primitive used by deletes and moves */
  void setRemoveFunction(RemoveFunction fn) { m_remove = std::move(fn); }

  /** @brief Replace the random suffix source used for retiring files */
  void setSuffixGenerator(SuffixGenerator fn) { m_suffix = std::move(fn); }

  /** @brief Default rename: renameat2(RENAME_NOREPLACE) */
  static int renameNoReplace(const std::string &from, const std::string &to);

  /** @brief Default removal: remove_all without following symlinks */
  static int removeTree(const std::string &path);

private:
  StorageResult moveAcrossVolumes(const std::string &old_path,
                                  const std::string &new_path) const;
  void discardStaging(const std::string &staging) const;
  void protectQuietly(const std::string &path) const;

  ProtectionManager m_protection;
  RenameFunction m_rename;
  RemoveFunction m_remove;
  SuffixGenerator m_suffix;
};

#endif // SAFEFILEOPS_HPP
