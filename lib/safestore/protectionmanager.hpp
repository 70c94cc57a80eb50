/**
 * @file protectionmanager.hpp
 * @brief Applying and querying protection classes on files and directories
 */

#ifndef PROTECTIONMANAGER_HPP
#define PROTECTIONMANAGER_HPP

#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "iprotectionbackend.hpp"

/**
 * @brief Aggregate outcome of a best-effort recursive protection pass
 */
struct ProtectionReport {
  size_t attempted = 0;
  size_t failed = 0;
  std::vector<StorageError> failures;

  bool fullySucceeded() const { return failed == 0; }
};

/**
 * @class ProtectionManager
 * @brief Applies protection classes through a pluggable backend
 *
 * ProtectionManager does not decide how a class is stored; that is the job
 * of the injected IProtectionBackend. Copies share the same backend.
 *
 * Every protected entry is also marked as excluded from backups.
 *
 * @see IProtectionBackend
 * @see XattrProtectionBackend
 * @see NullProtectionBackend
 */
class ProtectionManager {
public:
  /** @brief Class used by protect(path) and protectRecursive() */
  static constexpr ProtectionClass DEFAULT_CLASS =
      ProtectionClass::CompleteUntilFirstUserAuthentication;

  explicit ProtectionManager(std::shared_ptr<const IProtectionBackend> backend);

  /**
   * @brief Pick the xattr backend if it works below probe_dir, else the
   *        null backend
   */
  static std::shared_ptr<const IProtectionBackend>
  detectBackend(const std::filesystem::path &probe_dir);

  /**
   * @brief Manager using the xattr backend
   *
   * The backend degrades to a successful no-op per path on filesystems
   * without user xattrs, so one manager serves every mount.
   */
  static ProtectionManager createDefault();

  /**
   * @brief Set the protection class of a single entry
   *
   * Never creates the path. Re-applying the current class is a no-op
   * success.
   *
   * @return std::nullopt on success, PathNotFound if the entry is missing,
   *         PermissionDenied or IOFailure if the attribute cannot be set
   */
  StorageResult protect(const std::string &path, ProtectionClass cls) const;

  /** @brief protect() with DEFAULT_CLASS */
  StorageResult protect(const std::string &path) const;

  /**
   * @brief Apply DEFAULT_CLASS to path and all of its descendants
   *
   * Best effort: per-entry failures are logged and collected, remaining
   * entries are still processed. Symlinks are neither followed nor
   * protected. Entries added after the call are not covered.
   */
  ProtectionReport protectRecursive(const std::string &path) const;

  /**
   * @brief Read back the class stored on an entry
   * @return std::nullopt if none is recorded or the backend cannot tell
   */
  std::optional<ProtectionClass> protectionClassOf(const std::string &path) const;

  const IProtectionBackend &backend() const { return *m_backend; }

private:
  void recordFailure(ProtectionReport &report, StorageError error) const;

  std::shared_ptr<const IProtectionBackend> m_backend;
};

#endif // PROTECTIONMANAGER_HPP
