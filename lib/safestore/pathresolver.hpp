/**
 * @file pathresolver.hpp
 * @brief Stable storage root directories per lifecycle class
 */

#ifndef PATHRESOLVER_HPP
#define PATHRESOLVER_HPP

#include <filesystem>
#include <map>
#include <mutex>
#include <string>

#include "protectionmanager.hpp"
#include "storageconfig.hpp"

/**
 * @brief Lifecycle classes of storage roots
 */
enum class StorageRoot {
  Documents,
  Library,
  SharedData,
  Caches,
  TemporaryAfterFirstAuth,
  TemporaryLocked
};

/**
 * @class PathResolver
 * @brief Resolves and creates the storage roots of one application
 *
 * Linux layout:
 * - Documents: $XDG_DATA_HOME/<app_id>/Documents
 * - Library: $XDG_DATA_HOME/<app_id>/Library
 * - SharedData: $XDG_DATA_HOME/<group_id>
 * - Caches: $XDG_CACHE_HOME/<app_id>
 * - TemporaryAfterFirstAuth: <system temp>/<app_id>
 * - TemporaryLocked: <TemporaryAfterFirstAuth>/<temp_prefix><run id>
 *
 * Each root is created (and protected with its default class) on first
 * resolution and cached, so later calls return the identical string. A
 * cached root that was removed in the meantime is recreated in place.
 * The run id ("<pid>-<32 hex>") is generated once per resolver;
 * DirectoryJanitor relies on that format.
 *
 * Resolution failures throw StorageException(DirectoryUnavailable); they are
 * not recoverable for the affected root.
 *
 * Thread-safe: the cache is guarded by a mutex.
 */
class PathResolver {
public:
  PathResolver(StorageConfig config, ProtectionManager protection);

  PathResolver(const PathResolver &) = delete;
  PathResolver &operator=(const PathResolver &) = delete;

  /**
   * @brief Process-wide resolver
   *
   * Built on first use from StorageConfig::loadDefault() and
   * ProtectionManager::createDefault() unless configureShared() ran first.
   */
  static PathResolver &shared();

  /**
   * @brief Replace the process-wide resolver
   *
   * Must be called before any caller holds on to shared(); intended for
   * application startup.
   */
  static void configureShared(StorageConfig config,
                              ProtectionManager protection);

  /** @throws StorageException with DirectoryUnavailable */
  std::string resolve(StorageRoot root);

  std::string temporaryDirectory() { return resolve(StorageRoot::TemporaryLocked); }
  std::string temporaryDirectoryAccessibleAfterFirstAuth() {
    return resolve(StorageRoot::TemporaryAfterFirstAuth);
  }
  std::string appDocumentDirectoryPath() { return resolve(StorageRoot::Documents); }
  std::string appLibraryDirectoryPath() { return resolve(StorageRoot::Library); }
  std::string appSharedDataDirectoryPath() { return resolve(StorageRoot::SharedData); }
  std::string appSharedDataDirectoryURL();
  std::string cachesDirectoryPath() { return resolve(StorageRoot::Caches); }

  /**
   * @brief Unique, not yet existing file path inside temporaryDirectory()
   * @param extension Optional extension without the leading dot
   */
  std::string temporaryFilePath(const std::string &extension = "");

  const std::string &runIdentifier() const { return m_runId; }

  /** @brief Name of this run's directory inside the temp base */
  std::string temporaryDirectoryName() const {
    return m_config.temp_prefix + m_runId;
  }

  const StorageConfig &config() const { return m_config; }
  const ProtectionManager &protection() const { return m_protection; }

  static std::string rootName(StorageRoot root);
  static ProtectionClass defaultProtectionFor(StorageRoot root);

private:
  std::filesystem::path locate(StorageRoot root);
  void createRoot(StorageRoot root, const std::filesystem::path &path);
  std::filesystem::path dataHome() const;
  std::filesystem::path cacheHome() const;
  std::filesystem::path tempBase() const;
  std::filesystem::path homeDirectory() const;
  StorageException unavailable(StorageRoot root, const std::string &detail) const;

  StorageConfig m_config;
  ProtectionManager m_protection;
  std::string m_runId;
  std::map<StorageRoot, std::string> m_cache;
  std::mutex m_mutex;
};

#endif // PATHRESOLVER_HPP
