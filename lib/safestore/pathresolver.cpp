/**
 * @file pathresolver.cpp
 * @brief Resolution, creation and caching of storage roots
 */

#include "pathresolver.hpp"
#include "utils.hpp"
#include "fileurl.hpp"
#include "logger.hpp"
#include <cstdlib>
#include <memory>
#include <pwd.h>
#include <unistd.h>

namespace fs = std::filesystem;

namespace {

std::mutex g_sharedMutex;
std::unique_ptr<PathResolver> g_shared;

/**
 * @brief Reads an XDG base directory variable
 *
 * XDG base directories must be absolute; relative values are ignored
 * like unset ones.
 */
fs::path xdgDirectory(const char *variable) {
  const char *value = std::getenv(variable);
  if (value && *value && fs::path(value).is_absolute()) {
    return fs::path(value);
  }
  return {};
}

} // namespace

PathResolver::PathResolver(StorageConfig config, ProtectionManager protection)
    : m_config(std::move(config)), m_protection(std::move(protection)),
      m_runId(std::to_string(getpid()) + "-" + randomHexString(16)) {}

PathResolver &PathResolver::shared() {
  std::lock_guard<std::mutex> lock(g_sharedMutex);
  if (!g_shared) {
    g_shared = std::make_unique<PathResolver>(StorageConfig::loadDefault(),
                                              ProtectionManager::createDefault());
  }
  return *g_shared;
}

void PathResolver::configureShared(StorageConfig config,
                                   ProtectionManager protection) {
  std::lock_guard<std::mutex> lock(g_sharedMutex);
  g_shared = std::make_unique<PathResolver>(std::move(config),
                                            std::move(protection));
}

std::string PathResolver::rootName(StorageRoot root) {
  switch (root) {
  case StorageRoot::Documents:
    return "documents";
  case StorageRoot::Library:
    return "library";
  case StorageRoot::SharedData:
    return "shared-data";
  case StorageRoot::Caches:
    return "caches";
  case StorageRoot::TemporaryAfterFirstAuth:
    return "temp-after-first-auth";
  case StorageRoot::TemporaryLocked:
    return "temp";
  }
  return "unknown";
}

ProtectionClass PathResolver::defaultProtectionFor(StorageRoot root) {
  if (root == StorageRoot::TemporaryLocked) {
    return ProtectionClass::CompleteUnlessOpen;
  }
  return ProtectionClass::CompleteUntilFirstUserAuthentication;
}

/**
 * @brief Returns the absolute path of a storage root, creating it if needed
 *
 * The first successful resolution creates the directory (with parents),
 * applies the root's default protection class and caches the path. Later
 * calls return the cached string after checking that the directory is
 * still there; a root removed behind our back (tmp cleaner, bulk cleanup)
 * is recreated and re-protected at the same path. A protection failure is
 * logged but does not fail the resolution.
 *
 * The per-run temporary directory lives inside the after-first-auth temp
 * base, so that base is resolved first.
 *
 * @param root The lifecycle class to resolve
 *
 * @return std::string Absolute, existing directory path
 *
 * @throws StorageException with DirectoryUnavailable if no base directory
 *         can be determined or the directory cannot be created
 */
std::string PathResolver::resolve(StorageRoot root) {
  std::string parent;
  if (root == StorageRoot::TemporaryLocked) {
    parent = resolve(StorageRoot::TemporaryAfterFirstAuth);
  }

  std::lock_guard<std::mutex> lock(m_mutex);

  auto cached = m_cache.find(root);
  if (cached != m_cache.end()) {
    std::error_code ec;
    if (!fs::is_directory(cached->second, ec)) {
      LOG_INFO("Storage root " + rootName(root) + " disappeared, recreating " +
               cached->second);
      createRoot(root, cached->second);
    }
    return cached->second;
  }

  fs::path path = root == StorageRoot::TemporaryLocked
                      ? fs::path(parent) / temporaryDirectoryName()
                      : locate(root);
  path = path.lexically_normal();

  createRoot(root, path);

  LOG_DEBUG("Resolved " + rootName(root) + " root to " + path.string());
  m_cache.emplace(root, path.string());
  return path.string();
}

void PathResolver::createRoot(StorageRoot root, const fs::path &path) {
  std::error_code ec;
  fs::create_directories(path, ec);
  if (ec) {
    throw unavailable(root, "cannot create " + path.string() + ": " +
                                ec.message());
  }
  if (!fs::is_directory(path, ec)) {
    throw unavailable(root, path.string() + " is not a directory");
  }

  if (auto error = m_protection.protect(path.string(), defaultProtectionFor(root))) {
    LOG_WARN("Could not protect " + rootName(root) + " root: " +
             error->message());
  }
}

std::string PathResolver::appSharedDataDirectoryURL() {
  return FileUrl::fromPath(appSharedDataDirectoryPath());
}

/**
 * @brief Builds a fresh file name inside the per-run temp directory
 *
 * The file itself is not created. A random 128-bit tag keeps concurrent
 * callers apart.
 */
std::string PathResolver::temporaryFilePath(const std::string &extension) {
  std::string name = randomHexString(16);
  if (!extension.empty()) {
    name += "." + extension;
  }
  return (fs::path(temporaryDirectory()) / name).string();
}

fs::path PathResolver::locate(StorageRoot root) {
  switch (root) {
  case StorageRoot::Documents:
    return dataHome() / m_config.app_id / "Documents";
  case StorageRoot::Library:
    return dataHome() / m_config.app_id / "Library";
  case StorageRoot::SharedData:
    if (m_config.group_id.empty()) {
      throw unavailable(root, "no group identifier configured");
    }
    return dataHome() / m_config.group_id;
  case StorageRoot::Caches:
    return cacheHome() / m_config.app_id;
  case StorageRoot::TemporaryAfterFirstAuth:
    return tempBase();
  case StorageRoot::TemporaryLocked:
    return tempBase() / temporaryDirectoryName();
  }
  throw unavailable(root, "unknown storage root");
}

fs::path PathResolver::dataHome() const {
  if (!m_config.data_home.empty()) {
    return fs::absolute(m_config.data_home);
  }
  fs::path xdg = xdgDirectory("XDG_DATA_HOME");
  if (!xdg.empty()) {
    return xdg;
  }
  return homeDirectory() / ".local" / "share";
}

fs::path PathResolver::cacheHome() const {
  if (!m_config.cache_home.empty()) {
    return fs::absolute(m_config.cache_home);
  }
  fs::path xdg = xdgDirectory("XDG_CACHE_HOME");
  if (!xdg.empty()) {
    return xdg;
  }
  return homeDirectory() / ".cache";
}

fs::path PathResolver::tempBase() const {
  if (!m_config.temp_base.empty()) {
    return fs::absolute(m_config.temp_base);
  }
  std::error_code ec;
  fs::path system_temp = fs::temp_directory_path(ec);
  if (ec) {
    system_temp = "/tmp";
  }
  return system_temp / m_config.app_id;
}

/**
 * @brief Locates the user's home directory
 *
 * Prefers $HOME and falls back to the passwd entry of the current user.
 *
 * @throws StorageException if neither is available
 */
fs::path PathResolver::homeDirectory() const {
  const char *home = std::getenv("HOME");
  if (home && *home) {
    return fs::path(home);
  }

  struct passwd pwd;
  struct passwd *result = nullptr;
  char buf[4096];
  if (getpwuid_r(getuid(), &pwd, buf, sizeof(buf), &result) == 0 && result &&
      result->pw_dir && *result->pw_dir) {
    return fs::path(result->pw_dir);
  }

  LOG_ERROR("No home directory for the current user");
  throw StorageException(StorageError{StorageErrc::DirectoryUnavailable, "",
                                      "no home directory for current user"});
}

StorageException PathResolver::unavailable(StorageRoot root,
                                           const std::string &detail) const {
  LOG_ERROR("Storage root " + rootName(root) + " unavailable: " + detail);
  return StorageException(
      StorageError{StorageErrc::DirectoryUnavailable, rootName(root), detail});
}
