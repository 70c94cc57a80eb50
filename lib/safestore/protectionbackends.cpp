/**
 * @file protectionbackends.cpp
 * @brief Null and extended-attribute protection backends
 */

#include "logger.hpp"
#include "xattrprotectionbackend.hpp"
#include <cerrno>
#include <cstring>
#include <fstream>
#include <sys/stat.h>
#include <sys/xattr.h>
#include <unistd.h>

namespace fs = std::filesystem;

StorageResult NullProtectionBackend::checkExists(const std::string &path) {
  struct stat st;
  if (lstat(path.c_str(), &st) != 0) {
    return makeErrnoError(errno, path);
  }
  return std::nullopt;
}

StorageResult XattrProtectionBackend::setProtection(const std::string &path,
                                                    ProtectionClass cls) const {
  std::string value = protectionClassName(cls);

  // Already carrying the requested class
  auto current = readAttribute(path, PROTECTION_XATTR);
  if (current && *current == value) {
    return std::nullopt;
  }

  return writeAttribute(path, PROTECTION_XATTR, value);
}

std::optional<ProtectionClass>
XattrProtectionBackend::getProtection(const std::string &path) const {
  auto value = readAttribute(path, PROTECTION_XATTR);
  if (!value) {
    return std::nullopt;
  }
  return protectionClassFromName(*value);
}

StorageResult
XattrProtectionBackend::setExcludedFromBackup(const std::string &path,
                                              bool excluded) const {
  if (excluded) {
    return writeAttribute(path, BACKUP_XATTR, "1");
  }

  if (lremovexattr(path.c_str(), BACKUP_XATTR) != 0 && errno != ENODATA &&
      errno != ENOTSUP) {
    return makeErrnoError(errno, path);
  }
  return std::nullopt;
}

/**
 * @brief Writes a single user xattr without following symlinks
 *
 * ENOTSUP means the filesystem has no user xattr support. The entry is
 * checked for existence so that a missing path is still reported, and
 * the call otherwise succeeds.
 */
StorageResult
XattrProtectionBackend::writeAttribute(const std::string &path, const char *key,
                                       const std::string &value) const {
  if (lsetxattr(path.c_str(), key, value.data(), value.size(), 0) == 0) {
    return std::nullopt;
  }

  int err = errno;
  if (err == ENOTSUP) {
    struct stat st;
    if (lstat(path.c_str(), &st) != 0) {
      return makeErrnoError(errno, path);
    }
    LOG_DEBUG("xattrs unsupported, skipping protection for " + path);
    return std::nullopt;
  }

  return makeErrnoError(err, path);
}

std::optional<std::string>
XattrProtectionBackend::readAttribute(const std::string &path,
                                      const char *key) const {
  char buf[64];
  ssize_t len = lgetxattr(path.c_str(), key, buf, sizeof(buf));
  if (len < 0) {
    return std::nullopt;
  }
  return std::string(buf, static_cast<size_t>(len));
}

bool XattrProtectionBackend::isSupported(const fs::path &dir) {
  auto probe = dir / (".safestore_xattr_probe_" + std::to_string(getpid()));
  {
    std::ofstream f(probe);
    if (!f) {
      return false;
    }
    f << "probe";
  }

  const char value[] = "1";
  bool supported =
      lsetxattr(probe.c_str(), PROTECTION_XATTR, value, 1, 0) == 0;

  std::error_code ec;
  fs::remove(probe, ec);
  return supported;
}
