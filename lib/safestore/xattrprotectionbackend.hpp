#ifndef XATTRPROTECTIONBACKEND_HPP
#define XATTRPROTECTIONBACKEND_HPP

#include <filesystem>

#include "iprotectionbackend.hpp"

/**
 * @brief Stores protection metadata in user extended attributes
 *
 * The class name is kept in "user.safestore.protection" and the backup flag
 * in "user.safestore.exclude_from_backup". Symlinks are never followed.
 *
 * Filesystems that reject user xattrs (ENOTSUP) degrade to a successful
 * no-op, the same as NullProtectionBackend.
 */
class XattrProtectionBackend : public IProtectionBackend {
public:
  static constexpr const char *PROTECTION_XATTR = "user.safestore.protection";
  static constexpr const char *BACKUP_XATTR = "user.safestore.exclude_from_backup";

  StorageResult setProtection(const std::string &path,
                              ProtectionClass cls) const override;
  std::optional<ProtectionClass>
  getProtection(const std::string &path) const override;
  StorageResult setExcludedFromBackup(const std::string &path,
                                      bool excluded) const override;
  std::string name() const override { return "xattr"; }

  /**
   * @brief Check if user xattrs can be written below a directory
   *
   * Writes and removes a probe file. Returns false when the directory is
   * missing or not writable.
   */
  static bool isSupported(const std::filesystem::path &dir);

private:
  StorageResult writeAttribute(const std::string &path, const char *key,
                               const std::string &value) const;
  std::optional<std::string> readAttribute(const std::string &path,
                                           const char *key) const;
};

#endif // XATTRPROTECTIONBACKEND_HPP
