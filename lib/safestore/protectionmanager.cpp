/**
 * @file protectionmanager.cpp
 * @brief Implementation of single and recursive protection
 */

#include "protectionmanager.hpp"
#include "logger.hpp"
#include "xattrprotectionbackend.hpp"
#include <system_error>

namespace fs = std::filesystem;

ProtectionManager::ProtectionManager(
    std::shared_ptr<const IProtectionBackend> backend)
    : m_backend(std::move(backend)) {
  if (!m_backend) {
    m_backend = std::make_shared<NullProtectionBackend>();
  }
}

std::shared_ptr<const IProtectionBackend>
ProtectionManager::detectBackend(const fs::path &probe_dir) {
  if (XattrProtectionBackend::isSupported(probe_dir)) {
    return std::make_shared<XattrProtectionBackend>();
  }
  LOG_INFO("No protection attribute support under " + probe_dir.string() +
           ", protection requests become no-ops");
  return std::make_shared<NullProtectionBackend>();
}

ProtectionManager ProtectionManager::createDefault() {
  return ProtectionManager(std::make_shared<XattrProtectionBackend>());
}

/**
 * @brief Sets the protection class of one entry and marks it excluded from
 *        backups
 *
 * @param path The file or directory to protect
 * @param cls The protection class to apply
 *
 * @return std::nullopt on success, otherwise the first error encountered
 */
StorageResult ProtectionManager::protect(const std::string &path,
                                         ProtectionClass cls) const {
  if (auto error = m_backend->setProtection(path, cls)) {
    return error;
  }
  return m_backend->setExcludedFromBackup(path, true);
}

StorageResult ProtectionManager::protect(const std::string &path) const {
  return protect(path, DEFAULT_CLASS);
}

std::optional<ProtectionClass>
ProtectionManager::protectionClassOf(const std::string &path) const {
  return m_backend->getProtection(path);
}

void ProtectionManager::recordFailure(ProtectionReport &report,
                                      StorageError error) const {
  LOG_WARN("Protection failed: " + error.message());
  report.failed++;
  report.failures.push_back(std::move(error));
}

/**
 * @brief Applies the default class to a whole tree
 *
 * Walks the tree depth first with a plain directory_iterator per level so
 * that an unreadable subdirectory only costs its own subtree. The root
 * itself is protected first. A missing root is reported as a single
 * PathNotFound failure.
 *
 * @param path Root of the tree (a plain file is protected on its own)
 *
 * @return ProtectionReport with the number of entries attempted and the
 *         failures collected along the way
 */
ProtectionReport ProtectionManager::protectRecursive(const std::string &path) const {
  ProtectionReport report;

  std::error_code ec;
  auto root_status = fs::symlink_status(path, ec);
  if (ec || !fs::exists(root_status)) {
    report.attempted = 1;
    recordFailure(report, StorageError{StorageErrc::PathNotFound, path, ""});
    return report;
  }

  std::vector<fs::path> pending{fs::path(path)};
  while (!pending.empty()) {
    fs::path current = pending.back();
    pending.pop_back();

    report.attempted++;
    if (auto error = protect(current.string())) {
      recordFailure(report, std::move(*error));
    }

    std::error_code status_ec;
    if (!fs::is_directory(fs::symlink_status(current, status_ec))) {
      continue;
    }

    std::error_code iter_ec;
    fs::directory_iterator it(current, iter_ec);
    if (iter_ec) {
      recordFailure(report, makeErrnoError(iter_ec.value(), current.string()));
      continue;
    }

    while (it != fs::directory_iterator()) {
      std::error_code entry_ec;
      if (!it->is_symlink(entry_ec)) {
        pending.push_back(it->path());
      }
      it.increment(iter_ec);
      if (iter_ec) {
        recordFailure(report,
                      makeErrnoError(iter_ec.value(), current.string()));
        break;
      }
    }
  }

  if (report.fullySucceeded()) {
    LOG_DEBUG("Protected " + std::to_string(report.attempted) +
              " entries under " + path);
  } else {
    LOG_WARN(std::to_string(report.failed) + " protection failures across " +
             std::to_string(report.attempted) + " entries under " + path);
  }
  return report;
}
