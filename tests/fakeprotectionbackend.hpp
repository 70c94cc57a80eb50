#ifndef FAKEPROTECTIONBACKEND_HPP
#define FAKEPROTECTIONBACKEND_HPP

#include "iprotectionbackend.hpp"
#include <filesystem>
#include <map>
#include <mutex>
#include <set>
#include <string>

/**
 * @brief In-memory protection backend for tests
 *
 * Records the class applied to each path and fails with PermissionDenied
 * for any path whose file name was registered through failFor(). Missing
 * paths are reported as PathNotFound, like the real backends.
 */
class FakeProtectionBackend : public IProtectionBackend {
public:
    void failFor(const std::string& filename) {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_failing.insert(filename);
    }

    StorageResult setProtection(const std::string& path, ProtectionClass cls) const override {
        std::lock_guard<std::mutex> lock(m_mutex);
        std::error_code ec;
        if (!std::filesystem::exists(std::filesystem::symlink_status(path, ec))) {
            return StorageError{StorageErrc::PathNotFound, path, ""};
        }
        if (m_failing.count(std::filesystem::path(path).filename().string())) {
            return StorageError{StorageErrc::PermissionDenied, path, "simulated"};
        }
        m_classes[path] = cls;
        m_calls++;
        return std::nullopt;
    }

    std::optional<ProtectionClass> getProtection(const std::string& path) const override {
        std::lock_guard<std::mutex> lock(m_mutex);
        auto it = m_classes.find(path);
        if (it == m_classes.end()) {
            return std::nullopt;
        }
        return it->second;
    }

    StorageResult setExcludedFromBackup(const std::string& path, bool excluded) const override {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (excluded) {
            m_excluded.insert(path);
        } else {
            m_excluded.erase(path);
        }
        return std::nullopt;
    }

    std::string name() const override { return "fake"; }

    bool isExcludedFromBackup(const std::string& path) const {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_excluded.count(path) > 0;
    }

    size_t protectedCount() const {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_classes.size();
    }

    size_t calls() const {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_calls;
    }

private:
    mutable std::mutex m_mutex;
    mutable std::map<std::string, ProtectionClass> m_classes;
    mutable std::set<std::string> m_excluded;
    mutable size_t m_calls = 0;
    std::set<std::string> m_failing;
};

#endif // FAKEPROTECTIONBACKEND_HPP
