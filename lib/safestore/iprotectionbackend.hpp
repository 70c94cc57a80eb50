#ifndef IPROTECTIONBACKEND_HPP
#define IPROTECTIONBACKEND_HPP

#include <optional>
#include <string>

#include "protectionclass.hpp"
#include "storageerror.hpp"

class IProtectionBackend {
public:
    virtual StorageResult setProtection(const std::string& path, ProtectionClass cls) const = 0;
    virtual std::optional<ProtectionClass> getProtection(const std::string& path) const = 0;
    virtual StorageResult setExcludedFromBackup(const std::string& path, bool excluded) const = 0;
    virtual std::string name() const = 0;
    virtual ~IProtectionBackend() = default;
};

/**
 * @brief Backend for filesystems without a protection attribute
 *
 * Every request succeeds without touching the entry, except that a missing
 * path is still reported as PathNotFound.
 */
class NullProtectionBackend : public IProtectionBackend {
public:
    StorageResult setProtection(const std::string& path, ProtectionClass) const override {
        return checkExists(path);
    }

    std::optional<ProtectionClass> getProtection(const std::string&) const override {
        return std::nullopt;
    }

    StorageResult setExcludedFromBackup(const std::string& path, bool) const override {
        return checkExists(path);
    }

    std::string name() const override { return "none"; }

private:
    static StorageResult checkExists(const std::string& path);
};

#endif // IPROTECTIONBACKEND_HPP
