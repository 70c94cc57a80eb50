#ifndef STORAGEERROR_HPP
#define STORAGEERROR_HPP

#include <optional>
#include <stdexcept>
#include <string>
#include <utility>

/**
 * @brief Failure kinds reported by storage operations
 *
 * "Absent" (size of a missing file) is not an error and is expressed with
 * std::nullopt by the size queries.
 */
enum class StorageErrc {
    DirectoryUnavailable,
    PathNotFound,
    PermissionDenied,
    DestinationExists,
    CrossVolumeMoveFailed,
    RenameExhausted,
    IOFailure
};

/**
 * @brief Structured error returned by single-entity operations
 */
struct StorageError {
    StorageErrc kind;
    std::string path;
    std::string detail;

    /**
     * @brief Full human-readable description including path and detail
     */
    std::string message() const;
};

/** @brief Empty on success, the first error otherwise */
using StorageResult = std::optional<StorageError>;

/**
 * @brief Get a short human-readable description of an error kind
 */
std::string getErrorMessage(StorageErrc kind);

/**
 * @brief Map an errno value to the closest error kind
 */
StorageErrc errcFromErrno(int err);

/**
 * @brief Build a StorageError from errno and the path involved
 */
StorageError makeErrnoError(int err, const std::string &path);

/**
 * @brief Thrown when a storage root cannot be provided
 *
 * Only used for fatal conditions. Ordinary failures are returned as
 * StorageError values.
 */
class StorageException : public std::runtime_error {
public:
    explicit StorageException(StorageError error)
        : std::runtime_error(error.message()), m_error(std::move(error)) {}

    const StorageError &error() const { return m_error; }
    StorageErrc kind() const { return m_error.kind; }

private:
    StorageError m_error;
};

#endif // STORAGEERROR_HPP
