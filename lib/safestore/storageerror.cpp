/**
 * @file storageerror.cpp
 * @brief Error descriptions and errno translation for storage operations
 */

#include "storageerror.hpp"
#include <cerrno>
#include <cstring>

std::string StorageError::message() const {
    std::string msg = getErrorMessage(kind);
    if (!path.empty()) {
        msg += ": " + path;
    }
    if (!detail.empty()) {
        msg += " (" + detail + ")";
    }
    return msg;
}

/**
 * @brief Converts a StorageErrc to a human-readable message
 *
 * @param kind The error kind to describe
 *
 * @return std::string Short description without path information
 *
 * @see StorageError::message()
 */
std::string getErrorMessage(StorageErrc kind) {
    switch (kind) {
        case StorageErrc::DirectoryUnavailable:
            return "Storage directory unavailable";
        case StorageErrc::PathNotFound:
            return "Path not found";
        case StorageErrc::PermissionDenied:
            return "Permission denied";
        case StorageErrc::DestinationExists:
            return "Destination already exists";
        case StorageErrc::CrossVolumeMoveFailed:
            return "Cross-volume move copied data but could not remove the source";
        case StorageErrc::RenameExhausted:
            return "Could not find a free random name";
        case StorageErrc::IOFailure:
            return "I/O failure";
        default:
            return "Unknown error";
    }
}

/**
 * @brief Maps errno values to error kinds
 *
 * ENOENT and ENOTDIR mean the target (or one of its parents) is missing.
 * EACCES, EPERM and EROFS are all reported as PermissionDenied.
 * EEXIST and ENOTEMPTY map to DestinationExists. Everything else is an
 * IOFailure.
 */
StorageErrc errcFromErrno(int err) {
    switch (err) {
        case ENOENT:
        case ENOTDIR:
            return StorageErrc::PathNotFound;
        case EACCES:
        case EPERM:
        case EROFS:
            return StorageErrc::PermissionDenied;
        case EEXIST:
        case ENOTEMPTY:
            return StorageErrc::DestinationExists;
        default:
            return StorageErrc::IOFailure;
    }
}

StorageError makeErrnoError(int err, const std::string &path) {
    return StorageError{errcFromErrno(err), path, std::strerror(err)};
}
