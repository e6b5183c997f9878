#include "ErrorHandler.hpp"
#include <sqlite3.h>

namespace blobfs {

int ErrorHandler::toErrno(FsError error) {
    switch (error) {
        case FsError::NotFound:
            return ENOENT;
        case FsError::NotADirectory:
            return ENOTDIR;
        case FsError::IsADirectory:
            return EISDIR;
        case FsError::InvalidArgument:
            return EINVAL;
        case FsError::ReadOnlyViolation:
            return EROFS;
        case FsError::StoreError:
        default:
            return EIO;
    }
}

std::string ErrorHandler::errorName(FsError error) {
    switch (error) {
        case FsError::NotFound: return "NotFound";
        case FsError::NotADirectory: return "NotADirectory";
        case FsError::IsADirectory: return "IsADirectory";
        case FsError::InvalidArgument: return "InvalidArgument";
        case FsError::ReadOnlyViolation: return "ReadOnlyViolation";
        case FsError::StoreError: return "StoreError";
        default: return "Unknown";
    }
}

std::string ErrorHandler::sqliteErrorMessage(int sqliteCode) {
    const char* msg = sqlite3_errstr(sqliteCode);
    if (msg && *msg) {
        return std::string(msg) + " (" + std::to_string(sqliteCode) + ")";
    }
    return "SQLite error " + std::to_string(sqliteCode);
}

FsException::FsException(FsError error, const std::string& message)
    : std::runtime_error(message)
    , m_error(error) {
}

StoreException::StoreException(int sqlite_code, const std::string& message)
    : std::runtime_error(message)
    , m_errorCode(sqlite_code) {
}

}  // namespace blobfs
