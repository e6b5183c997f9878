#pragma once

#include <string>
#include <stdexcept>
#include <cerrno>

namespace blobfs {

// Failure categories surfaced by filesystem calls
enum class FsError {
    NotFound,
    NotADirectory,
    IsADirectory,
    InvalidArgument,
    ReadOnlyViolation,
    StoreError
};

// Error taxonomy to POSIX errno mapping
class ErrorHandler {
public:
    // Convert a filesystem error category to errno
    static int toErrno(FsError error);

    // Short name for logging
    static std::string errorName(FsError error);

    // Human-readable SQLite result code
    static std::string sqliteErrorMessage(int sqliteCode);

    // Common error codes
    static constexpr int SUCCESS = 0;
    static constexpr int ERR_NOT_FOUND = -ENOENT;
    static constexpr int ERR_IO = -EIO;
    static constexpr int ERR_INVALID = -EINVAL;
    static constexpr int ERR_NOT_DIR = -ENOTDIR;
    static constexpr int ERR_IS_DIR = -EISDIR;
    static constexpr int ERR_READ_ONLY = -EROFS;
};

// Raised by path resolution and query layers for expected lookup failures
class FsException : public std::runtime_error {
public:
    FsException(FsError error, const std::string& message);

    FsError error() const { return m_error; }
    int posixError() const { return ErrorHandler::toErrno(m_error); }

private:
    FsError m_error;
};

// Raised when the database itself fails (open, prepare, bind, step)
class StoreException : public std::runtime_error {
public:
    StoreException(int sqliteCode, const std::string& message);

    int errorCode() const { return m_errorCode; }
    int posixError() const { return EIO; }

private:
    int m_errorCode;
};

}  // namespace blobfs
