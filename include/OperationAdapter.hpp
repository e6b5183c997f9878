#pragma once

#include "Config.hpp"
#include "CacheManager.hpp"
#include "ErrorHandler.hpp"
#include "PathResolver.hpp"
#include "AttributeSynthesizer.hpp"
#include "SQLiteConnection.hpp"
#include "SQLiteSchemaIntrospector.hpp"
#include "SQLiteQueryExecutor.hpp"
#include <spdlog/spdlog.h>
#include <sys/stat.h>
#include <memory>
#include <string>
#include <vector>

namespace blobfs {

// The filesystem call surface, independent of libfuse. Each call resolves
// its path from scratch and returns 0 (or a byte count) on success and a
// negated errno on failure. Owns the database connection for the lifetime
// of the mount.
class OperationAdapter {
public:
    // Takes ownership of an open connection.
    // Throws std::invalid_argument if the connection is missing or closed.
    OperationAdapter(std::unique_ptr<SQLiteConnection> conn, const Config& config);

    // Non-copyable
    OperationAdapter(const OperationAdapter&) = delete;
    OperationAdapter& operator=(const OperationAdapter&) = delete;

    int getattr(const std::string& path, struct stat* stbuf);

    // Succeeds only for directories
    int opendir(const std::string& path);

    // Entries excluding "." and ".."
    int readdir(const std::string& path, std::vector<std::string>& entries);

    // Validation only; no handle state is kept
    int open(const std::string& path, int flags);

    int read(const std::string& path, char* buf, size_t size, off_t offset);

    // Every mutating call ends here, whatever the path
    int rejectMutation(const char* operation, const std::string& path);

private:
    // Runs `operation`, mapping exceptions to negated errno values
    template<typename Func>
    int guarded(const char* operation, const std::string& path, Func&& fn) {
        try {
            return fn();
        } catch (const FsException& e) {
            spdlog::debug("{} {}: {} ({})", operation, path,
                          ErrorHandler::errorName(e.error()), e.what());
            return -e.posixError();
        } catch (const StoreException& e) {
            spdlog::error("{} {}: database error: {}", operation, path, e.what());
            return -e.posixError();
        } catch (const std::exception& e) {
            spdlog::error("{} {}: {}", operation, path, e.what());
            return ErrorHandler::ERR_IO;
        }
    }

    // Members ordered by dependency (dependencies first, destroyed last)
    std::unique_ptr<SQLiteConnection> m_conn;
    CacheManager m_cache;
    SQLiteSchemaIntrospector m_schema;
    SQLiteQueryExecutor m_executor;
    PathResolver m_resolver;
    AttributeSynthesizer m_attributes;
};

}  // namespace blobfs
