#include "OperationAdapter.hpp"
#include <fcntl.h>
#include <unistd.h>
#include <algorithm>
#include <cstring>
#include <ctime>
#include <stdexcept>

namespace blobfs {

namespace {

std::unique_ptr<SQLiteConnection> requireOpen(std::unique_ptr<SQLiteConnection> conn) {
    if (!conn || !conn->isValid()) {
        throw std::invalid_argument("OperationAdapter requires an open database connection");
    }
    return conn;
}

}  // namespace

OperationAdapter::OperationAdapter(std::unique_ptr<SQLiteConnection> conn, const Config& config)
    : m_conn(requireOpen(std::move(conn)))
    , m_cache(config.cache)
    , m_schema(*m_conn, m_cache)
    , m_executor(*m_conn, config.security.quote_identifiers)
    , m_resolver(m_schema, m_executor)
    , m_attributes(m_executor, time(nullptr), getuid(), getgid()) {
    if (!config.security.quote_identifiers) {
        spdlog::warn("Identifier quoting disabled: table and column names go into SQL verbatim");
    }
    if (m_cache.enabled()) {
        spdlog::info("Schema cache enabled (TTL {}s)", config.cache.schema_ttl.count());
    }
}

int OperationAdapter::getattr(const std::string& path, struct stat* stbuf) {
    spdlog::debug("getattr: {}", path);

    return guarded("getattr", path, [&] {
        Locator locator = m_resolver.resolve(path);
        m_attributes.synthesize(locator, stbuf);
        return 0;
    });
}

int OperationAdapter::opendir(const std::string& path) {
    spdlog::debug("opendir: {}", path);

    return guarded("opendir", path, [&] {
        Locator locator = m_resolver.resolve(path);
        return locator.isDirectory() ? ErrorHandler::SUCCESS : ErrorHandler::ERR_NOT_DIR;
    });
}

int OperationAdapter::readdir(const std::string& path, std::vector<std::string>& entries) {
    spdlog::debug("readdir: {}", path);

    return guarded("readdir", path, [&] {
        Locator locator = m_resolver.resolve(path);

        switch (locator.kind) {
            case LocatorKind::Root:
                entries = m_schema.listTables();
                return 0;

            case LocatorKind::TableDir:
                entries = m_executor.listKeys(locator.table);
                return 0;

            case LocatorKind::RowDir:
                entries.clear();
                for (const auto& col : locator.table.columns) {
                    entries.push_back(col.name);
                }
                return 0;

            default:
                return ErrorHandler::ERR_NOT_DIR;
        }
    });
}

int OperationAdapter::open(const std::string& path, int flags) {
    spdlog::debug("open: {} (flags={:#x})", path, flags);

    if ((flags & O_ACCMODE) != O_RDONLY || (flags & O_TRUNC)) {
        return rejectMutation("open", path);
    }

    return guarded("open", path, [&] {
        Locator locator = m_resolver.resolve(path);
        if (locator.isDirectory()) {
            return ErrorHandler::ERR_IS_DIR;
        }
        return 0;
    });
}

int OperationAdapter::read(const std::string& path, char* buf, size_t size, off_t offset) {
    spdlog::debug("read: {} (size={}, offset={})", path, size, offset);

    return guarded("read", path, [&] {
        Locator locator = m_resolver.resolve(path);
        if (locator.isDirectory()) {
            return ErrorHandler::ERR_IS_DIR;
        }
        if (offset < 0) {
            return ErrorHandler::ERR_INVALID;
        }

        FieldValue content = m_executor.fetchField(locator.table, locator.key, locator.column);

        if (offset >= static_cast<off_t>(content.size())) {
            return 0;
        }

        size_t available = content.size() - static_cast<size_t>(offset);
        size_t to_read = std::min(size, available);

        memcpy(buf, content.data() + offset, to_read);

        return static_cast<int>(to_read);
    });
}

int OperationAdapter::rejectMutation(const char* operation, const std::string& path) {
    spdlog::debug("{}: {} rejected, filesystem is read-only", operation, path);
    return ErrorHandler::ERR_READ_ONLY;
}

}  // namespace blobfs
