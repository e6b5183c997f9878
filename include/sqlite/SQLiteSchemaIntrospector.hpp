#pragma once

/**
 * @file SQLiteSchemaIntrospector.hpp
 * @brief SQLite catalog queries behind the SchemaIntrospector interface.
 */

#include "SchemaIntrospector.hpp"
#include "SQLiteConnection.hpp"

namespace blobfs {

class CacheManager;

/**
 * @class SQLiteSchemaIntrospector
 * @brief SchemaIntrospector implementation for SQLite databases.
 *
 * System Tables and PRAGMAs Used:
 * - sqlite_master: table names (type = 'table')
 * - pragma_table_info(name): column name, declared type, pk ordinal
 *
 * Both are queried with the table name bound as a parameter, so catalog
 * lookups never interpolate identifiers.
 *
 * Results are re-read on every call. When the CacheManager is enabled,
 * they are kept for the configured schema TTL instead.
 */
class SQLiteSchemaIntrospector : public SchemaIntrospector {
public:
    /**
     * @brief Construct an SQLite schema introspector.
     * @param conn Open connection (owned by the caller).
     * @param cache Schema cache; a disabled cache turns caching off.
     */
    SQLiteSchemaIntrospector(SQLiteConnection& conn, CacheManager& cache);

    ~SQLiteSchemaIntrospector() override = default;

    /**
     * @brief Tables that declare at least one primary key column.
     * @return Table names sorted by name.
     */
    std::vector<std::string> listTables() override;

    /**
     * @brief Columns of a table in declaration order.
     * @throws FsException(NotFound) if `name` is not a table.
     */
    TableInfo describeTable(const std::string& name) override;

private:
    TableInfo queryTable(const std::string& name);

    static std::string serializeTable(const TableInfo& table);
    static TableInfo deserializeTable(const std::string& name, const std::string& data);

    SQLiteConnection& m_conn;
    CacheManager& m_cache;
};

}  // namespace blobfs
