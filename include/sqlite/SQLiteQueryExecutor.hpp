#pragma once

/**
 * @file SQLiteQueryExecutor.hpp
 * @brief Row and field queries for the SQLite backend.
 */

#include "QueryExecutor.hpp"
#include "SQLiteConnection.hpp"

namespace blobfs {

class SQLiteResultSet;

/**
 * @class SQLiteQueryExecutor
 * @brief QueryExecutor implementation for SQLite databases.
 *
 * Key components are always bound as text parameters. SQLite applies the
 * key column's affinity to the bound value when comparing, so "42" matches
 * an INTEGER key of 42.
 *
 * Table and column names are part of the SQL text. They are quoted unless
 * the connection was configured for raw identifiers, in which case a name
 * that is not a valid bare identifier fails with StoreException.
 *
 * listKeys() reads the whole key set into memory before returning. On a
 * very large table this blocks the filesystem for as long as the scan takes.
 */
class SQLiteQueryExecutor : public QueryExecutor {
public:
    /**
     * @param conn Open connection (owned by the caller).
     * @param quoteIdentifiers Quote table/column names in generated SQL.
     */
    SQLiteQueryExecutor(SQLiteConnection& conn, bool quoteIdentifiers = true);

    ~SQLiteQueryExecutor() override = default;

    bool tableExists(const std::string& name) override;

    std::vector<std::string> listKeys(const TableInfo& table) override;

    bool rowExists(const TableInfo& table, const std::vector<std::string>& key) override;

    /**
     * @brief Content of one column of one row.
     * @throws FsException(NotFound) if the row no longer exists.
     */
    FieldValue fetchField(const TableInfo& table,
                          const std::vector<std::string>& key,
                          const ColumnInfo& column) override;

private:
    void bindKey(SQLiteResultSet& rs, const TableInfo& table,
                 const std::vector<std::string>& key) const;

    SQLiteConnection& m_conn;
    bool m_quoteIdentifiers;
};

}  // namespace blobfs
