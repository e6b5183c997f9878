#pragma once

/**
 * @file SQLiteFormatConverter.hpp
 * @brief SQL text generation and value rendering for the SQLite backend.
 *
 * Builds the handful of SELECT statements the filesystem needs and turns
 * a fetched column value into the bytes a field file serves.
 */

#include "SchemaIntrospector.hpp"
#include "QueryExecutor.hpp"
#include <string>
#include <vector>

namespace blobfs {

class SQLiteResultSet;

/**
 * @class SQLiteFormatConverter
 * @brief Static utility class for SQLite statement text and value rendering.
 *
 * Identifier handling depends on the `quote` argument:
 * - true: identifiers are wrapped in double quotes with internal quotes
 *   doubled ("my table" -> "\"my table\"")
 * - false: identifiers are pasted into the SQL text unchanged
 *
 * Key values are never part of the SQL text; they are always bound as
 * text parameters ?1..?n, in key ordinal order. Key columns without TEXT
 * or NUMERIC affinity are compared through their rendered form, so any
 * key listed by buildSelectKeys() matches again when bound back.
 *
 * Value rendering by storage class:
 * - BLOB and TEXT: stored bytes, verbatim
 * - INTEGER: base-10 decimal
 * - REAL: shortest round-trip decimal, ".0" appended to integral values
 * - NULL: empty
 */
class SQLiteFormatConverter {
public:
    /**
     * @brief Escape an SQLite identifier (table, column name).
     * @return Identifier wrapped in double quotes with internal quotes doubled.
     */
    static std::string escapeIdentifier(const std::string& identifier);

    /**
     * @brief Identifier as it should appear in SQL text.
     * @param identifier Table or column name.
     * @param quote Quote with escapeIdentifier() or interpolate verbatim.
     */
    static std::string identifier(const std::string& identifier, bool quote);

    /**
     * @brief SELECT of all key columns of a table, in key ordinal order.
     *
     * Example: SELECT "owner", "name" FROM "repository"
     */
    static std::string buildSelectKeys(const TableInfo& table, bool quote);

    /**
     * @brief Existence probe for one row, one placeholder per key column.
     *
     * Example: SELECT 1 FROM "repository" WHERE "owner" = ?1 AND "name" = ?2 LIMIT 1
     */
    static std::string buildRowExists(const TableInfo& table, bool quote);

    /**
     * @brief Single-column select for one row, one placeholder per key column.
     *
     * Example: SELECT "source" FROM "source_file" WHERE "hash" = ?1 LIMIT 1
     */
    static std::string buildSelectField(const TableInfo& table,
                                        const std::string& column,
                                        bool quote);

    /**
     * @brief Render a REAL value.
     *
     * Examples: 1.5 -> "1.5", 100.0 -> "100.0", 1e20 -> "1e+20"
     */
    static std::string formatReal(double value);

    /**
     * @brief Render column `index` of the current row as file content.
     */
    static FieldValue formatValue(const SQLiteResultSet& rs, int index);

private:
    static std::string buildKeyMatch(const ColumnInfo& column, int param, bool quote);
    static std::string buildKeyPredicate(const TableInfo& table, bool quote);
};

}  // namespace blobfs
