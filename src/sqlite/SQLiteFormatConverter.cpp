/**
 * @file SQLiteFormatConverter.cpp
 * @brief Implementation of SQLite statement builders and value rendering.
 *
 * SQLite Escaping Conventions:
 * - Identifiers: Double quotes with doubled double-quotes for escaping
 *   (e.g., "column""name" for a column containing a double quote)
 */

#include "SQLiteFormatConverter.hpp"
#include "SQLiteResultSet.hpp"
#include <spdlog/fmt/fmt.h>
#include <sstream>

namespace blobfs {

// ============================================================================
// Escaping Utilities
// ============================================================================

std::string SQLiteFormatConverter::escapeIdentifier(const std::string& identifier) {
    std::string result = "\"";
    for (char c : identifier) {
        if (c == '"') {
            result += "\"\"";
        } else {
            result += c;
        }
    }
    result += "\"";
    return result;
}

std::string SQLiteFormatConverter::identifier(const std::string& identifier, bool quote) {
    return quote ? escapeIdentifier(identifier) : identifier;
}

// ============================================================================
// SQL Statement Builders
// ============================================================================

std::string SQLiteFormatConverter::buildKeyMatch(const ColumnInfo& column, int param, bool quote) {
    std::string ident = identifier(column.name, quote);
    std::string placeholder = "?" + std::to_string(param);

    // TEXT and NUMERIC affinity convert the bound text themselves
    if (column.affinity == Affinity::Text || column.affinity == Affinity::Numeric) {
        return ident + " = " + placeholder;
    }

    // No conversion happens here, so compare the stored value the way
    // formatValue() renders it
    return "(CASE WHEN typeof(" + ident + ") = 'real' THEN " + ident +
           " = CAST(" + placeholder + " AS REAL) ELSE CAST(" + ident +
           " AS TEXT) = " + placeholder + " END)";
}

std::string SQLiteFormatConverter::buildKeyPredicate(const TableInfo& table, bool quote) {
    std::ostringstream sql;
    int param = 1;
    for (const auto& col : table.primaryKey()) {
        if (param > 1) {
            sql << " AND ";
        }
        sql << buildKeyMatch(col, param++, quote);
    }
    return sql.str();
}

std::string SQLiteFormatConverter::buildSelectKeys(const TableInfo& table, bool quote) {
    std::ostringstream sql;
    sql << "SELECT ";

    bool first = true;
    for (const auto& col : table.primaryKey()) {
        if (!first) {
            sql << ", ";
        }
        first = false;
        sql << identifier(col.name, quote);
    }

    sql << " FROM " << identifier(table.name, quote);
    return sql.str();
}

std::string SQLiteFormatConverter::buildRowExists(const TableInfo& table, bool quote) {
    std::ostringstream sql;
    sql << "SELECT 1 FROM " << identifier(table.name, quote)
        << " WHERE " << buildKeyPredicate(table, quote)
        << " LIMIT 1";
    return sql.str();
}

std::string SQLiteFormatConverter::buildSelectField(const TableInfo& table,
                                                    const std::string& column,
                                                    bool quote) {
    std::ostringstream sql;
    sql << "SELECT " << identifier(column, quote)
        << " FROM " << identifier(table.name, quote)
        << " WHERE " << buildKeyPredicate(table, quote)
        << " LIMIT 1";
    return sql.str();
}

// ============================================================================
// Value Rendering
// ============================================================================

std::string SQLiteFormatConverter::formatReal(double value) {
    std::string text = fmt::format("{}", value);
    // "100" -> "100.0"; exponents, inf and nan are left alone
    if (text.find_first_of(".en") == std::string::npos) {
        text += ".0";
    }
    return text;
}

FieldValue SQLiteFormatConverter::formatValue(const SQLiteResultSet& rs, int index) {
    switch (rs.columnType(index)) {
        case SQLITE_INTEGER:
            return std::to_string(rs.getInt64(index));
        case SQLITE_FLOAT:
            return formatReal(rs.getDouble(index));
        case SQLITE_TEXT:
        case SQLITE_BLOB:
            return rs.getBytes(index);
        case SQLITE_NULL:
        default:
            return FieldValue();
    }
}

}  // namespace blobfs
