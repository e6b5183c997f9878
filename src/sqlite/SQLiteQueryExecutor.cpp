#include "SQLiteQueryExecutor.hpp"
#include "SQLiteResultSet.hpp"
#include "SQLiteFormatConverter.hpp"
#include "RowKeyCodec.hpp"
#include "ErrorHandler.hpp"
#include <spdlog/spdlog.h>
#include <utility>

namespace blobfs {

namespace {

const char* const kTableExistsSql =
    "SELECT 1 FROM sqlite_master AS m "
    "WHERE m.type = 'table' AND m.name = ? "
    "AND EXISTS (SELECT 1 FROM pragma_table_info(m.name) AS p WHERE p.pk > 0)";

}  // namespace

SQLiteQueryExecutor::SQLiteQueryExecutor(SQLiteConnection& conn, bool quoteIdentifiers)
    : m_conn(conn), m_quoteIdentifiers(quoteIdentifiers) {
}

void SQLiteQueryExecutor::bindKey(SQLiteResultSet& rs, const TableInfo& table,
                                  const std::vector<std::string>& key) const {
    if (key.size() != table.keyArity()) {
        throw FsException(FsError::InvalidArgument,
                          "Key arity " + std::to_string(key.size()) + " does not match table '" +
                          table.name + "' (" + std::to_string(table.keyArity()) + ")");
    }
    for (size_t i = 0; i < key.size(); ++i) {
        rs.bindText(static_cast<int>(i) + 1, key[i]);
    }
}

bool SQLiteQueryExecutor::tableExists(const std::string& name) {
    SQLiteResultSet rs(m_conn.prepare(kTableExistsSql));
    rs.bindText(1, name);
    return rs.step();
}

std::vector<std::string> SQLiteQueryExecutor::listKeys(const TableInfo& table) {
    size_t arity = table.keyArity();
    if (arity == 0) {
        throw FsException(FsError::NotFound, "Table has no primary key: " + table.name);
    }

    SQLiteResultSet rs(m_conn.prepare(
        SQLiteFormatConverter::buildSelectKeys(table, m_quoteIdentifiers)));

    std::vector<std::string> keys;
    std::vector<std::string> components(arity);
    size_t skipped = 0;
    while (rs.step()) {
        for (size_t i = 0; i < arity; ++i) {
            components[i] = SQLiteFormatConverter::formatValue(rs, static_cast<int>(i));
        }
        std::string encoded = RowKeyCodec::encode(components);
        // '' or NULL single-column keys have no path segment
        if (encoded.empty()) {
            ++skipped;
            continue;
        }
        keys.push_back(std::move(encoded));
    }

    if (skipped > 0) {
        spdlog::debug("Skipped {} row(s) of '{}' with an empty key", skipped, table.name);
    }

    spdlog::debug("Listed {} keys of '{}'", keys.size(), table.name);
    return keys;
}

bool SQLiteQueryExecutor::rowExists(const TableInfo& table, const std::vector<std::string>& key) {
    SQLiteResultSet rs(m_conn.prepare(
        SQLiteFormatConverter::buildRowExists(table, m_quoteIdentifiers)));
    bindKey(rs, table, key);
    return rs.step();
}

FieldValue SQLiteQueryExecutor::fetchField(const TableInfo& table,
                                           const std::vector<std::string>& key,
                                           const ColumnInfo& column) {
    SQLiteResultSet rs(m_conn.prepare(
        SQLiteFormatConverter::buildSelectField(table, column.name, m_quoteIdentifiers)));
    bindKey(rs, table, key);

    if (!rs.step()) {
        throw FsException(FsError::NotFound,
                          "Row " + RowKeyCodec::encode(key) + " vanished from '" + table.name + "'");
    }
    return SQLiteFormatConverter::formatValue(rs, 0);
}

}  // namespace blobfs
