#include "SQLiteSchemaIntrospector.hpp"
#include "SQLiteResultSet.hpp"
#include "CacheManager.hpp"
#include "ErrorHandler.hpp"
#include <spdlog/spdlog.h>
#include <sstream>

namespace blobfs {

namespace {

const char* const kListTablesSql =
    "SELECT m.name FROM sqlite_master AS m "
    "WHERE m.type = 'table' "
    "AND EXISTS (SELECT 1 FROM pragma_table_info(m.name) AS p WHERE p.pk > 0) "
    "ORDER BY m.name";

const char* const kDescribeTableSql =
    "SELECT p.name, p.type, p.pk "
    "FROM sqlite_master AS m JOIN pragma_table_info(m.name) AS p "
    "WHERE m.type = 'table' AND m.name = ? "
    "ORDER BY p.cid";

}  // namespace

SQLiteSchemaIntrospector::SQLiteSchemaIntrospector(SQLiteConnection& conn, CacheManager& cache)
    : m_conn(conn), m_cache(cache) {
}

std::vector<std::string> SQLiteSchemaIntrospector::listTables() {
    std::string cache_key = CacheManager::makeKey("tables");

    if (auto cached = m_cache.get(cache_key)) {
        std::vector<std::string> result;
        std::istringstream iss(*cached);
        std::string line;
        while (std::getline(iss, line, '\0')) {
            result.push_back(line);
        }
        return result;
    }

    std::vector<std::string> tables;
    SQLiteResultSet rs(m_conn.prepare(kListTablesSql));
    while (rs.step()) {
        tables.push_back(rs.getString(0));
    }

    if (m_cache.enabled()) {
        std::string data;
        for (const auto& t : tables) {
            data += t;
            data += '\0';
        }
        m_cache.put(cache_key, std::move(data));
    }

    return tables;
}

TableInfo SQLiteSchemaIntrospector::describeTable(const std::string& name) {
    std::string cache_key = CacheManager::makeKey("table", name);

    if (auto cached = m_cache.get(cache_key)) {
        return deserializeTable(name, *cached);
    }

    TableInfo info = queryTable(name);

    if (m_cache.enabled()) {
        m_cache.put(cache_key, serializeTable(info));
    }

    return info;
}

TableInfo SQLiteSchemaIntrospector::queryTable(const std::string& name) {
    TableInfo info;
    info.name = name;

    SQLiteResultSet rs(m_conn.prepare(kDescribeTableSql));
    rs.bindText(1, name);
    while (rs.step()) {
        ColumnInfo col;
        col.name = rs.getString(0);
        col.declaredType = rs.getString(1);
        col.affinity = affinityFromDeclaredType(col.declaredType);
        col.pkOrdinal = static_cast<int>(rs.getInt64(2));
        info.columns.push_back(std::move(col));
    }

    if (info.columns.empty()) {
        throw FsException(FsError::NotFound, "No such table: " + name);
    }

    spdlog::debug("Described table '{}': {} columns, key arity {}", name,
                  info.columns.size(), info.keyArity());
    return info;
}

// Cached form: name NUL declaredType NUL pkOrdinal NUL, repeated per column.
// Column names and types come from C strings and never contain NUL.
std::string SQLiteSchemaIntrospector::serializeTable(const TableInfo& table) {
    std::string data;
    for (const auto& col : table.columns) {
        data += col.name;
        data += '\0';
        data += col.declaredType;
        data += '\0';
        data += std::to_string(col.pkOrdinal);
        data += '\0';
    }
    return data;
}

TableInfo SQLiteSchemaIntrospector::deserializeTable(const std::string& name,
                                                     const std::string& data) {
    TableInfo info;
    info.name = name;

    std::vector<std::string> fields;
    std::istringstream iss(data);
    std::string field;
    while (std::getline(iss, field, '\0')) {
        fields.push_back(field);
    }

    for (size_t i = 0; i + 2 < fields.size(); i += 3) {
        ColumnInfo col;
        col.name = fields[i];
        col.declaredType = fields[i + 1];
        col.affinity = affinityFromDeclaredType(col.declaredType);
        col.pkOrdinal = std::stoi(fields[i + 2]);
        info.columns.push_back(std::move(col));
    }
    return info;
}

}  // namespace blobfs
