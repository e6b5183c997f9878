#pragma once

#include "SchemaIntrospector.hpp"
#include "QueryExecutor.hpp"
#include <string>
#include <string_view>
#include <vector>

namespace blobfs {

enum class LocatorKind {
    Root,
    TableDir,
    RowDir,
    FieldFile
};

// Resolved meaning of a path. Fields beyond `kind` are populated as the
// kind requires: TableDir sets `table`; RowDir adds `key` and `encodedKey`;
// FieldFile adds `column`.
struct Locator {
    LocatorKind kind = LocatorKind::Root;
    TableInfo table;
    std::vector<std::string> key;
    std::string encodedKey;
    ColumnInfo column;

    bool isDirectory() const;
};

// Classifies a path into a Locator, validating every segment against the
// live schema and data. Nothing is cached between calls.
class PathResolver {
public:
    PathResolver(SchemaIntrospector& schema, QueryExecutor& executor);

    // Throws FsException(NotFound) for unknown tables, rows and columns or
    // paths deeper than three segments, FsException(InvalidArgument) for a
    // key segment of the wrong arity.
    Locator resolve(std::string_view path) const;

    static std::vector<std::string> splitPath(std::string_view path);

    // Convert locator kind to string for debugging
    static std::string kindToString(LocatorKind kind);

private:
    Locator resolveTable(const std::string& table) const;
    Locator resolveRow(const std::string& table, const std::string& segment) const;

    SchemaIntrospector& m_schema;
    QueryExecutor& m_executor;
};

}  // namespace blobfs
