#include "PathResolver.hpp"
#include "RowKeyCodec.hpp"
#include "ErrorHandler.hpp"

namespace blobfs {

bool Locator::isDirectory() const {
    switch (kind) {
        case LocatorKind::Root:
        case LocatorKind::TableDir:
        case LocatorKind::RowDir:
            return true;
        default:
            return false;
    }
}

PathResolver::PathResolver(SchemaIntrospector& schema, QueryExecutor& executor)
    : m_schema(schema), m_executor(executor) {
}

std::vector<std::string> PathResolver::splitPath(std::string_view path) {
    std::vector<std::string> parts;
    std::string current;

    for (char c : path) {
        if (c == '/') {
            if (!current.empty()) {
                parts.push_back(current);
                current.clear();
            }
        } else {
            current += c;
        }
    }

    if (!current.empty()) {
        parts.push_back(current);
    }

    return parts;
}

Locator PathResolver::resolveTable(const std::string& table) const {
    if (!m_executor.tableExists(table)) {
        throw FsException(FsError::NotFound, "No such table: " + table);
    }

    Locator result;
    result.kind = LocatorKind::TableDir;
    result.table = m_schema.describeTable(table);
    return result;
}

Locator PathResolver::resolveRow(const std::string& table, const std::string& segment) const {
    Locator result = resolveTable(table);

    auto key = RowKeyCodec::decode(segment, result.table.keyArity());
    if (!key) {
        throw FsException(FsError::InvalidArgument,
                          "Key '" + segment + "' does not match the " +
                          std::to_string(result.table.keyArity()) + "-column key of " + table);
    }

    if (!m_executor.rowExists(result.table, *key)) {
        throw FsException(FsError::NotFound, "No such row: " + table + "/" + segment);
    }

    result.kind = LocatorKind::RowDir;
    result.key = std::move(*key);
    result.encodedKey = segment;
    return result;
}

Locator PathResolver::resolve(std::string_view path) const {
    auto parts = splitPath(path);

    switch (parts.size()) {
        case 0:
            return Locator{};

        case 1:
            return resolveTable(parts[0]);

        case 2:
            return resolveRow(parts[0], parts[1]);

        case 3: {
            Locator result = resolveRow(parts[0], parts[1]);
            const ColumnInfo* column = result.table.findColumn(parts[2]);
            if (!column) {
                throw FsException(FsError::NotFound,
                                  "No such column: " + parts[0] + "." + parts[2]);
            }
            result.column = *column;
            result.kind = LocatorKind::FieldFile;
            return result;
        }

        default:
            throw FsException(FsError::NotFound, "Path too deep: " + std::string(path));
    }
}

std::string PathResolver::kindToString(LocatorKind kind) {
    switch (kind) {
        case LocatorKind::Root: return "Root";
        case LocatorKind::TableDir: return "TableDir";
        case LocatorKind::RowDir: return "RowDir";
        case LocatorKind::FieldFile: return "FieldFile";
        default: return "Unknown";
    }
}

}  // namespace blobfs
