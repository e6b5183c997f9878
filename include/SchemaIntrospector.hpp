#pragma once

#include <string>
#include <vector>

namespace blobfs {

// Declared storage type category of a column
enum class Affinity {
    Text,
    Blob,
    Numeric,
    Unknown
};

struct ColumnInfo {
    std::string name;
    std::string declaredType;
    Affinity affinity = Affinity::Unknown;
    int pkOrdinal = 0;  // 1-based position in the primary key, 0 if not a key column

    bool isPrimaryKey() const { return pkOrdinal > 0; }
};

struct TableInfo {
    std::string name;
    std::vector<ColumnInfo> columns;  // Declaration order

    // Key columns ordered by key ordinal
    std::vector<ColumnInfo> primaryKey() const;

    // Number of key columns
    size_t keyArity() const;

    // Column by name, or nullptr
    const ColumnInfo* findColumn(const std::string& column) const;
};

// Derive affinity from a declared column type
Affinity affinityFromDeclaredType(const std::string& declaredType);

// Convert Affinity to string
std::string affinityToString(Affinity affinity);

// Abstract base class for schema discovery.
// Implementations query the live catalog on every call unless an explicit
// schema cache has been enabled.
class SchemaIntrospector {
public:
    virtual ~SchemaIntrospector() = default;

    // Tables that declare a primary key, sorted by name.
    // Throws StoreException if the catalog query fails.
    virtual std::vector<std::string> listTables() = 0;

    // Columns and primary key of a table.
    // Throws FsException(NotFound) if no such table exists.
    virtual TableInfo describeTable(const std::string& name) = 0;

protected:
    SchemaIntrospector() = default;
};

}  // namespace blobfs
