#pragma once

#include "SchemaIntrospector.hpp"
#include <string>
#include <vector>

namespace blobfs {

// Raw bytes backing a field file
using FieldValue = std::string;

// Abstract base class for the data queries behind each filesystem call.
// Every call runs its own statement(s); nothing spans a transaction.
class QueryExecutor {
public:
    virtual ~QueryExecutor() = default;

    // True if `name` is a table that declares a primary key
    virtual bool tableExists(const std::string& name) = 0;

    // Encoded primary keys of every row, fully materialized in one pass
    virtual std::vector<std::string> listKeys(const TableInfo& table) = 0;

    // True if a row with the given decoded key exists
    virtual bool rowExists(const TableInfo& table, const std::vector<std::string>& key) = 0;

    // Content of one column of one row.
    // Throws FsException(NotFound) if the row no longer exists.
    virtual FieldValue fetchField(const TableInfo& table,
                                  const std::vector<std::string>& key,
                                  const ColumnInfo& column) = 0;

protected:
    QueryExecutor() = default;
};

}  // namespace blobfs
