#include "SchemaIntrospector.hpp"
#include <algorithm>
#include <cctype>

namespace blobfs {

std::vector<ColumnInfo> TableInfo::primaryKey() const {
    std::vector<ColumnInfo> key;
    for (const auto& col : columns) {
        if (col.isPrimaryKey()) {
            key.push_back(col);
        }
    }
    std::stable_sort(key.begin(), key.end(),
                     [](const ColumnInfo& a, const ColumnInfo& b) {
                         return a.pkOrdinal < b.pkOrdinal;
                     });
    return key;
}

size_t TableInfo::keyArity() const {
    return static_cast<size_t>(std::count_if(columns.begin(), columns.end(),
                                             [](const ColumnInfo& c) { return c.isPrimaryKey(); }));
}

const ColumnInfo* TableInfo::findColumn(const std::string& column) const {
    for (const auto& col : columns) {
        if (col.name == column) {
            return &col;
        }
    }
    return nullptr;
}

// Declared-type rules from the SQLite documentation ("Determination Of
// Column Affinity"), applied in order. An empty declaration is Unknown
// rather than SQLite's BLOB.
Affinity affinityFromDeclaredType(const std::string& declaredType) {
    std::string upper = declaredType;
    std::transform(upper.begin(), upper.end(), upper.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });

    auto contains = [&upper](const char* needle) {
        return upper.find(needle) != std::string::npos;
    };

    if (upper.find_first_not_of(" \t") == std::string::npos) {
        return Affinity::Unknown;
    }
    if (contains("INT")) {
        return Affinity::Numeric;
    }
    if (contains("CHAR") || contains("CLOB") || contains("TEXT")) {
        return Affinity::Text;
    }
    if (contains("BLOB")) {
        return Affinity::Blob;
    }
    return Affinity::Numeric;
}

std::string affinityToString(Affinity affinity) {
    switch (affinity) {
        case Affinity::Text:
            return "text";
        case Affinity::Blob:
            return "blob";
        case Affinity::Numeric:
            return "numeric";
        case Affinity::Unknown:
        default:
            return "unknown";
    }
}

}  // namespace blobfs
