#pragma once

#include <string>
#include <string_view>
#include <vector>
#include <optional>

namespace blobfs {

// Maps a primary key tuple to a single path segment and back.
//
// Components are joined with a fixed delimiter and are not escaped:
// decode(encode(t)) == t only holds when no component contains the
// delimiter, '/' or NUL. A single empty component encodes to an empty
// segment, which no path can name; such rows are left out of listings.
class RowKeyCodec {
public:
    static constexpr char kDelimiter = ',';

    // Join stringified key components in primary key ordinal order
    static std::string encode(const std::vector<std::string>& values);

    // Split a segment into exactly `arity` components, or nullopt
    static std::optional<std::vector<std::string>> decode(std::string_view segment,
                                                          size_t arity);
};

}  // namespace blobfs
