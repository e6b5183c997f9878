#include "RowKeyCodec.hpp"

namespace blobfs {

std::string RowKeyCodec::encode(const std::vector<std::string>& values) {
    std::string segment;
    for (size_t i = 0; i < values.size(); ++i) {
        if (i > 0) {
            segment += kDelimiter;
        }
        segment += values[i];
    }
    return segment;
}

std::optional<std::vector<std::string>> RowKeyCodec::decode(std::string_view segment,
                                                            size_t arity) {
    if (arity == 0) {
        return std::nullopt;
    }

    // Empty components are kept: "a,," is three components
    std::vector<std::string> parts;
    size_t start = 0;
    while (true) {
        size_t pos = segment.find(kDelimiter, start);
        if (pos == std::string_view::npos) {
            parts.emplace_back(segment.substr(start));
            break;
        }
        parts.emplace_back(segment.substr(start, pos - start));
        start = pos + 1;
    }

    if (parts.size() != arity) {
        return std::nullopt;
    }
    return parts;
}

}  // namespace blobfs
