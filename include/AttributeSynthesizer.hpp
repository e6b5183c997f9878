#pragma once

#include "PathResolver.hpp"
#include "QueryExecutor.hpp"
#include <sys/stat.h>
#include <sys/types.h>
#include <ctime>

namespace blobfs {

// Builds stat(2) data for a resolved Locator. The database carries no
// timestamps, so every entry reports the time the filesystem started.
class AttributeSynthesizer {
public:
    static constexpr off_t kDirectorySize = 4096;
    static constexpr mode_t kDirectoryMode = S_IFDIR | 0555;
    static constexpr mode_t kFileMode = S_IFREG | 0444;

    AttributeSynthesizer(QueryExecutor& executor, time_t startTime, uid_t uid, gid_t gid);

    // Fill `stbuf` for `locator`. A FieldFile's size requires fetching the
    // field, so this runs the field query.
    void synthesize(const Locator& locator, struct stat* stbuf) const;

private:
    QueryExecutor& m_executor;
    time_t m_startTime;
    uid_t m_uid;
    gid_t m_gid;
};

}  // namespace blobfs
