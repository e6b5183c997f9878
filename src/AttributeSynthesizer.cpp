#include "AttributeSynthesizer.hpp"
#include <cstring>

namespace blobfs {

AttributeSynthesizer::AttributeSynthesizer(QueryExecutor& executor, time_t startTime,
                                           uid_t uid, gid_t gid)
    : m_executor(executor), m_startTime(startTime), m_uid(uid), m_gid(gid) {
}

void AttributeSynthesizer::synthesize(const Locator& locator, struct stat* stbuf) const {
    memset(stbuf, 0, sizeof(struct stat));

    stbuf->st_atime = m_startTime;
    stbuf->st_mtime = m_startTime;
    stbuf->st_ctime = m_startTime;
    stbuf->st_uid = m_uid;
    stbuf->st_gid = m_gid;

    if (locator.isDirectory()) {
        stbuf->st_mode = kDirectoryMode;
        stbuf->st_nlink = 2;
        stbuf->st_size = kDirectorySize;
        return;
    }

    FieldValue value = m_executor.fetchField(locator.table, locator.key, locator.column);
    stbuf->st_mode = kFileMode;
    stbuf->st_nlink = 1;
    stbuf->st_size = static_cast<off_t>(value.size());
}

}  // namespace blobfs
