#pragma once

#define FUSE_USE_VERSION 35

#include "Config.hpp"
#include "OperationAdapter.hpp"

#include <fuse3/fuse.h>
#include <memory>
#include <string>

namespace blobfs {

class BlobFS {
public:
    // Singleton access
    static BlobFS& instance();

    // Open the database and build the operation pipeline
    int init(const Config& config);

    // Mount and run the single-threaded FUSE loop (blocks until unmounted)
    int run(const char* argv0);

    // Shutdown
    void shutdown();

    // FUSE operation handlers
    int getattr(const char* path, struct stat* stbuf, fuse_file_info* fi);
    int readdir(const char* path, void* buf, fuse_fill_dir_t filler,
                off_t offset, fuse_file_info* fi, fuse_readdir_flags flags);
    int open(const char* path, fuse_file_info* fi);
    int read(const char* path, char* buf, size_t size, off_t offset,
             fuse_file_info* fi);
    int statfs(const char* path, struct statvfs* stbuf);
    int reject(const char* operation, const char* path);

    // Operation pipeline; null before init() succeeds
    OperationAdapter* operations() { return m_operations.get(); }

private:
    BlobFS() = default;
    ~BlobFS() = default;

    // Non-copyable
    BlobFS(const BlobFS&) = delete;
    BlobFS& operator=(const BlobFS&) = delete;

    Config m_config;
    std::unique_ptr<OperationAdapter> m_operations;

    bool m_initialized = false;
};

// Static C-style callbacks for FUSE
extern "C" {
    int blobfs_getattr(const char* path, struct stat* stbuf, fuse_file_info* fi);
    int blobfs_readdir(const char* path, void* buf, fuse_fill_dir_t filler,
                       off_t offset, fuse_file_info* fi, fuse_readdir_flags flags);
    int blobfs_open(const char* path, fuse_file_info* fi);
    int blobfs_opendir(const char* path, fuse_file_info* fi);
    int blobfs_read(const char* path, char* buf, size_t size, off_t offset,
                    fuse_file_info* fi);
    int blobfs_statfs(const char* path, struct statvfs* stbuf);

    // Mutating calls, all rejected
    int blobfs_write(const char* path, const char* buf, size_t size, off_t offset,
                     fuse_file_info* fi);
    int blobfs_create(const char* path, mode_t mode, fuse_file_info* fi);
    int blobfs_mknod(const char* path, mode_t mode, dev_t rdev);
    int blobfs_unlink(const char* path);
    int blobfs_mkdir(const char* path, mode_t mode);
    int blobfs_rmdir(const char* path);
    int blobfs_rename(const char* from, const char* to, unsigned int flags);
    int blobfs_symlink(const char* target, const char* path);
    int blobfs_link(const char* from, const char* to);
    int blobfs_truncate(const char* path, off_t size, fuse_file_info* fi);
    int blobfs_chmod(const char* path, mode_t mode, fuse_file_info* fi);
    int blobfs_chown(const char* path, uid_t uid, gid_t gid, fuse_file_info* fi);
    int blobfs_utimens(const char* path, const struct timespec tv[2],
                       fuse_file_info* fi);
    int blobfs_setxattr(const char* path, const char* name, const char* value,
                        size_t size, int flags);
    int blobfs_removexattr(const char* path, const char* name);

    void* blobfs_init(fuse_conn_info* conn, fuse_config* cfg);
    void blobfs_destroy(void* private_data);
}

// Get FUSE operations structure
const fuse_operations& getFuseOperations();

}  // namespace blobfs
