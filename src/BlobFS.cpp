#include "BlobFS.hpp"
#include "ErrorHandler.hpp"
#include "SQLiteConnection.hpp"
#include <spdlog/spdlog.h>
#include <sys/statvfs.h>
#include <cstring>
#include <vector>

namespace blobfs {

// Singleton instance
BlobFS& BlobFS::instance() {
    static BlobFS instance;
    return instance;
}

int BlobFS::init(const Config& config) {
    m_config = config;

    try {
        auto conn = std::make_unique<SQLiteConnection>(m_config.database.path, true);
        if (!conn->isValid() || !conn->healthCheck()) {
            spdlog::error("Failed to open SQLite database: {}", m_config.database.path);
            return -1;
        }

        conn->setBusyTimeout(m_config.database.busy_timeout);

        m_operations = std::make_unique<OperationAdapter>(std::move(conn), m_config);

        m_initialized = true;
        spdlog::info("SQLite database opened: {}", m_config.database.path);

        return 0;

    } catch (const std::exception& e) {
        spdlog::error("Initialization failed: {}", e.what());
        return -1;
    }
}

int BlobFS::run(const char* argv0) {
    if (!m_initialized) {
        spdlog::error("Filesystem not initialized");
        return -1;
    }

    std::vector<const char*> fuse_argv;
    fuse_argv.push_back(argv0);

    if (m_config.debug) {
        fuse_argv.push_back("-d");
    }

    fuse_argv.push_back("-o");
    fuse_argv.push_back("ro");
    fuse_argv.push_back("-o");
    fuse_argv.push_back("fsname=blobfs");

    if (m_config.allow_other) {
        fuse_argv.push_back("-o");
        fuse_argv.push_back("allow_other");
    }

    if (m_config.allow_root) {
        fuse_argv.push_back("-o");
        fuse_argv.push_back("allow_root");
    }

    const fuse_operations& ops = getFuseOperations();

    struct fuse_args args = FUSE_ARGS_INIT(static_cast<int>(fuse_argv.size()),
                                            const_cast<char**>(fuse_argv.data()));
    struct fuse* fuse = fuse_new(&args, &ops, sizeof(ops), nullptr);
    if (!fuse) {
        spdlog::error("fuse_new failed");
        fuse_opt_free_args(&args);
        return -1;
    }

    if (fuse_mount(fuse, m_config.mountpoint.c_str()) != 0) {
        spdlog::error("Failed to mount {}", m_config.mountpoint);
        fuse_destroy(fuse);
        fuse_opt_free_args(&args);
        return -1;
    }

    if (fuse_daemonize(m_config.foreground ? 1 : 0) != 0) {
        spdlog::error("Failed to detach from terminal");
        fuse_unmount(fuse);
        fuse_destroy(fuse);
        fuse_opt_free_args(&args);
        return -1;
    }

    struct fuse_session* se = fuse_get_session(fuse);
    if (fuse_set_signal_handlers(se) != 0) {
        fuse_unmount(fuse);
        fuse_destroy(fuse);
        fuse_opt_free_args(&args);
        return -1;
    }

    spdlog::info("Mounted {} at {}", m_config.database.path, m_config.mountpoint);

    // One request at a time; the connection is not shared across threads
    int ret = fuse_loop(fuse);

    fuse_remove_signal_handlers(se);
    fuse_unmount(fuse);
    fuse_destroy(fuse);
    fuse_opt_free_args(&args);

    return ret;
}

void BlobFS::shutdown() {
    if (!m_initialized) {
        return;
    }
    m_operations.reset();
    m_initialized = false;
    spdlog::info("blobfs shutdown");
}

int BlobFS::getattr(const char* path, struct stat* stbuf, fuse_file_info* fi) {
    (void)fi;
    return m_operations->getattr(path, stbuf);
}

int BlobFS::readdir(const char* path, void* buf, fuse_fill_dir_t filler,
                    off_t offset, fuse_file_info* fi, fuse_readdir_flags flags) {
    (void)offset;
    (void)fi;
    (void)flags;

    std::vector<std::string> entries;
    int ret = m_operations->readdir(path, entries);
    if (ret != 0) {
        return ret;
    }

    filler(buf, ".", nullptr, 0, static_cast<fuse_fill_dir_flags>(0));
    filler(buf, "..", nullptr, 0, static_cast<fuse_fill_dir_flags>(0));

    for (const auto& entry : entries) {
        if (filler(buf, entry.c_str(), nullptr, 0, static_cast<fuse_fill_dir_flags>(0)) != 0) {
            break;
        }
    }

    return 0;
}

int BlobFS::open(const char* path, fuse_file_info* fi) {
    return m_operations->open(path, fi->flags);
}

int BlobFS::read(const char* path, char* buf, size_t size, off_t offset,
                 fuse_file_info* fi) {
    (void)fi;
    return m_operations->read(path, buf, size, offset);
}

int BlobFS::statfs(const char* path, struct statvfs* stbuf) {
    (void)path;

    memset(stbuf, 0, sizeof(struct statvfs));

    stbuf->f_bsize = 4096;
    stbuf->f_frsize = 4096;
    stbuf->f_namemax = 255;
    stbuf->f_flag = ST_RDONLY;

    return 0;
}

int BlobFS::reject(const char* operation, const char* path) {
    return m_operations->rejectMutation(operation, path);
}

// C-style FUSE callbacks

extern "C" {

int blobfs_getattr(const char* path, struct stat* stbuf, fuse_file_info* fi) {
    return BlobFS::instance().getattr(path, stbuf, fi);
}

int blobfs_readdir(const char* path, void* buf, fuse_fill_dir_t filler,
                   off_t offset, fuse_file_info* fi, fuse_readdir_flags flags) {
    return BlobFS::instance().readdir(path, buf, filler, offset, fi, flags);
}

int blobfs_open(const char* path, fuse_file_info* fi) {
    return BlobFS::instance().open(path, fi);
}

int blobfs_opendir(const char* path, fuse_file_info* fi) {
    (void)fi;
    return BlobFS::instance().operations()->opendir(path);
}

int blobfs_read(const char* path, char* buf, size_t size, off_t offset,
                fuse_file_info* fi) {
    return BlobFS::instance().read(path, buf, size, offset, fi);
}

int blobfs_statfs(const char* path, struct statvfs* stbuf) {
    return BlobFS::instance().statfs(path, stbuf);
}

int blobfs_write(const char* path, const char* buf, size_t size, off_t offset,
                 fuse_file_info* fi) {
    (void)buf;
    (void)size;
    (void)offset;
    (void)fi;
    return BlobFS::instance().reject("write", path);
}

int blobfs_create(const char* path, mode_t mode, fuse_file_info* fi) {
    (void)mode;
    (void)fi;
    return BlobFS::instance().reject("create", path);
}

int blobfs_mknod(const char* path, mode_t mode, dev_t rdev) {
    (void)mode;
    (void)rdev;
    return BlobFS::instance().reject("mknod", path);
}

int blobfs_unlink(const char* path) {
    return BlobFS::instance().reject("unlink", path);
}

int blobfs_mkdir(const char* path, mode_t mode) {
    (void)mode;
    return BlobFS::instance().reject("mkdir", path);
}

int blobfs_rmdir(const char* path) {
    return BlobFS::instance().reject("rmdir", path);
}

int blobfs_rename(const char* from, const char* to, unsigned int flags) {
    (void)to;
    (void)flags;
    return BlobFS::instance().reject("rename", from);
}

int blobfs_symlink(const char* target, const char* path) {
    (void)target;
    return BlobFS::instance().reject("symlink", path);
}

int blobfs_link(const char* from, const char* to) {
    (void)from;
    return BlobFS::instance().reject("link", to);
}

int blobfs_truncate(const char* path, off_t size, fuse_file_info* fi) {
    (void)size;
    (void)fi;
    return BlobFS::instance().reject("truncate", path);
}

int blobfs_chmod(const char* path, mode_t mode, fuse_file_info* fi) {
    (void)mode;
    (void)fi;
    return BlobFS::instance().reject("chmod", path);
}

int blobfs_chown(const char* path, uid_t uid, gid_t gid, fuse_file_info* fi) {
    (void)uid;
    (void)gid;
    (void)fi;
    return BlobFS::instance().reject("chown", path);
}

int blobfs_utimens(const char* path, const struct timespec tv[2],
                   fuse_file_info* fi) {
    (void)tv;
    (void)fi;
    return BlobFS::instance().reject("utimens", path);
}

int blobfs_setxattr(const char* path, const char* name, const char* value,
                    size_t size, int flags) {
    (void)name;
    (void)value;
    (void)size;
    (void)flags;
    return BlobFS::instance().reject("setxattr", path);
}

int blobfs_removexattr(const char* path, const char* name) {
    (void)name;
    return BlobFS::instance().reject("removexattr", path);
}

void* blobfs_init(fuse_conn_info* conn, fuse_config* cfg) {
    (void)conn;

    // Row sets change underneath the mount; never let the kernel cache them
    cfg->kernel_cache = 0;
    cfg->entry_timeout = 0;
    cfg->attr_timeout = 0;
    cfg->negative_timeout = 0;

    return nullptr;
}

void blobfs_destroy(void* private_data) {
    (void)private_data;
    BlobFS::instance().shutdown();
}

}  // extern "C"

const fuse_operations& getFuseOperations() {
    static fuse_operations ops = {};

    ops.getattr = blobfs_getattr;
    ops.readdir = blobfs_readdir;
    ops.open = blobfs_open;
    ops.opendir = blobfs_opendir;
    ops.read = blobfs_read;
    ops.statfs = blobfs_statfs;
    ops.write = blobfs_write;
    ops.create = blobfs_create;
    ops.mknod = blobfs_mknod;
    ops.unlink = blobfs_unlink;
    ops.mkdir = blobfs_mkdir;
    ops.rmdir = blobfs_rmdir;
    ops.rename = blobfs_rename;
    ops.symlink = blobfs_symlink;
    ops.link = blobfs_link;
    ops.truncate = blobfs_truncate;
    ops.chmod = blobfs_chmod;
    ops.chown = blobfs_chown;
    ops.utimens = blobfs_utimens;
    ops.setxattr = blobfs_setxattr;
    ops.removexattr = blobfs_removexattr;
    ops.init = blobfs_init;
    ops.destroy = blobfs_destroy;

    return ops;
}

}  // namespace blobfs
