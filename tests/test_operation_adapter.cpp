#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include "OperationAdapter.hpp"
#include <fcntl.h>
#include <unistd.h>
#include <filesystem>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

using namespace blobfs;
using ::testing::ElementsAre;
using ::testing::UnorderedElementsAre;

namespace {

const char* const kHash = "9f2c1e";
const char* const kRepo = "/repository/torvalds,linux";
const char* const kLink = "/repository_source/torvalds,linux,9f2c1e,main.c";
const size_t kSourceSize = 9567;

}  // namespace

class OperationAdapterTest : public ::testing::Test {
protected:
    void SetUp() override {
        dbPath_ = (std::filesystem::temp_directory_path() /
                   ("blobfs_adapter_test_" + std::to_string(::getpid()) + ".db")).string();
        std::filesystem::remove(dbPath_);

        writer_ = std::make_unique<SQLiteConnection>(dbPath_, false);
        ASSERT_TRUE(writer_->isValid());
        ASSERT_TRUE(writer_->execute(R"(
            CREATE TABLE repository (
                owner TEXT,
                name TEXT,
                description TEXT,
                PRIMARY KEY (owner, name)
            );
            CREATE TABLE source_file (hash TEXT PRIMARY KEY, source BLOB);
            CREATE TABLE repository_source (
                owner TEXT,
                name TEXT,
                hash TEXT,
                path TEXT,
                PRIMARY KEY (owner, name, hash, path)
            );
            CREATE TABLE scratch (note TEXT);
            CREATE TABLE "odd table" ("key col" TEXT PRIMARY KEY);

            INSERT INTO repository VALUES ('torvalds', 'linux', 'kernel');
            INSERT INTO source_file VALUES (
                '9f2c1e', CAST(substr(hex(zeroblob(9567)), 1, 9567) AS BLOB));
            INSERT INTO repository_source VALUES ('torvalds', 'linux', '9f2c1e', 'main.c');
            INSERT INTO "odd table" VALUES ('k');
        )"));
    }

    void TearDown() override {
        adapter_.reset();
        writer_.reset();
        std::filesystem::remove(dbPath_);
    }

    OperationAdapter& mount(bool quoteIdentifiers = true) {
        config_.database.path = dbPath_;
        config_.security.quote_identifiers = quoteIdentifiers;
        adapter_ = std::make_unique<OperationAdapter>(
            std::make_unique<SQLiteConnection>(dbPath_, true), config_);
        return *adapter_;
    }

    static std::string sourcePath() {
        return std::string("/source_file/") + kHash + "/source";
    }

    static std::string readAll(OperationAdapter& fs, const std::string& path) {
        std::string content;
        char buf[4096];
        off_t offset = 0;
        int n;
        while ((n = fs.read(path, buf, sizeof(buf), offset)) > 0) {
            content.append(buf, static_cast<size_t>(n));
            offset += n;
        }
        EXPECT_EQ(n, 0) << path;
        return content;
    }

    std::string dbPath_;
    Config config_;
    std::unique_ptr<SQLiteConnection> writer_;
    std::unique_ptr<OperationAdapter> adapter_;
};

TEST_F(OperationAdapterTest, RequiresOpenConnection) {
    EXPECT_THROW(OperationAdapter(nullptr, config_), std::invalid_argument);
    EXPECT_THROW(OperationAdapter(std::make_unique<SQLiteConnection>(dbPath_ + ".missing", true),
                                  config_),
                 std::invalid_argument);
}

TEST_F(OperationAdapterTest, BrowseRepositoryDatabase) {
    OperationAdapter& fs = mount();

    std::vector<std::string> entries;
    ASSERT_EQ(fs.readdir("/", entries), 0);
    EXPECT_THAT(entries, ElementsAre("odd table", "repository", "repository_source", "source_file"));

    ASSERT_EQ(fs.readdir("/repository", entries), 0);
    EXPECT_THAT(entries, ElementsAre("torvalds,linux"));

    ASSERT_EQ(fs.readdir("/repository_source", entries), 0);
    EXPECT_THAT(entries, ElementsAre("torvalds,linux,9f2c1e,main.c"));

    ASSERT_EQ(fs.readdir(kLink, entries), 0);
    EXPECT_THAT(entries, ElementsAre("owner", "name", "hash", "path"));
    EXPECT_EQ(readAll(fs, std::string(kLink) + "/hash"), kHash);
    EXPECT_EQ(readAll(fs, std::string(kLink) + "/path"), "main.c");

    ASSERT_EQ(fs.readdir("/source_file", entries), 0);
    EXPECT_THAT(entries, ElementsAre(kHash));

    ASSERT_EQ(fs.readdir(std::string("/source_file/") + kHash, entries), 0);
    EXPECT_THAT(entries, ElementsAre("hash", "source"));

    struct stat st;
    ASSERT_EQ(fs.getattr(sourcePath(), &st), 0);
    EXPECT_TRUE(S_ISREG(st.st_mode));
    EXPECT_EQ(st.st_size, static_cast<off_t>(kSourceSize));

    ASSERT_EQ(fs.open(sourcePath(), O_RDONLY), 0);
    EXPECT_EQ(readAll(fs, sourcePath()), std::string(kSourceSize, '0'));

    EXPECT_EQ(fs.open(std::string("/source_file/") + kHash + "/nonexistent_column", O_RDONLY),
              -ENOENT);
}

TEST_F(OperationAdapterTest, EveryListedEntryResolves) {
    ASSERT_TRUE(writer_->execute(R"(
        CREATE TABLE untyped (k PRIMARY KEY, v TEXT);
        CREATE TABLE blobs (k BLOB PRIMARY KEY, v TEXT);
        CREATE TABLE reals (k REAL PRIMARY KEY, v TEXT);
        CREATE TABLE tags (name TEXT PRIMARY KEY);

        INSERT INTO untyped VALUES (5, 'x');
        INSERT INTO blobs VALUES (X'6869', 'y');
        INSERT INTO reals VALUES (1.5, 'z'), (100.0, 'w');
        INSERT INTO tags VALUES (''), ('stable');
        INSERT INTO repository VALUES ('gnu', 'emacs', NULL);
    )"));
    OperationAdapter& fs = mount();

    std::vector<std::string> tables;
    ASSERT_EQ(fs.readdir("/", tables), 0);

    size_t fields = 0;
    for (const auto& table : tables) {
        std::vector<std::string> keys;
        ASSERT_EQ(fs.readdir("/" + table, keys), 0) << table;

        for (const auto& key : keys) {
            std::string row = "/" + table + "/" + key;
            ASSERT_FALSE(key.empty()) << table;

            struct stat st;
            ASSERT_EQ(fs.getattr(row, &st), 0) << row;
            EXPECT_TRUE(S_ISDIR(st.st_mode)) << row;

            std::vector<std::string> columns;
            ASSERT_EQ(fs.readdir(row, columns), 0) << row;
            for (const auto& column : columns) {
                ASSERT_EQ(fs.getattr(row + "/" + column, &st), 0) << row << "/" << column;
                EXPECT_TRUE(S_ISREG(st.st_mode));
                EXPECT_EQ(fs.open(row + "/" + column, O_RDONLY), 0);
                EXPECT_EQ(readAll(fs, row + "/" + column).size(), static_cast<size_t>(st.st_size));
                ++fields;
            }
        }
    }
    EXPECT_GT(fields, 0u);

    EXPECT_EQ(readAll(fs, "/untyped/5/v"), "x");
    EXPECT_EQ(readAll(fs, "/blobs/hi/v"), "y");
    EXPECT_EQ(readAll(fs, "/reals/100.0/v"), "w");

    std::vector<std::string> entries;
    ASSERT_EQ(fs.readdir("/tags", entries), 0);
    EXPECT_THAT(entries, ElementsAre("stable"));
}

TEST_F(OperationAdapterTest, DirectoryAttributes) {
    OperationAdapter& fs = mount();

    for (const char* path : {"/", "/repository", kRepo, kLink}) {
        struct stat st;
        ASSERT_EQ(fs.getattr(path, &st), 0) << path;
        EXPECT_TRUE(S_ISDIR(st.st_mode)) << path;
        EXPECT_EQ(st.st_mode & 0777, 0555u) << path;
    }
}

TEST_F(OperationAdapterTest, FieldAttributesAreReadOnly) {
    OperationAdapter& fs = mount();

    struct stat st;
    ASSERT_EQ(fs.getattr(std::string(kRepo) + "/description", &st), 0);
    EXPECT_EQ(st.st_mode, static_cast<mode_t>(S_IFREG | 0444));
    EXPECT_EQ(st.st_size, 6);
}

TEST_F(OperationAdapterTest, ReadBeyondEndReturnsZero) {
    OperationAdapter& fs = mount();
    std::string path = std::string(kRepo) + "/description";
    char buf[16];

    EXPECT_EQ(fs.read(path, buf, sizeof(buf), 6), 0);
    EXPECT_EQ(fs.read(path, buf, sizeof(buf), 1000), 0);
}

TEST_F(OperationAdapterTest, ReadPartialRange) {
    OperationAdapter& fs = mount();
    char buf[3];

    ASSERT_EQ(fs.read(std::string(kRepo) + "/description", buf, sizeof(buf), 2), 3);
    EXPECT_EQ(std::string(buf, 3), "rne");
}

TEST_F(OperationAdapterTest, NegativeOffsetIsInvalid) {
    OperationAdapter& fs = mount();
    char buf[4];

    EXPECT_EQ(fs.read(std::string(kRepo) + "/name", buf, sizeof(buf), -1), -EINVAL);
}

TEST_F(OperationAdapterTest, MissingEntriesAreNotFound) {
    OperationAdapter& fs = mount();
    struct stat st;

    EXPECT_EQ(fs.getattr("/missing", &st), -ENOENT);
    EXPECT_EQ(fs.getattr("/scratch", &st), -ENOENT);
    EXPECT_EQ(fs.getattr("/repository/torvalds,git", &st), -ENOENT);
    EXPECT_EQ(fs.getattr(std::string(kRepo) + "/missing", &st), -ENOENT);
    EXPECT_EQ(fs.getattr(std::string(kRepo) + "/name/deeper", &st), -ENOENT);
    EXPECT_EQ(fs.getattr("/repository_source/torvalds,linux,9f2c1e,other.c", &st), -ENOENT);
}

TEST_F(OperationAdapterTest, WrongKeyArityIsInvalid) {
    OperationAdapter& fs = mount();
    struct stat st;

    EXPECT_EQ(fs.getattr("/repository/torvalds", &st), -EINVAL);
    EXPECT_EQ(fs.getattr("/repository/torvalds,linux,extra", &st), -EINVAL);
    EXPECT_EQ(fs.getattr("/repository_source/torvalds,linux", &st), -EINVAL);
    EXPECT_EQ(fs.getattr("/source_file/a,b", &st), -EINVAL);
}

TEST_F(OperationAdapterTest, OpenForWritingIsReadOnly) {
    OperationAdapter& fs = mount();
    std::string path = std::string(kRepo) + "/name";

    EXPECT_EQ(fs.open(path, O_WRONLY), -EROFS);
    EXPECT_EQ(fs.open(path, O_RDWR), -EROFS);
    EXPECT_EQ(fs.open(path, O_RDONLY | O_TRUNC), -EROFS);
    EXPECT_EQ(fs.open(sourcePath(), O_WRONLY), -EROFS);
    // Checked before resolution
    EXPECT_EQ(fs.open("/missing", O_WRONLY), -EROFS);
}

TEST_F(OperationAdapterTest, MutationsAreRejected) {
    OperationAdapter& fs = mount();

    for (const char* op : {"create", "write", "unlink", "rmdir", "mkdir", "rename",
                           "truncate", "symlink", "link", "chmod", "chown", "utimens"}) {
        EXPECT_EQ(fs.rejectMutation(op, sourcePath()), -EROFS) << op;
    }
}

TEST_F(OperationAdapterTest, KindMismatches) {
    OperationAdapter& fs = mount();
    std::string field = std::string(kRepo) + "/name";
    std::vector<std::string> entries;
    char buf[4];

    EXPECT_EQ(fs.readdir(field, entries), -ENOTDIR);
    EXPECT_EQ(fs.opendir(field), -ENOTDIR);
    EXPECT_EQ(fs.opendir(kRepo), 0);
    EXPECT_EQ(fs.open("/repository", O_RDONLY), -EISDIR);
    EXPECT_EQ(fs.read(kRepo, buf, sizeof(buf), 0), -EISDIR);
}

TEST_F(OperationAdapterTest, ListingReflectsExternalChanges) {
    OperationAdapter& fs = mount();
    std::vector<std::string> entries;

    ASSERT_EQ(fs.readdir("/repository", entries), 0);
    EXPECT_THAT(entries, ElementsAre("torvalds,linux"));

    ASSERT_TRUE(writer_->execute("INSERT INTO repository VALUES ('git', 'git', 'vcs')"));

    ASSERT_EQ(fs.readdir("/repository", entries), 0);
    EXPECT_THAT(entries, UnorderedElementsAre("torvalds,linux", "git,git"));

    ASSERT_TRUE(writer_->execute("DELETE FROM repository WHERE owner = 'torvalds'"));

    struct stat st;
    EXPECT_EQ(fs.getattr(kRepo, &st), -ENOENT);
}

TEST_F(OperationAdapterTest, NullFieldIsEmptyFile) {
    ASSERT_TRUE(writer_->execute("INSERT INTO repository VALUES ('gnu', 'emacs', NULL)"));
    OperationAdapter& fs = mount();

    struct stat st;
    ASSERT_EQ(fs.getattr("/repository/gnu,emacs/description", &st), 0);
    EXPECT_EQ(st.st_size, 0);
}

TEST_F(OperationAdapterTest, RawIdentifiersSurfaceStoreErrorsAsIO) {
    OperationAdapter& fs = mount(false);
    std::vector<std::string> entries;

    ASSERT_EQ(fs.readdir("/repository", entries), 0);
    EXPECT_THAT(entries, ElementsAre("torvalds,linux"));

    EXPECT_EQ(fs.readdir("/odd table", entries), -EIO);
}

TEST_F(OperationAdapterTest, QuotedIdentifiersHandleOddNames) {
    OperationAdapter& fs = mount(true);
    std::vector<std::string> entries;

    ASSERT_EQ(fs.readdir("/odd table", entries), 0);
    EXPECT_THAT(entries, ElementsAre("k"));
}
