#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include "PathResolver.hpp"
#include "ErrorHandler.hpp"
#include "MockBackends.hpp"

using namespace blobfs;
using ::testing::_;
using ::testing::ElementsAre;
using ::testing::NiceMock;
using ::testing::Return;

class PathResolverTest : public ::testing::Test {
protected:
    void SetUp() override {
        repository_.name = "repository";
        repository_.columns = {
            {"id", "INTEGER", Affinity::Numeric, 1},
            {"name", "TEXT", Affinity::Text, 0},
        };

        link_.name = "repository_source";
        link_.columns = {
            {"source_hash", "TEXT", Affinity::Text, 2},
            {"repository_id", "INTEGER", Affinity::Numeric, 1},
        };

        ON_CALL(executor_, tableExists(_)).WillByDefault(Return(false));
        ON_CALL(executor_, tableExists("repository")).WillByDefault(Return(true));
        ON_CALL(executor_, tableExists("repository_source")).WillByDefault(Return(true));
        ON_CALL(schema_, describeTable("repository")).WillByDefault(Return(repository_));
        ON_CALL(schema_, describeTable("repository_source")).WillByDefault(Return(link_));
        ON_CALL(executor_, rowExists(_, _)).WillByDefault(Return(false));
    }

    TableInfo repository_;
    TableInfo link_;
    NiceMock<MockSchemaIntrospector> schema_;
    NiceMock<MockQueryExecutor> executor_;
    PathResolver resolver_{schema_, executor_};

    void expectError(const std::string& path, FsError expected) {
        try {
            resolver_.resolve(path);
            FAIL() << "expected FsException for " << path;
        } catch (const FsException& e) {
            EXPECT_EQ(e.error(), expected) << path;
        }
    }
};

TEST_F(PathResolverTest, SplitPath) {
    EXPECT_TRUE(PathResolver::splitPath("/").empty());
    EXPECT_TRUE(PathResolver::splitPath("").empty());
    EXPECT_THAT(PathResolver::splitPath("/a/b/c"), ElementsAre("a", "b", "c"));
    EXPECT_THAT(PathResolver::splitPath("//a//b/"), ElementsAre("a", "b"));
}

TEST_F(PathResolverTest, RootPath) {
    Locator loc = resolver_.resolve("/");

    EXPECT_EQ(loc.kind, LocatorKind::Root);
    EXPECT_TRUE(loc.isDirectory());
}

TEST_F(PathResolverTest, TablePath) {
    Locator loc = resolver_.resolve("/repository");

    EXPECT_EQ(loc.kind, LocatorKind::TableDir);
    EXPECT_EQ(loc.table.name, "repository");
    EXPECT_EQ(loc.table.columns.size(), 2u);
    EXPECT_TRUE(loc.isDirectory());
}

TEST_F(PathResolverTest, UnknownTable) {
    EXPECT_CALL(schema_, describeTable(_)).Times(0);

    expectError("/nope", FsError::NotFound);
}

TEST_F(PathResolverTest, RowPath) {
    EXPECT_CALL(executor_, rowExists(_, ElementsAre("7"))).WillOnce(Return(true));

    Locator loc = resolver_.resolve("/repository/7");

    EXPECT_EQ(loc.kind, LocatorKind::RowDir);
    EXPECT_THAT(loc.key, ElementsAre("7"));
    EXPECT_EQ(loc.encodedKey, "7");
    EXPECT_TRUE(loc.isDirectory());
}

TEST_F(PathResolverTest, CompositeRowPathKeepsSegmentOrder) {
    // Segment components follow key ordinal order, not declaration order
    EXPECT_CALL(executor_, rowExists(_, ElementsAre("1", "abc"))).WillOnce(Return(true));

    Locator loc = resolver_.resolve("/repository_source/1,abc");

    EXPECT_EQ(loc.kind, LocatorKind::RowDir);
    EXPECT_THAT(loc.key, ElementsAre("1", "abc"));
}

TEST_F(PathResolverTest, MissingRow) {
    expectError("/repository/999", FsError::NotFound);
}

TEST_F(PathResolverTest, WrongArityIsInvalidArgument) {
    EXPECT_CALL(executor_, rowExists(_, _)).Times(0);

    expectError("/repository/1,2", FsError::InvalidArgument);
    expectError("/repository_source/1", FsError::InvalidArgument);
}

TEST_F(PathResolverTest, FieldPath) {
    ON_CALL(executor_, rowExists(_, ElementsAre("7"))).WillByDefault(Return(true));

    Locator loc = resolver_.resolve("/repository/7/name");

    EXPECT_EQ(loc.kind, LocatorKind::FieldFile);
    EXPECT_EQ(loc.column.name, "name");
    EXPECT_EQ(loc.column.affinity, Affinity::Text);
    EXPECT_FALSE(loc.isDirectory());
}

TEST_F(PathResolverTest, UnknownColumn) {
    ON_CALL(executor_, rowExists(_, ElementsAre("7"))).WillByDefault(Return(true));

    expectError("/repository/7/missing", FsError::NotFound);
}

TEST_F(PathResolverTest, TooDeep) {
    ON_CALL(executor_, rowExists(_, _)).WillByDefault(Return(true));

    expectError("/repository/7/name/extra", FsError::NotFound);
}

TEST_F(PathResolverTest, ResolutionIsNotCached) {
    EXPECT_CALL(executor_, tableExists("repository")).Times(2).WillRepeatedly(Return(true));

    resolver_.resolve("/repository");
    resolver_.resolve("/repository");
}

TEST_F(PathResolverTest, KindToString) {
    EXPECT_EQ(PathResolver::kindToString(LocatorKind::Root), "Root");
    EXPECT_EQ(PathResolver::kindToString(LocatorKind::TableDir), "TableDir");
    EXPECT_EQ(PathResolver::kindToString(LocatorKind::RowDir), "RowDir");
    EXPECT_EQ(PathResolver::kindToString(LocatorKind::FieldFile), "FieldFile");
}
