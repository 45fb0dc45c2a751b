/**
 * @file FilePermissionTest.cpp
 * @brief Integration tests for unusable registry locations and unreadable registry files
 */

#include <gtest/gtest.h>
#include <memory>
#include <sys/stat.h>

#include <filereg/error/RegistryError.hpp>
#include <filereg/repository/FileRegistry.hpp>
#include <filereg/util/FileOps.hpp>

#include "support/TestDoubles.hpp"

using namespace FileReg;
using FileRegTest::ScratchDir;

class FilePermissionTest : public ::testing::Test {
  protected:
    void SetUp() override {
        std::error_code ec;
        ASSERT_TRUE(util::makeDirectories(dir_.path(), ec));
    }

    ScratchDir dir_{"./test_permission_dir"};
};

// 파일이 디렉터리 자리를 차지하고 있으면 root 권한에서도 open이 실패한다.
TEST_F(FilePermissionTest, DirectoryPathOccupiedByFile) {
    std::error_code ec;
    const std::string blocker = dir_.sub("blocker");
    ASSERT_TRUE(util::writeTextFile(blocker, "", ec));

    FileRegistry repo(blocker, ec);
    EXPECT_TRUE(ec);
    EXPECT_EQ(ec, Errc::storage_failure);
    EXPECT_FALSE(repo.isOpen());
    EXPECT_FALSE(repo.lastError().empty());
}

TEST_F(FilePermissionTest, ParentOccupiedByFile) {
    std::error_code ec;
    const std::string blocker = dir_.sub("blocker");
    ASSERT_TRUE(util::writeTextFile(blocker, "", ec));

    FileRegistry repo(blocker + "/nested", ec);
    EXPECT_EQ(ec, ErrorKind::storage);
    EXPECT_FALSE(repo.isOpen());
}

TEST_F(FilePermissionTest, BackingPathIsDirectory) {
    std::error_code ec;
    ASSERT_TRUE(util::makeDirectories(dir_.sub("fms_registry.dat"), ec));

    FileRegistry repo(dir_.path(), ec);
    EXPECT_EQ(ec, Errc::storage_failure);
    EXPECT_FALSE(repo.isOpen());
}

TEST_F(FilePermissionTest, ReopenAfterFailureRecovers) {
    std::error_code ec;
    const std::string blocker = dir_.sub("blocker");
    ASSERT_TRUE(util::writeTextFile(blocker, "", ec));

    FileRegistry repo(blocker, ec);
    ASSERT_TRUE(ec);

    ASSERT_TRUE(repo.open(dir_.sub("good"), ec)) << repo.lastError();
    EXPECT_TRUE(repo.isOpen());
    auto r = std::make_shared<FileRecord>("a.txt", "", "/d", "");
    EXPECT_TRUE(repo.save(r, ec));
}
