/**
 * @file AtomicPersistTest.cpp
 * @brief Integration tests for the temp-file rewrite of the registry file
 * @details 임시 파일 쓰기/교체 단계에서 실패를 주입하고, 기존 레지스트리 파일과
 *          최신 데이터가 어디에 남는지 확인한다.
 */

#include <gtest/gtest.h>
#include <memory>

#include <filereg/error/RegistryError.hpp>
#include <filereg/record/FileRecordCodec.hpp>
#include <filereg/repository/FileRegistry.hpp>
#include <filereg/util/FileOps.hpp>

#include "support/TestDoubles.hpp"

using namespace FileReg;
using FileRegTest::ManualClock;
using FileRegTest::ScratchDir;
using FileRegTest::SequenceIdGenerator;

namespace {

/// Registry whose final replace step can be made to fail on demand
class FailingReplaceRegistry : public FileRegistry {
  public:
    using FileRegistry::FileRegistry;

    bool failReplace = false;
    int replaceCalls = 0;

  protected:
    bool replaceBackingFile(const std::string& tmpPath, const std::string& finalPath,
                            std::error_code& ec) override {
        ++replaceCalls;
        if (failReplace) {
            ec = std::make_error_code(std::errc::io_error);
            return false;
        }
        return FileRegistry::replaceBackingFile(tmpPath, finalPath, ec);
    }
};

std::string slurp(const std::string& path) {
    std::string out;
    std::error_code ec;
    EXPECT_TRUE(util::readWholeFile(path, out, ec)) << path << ": " << ec.message();
    return out;
}

} // namespace

class AtomicPersistTest : public ::testing::Test {
  protected:
    void SetUp() override {
        repo_ = std::make_unique<FailingReplaceRegistry>(dir_.path(), ec_);
        ASSERT_FALSE(ec_) << ec_.message();

        first_ = std::make_shared<FileRecord>("first.txt", "v1", "/d", "", ids_, clock_);
        ASSERT_TRUE(repo_->save(first_, ec_));
        committed_ = slurp(repo_->registryPath());
    }

    ScratchDir dir_{"./test_atomic_dir"};
    ManualClock clock_;
    SequenceIdGenerator ids_;
    std::error_code ec_;
    std::unique_ptr<FailingReplaceRegistry> repo_;
    std::shared_ptr<FileRecord> first_;
    std::string committed_;
};

TEST_F(AtomicPersistTest, TempWriteFailureLeavesBackingFileUntouched) {
    // 임시 파일 경로를 디렉터리로 막아 open(O_WRONLY)이 실패하게 만든다.
    std::error_code ec;
    ASSERT_TRUE(util::makeDirectories(repo_->tempPath(), ec));

    auto second = std::make_shared<FileRecord>("second.txt", "v1", "/d", "", ids_, clock_);
    EXPECT_FALSE(repo_->save(second, ec_));
    EXPECT_EQ(ec_, Errc::storage_failure);
    EXPECT_EQ(ec_, ErrorKind::storage);
    EXPECT_FALSE(repo_->lastError().empty());
    EXPECT_EQ(repo_->replaceCalls, 1);

    EXPECT_EQ(slurp(repo_->registryPath()), committed_);

    // 메모리 상태는 디스크보다 앞서 있다.
    EXPECT_EQ(repo_->count(), 2u);
}

TEST_F(AtomicPersistTest, ReplaceFailureKeepsLatestDataInTempFile) {
    repo_->failReplace = true;

    first_->setContent("v2", clock_.now() + std::chrono::seconds(5));
    EXPECT_FALSE(repo_->update(first_, ec_));
    EXPECT_EQ(ec_, Errc::storage_failure);
    EXPECT_NE(repo_->lastError().find(repo_->tempPath()), std::string::npos);

    EXPECT_EQ(slurp(repo_->registryPath()), committed_);
    ASSERT_TRUE(util::pathExists(repo_->tempPath()));
    EXPECT_EQ(slurp(repo_->tempPath()), codec::toLine(*first_) + "\n");
}

TEST_F(AtomicPersistTest, PersistRetrySucceedsAfterFailure) {
    repo_->failReplace = true;
    first_->setCategory("Work", clock_.now());
    EXPECT_FALSE(repo_->update(first_, ec_));

    repo_->failReplace = false;
    ASSERT_TRUE(repo_->persist(ec_)) << repo_->lastError();
    EXPECT_TRUE(repo_->lastError().empty());
    EXPECT_FALSE(util::pathExists(repo_->tempPath()));

    FileRegistry reloaded(dir_.path(), ec_);
    ASSERT_FALSE(ec_);
    EXPECT_EQ(reloaded.findById(first_->id())->category(), "Work");
}

TEST_F(AtomicPersistTest, StaleTempFileIsOverwritten) {
    std::error_code ec;
    ASSERT_TRUE(util::writeTextFile(repo_->tempPath(), "garbage that is not a record\n", ec));

    auto second = std::make_shared<FileRecord>("second.txt", "", "/d", "", ids_, clock_);
    ASSERT_TRUE(repo_->save(second, ec_));
    EXPECT_FALSE(util::pathExists(repo_->tempPath()));

    FileRegistry reloaded(dir_.path(), ec_);
    ASSERT_FALSE(ec_) << reloaded.lastError();
    EXPECT_EQ(reloaded.count(), 2u);
}

TEST_F(AtomicPersistTest, BackingFileNeverHoldsPartialLines) {
    for (int i = 0; i < 20; ++i) {
        auto r = std::make_shared<FileRecord>("f" + std::to_string(i) + ".txt",
                                              std::string(1000, 'x'), "/d", "", ids_, clock_);
        ASSERT_TRUE(repo_->save(r, ec_));

        std::string text = slurp(repo_->registryPath());
        ASSERT_FALSE(text.empty());
        EXPECT_EQ(text.back(), '\n');

        FileRegistry probe(dir_.path(), ec_);
        ASSERT_FALSE(ec_) << probe.lastError();
        EXPECT_EQ(probe.count(), static_cast<size_t>(i + 2));
    }
}
