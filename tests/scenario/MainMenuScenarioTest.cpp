/**
 * @file MainMenuScenarioTest.cpp
 * @brief Scenario tests driving the interactive menu with scripted input
 */

#include <gtest/gtest.h>
#include <memory>
#include <sstream>

#include <filereg/repository/FileRegistry.hpp>
#include <filereg/service/FileService.hpp>
#include <filereg/util/FileOps.hpp>

#include "app/ConsoleUi.hpp"
#include "app/MainMenu.hpp"
#include "support/TestDoubles.hpp"

using namespace FileReg;
using FileRegTest::ManualClock;
using FileRegTest::ScratchDir;
using FileRegTest::SequenceIdGenerator;

class MainMenuScenarioTest : public ::testing::Test {
  protected:
    void SetUp() override {
        registry_ = std::make_unique<FileRegistry>(root_.sub("registry"), ec_);
        ASSERT_FALSE(ec_) << ec_.message();
        service_ = std::make_unique<service::FileService>(*registry_, ids_, clock_);
    }

    /// Runs the menu over @p script and returns everything it printed
    std::string run(const std::string& script) {
        std::istringstream in(script);
        std::ostringstream out;
        app::ConsoleUi ui(out, false);
        app::MainMenu menu(*service_, ui, in, root_.sub("registry"));
        menu.run();
        return out.str();
    }

    std::string docs() const { return root_.sub("docs"); }

    ScratchDir root_{"./test_menu_scenario"};
    ManualClock clock_;
    SequenceIdGenerator ids_{"abcdef01"};
    std::error_code ec_;
    std::unique_ptr<FileRegistry> registry_;
    std::unique_ptr<service::FileService> service_;
};

TEST_F(MainMenuScenarioTest, ExitImmediately) {
    std::string out = run("0\n");
    EXPECT_NE(out.find("FILE MANAGEMENT SYSTEM"), std::string::npos);
    EXPECT_NE(out.find("GOODBYE!"), std::string::npos);
}

TEST_F(MainMenuScenarioTest, EndOfInputExits) {
    std::string out = run("");
    EXPECT_NE(out.find("GOODBYE!"), std::string::npos);
}

TEST_F(MainMenuScenarioTest, InvalidChoice) {
    std::string out = run("42\n0\n");
    EXPECT_NE(out.find("Invalid choice. Please enter 0-9."), std::string::npos);
}

TEST_F(MainMenuScenarioTest, CreateThenList) {
    std::string out = run("1\nnotes.txt\n" + docs() + "\nWork\nfirst line\nsecond|line\nEND\n" +
                          "2\n0\n");

    EXPECT_NE(out.find("[OK]  File created successfully!"), std::string::npos) << out;
    EXPECT_NE(out.find("Total files: 1"), std::string::npos);
    EXPECT_NE(out.find("abcdef01"), std::string::npos);

    std::string disk;
    std::error_code ec;
    ASSERT_TRUE(util::readWholeFile(docs() + "/notes.txt", disk, ec));
    EXPECT_EQ(disk, "first line\nsecond|line");
}

TEST_F(MainMenuScenarioTest, CreateWithBadNameShowsError) {
    std::string out = run("1\nREADME\n" + docs() + "\n\nbody\nend\n0\n");
    EXPECT_NE(out.find("[!!]  File name must include an extension (e.g. notes.txt)."),
              std::string::npos)
        << out;
    EXPECT_EQ(registry_->count(), 0u);
}

TEST_F(MainMenuScenarioTest, ViewShowsDetail) {
    auto rec = service_->createFile("a.txt", "hello", docs(), "", ec_);
    ASSERT_NE(rec, nullptr);

    std::string out = run("3\na.txt\n0\n");
    EXPECT_NE(out.find("File Details"), std::string::npos);
    EXPECT_NE(out.find(rec->id()), std::string::npos);
    EXPECT_NE(out.find("    hello"), std::string::npos);
}

TEST_F(MainMenuScenarioTest, UnknownRecordReported) {
    std::string out = run("3\nmissing.txt\n0\n");
    EXPECT_NE(out.find("No file found with ID or name: missing.txt"), std::string::npos) << out;
}

TEST_F(MainMenuScenarioTest, EditRenameMoveCategory) {
    auto rec = service_->createFile("a.txt", "v1", docs(), "", ec_);
    ASSERT_NE(rec, nullptr);
    const std::string sid = rec->shortId();
    const std::string archive = root_.sub("archive");

    std::string out = run("4\n" + sid + "\nv2\nEND\n" + "5\n" + sid + "\nb.txt\n" + "6\n" + sid +
                          "\n" + archive + "\n" + "7\n" + sid + "\nPersonal\n" + "0\n");

    EXPECT_NE(out.find("Content updated successfully!"), std::string::npos) << out;
    EXPECT_NE(out.find("File renamed to: b.txt"), std::string::npos);
    EXPECT_NE(out.find("File moved to: " + archive), std::string::npos);
    EXPECT_NE(out.find("Category updated to: Personal"), std::string::npos);

    EXPECT_EQ(rec->content(), "v2");
    EXPECT_EQ(rec->fileName(), "b.txt");
    EXPECT_EQ(rec->storagePath(), archive);
    EXPECT_EQ(rec->category(), "Personal");
    EXPECT_TRUE(util::pathExists(archive + "/b.txt"));
}

TEST_F(MainMenuScenarioTest, DeleteNeedsConfirmation) {
    auto rec = service_->createFile("a.txt", "x", docs(), "", ec_);
    ASSERT_NE(rec, nullptr);

    std::string out = run("8\na.txt\nno\n0\n");
    EXPECT_NE(out.find("Deletion cancelled."), std::string::npos);
    EXPECT_EQ(registry_->count(), 1u);

    out = run("8\na.txt\nY\n0\n");
    EXPECT_NE(out.find("File deleted successfully."), std::string::npos);
    EXPECT_EQ(registry_->count(), 0u);
    EXPECT_FALSE(util::pathExists(docs() + "/a.txt"));
}

TEST_F(MainMenuScenarioTest, ListByCategory) {
    service_->createFile("a.txt", "", docs(), "Work", ec_);
    service_->createFile("b.txt", "", docs(), "Home", ec_);

    std::string out = run("9\nwork\n0\n");
    EXPECT_NE(out.find("* Home"), std::string::npos);
    EXPECT_NE(out.find("* Work"), std::string::npos);
    EXPECT_NE(out.find("a.txt"), std::string::npos);
    EXPECT_EQ(out.find("b.txt"), std::string::npos);
}

TEST_F(MainMenuScenarioTest, EmptyListWarns) {
    std::string out = run("2\n0\n");
    EXPECT_NE(out.find("No files found."), std::string::npos);
}
