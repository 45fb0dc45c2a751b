#include <filesystem>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

#include <filereg/error/RegistryError.hpp>
#include <filereg/record/FileRecordCodec.hpp>
#include <filereg/repository/FileRegistry.hpp>
#include <filereg/service/FileService.hpp>
#include <filereg/util/FileOps.hpp>

using namespace FileReg;

// =============================================================================
// Helper Macros for Walkthrough Output
// =============================================================================

#define TEST_SECTION(name) std::cout << "\n=== " << name << " ===\n"
#define TEST_CASE(name) std::cout << "\n--- " << name << " ---\n"
#define TEST_PASS(msg) std::cout << "[PASS] " << msg << "\n"
#define TEST_FAIL(msg) std::cout << "[FAIL] " << msg << "\n"
#define CHECK_EC(ec, context)                                                                      \
    if (ec) {                                                                                      \
        TEST_FAIL(context << ": " << ec.message());                                                \
        return;                                                                                    \
    }

namespace {

const std::string kRegistryDir = "./example_data/registry";
const std::string kFilesDir = "./example_data/files";

void cleanStart() {
    std::error_code ec;
    std::filesystem::remove_all("./example_data", ec);
    if (ec)
        std::cout << "cleanup: " << ec.message() << "\n";
}

} // namespace

// =============================================================================
// Registry Walkthrough
// =============================================================================

void walkRegistry() {
    TEST_SECTION("Registry Walkthrough");
    std::error_code ec;

    FileRegistry registry(kRegistryDir, ec);
    CHECK_EC(ec, "Registry open");

    // =========================================================================
    // 1. Save records (content with delimiter and line breaks)
    // =========================================================================
    TEST_CASE("Save Records");

    auto notes = std::make_shared<FileRecord>("notes.txt", "a|b\nsecond line", kFilesDir, "Work");
    auto todo = std::make_shared<FileRecord>("todo.md", "- buy milk", kFilesDir, "");

    registry.save(notes, ec);
    CHECK_EC(ec, "Save notes");
    TEST_PASS("Saved notes.txt [" << notes->shortId() << "]");

    registry.save(todo, ec);
    CHECK_EC(ec, "Save todo");
    TEST_PASS("Saved todo.md in category '" << todo->category() << "'");

    std::cout << "Encoded line: " << codec::toLine(*notes) << "\n";

    // =========================================================================
    // 2. Reload from disk
    // =========================================================================
    TEST_CASE("Reload From Disk");

    FileRegistry reloaded(kRegistryDir, ec);
    CHECK_EC(ec, "Reopen");
    std::cout << "Count after reopen: " << reloaded.count() << " (expected: 2)\n";

    auto back = reloaded.findById(notes->id());
    if (back && back->content() == notes->content()) {
        TEST_PASS("Content with '|' and newline survived the round trip");
    } else {
        TEST_FAIL("Content changed after reload");
    }

    // =========================================================================
    // 3. Lookups
    // =========================================================================
    TEST_CASE("Lookups");

    if (reloaded.findByIdPrefix(notes->shortId()) == reloaded.findById(notes->id())) {
        TEST_PASS("Short id resolves to the same record");
    } else {
        TEST_FAIL("Short id lookup mismatch");
    }

    if (reloaded.findByFileName("NOTES.TXT")) {
        TEST_PASS("File name lookup ignores case");
    } else {
        TEST_FAIL("File name lookup failed");
    }

    std::cout << "Categories:";
    for (const auto& c : reloaded.categories())
        std::cout << " " << c;
    std::cout << "\n";

    // =========================================================================
    // 4. Delete
    // =========================================================================
    TEST_CASE("Delete");

    bool removed = reloaded.deleteById(todo->id(), ec);
    CHECK_EC(ec, "DeleteById todo");
    if (removed && reloaded.count() == 1) {
        TEST_PASS("todo.md removed, 1 record left");
    } else {
        TEST_FAIL("Delete did not remove the record");
    }

    removed = reloaded.deleteById("no-such-id", ec);
    CHECK_EC(ec, "DeleteById unknown");
    if (!removed) {
        TEST_PASS("Deleting an unknown id is a no-op");
    }

    reloaded.deleteAll(ec);
    CHECK_EC(ec, "DeleteAll");
    std::cout << "\nFinal count: " << reloaded.count() << "\n";
}

// =============================================================================
// Service Walkthrough
// =============================================================================

void walkService() {
    TEST_SECTION("Service Walkthrough");
    std::error_code ec;

    FileRegistry registry(kRegistryDir, ec);
    CHECK_EC(ec, "Registry open");

    SystemClock clock;
    RandomUuidGenerator ids;
    service::FileService service(registry, ids, clock);

    TEST_CASE("Create");
    auto rec = service.createFile("report.txt", "Q3 numbers", kFilesDir, "Finance", ec);
    CHECK_EC(ec, "Create report.txt");
    TEST_PASS("Created " << rec->fullPath());

    auto dup = service.createFile("report.txt", "again", kFilesDir, "", ec);
    if (!dup && ec == ErrorKind::duplicate) {
        TEST_PASS("Duplicate rejected: " << service.lastError());
    } else {
        TEST_FAIL("Duplicate file was accepted");
    }

    auto bad = service.createFile("no_extension", "x", kFilesDir, "", ec);
    if (!bad && ec == ErrorKind::validation) {
        TEST_PASS("Validation: " << service.lastError());
    } else {
        TEST_FAIL("Name without extension was accepted");
    }

    TEST_CASE("Edit, Rename, Move");
    service.updateContent(rec->shortId(), "Q3 numbers (revised)", ec);
    CHECK_EC(ec, "Update content");
    TEST_PASS("Content updated");

    service.renameFile(rec->shortId(), "report_final.txt", ec);
    CHECK_EC(ec, "Rename");
    TEST_PASS("Renamed to " << rec->fileName());

    service.moveFile(rec->shortId(), kFilesDir + "/archive", ec);
    CHECK_EC(ec, "Move");
    TEST_PASS("Moved to " << rec->storagePath());

    std::string live;
    service.readContentFromDisk(*rec, live, ec);
    CHECK_EC(ec, "Read from disk");
    std::cout << "Disk content: " << live << "\n";

    TEST_CASE("Delete");
    service.deleteFile(rec->id(), ec);
    CHECK_EC(ec, "Delete");
    if (!util::pathExists(rec->fullPath()) && registry.count() == 0) {
        TEST_PASS("File and registry entry removed");
    } else {
        TEST_FAIL("Delete left something behind");
    }
}

// =============================================================================
// Main
// =============================================================================

int main() {
    std::cout << "========================================\n";
    std::cout << "    FileReg Walkthrough\n";
    std::cout << "========================================\n";

    cleanStart();
    walkRegistry();
    walkService();

    std::cout << "\n========================================\n";
    std::cout << "    Walkthrough Completed\n";
    std::cout << "========================================\n";

    return 0;
}
