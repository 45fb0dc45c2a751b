#include "MainMenu.hpp"

#include <filereg/error/RegistryError.hpp>
#include <filereg/util/textFormatUtil.hpp>

#include <spdlog/spdlog.h>

namespace FileReg::app {

MainMenu::MainMenu(service::FileService& service, ConsoleUi& ui, std::istream& in,
                   std::string registryDir)
    : service_(service), ui_(ui), in_(in), registryDir_(std::move(registryDir)) {}

void MainMenu::run() {
    ui_.banner("FILE MANAGEMENT SYSTEM");
    ui_.info("Registry lives in: " + registryDir_);
    ui_.info("Type a menu number and press Enter.");

    while (true) {
        printMenu();
        ui_.prompt("Your choice: ");
        std::string choice = readLine();
        if (!in_) {
            // 입력 스트림 종료(EOF)는 종료 선택과 동일하게 처리한다.
            ui_.blankLine();
            choice = "0";
        }
        if (!dispatch(choice))
            break;
    }
}

bool MainMenu::dispatch(const std::string& choice) {
    spdlog::debug("MainMenu: choice '{}'", choice);
    if (choice == "1")
        handleCreate();
    else if (choice == "2")
        handleListAll();
    else if (choice == "3")
        handleView();
    else if (choice == "4")
        handleEditContent();
    else if (choice == "5")
        handleRename();
    else if (choice == "6")
        handleMove();
    else if (choice == "7")
        handleChangeCategory();
    else if (choice == "8")
        handleDelete();
    else if (choice == "9")
        handleListByCategory();
    else if (choice == "0") {
        ui_.banner("GOODBYE!");
        return false;
    } else
        ui_.warning("Invalid choice. Please enter 0-9.");
    return true;
}

void MainMenu::printMenu() {
    ui_.blankLine();
    ui_.separator();
    ui_.info("MAIN MENU");
    ui_.separator();
    ui_.menuItem("1", "Create File");
    ui_.menuItem("2", "List All Files");
    ui_.menuItem("3", "View File");
    ui_.menuItem("4", "Edit File Content");
    ui_.menuItem("5", "Rename File");
    ui_.menuItem("6", "Move File");
    ui_.menuItem("7", "Change Category");
    ui_.menuItem("8", "Delete File");
    ui_.menuItem("9", "List by Category");
    ui_.separator();
    ui_.menuItem("0", "Exit");
    ui_.separator();
}

void MainMenu::handleCreate() {
    ui_.subHeader("Create New File");

    ui_.prompt("File name (e.g. notes.txt)              : ");
    std::string name = readLine();
    ui_.prompt("Storage path (directory)                : ");
    std::string path = readLine();
    ui_.prompt("Category (or press Enter for 'General') : ");
    std::string category = readLine();

    ui_.info("Enter file content  (type END on a new line to finish):");
    std::string content = readMultiLine();

    std::error_code ec;
    auto rec = service_.createFile(name, content, path, category, ec);
    if (!rec) {
        reportFailure(ec);
        return;
    }
    ui_.success("File created successfully!");
    ui_.printDetail(*rec);
}

void MainMenu::handleListAll() {
    ui_.subHeader("All Files");
    auto all = service_.readAll();
    ui_.printTable(all);
    ui_.info("Total files: " + std::to_string(all.size()));
}

void MainMenu::handleView() {
    ui_.subHeader("View File");
    auto rec = askForRecord();
    if (!rec)
        return;

    // 화면에는 디스크의 최신 내용을 보여준다 (레지스트리 사본은 오래됐을 수 있음).
    std::error_code ec;
    if (!service_.refreshContent(rec, ec)) {
        reportFailure(ec);
        return;
    }
    ui_.printDetail(*rec);
}

void MainMenu::handleEditContent() {
    ui_.subHeader("Edit File Content");
    auto rec = askForRecord();
    if (!rec)
        return;

    ui_.info("Current content:");
    ui_.separator();
    ui_.printContent(rec->content());
    ui_.separator();

    ui_.info("Enter NEW content (type END on a new line to finish):");
    std::string newContent = readMultiLine();

    std::error_code ec;
    if (!service_.updateContent(rec->id(), newContent, ec)) {
        reportFailure(ec);
        return;
    }
    ui_.success("Content updated successfully!");
}

void MainMenu::handleRename() {
    ui_.subHeader("Rename File");
    auto rec = askForRecord();
    if (!rec)
        return;

    ui_.info("Current name: " + rec->fileName());
    ui_.prompt("New file name: ");
    std::string newName = readLine();

    std::error_code ec;
    if (!service_.renameFile(rec->id(), newName, ec)) {
        reportFailure(ec);
        return;
    }
    ui_.success("File renamed to: " + newName);
}

void MainMenu::handleMove() {
    ui_.subHeader("Move File");
    auto rec = askForRecord();
    if (!rec)
        return;

    ui_.info("Current path: " + rec->storagePath());
    ui_.prompt("New storage path (directory): ");
    std::string newPath = readLine();

    std::error_code ec;
    if (!service_.moveFile(rec->id(), newPath, ec)) {
        reportFailure(ec);
        return;
    }
    ui_.success("File moved to: " + newPath);
}

void MainMenu::handleChangeCategory() {
    ui_.subHeader("Change Category");
    auto rec = askForRecord();
    if (!rec)
        return;

    ui_.info("Current category: " + rec->category());
    ui_.prompt("New category: ");
    std::string newCategory = readLine();

    std::error_code ec;
    if (!service_.updateCategory(rec->id(), newCategory, ec)) {
        reportFailure(ec);
        return;
    }
    ui_.success("Category updated to: " + rec->category());
}

void MainMenu::handleDelete() {
    ui_.subHeader("Delete File");
    auto rec = askForRecord();
    if (!rec)
        return;

    ui_.warning("You are about to DELETE: " + rec->fileName() + "  at  " + rec->storagePath());
    ui_.prompt("Confirm? (yes / no): ");
    std::string confirm = util::toLower(readLine());

    if (confirm != "yes" && confirm != "y") {
        ui_.info("Deletion cancelled.");
        return;
    }

    std::error_code ec;
    if (!service_.deleteFile(rec->id(), ec)) {
        reportFailure(ec);
        return;
    }
    ui_.success("File deleted successfully.");
}

void MainMenu::handleListByCategory() {
    ui_.subHeader("List by Category");

    auto categories = service_.categories();
    if (categories.empty()) {
        ui_.warning("No categories exist yet.");
        return;
    }

    ui_.info("Available categories:");
    for (const auto& c : categories)
        ui_.bullet(c);

    ui_.prompt("Enter category name: ");
    std::string category = readLine();
    ui_.printTable(service_.readByCategory(category));
}

service::FileService::RecordPtr MainMenu::askForRecord() {
    ui_.prompt("Enter file ID (first 8 chars) or file name: ");
    std::string input = readLine();

    std::error_code ec;
    auto rec = service_.resolve(input, ec);
    if (!rec)
        reportFailure(ec);
    return rec;
}

std::string MainMenu::readLine() {
    std::string line;
    if (!std::getline(in_, line))
        return std::string();
    return util::trim(line);
}

std::string MainMenu::readMultiLine() {
    std::string text;
    bool first = true;
    std::string line;
    while (std::getline(in_, line)) {
        if (!line.empty() && line.back() == '\r')
            line.pop_back();
        if (util::iequals(util::trim(line), "END"))
            break;
        if (!first)
            text += '\n';
        text += line;
        first = false;
    }
    return text;
}

void MainMenu::reportFailure(const std::error_code& ec) {
    const std::string& msg = service_.lastError();
    ui_.error(msg.empty() ? ec.message() : msg);
    if (ec == Errc::partially_applied) {
        ui_.warning("The file on disk was changed but the registry still holds the old entry.");
    }
}

} // namespace FileReg::app
