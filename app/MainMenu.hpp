#pragma once
/// @file MainMenu.hpp
/// @brief Interactive numbered menu driving FileService

#include "ConsoleUi.hpp"

#include <filereg/service/FileService.hpp>

#include <istream>
#include <string>

namespace FileReg::app {

/// @brief Read-eval loop over a line-oriented input stream
/// @details Menu keys:
///          1 Create, 2 List All, 3 View, 4 Edit Content, 5 Rename, 6 Move,
///          7 Change Category, 8 Delete, 9 List by Category, 0 Exit.
///          Multi-line content is terminated by a line reading END (any case).
///          End of input leaves the loop as if 0 had been chosen.
class MainMenu {
  public:
    MainMenu(service::FileService& service, ConsoleUi& ui, std::istream& in,
             std::string registryDir);

    /// @brief Runs until the user exits or input ends
    void run();

    /// @brief Handles one menu choice
    /// @return false when the choice ends the loop
    bool dispatch(const std::string& choice);

  private:
    void printMenu();

    void handleCreate();
    void handleListAll();
    void handleView();
    void handleEditContent();
    void handleRename();
    void handleMove();
    void handleChangeCategory();
    void handleDelete();
    void handleListByCategory();

    /// @brief Prompts for an id / short id / file name and resolves it
    service::FileService::RecordPtr askForRecord();

    /// @brief Reads one trimmed line; empty string at end of input
    std::string readLine();

    /// @brief Reads lines until END; joined with LF
    std::string readMultiLine();

    /// @brief Reports a failed service call
    void reportFailure(const std::error_code& ec);

    service::FileService& service_;
    ConsoleUi& ui_;
    std::istream& in_;
    std::string registryDir_;
};

} // namespace FileReg::app
