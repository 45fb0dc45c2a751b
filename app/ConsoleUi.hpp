#pragma once
/// @file ConsoleUi.hpp
/// @brief Terminal rendering of records and status messages

#include <filereg/record/FileRecord.hpp>

#include <memory>
#include <ostream>
#include <string>
#include <vector>

namespace FileReg::app {

/// @brief Formatted, optionally coloured output on one stream
class ConsoleUi {
  public:
    ConsoleUi(std::ostream& out, bool color);

    void banner(const std::string& title);
    void subHeader(const std::string& text);
    void separator();
    void menuItem(const std::string& key, const std::string& label);

    void success(const std::string& msg); ///< "[OK]"
    void error(const std::string& msg);   ///< "[!!]"
    void info(const std::string& msg);    ///< "[i]"
    void warning(const std::string& msg); ///< "[!]"

    /// @brief Prints a label without a line break
    void prompt(const std::string& label);

    /// @brief One row per record: short id, name, category, created, path
    void printTable(const std::vector<std::shared_ptr<FileRecord>>& records);

    /// @brief Full field listing including the content
    void printDetail(const FileRecord& record);

    /// @brief Content lines indented for display
    void printContent(const std::string& content);

    void bullet(const std::string& text);
    void blankLine();

    /// @brief "dd-Mon-YYYY HH:MM" in local time
    static std::string displayTime(Timestamp ts);

    /// @brief Cuts @p s to @p max characters, ending with "..."
    static std::string truncate(const std::string& s, size_t max);

  private:
    std::string paint(const char* code, const std::string& text) const;

    std::ostream& out_;
    bool color_;
};

} // namespace FileReg::app
