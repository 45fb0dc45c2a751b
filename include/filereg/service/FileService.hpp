#pragma once
/// @file FileService.hpp
/// @brief Per-action orchestration of validation, file operations and registry updates

#include <filereg/record/FileRecord.hpp>
#include <filereg/repository/FileRegistry.hpp>
#include <filereg/util/Clock.hpp>
#include <filereg/util/IdGenerator.hpp>

#include <memory>
#include <string>
#include <system_error>
#include <vector>

namespace FileReg::service {

/// @brief Command layer: one method per user action
/// @details Each mutating action runs in the same order: validate input, change the file on
///          disk, then persist the metadata through the registry. Failures are reported
///          through @p ec with a user-facing message in lastError():
///          - validation / duplicate / not-found codes: nothing was changed
///          - Errc::storage_failure or an errno code: nothing was changed on disk
///          - Errc::partially_applied: the file on disk changed but the registry rewrite
///            failed; the in-memory record already reflects the change and
///            FileRegistry::persist() may be retried
///
///          Methods taking an @p id accept a full id or a short id prefix.
class FileService {
  public:
    using RecordPtr = std::shared_ptr<FileRecord>;

    FileService(FileRegistry& registry, IdGenerator& ids, const Clock& clock);

    /// @brief Writes a new file and registers it
    /// @param storagePath Target directory (trimmed, created when missing)
    /// @param category Blank means FileRecord::kDefaultCategory
    /// @return The registered record; nullptr on failure. On Errc::partially_applied the
    ///         file exists on disk and the record is held in memory but not persisted.
    RecordPtr createFile(const std::string& fileName, const std::string& content,
                         const std::string& storagePath, const std::string& category,
                         std::error_code& ec);

    /// @brief Exact id, then id prefix (newest match first)
    RecordPtr readById(const std::string& id, std::error_code& ec);

    /// @brief Case-insensitive file name lookup
    RecordPtr readByFileName(const std::string& fileName, std::error_code& ec);

    /// @brief Resolves free user input: exact id, then id prefix, then file name
    RecordPtr resolve(const std::string& input, std::error_code& ec);

    std::vector<RecordPtr> readAll() const;
    std::vector<RecordPtr> readByCategory(const std::string& category) const;
    std::vector<std::string> categories() const;

    /// @brief Reads the live file content, ignoring the registry copy
    bool readContentFromDisk(const FileRecord& record, std::string& out, std::error_code& ec);

    /// @brief Pulls the live content into @p record; persists only when it changed
    bool refreshContent(const RecordPtr& record, std::error_code& ec);

    /// @brief Overwrites the file and the registered content
    bool updateContent(const std::string& id, const std::string& newContent,
                       std::error_code& ec);

    /// @brief Renames the file within its directory
    bool renameFile(const std::string& id, const std::string& newFileName, std::error_code& ec);

    /// @brief Moves the file to another directory (created when missing)
    bool moveFile(const std::string& id, const std::string& newStoragePath, std::error_code& ec);

    /// @brief Changes the category; no file I/O
    bool updateCategory(const std::string& id, const std::string& newCategory,
                        std::error_code& ec);

    /// @brief Deletes the file (when still present) and its registry entry
    bool deleteFile(const std::string& id, std::error_code& ec);

    /// @brief Message for the most recent failure
    const std::string& lastError() const { return lastError_; }

  private:
    bool fail(std::error_code& ec, std::error_code code, std::string message);
    RecordPtr failRecord(std::error_code& ec, std::error_code code, std::string message);
    void begin(std::error_code& ec);

    FileRegistry& registry_;
    IdGenerator& ids_;
    const Clock& clock_;
    std::string lastError_;
};

} // namespace FileReg::service
