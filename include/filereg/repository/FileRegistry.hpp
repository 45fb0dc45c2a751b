#pragma once
/// @file FileRegistry.hpp
/// @brief Durable registry of FileRecord entries backed by a single text file

#include "RecordRepository.hpp"

#include <filereg/record/FileRecord.hpp>

#include <string>
#include <unordered_map>

namespace FileReg {

/// @brief Insertion-ordered map of FileRecord, persisted to <directory>/fms_registry.dat
/// @details Every mutation rewrites the whole backing file through a temporary file in the
///          same directory:
///          -# serialize every record (insertion order), one line each
///          -# write the lines to <registry>.tmp
///          -# fsync and close the temporary file
///          -# unlink the existing backing file
///          -# rename the temporary file to the backing name
///          A failure before step 4 leaves the previous backing file untouched.
///
///          Loading is strict: a single malformed line fails open() with
///          Errc::corrupt_record instead of skipping it.
///
/// @note Not thread-safe and takes no file locks. One process owns the directory.
class FileRegistry : public RecordRepository<FileRecord> {
  public:
    static constexpr const char* kRegistryFileName = "fms_registry.dat";
    static constexpr const char* kTempSuffix = ".tmp";

    /// @brief Creates a closed registry; call open() before use
    FileRegistry() = default;

    /// @brief Opens immediately
    /// @param directory Registry directory, created when missing
    /// @param ec Error code set on failure (registry stays closed)
    FileRegistry(const std::string& directory, std::error_code& ec);

    ~FileRegistry() override = default;

    FileRegistry(const FileRegistry&) = delete;
    FileRegistry& operator=(const FileRegistry&) = delete;

    /// @brief Ensures @p directory exists and loads the backing file if present
    /// @details A missing backing file is an empty registry. On failure the registry is left
    ///          closed and empty; lastError() names the cause (path and line for corruption).
    bool open(const std::string& directory, std::error_code& ec);

    bool isOpen() const { return open_; }
    const std::string& directory() const { return directory_; }
    const std::string& registryPath() const { return registryPath_; }
    std::string tempPath() const { return registryPath_ + kTempSuffix; }

    bool save(Ptr record, std::error_code& ec) override;
    bool saveAll(const std::vector<Ptr>& records, std::error_code& ec) override;
    bool deleteById(const std::string& id, std::error_code& ec) override;
    bool deleteAll(std::error_code& ec) override;

    Ptr findById(const std::string& id) const override;
    std::vector<Ptr> findAll() const override;
    size_t count() const override { return records_.size(); }

    /// @brief First record, newest first, whose id starts with @p prefix
    /// @return nullptr for an empty prefix or no match
    Ptr findByIdPrefix(const std::string& prefix) const;

    /// @brief Case-insensitive file name lookup, first match in insertion order
    Ptr findByFileName(const std::string& fileName) const;

    /// @brief Case-insensitive category filter, newest first
    std::vector<Ptr> findByCategory(const std::string& category) const;

    /// @brief Distinct category labels in ascending order
    std::vector<std::string> categories() const;

    /// @brief Rewrites the backing file from the in-memory state
    /// @details Used to retry after a mutation whose persist step failed.
    bool persist(std::error_code& ec);

    /// @brief Detail message of the most recent failed call (empty after a success)
    const std::string& lastError() const { return lastError_; }

  protected:
    /// @brief Steps 4 and 5 of the rewrite: drop the old backing file, rename the temp file
    /// @details Virtual so tests can inject a failure between the temp write and the rename.
    virtual bool replaceBackingFile(const std::string& tmpPath, const std::string& finalPath,
                                    std::error_code& ec);

  private:
    bool loadFromDisk(std::error_code& ec);
    bool writeTempFile(const std::string& tmpPath, std::error_code& ec);
    bool syncDirectory(std::error_code& ec);
    void put(Ptr record);
    bool requireOpen(std::error_code& ec);
    bool fail(std::error_code& ec, std::error_code code, std::string detail);

    std::string directory_;
    std::string registryPath_;
    bool open_ = false;

    std::vector<Ptr> records_;                   ///< insertion order
    std::unordered_map<std::string, Ptr> byId_;  ///< id -> same object as in records_
    std::string lastError_;
};

} // namespace FileReg
