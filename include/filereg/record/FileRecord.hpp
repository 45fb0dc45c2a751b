#pragma once
/// @file FileRecord.hpp
/// @brief Metadata entry for one tracked text file

#include "RecordBase.hpp"

#include <filereg/util/Clock.hpp>
#include <filereg/util/IdGenerator.hpp>

#include <string>

namespace FileReg {

/// @brief One tracked file: where it lives, what it holds, how it is tagged
/// @details Invariants kept by every constructor and setter:
///          - id() never changes once assigned
///          - category() is never empty (blank input becomes kDefaultCategory)
///          - updatedAt() >= createdAt()
class FileRecord : public RecordBase {
  public:
    static constexpr const char* kTypeName = "FileRecord";
    static constexpr const char* kDefaultCategory = "General";
    static constexpr size_t kShortIdLength = 8;

    /// @brief Fresh record: new id from @p ids, both timestamps set to clock.now()
    FileRecord(std::string fileName, std::string content, std::string storagePath,
               const std::string& category, IdGenerator& ids, const Clock& clock);

    /// @brief Fresh record using defaultIdGenerator() and the system clock
    FileRecord(std::string fileName, std::string content, std::string storagePath,
               const std::string& category);

    /// @brief Reconstruction from persisted fields
    /// @details An updatedAt earlier than createdAt is raised to createdAt.
    FileRecord(std::string id, std::string fileName, std::string content,
               std::string storagePath, const std::string& category, Timestamp createdAt,
               Timestamp updatedAt);

    const std::string& id() const override { return id_; }
    const char* typeName() const override { return kTypeName; }
    Timestamp createdAt() const override { return createdAt_; }
    Timestamp updatedAt() const override { return updatedAt_; }

    const std::string& fileName() const { return fileName_; }
    const std::string& content() const { return content_; }
    const std::string& storagePath() const { return storagePath_; }
    const std::string& category() const { return category_; }

    // Every setter refreshes updatedAt. The Timestamp overloads exist for callers that own
    // a Clock; the single-argument forms read the system clock.
    void setFileName(std::string fileName, Timestamp at);
    void setFileName(std::string fileName);
    void setContent(std::string content, Timestamp at);
    void setContent(std::string content);
    void setStoragePath(std::string storagePath, Timestamp at);
    void setStoragePath(std::string storagePath);
    void setCategory(const std::string& category, Timestamp at);
    void setCategory(const std::string& category);

    /// @brief First kShortIdLength characters of id(), for display and lookup
    std::string shortId() const;

    /// @brief storagePath() joined with fileName()
    std::string fullPath() const;

    /// @brief Trims @p category, returning kDefaultCategory when nothing is left
    static std::string normalizeCategory(const std::string& category);

  private:
    void touch(Timestamp at);

    std::string id_;
    std::string fileName_;
    std::string content_;
    std::string storagePath_;
    std::string category_;
    Timestamp createdAt_;
    Timestamp updatedAt_;
};

} // namespace FileReg
