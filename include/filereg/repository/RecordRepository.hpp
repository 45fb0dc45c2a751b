#pragma once
/// @file RecordRepository.hpp
/// @brief Repository template interface

#include <algorithm>
#include <memory>
#include <string>
#include <system_error>
#include <vector>

namespace FileReg {

/// @brief In-memory record repository with durable write-through (template)
/// @tparam T Record type (Duck Typing: requires id(), createdAt())
/// @details Reads are served from memory and cannot fail. Every mutation is applied to
///          memory first and then persisted; a failed persist leaves memory ahead of disk.
template <typename T> class RecordRepository {
  public:
    using Ptr = std::shared_ptr<T>;

    virtual ~RecordRepository() = default;

    // =========================================================================
    // Mutations
    // =========================================================================

    /// @brief Insert or replace by id, then persist
    /// @param record Record to store; the repository keeps this very object
    /// @param ec Error code set on failure
    /// @return true on success
    virtual bool save(Ptr record, std::error_code& ec) = 0;

    /// @brief Same as save(); reads better at call sites that changed an existing record
    bool update(Ptr record, std::error_code& ec) { return save(std::move(record), ec); }

    /// @brief Insert or replace several records, then persist once
    /// @note Not transactional: on a persist failure all records stay applied in memory
    virtual bool saveAll(const std::vector<Ptr>& records, std::error_code& ec) = 0;

    /// @brief Remove by id
    /// @return true if a record was removed and persisted; false with ec clear if absent
    virtual bool deleteById(const std::string& id, std::error_code& ec) = 0;

    /// @brief Remove every record, then persist
    virtual bool deleteAll(std::error_code& ec) = 0;

    // =========================================================================
    // Queries
    // =========================================================================

    /// @brief Exact id lookup
    /// @return Stored record or nullptr
    virtual Ptr findById(const std::string& id) const = 0;

    /// @brief All records, newest first
    virtual std::vector<Ptr> findAll() const = 0;

    virtual size_t count() const = 0;

    virtual bool existsById(const std::string& id) const { return findById(id) != nullptr; }

    /// @brief Sorts by createdAt descending; records created in the same second keep their
    ///        relative order
    static void sortNewestFirst(std::vector<Ptr>& records) {
        std::stable_sort(records.begin(), records.end(), [](const Ptr& a, const Ptr& b) {
            return a->createdAt() > b->createdAt();
        });
    }
};

} // namespace FileReg
