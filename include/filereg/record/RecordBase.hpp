#pragma once
/// @file RecordBase.hpp
/// @brief Base interface for records kept by a repository

#include <filereg/util/Clock.hpp>

#include <string>

namespace FileReg {

/// @brief Identity and timestamps shared by every stored record
/// @details Repositories key records by id() and order listings by createdAt().
class RecordBase {
  public:
    virtual ~RecordBase() = default;

    /// @brief Unique, immutable identifier
    virtual const std::string& id() const = 0;

    /// @brief Type name, used in log output
    virtual const char* typeName() const = 0;

    /// @brief Creation instant, fixed for the record's lifetime
    virtual Timestamp createdAt() const = 0;

    /// @brief Instant of the most recent field change
    virtual Timestamp updatedAt() const = 0;
};

} // namespace FileReg
