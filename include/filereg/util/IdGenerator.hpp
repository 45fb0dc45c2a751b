#pragma once
/// @file IdGenerator.hpp
/// @brief Unique identifier source for new records

#include <random>
#include <string>

namespace FileReg {

/// @brief Supplies identifiers for freshly created records
class IdGenerator {
  public:
    virtual ~IdGenerator() = default;

    /// @brief Returns an identifier never handed out before by this generator
    virtual std::string next() = 0;
};

/// @brief Random (version 4) UUID text, e.g. "3f2b8c1e-9a47-4d2e-b6c1-0e5f7a9d2c41"
class RandomUuidGenerator final : public IdGenerator {
  public:
    RandomUuidGenerator();
    /// @brief Deterministic sequence, for reproducible runs
    explicit RandomUuidGenerator(std::mt19937_64::result_type seed);

    std::string next() override;

  private:
    std::mt19937_64 engine_;
};

/// @brief Generator used by the FileRecord convenience constructor
IdGenerator& defaultIdGenerator();

} // namespace FileReg
