#pragma once
/// @file Clock.hpp
/// @brief Time source used for record timestamps

#include <chrono>

namespace FileReg {

/// @brief Wall-clock instant truncated to whole seconds
/// @details The registry file stores second precision only, so every timestamp held in
///          memory uses the same resolution and survives a save/load cycle unchanged.
using Timestamp = std::chrono::time_point<std::chrono::system_clock, std::chrono::seconds>;

/// @brief Supplies "now" for timestamp assignment
class Clock {
  public:
    virtual ~Clock() = default;

    /// @brief Current time, second precision
    virtual Timestamp now() const = 0;
};

/// @brief Clock backed by std::chrono::system_clock
class SystemClock final : public Clock {
  public:
    Timestamp now() const override {
        return std::chrono::time_point_cast<std::chrono::seconds>(
            std::chrono::system_clock::now());
    }
};

} // namespace FileReg
