#pragma once
/**
 * @file TestDoubles.hpp
 * @brief Deterministic clock / id sources and a throw-away directory for tests
 */

#include <filereg/util/Clock.hpp>
#include <filereg/util/IdGenerator.hpp>

#include <cstdio>
#include <filesystem>
#include <string>

namespace FileRegTest {

/// @brief Clock that only moves when told to
class ManualClock : public FileReg::Clock {
  public:
    explicit ManualClock(std::chrono::seconds sinceEpoch = std::chrono::seconds(1700000000))
        : now_(sinceEpoch) {}

    FileReg::Timestamp now() const override { return now_; }

    void advance(std::chrono::seconds by) { now_ += by; }
    void set(FileReg::Timestamp t) { now_ = t; }

  private:
    FileReg::Timestamp now_;
};

/// @brief Hands out "<prefix>-0001", "<prefix>-0002", ...
class SequenceIdGenerator : public FileReg::IdGenerator {
  public:
    explicit SequenceIdGenerator(std::string prefix = "id") : prefix_(std::move(prefix)) {}

    std::string next() override {
        char buf[16];
        std::snprintf(buf, sizeof(buf), "%04d", ++n_);
        return prefix_ + "-" + buf;
    }

  private:
    std::string prefix_;
    int n_ = 0;
};

/// @brief Directory removed (recursively) on construction and destruction
class ScratchDir {
  public:
    explicit ScratchDir(std::string path) : path_(std::move(path)) { wipe(); }
    ~ScratchDir() { wipe(); }

    ScratchDir(const ScratchDir&) = delete;
    ScratchDir& operator=(const ScratchDir&) = delete;

    const std::string& path() const { return path_; }
    std::string sub(const std::string& name) const { return path_ + "/" + name; }

  private:
    void wipe() {
        std::error_code ec;
        std::filesystem::remove_all(path_, ec);
    }

    std::string path_;
};

} // namespace FileRegTest
