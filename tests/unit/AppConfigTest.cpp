/**
 * @file AppConfigTest.cpp
 * @brief Unit tests for environment-driven start-up settings
 */

#include <gtest/gtest.h>

#include <cstdlib>
#include <string>

#include "app/AppConfig.hpp"

using namespace FileReg::app;

class AppConfigTest : public ::testing::Test {
  protected:
    void SetUp() override {
        save("FMS_DATA_DIR", savedDir_, hadDir_);
        save("FMS_LOG_LEVEL", savedLevel_, hadLevel_);
        save("HOME", savedHome_, hadHome_);
    }

    void TearDown() override {
        restore("FMS_DATA_DIR", savedDir_, hadDir_);
        restore("FMS_LOG_LEVEL", savedLevel_, hadLevel_);
        restore("HOME", savedHome_, hadHome_);
    }

  private:
    static void save(const char* name, std::string& value, bool& had) {
        const char* v = std::getenv(name);
        had = v != nullptr;
        value = v ? v : "";
    }

    static void restore(const char* name, const std::string& value, bool had) {
        if (had)
            ::setenv(name, value.c_str(), 1);
        else
            ::unsetenv(name);
    }

    std::string savedDir_, savedLevel_, savedHome_;
    bool hadDir_ = false, hadLevel_ = false, hadHome_ = false;
};

TEST_F(AppConfigTest, DataDirFromEnvironment) {
    ::setenv("FMS_DATA_DIR", "/srv/fms", 1);
    AppConfig cfg = loadAppConfig();
    EXPECT_EQ(cfg.registryDir, "/srv/fms");
    EXPECT_EQ(cfg.logFile, "/srv/fms/fms.log");
}

TEST_F(AppConfigTest, DefaultsUnderHome) {
    ::unsetenv("FMS_DATA_DIR");
    ::setenv("HOME", "/home/tester", 1);
    AppConfig cfg = loadAppConfig();
    EXPECT_EQ(cfg.registryDir, "/home/tester/.fms_data");
    EXPECT_EQ(homeDirectory(), "/home/tester");
}

TEST_F(AppConfigTest, LogLevel) {
    ::unsetenv("FMS_LOG_LEVEL");
    EXPECT_EQ(loadAppConfig().logLevel, spdlog::level::info);

    ::setenv("FMS_LOG_LEVEL", "debug", 1);
    EXPECT_EQ(loadAppConfig().logLevel, spdlog::level::debug);
}
