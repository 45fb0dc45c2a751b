#pragma once
/// @file AppConfig.hpp
/// @brief Start-up settings of the fms console application

#include <spdlog/common.h>

#include <string>

namespace FileReg::app {

/// @brief Values resolved once at start-up from the process environment
struct AppConfig {
    std::string registryDir; ///< where fms_registry.dat lives
    std::string logFile;     ///< spdlog file sink target
    spdlog::level::level_enum logLevel = spdlog::level::info;
    bool color = true; ///< ANSI colour on stdout
};

/// @brief Name of the registry directory under the user's home
constexpr const char* kDefaultDataDirName = ".fms_data";

/// @brief Resolves the configuration
/// @details - registryDir: $FMS_DATA_DIR, else $HOME/.fms_data, else the passwd entry's
///            home directory, else ./.fms_data
///          - logFile: <registryDir>/fms.log
///          - logLevel: $FMS_LOG_LEVEL ("trace" ... "off"), default info; an unknown name
///            turns logging off, as spdlog::level::from_str does
///          - color: stdout is a terminal and $NO_COLOR is not set
AppConfig loadAppConfig();

/// @brief Home directory lookup used by loadAppConfig()
/// @return empty string when neither $HOME nor the passwd entry names one
std::string homeDirectory();

} // namespace FileReg::app
