#include "AppConfig.hpp"

#include <filereg/util/FileOps.hpp>

#include <pwd.h>
#include <unistd.h>

#include <cstdlib>

namespace FileReg::app {

namespace {

std::string envOrEmpty(const char* name) {
    const char* v = std::getenv(name);
    return (v && *v) ? std::string(v) : std::string();
}

} // namespace

std::string homeDirectory() {
    std::string home = envOrEmpty("HOME");
    if (!home.empty())
        return home;

    // HOME이 비어 있는 환경(cron, 서비스 계정 등)에서는 passwd 항목으로 보완한다.
    if (const struct passwd* pw = ::getpwuid(::getuid())) {
        if (pw->pw_dir && *pw->pw_dir)
            return pw->pw_dir;
    }
    return std::string();
}

AppConfig loadAppConfig() {
    AppConfig cfg;

    cfg.registryDir = envOrEmpty("FMS_DATA_DIR");
    if (cfg.registryDir.empty()) {
        std::string home = homeDirectory();
        cfg.registryDir = util::joinPath(home.empty() ? "." : home, kDefaultDataDirName);
    }
    cfg.logFile = util::joinPath(cfg.registryDir, "fms.log");

    std::string level = envOrEmpty("FMS_LOG_LEVEL");
    if (!level.empty())
        cfg.logLevel = spdlog::level::from_str(level);

    cfg.color = ::isatty(STDOUT_FILENO) == 1 && envOrEmpty("NO_COLOR").empty();
    return cfg;
}

} // namespace FileReg::app
