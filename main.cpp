#include <iostream>

#include <filereg/error/RegistryError.hpp>
#include <filereg/repository/FileRegistry.hpp>
#include <filereg/service/FileService.hpp>
#include <filereg/util/FileOps.hpp>

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/spdlog.h>

#include "app/AppConfig.hpp"
#include "app/ConsoleUi.hpp"
#include "app/MainMenu.hpp"

int main() {
    using namespace FileReg;

    app::AppConfig cfg = app::loadAppConfig();

    std::error_code ec;
    if (!util::makeDirectories(cfg.registryDir, ec)) {
        std::cerr << "cannot create data directory " << cfg.registryDir << ": " << ec.message()
                  << "\n";
        return 1;
    }

    // 로그는 파일로만 남긴다 (stdout은 메뉴 화면 전용).
    try {
        auto logger = spdlog::basic_logger_mt("fms", cfg.logFile);
        logger->set_level(cfg.logLevel);
        logger->flush_on(spdlog::level::warn);
        spdlog::set_default_logger(logger);
    } catch (const spdlog::spdlog_ex& ex) {
        std::cerr << "logging disabled: " << ex.what() << "\n";
        spdlog::set_level(spdlog::level::off);
    }
    spdlog::info("fms starting, registry directory {}", cfg.registryDir);

    FileRegistry registry;
    if (!registry.open(cfg.registryDir, ec)) {
        std::cerr << "cannot open registry: " << ec.message();
        if (!registry.lastError().empty())
            std::cerr << " (" << registry.lastError() << ")";
        std::cerr << "\n";
        spdlog::error("open failed: {}", registry.lastError());
        return 1;
    }

    SystemClock clock;
    RandomUuidGenerator ids;
    service::FileService service(registry, ids, clock);

    app::ConsoleUi ui(std::cout, cfg.color);
    app::MainMenu menu(service, ui, std::cin, cfg.registryDir);
    menu.run();

    spdlog::info("fms exiting, {} record(s) registered", registry.count());
    spdlog::shutdown();
    return 0;
}
