#define SPDLOG_ACTIVE_LEVEL SPDLOG_LOGGER_TRACE
#include <iostream>
#include <map>
#include <spdlog/spdlog.h>

#include <cxxopts.hpp>

#include "common/config.hpp"
#include "common/vip_config.hpp"
#include "manager/manager.hpp"

void print_logo(){
    std::cout<< R"(        _       _
 __   _(_)_ __ | | _____  ___ _ __   ___ _ __
 \ \ / / | '_ \| |/ / _ \/ _ \ '_ \ / _ \ '__|
  \ V /| | |_) |   <  __/  __/ |_) |  __/ |
   \_/ |_| .__/|_|\_\___|\___| .__/ \___|_|
         |_|                 |_|
)" << std::endl;
}

void init(const Config& config, const std::string& level_override) {
    print_logo();
    // 初始化日志系统
    const static auto log_level_map = std::map<std::string, spdlog::level::level_enum>{
        {"trace", spdlog::level::trace},
        {"debug", spdlog::level::debug},
        {"info", spdlog::level::info},
        {"warn", spdlog::level::warn},
        {"error", spdlog::level::err},
        {"critical", spdlog::level::critical},
        {"off", spdlog::level::off}
    };
    auto log_level = level_override.empty()
        ? config.getString("log_config", "log_level", "info")
        : level_override;
    auto it = log_level_map.find(log_level);
    if (it == log_level_map.end()) {
        log_level = "info"; // 默认 info 级别
    }
    spdlog::set_level(log_level_map.at(log_level));
    spdlog::set_pattern("[%Y-%m-%d %H:%M:%S] [%l] %v"); // 设置日志格式
}

int main(int argc, char* argv[]) {
    cxxopts::Options options("vipkeeper", "Virtual IP failover manager");
    options.add_options()
        ("h,help", "Show help")
        ("c,config", "Configuration file path", cxxopts::value<std::string>()->default_value("config.yaml"))
        ("l,log-level", "Override log_config.log_level", cxxopts::value<std::string>()->default_value(""));

    try {
        auto result = options.parse(argc, argv);
        if (result.count("help")) {
            std::cout << options.help() << std::endl;
            return 0;
        }

        Config config(result["config"].as<std::string>());
        init(config, result["log-level"].as<std::string>());

        Manager manager(load_vip_config(config), default_manager_deps());
        manager.start();
    } catch (const std::exception& e) {
        spdlog::critical("Main: {}", e.what());
        return 1;
    }
    spdlog::info("Main: shutdown complete");
    return 0;
}
