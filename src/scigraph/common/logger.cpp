#include "scigraph/common/logger.h"
#include <spdlog/sinks/stdout_color_sinks.h>
#include <iostream>

namespace scigraph {
namespace common {

void Logger::Init() {
    if (spdlog::get("console")) {
        return;
    }
    try {
        // stdout carries command output; logs go to stderr
        auto console = spdlog::stderr_color_mt("console");
        spdlog::set_default_logger(console);
        spdlog::set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] [thread %t] %v");
        spdlog::set_level(spdlog::level::info);
    } catch (const spdlog::spdlog_ex& ex) {
        std::cerr << "Log initialization failed: " << ex.what() << std::endl;
    }
}

bool Logger::SetLevel(const std::string& level_name) {
    auto level = spdlog::level::from_str(level_name);
    // from_str maps unknown names to "off"
    if (level == spdlog::level::off && level_name != "off") {
        return false;
    }
    spdlog::set_level(level);
    return true;
}

} // namespace common
} // namespace scigraph
