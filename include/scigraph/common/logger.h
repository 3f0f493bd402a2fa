#ifndef SCIGRAPH_COMMON_LOGGER_H_
#define SCIGRAPH_COMMON_LOGGER_H_

#include <spdlog/spdlog.h>
#include <spdlog/fmt/ostr.h>
#include <string>

namespace scigraph {
namespace common {

class Logger {
public:
    // Installs the stderr "console" logger at info; repeated calls are no-ops
    static void Init();

    // Accepts trace/debug/info/warn/error/critical/off; unknown names leave the level unchanged
    static bool SetLevel(const std::string& level_name);
};

} // namespace common
} // namespace scigraph

// Macros for convenient logging
#define SCIGRAPH_TRACE(...) spdlog::trace(__VA_ARGS__)
#define SCIGRAPH_DEBUG(...) spdlog::debug(__VA_ARGS__)
#define SCIGRAPH_INFO(...)  spdlog::info(__VA_ARGS__)
#define SCIGRAPH_WARN(...)  spdlog::warn(__VA_ARGS__)
#define SCIGRAPH_ERROR(...) spdlog::error(__VA_ARGS__)
#define SCIGRAPH_CRITICAL(...) spdlog::critical(__VA_ARGS__)

#endif // SCIGRAPH_COMMON_LOGGER_H_
