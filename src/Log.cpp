// Log.cpp – spdlog logger construction.

#include "SIMForge/Log.hpp"

#include <spdlog/sinks/stdout_color_sinks.h>

#include <mutex>
#include <string>

namespace simforge {

std::shared_ptr<spdlog::logger> logger() {
    static std::once_flag once;
    static std::shared_ptr<spdlog::logger> instance;
    std::call_once(once, [] {
        instance = spdlog::get("simforge");
        if (!instance) {
            auto sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
            instance  = std::make_shared<spdlog::logger>("simforge", sink);
            instance->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%n] [%^%l%$] %v");
            instance->set_level(spdlog::level::info);
            spdlog::register_logger(instance);
        }
    });
    return instance;
}

bool setLogLevel(std::string_view level) {
    const std::string name(level);
    auto lvl = spdlog::level::from_str(name);
    // from_str() maps unknown names to "off"; only accept an explicit "off".
    if (lvl == spdlog::level::off && name != "off")
        return false;
    logger()->set_level(lvl);
    return true;
}

void configureLogging(std::string_view level) {
    if (!setLogLevel(level))
        logger()->warn("unknown log level '{}', keeping '{}'", level,
                       spdlog::level::to_string_view(logger()->level()));
}

} // namespace simforge
