#pragma once
// Log.hpp – Library-wide spdlog logger ("simforge", stderr).

#include <spdlog/spdlog.h>

#include <memory>
#include <string_view>

namespace simforge {

// Returns the shared logger, creating it on first use.
std::shared_ptr<spdlog::logger> logger();

// Accepts spdlog level names ("trace", "debug", "info", "warn", "error",
// "critical", "off"). Returns false and leaves the level unchanged otherwise.
bool setLogLevel(std::string_view level);

// Applies a configured level name (PipelineConfig::log_level) to the shared
// logger, warning and keeping the current level when the name is unknown.
// The logger is process-wide: applications call this once at start-up and
// pipelines never change the level themselves.
void configureLogging(std::string_view level);

} // namespace simforge
