#pragma once

#include <spdlog/spdlog.h>

#include <memory>
#include <string>

namespace kgraph {

/// The library's named spdlog logger ("kgraph"), created on first use.
std::shared_ptr<spdlog::logger> logger();

/// Apply a level name (trace, debug, info, warn, error, critical, off).
/// Throws ValidationError on an unknown name.
void configureLogging(const std::string& level);

bool isValidLogLevel(const std::string& level);

} // namespace kgraph
