#include "common/log.hpp"
#include "common/errors.hpp"

#include <spdlog/sinks/stdout_color_sinks.h>

namespace kgraph {

namespace {

constexpr const char* kLoggerName = "kgraph";

std::shared_ptr<spdlog::logger> createLogger() {
    if (auto existing = spdlog::get(kLoggerName)) {
        return existing;
    }
    return spdlog::stderr_color_mt(kLoggerName);
}

} // namespace

std::shared_ptr<spdlog::logger> logger() {
    static std::shared_ptr<spdlog::logger> instance = createLogger();
    return instance;
}

bool isValidLogLevel(const std::string& level) {
    return level == "trace" || level == "debug" || level == "info" ||
           level == "warn" || level == "warning" || level == "error" ||
           level == "err" || level == "critical" || level == "off";
}

void configureLogging(const std::string& level) {
    if (!isValidLogLevel(level)) {
        throw ValidationError("log_level", "unknown level '" + level + "'");
    }
    logger()->set_level(spdlog::level::from_str(level));
}

} // namespace kgraph
