// ==============================================================================
// Library Logger Implementation
// ==============================================================================

#include "logging.h"

#include <spdlog/cfg/env.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <mutex>

namespace Prism {
namespace DSP {

namespace {

std::shared_ptr<spdlog::logger> createLogger() {
    // Another component may already have registered a logger under our name
    if (auto existing = spdlog::get(kLoggerName)) {
        return existing;
    }

    auto created = spdlog::stderr_color_mt(kLoggerName);
    created->set_level(spdlog::level::warn);
    created->set_pattern("[%H:%M:%S.%e] [%n] [%^%l%$] %v");

    // SPDLOG_LEVEL=prism=debug (or a global level) overrides the default
    spdlog::cfg::load_env_levels();
    return created;
}

} // namespace

std::shared_ptr<spdlog::logger> logger() {
    static std::once_flag once;
    static std::shared_ptr<spdlog::logger> instance;
    std::call_once(once, [] { instance = createLogger(); });
    return instance;
}

void setLogLevel(spdlog::level::level_enum level) {
    logger()->set_level(level);
}

} // namespace DSP
} // namespace Prism
