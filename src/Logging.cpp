/**
 * @file Logging.cpp
 * @brief Implementation of the library logger
 */

#include "docpatch/Logging.hpp"

#include <spdlog/cfg/env.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <mutex>

namespace docpatch {

std::shared_ptr<spdlog::logger> logger() {
    static std::mutex creation_mutex;

    if (auto existing = spdlog::get(kLoggerName)) {
        return existing;
    }

    std::lock_guard<std::mutex> lock(creation_mutex);
    if (auto existing = spdlog::get(kLoggerName)) {
        return existing;
    }

    auto sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
    auto created = std::make_shared<spdlog::logger>(kLoggerName, sink);
    created->set_level(spdlog::level::warn);
    spdlog::register_logger(created);

    // SPDLOG_LEVEL=debug or SPDLOG_LEVEL=docpatch=trace
    spdlog::cfg::load_env_levels();

    return created;
}

void set_log_level(spdlog::level::level_enum level) {
    logger()->set_level(level);
}

} // namespace docpatch
