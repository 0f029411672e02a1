/**
 * @file logging.cpp
 * @brief spdlog component logger registry
 */

#include "tessera/core/logging.h"
#include <spdlog/sinks/stdout_color_sinks.h>
#include <mutex>

namespace tessera::logging {

namespace {

std::mutex& registry_mutex() {
    static std::mutex mutex;
    return mutex;
}

spdlog::level::level_enum& current_level() {
    static spdlog::level::level_enum level = spdlog::level::info;
    return level;
}

spdlog::sink_ptr shared_sink() {
    static spdlog::sink_ptr sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
    return sink;
}

} // anonymous namespace

std::shared_ptr<spdlog::logger> get_logger(const std::string& name) {
    std::lock_guard<std::mutex> lock(registry_mutex());

    if (auto existing = spdlog::get(name)) {
        return existing;
    }

    auto logger = std::make_shared<spdlog::logger>(name, shared_sink());
    logger->set_level(current_level());
    logger->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%n] [%^%l%$] %v");
    spdlog::register_logger(logger);
    return logger;
}

bool is_valid_level(const std::string& level) {
    if (level == "off") {
        return true;
    }
    return spdlog::level::from_str(level) != spdlog::level::off;
}

bool set_level(const std::string& level) {
    if (!is_valid_level(level)) {
        return false;
    }

    std::lock_guard<std::mutex> lock(registry_mutex());
    current_level() = spdlog::level::from_str(level);
    spdlog::apply_all([](const std::shared_ptr<spdlog::logger>& logger) {
        logger->set_level(current_level());
    });
    return true;
}

} // namespace tessera::logging
