#pragma once
/**
 * @file logging.h
 * @brief Component loggers backed by spdlog
 */

#include <spdlog/spdlog.h>
#include <memory>
#include <string>

namespace tessera::logging {

/**
 * @brief Get (or lazily create) a named component logger
 *
 * Loggers write to a shared colored stdout sink and honour the level set by
 * set_level(). Names follow "tessera.<component>".
 */
std::shared_ptr<spdlog::logger> get_logger(const std::string& name);

/**
 * @brief Set the level of every component logger
 * @param level spdlog level name ("trace", "debug", "info", "warn", "error", "off")
 * @return false when the name is not a recognised level
 */
bool set_level(const std::string& level);

/**
 * @brief Check whether a level name is recognised
 */
bool is_valid_level(const std::string& level);

} // namespace tessera::logging
