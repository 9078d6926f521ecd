#include "logging.hpp"

#include "spdlog/sinks/stdout_color_sinks.h"

#include <cassert>
#include <cstdlib>
#include <mutex>
#include <string_view>

namespace courier::logging {
/// @private
static std::shared_ptr<spdlog::logger> instance;

/// @private
static std::once_flag flag;

/// @private
static constexpr const char* k_level_env_variable = "COURIER_LOG_LEVEL";

/// @private
static void init_logger(std::shared_ptr<spdlog::logger> instance_) {
  assert(instance_);
  instance = instance_;
}

/**
 * @ingroup logging
 * @brief lazily initializes and returns the logger instance.
 */
spdlog::logger& debug_logger() {
  std::call_once(flag, []() {
    init_logger(spdlog::stdout_color_mt("courier"));
    instance->set_pattern("[%Y-%m-%d %T] [%^%l%$] %v");

#ifdef DEBUG_BUILD
    instance->set_level(spdlog::level::trace);
#else
    instance->set_level(spdlog::level::warn);
#endif

    const char* log_level = std::getenv(k_level_env_variable);
    if (log_level && !set_log_level(log_level)) {
      instance->error("failed to set log level from environment variable {}={}",
                      k_level_env_variable, log_level);
    }
  });

  assert(instance);
  return *instance;
}

/**
 * @ingroup logging
 * @brief Sets the level of the default logger.
 */
bool set_log_level(std::string_view level_name) {
  const auto level = spdlog::level::from_str(std::string{level_name});
  if (level == spdlog::level::off && level_name != std::string_view{"off"})
    return false;
  if (instance)
    instance->set_level(level);
  else
    debug_logger().set_level(level);
  return true;
}

} // namespace courier::logging
