#pragma once

#include "spdlog/spdlog.h"

#include <exception>
#include <string_view>

/**
 * @defgroup logging Logging
 * @ingroup courier-utils
 *
 * @see https://github.com/gabime/spdlog
 *
 * A convenience wrapper around `spdlog`. The
 * logger instance is held as a `static shared_ptr` in `logging.cpp`.
 *
 * Only supports 1 default logger, that outputs to stdout. Brokers, clients
 * and servers all share it. The logger is lazily initialized by the
 * `courier::logging::debug_logger()` function.
 */

namespace courier::logging
{
using logger_type = spdlog::logger;

logger_type& debug_logger();

/**
 * @brief Change the level of the default logger, e.g., "trace", "info", "off".
 * @return false iff `level_name` is not a valid spdlog level.
 */
bool set_log_level(std::string_view level_name);

enum class LogLevel : int { TRACE, DEBUG, INFO, WARN, ERROR, FATAL };

namespace detail
{
   template<std::size_t N> struct static_string
   {
      char str[N]{};
      constexpr static_string(const char (&s)[N])
      {
         for(std::size_t i = 0; i < N; ++i) str[i] = s[i];
      }
   };

   template<static_string s> struct format_string
   {
      static constexpr const char* string = s.str;
   };

   /**
    * For the logging macros  a constexpr string type through to the underlying call to
    * fmt::format
    */
   template<static_string s> constexpr auto operator""_cfmt() { return format_string<s>{}; }

   template<typename F, typename... Args>
   inline void log_internal_(LogLevel level, logger_type& logger, F, Args&&... args)
   {
      switch(level) {
      case LogLevel::TRACE: logger.trace(F::string, std::forward<Args>(args)...); break;
      case LogLevel::DEBUG: logger.debug(F::string, std::forward<Args>(args)...); break;
      case LogLevel::INFO: logger.info(F::string, std::forward<Args>(args)...); break;
      case LogLevel::WARN: logger.warn(F::string, std::forward<Args>(args)...); break;
      case LogLevel::ERROR: logger.error(F::string, std::forward<Args>(args)...); break;
      case LogLevel::FATAL:
         logger.critical(F::string, std::forward<Args>(args)...);
         logger.flush();
         std::terminate();
      }
   }
} // namespace detail

template<typename... Args> inline void log_trace(logger_type& logger, Args&&... args)
{
   detail::log_internal_(LogLevel::TRACE, logger, std::forward<Args>(args)...);
}

template<typename... Args> inline void log_debug(logger_type& logger, Args&&... args)
{
   detail::log_internal_(LogLevel::DEBUG, logger, std::forward<Args>(args)...);
}

template<typename... Args> inline void log_info(logger_type& logger, Args&&... args)
{
   detail::log_internal_(LogLevel::INFO, logger, std::forward<Args>(args)...);
}

template<typename... Args> inline void log_warn(logger_type& logger, Args&&... args)
{
   detail::log_internal_(LogLevel::WARN, logger, std::forward<Args>(args)...);
}

template<typename... Args> inline void log_error(logger_type& logger, Args&&... args)
{
   detail::log_internal_(LogLevel::ERROR, logger, std::forward<Args>(args)...);
}

template<typename... Args> inline void log_fatal(logger_type& logger, Args&&... args)
{
   detail::log_internal_(LogLevel::FATAL, logger, std::forward<Args>(args)...);
}

} // namespace courier::logging
