#pragma once

#include "spdlog/spdlog.h"

#include <string_view>

/**
 * @defgroup logging Logging
 * @ingroup jsonactor-utils
 *
 * @see https://github.com/gabime/spdlog
 *
 * A thin wrapper around `spdlog`, with a single lazily created terminal logger.
 * The format string passed to the logging macros is checked at compile time.
 *
 * The starting level is `trace` for debug builds, and `warn` otherwise. It can be
 * overridden with the `LOG_LEVEL_OVERRIDE` environment variable, or `set_level`.
 */

namespace jsonactor::logging {
using logger_type = spdlog::logger;

logger_type& debug_logger();

/**
 * @brief Set the level of the terminal logger from a level name, eg., "info".
 * @return false if `level` is not a spdlog level name; the level is unchanged.
 */
bool set_level(std::string_view level);

enum class LogLevel : int { TRACE, DEBUG, INFO, WARN, ERROR, CRITICAL, FATAL };

namespace detail {
  template <std::size_t N> struct static_string {
    char str[N]{};
    constexpr static_string(const char (&s)[N]) {
      for (std::size_t i = 0; i < N; ++i)
        str[i] = s[i];
    }
  };

  template <static_string s> struct format_string {
    static constexpr const char* string = s.str;
  };

  /**
   * Carries the macro's string literal, as a constant expression, through to
   * spdlog's compile-time checked format string.
   */
  template <static_string s> constexpr auto operator""_cfmt() { return format_string<s>{}; }

  template <typename F, typename... Args>
  inline void log_internal_(LogLevel level, logger_type& logger, F, Args&&... args) {
    switch (level) {
    case LogLevel::TRACE:
      logger.trace(F::string, std::forward<Args>(args)...);
      break;
    case LogLevel::DEBUG:
      logger.debug(F::string, std::forward<Args>(args)...);
      break;
    case LogLevel::INFO:
      logger.info(F::string, std::forward<Args>(args)...);
      break;
    case LogLevel::WARN:
      logger.warn(F::string, std::forward<Args>(args)...);
      break;
    case LogLevel::ERROR:
      logger.error(F::string, std::forward<Args>(args)...);
      break;
    case LogLevel::CRITICAL:
      logger.critical(F::string, std::forward<Args>(args)...);
      break;
    case LogLevel::FATAL:
      logger.critical(F::string, std::forward<Args>(args)...);
      logger.flush();
      std::terminate();
    }
  }
} // namespace detail

template <typename... Args> inline void log_trace(logger_type& logger, Args&&... args) {
  detail::log_internal_(LogLevel::TRACE, logger, std::forward<Args>(args)...);
}

template <typename... Args> inline void log_debug(logger_type& logger, Args&&... args) {
  detail::log_internal_(LogLevel::DEBUG, logger, std::forward<Args>(args)...);
}

template <typename... Args> inline void log_info(logger_type& logger, Args&&... args) {
  detail::log_internal_(LogLevel::INFO, logger, std::forward<Args>(args)...);
}

template <typename... Args> inline void log_warn(logger_type& logger, Args&&... args) {
  detail::log_internal_(LogLevel::WARN, logger, std::forward<Args>(args)...);
}

template <typename... Args> inline void log_error(logger_type& logger, Args&&... args) {
  detail::log_internal_(LogLevel::ERROR, logger, std::forward<Args>(args)...);
}

template <typename... Args> inline void log_critical(logger_type& logger, Args&&... args) {
  detail::log_internal_(LogLevel::CRITICAL, logger, std::forward<Args>(args)...);
}

template <typename... Args> inline void log_fatal(logger_type& logger, Args&&... args) {
  detail::log_internal_(LogLevel::FATAL, logger, std::forward<Args>(args)...);
}

} // namespace jsonactor::logging
