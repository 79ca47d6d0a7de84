#include "logging.hpp"

#include "spdlog/sinks/stdout_color_sinks.h"

#include <cstdlib>
#include <mutex>

namespace jsonactor::logging {

namespace {
  std::shared_ptr<spdlog::logger> instance;
  std::once_flag flag;

  bool parse_level(std::string_view name, spdlog::level::level_enum& level) {
    level = spdlog::level::from_str(std::string{name});
    return !(level == spdlog::level::off && name != "off");
  }

  void init_logger() {
    instance = spdlog::stdout_color_mt("terminal");
    instance->set_pattern("[%Y-%m-%d %T] [%^%l%$] %v");

#ifdef DEBUG_BUILD
    instance->set_level(spdlog::level::trace);
#else
    instance->set_level(spdlog::level::warn);
#endif

    const char* env_variable = "LOG_LEVEL_OVERRIDE";
    const char* log_level = std::getenv(env_variable);
    if (log_level != nullptr) {
      auto level = spdlog::level::off;
      if (parse_level(log_level, level)) {
        instance->set_level(level);
      } else {
        instance->error("failed to set log level from environment variable {}={}", env_variable,
                        log_level);
      }
    }
  }
} // namespace

/**
 * @ingroup logging
 * @brief lazily initializes and returns the logger instance.
 */
spdlog::logger& debug_logger() {
  std::call_once(flag, init_logger);
  return *instance;
}

bool set_level(std::string_view name) {
  auto level = spdlog::level::off;
  if (!parse_level(name, level))
    return false;
  debug_logger().set_level(level);
  return true;
}

} // namespace jsonactor::logging
