#pragma once

// ------------------------------------------------------------- Library defines

// Turn on 64bit files, stdio.h
#define _FILE_OFFSET_BITS 64

#ifndef __cplusplus
// --------------------------------------------------------------------------- C
#include <assert.h>
#include <stdio.h>

#else
// ------------------------------------------------------------------------- C++

// Contrib
#include <tl/expected.hpp>
#include <ofats/invocable.h>
#include <range/v3/all.hpp>

#define SPDLOG_FUNCTION __PRETTY_FUNCTION__
#ifndef SPDLOG_FMT_EXTERNAL
#define SPDLOG_FMT_EXTERNAL
#endif
#include "spdlog/spdlog.h"

#include <fmt/format.h>

#include "base/logging.hpp"

#include <algorithm>
#include <functional>
#include <memory>
#include <numeric>

#include <array>
#include <fstream>
#include <iostream>
#include <optional>
#include <sstream>
#include <string>
#include <string_view>
#include <span>

#include <map>
#include <unordered_map>
#include <unordered_set>
#include <vector>

#include <cmath>
#include <cstddef>
#include <cstdint>
#include <cstdlib>
#include <cstring>
#include <limits>
#include <mutex>
#include <system_error>

namespace actions {
using namespace ranges::actions;
}

namespace views {
using namespace ranges::views;
}

namespace jsonactor {
// -----------------------------------------------------------------------------

using tl::expected;
using tl::make_unexpected;
using tl::unexpected;

using fmt::format;

using ofats::any_invocable;
using std::function;
using thunk_type = std::function<void()>;

using std::cerr;
using std::cout;
using std::endl;
using std::istream;
using std::ostream;
using std::stringstream;

using std::array;
using std::string;
using std::string_view;
using std::unordered_map;
using std::unordered_set;
using std::vector;

// Smart Pointers
using std::make_shared;
using std::make_unique;
using std::shared_ptr;
using std::unique_ptr;
using std::weak_ptr;

using std::begin;
using std::cbegin;
using std::cend;
using std::end;

using std::error_code;
using std::make_error_code;

using std::lock_guard;

// NOTE:
//       "0"s is a string
//        1s is 1 second
using namespace std::literals::chrono_literals;

} // namespace jsonactor

#if defined __clang__
#pragma clang diagnostic push
#pragma clang diagnostic ignored "-Wgnu-zero-variadic-macro-arguments"
#elif defined __GNUC__
#pragma GCC diagnostic push
#pragma GCC diagnostic ignored "-Wvariadic-macros"
#endif

// ------------------------------------------------------------- Likely/unlikely

#if defined(__clang__) || defined(__GNUC__)
#define JSONACTOR_LIKELY(x) __builtin_expect(!!(x), 1)
#define JSONACTOR_UNLIKELY(x) __builtin_expect(!!(x), 0)
#else
#define JSONACTOR_LIKELY(x) (!!(x))
#define JSONACTOR_UNLIKELY(x) (!!(x))
#endif

// --------------------------------------------------------------------- Logging

#ifdef DEBUG_BUILD
#define TRACE(fmt, ...)                                                                            \
  {                                                                                                \
    using namespace ::jsonactor::logging::detail;                                                  \
    ::jsonactor::logging::log_trace(::jsonactor::logging::debug_logger(),                          \
                                    "[\x1b[4m\x1b[97m{}:{}\x1b[0m] " fmt##_cfmt, __FILE__,         \
                                    __LINE__ __VA_OPT__(, ) __VA_ARGS__);                          \
  }

#define LOG_DEBUG(fmt, ...)                                                                        \
  {                                                                                                \
    using namespace ::jsonactor::logging::detail;                                                  \
    ::jsonactor::logging::log_debug(::jsonactor::logging::debug_logger(),                          \
                                    "[\x1b[4m\x1b[97m{}:{}\x1b[0m] " fmt##_cfmt, __FILE__,         \
                                    __LINE__ __VA_OPT__(, ) __VA_ARGS__);                          \
  }
#else
#define TRACE(fmt, ...)
#define LOG_DEBUG(fmt, ...)
#endif

#define INFO(fmt, ...)                                                                             \
  {                                                                                                \
    using namespace ::jsonactor::logging::detail;                                                  \
    ::jsonactor::logging::log_info(::jsonactor::logging::debug_logger(),                           \
                                   "[\x1b[4m\x1b[97m{}:{}\x1b[0m] " fmt##_cfmt, __FILE__,          \
                                   __LINE__ __VA_OPT__(, ) __VA_ARGS__);                           \
  }

#define WARN(fmt, ...)                                                                             \
  {                                                                                                \
    using namespace ::jsonactor::logging::detail;                                                  \
    ::jsonactor::logging::log_warn(::jsonactor::logging::debug_logger(),                           \
                                   "[\x1b[4m\x1b[97m{}:{}\x1b[0m] " fmt##_cfmt, __FILE__,          \
                                   __LINE__ __VA_OPT__(, ) __VA_ARGS__);                           \
  }

#define LOG_ERR(fmt, ...)                                                                          \
  {                                                                                                \
    using namespace ::jsonactor::logging::detail;                                                  \
    ::jsonactor::logging::log_error(::jsonactor::logging::debug_logger(),                          \
                                    "[\x1b[4m\x1b[97m{}:{}\x1b[0m] " fmt##_cfmt, __FILE__,         \
                                    __LINE__ __VA_OPT__(, ) __VA_ARGS__);                          \
  }

#define CRITICAL(fmt, ...)                                                                         \
  {                                                                                                \
    using namespace ::jsonactor::logging::detail;                                                  \
    ::jsonactor::logging::log_critical(::jsonactor::logging::debug_logger(),                       \
                                       "[\x1b[4m\x1b[97m{}:{}\x1b[0m] " fmt##_cfmt, __FILE__,      \
                                       __LINE__ __VA_OPT__(, ) __VA_ARGS__);                       \
  }

#define FATAL(fmt, ...)                                                                            \
  {                                                                                                \
    using namespace ::jsonactor::logging::detail;                                                  \
    ::jsonactor::logging::log_fatal(::jsonactor::logging::debug_logger(),                          \
                                    "[\x1b[4m\x1b[97m{}:{}\x1b[0m] " fmt##_cfmt, __FILE__,         \
                                    __LINE__ __VA_OPT__(, ) __VA_ARGS__);                          \
  }

#ifdef Expects
#undef Expects
#endif
#ifdef NDEBUG
#define Expects(condition)
#else
#define Expects(condition)                                                                         \
  if (!JSONACTOR_LIKELY(condition))                                                                \
    FATAL("precondition failed: {}", #condition);
#endif

#ifdef Ensures
#undef Ensures
#endif
#ifdef NDEBUG
#define Ensures(condition)
#else
#define Ensures(condition)                                                                         \
  if (!JSONACTOR_LIKELY(condition))                                                                \
    FATAL("postcondition failed: {}", #condition);
#endif

#if defined __clang__
#pragma clang diagnostic pop
#elif defined __GNUC__
#pragma GCC diagnostic pop
#endif

#endif // #defined cplusplus
