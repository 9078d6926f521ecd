#pragma once

// ------------------------------------------------------------- Library defines

#ifndef __cplusplus
// --------------------------------------------------------------------------- C
#include <assert.h>
#include <stdio.h>

#else
// ------------------------------------------------------------------------- C++

// Contrib
#include <tl/expected.hpp>

#define SPDLOG_FUNCTION __PRETTY_FUNCTION__
#ifndef SPDLOG_FMT_EXTERNAL
#define SPDLOG_FMT_EXTERNAL
#endif
#include "spdlog/spdlog.h"

#include <fmt/format.h>

#include "base/logging.hpp"
#include "error-codes.hpp"

#include <algorithm>
#include <functional>
#include <memory>
#include <numeric>

#include <array>
#include <iostream>
#include <optional>
#include <span>
#include <sstream>
#include <string>
#include <string_view>

#include <map>
#include <unordered_map>
#include <vector>

#include <cassert>
#include <cstddef>
#include <cstdint>
#include <cstdlib>
#include <cstring>
#include <limits>

namespace courier {
// -----------------------------------------------------------------------------

using tl::expected;
using tl::make_unexpected;

using fmt::format;

using std::function;

using std::string;
using std::string_view;
using std::unordered_map;
using std::vector;

using std::make_shared;
using std::make_unique;
using std::shared_ptr;
using std::unique_ptr;
using std::weak_ptr;

using std::error_code;

using namespace std::literals::chrono_literals;

} // namespace courier

#if defined __clang__
#pragma clang diagnostic push
#pragma clang diagnostic ignored "-Wgnu-zero-variadic-macro-arguments"
#elif defined __GNUC__
#pragma GCC diagnostic push
#pragma GCC diagnostic ignored "-Wvariadic-macros"
#endif

// ------------------------------------------------------------- Likely/unlikely

#if defined(__clang__) || defined(__GNUC__)
#define likely(x) __builtin_expect(!!(x), 1)
#define unlikely(x) __builtin_expect(!!(x), 0)
#else
#define likely(x) (!!(x))
#define unlikely(x) (!!(x))
#endif

// --------------------------------------------------------------------- Logging

#ifdef DEBUG_BUILD
#define TRACE(fmt, ...)                                                                            \
  {                                                                                                \
    using namespace ::courier::logging::detail;                                                    \
    ::courier::logging::log_trace(::courier::logging::debug_logger(),                              \
                                  "[\x1b[4m\x1b[97m{}:{}\x1b[0m] " fmt##_cfmt, __FILE__,           \
                                  __LINE__ __VA_OPT__(, ) __VA_ARGS__);                            \
  }

#define LOG_DEBUG(fmt, ...)                                                                        \
  {                                                                                                \
    using namespace ::courier::logging::detail;                                                    \
    ::courier::logging::log_debug(::courier::logging::debug_logger(),                              \
                                  "[\x1b[4m\x1b[97m{}:{}\x1b[0m] " fmt##_cfmt, __FILE__,           \
                                  __LINE__ __VA_OPT__(, ) __VA_ARGS__);                            \
  }
#else
#define TRACE(fmt, ...)
#define LOG_DEBUG(fmt, ...)
#endif

#define INFO(fmt, ...)                                                                             \
  {                                                                                                \
    using namespace ::courier::logging::detail;                                                    \
    ::courier::logging::log_info(::courier::logging::debug_logger(),                               \
                                 "[\x1b[4m\x1b[97m{}:{}\x1b[0m] " fmt##_cfmt, __FILE__,            \
                                 __LINE__ __VA_OPT__(, ) __VA_ARGS__);                             \
  }

#define WARN(fmt, ...)                                                                             \
  {                                                                                                \
    using namespace ::courier::logging::detail;                                                    \
    ::courier::logging::log_warn(::courier::logging::debug_logger(),                               \
                                 "[\x1b[4m\x1b[97m{}:{}\x1b[0m] " fmt##_cfmt, __FILE__,            \
                                 __LINE__ __VA_OPT__(, ) __VA_ARGS__);                             \
  }

#define LOG_ERR(fmt, ...)                                                                          \
  {                                                                                                \
    using namespace ::courier::logging::detail;                                                    \
    ::courier::logging::log_error(::courier::logging::debug_logger(),                              \
                                  "[\x1b[4m\x1b[97m{}:{}\x1b[0m] " fmt##_cfmt, __FILE__,           \
                                  __LINE__ __VA_OPT__(, ) __VA_ARGS__);                            \
  }

#define FATAL(fmt, ...)                                                                            \
  {                                                                                                \
    using namespace ::courier::logging::detail;                                                    \
    ::courier::logging::log_fatal(::courier::logging::debug_logger(),                              \
                                  "[\x1b[4m\x1b[97m{}:{}\x1b[0m] " fmt##_cfmt, __FILE__,           \
                                  __LINE__ __VA_OPT__(, ) __VA_ARGS__);                            \
  }

#ifdef Expects
#undef Expects
#endif
#ifdef NDEBUG
#define Expects(condition)
#else
#define Expects(condition)                                                                         \
  if (!likely(condition))                                                                          \
    FATAL("precondition failed: {}", #condition);
#endif

#if defined __clang__
#pragma clang diagnostic pop
#elif defined __GNUC__
#pragma GCC diagnostic pop
#endif

#endif // #defined cplusplus
