// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef UPLIFT_LOG_MACROS_HPP
#define UPLIFT_LOG_MACROS_HPP

#include <boost/log/attributes/constant.hpp>
#include <boost/log/attributes/scoped_attribute.hpp>
#include <boost/log/sources/record_ostream.hpp>
#include <boost/log/sources/severity_logger.hpp>

#include <atomic>
#include <chrono>
#include <cstdint>
#include <mutex>
#include <sstream>
#include <string>

#include "uplift_log_severity.hpp"

namespace uplift {
namespace logging {

typedef boost::log::sources::severity_logger_mt<severity_level> logger_type;

/**
 * Process-wide logger. Defined in uplift_log_init.cpp.
 */
logger_type& get_logger();

/**
 * Key/value fragment for structured messages.
 * Usage: UPLIFT_LOG_INFO("Chunk uploaded" << kv("index", i) << kv("etag", etag));
 */
template<typename T>
inline std::string kv(const char* name, const T& value) {
  std::ostringstream oss;
  oss << " " << name << "=" << value;
  return oss.str();
}

template<>
inline std::string kv(const char* name, const std::string& value) {
  std::ostringstream oss;
  oss << " " << name << "=\"" << value << "\"";
  return oss.str();
}

inline std::string kv(const char* name, const char* value) {
  std::ostringstream oss;
  oss << " " << name << "=\"" << (value ? value : "") << "\"";
  return oss.str();
}

/**
 * Call-site rate limiter used by the *_THROTTLE macros.
 */
class LogThrottle {
public:
  bool should_log(double interval_sec) {
    auto now = std::chrono::steady_clock::now();
    std::lock_guard<std::mutex> lock(mutex_);
    if (armed_ && now - last_ < std::chrono::duration<double>(interval_sec)) {
      return false;
    }
    armed_ = true;
    last_ = now;
    return true;
  }

private:
  std::mutex mutex_;
  bool armed_ = false;
  std::chrono::steady_clock::time_point last_{};
};

}  // namespace logging
}  // namespace uplift

// Define UPLIFT_LOG_COMPONENT before including this header:
//   #define UPLIFT_LOG_COMPONENT "upload_queue"
//   #include "uplift_log_macros.hpp"
#ifndef UPLIFT_LOG_COMPONENT
#define UPLIFT_LOG_COMPONENT "uplift"
#endif

#ifdef NDEBUG
#define UPLIFT_LOG_ENABLE_DEBUG 0
#else
#define UPLIFT_LOG_ENABLE_DEBUG 1
#endif

#define UPLIFT_LOG_SEV(level, msg)                                                        \
  do {                                                                                    \
    BOOST_LOG_SEV(::uplift::logging::get_logger(), ::uplift::logging::severity_level::level) \
      << "[" << UPLIFT_LOG_COMPONENT << "] " << msg;                                      \
  } while (0)

#define UPLIFT_LOG_DEBUG(msg)         \
  do {                                \
    if (UPLIFT_LOG_ENABLE_DEBUG) {    \
      UPLIFT_LOG_SEV(debug, msg);     \
    }                                 \
  } while (0)

#define UPLIFT_LOG_INFO(msg) UPLIFT_LOG_SEV(info, msg)
#define UPLIFT_LOG_WARN(msg) UPLIFT_LOG_SEV(warn, msg)
#define UPLIFT_LOG_ERROR(msg) UPLIFT_LOG_SEV(error, msg)
#define UPLIFT_LOG_FATAL(msg) UPLIFT_LOG_SEV(fatal, msg)

// Tags every record in the enclosing scope with the upload item and file name.
#define UPLIFT_LOG_SCOPED_ITEM(item_id_val, file_name_val)                       \
  BOOST_LOG_SCOPED_THREAD_ATTR_INTERNAL(                                         \
    "ItemID", boost::log::attributes::constant<std::string>(item_id_val),        \
    BOOST_LOG_UNIQUE_IDENTIFIER_NAME(_uplift_log_scoped_item_id_sentry_)         \
  )                                                                              \
  BOOST_LOG_SCOPED_THREAD_ATTR_INTERNAL(                                         \
    "FileName", boost::log::attributes::constant<std::string>(file_name_val),    \
    BOOST_LOG_UNIQUE_IDENTIFIER_NAME(_uplift_log_scoped_file_name_sentry_)       \
  )

// Log every Nth pass through the call site.
#define UPLIFT_LOG_EVERY_N_IMPL(n, log_macro, msg)                  \
  do {                                                             \
    static std::atomic<uint64_t> _uplift_log_counter{0};           \
    if ((++_uplift_log_counter % static_cast<uint64_t>(n)) == 1 || \
        static_cast<uint64_t>(n) == 1) {                           \
      log_macro(msg);                                              \
    }                                                              \
  } while (0)

#define UPLIFT_LOG_DEBUG_EVERY_N(n, msg) UPLIFT_LOG_EVERY_N_IMPL(n, UPLIFT_LOG_DEBUG, msg)
#define UPLIFT_LOG_INFO_EVERY_N(n, msg) UPLIFT_LOG_EVERY_N_IMPL(n, UPLIFT_LOG_INFO, msg)
#define UPLIFT_LOG_WARN_EVERY_N(n, msg) UPLIFT_LOG_EVERY_N_IMPL(n, UPLIFT_LOG_WARN, msg)
#define UPLIFT_LOG_ERROR_EVERY_N(n, msg) UPLIFT_LOG_EVERY_N_IMPL(n, UPLIFT_LOG_ERROR, msg)

// Log at most once per interval_sec at the call site.
#define UPLIFT_LOG_THROTTLE_IMPL(interval_sec, log_macro, msg) \
  do {                                                        \
    static ::uplift::logging::LogThrottle _uplift_throttle;   \
    if (_uplift_throttle.should_log(interval_sec)) {          \
      log_macro(msg);                                         \
    }                                                         \
  } while (0)

#define UPLIFT_LOG_DEBUG_THROTTLE(sec, msg) UPLIFT_LOG_THROTTLE_IMPL(sec, UPLIFT_LOG_DEBUG, msg)
#define UPLIFT_LOG_INFO_THROTTLE(sec, msg) UPLIFT_LOG_THROTTLE_IMPL(sec, UPLIFT_LOG_INFO, msg)
#define UPLIFT_LOG_WARN_THROTTLE(sec, msg) UPLIFT_LOG_THROTTLE_IMPL(sec, UPLIFT_LOG_WARN, msg)
#define UPLIFT_LOG_ERROR_THROTTLE(sec, msg) UPLIFT_LOG_THROTTLE_IMPL(sec, UPLIFT_LOG_ERROR, msg)

#endif  // UPLIFT_LOG_MACROS_HPP
