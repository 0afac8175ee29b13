// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef UPLIFT_LOG_SEVERITY_HPP
#define UPLIFT_LOG_SEVERITY_HPP

#include <boost/log/expressions/keyword.hpp>

#include <cstddef>
#include <ostream>

namespace uplift {
namespace logging {

/**
 * Severity levels used by every uplift component.
 */
enum class severity_level { debug = 0, info = 1, warn = 2, error = 3, fatal = 4 };

inline const char* severity_name(severity_level level) {
  switch (level) {
    case severity_level::debug:
      return "DEBUG";
    case severity_level::info:
      return "INFO";
    case severity_level::warn:
      return "WARN";
    case severity_level::error:
      return "ERROR";
    case severity_level::fatal:
      return "FATAL";
  }
  return "UNKNOWN";
}

inline std::ostream& operator<<(std::ostream& strm, severity_level level) {
  return strm << severity_name(level);
}

BOOST_LOG_ATTRIBUTE_KEYWORD(severity, "Severity", severity_level)

}  // namespace logging
}  // namespace uplift

#endif  // UPLIFT_LOG_SEVERITY_HPP
