// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#include "uplift_log_format.hpp"

#include <boost/log/attributes/current_thread_id.hpp>
#include <boost/log/attributes/value_extraction.hpp>
#include <boost/log/expressions.hpp>
#include <boost/log/support/date_time.hpp>

#include <cstdio>

#include "uplift_log_severity.hpp"

namespace uplift {
namespace logging {

namespace expr = boost::log::expressions;

namespace {

const char* level_color(severity_level level) {
  switch (level) {
    case severity_level::debug:
      return "\033[36m";
    case severity_level::info:
      return "\033[32m";
    case severity_level::warn:
      return "\033[33m";
    case severity_level::error:
      return "\033[31m";
    case severity_level::fatal:
      return "\033[35m";
  }
  return "";
}

constexpr const char* kResetColor = "\033[0m";

}  // namespace

std::string escape_json(const std::string& s) {
  std::string result;
  result.reserve(s.size() + 16);
  for (unsigned char c : s) {
    switch (c) {
      case '"':
        result += "\\\"";
        break;
      case '\\':
        result += "\\\\";
        break;
      case '\b':
        result += "\\b";
        break;
      case '\f':
        result += "\\f";
        break;
      case '\n':
        result += "\\n";
        break;
      case '\r':
        result += "\\r";
        break;
      case '\t':
        result += "\\t";
        break;
      default:
        if (c < 0x20) {
          char buf[8];
          snprintf(buf, sizeof(buf), "\\u%04x", c);
          result += buf;
        } else {
          result += static_cast<char>(c);
        }
    }
  }
  return result;
}

void format_text_record(
  boost::log::record_view const& rec, boost::log::formatting_ostream& strm, bool colors
) {
  strm << "[";
  if (auto ts = boost::log::extract<boost::posix_time::ptime>("TimeStamp", rec)) {
    strm << *ts;
  }
  strm << "] ";

  if (auto sev = boost::log::extract<severity_level>("Severity", rec)) {
    if (colors) {
      strm << level_color(*sev) << "[" << *sev << "]" << kResetColor << " ";
    } else {
      strm << "[" << *sev << "] ";
    }
  }

  strm << rec[expr::smessage];

  auto item_id = boost::log::extract<std::string>("ItemID", rec);
  auto file_name = boost::log::extract<std::string>("FileName", rec);
  if (item_id || file_name) {
    strm << " |";
    if (item_id) strm << " item_id=" << *item_id;
    if (file_name) strm << " file=" << *file_name;
  }
}

void format_json_record(boost::log::record_view const& rec, boost::log::formatting_ostream& strm) {
  strm << "{\"ts\":\"";
  if (auto ts = boost::log::extract<boost::posix_time::ptime>("TimeStamp", rec)) {
    strm << *ts;
  }
  strm << "\",\"level\":\"";
  if (auto sev = boost::log::extract<severity_level>("Severity", rec)) {
    strm << *sev;
  }
  strm << "\"";

  if (auto msg = rec[expr::smessage]) {
    strm << ",\"msg\":\"" << escape_json(msg.get()) << "\"";
  } else {
    strm << ",\"msg\":\"\"";
  }

  auto thread_id =
    boost::log::extract<boost::log::attributes::current_thread_id::value_type>("ThreadID", rec);
  if (thread_id) {
    strm << ",\"thread_id\":\"" << *thread_id << "\"";
  }
  if (auto item_id = boost::log::extract<std::string>("ItemID", rec)) {
    strm << ",\"item_id\":\"" << escape_json(*item_id) << "\"";
  }
  if (auto file_name = boost::log::extract<std::string>("FileName", rec)) {
    strm << ",\"file\":\"" << escape_json(*file_name) << "\"";
  }
  strm << "}";
}

}  // namespace logging
}  // namespace uplift
