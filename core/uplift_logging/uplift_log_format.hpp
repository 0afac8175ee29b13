// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef UPLIFT_LOG_FORMAT_HPP
#define UPLIFT_LOG_FORMAT_HPP

#include <boost/log/core/record_view.hpp>
#include <boost/log/utility/formatting_ostream.hpp>

#include <string>

namespace uplift {
namespace logging {

/**
 * Escape a string for embedding in a JSON string literal (RFC 8259).
 */
std::string escape_json(const std::string& s);

/**
 * "[timestamp] [LEVEL] message | item_id=... file=..."
 * When colors is set the level tag is wrapped in ANSI color codes.
 */
void format_text_record(
  boost::log::record_view const& rec, boost::log::formatting_ostream& strm, bool colors
);

/**
 * One JSON object per record: ts, level, msg, thread_id, item_id, file.
 */
void format_json_record(boost::log::record_view const& rec, boost::log::formatting_ostream& strm);

}  // namespace logging
}  // namespace uplift

#endif  // UPLIFT_LOG_FORMAT_HPP
