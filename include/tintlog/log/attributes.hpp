#pragma once

#include <boost/date_time/posix_time/posix_time_types.hpp>
#include <boost/log/attributes/current_thread_id.hpp>
#include <boost/log/expressions/keyword.hpp>
#include <string>

#include "tintlog/log/level.hpp"

// Attribute keywords shared by the call-site macros, the sink filters and
// the line formatter.
namespace tintlog::log::attr {

BOOST_LOG_ATTRIBUTE_KEYWORD(severity, "Severity", ::tintlog::log::Level)
BOOST_LOG_ATTRIBUTE_KEYWORD(source_file, "File", std::string)
BOOST_LOG_ATTRIBUTE_KEYWORD(source_line, "Line", unsigned int)
BOOST_LOG_ATTRIBUTE_KEYWORD(line_break, "Newline", bool)
BOOST_LOG_ATTRIBUTE_KEYWORD(timestamp, "TimeStamp", boost::posix_time::ptime)
BOOST_LOG_ATTRIBUTE_KEYWORD(
    thread_id, "ThreadID",
    boost::log::attributes::current_thread_id::value_type)
BOOST_LOG_ATTRIBUTE_KEYWORD(thread_name, "ThreadName", std::string)

}  // namespace tintlog::log::attr
