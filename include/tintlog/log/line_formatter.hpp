#pragma once

#include <boost/date_time/posix_time/posix_time_types.hpp>
#include <boost/log/core/record_view.hpp>
#include <boost/log/utility/formatting_ostream.hpp>
#include <cstddef>
#include <locale>
#include <string>
#include <string_view>

#include "tintlog/log/logger_config.hpp"
#include "tintlog/log/origin_filter.hpp"

namespace tintlog::log {

// Everything a rendered line can show, detached from Boost.Log records.
struct LineFields {
    Level level = Level::INFO;
    std::string_view file;
    unsigned int line = 0;
    std::string_view thread;
    boost::posix_time::ptime timestamp;
    std::string_view message;
    bool newline = true;
};

// Renders records according to a preset. Used as the Boost.Log formatter of
// the console sinks.
class LineFormatter {
public:
    LineFormatter(const LoggerConfig& config, bool colored);

    std::string render(const LineFields& fields) const;
    std::string format_timestamp(const boost::posix_time::ptime& ts) const;

    void operator()(const boost::log::record_view& rec,
                    boost::log::formatting_ostream& strm) const;

    bool colored() const { return colored_; }

private:
    void append_thread(std::string& out, std::string_view thread) const;
    void append_location(std::string& out, const LineFields& fields) const;

    Preset preset_;
    std::size_t path_depth_;
    std::string path_anchor_;
    OriginFilter origin_filter_;
    bool colored_;
    std::locale time_locale_;
};

}  // namespace tintlog::log
