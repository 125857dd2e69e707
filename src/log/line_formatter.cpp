#include "tintlog/log/line_formatter.hpp"

#include <boost/date_time/posix_time/posix_time.hpp>
#include <boost/log/expressions/message.hpp>
#include <sstream>

#include "tintlog/log/attributes.hpp"
#include "tintlog/log/path_display.hpp"

namespace tintlog::log {

LineFormatter::LineFormatter(const LoggerConfig& config, bool colored)
    : preset_(config.preset),
      path_depth_(config.path_depth),
      path_anchor_(config.path_anchor),
      origin_filter_(config.project_roots, config.external_markers),
      colored_(colored),
      time_locale_(std::locale::classic(),
                   new boost::posix_time::time_facet(
                       config.time_format.c_str())) {}

std::string LineFormatter::format_timestamp(
    const boost::posix_time::ptime& ts) const {
    std::ostringstream oss;
    oss.imbue(time_locale_);
    oss << ts;
    return oss.str();
}

void LineFormatter::append_thread(std::string& out,
                                  std::string_view thread) const {
    const Style style{thread == "main" ? Color::BRIGHT_GREEN
                                       : Color::BRIGHT_BLUE};
    out.push_back('[');
    paint(out, thread, style, colored_);
    out.append("] ");
}

void LineFormatter::append_location(std::string& out,
                                    const LineFields& fields) const {
    const Style yellow{Color::YELLOW};

    auto origin = origin_filter_.classify(fields.file);
    if (origin.external) {
        out.push_back('[');
        paint(out, origin.component, yellow, colored_);
        out.append("] ");
    }

    out.push_back('[');
    paint(out, display_path(fields.file, path_depth_, path_anchor_), yellow,
          colored_);
    out.push_back(':');
    paint(out, std::to_string(fields.line), yellow, colored_);
    out.append("] ");
}

std::string LineFormatter::render(const LineFields& fields) const {
    std::string out;
    out.reserve(fields.message.size() + 96);

    if (preset_ == Preset::FULL) {
        paint(out, format_timestamp(fields.timestamp), Style{Color::CYAN},
              colored_);
        out.push_back(' ');
    }

    paint(out, level_tag(fields.level), level_style(fields.level), colored_);
    out.push_back(' ');

    if (preset_ != Preset::SIMPLE) {
        append_thread(out, fields.thread);
        append_location(out, fields);
    }

    out.append(fields.message);
    if (fields.newline) out.push_back('\n');
    return out;
}

void LineFormatter::operator()(const boost::log::record_view& rec,
                               boost::log::formatting_ostream& strm) const {
    LineFields fields;

    if (auto level = rec[attr::severity]) fields.level = level.get();

    auto file = rec[attr::source_file];
    if (file) fields.file = file.get();

    if (auto line = rec[attr::source_line]) fields.line = line.get();
    if (auto newline = rec[attr::line_break]) fields.newline = newline.get();

    if (auto ts = rec[attr::timestamp]) {
        fields.timestamp = ts.get();
    } else {
        fields.timestamp = boost::posix_time::microsec_clock::local_time();
    }

    std::string thread;
    auto name = rec[attr::thread_name];
    if (name && !name.get().empty()) {
        thread = name.get();
    } else if (auto id = rec[attr::thread_id]) {
        std::ostringstream oss;
        oss << id.get();
        thread = oss.str();
    }
    fields.thread = thread;

    auto message = rec[boost::log::expressions::smessage];
    if (message) fields.message = message.get();

    strm << render(fields);
}

}  // namespace tintlog::log
