#pragma once

#include <boost/log/sinks/sync_frontend.hpp>
#include <boost/log/sinks/text_ostream_backend.hpp>
#include <boost/log/sources/global_logger_storage.hpp>
#include <boost/log/sources/record_ostream.hpp>
#include <boost/log/sources/severity_logger.hpp>
#include <boost/log/utility/manipulators/add_value.hpp>
#include <boost/shared_ptr.hpp>
#include <ostream>
#include <string>
#include <string_view>

#include "tintlog/log/attributes.hpp"
#include "tintlog/log/errors.hpp"
#include "tintlog/log/level.hpp"
#include "tintlog/log/logger_config.hpp"
#include "tintlog/log/origin_filter.hpp"
#include "tintlog/log/thread_name.hpp"

namespace tintlog::log {

BOOST_LOG_GLOBAL_LOGGER(global_source,
                        boost::log::sources::severity_logger_mt<Level>)

namespace detail {
class LoggerRegistry;
}

// Owns the two console sinks for one configuration. ERROR and WARN records
// go to the error stream, everything else to the output stream.
class Logger {
public:
    using console_sink = boost::log::sinks::synchronous_sink<
        boost::log::sinks::text_ostream_backend>;

    // Writes to std::cout / std::cerr.
    explicit Logger(const LoggerConfig& config);
    // The streams must outlive the Logger.
    Logger(const LoggerConfig& config, std::ostream& out, std::ostream& err);
    ~Logger();

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    // Registers the sinks with the Boost.Log core, replacing the fallback
    // logger if it is installed.
    void attach();
    // Before init_logger(), detaching the last attached logger reinstates
    // the fallback.
    void detach();
    bool attached() const;

    // Level threshold plus project-origin filter.
    bool accepts(Level level, std::string_view file) const;

    const LoggerConfig& config() const { return config_; }
    Level threshold() const { return threshold_; }

private:
    friend class detail::LoggerRegistry;

    boost::shared_ptr<console_sink> make_sink(std::ostream& stream,
                                              bool error_stream) const;

    LoggerConfig config_;
    Level threshold_;
    OriginFilter origin_filter_;
    boost::shared_ptr<console_sink> out_sink_;
    boost::shared_ptr<console_sink> err_sink_;
    bool attached_ = false;
};

// Installs the process-wide logger. Throws InitError when called a second
// time; the first configuration stays active. Throws ConfigError for an
// invalid configuration.
void init_logger(const LoggerConfig& config);

// Same as init_logger(), but returns false instead of throwing InitError.
bool try_init_logger(const LoggerConfig& config);

bool is_logger_initialized();

// The installed configuration, or the defaults before init_logger().
const LoggerConfig& active_config();

}  // namespace tintlog::log

#define TINTLOG_LOG_AT(level, file, line, newline)                          \
    BOOST_LOG_SEV(::tintlog::log::global_source::get(), (level))            \
        << ::boost::log::add_value(::tintlog::log::attr::source_file,       \
                                   ::std::string(file))                     \
        << ::boost::log::add_value(::tintlog::log::attr::source_line,       \
                                   static_cast<unsigned int>(line))         \
        << ::boost::log::add_value(::tintlog::log::attr::line_break,        \
                                   static_cast<bool>(newline))

#define TINTLOG_LOG(level, newline) \
    TINTLOG_LOG_AT(level, __FILE__, __LINE__, newline)

#define TINTLOG_ERROR TINTLOG_LOG(::tintlog::log::Level::ERROR, true)
#define TINTLOG_WARN TINTLOG_LOG(::tintlog::log::Level::WARN, true)
#define TINTLOG_INFO TINTLOG_LOG(::tintlog::log::Level::INFO, true)
#define TINTLOG_DEBUG TINTLOG_LOG(::tintlog::log::Level::DEBUG, true)
#define TINTLOG_TRACE TINTLOG_LOG(::tintlog::log::Level::TRACE, true)

// No trailing newline; the caller continues the line with plain output.
#define TINTLOG_ERROR_NOLF TINTLOG_LOG(::tintlog::log::Level::ERROR, false)
#define TINTLOG_WARN_NOLF TINTLOG_LOG(::tintlog::log::Level::WARN, false)
#define TINTLOG_INFO_NOLF TINTLOG_LOG(::tintlog::log::Level::INFO, false)
#define TINTLOG_DEBUG_NOLF TINTLOG_LOG(::tintlog::log::Level::DEBUG, false)
#define TINTLOG_TRACE_NOLF TINTLOG_LOG(::tintlog::log::Level::TRACE, false)
