#include "tintlog/log/logger.hpp"

#include <atomic>
#include <boost/core/null_deleter.hpp>
#include <boost/log/attributes/function.hpp>
#include <boost/log/core.hpp>
#include <boost/log/utility/exception_handler.hpp>
#include <boost/log/utility/setup/common_attributes.hpp>
#include <boost/make_shared.hpp>
#include <iostream>
#include <memory>
#include <mutex>

#include "tintlog/log/line_formatter.hpp"

namespace logging = boost::log;
namespace sinks = boost::log::sinks;
namespace attrs = boost::log::attributes;

namespace tintlog::log {

namespace detail {

// Process-wide bookkeeping: the logger installed by init_logger(), the
// fallback used before it, and how many other loggers are attached.
// Never destroyed, so sinks stay valid while static destructors run.
class LoggerRegistry {
public:
    static LoggerRegistry& instance() {
        static auto* registry = new LoggerRegistry();
        return *registry;
    }

    void attach(Logger& logger) {
        std::lock_guard<std::mutex> lock(mutex_);
        attach_locked(logger);
    }

    void detach(Logger& logger) {
        std::lock_guard<std::mutex> lock(mutex_);
        detach_locked(logger);
    }

    bool attached(const Logger& logger) {
        std::lock_guard<std::mutex> lock(mutex_);
        return logger.attached_;
    }

    // Called on the first log statement of the process.
    void ensure_fallback() {
        std::lock_guard<std::mutex> lock(mutex_);
        if (initialized_.load(std::memory_order_relaxed) ||
            attached_count_ > 0 || fallback_) {
            return;
        }
        attach_fallback_locked();
    }

    bool install(const LoggerConfig& config) {
        // Built outside the lock: construction validates the config.
        auto logger = std::make_unique<Logger>(config);

        std::lock_guard<std::mutex> lock(mutex_);
        if (initialized_.load(std::memory_order_relaxed)) return false;

        attach_locked(*logger);
        installed_ = std::move(logger);
        initialized_.store(true, std::memory_order_release);
        return true;
    }

    bool initialized() const {
        return initialized_.load(std::memory_order_acquire);
    }

    const LoggerConfig& active_config() const {
        static const LoggerConfig defaults;
        if (!initialized()) return defaults;
        return installed_->config();
    }

private:
    LoggerRegistry() {
        auto core = logging::core::get();
        logging::add_common_attributes();
        core->add_global_attribute("ThreadName",
                                   attrs::make_function(&current_thread_name));
        core->set_exception_handler(logging::make_exception_suppressor());
    }

    // Built on first use and kept for the life of the process.
    void attach_fallback_locked() {
        if (!fallback_) fallback_ = std::make_unique<Logger>(LoggerConfig{});
        attach_locked(*fallback_);
    }

    // Adds the new sinks before removing the fallback's.
    void attach_locked(Logger& logger) {
        if (logger.attached_) return;

        auto core = logging::core::get();
        core->add_sink(logger.err_sink_);
        core->add_sink(logger.out_sink_);
        logger.attached_ = true;

        if (&logger == fallback_.get()) return;
        ++attached_count_;
        if (fallback_ && fallback_->attached_) detach_locked(*fallback_);
    }

    void detach_locked(Logger& logger) {
        if (!logger.attached_) return;

        // The last logger leaving before init_logger() hands over to the
        // fallback.
        if (&logger != fallback_.get() && --attached_count_ == 0 &&
            !initialized_.load(std::memory_order_relaxed)) {
            attach_fallback_locked();
        }

        auto core = logging::core::get();
        core->remove_sink(logger.out_sink_);
        core->remove_sink(logger.err_sink_);
        logger.out_sink_->flush();
        logger.err_sink_->flush();
        logger.attached_ = false;
    }

    std::mutex mutex_;
    std::unique_ptr<Logger> fallback_;
    std::unique_ptr<Logger> installed_;
    std::atomic<bool> initialized_{false};
    std::size_t attached_count_ = 0;
};

}  // namespace detail

BOOST_LOG_GLOBAL_LOGGER_INIT(global_source,
                             logging::sources::severity_logger_mt<Level>) {
    detail::LoggerRegistry::instance().ensure_fallback();
    return logging::sources::severity_logger_mt<Level>();
}

namespace {

int stream_descriptor(const std::ostream& stream) {
    if (&stream == &std::cout) return 1;
    if (&stream == &std::cerr || &stream == &std::clog) return 2;
    return -1;
}

}  // namespace

Logger::Logger(const LoggerConfig& config)
    : Logger(config, std::cout, std::cerr) {}

Logger::Logger(const LoggerConfig& config, std::ostream& out,
               std::ostream& err)
    : config_(config),
      threshold_(config.effective_level()),
      origin_filter_(config.project_roots, config.external_markers) {
    config_.validate();
    out_sink_ = make_sink(out, false);
    err_sink_ = make_sink(err, true);
}

Logger::~Logger() {
    if (attached_) detach();
}

boost::shared_ptr<Logger::console_sink> Logger::make_sink(
    std::ostream& stream, bool error_stream) const {
    auto backend = boost::make_shared<sinks::text_ostream_backend>();
    backend->add_stream(
        boost::shared_ptr<std::ostream>(&stream, boost::null_deleter()));
    backend->auto_flush(true);
    // The formatter decides whether the line ends with a newline.
    backend->set_auto_newline_mode(sinks::disabled_auto_newline);

    auto sink = boost::make_shared<console_sink>(backend);
    sink->set_formatter(LineFormatter(
        config_, should_colorize(config_.color, stream_descriptor(stream))));

    sink->set_filter([threshold = threshold_,
                      only_project = config_.only_project_logs,
                      origin = origin_filter_, error_stream](
                         const logging::attribute_value_set& values) {
        auto level = values[attr::severity];
        if (!level) return false;
        if (is_enabled(level.get(), Level::WARN) != error_stream) return false;
        if (!is_enabled(level.get(), threshold)) return false;
        if (!only_project) return true;

        auto file = values[attr::source_file];
        return !file || !origin.is_external(file.get());
    });
    return sink;
}

void Logger::attach() { detail::LoggerRegistry::instance().attach(*this); }

void Logger::detach() { detail::LoggerRegistry::instance().detach(*this); }

bool Logger::attached() const {
    return detail::LoggerRegistry::instance().attached(*this);
}

bool Logger::accepts(Level level, std::string_view file) const {
    if (!is_enabled(level, threshold_)) return false;
    return !config_.only_project_logs || !origin_filter_.is_external(file);
}

void init_logger(const LoggerConfig& config) {
    if (!detail::LoggerRegistry::instance().install(config)) {
        throw InitError("Logger already initialized");
    }
}

bool try_init_logger(const LoggerConfig& config) {
    return detail::LoggerRegistry::instance().install(config);
}

bool is_logger_initialized() {
    return detail::LoggerRegistry::instance().initialized();
}

const LoggerConfig& active_config() {
    return detail::LoggerRegistry::instance().active_config();
}

}  // namespace tintlog::log
