// tests/log/test_fallback_logger.cpp
//
// Logging without init_logger(): the first statement installs a fallback
// logger with the default configuration.
#define BOOST_TEST_MODULE FallbackLoggerTests
#include <boost/test/unit_test.hpp>
#include <iostream>
#include <sstream>
#include <string>

#include "tintlog/log/logger.hpp"

using tintlog::log::Level;
using tintlog::log::Logger;
using tintlog::log::LoggerBuilder;
using tintlog::log::Preset;

namespace {

class StreamCapture {
public:
    explicit StreamCapture(std::ostream& stream)
        : stream_(stream), previous_(stream.rdbuf(buffer_.rdbuf())) {}
    ~StreamCapture() { release(); }

    std::string release() {
        if (previous_ != nullptr) {
            stream_.rdbuf(previous_);
            previous_ = nullptr;
        }
        return buffer_.str();
    }

private:
    std::ostringstream buffer_;
    std::ostream& stream_;
    std::streambuf* previous_;
};

}  // namespace

BOOST_AUTO_TEST_SUITE(FallbackLoggerTestSuite)

BOOST_AUTO_TEST_CASE(test_default_layout) {
    StreamCapture out(std::cout);
    StreamCapture err(std::cerr);
    TINTLOG_INFO << "hello";
    TINTLOG_DEBUG << "hidden";
    TINTLOG_WARN << "careful";
    const auto out_text = out.release();
    const auto err_text = err.release();

    BOOST_CHECK(out_text.find("INFO") != std::string::npos);
    BOOST_CHECK(out_text.find("[main]") != std::string::npos);
    BOOST_CHECK(out_text.find("test_fallback_logger.cpp:") !=
                std::string::npos);
    BOOST_CHECK(out_text.find("hello\n") != std::string::npos);
    BOOST_CHECK(out_text.find("hidden") == std::string::npos);

    BOOST_CHECK(err_text.find("WARN") != std::string::npos);
    BOOST_CHECK(err_text.find("careful\n") != std::string::npos);

    BOOST_CHECK(!tintlog::log::is_logger_initialized());
}

BOOST_AUTO_TEST_CASE(test_attached_logger_replaces_fallback) {
    std::ostringstream captured_out;
    std::ostringstream captured_err;
    Logger logger(LoggerBuilder().preset(Preset::SIMPLE).build(), captured_out,
                  captured_err);
    logger.attach();

    StreamCapture out(std::cout);
    TINTLOG_INFO << "routed";
    const auto console = out.release();

    BOOST_CHECK(console.empty());
    BOOST_CHECK_EQUAL(captured_out.str(), "INFO  routed\n");
}

BOOST_AUTO_TEST_CASE(test_fallback_returns_after_detach) {
    std::ostringstream captured_out;
    std::ostringstream captured_err;

    StreamCapture out(std::cout);
    StreamCapture err(std::cerr);
    TINTLOG_INFO << "first";
    {
        Logger temporary(LoggerBuilder().preset(Preset::SIMPLE).build(),
                         captured_out, captured_err);
        temporary.attach();
        TINTLOG_INFO << "to temporary";
    }
    TINTLOG_INFO << "second";
    const auto out_text = out.release();
    const auto err_text = err.release();

    BOOST_CHECK_EQUAL(captured_out.str(), "INFO  to temporary\n");
    BOOST_CHECK(out_text.find("to temporary") == std::string::npos);

    const auto second = out_text.find("second\n");
    BOOST_REQUIRE(second != std::string::npos);
    const auto line_start = out_text.rfind('\n', second) + 1;
    const auto line = out_text.substr(line_start);
    BOOST_CHECK(line.find("INFO ") != std::string::npos);
    BOOST_CHECK(line.find("[main]") != std::string::npos);
    BOOST_CHECK(line.find("test_fallback_logger.cpp:") != std::string::npos);
    BOOST_CHECK(out_text.find("first\n") != std::string::npos);
    BOOST_CHECK(err_text.find("second") == std::string::npos);
}

BOOST_AUTO_TEST_SUITE_END()
