// tests/log/test_line_formatter.cpp
#define BOOST_TEST_MODULE LineFormatterTests
#include <boost/date_time/posix_time/posix_time.hpp>
#include <boost/test/unit_test.hpp>
#include <string>

#include "tintlog/log/line_formatter.hpp"

using tintlog::log::Level;
using tintlog::log::LineFields;
using tintlog::log::LineFormatter;
using tintlog::log::LoggerBuilder;
using tintlog::log::Preset;

struct FormatterFixture {
    LineFields fields;

    FormatterFixture() {
        fields.level = Level::INFO;
        fields.file = "/home/dev/app/src/net/server.cpp";
        fields.line = 42;
        fields.thread = "main";
        fields.timestamp = boost::posix_time::ptime(
            boost::gregorian::date(2024, 3, 5),
            boost::posix_time::time_duration(14, 7, 9));
        fields.message = "listening";
    }

    static LineFormatter plain(Preset preset) {
        return LineFormatter(LoggerBuilder().preset(preset).build(), false);
    }
};

BOOST_FIXTURE_TEST_SUITE(LineFormatterTestSuite, FormatterFixture)

BOOST_AUTO_TEST_CASE(test_full_preset) {
    BOOST_CHECK_EQUAL(
        plain(Preset::FULL).render(fields),
        "2024-03-05 14:07:09 INFO  [main] [net/server.cpp:42] listening\n");
}

BOOST_AUTO_TEST_CASE(test_thread_preset) {
    BOOST_CHECK_EQUAL(plain(Preset::THREAD).render(fields),
                      "INFO  [main] [net/server.cpp:42] listening\n");

    fields.thread = "io-1";
    BOOST_CHECK_EQUAL(plain(Preset::THREAD).render(fields),
                      "INFO  [io-1] [net/server.cpp:42] listening\n");
}

BOOST_AUTO_TEST_CASE(test_simple_preset) {
    BOOST_CHECK_EQUAL(plain(Preset::SIMPLE).render(fields),
                      "INFO  listening\n");

    fields.level = Level::ERROR;
    BOOST_CHECK_EQUAL(plain(Preset::SIMPLE).render(fields),
                      "ERROR listening\n");
}

BOOST_AUTO_TEST_CASE(test_no_newline_differs_only_by_terminator) {
    for (auto preset : {Preset::FULL, Preset::THREAD, Preset::SIMPLE}) {
        auto formatter = plain(preset);
        fields.newline = true;
        const auto with_newline = formatter.render(fields);
        fields.newline = false;
        const auto without_newline = formatter.render(fields);

        BOOST_CHECK_EQUAL(with_newline, without_newline + "\n");
    }
}

BOOST_AUTO_TEST_CASE(test_path_depth_and_anchor) {
    auto base_name =
        LineFormatter(LoggerBuilder().preset(Preset::THREAD).path_depth(0).build(),
                      false);
    BOOST_CHECK_EQUAL(base_name.render(fields),
                      "INFO  [main] [server.cpp:42] listening\n");

    auto unanchored = LineFormatter(LoggerBuilder()
                                        .preset(Preset::THREAD)
                                        .path_depth(50)
                                        .path_anchor("")
                                        .build(),
                                    false);
    BOOST_CHECK_EQUAL(
        unanchored.render(fields),
        "INFO  [main] [/home/dev/app/src/net/server.cpp:42] listening\n");
}

BOOST_AUTO_TEST_CASE(test_external_component_is_shown) {
    fields.file = "/home/dev/app/third_party/fmt/include/fmt/core.h";
    BOOST_CHECK_EQUAL(plain(Preset::THREAD).render(fields),
                      "INFO  [main] [fmt] [fmt/core.h:42] listening\n");
    BOOST_CHECK_EQUAL(plain(Preset::SIMPLE).render(fields),
                      "INFO  listening\n");
}

BOOST_AUTO_TEST_CASE(test_time_format) {
    auto formatter = LineFormatter(
        LoggerBuilder().time_format("%d/%m/%Y %H.%M").build(), false);
    BOOST_CHECK_EQUAL(formatter.format_timestamp(fields.timestamp),
                      "05/03/2024 14.07");
}

BOOST_AUTO_TEST_CASE(test_colored_output) {
    LineFormatter formatter(LoggerBuilder().preset(Preset::SIMPLE).build(),
                            true);
    fields.level = Level::WARN;
    BOOST_CHECK_EQUAL(formatter.render(fields),
                      "\033[1;33mWARN \033[0m listening\n");

    LineFormatter full(LoggerBuilder().preset(Preset::THREAD).build(), true);
    fields.level = Level::DEBUG;
    BOOST_CHECK_EQUAL(full.render(fields),
                      "\033[1;34mDEBUG\033[0m [\033[92mmain\033[0m] "
                      "[\033[33mnet/server.cpp\033[0m:\033[33m42\033[0m] "
                      "listening\n");

    fields.thread = "worker";
    const auto worker_line = full.render(fields);
    BOOST_CHECK(worker_line.find("\033[94mworker\033[0m") !=
                std::string::npos);
}

BOOST_AUTO_TEST_CASE(test_plain_output_has_no_escape_codes) {
    for (auto level : tintlog::log::ALL_LEVELS) {
        fields.level = level;
        BOOST_CHECK(plain(Preset::FULL).render(fields).find('\033') ==
                    std::string::npos);
    }
}

BOOST_AUTO_TEST_SUITE_END()
