// tests/log/test_level.cpp
#define BOOST_TEST_MODULE LevelTests
#include <boost/test/unit_test.hpp>

#include "tintlog/log/errors.hpp"
#include "tintlog/log/level.hpp"

using tintlog::log::ALL_LEVELS;
using tintlog::log::ConfigError;
using tintlog::log::Level;

BOOST_AUTO_TEST_SUITE(LevelTestSuite)

BOOST_AUTO_TEST_CASE(test_threshold_comparison_is_total) {
    for (auto threshold : ALL_LEVELS) {
        for (auto incoming : ALL_LEVELS) {
            const bool expected =
                static_cast<int>(incoming) <= static_cast<int>(threshold);
            BOOST_CHECK_EQUAL(tintlog::log::is_enabled(incoming, threshold),
                              expected);
        }
    }
}

BOOST_AUTO_TEST_CASE(test_threshold_boundaries) {
    using tintlog::log::is_enabled;

    // ERROR threshold emits only ERROR.
    BOOST_CHECK(is_enabled(Level::ERROR, Level::ERROR));
    BOOST_CHECK(!is_enabled(Level::WARN, Level::ERROR));
    BOOST_CHECK(!is_enabled(Level::TRACE, Level::ERROR));

    // TRACE threshold emits everything.
    for (auto incoming : ALL_LEVELS) {
        BOOST_CHECK(is_enabled(incoming, Level::TRACE));
    }
}

BOOST_AUTO_TEST_CASE(test_level_from_string_is_case_insensitive) {
    BOOST_CHECK_EQUAL(tintlog::log::level_from_string("error"), Level::ERROR);
    BOOST_CHECK_EQUAL(tintlog::log::level_from_string("Warn"), Level::WARN);
    BOOST_CHECK_EQUAL(tintlog::log::level_from_string("INFO"), Level::INFO);
    BOOST_CHECK_EQUAL(tintlog::log::level_from_string("dEbUg"), Level::DEBUG);
    BOOST_CHECK_EQUAL(tintlog::log::level_from_string("trace"), Level::TRACE);
}

BOOST_AUTO_TEST_CASE(test_unknown_level_is_rejected) {
    BOOST_CHECK_THROW(tintlog::log::level_from_string("verbose"), ConfigError);
    BOOST_CHECK_THROW(tintlog::log::level_from_string("warning"), ConfigError);
    BOOST_CHECK_THROW(tintlog::log::level_from_string(""), ConfigError);
    BOOST_CHECK_THROW(tintlog::log::level_from_string(" info"), ConfigError);

    try {
        tintlog::log::level_from_string("loud");
        BOOST_FAIL("expected ConfigError");
    } catch (const ConfigError& e) {
        BOOST_CHECK(std::string(e.what()).find("'loud'") != std::string::npos);
    }
}

BOOST_AUTO_TEST_CASE(test_level_names_round_trip) {
    for (auto level : ALL_LEVELS) {
        BOOST_CHECK_EQUAL(tintlog::log::level_from_string(
                              tintlog::log::level_to_string(level)),
                          level);
    }
}

BOOST_AUTO_TEST_CASE(test_level_tags_have_fixed_width) {
    for (auto level : ALL_LEVELS) {
        BOOST_CHECK_EQUAL(tintlog::log::level_tag(level).size(), 5u);
    }
    BOOST_CHECK_EQUAL(tintlog::log::level_tag(Level::WARN), "WARN ");
    BOOST_CHECK_EQUAL(tintlog::log::level_tag(Level::ERROR), "ERROR");
}

BOOST_AUTO_TEST_SUITE_END()
