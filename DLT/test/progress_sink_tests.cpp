/**
 * ProgressSink and Logger tests
 */

#include <boost/test/unit_test.hpp>

#include "test_helpers.h"

BOOST_AUTO_TEST_SUITE(progress_sink_tests)

BOOST_AUTO_TEST_CASE(missing_key_is_absent) {
    ProgressSink sink;
    BOOST_CHECK(!sink.get("a.bin").has_value());
    BOOST_CHECK_EQUAL(sink.snapshotTotal(), 0.0);
    BOOST_CHECK_EQUAL(sink.size(), 0u);
}

BOOST_AUTO_TEST_CASE(last_write_wins_and_keeps_position) {
    ProgressSink sink;
    sink.set("a.bin", 0.25);
    sink.set(TOTAL_PROGRESS_KEY, 0.1);
    sink.set("b.bin", 0.5);
    sink.set("a.bin", 0.75);

    BOOST_CHECK_EQUAL(valueOf(sink, "a.bin"), 0.75);
    BOOST_CHECK_EQUAL(sink.snapshotTotal(), 0.1);

    auto entries = sink.entries();
    BOOST_REQUIRE_EQUAL(entries.size(), 3u);
    BOOST_CHECK_EQUAL(entries[0].first, "a.bin");
    BOOST_CHECK_EQUAL(entries[1].first, TOTAL_PROGRESS_KEY);
    BOOST_CHECK_EQUAL(entries[2].first, "b.bin");
    BOOST_CHECK_EQUAL(entries[0].second, 0.75);
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_AUTO_TEST_SUITE(logger_tests)

BOOST_AUTO_TEST_CASE(filters_below_level_and_tags_lines) {
    std::ostringstream out;
    {
        Logger logger(out);
        logger.setLevel(LogLevel::Info);
        logger.start();
        logger.debug("hidden detail");
        logger.info("tracking started");
        logger.warn("no progress");
        logger.stop();
    }

    const std::string text = out.str();
    BOOST_CHECK(text.find("hidden detail") == std::string::npos);
    BOOST_CHECK(text.find("[INFO] tracking started") != std::string::npos);
    BOOST_CHECK(text.find("[WARN] no progress") != std::string::npos);
    BOOST_CHECK(text.find("tracking started") < text.find("no progress"));
}

BOOST_AUTO_TEST_SUITE_END()
