/**
 * LogProtocolReader tests
 *
 * Record grammar: START <path> FILE_SIZE <bytes> [ERROR] END ... FINISH
 */

#include <boost/test/unit_test.hpp>

#include "test_helpers.h"
#include "../io/LogProtocolReader.h"

#include <vector>

namespace {
// Finished records only, rendered so two runs can be compared
std::vector<std::string> settled(const std::vector<LogRecord>& records) {
    std::vector<std::string> out;
    for (const auto& r : records) {
        if (r.state == LogRecord::State::InProgress)
            continue;
        std::ostringstream os;
        os << r.path << ":" << (r.state == LogRecord::State::Complete ? "ok" : "failed");
        if (r.declaredSize)
            os << ":" << *r.declaredSize;
        out.push_back(os.str());
    }
    return out;
}

void append(std::vector<LogRecord>& dst, const std::vector<LogRecord>& src) {
    dst.insert(dst.end(), src.begin(), src.end());
}
}

BOOST_AUTO_TEST_SUITE(log_protocol_reader_tests)

BOOST_AUTO_TEST_CASE(complete_record) {
    ProgressLog log;
    log.append("START a.bin FILE_SIZE 100 END");

    LogProtocolReader reader(log);
    auto records = reader.poll();

    BOOST_REQUIRE_EQUAL(records.size(), 1u);
    BOOST_CHECK_EQUAL(records[0].path, "a.bin");
    BOOST_CHECK(records[0].state == LogRecord::State::Complete);
    BOOST_REQUIRE(records[0].declaredSize.has_value());
    BOOST_CHECK_EQUAL(*records[0].declaredSize, 100u);
    BOOST_CHECK_EQUAL(reader.cursor(), log.size());
    BOOST_CHECK(!reader.finished());
}

BOOST_AUTO_TEST_CASE(error_record_is_consumed) {
    ProgressLog log;
    log.append("START a.bin FILE_SIZE 100 ERROR END");

    LogProtocolReader reader(log);
    auto records = reader.poll();

    BOOST_REQUIRE_EQUAL(records.size(), 1u);
    BOOST_CHECK(records[0].state == LogRecord::State::Failed);
    BOOST_CHECK_EQUAL(reader.cursor(), log.size());
    BOOST_CHECK(!reader.hasOpenRecord());

    BOOST_CHECK(reader.poll().empty());
}

BOOST_AUTO_TEST_CASE(error_before_end_arrives) {
    ProgressLog log;
    log.append("START a.bin FILE_SIZE 100 ERROR");

    LogProtocolReader reader(log);
    auto records = reader.poll();
    BOOST_REQUIRE_EQUAL(records.size(), 1u);
    BOOST_CHECK(records[0].state == LogRecord::State::Failed);
    BOOST_CHECK_EQUAL(reader.cursor(), log.size());

    log.append(" END START b.bin FILE_SIZE 5 END");
    records = reader.poll();
    BOOST_REQUIRE_EQUAL(records.size(), 1u);
    BOOST_CHECK_EQUAL(records[0].path, "b.bin");
    BOOST_CHECK(records[0].state == LogRecord::State::Complete);
}

BOOST_AUTO_TEST_CASE(partial_record_waits) {
    ProgressLog log;
    LogProtocolReader reader(log);

    log.append("STA");
    BOOST_CHECK(reader.poll().empty());
    BOOST_CHECK_EQUAL(reader.cursor(), 0u);

    log.append("RT a.bin FILE_SI");
    BOOST_CHECK(reader.poll().empty());
    BOOST_CHECK_EQUAL(reader.cursor(), 0u);

    // path known: cursor moves past "START a.bin FILE_SIZE"
    log.append("ZE 10");
    auto records = reader.poll();
    BOOST_REQUIRE_EQUAL(records.size(), 1u);
    BOOST_CHECK(records[0].state == LogRecord::State::InProgress);
    BOOST_CHECK(!records[0].declaredSize.has_value());
    BOOST_CHECK_EQUAL(reader.cursor(), std::string("START a.bin FILE_SIZE").size());

    log.append("0 ");
    records = reader.poll();
    BOOST_REQUIRE_EQUAL(records.size(), 1u);
    BOOST_CHECK(records[0].state == LogRecord::State::InProgress);
    BOOST_REQUIRE(records[0].declaredSize.has_value());
    BOOST_CHECK_EQUAL(*records[0].declaredSize, 100u);
    BOOST_CHECK_EQUAL(reader.cursor(), std::string("START a.bin FILE_SIZE").size());

    log.append("END");
    records = reader.poll();
    BOOST_REQUIRE_EQUAL(records.size(), 1u);
    BOOST_CHECK(records[0].state == LogRecord::State::Complete);
    BOOST_CHECK_EQUAL(*records[0].declaredSize, 100u);
    BOOST_CHECK_EQUAL(reader.cursor(), log.size());
}

BOOST_AUTO_TEST_CASE(finish_after_records) {
    ProgressLog log;
    log.append(record("a.bin", 1) + record("b.bin", 2) + "FINISH");

    LogProtocolReader reader(log);
    auto records = reader.poll();

    BOOST_CHECK_EQUAL(records.size(), 2u);
    BOOST_CHECK(reader.finished());
    BOOST_CHECK_EQUAL(reader.cursor(), log.size());

    log.append(record("late.bin", 3));
    BOOST_CHECK(reader.poll().empty());
}

BOOST_AUTO_TEST_CASE(stray_end_and_bad_size) {
    ProgressLog log;
    log.append("noise END START a.bin FILE_SIZE abc END START b.bin FILE_SIZE 7 END");

    LogProtocolReader reader(log);
    auto got = settled(reader.poll());

    std::vector<std::string> expected = { "a.bin:failed", "b.bin:ok:7" };
    BOOST_CHECK_EQUAL_COLLECTIONS(got.begin(), got.end(), expected.begin(), expected.end());
}

BOOST_AUTO_TEST_CASE(no_new_bytes_changes_nothing) {
    ProgressLog log;
    log.append(record("a.bin", 10));

    LogProtocolReader reader(log);
    BOOST_CHECK_EQUAL(reader.poll().size(), 1u);
    const auto cursor = reader.cursor();

    for (int i = 0; i < 5; ++i) {
        BOOST_CHECK(reader.poll().empty());
        BOOST_CHECK_EQUAL(reader.cursor(), cursor);
    }
}

BOOST_AUTO_TEST_CASE(replay_in_fragments_matches_single_read) {
    const std::string text = record("a.bin", 100)
        + "START b.bin FILE_SIZE 250 ERROR END "
        + record("c.bin", 3)
        + "FINISH";

    ProgressLog whole;
    whole.append(text);
    LogProtocolReader single(whole);
    auto expected = settled(single.poll());

    // same bytes, one character per poll
    ProgressLog growing;
    LogProtocolReader incremental(growing);
    std::vector<LogRecord> seen;
    std::size_t lastCursor = 0;
    for (char ch : text) {
        growing.append(std::string(1, ch));
        append(seen, incremental.poll());
        BOOST_REQUIRE(incremental.cursor() >= lastCursor);
        lastCursor = incremental.cursor();
    }
    auto got = settled(seen);

    BOOST_CHECK_EQUAL_COLLECTIONS(got.begin(), got.end(), expected.begin(), expected.end());
    BOOST_CHECK_EQUAL(incremental.cursor(), single.cursor());
    BOOST_CHECK(incremental.finished());
    BOOST_CHECK(single.finished());
}

BOOST_AUTO_TEST_SUITE_END()
