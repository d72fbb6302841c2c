// test/test_replay_source.cpp
/**
 * Unit Test: ReplaySource
 *
 * Test Coverage:
 *   1. Loading a recorded CSV log (units, faults, comments)
 *   2. Time-ordered polling and rewind
 *   3. Malformed rows and files
 *   4. Recorded approach log feeding a SensorBank
 */

#include "sensors/replay_source.hpp"
#include "sensors/sensor_bank.hpp"
#include "utils/logging.hpp"
#include <cmath>
#include <cstdio>
#include <fstream>
#include <iostream>
#include <string>

// ANSI color codes
#define COLOR_GREEN  "\033[32m"
#define COLOR_RED    "\033[31m"
#define COLOR_YELLOW "\033[33m"
#define COLOR_RESET  "\033[0m"

struct TestResult {
    int passed = 0;
    int failed = 0;

    void pass(const std::string& msg) {
        std::cout << COLOR_GREEN << "  ✓ " << msg << COLOR_RESET << "\n";
        ++passed;
    }

    void fail(const std::string& msg) {
        std::cout << COLOR_RED << "  ✗ " << msg << COLOR_RESET << "\n";
        ++failed;
    }

    void check(bool ok, const std::string& msg) {
        if (ok) pass(msg); else fail(msg);
    }

    void summary() {
        std::cout << "\n========================================\n";
        if (failed == 0) {
            std::cout << COLOR_GREEN << "ALL TESTS PASSED" << COLOR_RESET;
        } else {
            std::cout << COLOR_RED << "SOME TESTS FAILED" << COLOR_RESET;
        }
        std::cout << " (" << passed << " passed, " << failed << " failed)\n";
        std::cout << "========================================\n";
    }
};

// Helper: Check if value is close to expected
bool is_close(double actual, double expected, double tolerance = 1e-6) {
    return std::abs(actual - expected) <= tolerance;
}

using sensors::ReadingFault;
using sensors::ReplaySource;

void write_file(const char* path, const std::string& content) {
    std::ofstream out(path);
    out << content;
}

// Test 1: Loading
void test_load(TestResult& result) {
    std::cout << "\n=== Test 1: Loading ===\n";

    const char* path = "/tmp/test_replay_basic.csv";
    write_file(path,
               "# recorded in the garage\n"
               "T_S,Sensor_ID,Value,Unit,Fault\n"
               "0.2,range,120,cm,\n"
               "0.0,range,1300,mm,\n"
               "\n"
               "0.1,range,,cm,out_of_range\n"
               "0.1,front,24,in,\n"
               "0.3,front,,in,\n");

    ReplaySource replay;
    result.check(replay.load(path), "Log with comment, blank line and mixed-case header loads");
    result.check(replay.row_count() == 5 && replay.skipped_rows() == 0, "Five rows, none skipped");
    result.check(is_close(replay.end_time(), 0.3), "End time = 0.3 s");

    auto first = replay.poll(0.0);
    result.check(first.size() == 1 && first[0].first == "range" &&
                 first[0].second.is_valid() &&
                 first[0].second.value->unit() == units::Unit::Millimeter &&
                 is_close(first[0].second.value->value_in(units::Unit::Centimeter), 130.0),
                 "Rows sorted by time: 1300 mm first");

    auto second = replay.poll(0.1);
    result.check(second.size() == 2, "Two rows at t = 0.1");
    result.check(second.size() == 2 && !second[0].second.is_valid() &&
                 second[0].second.fault == ReadingFault::OutOfRange,
                 "Empty value with fault column → invalid reading with that fault");
    result.check(second.size() == 2 &&
                 is_close(second[1].second.value->value_in(units::Unit::Centimeter), 60.96),
                 "24 in = 60.96 cm");

    auto rest = replay.poll(10.0);
    result.check(rest.size() == 2 && replay.finished(), "Remaining rows delivered, source finished");
    result.check(rest.size() == 2 && rest[1].second.fault == ReadingFault::Timeout,
                 "Empty value without fault → Timeout");
    result.check(replay.poll(20.0).empty(), "Nothing after the end");

    replay.rewind();
    result.check(!replay.finished() && replay.poll(0.05).size() == 1, "rewind() restarts the log");

    std::remove(path);
}

// Test 2: Fault names
void test_faults(TestResult& result) {
    std::cout << "\n=== Test 2: Fault Names ===\n";

    result.check(ReplaySource::parse_fault("FAULT") == ReadingFault::Fault, "'FAULT' → Fault");
    result.check(ReplaySource::parse_fault("toofar") == ReadingFault::OutOfRange, "'toofar' → OutOfRange");
    result.check(ReplaySource::parse_fault("not_ranging") == ReadingFault::NotRanging,
                 "'not_ranging' → NotRanging");
    result.check(ReplaySource::parse_fault("") == ReadingFault::Timeout, "Empty → Timeout");
}

// Test 3: Malformed input
void test_malformed(TestResult& result) {
    std::cout << "\n=== Test 3: Malformed Input ===\n";

    ReplaySource replay;
    result.check(!replay.load("/tmp/nonexistent_replay.csv"), "Missing file → false");

    const char* no_unit = "/tmp/test_replay_no_unit.csv";
    write_file(no_unit, "t_s,sensor_id,value\n0.0,range,100\n");
    result.check(!replay.load(no_unit), "Missing 'unit' column → false");
    std::remove(no_unit);

    const char* bad_unit = "/tmp/test_replay_bad_unit.csv";
    write_file(bad_unit, "t_s,sensor_id,value,unit\n0.0,range,100,cm\n0.1,range,100,furlong\n");
    result.check(!replay.load(bad_unit) && replay.row_count() == 0,
                 "Unknown unit → false, nothing loaded");
    std::remove(bad_unit);

    const char* bad_rows = "/tmp/test_replay_bad_rows.csv";
    write_file(bad_rows,
               "t_s,sensor_id,value,unit\n"
               "zero,range,100,cm\n"
               "0.1,,100,cm\n"
               "0.2,range,abc,cm\n"
               "0.3,range,101,cm\n");
    result.check(replay.load(bad_rows), "Bad rows do not fail the whole log");
    result.check(replay.row_count() == 1 && replay.skipped_rows() == 3, "Three rows skipped");
    std::remove(bad_rows);

    const char* time_rows = "/tmp/test_replay_time_rows.csv";
    write_file(time_rows,
               "t_s,sensor_id,value,unit\n"
               "0.0,range,120,cm\n"
               "0.1,range,250,ms\n"
               "0.2,range,3,s\n");
    result.check(replay.load(time_rows), "Time-unit rows do not fail the whole log");
    result.check(replay.row_count() == 1 && replay.skipped_rows() == 2,
                 "Rows in ms and s skipped");
    std::remove(time_rows);
}

// Test 4: Recorded approach
void test_recorded_approach(TestResult& result) {
    std::cout << "\n=== Test 4: Recorded Approach ===\n";

    ReplaySource replay;
    if (!replay.load("data/replay/approach.csv")) {
        result.fail("Recorded approach log should load");
        return;
    }
    result.pass("Recorded approach log loaded (" + std::to_string(replay.row_count()) + " rows)");

    sensors::SensorBank bank;
    bank.add_sensor("range");
    bank.add_sensor("front");
    bank.add_sensor("rear");

    double first_cm = -1.0;
    double last_cm = -1.0;
    for (int k = 0; !replay.finished() && k < 1000; ++k) {
        for (const auto& [id, reading] : replay.poll(k * 0.1)) {
            bank.push(id, reading);
        }
        const auto est = bank.estimates().at("range");
        if (est.is_valid()) {
            if (first_cm < 0.0) first_cm = est.value->value_in(units::Unit::Centimeter);
            last_cm = est.value->value_in(units::Unit::Centimeter);
        }
    }

    result.check(replay.finished(), "Whole log replayed");
    result.check(first_cm > 0.0 && last_cm > 0.0 && last_cm < first_cm,
                 "Range estimate decreases over the approach");
    const auto avail = bank.availability();
    result.check(avail.at("range") == sensors::SensorAvailability::Available &&
                 avail.at("front") == sensors::SensorAvailability::Available,
                 "Sensors available at the end of the log");
}

int main() {
    std::cout << "\n";
    std::cout << "╔══════════════════════════════════════════════════════════════╗\n";
    std::cout << "║            ReplaySource Unit Tests                           ║\n";
    std::cout << "╚══════════════════════════════════════════════════════════════╝\n";

    utils::set_level(utils::LogLevel::Off);

    TestResult result;

    test_load(result);
    test_faults(result);
    test_malformed(result);
    test_recorded_approach(result);

    result.summary();

    return (result.failed == 0) ? 0 : 1;
}
