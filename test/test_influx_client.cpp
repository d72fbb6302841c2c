// test/test_influx_client.cpp
// Unit tests for InfluxDB client integration

#include "utils/influx.hpp"
#include "utils/logging.hpp"
#include <iostream>
#include <cmath>
#include <string>

// Test helper macros
#define TEST_ASSERT(condition, message) \
    do { \
        if (!(condition)) { \
            std::cerr << "FAILED: " << message << std::endl; \
            std::cerr << "  at " << __FILE__ << ":" << __LINE__ << std::endl; \
            return false; \
        } \
    } while (0)

#define RUN_TEST(test_func) \
    do { \
        std::cout << "Running " << #test_func << "... "; \
        if (test_func()) { \
            std::cout << "PASSED" << std::endl; \
            passed++; \
        } else { \
            std::cout << "FAILED" << std::endl; \
            failed++; \
        } \
        total++; \
    } while (0)

// Helper to create a docked bay with one evaluated and one distant zone
bay::BayStatus create_test_status() {
    bay::BayStatus status;
    status.bay_id = "bay1";
    status.timestamp_s = 12.5;
    status.lifecycle = bay::LifecycleState::Ready;
    status.activity = bay::Activity::Docking;
    status.occupancy = bay::Occupancy::Occupied;
    status.motion = bay::Motion::Still;

    bay::BayStateSnapshot snap;
    snap.bay_id = "bay1";
    snap.timestamp_s = 12.5;
    snap.range.status = bay::RangeStatus::InRange;
    snap.range.raw = units::cm(50.0);
    snap.range.adjusted = units::cm(40.0);
    snap.range.fraction = 0.4;

    bay::LateralZoneResult front;
    front.zone_id = "front";
    front.status = bay::ZoneStatus::Evaluated;
    bay::LateralDeviation dev;
    dev.magnitude = units::cm(2.5);
    dev.direction = bay::Direction::Left;
    dev.severity = bay::Severity::Warning;
    front.deviation = dev;

    bay::LateralZoneResult rear;
    rear.zone_id = "rear";
    rear.status = bay::ZoneStatus::BeyondRange;

    snap.lateral = {front, rear};
    snap.expected_zones = 2;
    status.snapshot = snap;
    return status;
}

// ============================================================================
// Test Cases
// ============================================================================

// Test 1: Client creation with disabled config
bool test_client_creation_disabled() {
    utils::InfluxClient::Config config;
    config.enabled = false;

    utils::InfluxClient client(config);

    TEST_ASSERT(!client.is_enabled(), "Client should be disabled");

    return true;
}

// Test 2: Client creation with enabled config (no actual connection)
bool test_client_creation_enabled() {
    utils::InfluxClient::Config config;
    config.enabled = true;
    config.url = "http://localhost:8086";
    config.org = "test-org";
    config.bucket = "test-bucket";
    config.write_interval_s = 0.1;

    utils::InfluxClient client(config);

    TEST_ASSERT(client.is_enabled(), "Client should be enabled");
    TEST_ASSERT(client.get_config().bucket == "test-bucket", "Config should be kept");

    return true;
}

// Test 3: Write with disabled client (should not write)
bool test_write_disabled_client() {
    utils::InfluxClient::Config config;
    config.enabled = false;

    utils::InfluxClient client(config);

    bay::BayStatusMap statuses;
    statuses["bay1"] = create_test_status();

    bool result = client.write_bay_statuses(statuses, 0.0);

    TEST_ASSERT(!result, "Write should return false for disabled client");

    return true;
}

// Test 4: Rate limiting (should skip writes within interval)
bool test_rate_limiting() {
    utils::InfluxClient::Config config;
    config.enabled = true;
    config.url = "http://localhost:8086";
    config.org = "test-org";
    config.bucket = "test-bucket";
    config.write_interval_s = 1.0;  // 1 second interval
    config.token = "fake-token";  // Won't actually connect

    utils::InfluxClient client(config);

    bay::BayStatusMap statuses;
    statuses["bay1"] = create_test_status();

    // First write at t=0 (should attempt to write, will fail due to no server)
    // We're testing rate limiting, not connection, so we ignore the return value
    client.write_bay_statuses(statuses, 0.0);

    // Second write at t=0.5 (should skip due to rate limiting)
    bool result2 = client.write_bay_statuses(statuses, 0.5);
    TEST_ASSERT(!result2, "Write should be skipped due to rate limiting");

    // Third write at t=1.0 (should attempt to write)
    client.write_bay_statuses(statuses, 1.0);

    // Fourth write at t=1.5 (should skip)
    bool result4 = client.write_bay_statuses(statuses, 1.5);
    TEST_ASSERT(!result4, "Write should be skipped due to rate limiting");

    return true;
}

// Test 5: Config validation (default values)
bool test_config_defaults() {
    utils::InfluxClient::Config config;

    TEST_ASSERT(!config.enabled, "Default enabled should be false");
    TEST_ASSERT(config.url == "http://localhost:8086", "Default URL incorrect");
    TEST_ASSERT(config.token == "", "Default token should be empty");
    TEST_ASSERT(config.org == "bayassist", "Default org incorrect");
    TEST_ASSERT(config.bucket == "bays", "Default bucket incorrect");
    TEST_ASSERT(std::abs(config.write_interval_s - 1.0) < 0.001, "Default interval incorrect");

    return true;
}

// Test 6: Tag escaping
bool test_escape_tag() {
    TEST_ASSERT(utils::InfluxClient::escape_tag("bay1") == "bay1", "Plain tag unchanged");
    TEST_ASSERT(utils::InfluxClient::escape_tag("Bay 1") == "Bay\\ 1", "Space escaped");
    TEST_ASSERT(utils::InfluxClient::escape_tag("a,b=c") == "a\\,b\\=c", "Comma and equals escaped");

    return true;
}

// Test 7: bay_state line with a snapshot
bool test_bay_state_line() {
    const std::string line = utils::InfluxClient::build_bay_state_line(create_test_status(), 1000);

    TEST_ASSERT(line.rfind("bay_state,bay=bay1 ", 0) == 0, "Measurement and tag incorrect: " + line);
    TEST_ASSERT(line.find("range=50,") != std::string::npos, "Range field missing: " + line);
    TEST_ASSERT(line.find("adjusted=40,") != std::string::npos, "Adjusted field missing: " + line);
    TEST_ASSERT(line.find("fraction=0.4,") != std::string::npos, "Fraction field missing: " + line);
    TEST_ASSERT(line.find("range_status=\"in_range\"") != std::string::npos, "Range status missing");
    TEST_ASSERT(line.find("activity=\"docking\"") != std::string::npos, "Activity missing");
    TEST_ASSERT(line.find("occupancy=\"occupied\"") != std::string::npos, "Occupancy missing");
    TEST_ASSERT(line.find("motion=\"still\" 1000") != std::string::npos, "Timestamp must end the line");

    return true;
}

// Test 8: bay_state line without a snapshot (bay unavailable)
bool test_bay_state_line_unavailable() {
    bay::BayStatus status;
    status.bay_id = "Bay 2";
    status.lifecycle = bay::LifecycleState::Unavailable;

    const std::string line = utils::InfluxClient::build_bay_state_line(status, 42);

    TEST_ASSERT(line.rfind("bay_state,bay=Bay\\ 2 lifecycle=\"unavailable\"", 0) == 0,
                "Unexpected line: " + line);
    TEST_ASSERT(line.find("range") == std::string::npos, "No range fields without a snapshot");
    TEST_ASSERT(line.find("occupancy=\"unknown\"") != std::string::npos, "Occupancy should be unknown");

    return true;
}

// Test 9: bay_lateral lines
bool test_bay_lateral_line() {
    const auto status = create_test_status();

    const std::string evaluated =
        utils::InfluxClient::build_bay_lateral_line("bay1", status.snapshot->lateral[0], 7);
    TEST_ASSERT(evaluated == "bay_lateral,bay=bay1,zone=front status=\"evaluated\",deviation=2.5,"
                             "direction=\"L\",severity=\"warning\" 7",
                "Unexpected evaluated line: " + evaluated);

    const std::string distant =
        utils::InfluxClient::build_bay_lateral_line("bay1", status.snapshot->lateral[1], 7);
    TEST_ASSERT(distant == "bay_lateral,bay=bay1,zone=rear status=\"beyond_range\" 7",
                "Unexpected distant line: " + distant);

    return true;
}

// Test 10: Empty status map (nothing to send)
bool test_empty_statuses() {
    utils::InfluxClient::Config config;
    config.enabled = true;
    config.token = "fake-token";

    utils::InfluxClient client(config);

    bool result = client.write_bay_statuses({}, 0.0);
    TEST_ASSERT(!result, "Nothing to write should return false");

    return true;
}

// Test 11: Wall clock time
bool test_wall_clock() {
    const int64_t t1 = utils::InfluxClient::wall_clock_time_ns();
    const int64_t t2 = utils::InfluxClient::wall_clock_time_ns();

    TEST_ASSERT(t1 > 1600000000LL * 1000000000LL, "Wall clock should be after 2020");
    TEST_ASSERT(t2 >= t1, "Wall clock should not go backwards");

    return true;
}

// ============================================================================
// Main test runner
// ============================================================================

int main() {
    std::cout << "========================================" << std::endl;
    std::cout << "InfluxDB Client Unit Tests" << std::endl;
    std::cout << "========================================" << std::endl;
    std::cout << std::endl;

    utils::set_level(utils::LogLevel::Off);

    int total = 0;
    int passed = 0;
    int failed = 0;

    // Run all tests
    RUN_TEST(test_client_creation_disabled);
    RUN_TEST(test_client_creation_enabled);
    RUN_TEST(test_write_disabled_client);
    RUN_TEST(test_rate_limiting);
    RUN_TEST(test_config_defaults);
    RUN_TEST(test_escape_tag);
    RUN_TEST(test_bay_state_line);
    RUN_TEST(test_bay_state_line_unavailable);
    RUN_TEST(test_bay_lateral_line);
    RUN_TEST(test_empty_statuses);
    RUN_TEST(test_wall_clock);

    // Print summary
    std::cout << std::endl;
    std::cout << "========================================" << std::endl;
    std::cout << "Test Summary" << std::endl;
    std::cout << "========================================" << std::endl;
    std::cout << "Total:  " << total << std::endl;
    std::cout << "Passed: " << passed << std::endl;
    std::cout << "Failed: " << failed << std::endl;
    std::cout << "========================================" << std::endl;

    if (failed == 0) {
        std::cout << "✓ All tests passed!" << std::endl;
        return 0;
    } else {
        std::cout << "✗ Some tests failed!" << std::endl;
        return 1;
    }
}
