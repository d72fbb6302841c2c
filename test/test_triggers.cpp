// test/test_triggers.cpp
/**
 * Unit Test: Triggers
 *
 * Test Coverage:
 *   1. Command parsing and classification
 *   2. Topic resolution (full, suffix, prefix changes)
 *   3. System command triggers
 *   4. Bay command triggers and state filtering
 *   5. MQTT sensor triggers ("to" and "from")
 *   6. Range triggers and occupancy-derived actions
 *   7. Queue draining and id normalization
 */

#include "triggers/trigger.hpp"
#include "utils/logging.hpp"
#include <iostream>
#include <string>
#include <vector>

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

using namespace triggers;

bay::BayStatus make_status(bay::Activity activity = bay::Activity::Idle,
                           bay::Occupancy occupancy = bay::Occupancy::Unoccupied) {
    bay::BayStatus st;
    st.bay_id = "bay1";
    st.lifecycle = bay::LifecycleState::Ready;
    st.activity = activity;
    st.occupancy = occupancy;
    return st;
}

bay::BayStatusMap statuses_of(const bay::BayStatus& st) {
    bay::BayStatusMap map;
    map[st.bay_id] = st;
    return map;
}

// Test 1: Commands
void test_commands(TestResult& result) {
    std::cout << "\n=== Test 1: Commands ===\n";

    result.check(parse_command("dock") == Command::Dock, "'dock' → Dock");
    result.check(parse_command("  UnDock \n") == Command::Undock, "Whitespace and case ignored");
    result.check(parse_command("Rediscover") == Command::Rediscover, "'Rediscover' → Rediscover");
    result.check(!parse_command("park").has_value() && !parse_command("").has_value(),
                 "Unknown or empty text → nothing");

    result.check(is_system_command(Command::Reboot) && is_system_command(Command::Rescan) &&
                 is_system_command(Command::Rediscover), "Reboot/Rescan/Rediscover are system commands");
    result.check(is_bay_command(Command::Dock) && is_bay_command(Command::Abort),
                 "Dock/Abort are bay commands");

    auto action = TriggerAction::parse("Occupancy");
    result.check(action && action->from_occupancy, "Action 'occupancy' parses");
    action = TriggerAction::parse("verify");
    result.check(action && !action->from_occupancy && action->command == Command::Verify,
                 "Action 'verify' parses to a literal command");
    result.check(!TriggerAction::parse("reboot").has_value(), "System command is not a trigger action");
    result.check(!TriggerAction::parse("jump").has_value(), "Unknown action rejected");
}

// Test 2: Topics
void test_topics(TestResult& result) {
    std::cout << "\n=== Test 2: Topic Resolution ===\n";

    auto sys = Trigger::system_command("System", "command");
    result.check(sys.topic() == "command", "No prefix: suffix topic used alone");

    sys.set_topic_prefix("bayassist");
    result.check(sys.topic() == "bayassist/command", "System topic joined to the prefix");

    auto bay_cmd = Trigger::bay_command("Bay 1 Command", "command", "bay1");
    bay_cmd.set_topic_prefix("bayassist/");
    result.check(bay_cmd.topic() == "bayassist/bay1/command",
                 "Bay command topic = prefix/bay/topic");

    auto door = Trigger::mqtt_sensor("Door", "home/garage/door", "bay1", ChangeMode::To, "open",
                                     TriggerAction::occupancy());
    door.set_topic_prefix("bayassist");
    result.check(door.topic() == "home/garage/door", "Full topic ignores the prefix");

    auto range = Trigger::range("bay1_range", "bay1");
    result.check(!range.has_topic() && range.topic().empty(), "Range trigger has no topic");

    result.check(sys.observe(MessageEvent{"other/topic", "rescan"}, {}) == Disposition::Ignored,
                 "Message on a different topic is ignored");
    result.check(!sys.triggered(), "Ignored message queues nothing");
}

// Test 3: System commands
void test_system(TestResult& result) {
    std::cout << "\n=== Test 3: System Command Trigger ===\n";

    auto sys = Trigger::system_command("system", "command");
    sys.set_topic_prefix("bayassist");

    result.check(sys.observe(MessageEvent{"bayassist/command", "Rescan"}, {}) == Disposition::Fired,
                 "'Rescan' fires");
    result.check(sys.observe(MessageEvent{"bayassist/command", "dock"}, {}) ==
                 Disposition::UnknownCommand,
                 "Bay command on the system topic is discarded");
    result.check(sys.observe(MessageEvent{"bayassist/command", "explode"}, {}) ==
                 Disposition::UnknownCommand,
                 "Unknown payload is discarded");
    result.check(sys.observe(BayEvent{"bay1", bay::Motion::Approaching}, {}) == Disposition::Ignored,
                 "Bay events are ignored");

    auto cmds = sys.drain();
    result.check(cmds.size() == 1 && cmds[0] == Command::Rescan, "Only 'rescan' was queued");
}

// Test 4: Bay commands
void test_bay_command(TestResult& result) {
    std::cout << "\n=== Test 4: Bay Command Trigger ===\n";

    auto trig = Trigger::bay_command("bay1_command", "command", "bay1");
    const std::string topic = trig.topic();

    auto idle = statuses_of(make_status());
    result.check(trig.observe(MessageEvent{topic, "dock"}, idle) == Disposition::Fired,
                 "Dock while Idle fires");

    auto docking = statuses_of(make_status(bay::Activity::Docking));
    trig.drain();
    result.check(trig.observe(MessageEvent{topic, "dock"}, docking) == Disposition::Filtered,
                 "Dock while Docking is filtered");
    result.check(!trig.triggered(), "Filtered command queues nothing");

    result.check(trig.observe(MessageEvent{topic, "ABORT"}, docking) == Disposition::Fired,
                 "Abort while Docking fires");
    auto cmds = trig.drain();
    result.check(cmds.size() == 1 && cmds[0] == Command::Abort, "Abort enqueued");

    auto unavailable = make_status();
    unavailable.lifecycle = bay::LifecycleState::Unavailable;
    result.check(trig.observe(MessageEvent{topic, "verify"}, statuses_of(unavailable)) ==
                 Disposition::Filtered,
                 "Verify on an unavailable bay is filtered");

    auto initializing = make_status();
    initializing.lifecycle = bay::LifecycleState::Initializing;
    result.check(trig.observe(MessageEvent{topic, "dock"}, statuses_of(initializing)) ==
                 Disposition::Filtered,
                 "Dock before the first availability check is filtered");
    result.check(trig.observe(MessageEvent{topic, "abort"}, statuses_of(initializing)) ==
                 Disposition::Fired,
                 "Abort accepted while Initializing");
    trig.drain();

    result.check(trig.observe(MessageEvent{topic, "undock"}, {}) == Disposition::Filtered,
                 "No bay status → filtered");

    result.check(trig.observe(MessageEvent{topic, "reboot"}, idle) == Disposition::UnknownCommand,
                 "System command on a bay topic is discarded");

    auto verifying = statuses_of(make_status(bay::Activity::Verifying));
    result.check(trig.observe(MessageEvent{topic, "undock"}, verifying) == Disposition::Fired,
                 "Verifying does not block new commands");
}

// Test 5: MQTT sensors
void test_mqtt_sensor(TestResult& result) {
    std::cout << "\n=== Test 5: MQTT Sensor Trigger ===\n";

    const std::string topic = "home/garage/door";
    auto empty_bay = statuses_of(make_status(bay::Activity::Idle, bay::Occupancy::Unoccupied));
    auto full_bay = statuses_of(make_status(bay::Activity::Idle, bay::Occupancy::Occupied));

    auto to_open = Trigger::mqtt_sensor("door_open", topic, "bay1", ChangeMode::To, "Open",
                                        TriggerAction::occupancy());
    result.check(to_open.observe(MessageEvent{topic, "closed"}, empty_bay) == Disposition::Observed,
                 "'to: open' ignores 'closed'");
    result.check(to_open.observe(MessageEvent{topic, "OPEN"}, empty_bay) == Disposition::Fired,
                 "'to: open' fires on 'OPEN'");
    auto cmds = to_open.drain();
    result.check(cmds.size() == 1 && cmds[0] == Command::Dock, "Unoccupied bay → dock");

    to_open.observe(MessageEvent{topic, "open"}, full_bay);
    cmds = to_open.drain();
    result.check(cmds.size() == 1 && cmds[0] == Command::Undock, "Occupied bay → undock");

    auto unknown = statuses_of(make_status(bay::Activity::Idle, bay::Occupancy::Unknown));
    result.check(to_open.observe(MessageEvent{topic, "open"}, unknown) == Disposition::Filtered,
                 "Unknown occupancy → no command");

    auto from_closed = Trigger::mqtt_sensor("door_from_closed", topic, "bay1", ChangeMode::From,
                                            "closed", TriggerAction::occupancy());
    result.check(from_closed.observe(MessageEvent{topic, "closed"}, empty_bay) == Disposition::Observed,
                 "'from: closed' does not fire on 'closed'");
    result.check(from_closed.observe(MessageEvent{topic, "open"}, empty_bay) == Disposition::Fired,
                 "'from: closed' fires when the payload changes to 'open'");
    result.check(from_closed.observe(MessageEvent{topic, "opening"}, empty_bay) == Disposition::Observed,
                 "No second fire without returning to 'closed'");

    const auto& watch = std::get<MqttSensorWatch>(from_closed.state());
    result.check(watch.previous && *watch.previous == "opening", "Previous payload tracked");

    auto fresh = Trigger::mqtt_sensor("door_fresh", topic, "bay1", ChangeMode::From, "closed",
                                      TriggerAction::occupancy());
    result.check(fresh.observe(MessageEvent{topic, "open"}, empty_bay) == Disposition::Observed,
                 "'from' needs a prior 'closed' payload");

    auto literal = Trigger::mqtt_sensor("door_verify", topic, "bay1", ChangeMode::To, "open",
                                        TriggerAction::literal(Command::Verify));
    literal.observe(MessageEvent{topic, "open"}, {});
    cmds = literal.drain();
    result.check(cmds.size() == 1 && cmds[0] == Command::Verify,
                 "Literal action fires regardless of bay status");
}

// Test 6: Range
void test_range(TestResult& result) {
    std::cout << "\n=== Test 6: Range Trigger ===\n";

    auto empty_bay = statuses_of(make_status(bay::Activity::Idle, bay::Occupancy::Unoccupied));
    auto trig = Trigger::range("bay1_range", "bay1");

    result.check(trig.observe(BayEvent{"bay1", bay::Motion::Still}, empty_bay) == Disposition::Observed,
                 "Still motion does not fire");
    result.check(trig.observe(BayEvent{"bay2", bay::Motion::Approaching}, empty_bay) ==
                 Disposition::Ignored,
                 "Other bay's motion ignored");
    result.check(trig.observe(MessageEvent{"any", "dock"}, empty_bay) == Disposition::Ignored,
                 "Messages ignored");
    result.check(trig.observe(BayEvent{"bay1", bay::Motion::Approaching}, empty_bay) ==
                 Disposition::Fired,
                 "Approaching fires");

    auto full_bay = statuses_of(make_status(bay::Activity::Idle, bay::Occupancy::Occupied));
    trig.observe(BayEvent{"bay1", bay::Motion::Receding}, full_bay);

    auto cmds = trig.drain();
    result.check(cmds.size() == 2 && cmds[0] == Command::Dock && cmds[1] == Command::Undock,
                 "Dock then undock drained in arrival order");

    auto docking = statuses_of(make_status(bay::Activity::Docking, bay::Occupancy::Unoccupied));
    result.check(trig.observe(BayEvent{"bay1", bay::Motion::Approaching}, docking) ==
                 Disposition::Filtered,
                 "Approaching while Docking is filtered");
    result.check(trig.observe(BayEvent{"bay1", bay::Motion::Receding}, empty_bay) ==
                 Disposition::Filtered,
                 "Receding from an empty bay is filtered");
    result.check(!trig.triggered(), "Filtered motion queues nothing");
}

// Test 7: Queue and ids
void test_queue(TestResult& result) {
    std::cout << "\n=== Test 7: Queue / Ids ===\n";

    CommandQueue q;
    q.enqueue(Command::Dock);
    q.enqueue(Command::Abort);
    result.check(q.size() == 2 && !q.empty(), "Queue holds two commands");
    auto out = q.drain_all();
    result.check(out.size() == 2 && out[0] == Command::Dock && out[1] == Command::Abort,
                 "drain_all() preserves order");
    result.check(q.empty() && q.drain_all().empty(), "Second drain is empty");

    result.check(Trigger::normalize_id("  Bay 1 Door ") == "bay_1_door", "Id normalized");

    auto trig = Trigger::bay_command("Bay 1 Command", "command", "bay1");
    result.check(trig.id() == "bay_1_command" && trig.kind() == TriggerKind::BayCommand,
                 "Trigger id and kind");
    result.check(std::string(to_string(TriggerKind::MqttSensor)) == "mqtt_sensor" &&
                 std::string(to_string(Disposition::UnknownCommand)) == "unknown_command",
                 "String forms");
}

int main() {
    std::cout << "\n";
    std::cout << "╔══════════════════════════════════════════════════════════════╗\n";
    std::cout << "║            Trigger Unit Tests                                ║\n";
    std::cout << "╚══════════════════════════════════════════════════════════════╝\n";

    utils::set_level(utils::LogLevel::Error);

    TestResult result;

    test_commands(result);
    test_topics(result);
    test_system(result);
    test_bay_command(result);
    test_mqtt_sensor(result);
    test_range(result);
    test_queue(result);

    result.summary();

    return (result.failed == 0) ? 0 : 1;
}
