// tests/test_topic.cpp
// Tests for topic construction, parsing and the publish policy
#include <iostream>
#include <string>
#include <vector>

#include <ccujack/mqtt_packet.hpp>
#include <ccujack/topic.hpp>

// Test result tracking
struct TestResult {
  std::string name;
  bool passed;
  std::string message;
};

std::vector<TestResult> results;

void report_test(const std::string& name, bool passed, const std::string& msg = "") {
  results.push_back({name, passed, msg});
  std::cout << (passed ? "[PASS]" : "[FAIL]") << " " << name;
  if (!msg.empty()) {
    std::cout << ": " << msg;
  }
  std::cout << "\n";
}

// Test 1: device topic from address and parameter
void test_build_device_topic() {
  auto topic = ccujack::build_device_topic("ABC123:1", "LEVEL");
  if (!topic) {
    report_test("Build device topic", false, ccujack::describe(topic.error()));
    return;
  }

  bool passed = topic->to_string() == "device/status/ABC123/1/LEVEL";
  report_test("Build device topic", passed, passed ? "" : topic->to_string());
}

// Test 2: malformed addresses are address format errors
void test_build_device_topic_errors() {
  std::vector<std::string> bad{"ABC123", "ABC123:1:2", ":1", "ABC123:", ""};

  bool passed = true;
  std::string offender;
  for (const auto& address : bad) {
    auto topic = ccujack::build_device_topic(address, "STATE");
    if (topic || topic.error().kind != ccujack::ErrorKind::AddressFormat) {
      passed = false;
      offender = address;
    }
  }
  report_test("Reject malformed device addresses", passed, passed ? "" : offender);
}

// Test 3: system variable and program topics
void test_sysvar_program_topics() {
  bool passed = ccujack::sysvar_topic("1234").to_string() == "sysvar/status/1234" &&
                ccujack::program_topic("42").to_string() == "program/status/42";
  report_test("System variable and program topics", passed);
}

// Test 4: parsing client supplied topics
void test_parse() {
  auto set = ccujack::Topic::parse("device/set/ABC123/1/LEVEL");
  auto get = ccujack::Topic::parse("sysvar/get/1234");

  bool passed = set && set->category == ccujack::Category::Device &&
                set->service == ccujack::Service::Set && set->segments.size() == 3 &&
                set->segments[2] == "LEVEL" && get && get->category == ccujack::Category::Sysvar &&
                get->service == ccujack::Service::Get && get->segments[0] == "1234";
  report_test("Parse set/get topics", passed);
}

// Test 5: parse rejects unknown categories, services and identifiers
void test_parse_errors() {
  std::vector<std::string> bad{"device/set",      "foo/status/1",       "device/put/A/1/X",
                               "sysvar/set/abc",  "device/set/A//X",    "program/get/1/2",
                               "device/status/A/1"};

  bool passed = true;
  std::string offender;
  for (const auto& topic : bad) {
    auto parsed = ccujack::Topic::parse(topic);
    if (parsed || parsed.error().kind != ccujack::ErrorKind::AddressFormat) {
      passed = false;
      offender = topic;
    }
  }
  report_test("Reject malformed topics", passed, passed ? "" : offender);
}

// Test 6: default publish decisions
void test_publish_decision() {
  using ccujack::PublishDecision;
  using ccujack::QoS;

  bool passed =
      ccujack::resolve_publish_decision("INSTALL_TEST") ==
          PublishDecision{.qos = QoS::ExactlyOnce, .retain = false} &&
      ccujack::resolve_publish_decision("PRESS_SHORT") ==
          PublishDecision{.qos = QoS::ExactlyOnce, .retain = false} &&
      ccujack::resolve_publish_decision("LEVEL") ==
          PublishDecision{.qos = QoS::AtLeastOnce, .retain = true} &&
      ccujack::resolve_publish_decision("INSTALL_TEST_2") ==
          PublishDecision{.qos = QoS::AtLeastOnce, .retain = true} &&
      ccujack::resolve_publish_decision("XPRESS_SHORT") ==
          PublishDecision{.qos = QoS::AtLeastOnce, .retain = true};
  report_test("Default publish decisions", passed);
}

// Test 7: custom policy
void test_custom_policy() {
  ccujack::PublishPolicy policy{.transient_names = {"MOTION"}, .transient_prefixes = {}};

  bool passed = policy.decide("MOTION").qos == ccujack::QoS::ExactlyOnce &&
                !policy.decide("MOTION").retain && policy.decide("PRESS_LONG").retain;
  report_test("Custom publish policy", passed);
}

// Test 8: MQTT topic filter matching
void test_topic_matches() {
  using ccujack::mqtt::topic_matches;

  bool passed = topic_matches("device/status/#", "device/status/ABC123/1/LEVEL") &&
                topic_matches("device/+/ABC123/1/LEVEL", "device/set/ABC123/1/LEVEL") &&
                topic_matches("device/#", "device") && topic_matches("#", "sysvar/status/1") &&
                !topic_matches("device/+", "device/status/ABC123") &&
                !topic_matches("#", "$SYS/uptime") && !topic_matches("+/uptime", "$SYS/uptime") &&
                topic_matches("$SYS/#", "$SYS/uptime") &&
                !topic_matches("device/status", "device/status/ABC123");
  report_test("Topic filter matching", passed);
}

// Test 9: topic name and filter validation
void test_topic_validation() {
  using namespace ccujack::mqtt;

  bool passed = is_valid_topic_name("device/status/A/1/LEVEL") && !is_valid_topic_name("") &&
                !is_valid_topic_name("device/+") && !is_valid_topic_name("device/#") &&
                is_valid_topic_filter("device/+/A/#") && !is_valid_topic_filter("device/#/A") &&
                !is_valid_topic_filter("device/st+") && !is_valid_topic_filter("");
  report_test("Topic validation", passed);
}

int main() {
  std::cout << "=== Topic Tests ===\n\n";

  test_build_device_topic();
  test_build_device_topic_errors();
  test_sysvar_program_topics();
  test_parse();
  test_parse_errors();
  test_publish_decision();
  test_custom_policy();
  test_topic_matches();
  test_topic_validation();

  // Summary
  int passed = 0;
  int failed = 0;

  std::cout << "\n=== Test Results ===\n";
  for (const auto& result : results) {
    if (result.passed) {
      passed++;
    } else {
      failed++;
      std::cout << "FAILED: " << result.name << " - " << result.message << "\n";
    }
  }

  std::cout << "\nTotal: " << results.size() << " tests\n";
  std::cout << "Passed: " << passed << "\n";
  std::cout << "Failed: " << failed << "\n";

  return failed == 0 ? 0 : 1;
}
