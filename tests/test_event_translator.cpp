// tests/test_event_translator.cpp
// Tests for the notification handler chain and the event translator
#include <chrono>
#include <condition_variable>
#include <expected>
#include <format>
#include <iostream>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

#include <ccujack/event_receiver.hpp>
#include <ccujack/server.hpp>
#include <ccujack/wire_codec.hpp>

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

// Records every notification it sees, optionally failing each one
class RecordingHandler : public ccujack::NotificationHandler {
public:
  RecordingHandler(std::vector<std::string>& trace, std::string name, bool fail = false)
      : trace_(trace), name_(std::move(name)), fail_(fail) {
  }

  std::expected<void, ccujack::Error> handle(const ccujack::Notification& notification) override {
    seen.push_back(notification);
    trace_.push_back(name_);
    if (fail_) {
      return std::unexpected(ccujack::Error(ccujack::ErrorKind::Publish, name_ + " failed"));
    }
    return {};
  }

  std::vector<ccujack::Notification> seen;

private:
  std::vector<std::string>& trace_;
  std::string name_;
  bool fail_;
};

// Captures publish_pv calls without a broker
class CapturingPublisher : public ccujack::PvPublisher {
public:
  struct Call {
    std::string topic;
    ccujack::ProcessValue pv;
    ccujack::QoS qos;
    bool retain;
  };

  std::expected<void, ccujack::Error> publish_pv(std::string_view topic,
                                                 const ccujack::ProcessValue& pv,
                                                 ccujack::QoS qos, bool retain) override {
    calls.push_back(Call{std::string(topic), pv, qos, retain});
    return {};
  }

  std::vector<Call> calls;
};

// Test 1: every handler sees every notification kind, in order
void test_chain_order() {
  std::vector<std::string> trace;
  RecordingHandler first(trace, "first");
  RecordingHandler second(trace, "second");
  RecordingHandler third(trace, "third");
  ccujack::HandlerChain chain({&first, &second, &third});

  bool ok = chain.event("CCU-RF", "ABC:1", "STATE", true).has_value() &&
            chain.new_devices("CCU-RF", {ccujack::DeviceDescription{.address = "ABC"}}) &&
            chain.delete_devices("CCU-RF", {"ABC"}) && chain.update_device("CCU-RF", "ABC", 1) &&
            chain.replace_device("CCU-RF", "ABC", "DEF") &&
            chain.readded_device("CCU-RF", {"DEF"});

  std::vector<std::string> expected;
  for (int i = 0; i < 6; ++i) {
    expected.insert(expected.end(), {"first", "second", "third"});
  }

  bool passed = ok && trace == expected && third.seen.size() == 6 &&
                std::holds_alternative<ccujack::ValueChanged>(third.seen[0]) &&
                std::holds_alternative<ccujack::DevicesReadded>(third.seen[5]) &&
                std::get<ccujack::DeviceReplaced>(third.seen[4]).new_address == "DEF";
  report_test("Chain dispatches in order", passed);
}

// Test 2: a failing handler does not stop the chain, its error is returned
void test_chain_error() {
  std::vector<std::string> trace;
  RecordingHandler first(trace, "first");
  RecordingHandler failing(trace, "failing", true);
  RecordingHandler also_failing(trace, "also_failing", true);
  RecordingHandler last(trace, "last");
  ccujack::HandlerChain chain({&first, &failing, &also_failing, &last});

  auto result = chain.update_device("CCU-RF", "ABC", 0);

  bool passed = !result && result.error().message == "failing failed" && trace.size() == 4 &&
                last.seen.size() == 1;
  report_test("Chain continues after handler error", passed);
}

// Test 3: value change becomes a retained QoS 1 publication
void test_translate_value() {
  CapturingPublisher publisher;
  ccujack::EventTranslator translator({}, publisher);

  auto before = std::chrono::system_clock::now();
  auto result = translator.handle(ccujack::ValueChanged{
      .interface_id = "CCU-RF", .address = "ABC123:1", .value_key = "LEVEL", .value = 42.5});

  bool passed = result.has_value() && publisher.calls.size() == 1;
  if (passed) {
    const auto& call = publisher.calls[0];
    passed = call.topic == "device/status/ABC123/1/LEVEL" && call.pv.value == 42.5 &&
             call.pv.status == ccujack::Status::Good && call.pv.timestamp >= before &&
             call.qos == ccujack::QoS::AtLeastOnce && call.retain;
  }
  report_test("Translate value change", passed);
}

// Test 4: button presses are not retained and use QoS 2
void test_translate_press() {
  CapturingPublisher publisher;
  ccujack::EventTranslator translator({}, publisher);

  (void)translator.handle(ccujack::ValueChanged{
      .interface_id = "CCU-RF", .address = "KEY01:2", .value_key = "PRESS_SHORT", .value = true});
  (void)translator.handle(ccujack::ValueChanged{
      .interface_id = "CCU-RF", .address = "KEY01:0", .value_key = "INSTALL_TEST", .value = true});

  bool passed = publisher.calls.size() == 2;
  for (const auto& call : publisher.calls) {
    passed = passed && call.qos == ccujack::QoS::ExactlyOnce && !call.retain;
  }
  report_test("Translate transient values", passed);
}

// Test 5: malformed addresses are reported and nothing is published
void test_translate_bad_address() {
  CapturingPublisher publisher;
  std::vector<ccujack::LogLevel> levels;
  ccujack::EventTranslator translator(
      {.log_callback = [&](ccujack::LogLevel level, std::string_view) { levels.push_back(level); }},
      publisher);

  auto result = translator.handle(ccujack::ValueChanged{
      .interface_id = "CCU-RF", .address = "ABC123", .value_key = "LEVEL", .value = 1});

  bool passed = !result && result.error().kind == ccujack::ErrorKind::AddressFormat &&
                result.error().message == "Unexpected event from a device: ABC123" &&
                publisher.calls.empty() && !levels.empty() &&
                levels.front() == ccujack::LogLevel::ERROR;
  report_test("Reject malformed address", passed);
}

// Test 6: other notification kinds pass through untouched
void test_translate_pass_through() {
  CapturingPublisher publisher;
  ccujack::EventTranslator translator({}, publisher);

  auto result = translator.handle(ccujack::DevicesDeleted{.interface_id = "CCU-RF",
                                                          .addresses = {"ABC123"}});

  bool passed = result.has_value() && publisher.calls.empty();
  report_test("Pass through structural notifications", passed);
}

// Test 7: publish failures are logged, not returned
void test_translate_publish_failure() {
  // Never started, so every publish fails
  ccujack::MqttServer server(ccujack::MqttServer::Config{});
  std::vector<std::string> logged;
  ccujack::EventTranslator translator(
      {.log_callback =
           [&](ccujack::LogLevel level, std::string_view msg) {
             if (level == ccujack::LogLevel::ERROR) {
               logged.emplace_back(msg);
             }
           }},
      server);

  std::vector<std::string> trace;
  RecordingHandler downstream(trace, "downstream");
  ccujack::HandlerChain chain({&translator, &downstream});

  auto result = chain.event("CCU-RF", "ABC123:1", "LEVEL", 1.0);

  bool passed = result.has_value() && logged.size() == 1 && downstream.seen.size() == 1;
  report_test("Publish failure is logged only", passed, passed ? "" : "unexpected outcome");
}

// Test 8: many notifications through many handlers keep their order while every publish fails
void test_chain_publish_failures() {
  constexpr int kNotifications = 5;
  constexpr int kHandlers = 3;

  // Never started, so every publish fails
  ccujack::MqttServer server(ccujack::MqttServer::Config{});
  int publish_errors = 0;
  ccujack::EventTranslator translator(
      {.log_callback =
           [&](ccujack::LogLevel level, std::string_view) {
             if (level == ccujack::LogLevel::ERROR) {
               ++publish_errors;
             }
           }},
      server);

  std::vector<std::string> trace;
  std::vector<std::unique_ptr<RecordingHandler>> recorders;
  std::vector<ccujack::NotificationHandler*> handlers{&translator};
  for (int k = 0; k < kHandlers; ++k) {
    recorders.push_back(std::make_unique<RecordingHandler>(trace, std::format("handler{}", k)));
    handlers.push_back(recorders.back().get());
  }
  ccujack::HandlerChain chain(std::move(handlers));

  bool all_ok = true;
  for (int n = 0; n < kNotifications; ++n) {
    auto result = chain.event("CCU-RF", std::format("DEV{}:1", n), "LEVEL", n);
    all_ok = all_ok && result.has_value();
  }

  std::vector<std::string> expected;
  for (int n = 0; n < kNotifications; ++n) {
    for (int k = 0; k < kHandlers; ++k) {
      expected.push_back(std::format("handler{}", k));
    }
  }

  bool passed = all_ok && trace == expected && publish_errors == kNotifications;
  for (const auto& recorder : recorders) {
    passed = passed && recorder->seen.size() == static_cast<size_t>(kNotifications);
    for (int n = 0; passed && n < kNotifications; ++n) {
      const auto& seen = std::get<ccujack::ValueChanged>(recorder->seen[n]);
      passed = seen.address == std::format("DEV{}:1", n) && seen.value == n;
    }
  }
  report_test("Chain order survives failing publishes", passed,
              passed ? "" : std::format("{} trace entries, {} errors", trace.size(),
                                        publish_errors));
}

// Test 9: a malformed address is returned but downstream handlers still run
void test_chain_bad_address_forwards() {
  CapturingPublisher publisher;
  ccujack::EventTranslator translator({}, publisher);
  std::vector<std::string> trace;
  RecordingHandler downstream(trace, "downstream");
  RecordingHandler last(trace, "last");
  ccujack::HandlerChain chain({&translator, &downstream, &last});

  auto result = chain.event("CCU-RF", "ABC123", "LEVEL", 1);

  bool passed = !result && result.error().kind == ccujack::ErrorKind::AddressFormat &&
                publisher.calls.empty() &&
                trace == std::vector<std::string>{"downstream", "last"} &&
                downstream.seen.size() == 1 &&
                std::get<ccujack::ValueChanged>(downstream.seen[0]).address == "ABC123";
  report_test("Address error still reaches downstream handlers", passed);
}

// Test 10: end to end through the server to a local subscriber
void test_end_to_end() {
  ccujack::MqttServer server(ccujack::MqttServer::Config{});
  if (auto started = server.start(); !started) {
    report_test("End to end translation", false, ccujack::describe(started.error()));
    return;
  }

  std::mutex mutex;
  std::condition_variable cv;
  std::vector<ccujack::Message> received;
  auto handler = std::make_shared<const ccujack::OnPublish>([&](const ccujack::Message& msg) {
    std::lock_guard<std::mutex> lock(mutex);
    received.push_back(msg);
    cv.notify_all();
  });

  ccujack::EventTranslator translator({}, server);
  ccujack::HandlerChain chain({&translator});
  (void)chain.event("CCU-RF", "ABC123:1", "LEVEL", 42.5);

  // Retained, so a late subscriber still sees the value
  (void)server.subscribe("device/status/#", ccujack::QoS::ExactlyOnce, handler);

  bool passed = false;
  {
    std::unique_lock<std::mutex> lock(mutex);
    passed = cv.wait_for(lock, std::chrono::seconds(2), [&] { return !received.empty(); });
  }
  server.stop();

  if (passed) {
    const auto& msg = received.front();
    auto pv = ccujack::decode_pv(msg.payload);
    passed = msg.topic == "device/status/ABC123/1/LEVEL" && msg.retain &&
             msg.qos == ccujack::QoS::AtLeastOnce && pv.value == 42.5 &&
             pv.status == ccujack::Status::Good;
  }
  report_test("End to end translation", passed);
}

int main() {
  std::cout << "=== Event Translator Tests ===\n\n";

  test_chain_order();
  test_chain_error();
  test_translate_value();
  test_translate_press();
  test_translate_bad_address();
  test_translate_pass_through();
  test_translate_publish_failure();
  test_chain_publish_failures();
  test_chain_bad_address_forwards();
  test_end_to_end();

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
