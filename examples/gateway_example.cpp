// examples/gateway_example.cpp
#include <atomic>
#include <chrono>
#include <csignal>
#include <expected>
#include <iostream>
#include <memory>
#include <string>
#include <string_view>
#include <thread>
#include <utility>
#include <variant>

#include <ccujack/event_receiver.hpp>
#include <ccujack/server.hpp>
#include <ccujack/topic.hpp>
#include <ccujack/wire_codec.hpp>

std::atomic<bool> running{true};

void signal_handler(int signal) {
  (void)signal;
  running = false;
}

// Stand-in for the device tree, which would track added and removed devices
class DeviceTreeLogger : public ccujack::NotificationHandler {
public:
  std::expected<void, ccujack::Error> handle(const ccujack::Notification& notification) override {
    if (const auto* added = std::get_if<ccujack::DevicesAdded>(&notification)) {
      std::cout << "Devices added on " << added->interface_id << ": "
                << added->descriptions.size() << "\n";
    }
    return {};
  }
};

int main(int argc, char* argv[]) {
  std::signal(SIGINT, signal_handler);
  std::signal(SIGTERM, signal_handler);

  auto log_callback = [](ccujack::LogLevel level, std::string_view message) {
    std::cerr << "[" << ccujack::to_string(level) << "] " << message << "\n";
  };

  // Usage: gateway_example [cert.pem key.pem]
  ccujack::MqttServer::Config config{
      .addr = ":1883",
      .serve_error =
          [](const ccujack::Error& error) {
            std::cerr << "Listener failed: " << ccujack::describe(error) << "\n";
          },
      .log_callback = log_callback};
  if (argc == 3) {
    config.addr_tls = ":8883";
    config.cert_file = argv[1];
    config.key_file = argv[2];
  }

  ccujack::MqttServer server(std::move(config));
  if (auto result = server.start(); !result) {
    std::cerr << "Failed to start: " << ccujack::describe(result.error()) << "\n";
    return 1;
  }

  // Set requests from MQTT clients, e.g. device/set/ABC123/1/LEVEL
  auto set_handler = std::make_shared<const ccujack::OnPublish>([](const ccujack::Message& msg) {
    auto topic = ccujack::Topic::parse(msg.topic);
    if (!topic) {
      std::cerr << "Ignoring " << msg.topic << ": " << ccujack::describe(topic.error()) << "\n";
      return;
    }
    auto pv = ccujack::decode_pv(msg.payload);
    std::cout << "Set request " << topic->segments[0] << ":" << topic->segments[1] << " "
              << topic->segments[2] << " = " << pv.value.dump() << "\n";
  });
  if (auto result = server.subscribe("device/set/#", ccujack::QoS::ExactlyOnce, set_handler);
      !result) {
    std::cerr << "Failed to subscribe: " << ccujack::describe(result.error()) << "\n";
    return 1;
  }

  ccujack::EventTranslator translator({.log_callback = log_callback}, server);
  DeviceTreeLogger device_tree;
  ccujack::HandlerChain chain({&translator, &device_tree});

  (void)chain.new_devices("CCU-RF", {ccujack::DeviceDescription{
                                        .address = "ABC123:1", .type = "DIMMER_VIRTUAL_RECEIVER"}});

  std::cout << "Gateway running. Press Ctrl+C to stop.\n";

  // Simulated controller events
  double level = 0.0;
  int tick = 0;
  while (running) {
    level = level >= 1.0 ? 0.0 : level + 0.1;
    if (auto result = chain.event("CCU-RF", "ABC123:1", "LEVEL", level); !result) {
      std::cerr << "Event failed: " << ccujack::describe(result.error()) << "\n";
    }
    if (++tick % 5 == 0) {
      (void)chain.event("CCU-RF", "KEY001:1", "PRESS_SHORT", true);
    }
    std::this_thread::sleep_for(std::chrono::seconds(1));
  }

  std::cout << "\nShutting down...\n";
  server.stop();
  return 0;
}
