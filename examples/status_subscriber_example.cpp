// examples/status_subscriber_example.cpp
#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdint>
#include <ctime>
#include <future>
#include <iostream>
#include <string>
#include <string_view>
#include <thread>

#include <ccujack/wire_codec.hpp>

#include <MQTTAsync.h>

std::atomic<bool> running{true};

void signal_handler(int signal) {
  (void)signal;
  running = false;
}

void on_connect_success(void* context, MQTTAsync_successData* response) {
  (void)response;
  static_cast<std::promise<bool>*>(context)->set_value(true);
}

void on_connect_failure(void* context, MQTTAsync_failureData* response) {
  (void)response;
  static_cast<std::promise<bool>*>(context)->set_value(false);
}

int on_message_arrived(void* context, char* topic_name, int topic_len,
                       MQTTAsync_message* message) {
  (void)context;
  std::string topic = topic_len > 0 ? std::string(topic_name, static_cast<size_t>(topic_len))
                                    : std::string(topic_name);
  auto pv = ccujack::decode_pv(
      std::string_view(static_cast<const char*>(message->payload),
                       static_cast<size_t>(message->payloadlen)));

  auto ts = std::chrono::system_clock::to_time_t(pv.timestamp);
  std::cout << topic << (message->retained ? " (retained)" : "") << "\n"
            << "    value:  " << pv.value.dump() << "\n"
            << "    status: " << static_cast<int32_t>(pv.status) << "\n"
            << "    time:   " << std::ctime(&ts);

  MQTTAsync_freeMessage(&message);
  MQTTAsync_free(topic_name);
  return 1;
}

int main(int argc, char* argv[]) {
  std::signal(SIGINT, signal_handler);
  std::signal(SIGTERM, signal_handler);

  std::string url = argc > 1 ? argv[1] : "tcp://localhost:1883";

  MQTTAsync client = nullptr;
  if (MQTTAsync_create(&client, url.c_str(), "ccujack_status_subscriber",
                       MQTTCLIENT_PERSISTENCE_NONE, nullptr) != MQTTASYNC_SUCCESS) {
    std::cerr << "Failed to create client\n";
    return 1;
  }
  if (MQTTAsync_setCallbacks(client, nullptr, nullptr, on_message_arrived, nullptr) !=
      MQTTASYNC_SUCCESS) {
    std::cerr << "Failed to set callbacks\n";
    MQTTAsync_destroy(&client);
    return 1;
  }

  std::promise<bool> connected;
  auto connected_future = connected.get_future();
  MQTTAsync_connectOptions conn_opts = MQTTAsync_connectOptions_initializer;
  conn_opts.keepAliveInterval = 60;
  conn_opts.cleansession = 1;
  conn_opts.context = &connected;
  conn_opts.onSuccess = on_connect_success;
  conn_opts.onFailure = on_connect_failure;

  if (MQTTAsync_connect(client, &conn_opts) != MQTTASYNC_SUCCESS ||
      connected_future.wait_for(std::chrono::seconds(5)) != std::future_status::ready ||
      !connected_future.get()) {
    std::cerr << "Failed to connect to " << url << "\n";
    MQTTAsync_destroy(&client);
    return 1;
  }

  MQTTAsync_responseOptions sub_opts = MQTTAsync_responseOptions_initializer;
  if (MQTTAsync_subscribe(client, "device/status/#", 1, &sub_opts) != MQTTASYNC_SUCCESS ||
      MQTTAsync_subscribe(client, "sysvar/status/#", 1, &sub_opts) != MQTTASYNC_SUCCESS) {
    std::cerr << "Failed to subscribe\n";
    MQTTAsync_destroy(&client);
    return 1;
  }

  std::cout << "Listening for status updates on " << url << ". Press Ctrl+C to stop.\n";
  while (running) {
    std::this_thread::sleep_for(std::chrono::milliseconds(100));
  }

  MQTTAsync_disconnectOptions disc_opts = MQTTAsync_disconnectOptions_initializer;
  disc_opts.timeout = 1000;
  if (MQTTAsync_disconnect(client, &disc_opts) != MQTTASYNC_SUCCESS) {
    std::cerr << "Failed to disconnect cleanly\n";
  }
  std::this_thread::sleep_for(std::chrono::milliseconds(200));
  MQTTAsync_destroy(&client);
  return 0;
}
