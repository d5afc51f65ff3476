// src/server.cpp
#include "ccujack/server.hpp"

#include "ccujack/wire_codec.hpp"

#include <utility>
#include <vector>

namespace ccujack {

MqttServer::MqttServer(Config config)
    : config_(std::move(config)), broker_({.log_callback = config_.log_callback}),
      listeners_(broker_) {
}

MqttServer::~MqttServer() {
  stop();
}

void MqttServer::log(LogLevel level, std::string_view message) const {
  if (config_.log_callback) {
    config_.log_callback(level, message);
  }
}

std::expected<void, Error> MqttServer::start() {
  std::lock_guard<std::mutex> lock(lifecycle_mutex_);

  if (started_) {
    return std::unexpected(Error(ErrorKind::AlreadyRunning, "MQTT server already running"));
  }

  auto result = broker_.start();
  if (!result) {
    return result;
  }

  auto listener_config = [this](std::string address, Transport transport) {
    return Listener::Config{.bind_address = std::move(address),
                            .transport = transport,
                            .cert_file = config_.cert_file,
                            .key_file = config_.key_file,
                            .max_packet_size = config_.max_packet_size,
                            .connect_timeout = config_.connect_timeout,
                            .serve_error = config_.serve_error,
                            .log_callback = config_.log_callback};
  };

  std::vector<Listener::Config> configs;
  if (!config_.addr.empty()) {
    configs.push_back(listener_config(config_.addr, Transport::Plain));
  }
  if (!config_.addr_tls.empty()) {
    configs.push_back(listener_config(config_.addr_tls, Transport::Tls));
  }
  if (configs.empty()) {
    log(LogLevel::WARN, "No listener address configured, serving local clients only");
  }

  listeners_.start(std::move(configs));
  started_ = true;
  return {};
}

void MqttServer::stop() {
  std::lock_guard<std::mutex> lock(lifecycle_mutex_);

  if (!started_) {
    return;
  }

  log(LogLevel::INFO, "Stopping MQTT server");
  // Rejects new publications and drains the ones already accepted
  broker_.stop();
  listeners_.stop();
  started_ = false;
}

bool MqttServer::is_running() const {
  std::lock_guard<std::mutex> lock(lifecycle_mutex_);
  return started_;
}

std::expected<void, Error> MqttServer::publish(std::string_view topic, std::string_view payload,
                                               int qos, bool retain) {
  return broker_.publish(topic, payload, qos, retain);
}

std::expected<void, Error> MqttServer::publish_pv(std::string_view topic, const ProcessValue& pv,
                                                  QoS qos, bool retain) {
  auto payload = encode_pv(pv);
  if (!payload) {
    return std::unexpected(payload.error());
  }
  return broker_.publish(Message{
      .topic = std::string(topic), .payload = std::move(*payload), .qos = qos, .retain = retain});
}

std::expected<void, Error> MqttServer::subscribe(std::string_view filter, QoS qos,
                                                 OnPublishPtr handler) {
  return broker_.subscribe(filter, qos, std::move(handler));
}

std::expected<void, Error> MqttServer::unsubscribe(std::string_view filter,
                                                   const OnPublishPtr& handler) {
  return broker_.unsubscribe(filter, handler);
}

} // namespace ccujack
