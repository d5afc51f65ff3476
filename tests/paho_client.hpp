// tests/paho_client.hpp
// Blocking wrapper around a Paho MQTTAsync client for integration tests
#pragma once

#include <chrono>
#include <condition_variable>
#include <expected>
#include <future>
#include <mutex>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include <MQTTAsync.h>

namespace paho_client {

constexpr auto OPERATION_TIMEOUT = std::chrono::seconds(5);

struct Received {
  std::string topic;
  std::string payload;
  int qos;
  bool retained;
};

namespace detail {

inline void on_success(void* context, MQTTAsync_successData* response) {
  (void)response;
  static_cast<std::promise<void>*>(context)->set_value();
}

inline void on_failure(void* context, MQTTAsync_failureData* response) {
  auto* promise = static_cast<std::promise<void>*>(context);
  std::string error = "code=" + std::to_string(response ? response->code : -1);
  promise->set_exception(std::make_exception_ptr(std::runtime_error(error)));
}

inline std::expected<void, std::string> await(std::future<void>& future, const char* what) {
  if (future.wait_for(OPERATION_TIMEOUT) == std::future_status::timeout) {
    return std::unexpected(std::string(what) + " timeout");
  }
  try {
    future.get();
  } catch (const std::exception& e) {
    return std::unexpected(std::string(what) + " failed: " + e.what());
  }
  return {};
}

} // namespace detail

/**
 * @brief MQTT client used to exercise the listeners from the outside.
 *
 * Every operation blocks until the broker acknowledged it.
 */
class Client {
public:
  struct Options {
    std::string url;        ///< "tcp://127.0.0.1:port" or "ssl://127.0.0.1:port"
    std::string client_id;
    bool clean_session = true;
    int keep_alive = 30;
  };

  explicit Client(Options options) : options_(std::move(options)) {
  }

  ~Client() {
    if (client_) {
      if (MQTTAsync_isConnected(client_)) {
        (void)disconnect();
      }
      MQTTAsync_destroy(&client_);
    }
  }

  Client(const Client&) = delete;
  Client& operator=(const Client&) = delete;

  std::expected<void, std::string> connect() {
    int rc = MQTTAsync_create(&client_, options_.url.c_str(), options_.client_id.c_str(),
                              MQTTCLIENT_PERSISTENCE_NONE, nullptr);
    if (rc != MQTTASYNC_SUCCESS) {
      return std::unexpected("Failed to create client: " + std::to_string(rc));
    }
    rc = MQTTAsync_setCallbacks(client_, this, on_connection_lost, on_message_arrived, nullptr);
    if (rc != MQTTASYNC_SUCCESS) {
      return std::unexpected("Failed to set callbacks: " + std::to_string(rc));
    }

    std::promise<void> promise;
    auto future = promise.get_future();

    MQTTAsync_connectOptions conn_opts = MQTTAsync_connectOptions_initializer;
    conn_opts.keepAliveInterval = options_.keep_alive;
    conn_opts.cleansession = options_.clean_session ? 1 : 0;
    conn_opts.context = &promise;
    conn_opts.onSuccess = detail::on_success;
    conn_opts.onFailure = detail::on_failure;

    // Self-signed test certificate, so the server certificate is not verified
    MQTTAsync_SSLOptions ssl_opts = MQTTAsync_SSLOptions_initializer;
    ssl_opts.enableServerCertAuth = 0;
    if (options_.url.starts_with("ssl://")) {
      conn_opts.ssl = &ssl_opts;
    }

    rc = MQTTAsync_connect(client_, &conn_opts);
    if (rc != MQTTASYNC_SUCCESS) {
      return std::unexpected("Failed to connect: " + std::to_string(rc));
    }
    return detail::await(future, "Connect");
  }

  std::expected<void, std::string> subscribe(const std::string& filter, int qos) {
    std::promise<void> promise;
    auto future = promise.get_future();

    MQTTAsync_responseOptions opts = MQTTAsync_responseOptions_initializer;
    opts.context = &promise;
    opts.onSuccess = detail::on_success;
    opts.onFailure = detail::on_failure;

    int rc = MQTTAsync_subscribe(client_, filter.c_str(), qos, &opts);
    if (rc != MQTTASYNC_SUCCESS) {
      return std::unexpected("Failed to subscribe: " + std::to_string(rc));
    }
    return detail::await(future, "Subscribe");
  }

  std::expected<void, std::string> publish(const std::string& topic, const std::string& payload,
                                           int qos, bool retain) {
    std::promise<void> promise;
    auto future = promise.get_future();

    MQTTAsync_message msg = MQTTAsync_message_initializer;
    msg.payload = const_cast<char*>(payload.data());
    msg.payloadlen = static_cast<int>(payload.size());
    msg.qos = qos;
    msg.retained = retain ? 1 : 0;

    MQTTAsync_responseOptions opts = MQTTAsync_responseOptions_initializer;
    opts.context = &promise;
    opts.onSuccess = detail::on_success;
    opts.onFailure = detail::on_failure;

    int rc = MQTTAsync_sendMessage(client_, topic.c_str(), &msg, &opts);
    if (rc != MQTTASYNC_SUCCESS) {
      return std::unexpected("Failed to publish: " + std::to_string(rc));
    }
    return detail::await(future, "Publish");
  }

  std::expected<void, std::string> disconnect() {
    std::promise<void> promise;
    auto future = promise.get_future();

    MQTTAsync_disconnectOptions opts = MQTTAsync_disconnectOptions_initializer;
    opts.timeout = 1000;
    opts.context = &promise;
    opts.onSuccess = detail::on_success;
    opts.onFailure = detail::on_failure;

    int rc = MQTTAsync_disconnect(client_, &opts);
    if (rc != MQTTASYNC_SUCCESS) {
      return std::unexpected("Failed to disconnect: " + std::to_string(rc));
    }
    return detail::await(future, "Disconnect");
  }

  bool wait_for(size_t count, std::chrono::milliseconds timeout = std::chrono::seconds(3)) {
    std::unique_lock<std::mutex> lock(mutex_);
    return cv_.wait_for(lock, timeout, [&] { return received_.size() >= count; });
  }

  bool wait_for_loss(std::chrono::milliseconds timeout = std::chrono::seconds(3)) {
    std::unique_lock<std::mutex> lock(mutex_);
    return cv_.wait_for(lock, timeout, [&] { return lost_; });
  }

  std::vector<Received> received() {
    std::lock_guard<std::mutex> lock(mutex_);
    return received_;
  }

private:
  Options options_;
  MQTTAsync client_ = nullptr;

  std::mutex mutex_;
  std::condition_variable cv_;
  std::vector<Received> received_;
  bool lost_ = false;

  static int on_message_arrived(void* context, char* topic_name, int topic_len,
                                MQTTAsync_message* message) {
    auto* self = static_cast<Client*>(context);
    Received r{.topic = topic_len > 0 ? std::string(topic_name, static_cast<size_t>(topic_len))
                                      : std::string(topic_name),
               .payload = std::string(static_cast<const char*>(message->payload),
                                      static_cast<size_t>(message->payloadlen)),
               .qos = message->qos,
               .retained = message->retained != 0};
    {
      std::lock_guard<std::mutex> lock(self->mutex_);
      self->received_.push_back(std::move(r));
    }
    self->cv_.notify_all();

    MQTTAsync_freeMessage(&message);
    MQTTAsync_free(topic_name);
    return 1;
  }

  static void on_connection_lost(void* context, char* cause) {
    (void)cause;
    auto* self = static_cast<Client*>(context);
    {
      std::lock_guard<std::mutex> lock(self->mutex_);
      self->lost_ = true;
    }
    self->cv_.notify_all();
  }
};

} // namespace paho_client
