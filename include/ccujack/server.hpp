// include/ccujack/server.hpp
#pragma once

#include "broker.hpp"
#include "error.hpp"
#include "event_receiver.hpp"
#include "listener.hpp"
#include "logging.hpp"
#include "message.hpp"
#include "process_value.hpp"

#include <chrono>
#include <expected>
#include <mutex>
#include <string>
#include <string_view>

namespace ccujack {

/**
 * @brief Embedded MQTT server: broker core plus its network listeners.
 *
 * This is the integration surface used by the gateway. Local components
 * publish and subscribe through it; network clients reach the same broker
 * through the plain and TLS listeners.
 *
 * @par Thread Safety
 * publish(), publish_pv(), subscribe() and unsubscribe() may be called from
 * any thread. start() and stop() are serialized by an internal mutex.
 *
 * @par Example Usage
 * @code
 * ccujack::MqttServer server({.addr = ":1883",
 *                             .addr_tls = ":8883",
 *                             .cert_file = "cert.pem",
 *                             .key_file = "key.pem",
 *                             .serve_error = [](const ccujack::Error& e) {
 *                               std::cerr << ccujack::describe(e) << "\n";
 *                             }});
 * if (auto result = server.start(); !result) {
 *   std::cerr << ccujack::describe(result.error()) << "\n";
 *   return 1;
 * }
 *
 * auto handler = std::make_shared<const ccujack::OnPublish>(
 *     [](const ccujack::Message& msg) { std::cout << msg.topic << "\n"; });
 * (void)server.subscribe("device/set/#", ccujack::QoS::AtLeastOnce, handler);
 *
 * (void)server.publish("sysvar/status/1234", R"({"v":1})", 1, true);
 * server.stop();
 * @endcode
 */
class MqttServer : public PvPublisher {
public:
  /**
   * @brief Configuration parameters for the MQTT server.
   *
   * An empty address disables the corresponding listener.
   */
  struct Config {
    std::string addr;      ///< Plain TCP listener address, e.g. ":1883"
    std::string addr_tls;  ///< TLS listener address, e.g. ":8883"
    std::string cert_file; ///< PEM server certificate chain (TLS listener)
    std::string key_file;  ///< PEM server private key (TLS listener)
    size_t max_packet_size = 1024 * 1024;     ///< Maximum accepted MQTT packet size in bytes
    std::chrono::seconds connect_timeout{10}; ///< Time allowed between accept and CONNECT
    ServeErrorCallback serve_error{};         ///< Optional terminal listener failure callback
    LogCallback log_callback{};               ///< Optional callback for log messages
  };

  explicit MqttServer(Config config);

  /**
   * @brief Stops the server if it is still running.
   */
  ~MqttServer() override;

  MqttServer(const MqttServer&) = delete;
  MqttServer& operator=(const MqttServer&) = delete;

  /**
   * @brief Starts the broker and spawns the configured listeners.
   *
   * Returns without waiting for the listeners to bind. Bind and certificate
   * failures are reported later through Config::serve_error.
   *
   * @return void on success, ErrorKind::AlreadyRunning if already started
   */
  [[nodiscard]] std::expected<void, Error> start();

  /**
   * @brief Stops accepting publications, shuts all listeners down and blocks
   *        until every listener thread and the delivery worker have exited.
   *
   * Calling stop() on a stopped server does nothing.
   */
  void stop();

  [[nodiscard]] bool is_running() const;

  /**
   * @brief Publishes raw payload bytes.
   *
   * @return void on success, ErrorKind::Publish for an invalid topic, a QoS
   *         other than 0, 1 or 2, or a server that is not running
   */
  [[nodiscard]] std::expected<void, Error> publish(std::string_view topic,
                                                   std::string_view payload, int qos,
                                                   bool retain);

  /**
   * @brief Encodes a process value with encode_pv() and publishes it.
   *
   * @return void on success, ErrorKind::Encoding if the value cannot be
   *         encoded, otherwise the errors of publish()
   */
  [[nodiscard]] std::expected<void, Error> publish_pv(std::string_view topic,
                                                      const ProcessValue& pv, QoS qos,
                                                      bool retain) override;

  [[nodiscard]] std::expected<void, Error> subscribe(std::string_view filter, QoS qos,
                                                     OnPublishPtr handler);
  [[nodiscard]] std::expected<void, Error> unsubscribe(std::string_view filter,
                                                       const OnPublishPtr& handler);

  [[nodiscard]] const std::vector<std::unique_ptr<Listener>>& listeners() const noexcept {
    return listeners_.listeners();
  }

  [[nodiscard]] Broker& broker() noexcept {
    return broker_;
  }

private:
  Config config_;
  Broker broker_;
  ListenerManager listeners_;

  mutable std::mutex lifecycle_mutex_;
  bool started_{false};

  void log(LogLevel level, std::string_view message) const;
};

} // namespace ccujack
