// include/ccujack/broker.hpp
#pragma once

#include "error.hpp"
#include "logging.hpp"
#include "message.hpp"

#include <atomic>
#include <cstdint>
#include <expected>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <thread>
#include <unordered_map>
#include <vector>

#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>

namespace ccujack {

/**
 * @brief Receiver of publications matched by a subscription.
 *
 * deliver() is invoked on the broker delivery worker thread with the QoS
 * already downgraded to the granted level. Implementations must not block.
 */
class MessageSink {
public:
  virtual ~MessageSink() = default;
  virtual void deliver(const Message& message) = 0;
};

/**
 * @brief A connected network client, registered under its client identifier.
 */
class ClientConnection : public MessageSink {
public:
  // Asynchronously closes the connection. Safe to call from any thread.
  virtual void close() = 0;
};

/**
 * @brief Publish/subscribe core shared by all listeners and local publishers.
 *
 * Owns the subscription table, the retained message store and the client
 * registry. All of them are guarded by a single mutex; sinks are invoked
 * outside of it on a single delivery worker thread, so publications from one
 * thread reach every subscriber in the order they were published.
 *
 * @par Thread Safety
 * All public methods may be called concurrently from any thread.
 */
class Broker {
public:
  struct Config {
    LogCallback log_callback{}; ///< Optional callback for broker log messages
  };

  explicit Broker(Config config);
  ~Broker();

  Broker(const Broker&) = delete;
  Broker& operator=(const Broker&) = delete;

  /**
   * @brief Starts the delivery worker.
   *
   * @return void on success, ErrorKind::AlreadyRunning if already started
   */
  [[nodiscard]] std::expected<void, Error> start();

  /**
   * @brief Rejects further publications and joins the delivery worker after it
   *        drained the publications accepted so far.
   */
  void stop();

  [[nodiscard]] bool is_running() const;

  /**
   * @brief Submits one publication.
   *
   * @return void on success, ErrorKind::Publish if the topic is not a valid
   *         topic name, qos is not 0, 1 or 2, or the broker is not running
   *
   * @note A retained publication with an empty payload clears the retained
   *       value of the topic.
   */
  [[nodiscard]] std::expected<void, Error> publish(std::string_view topic,
                                                   std::string_view payload, int qos,
                                                   bool retain);
  [[nodiscard]] std::expected<void, Error> publish(Message message);

  /**
   * @brief Registers a local callback for a topic filter.
   *
   * Subscribing the same handler to the same filter again replaces its QoS.
   * Retained messages matching the filter are delivered right away.
   *
   * @return void on success, ErrorKind::Publish for an invalid filter or QoS
   */
  [[nodiscard]] std::expected<void, Error> subscribe(std::string_view filter, QoS qos,
                                                     OnPublishPtr handler);
  [[nodiscard]] std::expected<void, Error> unsubscribe(std::string_view filter,
                                                       const OnPublishPtr& handler);

  // Network session hooks. The filter must already be validated.
  void subscribe_sink(std::string_view filter, QoS qos, std::shared_ptr<MessageSink> sink);
  void unsubscribe_sink(std::string_view filter, const MessageSink* sink);
  void remove_sink(const MessageSink* sink);

  /**
   * @brief Registers a client identifier.
   *
   * @return The connection previously registered under the same identifier,
   *         which the caller must close (session takeover)
   */
  [[nodiscard]] std::shared_ptr<ClientConnection>
  register_client(const std::string& client_id, const std::shared_ptr<ClientConnection>& client);
  void unregister_client(const std::string& client_id, const ClientConnection* client);
  [[nodiscard]] std::string generate_client_id();

  [[nodiscard]] size_t retained_count() const;
  [[nodiscard]] size_t subscription_count() const;

private:
  struct Subscription {
    std::string filter;
    QoS qos;
    std::shared_ptr<MessageSink> sink;
    const void* key; // handler address for local callbacks, sink address otherwise
  };

  struct Delivery {
    std::shared_ptr<MessageSink> sink;
    Message message;
  };

  Config config_;

  mutable std::mutex mutex_;
  bool running_{false};
  std::vector<Subscription> subscriptions_;
  std::map<std::string, Message, std::less<>> retained_;
  std::unordered_map<std::string, std::weak_ptr<ClientConnection>> clients_;
  std::atomic<uint64_t> client_counter_{0};

  boost::asio::io_context delivery_io_;
  std::optional<boost::asio::executor_work_guard<boost::asio::io_context::executor_type>>
      work_guard_;
  std::thread delivery_thread_;

  void add_subscription(std::string_view filter, QoS qos, std::shared_ptr<MessageSink> sink,
                        const void* key);
  // Mutex must be held by caller
  void post_deliveries(std::vector<Delivery> deliveries);
  [[nodiscard]] std::vector<Delivery> retained_for(std::string_view filter, QoS qos,
                                                   const std::shared_ptr<MessageSink>& sink) const;

  void log(LogLevel level, std::string_view message) const;
};

} // namespace ccujack
