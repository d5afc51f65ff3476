// src/broker.cpp
#include "ccujack/broker.hpp"

#include "ccujack/mqtt_packet.hpp"

#include <algorithm>
#include <exception>
#include <format>
#include <utility>

#include <boost/asio/post.hpp>

namespace ccujack {

namespace {

QoS min_qos(QoS a, QoS b) {
  return std::to_underlying(a) < std::to_underlying(b) ? a : b;
}

// Adapts a local OnPublish callback to the sink interface.
class CallbackSink : public MessageSink {
public:
  CallbackSink(OnPublishPtr handler, LogCallback log_callback)
      : handler_(std::move(handler)), log_callback_(std::move(log_callback)) {
  }

  void deliver(const Message& message) override {
    try {
      (*handler_)(message);
    } catch (const std::exception& e) {
      if (log_callback_) {
        log_callback_(LogLevel::ERROR,
                      std::format("Subscriber callback for {} failed: {}", message.topic,
                                  e.what()));
      }
    }
  }

private:
  OnPublishPtr handler_;
  LogCallback log_callback_;
};

} // namespace

Broker::Broker(Config config) : config_(std::move(config)) {
}

Broker::~Broker() {
  stop();
}

void Broker::log(LogLevel level, std::string_view message) const {
  if (config_.log_callback) {
    config_.log_callback(level, message);
  }
}

std::expected<void, Error> Broker::start() {
  std::lock_guard<std::mutex> lock(mutex_);

  if (running_) {
    return std::unexpected(Error(ErrorKind::AlreadyRunning, "Broker already running"));
  }

  delivery_io_.restart();
  work_guard_.emplace(boost::asio::make_work_guard(delivery_io_));
  delivery_thread_ = std::thread([this]() { delivery_io_.run(); });
  running_ = true;

  log(LogLevel::DEBUG, "Broker started");
  return {};
}

void Broker::stop() {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!running_) {
      return;
    }
    running_ = false;
    // Deliveries posted so far still run before the worker exits
    work_guard_.reset();
  }

  if (delivery_thread_.joinable()) {
    delivery_thread_.join();
  }
  log(LogLevel::DEBUG, "Broker stopped");
}

bool Broker::is_running() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return running_;
}

std::expected<void, Error> Broker::publish(std::string_view topic, std::string_view payload,
                                           int qos, bool retain) {
  auto q = qos_from_int(qos);
  if (!q) {
    return std::unexpected(Error(ErrorKind::Publish, std::format("Invalid QoS: {}", qos)));
  }
  return publish(Message{.topic = std::string(topic),
                         .payload = std::string(payload),
                         .qos = *q,
                         .retain = retain});
}

std::expected<void, Error> Broker::publish(Message message) {
  if (!mqtt::is_valid_topic_name(message.topic)) {
    return std::unexpected(
        Error(ErrorKind::Publish, std::format("Invalid topic: {}", message.topic)));
  }
  if (!qos_from_int(std::to_underlying(message.qos))) {
    auto code = static_cast<int>(std::to_underlying(message.qos));
    return std::unexpected(Error(ErrorKind::Publish, std::format("Invalid QoS: {}", code)));
  }

  log(LogLevel::DEBUG, std::format("Publishing {}: {}", message.topic, message.payload));

  std::lock_guard<std::mutex> lock(mutex_);

  if (!running_) {
    return std::unexpected(Error(ErrorKind::Publish, "Publish failed: broker not running"));
  }

  if (message.retain) {
    if (message.payload.empty()) {
      retained_.erase(message.topic);
    } else {
      retained_.insert_or_assign(message.topic, message);
    }
  }

  // One delivery per sink, at the highest QoS granted by its matching filters
  std::vector<Delivery> deliveries;
  std::vector<const void*> keys;
  for (const auto& sub : subscriptions_) {
    if (!mqtt::topic_matches(sub.filter, message.topic)) {
      continue;
    }
    auto granted = min_qos(message.qos, sub.qos);
    auto it = std::ranges::find(keys, sub.key);
    if (it == keys.end()) {
      Message copy{.topic = message.topic, .payload = {}, .qos = granted, .retain = false};
      deliveries.push_back(Delivery{.sink = sub.sink, .message = std::move(copy)});
      keys.push_back(sub.key);
      continue;
    }
    auto& existing = deliveries[static_cast<size_t>(it - keys.begin())].message;
    if (std::to_underlying(granted) > std::to_underlying(existing.qos)) {
      existing.qos = granted;
    }
  }
  for (auto& d : deliveries) {
    d.message.payload = message.payload;
  }

  post_deliveries(std::move(deliveries));
  return {};
}

void Broker::post_deliveries(std::vector<Delivery> deliveries) {
  if (deliveries.empty() || !running_) {
    return;
  }
  boost::asio::post(delivery_io_, [deliveries = std::move(deliveries)]() {
    for (const auto& d : deliveries) {
      d.sink->deliver(d.message);
    }
  });
}

std::vector<Broker::Delivery>
Broker::retained_for(std::string_view filter, QoS qos,
                     const std::shared_ptr<MessageSink>& sink) const {
  std::vector<Delivery> deliveries;
  for (const auto& [topic, message] : retained_) {
    if (mqtt::topic_matches(filter, topic)) {
      Message copy = message;
      copy.qos = min_qos(message.qos, qos);
      copy.retain = true;
      deliveries.push_back(Delivery{.sink = sink, .message = std::move(copy)});
    }
  }
  return deliveries;
}

void Broker::add_subscription(std::string_view filter, QoS qos,
                              std::shared_ptr<MessageSink> sink, const void* key) {
  std::lock_guard<std::mutex> lock(mutex_);

  auto it = std::ranges::find_if(subscriptions_, [&](const Subscription& sub) {
    return sub.key == key && sub.filter == filter;
  });
  if (it != subscriptions_.end()) {
    it->qos = qos;
  } else {
    subscriptions_.push_back(
        Subscription{.filter = std::string(filter), .qos = qos, .sink = sink, .key = key});
  }

  post_deliveries(retained_for(filter, qos, sink));
}

std::expected<void, Error> Broker::subscribe(std::string_view filter, QoS qos,
                                             OnPublishPtr handler) {
  if (!mqtt::is_valid_topic_filter(filter)) {
    return std::unexpected(
        Error(ErrorKind::Publish, std::format("Invalid topic filter: {}", filter)));
  }
  if (!qos_from_int(std::to_underlying(qos))) {
    return std::unexpected(Error(ErrorKind::Publish, "Invalid QoS"));
  }
  if (!handler || !*handler) {
    return std::unexpected(Error(ErrorKind::Publish, "Missing subscriber callback"));
  }

  const void* key = handler.get();
  auto sink = std::make_shared<CallbackSink>(std::move(handler), config_.log_callback);
  add_subscription(filter, qos, std::move(sink), key);
  return {};
}

std::expected<void, Error> Broker::unsubscribe(std::string_view filter,
                                               const OnPublishPtr& handler) {
  std::lock_guard<std::mutex> lock(mutex_);

  auto removed = std::erase_if(subscriptions_, [&](const Subscription& sub) {
    return sub.key == handler.get() && sub.filter == filter;
  });
  if (removed == 0) {
    return std::unexpected(Error(ErrorKind::Publish, std::format("Not subscribed: {}", filter)));
  }
  return {};
}

void Broker::subscribe_sink(std::string_view filter, QoS qos, std::shared_ptr<MessageSink> sink) {
  const void* key = sink.get();
  add_subscription(filter, qos, std::move(sink), key);
}

void Broker::unsubscribe_sink(std::string_view filter, const MessageSink* sink) {
  std::lock_guard<std::mutex> lock(mutex_);
  std::erase_if(subscriptions_, [&](const Subscription& sub) {
    return sub.key == sink && sub.filter == filter;
  });
}

void Broker::remove_sink(const MessageSink* sink) {
  std::lock_guard<std::mutex> lock(mutex_);
  std::erase_if(subscriptions_, [&](const Subscription& sub) { return sub.key == sink; });
}

std::shared_ptr<ClientConnection>
Broker::register_client(const std::string& client_id,
                        const std::shared_ptr<ClientConnection>& client) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto& slot = clients_[client_id];
  auto previous = slot.lock();
  slot = client;
  return previous;
}

void Broker::unregister_client(const std::string& client_id, const ClientConnection* client) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = clients_.find(client_id);
  if (it == clients_.end()) {
    return;
  }
  // A newer connection may have taken over the identifier
  auto current = it->second.lock();
  if (!current || current.get() == client) {
    clients_.erase(it);
  }
}

std::string Broker::generate_client_id() {
  return std::format("ccujack-{}", ++client_counter_);
}

size_t Broker::retained_count() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return retained_.size();
}

size_t Broker::subscription_count() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return subscriptions_.size();
}

} // namespace ccujack
