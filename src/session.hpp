// src/session.hpp
#pragma once

#include "ccujack/broker.hpp"
#include "ccujack/logging.hpp"
#include "ccujack/mqtt_packet.hpp"

#include <array>
#include <chrono>
#include <cstdint>
#include <deque>
#include <format>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <type_traits>
#include <unordered_map>
#include <utility>
#include <vector>

#include <boost/asio/buffer.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/read.hpp>
#include <boost/asio/ssl/stream.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/write.hpp>

namespace ccujack::detail {

// Shared between a listener and its sessions. Posting to the listener's
// io_context is only allowed while alive is true.
struct ExecutorGuard {
  std::mutex mutex;
  bool alive{true};
};

struct SessionOptions {
  size_t max_packet_size;
  std::chrono::seconds connect_timeout;
  LogCallback log_callback;
};

class SessionBase : public ClientConnection {
public:
  virtual void start() = 0;
  // Must run on the listener thread.
  virtual void close_now(bool publish_will) = 0;
};

/**
 * @brief One MQTT 3.1/3.1.1 client connection.
 *
 * Stream is boost::asio::ip::tcp::socket or boost::asio::ssl::stream of it.
 * All members are touched on the listener thread only; deliver() and close()
 * hop onto it through the stream executor.
 */
template <typename Stream>
class Session : public SessionBase, public std::enable_shared_from_this<Session<Stream>> {
public:
  template <typename... StreamArgs>
  Session(Broker& broker, SessionOptions options, std::shared_ptr<ExecutorGuard> guard,
          StreamArgs&&... stream_args)
      : stream_(std::forward<StreamArgs>(stream_args)...), broker_(broker),
        options_(std::move(options)), guard_(std::move(guard)), timer_(stream_.get_executor()) {
  }

  void start() override {
    arm_timer(options_.connect_timeout);
    if constexpr (is_tls) {
      auto self = this->shared_from_this();
      stream_.async_handshake(boost::asio::ssl::stream_base::server,
                              [self](const boost::system::error_code& ec) {
                                if (ec) {
                                  self->log(LogLevel::WARN, std::format("TLS handshake failed: {}",
                                                                        ec.message()));
                                  self->close_now(false);
                                  return;
                                }
                                self->read_header();
                              });
    } else {
      read_header();
    }
  }

  void deliver(const Message& message) override {
    auto self = this->shared_from_this();
    std::lock_guard<std::mutex> lock(guard_->mutex);
    if (!guard_->alive) {
      return;
    }
    boost::asio::post(stream_.get_executor(), [self, message]() { self->send_publish(message); });
  }

  void close() override {
    auto self = this->shared_from_this();
    std::lock_guard<std::mutex> lock(guard_->mutex);
    if (!guard_->alive) {
      return;
    }
    boost::asio::post(stream_.get_executor(), [self]() { self->close_now(true); });
  }

  void close_now(bool publish_will) override {
    if (closed_) {
      return;
    }
    closed_ = true;

    boost::system::error_code ec;
    timer_.cancel();
    stream_.lowest_layer().close(ec);

    broker_.remove_sink(this);
    if (connected_) {
      broker_.unregister_client(client_id_, this);
      log(LogLevel::DEBUG, std::format("Client {} disconnected", client_id_));
    }

    if (publish_will && will_) {
      auto result = broker_.publish(std::move(*will_));
      if (!result) {
        log(LogLevel::WARN,
            std::format("Publishing will of {} failed: {}", client_id_, describe(result.error())));
      }
    }
    will_.reset();
  }

private:
  static constexpr bool is_tls = !std::is_same_v<Stream, boost::asio::ip::tcp::socket>;

  enum class Outbound : uint8_t { AwaitPuback, AwaitPubrec, AwaitPubcomp };

  Stream stream_;
  Broker& broker_;
  SessionOptions options_;
  std::shared_ptr<ExecutorGuard> guard_;
  boost::asio::steady_timer timer_;

  std::array<uint8_t, 1> byte_{};
  uint8_t fixed_header_{0};
  mqtt::RemainingLength remaining_;
  std::string body_;

  std::deque<std::string> write_queue_;
  bool writing_{false};

  bool closed_{false};
  bool connected_{false};
  std::string client_id_;
  uint16_t keep_alive_{0};
  std::optional<Message> will_;

  uint16_t last_packet_id_{0};
  std::unordered_map<uint16_t, Outbound> inflight_;
  std::set<uint16_t> qos2_received_;

  void log(LogLevel level, std::string_view message) const {
    if (options_.log_callback) {
      options_.log_callback(level, message);
    }
  }

  void arm_timer(std::chrono::milliseconds timeout) {
    timer_.expires_after(timeout);
    auto self = this->shared_from_this();
    timer_.async_wait([self](const boost::system::error_code& ec) {
      if (ec || self->closed_) {
        return;
      }
      self->log(LogLevel::WARN, std::format("Client {} timed out", self->client_id_));
      self->close_now(true);
    });
  }

  void read_header() {
    auto self = this->shared_from_this();
    boost::asio::async_read(stream_, boost::asio::buffer(byte_),
                            [self](const boost::system::error_code& ec, size_t) {
                              if (self->closed_) {
                                return;
                              }
                              if (ec) {
                                self->close_now(true);
                                return;
                              }
                              self->fixed_header_ = self->byte_[0];
                              self->remaining_ = mqtt::RemainingLength{};
                              self->read_length();
                            });
  }

  void read_length() {
    auto self = this->shared_from_this();
    boost::asio::async_read(stream_, boost::asio::buffer(byte_),
                            [self](const boost::system::error_code& ec, size_t) {
                              if (self->closed_) {
                                return;
                              }
                              if (ec) {
                                self->close_now(true);
                                return;
                              }
                              if (!self->remaining_.feed(self->byte_[0])) {
                                self->protocol_violation("Malformed remaining length");
                                return;
                              }
                              if (!self->remaining_.complete()) {
                                self->read_length();
                                return;
                              }
                              self->read_body();
                            });
  }

  void read_body() {
    auto length = remaining_.value();
    if (length > options_.max_packet_size) {
      protocol_violation(std::format("Packet of {} bytes exceeds limit", length));
      return;
    }
    body_.resize(length);
    if (length == 0) {
      dispatch();
      return;
    }
    auto self = this->shared_from_this();
    boost::asio::async_read(stream_, boost::asio::buffer(body_),
                            [self](const boost::system::error_code& ec, size_t) {
                              if (self->closed_) {
                                return;
                              }
                              if (ec) {
                                self->close_now(true);
                                return;
                              }
                              self->dispatch();
                            });
  }

  void dispatch() {
    auto type = static_cast<mqtt::PacketType>(fixed_header_ >> 4);
    uint8_t flags = fixed_header_ & 0x0F;

    if (!connected_ && type != mqtt::PacketType::CONNECT) {
      protocol_violation("First packet is not CONNECT");
      return;
    }

    bool keep_reading = true;
    switch (type) {
    case mqtt::PacketType::CONNECT:
      keep_reading = handle_connect();
      break;
    case mqtt::PacketType::PUBLISH:
      keep_reading = handle_publish(flags);
      break;
    case mqtt::PacketType::PUBACK:
    case mqtt::PacketType::PUBREC:
    case mqtt::PacketType::PUBREL:
    case mqtt::PacketType::PUBCOMP:
      keep_reading = handle_ack(type);
      break;
    case mqtt::PacketType::SUBSCRIBE:
      keep_reading = handle_subscribe(flags);
      break;
    case mqtt::PacketType::UNSUBSCRIBE:
      keep_reading = handle_unsubscribe(flags);
      break;
    case mqtt::PacketType::PINGREQ:
      enqueue(mqtt::encode_pingresp());
      break;
    case mqtt::PacketType::DISCONNECT:
      will_.reset();
      close_now(false);
      keep_reading = false;
      break;
    default:
      protocol_violation(std::format("Unexpected packet type {}", fixed_header_ >> 4));
      keep_reading = false;
      break;
    }

    if (keep_reading && !closed_) {
      if (keep_alive_ > 0) {
        // A client is dropped after one and a half keep-alive periods of silence
        arm_timer(std::chrono::milliseconds(keep_alive_ * 1500));
      }
      read_header();
    }
  }

  bool handle_connect() {
    if (connected_) {
      protocol_violation("Second CONNECT");
      return false;
    }
    auto pkt = mqtt::decode_connect(body_);
    if (!pkt) {
      protocol_violation(pkt.error().message);
      return false;
    }

    bool supported = (pkt->protocol_name == "MQTT" && pkt->protocol_level == 4) ||
                     (pkt->protocol_name == "MQIsdp" && pkt->protocol_level == 3);
    if (!supported) {
      refuse(mqtt::ConnectReturnCode::UnacceptableProtocolVersion);
      return false;
    }
    if (pkt->client_id.empty()) {
      if (!pkt->clean_session) {
        refuse(mqtt::ConnectReturnCode::IdentifierRejected);
        return false;
      }
      pkt->client_id = broker_.generate_client_id();
    }

    connected_ = true;
    client_id_ = std::move(pkt->client_id);
    keep_alive_ = pkt->keep_alive;
    will_ = std::move(pkt->will);
    timer_.cancel();

    auto previous = broker_.register_client(client_id_, this->shared_from_this());
    if (previous) {
      log(LogLevel::INFO, std::format("Client {} taken over by new connection", client_id_));
      previous->close();
    }

    enqueue(mqtt::encode_connack(false, mqtt::ConnectReturnCode::Accepted));
    log(LogLevel::DEBUG, std::format("Client {} connected", client_id_));
    return true;
  }

  bool handle_publish(uint8_t flags) {
    auto pkt = mqtt::decode_publish(flags, body_);
    if (!pkt) {
      protocol_violation(pkt.error().message);
      return false;
    }

    auto qos = pkt->message.qos;
    auto packet_id = pkt->packet_id;

    if (qos == QoS::ExactlyOnce) {
      // Duplicate until the matching PUBREL arrives
      if (qos2_received_.insert(packet_id).second) {
        forward(std::move(pkt->message));
      }
      enqueue(mqtt::encode_ack(mqtt::PacketType::PUBREC, packet_id));
      return true;
    }

    forward(std::move(pkt->message));
    if (qos == QoS::AtLeastOnce) {
      enqueue(mqtt::encode_ack(mqtt::PacketType::PUBACK, packet_id));
    }
    return true;
  }

  void forward(Message message) {
    auto result = broker_.publish(std::move(message));
    if (!result) {
      log(LogLevel::WARN,
          std::format("Publish from client {} rejected: {}", client_id_, describe(result.error())));
    }
  }

  bool handle_ack(mqtt::PacketType type) {
    auto id = mqtt::decode_packet_id(body_);
    if (!id) {
      protocol_violation(id.error().message);
      return false;
    }

    switch (type) {
    case mqtt::PacketType::PUBACK:
      inflight_.erase(*id);
      break;
    case mqtt::PacketType::PUBREC:
      if (auto it = inflight_.find(*id); it != inflight_.end()) {
        it->second = Outbound::AwaitPubcomp;
      }
      enqueue(mqtt::encode_ack(mqtt::PacketType::PUBREL, *id));
      break;
    case mqtt::PacketType::PUBREL:
      qos2_received_.erase(*id);
      enqueue(mqtt::encode_ack(mqtt::PacketType::PUBCOMP, *id));
      break;
    case mqtt::PacketType::PUBCOMP:
      inflight_.erase(*id);
      break;
    default:
      break;
    }
    return true;
  }

  bool handle_subscribe(uint8_t flags) {
    auto pkt = mqtt::decode_subscribe(flags, body_);
    if (!pkt) {
      protocol_violation(pkt.error().message);
      return false;
    }

    std::vector<uint8_t> codes;
    std::vector<const mqtt::TopicRequest*> accepted;
    for (const auto& request : pkt->requests) {
      if (request.qos <= 2 && mqtt::is_valid_topic_filter(request.filter)) {
        codes.push_back(request.qos);
        accepted.push_back(&request);
      } else {
        codes.push_back(mqtt::SUBACK_FAILURE);
      }
    }

    // SUBACK goes out before any retained message
    enqueue(mqtt::encode_suback(pkt->packet_id, codes));
    for (const auto* request : accepted) {
      broker_.subscribe_sink(request->filter, static_cast<QoS>(request->qos),
                             this->shared_from_this());
      log(LogLevel::DEBUG, std::format("Client {} subscribed to {}", client_id_, request->filter));
    }
    return true;
  }

  bool handle_unsubscribe(uint8_t flags) {
    auto pkt = mqtt::decode_unsubscribe(flags, body_);
    if (!pkt) {
      protocol_violation(pkt.error().message);
      return false;
    }
    for (const auto& filter : pkt->filters) {
      broker_.unsubscribe_sink(filter, this);
    }
    enqueue(mqtt::encode_ack(mqtt::PacketType::UNSUBACK, pkt->packet_id));
    return true;
  }

  void send_publish(const Message& message) {
    if (closed_ || !connected_) {
      return;
    }
    if (message.qos == QoS::AtMostOnce) {
      enqueue(mqtt::encode_publish(message, 0, false));
      return;
    }

    auto id = next_packet_id();
    if (!id) {
      log(LogLevel::WARN, std::format("Client {} has no free packet identifier, dropping {}",
                                      client_id_, message.topic));
      return;
    }
    inflight_[*id] =
        message.qos == QoS::AtLeastOnce ? Outbound::AwaitPuback : Outbound::AwaitPubrec;
    enqueue(mqtt::encode_publish(message, *id, false));
  }

  std::optional<uint16_t> next_packet_id() {
    for (int attempt = 0; attempt < 65535; ++attempt) {
      last_packet_id_ = last_packet_id_ == 65535 ? 1 : static_cast<uint16_t>(last_packet_id_ + 1);
      if (!inflight_.contains(last_packet_id_)) {
        return last_packet_id_;
      }
    }
    return std::nullopt;
  }

  void refuse(mqtt::ConnectReturnCode rc) {
    log(LogLevel::WARN,
        std::format("Connection refused with return code {}", std::to_underlying(rc)));
    // Close once the CONNACK is written
    write_queue_.push_back(mqtt::encode_connack(false, rc));
    auto self = this->shared_from_this();
    boost::asio::async_write(stream_, boost::asio::buffer(write_queue_.back()),
                             [self](const boost::system::error_code&, size_t) {
                               self->close_now(false);
                             });
  }

  void protocol_violation(const std::string& reason) {
    log(LogLevel::WARN, std::format("Closing client {}: {}",
                                    client_id_.empty() ? "(unknown)" : client_id_, reason));
    close_now(true);
  }

  void enqueue(std::string packet) {
    if (closed_) {
      return;
    }
    write_queue_.push_back(std::move(packet));
    if (!writing_) {
      do_write();
    }
  }

  void do_write() {
    writing_ = true;
    auto self = this->shared_from_this();
    boost::asio::async_write(stream_, boost::asio::buffer(write_queue_.front()),
                             [self](const boost::system::error_code& ec, size_t) {
                               if (ec) {
                                 self->writing_ = false;
                                 self->close_now(true);
                                 return;
                               }
                               self->write_queue_.pop_front();
                               if (self->write_queue_.empty() || self->closed_) {
                                 self->writing_ = false;
                                 return;
                               }
                               self->do_write();
                             });
  }
};

using PlainSession = Session<boost::asio::ip::tcp::socket>;
using TlsSession = Session<boost::asio::ssl::stream<boost::asio::ip::tcp::socket>>;

} // namespace ccujack::detail
