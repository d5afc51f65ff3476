// include/ccujack/mqtt_packet.hpp
#pragma once

#include "error.hpp"
#include "message.hpp"

#include <cstddef>
#include <cstdint>
#include <expected>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace ccujack::mqtt {

// MQTT 3.1 / 3.1.1 control packet types (upper nibble of the fixed header)
enum class PacketType : uint8_t {
  CONNECT = 1,
  CONNACK = 2,
  PUBLISH = 3,
  PUBACK = 4,
  PUBREC = 5,
  PUBREL = 6,
  PUBCOMP = 7,
  SUBSCRIBE = 8,
  SUBACK = 9,
  UNSUBSCRIBE = 10,
  UNSUBACK = 11,
  PINGREQ = 12,
  PINGRESP = 13,
  DISCONNECT = 14
};

enum class ConnectReturnCode : uint8_t {
  Accepted = 0,
  UnacceptableProtocolVersion = 1,
  IdentifierRejected = 2,
  ServerUnavailable = 3,
  BadUsernameOrPassword = 4,
  NotAuthorized = 5
};

constexpr uint8_t SUBACK_FAILURE = 0x80;
constexpr size_t MAX_REMAINING_LENGTH = 268435455;

struct ConnectPacket {
  std::string protocol_name;
  uint8_t protocol_level{0};
  bool clean_session{true};
  uint16_t keep_alive{0};
  std::string client_id;
  std::optional<Message> will;
  std::optional<std::string> username;
  std::optional<std::string> password;
};

struct PublishPacket {
  Message message;
  bool dup{false};
  uint16_t packet_id{0}; // only for QoS > 0
};

struct TopicRequest {
  std::string filter;
  uint8_t qos{0};
};

struct SubscribePacket {
  uint16_t packet_id{0};
  std::vector<TopicRequest> requests;
};

struct UnsubscribePacket {
  uint16_t packet_id{0};
  std::vector<std::string> filters;
};

/**
 * @brief Incremental decoder for the variable length "remaining length" field.
 *
 * Feed bytes following the first fixed header byte until complete() is true.
 */
class RemainingLength {
public:
  // Returns false if the encoding exceeds four bytes.
  [[nodiscard]] bool feed(uint8_t byte);
  [[nodiscard]] bool complete() const noexcept {
    return complete_;
  }
  [[nodiscard]] size_t value() const noexcept {
    return value_;
  }

private:
  size_t value_{0};
  size_t multiplier_{1};
  int bytes_{0};
  bool complete_{false};
};

// Decoders take the fixed header flags (lower nibble) and the packet body.
[[nodiscard]] std::expected<ConnectPacket, Error> decode_connect(std::string_view body);
[[nodiscard]] std::expected<PublishPacket, Error> decode_publish(uint8_t flags,
                                                                 std::string_view body);
[[nodiscard]] std::expected<SubscribePacket, Error> decode_subscribe(uint8_t flags,
                                                                     std::string_view body);
[[nodiscard]] std::expected<UnsubscribePacket, Error> decode_unsubscribe(uint8_t flags,
                                                                         std::string_view body);
// PUBACK, PUBREC, PUBREL, PUBCOMP
[[nodiscard]] std::expected<uint16_t, Error> decode_packet_id(std::string_view body);

[[nodiscard]] std::string encode_connack(bool session_present, ConnectReturnCode rc);
[[nodiscard]] std::string encode_publish(const Message& message, uint16_t packet_id, bool dup);
// PUBACK, PUBREC, PUBREL, PUBCOMP, UNSUBACK
[[nodiscard]] std::string encode_ack(PacketType type, uint16_t packet_id);
[[nodiscard]] std::string encode_suback(uint16_t packet_id, const std::vector<uint8_t>& codes);
[[nodiscard]] std::string encode_pingresp();

// Topic names carry no wildcards; filters may use '+' per level and '#' last.
[[nodiscard]] bool is_valid_topic_name(std::string_view topic);
[[nodiscard]] bool is_valid_topic_filter(std::string_view filter);
[[nodiscard]] bool topic_matches(std::string_view filter, std::string_view topic);

} // namespace ccujack::mqtt
