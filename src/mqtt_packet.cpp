// src/mqtt_packet.cpp
#include "ccujack/mqtt_packet.hpp"

#include <format>
#include <utility>

namespace ccujack::mqtt {

namespace {

constexpr size_t MAX_STRING_LENGTH = 65535;

Error protocol_error(std::string message) {
  return Error(ErrorKind::Protocol, std::move(message));
}

// Sequential reader over a packet body.
class Reader {
public:
  explicit Reader(std::string_view data) : data_(data) {
  }

  std::optional<uint8_t> u8() {
    if (pos_ + 1 > data_.size())
      return std::nullopt;
    return static_cast<uint8_t>(data_[pos_++]);
  }

  std::optional<uint16_t> u16() {
    if (pos_ + 2 > data_.size())
      return std::nullopt;
    auto hi = static_cast<uint8_t>(data_[pos_]);
    auto lo = static_cast<uint8_t>(data_[pos_ + 1]);
    pos_ += 2;
    return static_cast<uint16_t>((hi << 8) | lo);
  }

  // Two byte length prefixed string
  std::optional<std::string_view> str() {
    auto len = u16();
    if (!len || pos_ + *len > data_.size())
      return std::nullopt;
    auto s = data_.substr(pos_, *len);
    pos_ += *len;
    return s;
  }

  std::string_view rest() {
    auto s = data_.substr(pos_);
    pos_ = data_.size();
    return s;
  }

  [[nodiscard]] bool empty() const {
    return pos_ >= data_.size();
  }

private:
  std::string_view data_;
  size_t pos_{0};
};

void write_u16(std::string& buf, uint16_t value) {
  buf.push_back(static_cast<char>(value >> 8));
  buf.push_back(static_cast<char>(value & 0xFF));
}

void write_str(std::string& buf, std::string_view s) {
  write_u16(buf, static_cast<uint16_t>(s.size()));
  buf.append(s);
}

void write_remaining_length(std::string& buf, size_t length) {
  do {
    auto byte = static_cast<uint8_t>(length % 128);
    length /= 128;
    if (length > 0)
      byte |= 0x80;
    buf.push_back(static_cast<char>(byte));
  } while (length > 0);
}

std::string build_packet(uint8_t fixed_header, std::string_view body) {
  std::string pkt;
  pkt.reserve(1 + 4 + body.size());
  pkt.push_back(static_cast<char>(fixed_header));
  write_remaining_length(pkt, body.size());
  pkt.append(body);
  return pkt;
}

constexpr uint8_t header(PacketType type, uint8_t flags = 0) {
  return static_cast<uint8_t>((std::to_underlying(type) << 4) | (flags & 0x0F));
}

} // namespace

bool RemainingLength::feed(uint8_t byte) {
  if (complete_ || bytes_ >= 4)
    return false;
  value_ += static_cast<size_t>(byte & 0x7F) * multiplier_;
  multiplier_ *= 128;
  ++bytes_;
  if ((byte & 0x80) == 0) {
    complete_ = true;
    return true;
  }
  return bytes_ < 4;
}

std::expected<ConnectPacket, Error> decode_connect(std::string_view body) {
  Reader r(body);
  ConnectPacket pkt;

  auto name = r.str();
  auto level = r.u8();
  auto flags = r.u8();
  auto keep_alive = r.u16();
  if (!name || !level || !flags || !keep_alive) {
    return std::unexpected(protocol_error("Truncated CONNECT variable header"));
  }
  pkt.protocol_name = std::string(*name);
  pkt.protocol_level = *level;
  pkt.keep_alive = *keep_alive;

  if (*flags & 0x01) {
    return std::unexpected(protocol_error("CONNECT reserved flag set"));
  }
  pkt.clean_session = (*flags & 0x02) != 0;
  bool will_flag = (*flags & 0x04) != 0;
  auto will_qos = static_cast<uint8_t>((*flags >> 3) & 0x03);
  bool will_retain = (*flags & 0x20) != 0;
  bool password_flag = (*flags & 0x40) != 0;
  bool username_flag = (*flags & 0x80) != 0;

  if (will_qos > 2 || (!will_flag && (will_qos != 0 || will_retain))) {
    return std::unexpected(protocol_error("Invalid will flags"));
  }

  auto client_id = r.str();
  if (!client_id) {
    return std::unexpected(protocol_error("Missing client identifier"));
  }
  pkt.client_id = std::string(*client_id);

  if (will_flag) {
    auto will_topic = r.str();
    auto will_message = r.str();
    if (!will_topic || !will_message) {
      return std::unexpected(protocol_error("Truncated will"));
    }
    if (!is_valid_topic_name(*will_topic)) {
      return std::unexpected(protocol_error("Invalid will topic"));
    }
    pkt.will = Message{.topic = std::string(*will_topic),
                       .payload = std::string(*will_message),
                       .qos = static_cast<QoS>(will_qos),
                       .retain = will_retain};
  }

  if (username_flag) {
    auto username = r.str();
    if (!username) {
      return std::unexpected(protocol_error("Truncated user name"));
    }
    pkt.username = std::string(*username);
  }
  if (password_flag) {
    auto password = r.str();
    if (!password) {
      return std::unexpected(protocol_error("Truncated password"));
    }
    pkt.password = std::string(*password);
  }

  return pkt;
}

std::expected<PublishPacket, Error> decode_publish(uint8_t flags, std::string_view body) {
  PublishPacket pkt;
  pkt.dup = (flags & 0x08) != 0;
  auto qos = qos_from_int((flags >> 1) & 0x03);
  if (!qos) {
    return std::unexpected(protocol_error("Invalid PUBLISH QoS"));
  }
  pkt.message.qos = *qos;
  pkt.message.retain = (flags & 0x01) != 0;

  Reader r(body);
  auto topic = r.str();
  if (!topic) {
    return std::unexpected(protocol_error("Truncated PUBLISH topic"));
  }
  if (!is_valid_topic_name(*topic)) {
    return std::unexpected(protocol_error(std::format("Invalid PUBLISH topic: {}", *topic)));
  }
  pkt.message.topic = std::string(*topic);

  if (pkt.message.qos != QoS::AtMostOnce) {
    auto id = r.u16();
    if (!id || *id == 0) {
      return std::unexpected(protocol_error("Missing PUBLISH packet identifier"));
    }
    pkt.packet_id = *id;
  }

  pkt.message.payload = std::string(r.rest());
  return pkt;
}

std::expected<SubscribePacket, Error> decode_subscribe(uint8_t flags, std::string_view body) {
  if (flags != 0x02) {
    return std::unexpected(protocol_error("Invalid SUBSCRIBE flags"));
  }
  Reader r(body);
  SubscribePacket pkt;
  auto id = r.u16();
  if (!id) {
    return std::unexpected(protocol_error("Missing SUBSCRIBE packet identifier"));
  }
  pkt.packet_id = *id;

  while (!r.empty()) {
    auto filter = r.str();
    auto qos = r.u8();
    if (!filter || !qos) {
      return std::unexpected(protocol_error("Truncated SUBSCRIBE payload"));
    }
    pkt.requests.push_back(TopicRequest{.filter = std::string(*filter), .qos = *qos});
  }
  if (pkt.requests.empty()) {
    return std::unexpected(protocol_error("SUBSCRIBE without topic filters"));
  }
  return pkt;
}

std::expected<UnsubscribePacket, Error> decode_unsubscribe(uint8_t flags, std::string_view body) {
  if (flags != 0x02) {
    return std::unexpected(protocol_error("Invalid UNSUBSCRIBE flags"));
  }
  Reader r(body);
  UnsubscribePacket pkt;
  auto id = r.u16();
  if (!id) {
    return std::unexpected(protocol_error("Missing UNSUBSCRIBE packet identifier"));
  }
  pkt.packet_id = *id;

  while (!r.empty()) {
    auto filter = r.str();
    if (!filter) {
      return std::unexpected(protocol_error("Truncated UNSUBSCRIBE payload"));
    }
    pkt.filters.emplace_back(*filter);
  }
  if (pkt.filters.empty()) {
    return std::unexpected(protocol_error("UNSUBSCRIBE without topic filters"));
  }
  return pkt;
}

std::expected<uint16_t, Error> decode_packet_id(std::string_view body) {
  Reader r(body);
  auto id = r.u16();
  if (!id) {
    return std::unexpected(protocol_error("Missing packet identifier"));
  }
  return *id;
}

std::string encode_connack(bool session_present, ConnectReturnCode rc) {
  std::string body;
  body.push_back(session_present ? 0x01 : 0x00);
  body.push_back(static_cast<char>(std::to_underlying(rc)));
  return build_packet(header(PacketType::CONNACK), body);
}

std::string encode_publish(const Message& message, uint16_t packet_id, bool dup) {
  uint8_t flags = static_cast<uint8_t>(std::to_underlying(message.qos) << 1);
  if (dup)
    flags |= 0x08;
  if (message.retain)
    flags |= 0x01;

  std::string body;
  body.reserve(2 + message.topic.size() + 2 + message.payload.size());
  write_str(body, message.topic);
  if (message.qos != QoS::AtMostOnce) {
    write_u16(body, packet_id);
  }
  body.append(message.payload);
  return build_packet(header(PacketType::PUBLISH, flags), body);
}

std::string encode_ack(PacketType type, uint16_t packet_id) {
  // PUBREL carries the reserved flags 0b0010
  uint8_t flags = type == PacketType::PUBREL ? 0x02 : 0x00;
  std::string body;
  write_u16(body, packet_id);
  return build_packet(header(type, flags), body);
}

std::string encode_suback(uint16_t packet_id, const std::vector<uint8_t>& codes) {
  std::string body;
  write_u16(body, packet_id);
  for (auto code : codes) {
    body.push_back(static_cast<char>(code));
  }
  return build_packet(header(PacketType::SUBACK), body);
}

std::string encode_pingresp() {
  return build_packet(header(PacketType::PINGRESP), {});
}

bool is_valid_topic_name(std::string_view topic) {
  if (topic.empty() || topic.size() > MAX_STRING_LENGTH)
    return false;
  return topic.find_first_of(std::string_view("+#\0", 3)) == std::string_view::npos;
}

bool is_valid_topic_filter(std::string_view filter) {
  if (filter.empty() || filter.size() > MAX_STRING_LENGTH)
    return false;
  if (filter.find('\0') != std::string_view::npos)
    return false;

  size_t start = 0;
  while (true) {
    auto end = filter.find('/', start);
    auto level = filter.substr(start, end == std::string_view::npos ? end : end - start);
    if (level.find_first_of("+#") != std::string_view::npos && level.size() != 1)
      return false;
    if (level == "#" && end != std::string_view::npos)
      return false;
    if (end == std::string_view::npos)
      return true;
    start = end + 1;
  }
}

bool topic_matches(std::string_view filter, std::string_view topic) {
  // Wildcards at the first level never match $-prefixed system topics
  if (!topic.empty() && topic.front() == '$' && !filter.empty() &&
      (filter.front() == '+' || filter.front() == '#'))
    return false;

  size_t f = 0;
  size_t t = 0;
  while (true) {
    auto f_end = filter.find('/', f);
    auto f_level = filter.substr(f, f_end == std::string_view::npos ? f_end : f_end - f);

    if (f_level == "#")
      return true;

    auto t_end = topic.find('/', t);
    auto t_level = topic.substr(t, t_end == std::string_view::npos ? t_end : t_end - t);

    if (f_level != "+" && f_level != t_level)
      return false;

    bool f_last = f_end == std::string_view::npos;
    bool t_last = t_end == std::string_view::npos;
    if (f_last || t_last) {
      if (f_last && t_last)
        return true;
      // "a/#" matches "a"
      return t_last && filter.substr(f_end + 1) == "#";
    }
    f = f_end + 1;
    t = t_end + 1;
  }
}

} // namespace ccujack::mqtt
