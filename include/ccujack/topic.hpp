// include/ccujack/topic.hpp
#pragma once

#include "error.hpp"
#include "message.hpp"

#include <expected>
#include <string>
#include <string_view>
#include <vector>

namespace ccujack {

enum class Category { Device, Sysvar, Program };

enum class Service { Status, Set, Get };

/**
 * @brief Hierarchical topic {category}/{service}/{segments...}.
 *
 * Device topics carry three segments (serial, channel, parameter), system
 * variable and program topics carry one numeric identifier.
 */
struct Topic {
  Category category;
  Service service;
  std::vector<std::string> segments;

  [[nodiscard]] std::string to_string() const;

  [[nodiscard]] static std::expected<Topic, Error> parse(std::string_view topic_str);
};

/**
 * @brief Builds device/status/{device}/{channel}/{parameter}.
 *
 * @param address Controller address "device-serial:channel-number"
 * @param parameter Parameter name (value key), e.g. "STATE"
 *
 * @return The topic, or ErrorKind::AddressFormat unless the address contains
 *         exactly one ':' with a non-empty serial and channel.
 */
[[nodiscard]] std::expected<Topic, Error> build_device_topic(std::string_view address,
                                                             std::string_view parameter);

[[nodiscard]] Topic sysvar_topic(std::string_view id);
[[nodiscard]] Topic program_topic(std::string_view id);

/**
 * @brief QoS and retain flag for a publication.
 */
struct PublishDecision {
  QoS qos;
  bool retain;

  bool operator==(const PublishDecision&) const = default;
};

/**
 * @brief Maps parameter names to publish decisions.
 *
 * Transient signals (button presses, install test) are published with
 * ExactlyOnce and without retain, so late subscribers never see a stale press.
 * Everything else is published AtLeastOnce and retained.
 */
struct PublishPolicy {
  std::vector<std::string> transient_names{"INSTALL_TEST"};
  std::vector<std::string> transient_prefixes{"PRESS_"};

  [[nodiscard]] PublishDecision decide(std::string_view parameter) const;
};

// Decision of the default PublishPolicy.
[[nodiscard]] PublishDecision resolve_publish_decision(std::string_view parameter);

} // namespace ccujack
