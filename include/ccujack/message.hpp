// include/ccujack/message.hpp
#pragma once

#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>

namespace ccujack {

/**
 * @brief MQTT delivery guarantee levels.
 */
enum class QoS : uint8_t { AtMostOnce = 0, AtLeastOnce = 1, ExactlyOnce = 2 };

// Values outside {0,1,2} are rejected by publish().
[[nodiscard]] constexpr std::optional<QoS> qos_from_int(int value) {
  if (value < 0 || value > 2)
    return std::nullopt;
  return static_cast<QoS>(value);
}

/**
 * @brief One publication as seen by subscribers.
 *
 * retain is true only when the message is delivered from the retained store
 * to a new subscription.
 */
struct Message {
  std::string topic;
  std::string payload;
  QoS qos{QoS::AtMostOnce};
  bool retain{false};
};

/**
 * @brief Local subscriber callback.
 *
 * Invoked on the broker delivery worker thread. Subscriptions are keyed by the
 * address of the shared callback object, so keep the pointer to unsubscribe.
 */
using OnPublish = std::function<void(const Message&)>;
using OnPublishPtr = std::shared_ptr<const OnPublish>;

} // namespace ccujack
