// include/ccujack/event_receiver.hpp
#pragma once

#include "error.hpp"
#include "logging.hpp"
#include "message.hpp"
#include "process_value.hpp"
#include "topic.hpp"

#include <expected>
#include <memory>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

#include <nlohmann/json.hpp>

namespace ccujack {

/**
 * @brief Device description as reported by the controller.
 *
 * The fields are passed through untouched; interpreting them belongs to the
 * device tree, not to the messaging engine.
 */
struct DeviceDescription {
  std::string address;
  std::string type;
  std::string parent;
  nlohmann::json attributes = nlohmann::json::object();
};

/**
 * @brief A data point of a device channel changed its value.
 */
struct ValueChanged {
  std::string interface_id;
  std::string address;   ///< "device-serial:channel-number"
  std::string value_key; ///< Parameter name, e.g. "LEVEL"
  nlohmann::json value;
};

struct DevicesAdded {
  std::string interface_id;
  std::vector<DeviceDescription> descriptions;
};

struct DevicesDeleted {
  std::string interface_id;
  std::vector<std::string> addresses;
};

struct DeviceUpdated {
  std::string interface_id;
  std::string address;
  int hint{0};
};

struct DeviceReplaced {
  std::string interface_id;
  std::string old_address;
  std::string new_address;
};

struct DevicesReadded {
  std::string interface_id;
  std::vector<std::string> addresses;
};

using Notification = std::variant<ValueChanged, DevicesAdded, DevicesDeleted, DeviceUpdated,
                                  DeviceReplaced, DevicesReadded>;

/**
 * @brief Capability implemented by every member of a HandlerChain.
 *
 * handle() runs synchronously on the thread that dispatched the notification.
 */
class NotificationHandler {
public:
  virtual ~NotificationHandler() = default;
  [[nodiscard]] virtual std::expected<void, Error> handle(const Notification& notification) = 0;
};

/**
 * @brief Target of encoded process value publications.
 */
class PvPublisher {
public:
  virtual ~PvPublisher() = default;
  [[nodiscard]] virtual std::expected<void, Error>
  publish_pv(std::string_view topic, const ProcessValue& pv, QoS qos, bool retain) = 0;
};

/**
 * @brief Turns value change notifications into broker publications.
 *
 * For every ValueChanged notification the translator derives the topic from
 * the channel address and parameter name, picks QoS and retention from the
 * publish policy, wraps the value into a ProcessValue (timestamp now, status
 * Good) and publishes it. All other notification kinds pass through.
 *
 * @par Error Handling
 * - Malformed addresses are logged and returned (ErrorKind::AddressFormat)
 * - Encoding and publish failures are logged only; the notification counts
 *   as handled so the remaining handlers still see it
 *
 * @par Example Usage
 * @code
 * ccujack::EventTranslator translator({}, server);
 * ccujack::HandlerChain chain({&translator, &device_tree});
 * chain.event("CCU-RF", "ABC123:1", "LEVEL", 42.5);
 * // -> device/status/ABC123/1/LEVEL, {"v":42.5,"ts":...,"s":0}, QoS 1, retained
 * @endcode
 */
class EventTranslator : public NotificationHandler {
public:
  struct Config {
    PublishPolicy policy{};     ///< QoS/retention per parameter name
    LogCallback log_callback{}; ///< Optional callback for log messages
  };

  EventTranslator(Config config, PvPublisher& publisher);

  [[nodiscard]] std::expected<void, Error> handle(const Notification& notification) override;

private:
  Config config_;
  PvPublisher& publisher_;

  [[nodiscard]] std::expected<void, Error> translate(const ValueChanged& event);
  void log(LogLevel level, std::string_view message) const;
};

/**
 * @brief Ordered, immutable list of notification handlers.
 *
 * Every notification is handed to every handler in order on the caller's
 * thread. A failing handler does not stop the chain; the first error is
 * returned after all handlers ran. Handlers are not owned and must outlive
 * the chain.
 */
class HandlerChain {
public:
  explicit HandlerChain(std::vector<NotificationHandler*> handlers);

  [[nodiscard]] std::expected<void, Error> dispatch(const Notification& notification) const;

  // Controller callback entry points
  [[nodiscard]] std::expected<void, Error> event(std::string interface_id, std::string address,
                                                 std::string value_key,
                                                 nlohmann::json value) const;
  [[nodiscard]] std::expected<void, Error>
  new_devices(std::string interface_id, std::vector<DeviceDescription> descriptions) const;
  [[nodiscard]] std::expected<void, Error>
  delete_devices(std::string interface_id, std::vector<std::string> addresses) const;
  [[nodiscard]] std::expected<void, Error> update_device(std::string interface_id,
                                                         std::string address, int hint) const;
  [[nodiscard]] std::expected<void, Error> replace_device(std::string interface_id,
                                                          std::string old_address,
                                                          std::string new_address) const;
  [[nodiscard]] std::expected<void, Error>
  readded_device(std::string interface_id, std::vector<std::string> addresses) const;

  [[nodiscard]] size_t size() const noexcept {
    return handlers_.size();
  }

private:
  const std::vector<NotificationHandler*> handlers_;
};

} // namespace ccujack
