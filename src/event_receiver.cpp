// src/event_receiver.cpp
#include "ccujack/event_receiver.hpp"

#include <format>
#include <utility>

namespace ccujack {

EventTranslator::EventTranslator(Config config, PvPublisher& publisher)
    : config_(std::move(config)), publisher_(publisher) {
}

void EventTranslator::log(LogLevel level, std::string_view message) const {
  if (config_.log_callback) {
    config_.log_callback(level, message);
  }
}

std::expected<void, Error> EventTranslator::handle(const Notification& notification) {
  if (const auto* event = std::get_if<ValueChanged>(&notification)) {
    return translate(*event);
  }
  return {};
}

std::expected<void, Error> EventTranslator::translate(const ValueChanged& event) {
  auto topic = build_device_topic(event.address, event.value_key);
  if (!topic) {
    log(LogLevel::ERROR, std::format("Publish of event failed: {}", describe(topic.error())));
    return std::unexpected(topic.error());
  }

  auto decision = config_.policy.decide(event.value_key);
  ProcessValue pv{.timestamp = std::chrono::system_clock::now(),
                  .value = event.value,
                  .status = Status::Good};

  auto topic_str = topic->to_string();
  auto result = publisher_.publish_pv(topic_str, pv, decision.qos, decision.retain);
  if (!result) {
    log(LogLevel::ERROR, std::format("Publish of event failed: {}", describe(result.error())));
    return {};
  }

  log(LogLevel::DEBUG, std::format("Published event {}", topic_str));
  return {};
}

HandlerChain::HandlerChain(std::vector<NotificationHandler*> handlers)
    : handlers_(std::move(handlers)) {
}

std::expected<void, Error> HandlerChain::dispatch(const Notification& notification) const {
  std::expected<void, Error> first{};
  for (auto* handler : handlers_) {
    auto result = handler->handle(notification);
    if (!result && first) {
      first = std::unexpected(std::move(result.error()));
    }
  }
  return first;
}

std::expected<void, Error> HandlerChain::event(std::string interface_id, std::string address,
                                               std::string value_key,
                                               nlohmann::json value) const {
  return dispatch(ValueChanged{.interface_id = std::move(interface_id),
                               .address = std::move(address),
                               .value_key = std::move(value_key),
                               .value = std::move(value)});
}

std::expected<void, Error>
HandlerChain::new_devices(std::string interface_id,
                          std::vector<DeviceDescription> descriptions) const {
  return dispatch(DevicesAdded{.interface_id = std::move(interface_id),
                               .descriptions = std::move(descriptions)});
}

std::expected<void, Error> HandlerChain::delete_devices(std::string interface_id,
                                                        std::vector<std::string> addresses) const {
  return dispatch(DevicesDeleted{.interface_id = std::move(interface_id),
                                 .addresses = std::move(addresses)});
}

std::expected<void, Error> HandlerChain::update_device(std::string interface_id,
                                                       std::string address, int hint) const {
  return dispatch(DeviceUpdated{
      .interface_id = std::move(interface_id), .address = std::move(address), .hint = hint});
}

std::expected<void, Error> HandlerChain::replace_device(std::string interface_id,
                                                        std::string old_address,
                                                        std::string new_address) const {
  return dispatch(DeviceReplaced{.interface_id = std::move(interface_id),
                                 .old_address = std::move(old_address),
                                 .new_address = std::move(new_address)});
}

std::expected<void, Error> HandlerChain::readded_device(std::string interface_id,
                                                        std::vector<std::string> addresses) const {
  return dispatch(DevicesReadded{.interface_id = std::move(interface_id),
                                 .addresses = std::move(addresses)});
}

} // namespace ccujack
