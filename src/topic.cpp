// src/topic.cpp
#include "ccujack/topic.hpp"

#include <algorithm>
#include <format>
#include <ranges>
#include <utility>

namespace ccujack {

namespace {

using namespace std::string_view_literals;

constexpr std::string_view category_to_string(Category category) {
  switch (category) {
  case Category::Device:
    return "device";
  case Category::Sysvar:
    return "sysvar";
  case Category::Program:
    return "program";
  }
  std::unreachable();
}

constexpr std::string_view service_to_string(Service service) {
  switch (service) {
  case Service::Status:
    return "status";
  case Service::Set:
    return "set";
  case Service::Get:
    return "get";
  }
  std::unreachable();
}

std::expected<Category, Error> parse_category(std::string_view str) {
  if (str == "device")
    return Category::Device;
  if (str == "sysvar")
    return Category::Sysvar;
  if (str == "program")
    return Category::Program;
  return std::unexpected(
      Error(ErrorKind::AddressFormat, std::format("Unknown topic category: {}", str)));
}

std::expected<Service, Error> parse_service(std::string_view str) {
  if (str == "status")
    return Service::Status;
  if (str == "set")
    return Service::Set;
  if (str == "get")
    return Service::Get;
  return std::unexpected(
      Error(ErrorKind::AddressFormat, std::format("Unknown topic service: {}", str)));
}

bool is_numeric(std::string_view str) {
  return !str.empty() && std::ranges::all_of(str, [](char c) { return c >= '0' && c <= '9'; });
}

} // namespace

std::string Topic::to_string() const {
  std::string out(category_to_string(category));
  out += '/';
  out += service_to_string(service);
  for (const auto& segment : segments) {
    out += '/';
    out += segment;
  }
  return out;
}

std::expected<Topic, Error> Topic::parse(std::string_view topic_str) {
  std::vector<std::string_view> elements;
  for (auto&& rng : topic_str | std::views::split('/')) {
    elements.emplace_back(rng.begin(), rng.end());
  }
  if (elements.size() < 3) {
    return std::unexpected(
        Error(ErrorKind::AddressFormat, std::format("Invalid topic format: {}", topic_str)));
  }

  auto category = parse_category(elements[0]);
  if (!category) {
    return std::unexpected(category.error());
  }
  auto service = parse_service(elements[1]);
  if (!service) {
    return std::unexpected(service.error());
  }

  auto ids = std::ranges::subrange(elements.begin() + 2, elements.end());
  auto non_empty = [](std::string_view id) { return !id.empty(); };
  bool valid = *category == Category::Device
                   ? ids.size() == 3 && std::ranges::all_of(ids, non_empty)
                   : ids.size() == 1 && is_numeric(ids.front());
  if (!valid) {
    return std::unexpected(
        Error(ErrorKind::AddressFormat, std::format("Invalid topic identifier: {}", topic_str)));
  }

  Topic topic{.category = *category, .service = *service, .segments = {}};
  for (auto id : ids) {
    topic.segments.emplace_back(id);
  }
  return topic;
}

std::expected<Topic, Error> build_device_topic(std::string_view address,
                                               std::string_view parameter) {
  auto p = address.find(':');
  if (p == std::string_view::npos || address.find(':', p + 1) != std::string_view::npos) {
    return std::unexpected(
        Error(ErrorKind::AddressFormat,
              std::format("Unexpected event from a device: {}", address)));
  }
  auto device = address.substr(0, p);
  auto channel = address.substr(p + 1);
  if (device.empty() || channel.empty() || parameter.empty()) {
    return std::unexpected(
        Error(ErrorKind::AddressFormat,
              std::format("Unexpected event from a device: {}", address)));
  }

  return Topic{.category = Category::Device,
               .service = Service::Status,
               .segments = {std::string(device), std::string(channel), std::string(parameter)}};
}

Topic sysvar_topic(std::string_view id) {
  return Topic{
      .category = Category::Sysvar, .service = Service::Status, .segments = {std::string(id)}};
}

Topic program_topic(std::string_view id) {
  return Topic{
      .category = Category::Program, .service = Service::Status, .segments = {std::string(id)}};
}

PublishDecision PublishPolicy::decide(std::string_view parameter) const {
  bool transient =
      std::ranges::any_of(transient_names, [&](const auto& name) { return parameter == name; }) ||
      std::ranges::any_of(transient_prefixes,
                          [&](const auto& prefix) { return parameter.starts_with(prefix); });
  if (transient) {
    return PublishDecision{.qos = QoS::ExactlyOnce, .retain = false};
  }
  return PublishDecision{.qos = QoS::AtLeastOnce, .retain = true};
}

PublishDecision resolve_publish_decision(std::string_view parameter) {
  static const PublishPolicy default_policy{};
  return default_policy.decide(parameter);
}

} // namespace ccujack
