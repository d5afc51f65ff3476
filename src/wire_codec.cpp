// src/wire_codec.cpp
#include "ccujack/wire_codec.hpp"

#include <array>
#include <chrono>
#include <cmath>
#include <cstdint>
#include <format>
#include <limits>
#include <optional>
#include <utility>
#include <variant>

namespace ccujack {

namespace {

using json = nlohmann::json;
using namespace std::string_view_literals;

constexpr std::array WIRE_KEYS{"ts"sv, "v"sv, "s"sv};

// Result of one decode tier. Tiers either produce a wire message or decline.
struct WireMessage {
  int64_t ts{0};
  json v{};
  int32_t s{0};
};
struct Declined {};
using TierResult = std::variant<WireMessage, Declined>;

bool is_wire_key(std::string_view key) {
  for (auto k : WIRE_KEYS) {
    if (k == key)
      return true;
  }
  return false;
}

bool in_clock_range(int64_t ms) {
  using std::chrono::duration_cast;
  using std::chrono::milliseconds;
  using std::chrono::system_clock;
  return ms >= duration_cast<milliseconds>(system_clock::duration::min()).count() &&
         ms <= duration_cast<milliseconds>(system_clock::duration::max()).count();
}

template <typename Int> std::optional<Int> integral_field(const json& field) {
  if (field.is_null())
    return Int{0};
  if (field.is_number_integer()) {
    if (field.is_number_unsigned()) {
      auto u = field.get<uint64_t>();
      if (u > static_cast<uint64_t>(std::numeric_limits<Int>::max()))
        return std::nullopt;
      return static_cast<Int>(u);
    }
    auto i = field.get<int64_t>();
    if (i < std::numeric_limits<Int>::min() || i > std::numeric_limits<Int>::max())
      return std::nullopt;
    return static_cast<Int>(i);
  }
  return std::nullopt;
}

// Tier 1: strict wire message. `doc` is the whole payload parsed as JSON, so a
// successful parse already guarantees nothing but whitespace trails the object.
TierResult decode_strict(const std::optional<json>& doc) {
  if (!doc || !doc->is_object())
    return Declined{};

  WireMessage w;
  for (const auto& [key, field] : doc->items()) {
    if (!is_wire_key(key))
      return Declined{};
    if (key == "ts") {
      auto ts = integral_field<int64_t>(field);
      if (!ts)
        return Declined{};
      // Timestamps the clock cannot represent count as absent
      w.ts = in_clock_range(*ts) ? *ts : 0;
    } else if (key == "s") {
      auto s = integral_field<int32_t>(field);
      if (!s)
        return Declined{};
      w.s = *s;
    } else {
      w.v = field;
    }
  }
  return w;
}

// Tier 2: any JSON value.
TierResult decode_generic(const std::optional<json>& doc) {
  if (!doc)
    return Declined{};
  return WireMessage{.ts = 0, .v = *doc, .s = 0};
}

// Tier 3: the payload as string, always applies.
TierResult decode_raw(std::string_view payload) {
  return WireMessage{.ts = 0, .v = json(std::string(payload)), .s = 0};
}

std::optional<json> parse_document(std::string_view payload) {
  // allow_exceptions=false: malformed input yields a discarded value
  auto doc = json::parse(payload.begin(), payload.end(), nullptr, false);
  if (doc.is_discarded())
    return std::nullopt;
  return doc;
}

} // namespace

ProcessValue decode_pv(std::string_view payload) {
  auto doc = parse_document(payload);

  TierResult result = decode_strict(doc);
  if (std::holds_alternative<Declined>(result))
    result = decode_generic(doc);
  if (std::holds_alternative<Declined>(result))
    result = decode_raw(payload);

  auto& w = std::get<WireMessage>(result);

  ProcessValue pv;
  if (w.ts != 0) {
    pv.timestamp = std::chrono::system_clock::time_point(std::chrono::milliseconds(w.ts));
  } else {
    pv.timestamp = std::chrono::system_clock::now();
  }
  pv.value = std::move(w.v);
  pv.status = static_cast<Status>(w.s);
  return pv;
}

std::expected<std::string, Error> encode_pv(const ProcessValue& pv) {
  nlohmann::ordered_json w;

  switch (pv.value.type()) {
  case json::value_t::null:
    w["v"] = nullptr;
    break;
  case json::value_t::boolean:
    w["v"] = pv.value.get<bool>();
    break;
  case json::value_t::number_integer:
    w["v"] = pv.value.get<int64_t>();
    break;
  case json::value_t::number_unsigned:
    w["v"] = pv.value.get<uint64_t>();
    break;
  case json::value_t::number_float: {
    auto d = pv.value.get<double>();
    if (!std::isfinite(d)) {
      return std::unexpected(Error(ErrorKind::Encoding, "Unsupported value: non-finite number"));
    }
    w["v"] = d;
    break;
  }
  case json::value_t::string:
    w["v"] = pv.value.get<std::string>();
    break;
  default:
    return std::unexpected(Error(ErrorKind::Encoding,
                                 std::format("Unsupported value type: {}", pv.value.type_name())));
  }

  auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(pv.timestamp.time_since_epoch());
  w["ts"] = static_cast<int64_t>(ms.count());
  w["s"] = static_cast<int32_t>(pv.status);

  try {
    return w.dump();
  } catch (const nlohmann::json::type_error& e) {
    // raised for strings that are not valid UTF-8
    return std::unexpected(Error(ErrorKind::Encoding,
                                 std::format("Conversion of PV to JSON failed: {}", e.what())));
  }
}

} // namespace ccujack
