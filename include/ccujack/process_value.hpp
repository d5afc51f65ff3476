// include/ccujack/process_value.hpp
#pragma once

#include <chrono>
#include <cstdint>

#include <nlohmann/json.hpp>

namespace ccujack {

/**
 * @brief Quality tag of a process value.
 *
 * The numeric code is carried verbatim on the wire ("s" field). The named
 * enumerators are the canonical codes; any other code is classified by
 * status_class().
 */
enum class Status : int32_t { Good = 0, Uncertain = 100, Bad = 200 };

[[nodiscard]] constexpr Status status_class(Status status) {
  auto code = static_cast<int32_t>(status);
  if (code >= 0 && code < 100)
    return Status::Good;
  if (code >= 100 && code < 200)
    return Status::Uncertain;
  return Status::Bad;
}

/**
 * @brief A timestamped, typed value with an associated status.
 *
 * value holds null, boolean, number or string for controller values.
 * Client supplied payloads may also yield arrays or objects (see decode_pv).
 */
struct ProcessValue {
  std::chrono::system_clock::time_point timestamp{std::chrono::system_clock::now()};
  nlohmann::json value{};
  Status status{Status::Good};
};

} // namespace ccujack
