// include/ccujack/wire_codec.hpp
#pragma once

#include "error.hpp"
#include "process_value.hpp"

#include <expected>
#include <string>
#include <string_view>

namespace ccujack {

/**
 * @brief Converts an MQTT payload into a process value. Never fails.
 *
 * Tiers are tried in order, each only if the previous one does not apply:
 * 1. Strict wire message: a JSON object with no keys besides "ts", "v" and
 *    "s", "ts"/"s" integral, and nothing but whitespace after the object.
 * 2. Any JSON value: becomes the value, with default timestamp and status.
 * 3. Raw payload: the bytes verbatim as a string value.
 *
 * The timestamp is taken from "ts" when tier 1 applied and "ts" is non-zero
 * and within the range of std::chrono::system_clock, otherwise it is the time
 * of the call. Status is Good unless tier 1 supplied
 * an "s" code.
 *
 * @par Example Usage
 * @code
 * auto pv = ccujack::decode_pv(R"({"v":123.456,"ts":1483228800000,"s":0})");
 * auto pv2 = ccujack::decode_pv("true");     // value true
 * auto pv3 = ccujack::decode_pv("on please"); // value "on please"
 * @endcode
 */
[[nodiscard]] ProcessValue decode_pv(std::string_view payload);

/**
 * @brief Converts a process value into the wire schema {"v":...,"ts":...,"s":...}.
 *
 * The timestamp is truncated to milliseconds since the Unix epoch.
 *
 * @return JSON text, or ErrorKind::Encoding if the value is an array or object,
 *         a non-finite number, or a string that is not valid UTF-8.
 */
[[nodiscard]] std::expected<std::string, Error> encode_pv(const ProcessValue& pv);

} // namespace ccujack
