// include/ccujack/error.hpp
#pragma once

#include <cstdint>
#include <format>
#include <string>
#include <string_view>
#include <utility>

namespace ccujack {

/**
 * @brief Classifies failures reported through std::expected.
 */
enum class ErrorKind : uint8_t {
  AddressFormat,   ///< Malformed device address (missing or repeated ':')
  Publish,         ///< Invalid topic, invalid QoS or broker not running
  Encoding,        ///< Value not representable in the wire schema
  ListenerBind,    ///< Address resolution, bind or accept loop failure
  CertificateLoad, ///< TLS certificate or private key could not be loaded
  AlreadyRunning,  ///< start() called twice
  Protocol         ///< Malformed MQTT control packet
};

struct Error {
  ErrorKind kind;
  std::string message;

  Error(ErrorKind k, std::string msg) : kind(k), message(std::move(msg)) {
  }
};

[[nodiscard]] constexpr std::string_view to_string(ErrorKind kind) {
  switch (kind) {
  case ErrorKind::AddressFormat:
    return "AddressFormatError";
  case ErrorKind::Publish:
    return "PublishError";
  case ErrorKind::Encoding:
    return "EncodingError";
  case ErrorKind::ListenerBind:
    return "ListenerBindError";
  case ErrorKind::CertificateLoad:
    return "CertificateLoadError";
  case ErrorKind::AlreadyRunning:
    return "AlreadyRunning";
  case ErrorKind::Protocol:
    return "ProtocolError";
  }
  std::unreachable();
}

// "PublishError: Invalid QoS: 3"
[[nodiscard]] inline std::string describe(const Error& error) {
  return std::format("{}: {}", to_string(error.kind), error.message);
}

} // namespace ccujack
