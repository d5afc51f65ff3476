// include/ccujack/logging.hpp
#pragma once

#include <functional>
#include <string_view>

namespace ccujack {

/**
 * @brief Log severity levels for the library logging callback.
 */
enum class LogLevel {
  DEBUG = 0, ///< Detailed debugging information (e.g. every publication)
  INFO = 1,  ///< Informational messages (listener start/stop)
  WARN = 2,  ///< Warning messages (dropped clients, protocol violations)
  ERROR = 3  ///< Error messages (failed publications, listener failures)
};

/**
 * @brief Callback function type for receiving log messages from the library.
 *
 * Every component takes its own callback through its Config. If no callback
 * is set, logging is silently disabled.
 *
 * @note The callback may be invoked from any thread (listener threads, the
 *       broker delivery worker or the thread feeding controller events).
 * @note Keep callback execution fast; it runs inline on those threads.
 *
 * @par Example Usage
 * @code
 * auto log_callback = [](ccujack::LogLevel level, std::string_view message) {
 *   if (level >= ccujack::LogLevel::WARN) {
 *     std::cerr << "[mqtt] " << message << "\n";
 *   }
 * };
 * @endcode
 */
using LogCallback = std::function<void(LogLevel, std::string_view)>;

[[nodiscard]] constexpr std::string_view to_string(LogLevel level) {
  switch (level) {
  case LogLevel::DEBUG:
    return "DEBUG";
  case LogLevel::INFO:
    return "INFO";
  case LogLevel::WARN:
    return "WARN";
  case LogLevel::ERROR:
    return "ERROR";
  }
  return "UNKNOWN";
}

} // namespace ccujack
