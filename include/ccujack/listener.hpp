// include/ccujack/listener.hpp
#pragma once

#include "broker.hpp"
#include "error.hpp"
#include "logging.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <expected>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <thread>
#include <utility>
#include <vector>

#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/ssl/context.hpp>

namespace ccujack {

enum class Transport { Plain, Tls };

/**
 * @brief Listener lifecycle.
 *
 * Created → Starting → Running → Stopping → Stopped, with Failed reachable
 * from Starting (certificate, resolve or bind failure) and from Running
 * (fatal accept error).
 */
enum class ListenerState { Created, Starting, Running, Stopping, Stopped, Failed };

[[nodiscard]] std::string_view to_string(ListenerState state);

/**
 * @brief Receives terminal listener failures (ListenerBind, CertificateLoad).
 *
 * Invoked once per failure on the failing listener's thread. The callback must
 * not block; hand the error off to a queue if it needs processing.
 */
using ServeErrorCallback = std::function<void(const Error&)>;

namespace detail {
class SessionBase;
struct ExecutorGuard;
} // namespace detail

/**
 * @brief One MQTT network listener (plain TCP or TLS) serving the broker.
 *
 * Each listener runs on its own thread with its own io_context. All client
 * sessions accepted by the listener live on that thread.
 *
 * @par Example Usage
 * @code
 * ccujack::Listener listener({.bind_address = ":8883",
 *                             .transport = ccujack::Transport::Tls,
 *                             .cert_file = "certs/server.crt",
 *                             .key_file = "certs/server.key"},
 *                            broker);
 * listener.start();  // returns immediately
 * ...
 * listener.request_stop();
 * listener.join();
 * @endcode
 */
class Listener {
public:
  struct Config {
    std::string bind_address; ///< "host:port", ":port" (all interfaces) or "[v6addr]:port"
    Transport transport = Transport::Plain;
    std::string cert_file;                ///< PEM certificate chain (TLS only)
    std::string key_file;                 ///< PEM private key (TLS only)
    size_t max_packet_size = 1024 * 1024; ///< Larger packets close the connection
    std::chrono::seconds connect_timeout{10}; ///< Time allowed between accept and CONNECT
    ServeErrorCallback serve_error{};         ///< Optional terminal failure callback
    LogCallback log_callback{};               ///< Optional callback for log messages
  };

  Listener(Config config, Broker& broker);
  ~Listener();

  Listener(const Listener&) = delete;
  Listener& operator=(const Listener&) = delete;

  /**
   * @brief Spawns the listener thread. Does not wait for the bind.
   */
  void start();

  /**
   * @brief Closes the acceptor and all client connections. Does not block.
   */
  void request_stop();

  /**
   * @brief Blocks until the listener thread has exited.
   */
  void join();

  [[nodiscard]] ListenerState state() const noexcept {
    return state_.load();
  }

  /**
   * @brief Port actually bound (differs from the configured one for port 0).
   *
   * @return 0 until the listener is Running
   */
  [[nodiscard]] uint16_t local_port() const noexcept {
    return port_.load();
  }

  [[nodiscard]] const Config& config() const noexcept {
    return config_;
  }

private:
  Config config_;
  Broker& broker_;

  std::unique_ptr<boost::asio::ssl::context> ssl_context_;
  boost::asio::io_context io_;
  boost::asio::ip::tcp::acceptor acceptor_;
  std::shared_ptr<detail::ExecutorGuard> guard_;
  std::vector<std::weak_ptr<detail::SessionBase>> sessions_; // io thread only
  std::optional<Error> failure_;                              // io thread only

  std::atomic<ListenerState> state_{ListenerState::Created};
  std::atomic<bool> stop_requested_{false};
  std::atomic<uint16_t> port_{0};
  std::thread thread_;

  void run();
  [[nodiscard]] std::expected<void, Error> load_certificate();
  [[nodiscard]] std::expected<void, Error> bind();
  void do_accept();
  void accept_session(boost::asio::ip::tcp::socket socket);
  void close_all();
  void report(const Error& error);

  void log(LogLevel level, std::string_view message) const;
};

/**
 * @brief Owns the configured listeners and their shared stop barrier.
 *
 * A failure of one listener never affects the others. stop() returns only
 * after every listener thread has exited, however it exited.
 */
class ListenerManager {
public:
  explicit ListenerManager(Broker& broker);
  ~ListenerManager();

  ListenerManager(const ListenerManager&) = delete;
  ListenerManager& operator=(const ListenerManager&) = delete;

  /**
   * @brief Creates and starts one listener per config. Non-blocking.
   */
  void start(std::vector<Listener::Config> configs);

  /**
   * @brief Stops all listeners and blocks until every listener thread exited.
   */
  void stop();

  [[nodiscard]] const std::vector<std::unique_ptr<Listener>>& listeners() const noexcept {
    return listeners_;
  }

private:
  Broker& broker_;
  std::vector<std::unique_ptr<Listener>> listeners_;
};

/**
 * @brief Splits a bind address into host and port.
 *
 * @return {host, port}; host is empty for ":port". ErrorKind::ListenerBind if
 *         the port is missing or not numeric.
 */
[[nodiscard]] std::expected<std::pair<std::string, std::string>, Error>
split_bind_address(std::string_view address);

} // namespace ccujack
