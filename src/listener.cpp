// src/listener.cpp
#include "ccujack/listener.hpp"

#include "session.hpp"

#include <algorithm>
#include <exception>
#include <format>
#include <utility>

#include <boost/asio/post.hpp>
#include <boost/system/system_error.hpp>

namespace ccujack {

std::string_view to_string(ListenerState state) {
  switch (state) {
  case ListenerState::Created:
    return "Created";
  case ListenerState::Starting:
    return "Starting";
  case ListenerState::Running:
    return "Running";
  case ListenerState::Stopping:
    return "Stopping";
  case ListenerState::Stopped:
    return "Stopped";
  case ListenerState::Failed:
    return "Failed";
  }
  std::unreachable();
}

std::expected<std::pair<std::string, std::string>, Error>
split_bind_address(std::string_view address) {
  std::string_view host;
  std::string_view port;

  if (address.starts_with('[')) {
    auto close = address.find(']');
    if (close == std::string_view::npos || close + 1 >= address.size() ||
        address[close + 1] != ':') {
      return std::unexpected(
          Error(ErrorKind::ListenerBind, std::format("Invalid bind address: {}", address)));
    }
    host = address.substr(1, close - 1);
    port = address.substr(close + 2);
  } else {
    auto colon = address.rfind(':');
    if (colon == std::string_view::npos) {
      return std::unexpected(
          Error(ErrorKind::ListenerBind, std::format("Missing port in address: {}", address)));
    }
    host = address.substr(0, colon);
    port = address.substr(colon + 1);
  }

  bool numeric = !port.empty() && port.size() <= 5 &&
                 std::ranges::all_of(port, [](char c) { return c >= '0' && c <= '9'; });
  if (!numeric || std::stoul(std::string(port)) > 65535) {
    return std::unexpected(
        Error(ErrorKind::ListenerBind, std::format("Invalid port in address: {}", address)));
  }
  return std::pair{std::string(host), std::string(port)};
}

Listener::Listener(Config config, Broker& broker)
    : config_(std::move(config)), broker_(broker), acceptor_(io_),
      guard_(std::make_shared<detail::ExecutorGuard>()) {
}

Listener::~Listener() {
  request_stop();
  join();
}

void Listener::log(LogLevel level, std::string_view message) const {
  if (config_.log_callback) {
    config_.log_callback(level, message);
  }
}

void Listener::start() {
  if (thread_.joinable()) {
    return;
  }
  state_ = ListenerState::Starting;
  thread_ = std::thread([this]() { run(); });
}

void Listener::request_stop() {
  if (stop_requested_.exchange(true)) {
    return;
  }
  auto running = ListenerState::Running;
  state_.compare_exchange_strong(running, ListenerState::Stopping);

  // Never runs if the listener failed before serving
  boost::asio::post(io_, [this]() {
    close_all();
    io_.stop();
  });
}

void Listener::join() {
  if (thread_.joinable()) {
    thread_.join();
  }
}

void Listener::report(const Error& error) {
  log(LogLevel::ERROR, describe(error));
  if (!config_.serve_error) {
    return;
  }
  try {
    config_.serve_error(error);
  } catch (const std::exception& e) {
    log(LogLevel::ERROR, std::format("Serve error callback failed: {}", e.what()));
  }
}

std::expected<void, Error> Listener::load_certificate() {
  namespace ssl = boost::asio::ssl;

  boost::system::error_code ec;
  try {
    ssl_context_ = std::make_unique<ssl::context>(ssl::context::tls_server);
  } catch (const boost::system::system_error& e) {
    return std::unexpected(Error(ErrorKind::CertificateLoad,
                                 std::format("Creating TLS context failed: {}", e.what())));
  }
  ssl_context_->set_options(ssl::context::default_workarounds | ssl::context::no_sslv2 |
                                ssl::context::no_sslv3 | ssl::context::single_dh_use,
                            ec);
  if (ec) {
    return std::unexpected(
        Error(ErrorKind::CertificateLoad,
              std::format("Configuring TLS context failed: {}", ec.message())));
  }

  ssl_context_->use_certificate_chain_file(config_.cert_file, ec);
  if (ec) {
    return std::unexpected(Error(ErrorKind::CertificateLoad,
                                 std::format("Loading certificate {} failed: {}",
                                             config_.cert_file, ec.message())));
  }
  ssl_context_->use_private_key_file(config_.key_file, ssl::context::pem, ec);
  if (ec) {
    return std::unexpected(Error(ErrorKind::CertificateLoad,
                                 std::format("Loading private key {} failed: {}",
                                             config_.key_file, ec.message())));
  }
  return {};
}

std::expected<void, Error> Listener::bind() {
  using boost::asio::ip::tcp;

  auto address = split_bind_address(config_.bind_address);
  if (!address) {
    return std::unexpected(address.error());
  }
  const auto& [host, port] = *address;

  auto fail = [&](std::string_view what, const boost::system::error_code& ec) {
    return std::unexpected(Error(ErrorKind::ListenerBind,
                                 std::format("{} {} failed: {}", what, config_.bind_address,
                                             ec.message())));
  };

  boost::system::error_code ec;
  tcp::resolver resolver(io_);
  auto results =
      resolver.resolve(host.empty() ? std::string("0.0.0.0") : host, port,
                       tcp::resolver::passive | tcp::resolver::numeric_service, ec);
  if (ec || results.empty()) {
    return fail("Resolving", ec);
  }
  tcp::endpoint endpoint = *results.begin();

  acceptor_.open(endpoint.protocol(), ec);
  if (ec) {
    return fail("Opening", ec);
  }
  acceptor_.set_option(tcp::acceptor::reuse_address(true), ec);
  acceptor_.bind(endpoint, ec);
  if (ec) {
    return fail("Binding", ec);
  }
  acceptor_.listen(boost::asio::socket_base::max_listen_connections, ec);
  if (ec) {
    return fail("Listening on", ec);
  }

  port_ = acceptor_.local_endpoint(ec).port();
  return {};
}

void Listener::run() {
  auto kind = config_.transport == Transport::Tls ? "Secure MQTT" : "MQTT";
  log(LogLevel::INFO,
      std::format("Starting {} listener on address {}", kind, config_.bind_address));

  auto prepared = [&]() -> std::expected<void, Error> {
    if (config_.transport == Transport::Tls) {
      auto loaded = load_certificate();
      if (!loaded) {
        return loaded;
      }
    }
    return bind();
  }();

  if (!prepared) {
    {
      std::lock_guard<std::mutex> lock(guard_->mutex);
      guard_->alive = false;
    }
    state_ = ListenerState::Failed;
    report(prepared.error());
    return;
  }

  auto starting = ListenerState::Starting;
  state_.compare_exchange_strong(starting, ListenerState::Running);
  do_accept();

  try {
    io_.run();
  } catch (const std::exception& e) {
    failure_ = Error(ErrorKind::ListenerBind, std::format("Serving failed: {}", e.what()));
    close_all();
  }

  {
    std::lock_guard<std::mutex> lock(guard_->mutex);
    guard_->alive = false;
  }

  if (failure_) {
    state_ = ListenerState::Failed;
    report(*failure_);
  } else {
    state_ = ListenerState::Stopped;
    log(LogLevel::INFO,
        std::format("{} listener on address {} stopped", kind, config_.bind_address));
  }
}

void Listener::do_accept() {
  acceptor_.async_accept([this](const boost::system::error_code& ec,
                                boost::asio::ip::tcp::socket socket) {
    if (ec == boost::asio::error::operation_aborted || stop_requested_) {
      return;
    }
    if (ec == boost::asio::error::connection_aborted) {
      log(LogLevel::WARN, std::format("Accept failed: {}", ec.message()));
      do_accept();
      return;
    }
    if (ec) {
      failure_ = Error(ErrorKind::ListenerBind, std::format("Accepting on {} failed: {}",
                                                            config_.bind_address, ec.message()));
      close_all();
      io_.stop();
      return;
    }

    accept_session(std::move(socket));
    do_accept();
  });
}

void Listener::accept_session(boost::asio::ip::tcp::socket socket) {
  detail::SessionOptions options{.max_packet_size = config_.max_packet_size,
                                 .connect_timeout = config_.connect_timeout,
                                 .log_callback = config_.log_callback};

  boost::system::error_code ec;
  auto remote = socket.remote_endpoint(ec);
  if (!ec) {
    log(LogLevel::DEBUG, std::format("Accepted connection from {}:{}",
                                     remote.address().to_string(), remote.port()));
  }

  std::shared_ptr<detail::SessionBase> session;
  if (config_.transport == Transport::Tls) {
    session = std::make_shared<detail::TlsSession>(broker_, std::move(options), guard_,
                                                   std::move(socket), *ssl_context_);
  } else {
    session = std::make_shared<detail::PlainSession>(broker_, std::move(options), guard_,
                                                     std::move(socket));
  }

  std::erase_if(sessions_, [](const auto& weak) { return weak.expired(); });
  sessions_.push_back(session);
  session->start();
}

void Listener::close_all() {
  boost::system::error_code ec;
  acceptor_.close(ec);
  for (const auto& weak : sessions_) {
    if (auto session = weak.lock()) {
      session->close_now(false);
    }
  }
  sessions_.clear();
}

ListenerManager::ListenerManager(Broker& broker) : broker_(broker) {
}

ListenerManager::~ListenerManager() {
  stop();
}

void ListenerManager::start(std::vector<Listener::Config> configs) {
  for (auto& config : configs) {
    auto& listener =
        listeners_.emplace_back(std::make_unique<Listener>(std::move(config), broker_));
    listener->start();
  }
}

void ListenerManager::stop() {
  for (auto& listener : listeners_) {
    listener->request_stop();
  }
  for (auto& listener : listeners_) {
    listener->join();
  }
  listeners_.clear();
}

} // namespace ccujack
