#ifndef SERVER_CONNECTION_H
#define SERVER_CONNECTION_H

#include "server_client_state.h"
#include "server_handlers.h"
#include "server_session.h"
#include "shared_audit_sink.h"
#include "shared_config.h"
#include "shared_net_frame_io.h"
#include "shared_net_socket_util.h"

#include <asio.hpp>

#include <algorithm>
#include <atomic>
#include <iostream>
#include <list>
#include <memory>
#include <mutex>
#include <system_error>
#include <thread>

// Accept loop with one thread per connection.
class RelayServer {
public:
  RelayServer(RelayConfig cfg, AuditSink &audit)
      : cfg_(std::move(cfg)), audit_(audit),
        router_(directory_, audit_,
                RouterOptions{cfg_.read_buffer_size, cfg_.max_envelope_bytes}) {}

  ~RelayServer() { stop(); }

  RelayServer(const RelayServer &) = delete;
  RelayServer &operator=(const RelayServer &) = delete;

  // Binds and starts accepting. Throws std::system_error when the address
  // cannot be bound.
  void start() {
    std::error_code ec;
    acceptor_ = make_listen_socket_asio(*io_, cfg_.host, cfg_.port,
                                        cfg_.max_connections, &ec);
    if (!acceptor_)
      throw std::system_error(ec, "bind " + cfg_.host + ":" +
                                      std::to_string(cfg_.port));

    running_ = true;
    std::cerr << "[" << get_current_timestamp_ms() << "] relay listening on "
              << cfg_.host << ":" << port() << "\n";
    accept_thread_ = std::thread([this] { accept_loop(); });
  }

  [[nodiscard]] unsigned short port() const {
    std::error_code ec;
    const auto ep = acceptor_->local_endpoint(ec);
    return ec ? 0 : ep.port();
  }

  void stop() {
    if (!running_.exchange(false))
      return;

    std::error_code ec;
    // A blocked accept() returns once the listening socket is shut down.
    ::shutdown(acceptor_->native_handle(), SHUT_RDWR);
    if (accept_thread_.joinable())
      accept_thread_.join();
    acceptor_->close(ec);

    router_.disconnect_all("Server shutting down");

    std::list<std::thread> threads;
    {
      std::lock_guard<std::mutex> lk(conn_mtx_);
      for (auto &c : connections_)
        if (auto client = c.client.lock())
          client->close();
      for (auto &c : connections_)
        threads.push_back(std::move(c.thread));
      connections_.clear();
    }
    for (auto &t : threads)
      if (t.joinable())
        t.join();

    std::cerr << "[" << get_current_timestamp_ms() << "] relay stopped\n";
  }

  [[nodiscard]] SessionDirectory &directory() noexcept { return directory_; }

private:
  struct Connection {
    std::weak_ptr<ClientState> client;
    std::thread thread;
    std::shared_ptr<std::atomic_bool> done;
  };

  void accept_loop() {
    while (running_) {
      auto sock = std::make_unique<asio::ip::tcp::socket>(*io_);
      std::error_code ec;
      acceptor_->accept(*sock, ec);
      if (ec) {
        if (!running_)
          break;
        std::cerr << "[" << get_current_timestamp_ms()
                  << "] accept failed: " << ec.message() << "\n";
        continue;
      }
      set_cloexec(static_cast<int>(sock->native_handle()));

      auto client = std::make_shared<ClientState>(
          std::make_shared<AsioTransport>(io_, std::move(sock)));
      dev_println("accepted " + client->remote_address);

      std::lock_guard<std::mutex> lk(conn_mtx_);
      reap_finished();
      auto done = std::make_shared<std::atomic_bool>(false);
      connections_.push_back(Connection{
          client, std::thread([this, client, done] {
            try {
              router_.serve(client);
            } catch (const std::exception &e) {
              std::cerr << "[" << get_current_timestamp_ms() << "] "
                        << client->label() << ": " << e.what() << "\n";
              client->close();
            }
            done->store(true);
          }),
          done});
    }
  }

  // Caller holds conn_mtx_.
  void reap_finished() {
    for (auto it = connections_.begin(); it != connections_.end();) {
      if (it->done->load()) {
        if (it->thread.joinable())
          it->thread.join();
        it = connections_.erase(it);
      } else {
        ++it;
      }
    }
  }

  RelayConfig cfg_;
  AuditSink &audit_;
  std::shared_ptr<asio::io_context> io_ = std::make_shared<asio::io_context>();
  SessionDirectory directory_;
  RelayRouter router_;
  std::shared_ptr<asio::ip::tcp::acceptor> acceptor_;
  std::atomic_bool running_{false};
  std::thread accept_thread_;
  std::mutex conn_mtx_;
  std::list<Connection> connections_;
};

#endif
