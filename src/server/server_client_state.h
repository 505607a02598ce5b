#ifndef SERVER_CLIENT_STATE_H
#define SERVER_CLIENT_STATE_H

#include "shared_net_frame_io.h"

#include <atomic>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>

struct ClientState {
  std::shared_ptr<Transport> transport{};
  std::string username{};
  std::string fingerprint_hex{};
  std::string remote_address{};
  std::mutex write_mtx{};
  std::atomic_bool closed{false};

  explicit ClientState(std::shared_ptr<Transport> t)
      : transport(std::move(t)),
        remote_address(transport ? transport->remote_address() : "unknown") {}

  ClientState(const ClientState &) = delete;
  ClientState &operator=(const ClientState &) = delete;

  // Writes one already-framed envelope; writes never interleave.
  [[nodiscard]] bool send_frame(std::string_view frame) {
    if (closed.load())
      return false;
    std::lock_guard<std::mutex> lk(write_mtx);
    return !transport->write_all(frame);
  }

  // Unblocks the connection thread's pending read.
  void close() noexcept {
    if (!closed.exchange(true))
      transport->shutdown();
  }

  [[nodiscard]] std::string label() const {
    return username.empty() ? remote_address : username;
  }
};

#endif
