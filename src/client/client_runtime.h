#ifndef CLIENT_RUNTIME_H
#define CLIENT_RUNTIME_H

#include <array>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

enum class SessionState : uint8_t {
  Disconnected,
  Authenticating,
  Authenticated,
  Active,
  Closed
};

[[nodiscard]] inline constexpr std::string_view
session_state_str(SessionState s) noexcept {
  constexpr std::array<std::string_view, 5> names = {
      "disconnected", "authenticating", "authenticated", "active", "closed"};
  return names[static_cast<size_t>(s)];
}

enum class SendResult : uint8_t {
  Sent,
  NotActive,
  NoKeyForPeer,
  InvalidRecipient,
  TransportError
};

[[nodiscard]] inline constexpr std::string_view
send_result_str(SendResult r) noexcept {
  constexpr std::array<std::string_view, 5> msgs = {
      "sent", "not connected", "no public key for recipient",
      "invalid recipient", "transport error"};
  return msgs[static_cast<size_t>(r)];
}

// Presentation callbacks. Called from the session's receive thread, or from
// the caller's thread inside connect() and disconnect().
class SessionObserver {
public:
  virtual ~SessionObserver() = default;

  virtual void on_message(const std::string &sender,
                          const std::string &plaintext) = 0;
  virtual void on_directory_changed(const std::vector<std::string> &ids) = 0;
  virtual void on_connection_state(bool is_connected,
                                   const std::string &reason) = 0;
  virtual void on_error(const std::string &message) = 0;
};

#endif
