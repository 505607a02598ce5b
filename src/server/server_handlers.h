#ifndef SERVER_HANDLERS_H
#define SERVER_HANDLERS_H

#include "server_client_state.h"
#include "server_session.h"
#include "shared_audit_sink.h"
#include "shared_common_crypto.h"
#include "shared_net_common_protocol.h"
#include "shared_net_frame_io.h"
#include "shared_net_username_util.h"

#include <deque>
#include <iostream>
#include <memory>
#include <string>
#include <variant>
#include <vector>

struct RouterOptions {
  size_t read_buffer_size = DEFAULT_READ_BUFFER_SIZE;
  size_t max_envelope_bytes = DEFAULT_MAX_ENVELOPE_BYTES;
};

// Per-connection state machine: authenticate, then forward opaque payloads
// until the peer leaves. The relay never looks inside payloads.
class RelayRouter {
public:
  RelayRouter(SessionDirectory &dir, AuditSink &audit,
              RouterOptions opts = {})
      : dir_(dir), audit_(audit), opts_(opts) {}

  // Runs on the connection's own thread until the connection ends.
  void serve(const std::shared_ptr<ClientState> &client) {
    StreamFramer framer(opts_.max_envelope_bytes);
    std::vector<char> scratch(opts_.read_buffer_size);
    std::deque<DecodeResult> pending;

    if (!fill(*client, framer, scratch, pending)) {
      client->close();
      return;
    }

    DecodeResult first = std::move(pending.front());
    pending.pop_front();
    if (!authenticate(client, first)) {
      client->close();
      return;
    }

    std::string end_reason = "connection closed";
    for (;;) {
      if (pending.empty() && !fill(*client, framer, scratch, pending))
        break;

      DecodeResult next = std::move(pending.front());
      pending.pop_front();
      if (!route(client, next)) {
        end_reason = "client disconnected";
        break;
      }
    }

    finish(client, end_reason);
  }

  // Relay shutdown: tell every session, then cut it loose.
  void disconnect_all(std::string_view reason) {
    const std::string frame = frame_envelope(build_disconnect(reason));
    dir_.exclusive([&](SessionDirectory::Locked &l) {
      for (const auto &e : l.entries()) {
        if (!e.handle->send_frame(frame))
          dev_println("disconnect notice to " + e.identity + " failed");
        e.handle->close();
      }
    });
  }

private:
  bool fill(ClientState &client, StreamFramer &framer,
            std::vector<char> &scratch, std::deque<DecodeResult> &pending) {
    std::vector<DecodeResult> batch;
    while (batch.empty()) {
      const std::error_code ec =
          read_envelopes(*client.transport, framer, scratch, batch);
      if (ec == std::errc::message_size) {
        std::cerr << "[" << get_current_timestamp_ms() << "] "
                  << client.label() << ": envelope exceeds "
                  << opts_.max_envelope_bytes << " bytes, closing\n";
        audit_.suspicious(client.label(), "oversized envelope");
        return false;
      }
      if (ec) {
        if (ec != asio::error::eof)
          dev_println(client.label() + ": read failed: " + ec.message());
        for (auto &d : batch)
          pending.push_back(std::move(d));
        return !pending.empty();
      }
    }
    for (auto &d : batch)
      pending.push_back(std::move(d));
    return true;
  }

  void reject(const std::shared_ptr<ClientState> &client,
              std::string_view identity, const std::string &reason) {
    std::cerr << "[" << get_current_timestamp_ms() << "] REJECTED "
              << client->remote_address << ": " << reason << "\n";
    audit_.auth_failure(identity.empty() ? "unknown" : identity,
                        client->remote_address, reason);
    if (!client->send_frame(frame_envelope(build_auth_rejected(reason))))
      dev_println("rejection to " + client->remote_address + " not delivered");
  }

  bool authenticate(const std::shared_ptr<ClientState> &client,
                    const DecodeResult &first) {
    if (const auto *err = std::get_if<ParseError>(&first)) {
      reject(client, {},
             *err == ParseError::UnknownType ? "Unknown message type"
                                             : "Invalid authentication format");
      return false;
    }

    const Envelope &env = std::get<Envelope>(first);
    if (env.type != MsgType::Auth || env.fields.size() != 2) {
      reject(client, {}, "Invalid authentication format");
      return false;
    }

    const std::string identity = trim(env.field(0));
    if (!is_valid_username(identity)) {
      reject(client, identity, "Invalid username");
      return false;
    }

    auto key = import_public(env.field(1));
    if (std::holds_alternative<CryptoError>(key)) {
      reject(client, identity, "Invalid public key");
      return false;
    }
    PublicKey public_key = std::get<PublicKey>(std::move(key));
    const std::string fp = fingerprint_hex(public_key.pem);
    const std::string key_pem = public_key.pem;

    enum class Outcome { Registered, Taken, Dropped };

    const Outcome outcome = dir_.exclusive([&](SessionDirectory::Locked &l) {
      if (l.try_register(identity, client, std::move(public_key),
                         client->remote_address) ==
          RegisterResult::AlreadyTaken)
        return Outcome::Taken;

      client->username = identity;
      client->fingerprint_hex = fp;

      std::vector<std::shared_ptr<ClientState>> failed;
      if (!client->send_frame(frame_envelope(build_auth_success())))
        failed.push_back(client);

      send_user_list(l, failed);

      for (const auto &[peer, pem] : l.public_keys_excluding(identity)) {
        if (!client->send_frame(
                frame_envelope(build_key_exchange(peer, pem)))) {
          failed.push_back(client);
          break;
        }
        audit_.key_exchange(peer, identity);
      }

      const std::string announce =
          frame_envelope(build_key_exchange(identity, key_pem));
      for (const auto &e : l.entries()) {
        if (e.identity != identity && !e.handle->send_frame(announce))
          failed.push_back(e.handle);
      }

      drop_failed(l, failed);
      // The acknowledgment itself may have failed.
      const DirectoryEntry *self = l.find(identity);
      return self != nullptr && self->handle == client ? Outcome::Registered
                                                       : Outcome::Dropped;
    });

    if (outcome == Outcome::Taken) {
      reject(client, identity, "Username '" + identity + "' already taken");
      return false;
    }
    if (outcome == Outcome::Dropped) {
      std::cerr << "[" << get_current_timestamp_ms() << "] " << identity
                << " from " << client->remote_address
                << " dropped during registration: send failed\n";
      return false;
    }

    std::cerr << "[" << get_current_timestamp_ms() << "] connect " << identity
              << " from " << client->remote_address
              << " fingerprint=" << fp.substr(0, 16) << "\n";
    audit_.auth_success(identity, client->remote_address);
    return true;
  }

  // Returns false when the client asked to leave.
  bool route(const std::shared_ptr<ClientState> &client,
             const DecodeResult &d) {
    const std::string &sender = client->username;

    if (const auto *err = std::get_if<ParseError>(&d)) {
      std::cerr << "[" << get_current_timestamp_ms() << "] " << sender
                << ": dropped envelope: " << parse_error_str(*err) << "\n";
      audit_.suspicious(sender, std::string("malformed envelope: ") +
                                    std::string(parse_error_str(*err)));
      return true;
    }

    const Envelope &env = std::get<Envelope>(d);
    switch (env.type) {
    case MsgType::Message:
      forward_message(client, env.field(0), env.field(1));
      return true;
    case MsgType::Broadcast:
      if (env.fields.size() != 1) {
        audit_.suspicious(sender, "malformed BROADCAST");
        return true;
      }
      forward_broadcast(client, env.field(0));
      return true;
    case MsgType::Disconnect:
      return false;
    case MsgType::Auth:
      audit_.suspicious(sender, "repeated AUTH after authentication");
      return true;
    case MsgType::KeyExchange:
    case MsgType::UserList:
      audit_.suspicious(sender, std::string("client sent relay-only ") +
                                    std::string(msg_type_str(env.type)));
      return true;
    }
    return true;
  }

  void forward_message(const std::shared_ptr<ClientState> &client,
                       const std::string &recipient,
                       const std::string &payload) {
    const std::string &sender = client->username;
    std::string frame;
    try {
      frame = frame_envelope(build_message(sender, payload));
    } catch (const std::runtime_error &e) {
      audit_.suspicious(sender, std::string("unforwardable MESSAGE: ") +
                                    e.what());
      return;
    }

    dir_.exclusive([&](SessionDirectory::Locked &l) {
      const DirectoryEntry *target = l.find(recipient);
      if (target == nullptr) {
        dev_println("MESSAGE " + sender + " -> " + recipient +
                    " dropped: recipient not connected");
        return;
      }
      std::vector<std::shared_ptr<ClientState>> failed;
      if (!target->handle->send_frame(frame)) {
        std::cerr << "[" << get_current_timestamp_ms() << "] forward "
                  << sender << " -> " << recipient << " FAILED\n";
        failed.push_back(target->handle);
      } else {
        audit_.message_routed(sender, recipient);
      }
      drop_failed(l, failed);
    });
  }

  void forward_broadcast(const std::shared_ptr<ClientState> &client,
                         const std::string &payload) {
    const std::string &sender = client->username;
    std::string frame;
    try {
      frame = frame_envelope(build_broadcast_from(sender, payload));
    } catch (const std::runtime_error &e) {
      audit_.suspicious(sender, std::string("unforwardable BROADCAST: ") +
                                    e.what());
      return;
    }

    dir_.exclusive([&](SessionDirectory::Locked &l) {
      std::vector<std::shared_ptr<ClientState>> failed;
      for (const auto &e : l.entries()) {
        if (e.identity == sender)
          continue;
        if (!e.handle->send_frame(frame)) {
          std::cerr << "[" << get_current_timestamp_ms() << "] broadcast "
                    << sender << " -> " << e.identity << " FAILED\n";
          failed.push_back(e.handle);
        }
      }
      audit_.message_routed(sender, BROADCAST_TARGET);
      drop_failed(l, failed);
    });
  }

  void send_user_list(SessionDirectory::Locked &l,
                      std::vector<std::shared_ptr<ClientState>> &failed) {
    const std::string frame = frame_envelope(build_user_list(l.identities()));
    for (const auto &e : l.entries()) {
      if (!e.handle->send_frame(frame))
        failed.push_back(e.handle);
    }
  }

  // Removes unreachable sessions; each removal round announces the shrunken
  // membership, which can in turn expose more unreachable sessions.
  void drop_failed(SessionDirectory::Locked &l,
                   std::vector<std::shared_ptr<ClientState>> failed) {
    while (!failed.empty()) {
      bool removed = false;
      for (const auto &h : failed) {
        if (l.remove_session(h->username, h.get())) {
          std::cerr << "[" << get_current_timestamp_ms() << "] removed "
                    << h->username << ": send failed\n";
          removed = true;
        }
        h->close();
      }
      failed.clear();
      if (removed)
        send_user_list(l, failed);
    }
  }

  void finish(const std::shared_ptr<ClientState> &client,
              const std::string &reason) {
    dir_.exclusive([&](SessionDirectory::Locked &l) {
      if (!l.remove_session(client->username, client.get()))
        return;
      std::vector<std::shared_ptr<ClientState>> failed;
      send_user_list(l, failed);
      drop_failed(l, failed);
    });
    client->close();
    std::cerr << "[" << get_current_timestamp_ms() << "] DISCONNECT "
              << client->username << " (" << reason << ")\n";
  }

  SessionDirectory &dir_;
  AuditSink &audit_;
  RouterOptions opts_;
};

#endif
