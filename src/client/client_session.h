#ifndef CLIENT_SESSION_H
#define CLIENT_SESSION_H

#include "client_peer_manager.h"
#include "client_runtime.h"
#include "shared_common_crypto.h"
#include "shared_common_util.h"
#include "shared_net_common_protocol.h"
#include "shared_net_frame_io.h"
#include "shared_net_username_util.h"

#include <atomic>
#include <deque>
#include <iostream>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <thread>
#include <variant>
#include <vector>

struct PeerSessionOptions
{
    int    rsa_key_bits       = DEFAULT_RSA_BITS;
    size_t read_buffer_size   = DEFAULT_READ_BUFFER_SIZE;
    size_t max_envelope_bytes = DEFAULT_MAX_ENVELOPE_BYTES;
};

// One authenticated connection to the relay. Single use: once Closed, a new
// PeerSession (with a fresh key pair) is needed to reconnect.
class PeerSession
{
  public:
    PeerSession(std::string identity, SessionObserver &observer,
                PeerSessionOptions opts = {})
        : identity_(std::move(identity)), observer_(observer), opts_(opts),
          peers_(identity_), framer_(opts.max_envelope_bytes)
    {
    }

    ~PeerSession() { disconnect(); }

    PeerSession(const PeerSession &)            = delete;
    PeerSession &operator=(const PeerSession &) = delete;

    // Returns an empty string on success, otherwise the reason.
    [[nodiscard]] std::string connect(const std::string &host, int port)
    {
        if (state_.load() != SessionState::Disconnected)
            return "session already used";

        std::cerr << "[" << get_current_timestamp_ms()
                  << "] attempting connection to " << host << ":" << port
                  << "\n";

        std::error_code ec;
        auto            t = connect_transport(host, port, ec);
        if (!t)
        {
            close_reported_ = true;
            state_          = SessionState::Closed;
            return "Connection failed: " + ec.message();
        }
        return connect(std::move(t));
    }

    [[nodiscard]] std::string connect(std::unique_ptr<Transport> transport)
    {
        SessionState expected = SessionState::Disconnected;
        if (!state_.compare_exchange_strong(expected,
                                            SessionState::Authenticating))
            return "session already used";

        if (!is_valid_username(identity_))
        {
            close_reported_ = true;
            state_          = SessionState::Closed;
            return "Invalid username";
        }

        keys_      = generate_keypair(opts_.rsa_key_bits);
        transport_ = std::move(transport);
        dev_println("own key fingerprint " + fingerprint());

        if (auto ec = write_envelope(*transport_,
                                     build_auth(identity_, keys_.public_pem)))
        {
            return fail_connect("Connection failed: " + ec.message());
        }

        std::vector<char> scratch(opts_.read_buffer_size);
        while (pending_.empty())
        {
            std::vector<DecodeResult> batch;
            const std::error_code ec =
                read_envelopes(*transport_, framer_, scratch, batch);
            for (auto &d : batch)
                pending_.push_back(std::move(d));
            if (ec && pending_.empty())
                return fail_connect("Connection lost during authentication: " +
                                    ec.message());
        }

        DecodeResult reply = std::move(pending_.front());
        pending_.pop_front();

        const auto *env = std::get_if<Envelope>(&reply);
        if (env == nullptr || env->type != MsgType::Auth)
            return fail_connect("Unexpected reply to authentication");
        if (env->field(0) != AUTH_SUCCESS)
        {
            const std::string reason = env->fields.size() > 1
                                           ? env->field(1)
                                           : "Authentication rejected";
            return fail_connect(reason);
        }

        state_ = SessionState::Authenticated;
        std::cerr << "[" << get_current_timestamp_ms() << "] authenticated as "
                  << identity_ << "\n";

        state_ = SessionState::Active;
        observer_.on_connection_state(true, "Connected as " + identity_);
        rx_thread_ = std::thread([this] { receive_loop(); });
        return {};
    }

    // recipient is a peer identity or "ALL".
    SendResult send(std::string_view recipient, std::string_view plaintext)
    {
        if (state_.load() != SessionState::Active)
            return SendResult::NotActive;

        Envelope env;
        if (recipient == BROADCAST_TARGET)
        {
            env = build_broadcast(peers_.seal_broadcast(plaintext, keys_));
        }
        else
        {
            if (!is_valid_username(recipient) || recipient == identity_)
                return SendResult::InvalidRecipient;
            auto sealed = peers_.seal_for(recipient, plaintext, keys_);
            if (std::holds_alternative<CryptoError>(sealed))
                return SendResult::NoKeyForPeer;
            env = build_message(recipient, std::get<std::string>(sealed));
        }

        std::error_code ec;
        {
            std::lock_guard<std::mutex> lk(write_mtx_);
            if (state_.load() != SessionState::Active)
                return SendResult::NotActive;
            ec = write_envelope(*transport_, env);
        }
        if (ec)
        {
            std::cerr << "[" << get_current_timestamp_ms()
                      << "] send failed: " << ec.message() << "\n";
            mark_closed("Connection lost: " + ec.message());
            transport_->shutdown();
            return SendResult::TransportError;
        }
        return SendResult::Sent;
    }

    void disconnect()
    {
        if (state_.load() == SessionState::Active)
        {
            std::lock_guard<std::mutex> lk(write_mtx_);
            if (auto ec = write_envelope(*transport_, build_disconnect()))
                dev_println("disconnect notice not delivered: " + ec.message());
        }
        // Closed before the shutdown so the receive loop does not report the
        // resulting end of stream as a lost connection.
        if (state_.load() != SessionState::Disconnected)
            mark_closed("Disconnected");
        if (transport_)
            transport_->shutdown();
        if (rx_thread_.joinable() &&
            rx_thread_.get_id() != std::this_thread::get_id())
            rx_thread_.join();
    }

    [[nodiscard]] SessionState state() const noexcept { return state_.load(); }

    [[nodiscard]] const std::string &identity() const noexcept
    {
        return identity_;
    }

    [[nodiscard]] std::string fingerprint() const
    {
        return keys_.public_pem.empty() ? std::string()
                                        : fingerprint_hex(keys_.public_pem);
    }

    [[nodiscard]] std::vector<std::string> directory() const
    {
        std::lock_guard<std::mutex> lk(dir_mtx_);
        return directory_;
    }

    [[nodiscard]] std::vector<std::string> known_peers() const
    {
        return peers_.known_peers();
    }

    [[nodiscard]] std::optional<PeerInfo> peer(std::string_view name) const
    {
        return peers_.peer(name);
    }

  private:
    std::string fail_connect(const std::string &reason)
    {
        std::cerr << "[" << get_current_timestamp_ms()
                  << "] authentication failed: " << reason << "\n";
        if (transport_)
            transport_->shutdown();
        close_reported_ = true;
        state_          = SessionState::Closed;
        return reason;
    }

    void mark_closed(const std::string &reason)
    {
        state_ = SessionState::Closed;
        if (!close_reported_.exchange(true))
            observer_.on_connection_state(false, reason);
    }

    void receive_loop()
    {
        std::vector<char> scratch(opts_.read_buffer_size);
        for (;;)
        {
            while (!pending_.empty())
            {
                DecodeResult d = std::move(pending_.front());
                pending_.pop_front();
                if (!handle(d))
                {
                    transport_->shutdown();
                    return;
                }
            }

            std::vector<DecodeResult> batch;
            const std::error_code     ec =
                read_envelopes(*transport_, framer_, scratch, batch);
            for (auto &d : batch)
                pending_.push_back(std::move(d));
            if (ec && pending_.empty())
            {
                if (state_.load() == SessionState::Active)
                {
                    std::cerr << "[" << get_current_timestamp_ms()
                              << "] connection lost: " << ec.message() << "\n";
                    mark_closed("Connection lost: " + ec.message());
                }
                return;
            }
        }
    }

    // Returns false when the relay ended the session.
    bool handle(const DecodeResult &d)
    {
        if (const auto *err = std::get_if<ParseError>(&d))
        {
            dev_println("dropped envelope: " +
                        std::string(parse_error_str(*err)));
            return true;
        }

        const Envelope &env = std::get<Envelope>(d);
        switch (env.type)
        {
        case MsgType::KeyExchange:
            handle_key_exchange(env.field(0), env.field(1));
            return true;
        case MsgType::UserList:
            handle_user_list(parse_user_list(env.field(0)));
            return true;
        case MsgType::Message:
            handle_payload(MsgType::Message, env.field(0), env.field(1));
            return true;
        case MsgType::Broadcast:
            if (env.fields.size() != 2)
            {
                dev_println("dropped BROADCAST without sender");
                return true;
            }
            handle_payload(MsgType::Broadcast, env.field(0), env.field(1));
            return true;
        case MsgType::Disconnect:
            mark_closed(env.fields.empty()
                            ? std::string("Disconnected by relay")
                            : "Disconnected by relay: " + env.field(0));
            return false;
        case MsgType::Auth:
            dev_println("dropped unexpected AUTH");
            return true;
        }
        return true;
    }

    void handle_key_exchange(const std::string &username,
                             const std::string &pem)
    {
        if (username == identity_)
            return;

        auto pk = import_public(pem);
        if (std::holds_alternative<CryptoError>(pk))
        {
            observer_.on_error("Invalid public key received for " + username);
            return;
        }

        const KeyUpdate r =
            peers_.update_peer_key(username, std::get<PublicKey>(std::move(pk)));
        if (r != KeyUpdate::Unchanged)
            dev_println("key for " + username + " fp=" +
                        fingerprint_hex(pem).substr(0, 16) +
                        (r == KeyUpdate::Replaced ? " (replaced)" : ""));
    }

    void handle_user_list(const std::vector<std::string> &ids)
    {
        for (const auto &gone : peers_.retain_only(ids))
            dev_println("peer left: " + gone);
        {
            std::lock_guard<std::mutex> lk(dir_mtx_);
            directory_ = ids;
        }
        observer_.on_directory_changed(ids);
    }

    void handle_payload(MsgType kind, const std::string &sender,
                        const std::string &payload)
    {
        auto plain = peers_.open(kind, sender, payload, keys_);
        if (const auto *err = std::get_if<CryptoError>(&plain))
        {
            observer_.on_error("Could not decrypt message from " + sender +
                               ": " + std::string(crypto_error_str(*err)));
            return;
        }
        observer_.on_message(sender, std::get<std::string>(plain));
    }

    std::string                identity_;
    SessionObserver           &observer_;
    PeerSessionOptions         opts_;
    PeerManager                peers_;
    KeyPair                    keys_{};
    std::unique_ptr<Transport> transport_{};
    StreamFramer               framer_;
    std::deque<DecodeResult>   pending_{};
    std::atomic<SessionState>  state_{SessionState::Disconnected};
    std::atomic_bool           close_reported_{false};
    std::mutex                 write_mtx_;
    mutable std::mutex         dir_mtx_;
    std::vector<std::string>   directory_{};
    std::thread                rx_thread_{};
};

#endif
