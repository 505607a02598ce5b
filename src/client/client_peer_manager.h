#ifndef CLIENT_PEER_MANAGER_H
#define CLIENT_PEER_MANAGER_H

#include "client_crypto_util.h"
#include "shared_common_crypto.h"
#include "shared_common_util.h"
#include "shared_net_common_protocol.h"

#include <algorithm>
#include <cstdint>
#include <iostream>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <unordered_set>
#include <variant>
#include <vector>

struct PeerInfo
{
    std::string username{};
    PublicKey   public_key{};
    std::string peer_fp_hex{};
};

struct OutboundConversation
{
    ConversationKeys keys{};
    // recipient -> base64 wrapped secret
    std::unordered_map<std::string, std::string> grants{};
};

struct InboundConversation
{
    std::string      wrapped{};
    ConversationKeys keys{};
};

enum class KeyUpdate : uint8_t
{
    Added,
    Unchanged,
    Replaced
};

// Peer public keys and per-conversation key state of one session.
class PeerManager
{
  public:
    explicit PeerManager(std::string self) : self_(std::move(self)) {}

    KeyUpdate update_peer_key(const std::string &username, PublicKey pk)
    {
        std::lock_guard<std::mutex> lk(mtx_);
        auto it = peers_.find(username);
        if (it != peers_.end() && it->second.public_key.pem == pk.pem)
            return KeyUpdate::Unchanged;

        const bool replaced = it != peers_.end();
        if (replaced)
            forget_conversations(username);

        PeerInfo info;
        info.username    = username;
        info.peer_fp_hex = fingerprint_hex(pk.pem);
        info.public_key  = std::move(pk);
        peers_[username] = std::move(info);
        return replaced ? KeyUpdate::Replaced : KeyUpdate::Added;
    }

    // Drops keys and conversation state of every peer not in present.
    std::vector<std::string> retain_only(const std::vector<std::string> &present)
    {
        const std::unordered_set<std::string> keep(present.begin(),
                                                   present.end());
        std::vector<std::string>              gone;

        std::lock_guard<std::mutex> lk(mtx_);
        for (auto it = peers_.begin(); it != peers_.end();)
        {
            if (!keep.contains(it->first))
            {
                gone.push_back(it->first);
                forget_conversations(it->first);
                it = peers_.erase(it);
            }
            else
            {
                ++it;
            }
        }
        return gone;
    }

    [[nodiscard]] std::optional<PeerInfo> peer(std::string_view username) const
    {
        std::lock_guard<std::mutex> lk(mtx_);
        auto it = peers_.find(std::string(username));
        if (it == peers_.end())
            return std::nullopt;
        return it->second;
    }

    [[nodiscard]] std::vector<std::string> known_peers() const
    {
        std::lock_guard<std::mutex> lk(mtx_);
        std::vector<std::string>    out;
        out.reserve(peers_.size());
        for (const auto &kv : peers_)
            out.push_back(kv.first);
        std::ranges::sort(out);
        return out;
    }

    CryptoResult<std::string> seal_for(std::string_view recipient,
                                       std::string_view plaintext,
                                       const KeyPair   &own)
    {
        std::lock_guard<std::mutex> lk(mtx_);
        const std::string           key(recipient);
        auto                        pit = peers_.find(key);
        if (pit == peers_.end())
            return CryptoError::NoKeyForPeer;

        OutboundConversation &conv  = outbound(key);
        auto                  grant = grant_for(conv, pit->second);
        if (std::holds_alternative<CryptoError>(grant))
            return CryptoError::NoKeyForPeer;

        std::vector<Grant> grants;
        grants.emplace_back(key, std::get<std::string>(std::move(grant)));
        return seal_payload(MsgType::Message, plaintext, conv.keys, grants, own);
    }

    // Seals for every known peer. Peers without a key, or whose key cannot
    // wrap the secret, get no grant.
    std::string seal_broadcast(std::string_view plaintext, const KeyPair &own)
    {
        std::lock_guard<std::mutex> lk(mtx_);
        OutboundConversation &conv = outbound(std::string(BROADCAST_TARGET));

        std::vector<Grant> grants;
        for (const auto &kv : peers_)
        {
            auto grant = grant_for(conv, kv.second);
            if (auto *wrapped = std::get_if<std::string>(&grant))
                grants.emplace_back(kv.first, std::move(*wrapped));
        }
        std::ranges::sort(grants);
        return seal_payload(MsgType::Broadcast, plaintext, conv.keys, grants,
                            own);
    }

    CryptoResult<std::string> open(MsgType kind, const std::string &sender,
                                   std::string_view payload,
                                   const KeyPair   &own)
    {
        const auto sealed = parse_sealed(payload);
        if (!sealed)
        {
            dev_println("malformed sealed payload from " + sender);
            return CryptoError::DecryptionFailed;
        }

        std::lock_guard<std::mutex> lk(mtx_);
        auto                        pit = peers_.find(sender);
        if (pit == peers_.end())
            return CryptoError::NoKeyForPeer;
        if (!verify_sealed_signature(kind, *sealed, pit->second.public_key))
            return CryptoError::SignatureInvalid;

        const Grant *grant = find_grant(*sealed, self_);
        if (grant == nullptr)
            return CryptoError::NoKeyForPeer;

        const std::string conv_id =
            std::string(msg_type_str(kind)) + "|" + sender;
        auto cit = inbound_.find(conv_id);
        if (cit == inbound_.end() || cit->second.wrapped != grant->second)
        {
            const auto wrapped = base64_decode(grant->second);
            if (!wrapped)
                return CryptoError::UnwrapFailed;
            auto secret = unwrap_key(*wrapped, own);
            if (std::holds_alternative<CryptoError>(secret))
                return std::get<CryptoError>(secret);
            if (std::get<secure_vector>(secret).size() != KEY_LEN)
                return CryptoError::UnwrapFailed;

            InboundConversation conv;
            conv.wrapped = grant->second;
            conv.keys    = derive_conversation_keys(
                std::get<secure_vector>(std::move(secret)));
            cit = inbound_.insert_or_assign(conv_id, std::move(conv)).first;
            dev_println("established conversation key " + conv_id);
        }

        return open_sealed(*sealed, cit->second.keys);
    }

  private:
    // Caller holds mtx_.
    OutboundConversation &outbound(const std::string &conv_id)
    {
        auto it = outbound_.find(conv_id);
        if (it == outbound_.end())
        {
            OutboundConversation conv;
            conv.keys = derive_conversation_keys(generate_symmetric_key());
            it        = outbound_.emplace(conv_id, std::move(conv)).first;
        }
        return it->second;
    }

    // Caller holds mtx_. Wraps once per (conversation, recipient).
    static CryptoResult<std::string> grant_for(OutboundConversation &conv,
                                               const PeerInfo       &p)
    {
        auto it = conv.grants.find(p.username);
        if (it != conv.grants.end())
            return it->second;
        auto wrapped = wrap_key(conv.keys.secret, p.public_key);
        if (const auto *err = std::get_if<CryptoError>(&wrapped))
        {
            std::cerr << "[" << get_current_timestamp_ms()
                      << "] cannot wrap key for " << p.username << ": "
                      << crypto_error_str(*err) << "\n";
            return *err;
        }
        std::string encoded =
            base64_encode(std::get<std::vector<unsigned char>>(wrapped));
        conv.grants.emplace(p.username, encoded);
        return encoded;
    }

    // Caller holds mtx_.
    void forget_conversations(const std::string &username)
    {
        outbound_.erase(username);
        auto bit = outbound_.find(std::string(BROADCAST_TARGET));
        if (bit != outbound_.end())
            bit->second.grants.erase(username);
        inbound_.erase(std::string(msg_type_str(MsgType::Message)) + "|" +
                       username);
        inbound_.erase(std::string(msg_type_str(MsgType::Broadcast)) + "|" +
                       username);
    }

    mutable std::mutex                                   mtx_;
    std::string                                          self_;
    std::unordered_map<std::string, PeerInfo>             peers_;
    std::unordered_map<std::string, OutboundConversation> outbound_;
    std::unordered_map<std::string, InboundConversation>  inbound_;
};

#endif
