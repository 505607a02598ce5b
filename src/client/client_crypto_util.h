#ifndef CLIENT_CRYPTO_UTIL_H
#define CLIENT_CRYPTO_UTIL_H

#include "shared_common_crypto.h"
#include "shared_common_util.h"
#include "shared_net_common_protocol.h"
#include "shared_net_username_util.h"

#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

inline constexpr std::string_view ENC_KEY_INFO = "cryptex message encryption";
inline constexpr std::string_view MAC_KEY_INFO =
    "cryptex message authentication";

// Keys derived from one conversation secret.
struct ConversationKeys
{
    secure_vector secret{};
    secure_vector enc_key{};
    secure_vector mac_key{};
};

inline ConversationKeys derive_conversation_keys(secure_vector secret)
{
    if (secret.size() != KEY_LEN)
        throw std::runtime_error("bad conversation secret length");

    ConversationKeys k;
    k.enc_key = hkdf(secret, {}, ENC_KEY_INFO, KEY_LEN);
    k.mac_key = hkdf(secret, {}, MAC_KEY_INFO, KEY_LEN);
    k.secret  = std::move(secret);
    return k;
}

// (recipient identity, base64 of the wrapped conversation secret)
using Grant = std::pair<std::string, std::string>;

// grants "." ciphertext "." tag "." signature
struct SealedPayload
{
    std::vector<Grant> grants{};
    std::string        cipher{};
    std::string        tag{};
    std::string        signature{};
};

namespace sealed_detail
{

inline std::string join_grants(const std::vector<Grant> &grants)
{
    std::string out;
    for (size_t i = 0; i < grants.size(); ++i)
    {
        if (i != 0)
            out.push_back(',');
        out.append(grants[i].first);
        out.push_back(':');
        out.append(grants[i].second);
    }
    return out;
}

inline std::string signed_portion(MsgType kind, const SealedPayload &p)
{
    std::string s(msg_type_str(kind));
    s.push_back('|');
    s.append(join_grants(p.grants));
    s.push_back('.');
    s.append(p.cipher);
    s.push_back('.');
    s.append(p.tag);
    return s;
}

} // namespace sealed_detail

inline std::string serialize_sealed(const SealedPayload &p)
{
    return sealed_detail::join_grants(p.grants) + "." + p.cipher + "." +
           p.tag + "." + p.signature;
}

inline std::optional<SealedPayload> parse_sealed(std::string_view text)
{
    const auto parts = split_all(text, ".");
    if (parts.size() != 4 || parts[1].empty() || parts[2].empty() ||
        parts[3].empty())
        return std::nullopt;

    SealedPayload p;
    if (!parts[0].empty())
    {
        for (const auto &g : split_all(parts[0], ","))
        {
            const auto colon = g.find(':');
            if (colon == std::string::npos || colon == 0 ||
                colon + 1 == g.size())
                return std::nullopt;
            p.grants.emplace_back(g.substr(0, colon), g.substr(colon + 1));
        }
    }
    p.cipher    = parts[1];
    p.tag       = parts[2];
    p.signature = parts[3];
    return p;
}

inline std::string seal_payload(MsgType kind, std::string_view plaintext,
                                const ConversationKeys   &keys,
                                const std::vector<Grant> &grants,
                                const KeyPair            &own)
{
    SealedPayload p;
    p.grants       = grants;
    p.cipher       = symmetric_encrypt(plaintext, keys.enc_key);
    p.tag          = to_hex(mac(p.cipher, keys.mac_key));
    p.signature    = base64_encode(sign(sealed_detail::signed_portion(kind, p), own));
    return serialize_sealed(p);
}

[[nodiscard]] inline bool verify_sealed_signature(MsgType              kind,
                                                  const SealedPayload &p,
                                                  const PublicKey     &sender)
{
    const auto sig = base64_decode(p.signature);
    if (!sig)
        return false;
    return verify(sealed_detail::signed_portion(kind, p), *sig, sender);
}

[[nodiscard]] inline const Grant *find_grant(const SealedPayload &p,
                                             std::string_view     identity)
{
    for (const auto &g : p.grants)
    {
        if (g.first == identity)
            return &g;
    }
    return nullptr;
}

// Tag check in constant time, then decryption.
inline CryptoResult<std::string> open_sealed(const SealedPayload    &p,
                                             const ConversationKeys &keys)
{
    std::vector<unsigned char> tag;
    try
    {
        tag = from_hex(p.tag);
    }
    catch (const std::invalid_argument &)
    {
        return CryptoError::IntegrityFailed;
    }
    if (!verify_mac(p.cipher, tag, keys.mac_key))
        return CryptoError::IntegrityFailed;
    return symmetric_decrypt(p.cipher, keys.enc_key);
}

#endif
