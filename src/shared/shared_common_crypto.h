#ifndef SHARED_COMMON_CRYPTO_H
#define SHARED_COMMON_CRYPTO_H

#include "shared_common_util.h"

#include <algorithm>
#include <array>
#include <cctype>
#include <cstdint>
#include <cstring>
#include <functional>
#include <memory>
#include <openssl/bio.h>
#include <openssl/crypto.h>
#include <openssl/err.h>
#include <openssl/evp.h>
#include <openssl/hmac.h>
#include <openssl/kdf.h>
#include <openssl/pem.h>
#include <openssl/rand.h>
#include <openssl/rsa.h>
#include <optional>
#include <span>
#include <stdexcept>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

inline constexpr std::size_t KEY_LEN         = 32;
inline constexpr std::size_t IV_LEN          = 16;
inline constexpr std::size_t AES_BLOCK       = 16;
inline constexpr std::size_t SHA256_LEN      = 32;
inline constexpr int         DEFAULT_RSA_BITS = 2048;

struct secure_vector : std::vector<unsigned char>
{
    using std::vector<unsigned char>::vector;

    secure_vector(const secure_vector &)            = default;
    secure_vector &operator=(const secure_vector &) = default;

    secure_vector(secure_vector &&) noexcept            = default;
    secure_vector &operator=(secure_vector &&) noexcept = default;

    ~secure_vector()
    {
        if (!this->empty())
        {
            OPENSSL_cleanse(this->data(), this->size());
        }
    }
};

struct EVP_CIPHER_CTX_Deleter
{
    void operator()(EVP_CIPHER_CTX *ctx) const noexcept
    {
        if (ctx != nullptr)
        {
            EVP_CIPHER_CTX_free(ctx);
        }
    }
};

struct EVP_MD_CTX_Deleter
{
    void operator()(EVP_MD_CTX *ctx) const noexcept
    {
        if (ctx != nullptr)
        {
            EVP_MD_CTX_free(ctx);
        }
    }
};

struct EVP_PKEY_CTX_Deleter
{
    void operator()(EVP_PKEY_CTX *ctx) const noexcept
    {
        if (ctx != nullptr)
        {
            EVP_PKEY_CTX_free(ctx);
        }
    }
};

struct EVP_PKEY_Deleter
{
    void operator()(EVP_PKEY *k) const noexcept
    {
        if (k != nullptr)
        {
            EVP_PKEY_free(k);
        }
    }
};

struct BIO_Deleter
{
    void operator()(BIO *b) const noexcept
    {
        if (b != nullptr)
        {
            BIO_free_all(b);
        }
    }
};

using EVP_CIPHER_CTX_ptr =
    std::unique_ptr<EVP_CIPHER_CTX, EVP_CIPHER_CTX_Deleter>;
using EVP_MD_CTX_ptr   = std::unique_ptr<EVP_MD_CTX, EVP_MD_CTX_Deleter>;
using EVP_PKEY_CTX_ptr = std::unique_ptr<EVP_PKEY_CTX, EVP_PKEY_CTX_Deleter>;
using EVP_PKEY_ptr     = std::unique_ptr<EVP_PKEY, EVP_PKEY_Deleter>;
using BIO_ptr          = std::unique_ptr<BIO, BIO_Deleter>;

enum class CryptoError : uint8_t
{
    MalformedKey,
    DecryptionFailed,
    UnwrapFailed,
    NoKeyForPeer,
    IntegrityFailed,
    SignatureInvalid
};

[[nodiscard]] inline constexpr std::string_view
crypto_error_str(CryptoError e) noexcept
{
    constexpr std::array<std::string_view, 6> msgs = {
        "malformed key",     "decryption failed",
        "key unwrap failed", "no key for peer",
        "integrity check failed", "signature invalid"};
    return msgs[static_cast<size_t>(e)];
}

template <typename T> using CryptoResult = std::variant<T, CryptoError>;

// RSA key pair; the private half never leaves the owning process.
struct KeyPair
{
    std::shared_ptr<EVP_PKEY> pkey{};
    std::string               public_pem{};
};

struct PublicKey
{
    std::shared_ptr<EVP_PKEY> pkey{};
    std::string               pem{};
};

inline void crypto_init() { OPENSSL_init_crypto(0, nullptr); }

[[nodiscard]] inline std::string openssl_last_error()
{
    const unsigned long code = ERR_get_error();
    if (code == 0)
        return "unknown openssl error";
    std::array<char, 256> buf{};
    ERR_error_string_n(code, buf.data(), buf.size());
    ERR_clear_error();
    return buf.data();
}

inline secure_vector random_bytes(std::size_t n)
{
    if (n == 0)
    {
        return {};
    }

    secure_vector v(n);
    if (RAND_bytes(v.data(), static_cast<int>(n)) != 1)
    {
        throw std::runtime_error("RAND_bytes failed");
    }

    return v;
}

inline secure_vector generate_symmetric_key() { return random_bytes(KEY_LEN); }

inline std::string base64_encode(std::span<const unsigned char> data)
{
    if (data.empty())
        return {};
    std::string out(4 * ((data.size() + 2) / 3), '\0');
    const int   n =
        EVP_EncodeBlock(reinterpret_cast<unsigned char *>(out.data()),
                        data.data(), static_cast<int>(data.size()));
    if (n < 0)
        throw std::runtime_error("EVP_EncodeBlock failed");
    out.resize(static_cast<size_t>(n));
    return out;
}

inline std::string base64_encode(std::string_view data)
{
    return base64_encode(std::span<const unsigned char>(
        reinterpret_cast<const unsigned char *>(data.data()), data.size()));
}

// Strict standard-alphabet decoding; nullopt on any malformed input.
inline std::optional<std::vector<unsigned char>>
base64_decode(std::string_view text)
{
    if (text.empty())
        return std::vector<unsigned char>{};
    if (text.size() % 4 != 0)
        return std::nullopt;

    size_t pad = 0;
    if (text.back() == '=')
        ++pad;
    if (text.size() >= 2 && text[text.size() - 2] == '=')
        ++pad;

    for (size_t i = 0; i < text.size() - pad; ++i)
    {
        const unsigned char c = static_cast<unsigned char>(text[i]);
        if (!(std::isalnum(c) != 0 || c == '+' || c == '/'))
            return std::nullopt;
    }

    std::vector<unsigned char> out(3 * (text.size() / 4));
    const int                  n = EVP_DecodeBlock(
        out.data(), reinterpret_cast<const unsigned char *>(text.data()),
        static_cast<int>(text.size()));
    if (n < 0 || static_cast<size_t>(n) < pad)
        return std::nullopt;
    out.resize(static_cast<size_t>(n) - pad);
    return out;
}

[[nodiscard]] inline KeyPair generate_keypair(int bits = DEFAULT_RSA_BITS)
{
    EVP_PKEY_CTX_ptr ctx(EVP_PKEY_CTX_new_id(EVP_PKEY_RSA, nullptr));
    if (ctx == nullptr)
    {
        throw std::runtime_error("EVP_PKEY_CTX_new_id failed");
    }
    if (1 != EVP_PKEY_keygen_init(ctx.get()))
    {
        throw std::runtime_error("EVP_PKEY_keygen_init failed");
    }
    if (1 != EVP_PKEY_CTX_set_rsa_keygen_bits(ctx.get(), bits))
    {
        throw std::runtime_error("EVP_PKEY_CTX_set_rsa_keygen_bits failed");
    }

    EVP_PKEY *raw = nullptr;
    if (1 != EVP_PKEY_keygen(ctx.get(), &raw) || raw == nullptr)
    {
        throw std::runtime_error("RSA key generation failed: " +
                                 openssl_last_error());
    }

    KeyPair kp;
    kp.pkey = std::shared_ptr<EVP_PKEY>(raw, EVP_PKEY_Deleter{});

    BIO_ptr bio(BIO_new(BIO_s_mem()));
    if (bio == nullptr || 1 != PEM_write_bio_PUBKEY(bio.get(), raw))
    {
        throw std::runtime_error("PEM_write_bio_PUBKEY failed");
    }
    char      *data = nullptr;
    const long len  = BIO_get_mem_data(bio.get(), &data);
    kp.public_pem.assign(data, static_cast<size_t>(len));
    return kp;
}

[[nodiscard]] inline const std::string &export_public(const KeyPair &kp) noexcept
{
    return kp.public_pem;
}

[[nodiscard]] inline PublicKey public_of(const KeyPair &kp)
{
    return PublicKey{kp.pkey, kp.public_pem};
}

// Accepts RSA SubjectPublicKeyInfo PEM of at least DEFAULT_RSA_BITS.
inline CryptoResult<PublicKey> import_public(std::string_view pem_text)
{
    std::string pem(trim_view(pem_text));
    if (pem.empty())
        return CryptoError::MalformedKey;
    pem.push_back('\n');

    BIO_ptr bio(BIO_new_mem_buf(pem.data(), static_cast<int>(pem.size())));
    if (bio == nullptr)
        return CryptoError::MalformedKey;

    EVP_PKEY *raw = PEM_read_bio_PUBKEY(bio.get(), nullptr, nullptr, nullptr);
    if (raw == nullptr)
    {
        ERR_clear_error();
        return CryptoError::MalformedKey;
    }
    EVP_PKEY_ptr owned(raw);
    if (EVP_PKEY_get_base_id(raw) != EVP_PKEY_RSA ||
        EVP_PKEY_get_bits(raw) < DEFAULT_RSA_BITS)
        return CryptoError::MalformedKey;

    PublicKey out;
    out.pkey = std::shared_ptr<EVP_PKEY>(owned.release(), EVP_PKEY_Deleter{});
    out.pem  = std::move(pem);
    return out;
}

namespace crypto_detail
{

inline std::vector<unsigned char> pkcs7_pad(std::span<const unsigned char> in)
{
    const size_t               n = AES_BLOCK - (in.size() % AES_BLOCK);
    std::vector<unsigned char> out(in.begin(), in.end());
    out.insert(out.end(), n, static_cast<unsigned char>(n));
    return out;
}

inline bool pkcs7_unpad(secure_vector &buf) noexcept
{
    if (buf.empty() || buf.size() % AES_BLOCK != 0)
        return false;
    const unsigned char n = buf.back();
    if (n < 1 || n > AES_BLOCK)
        return false;
    for (size_t i = buf.size() - n; i < buf.size(); ++i)
    {
        if (buf[i] != n)
            return false;
    }
    buf.resize(buf.size() - n);
    return true;
}

[[nodiscard]] inline std::span<const unsigned char>
as_bytes(std::string_view s) noexcept
{
    return {reinterpret_cast<const unsigned char *>(s.data()), s.size()};
}

} // namespace crypto_detail

// AES-256-CBC with a fresh IV; returns base64(iv || ciphertext).
inline std::string symmetric_encrypt(std::string_view     plaintext,
                                     const secure_vector &key)
{
    if (key.size() != KEY_LEN)
    {
        throw std::runtime_error("bad key size for AES-256");
    }

    const secure_vector iv     = random_bytes(IV_LEN);
    const auto          padded = crypto_detail::pkcs7_pad(
        crypto_detail::as_bytes(plaintext));

    EVP_CIPHER_CTX_ptr ctx(EVP_CIPHER_CTX_new());
    if (ctx == nullptr)
    {
        throw std::runtime_error("EVP_CIPHER_CTX_new failed");
    }
    if (1 != EVP_EncryptInit_ex(ctx.get(), EVP_aes_256_cbc(), nullptr,
                                key.data(), iv.data()))
    {
        throw std::runtime_error("EVP_EncryptInit_ex failed");
    }
    EVP_CIPHER_CTX_set_padding(ctx.get(), 0);

    std::vector<unsigned char> out(IV_LEN + padded.size());
    std::ranges::copy(iv, out.begin());

    int len  = 0;
    int clen = 0;
    if (1 != EVP_EncryptUpdate(ctx.get(), out.data() + IV_LEN, &len,
                               padded.data(), static_cast<int>(padded.size())))
    {
        throw std::runtime_error("EncryptUpdate failed");
    }
    clen = len;
    if (1 != EVP_EncryptFinal_ex(ctx.get(), out.data() + IV_LEN + clen, &len))
    {
        throw std::runtime_error("EncryptFinal failed");
    }
    clen += len;
    out.resize(IV_LEN + static_cast<size_t>(clen));

    return base64_encode(out);
}

inline CryptoResult<std::string> symmetric_decrypt(std::string_view     cipher,
                                                   const secure_vector &key)
{
    if (key.size() != KEY_LEN)
        return CryptoError::DecryptionFailed;

    auto raw = base64_decode(cipher);
    if (!raw)
        return CryptoError::DecryptionFailed;
    if (raw->size() < IV_LEN + AES_BLOCK || (raw->size() - IV_LEN) % AES_BLOCK)
        return CryptoError::DecryptionFailed;

    EVP_CIPHER_CTX_ptr ctx(EVP_CIPHER_CTX_new());
    if (ctx == nullptr)
    {
        throw std::runtime_error("EVP_CIPHER_CTX_new failed");
    }
    if (1 != EVP_DecryptInit_ex(ctx.get(), EVP_aes_256_cbc(), nullptr,
                                key.data(), raw->data()))
    {
        return CryptoError::DecryptionFailed;
    }
    EVP_CIPHER_CTX_set_padding(ctx.get(), 0);

    const size_t  body = raw->size() - IV_LEN;
    secure_vector plain(body);
    int           len  = 0;
    int           plen = 0;
    if (1 != EVP_DecryptUpdate(ctx.get(), plain.data(), &len,
                               raw->data() + IV_LEN, static_cast<int>(body)))
    {
        return CryptoError::DecryptionFailed;
    }
    plen = len;
    if (1 != EVP_DecryptFinal_ex(ctx.get(), plain.data() + plen, &len))
    {
        return CryptoError::DecryptionFailed;
    }
    plen += len;
    plain.resize(static_cast<size_t>(plen));

    if (!crypto_detail::pkcs7_unpad(plain))
        return CryptoError::DecryptionFailed;

    return std::string(plain.begin(), plain.end());
}

namespace crypto_detail
{

inline void set_oaep_sha256(EVP_PKEY_CTX *ctx)
{
    if (1 != EVP_PKEY_CTX_set_rsa_padding(ctx, RSA_PKCS1_OAEP_PADDING) ||
        1 != EVP_PKEY_CTX_set_rsa_oaep_md(ctx, EVP_sha256()) ||
        1 != EVP_PKEY_CTX_set_rsa_mgf1_md(ctx, EVP_sha256()))
    {
        throw std::runtime_error("RSA-OAEP parameter setup failed");
    }
}

} // namespace crypto_detail

// RSA-OAEP(SHA-256) encryption of a symmetric key for one recipient. A key
// too small to carry the payload yields MalformedKey.
inline CryptoResult<std::vector<unsigned char>>
wrap_key(std::span<const unsigned char> key, const PublicKey &recipient)
{
    if (recipient.pkey == nullptr)
        return CryptoError::NoKeyForPeer;

    EVP_PKEY_CTX_ptr ctx(EVP_PKEY_CTX_new(recipient.pkey.get(), nullptr));
    if (ctx == nullptr || 1 != EVP_PKEY_encrypt_init(ctx.get()))
    {
        throw std::runtime_error("EVP_PKEY_encrypt_init failed");
    }
    crypto_detail::set_oaep_sha256(ctx.get());

    size_t out_len = 0;
    if (1 != EVP_PKEY_encrypt(ctx.get(), nullptr, &out_len, key.data(),
                              key.size()))
    {
        dev_println("wrap_key sizing failed: " + openssl_last_error());
        return CryptoError::MalformedKey;
    }
    std::vector<unsigned char> out(out_len);
    if (1 != EVP_PKEY_encrypt(ctx.get(), out.data(), &out_len, key.data(),
                              key.size()))
    {
        dev_println("wrap_key failed: " + openssl_last_error());
        return CryptoError::MalformedKey;
    }
    out.resize(out_len);
    return out;
}

using PublicKeyLookup =
    std::function<std::optional<PublicKey>(std::string_view identity)>;

inline CryptoResult<std::vector<unsigned char>>
wrap_key_for(std::span<const unsigned char> key, std::string_view identity,
             const PublicKeyLookup &lookup)
{
    auto pk = lookup(identity);
    if (!pk || pk->pkey == nullptr)
        return CryptoError::NoKeyForPeer;
    return wrap_key(key, *pk);
}

inline CryptoResult<secure_vector>
unwrap_key(std::span<const unsigned char> wrapped, const KeyPair &own)
{
    if (own.pkey == nullptr || wrapped.empty())
        return CryptoError::UnwrapFailed;

    EVP_PKEY_CTX_ptr ctx(EVP_PKEY_CTX_new(own.pkey.get(), nullptr));
    if (ctx == nullptr || 1 != EVP_PKEY_decrypt_init(ctx.get()))
    {
        return CryptoError::UnwrapFailed;
    }
    crypto_detail::set_oaep_sha256(ctx.get());

    size_t out_len = 0;
    if (1 != EVP_PKEY_decrypt(ctx.get(), nullptr, &out_len, wrapped.data(),
                              wrapped.size()))
    {
        ERR_clear_error();
        return CryptoError::UnwrapFailed;
    }
    secure_vector out(out_len);
    if (1 != EVP_PKEY_decrypt(ctx.get(), out.data(), &out_len, wrapped.data(),
                              wrapped.size()))
    {
        ERR_clear_error();
        return CryptoError::UnwrapFailed;
    }
    out.resize(out_len);
    return out;
}

// RSASSA-PKCS1-v1_5 over SHA-256.
inline std::vector<unsigned char> sign(std::string_view message,
                                       const KeyPair   &own)
{
    EVP_MD_CTX_ptr ctx(EVP_MD_CTX_new());
    if (ctx == nullptr)
    {
        throw std::runtime_error("EVP_MD_CTX_new failed");
    }
    if (1 != EVP_DigestSignInit(ctx.get(), nullptr, EVP_sha256(), nullptr,
                                own.pkey.get()))
    {
        throw std::runtime_error("EVP_DigestSignInit failed");
    }

    const auto msg     = crypto_detail::as_bytes(message);
    size_t     sig_len = 0;
    if (1 != EVP_DigestSign(ctx.get(), nullptr, &sig_len, msg.data(),
                            msg.size()))
    {
        throw std::runtime_error("EVP_DigestSign sizing failed");
    }
    std::vector<unsigned char> sig(sig_len);
    if (1 != EVP_DigestSign(ctx.get(), sig.data(), &sig_len, msg.data(),
                            msg.size()))
    {
        throw std::runtime_error("EVP_DigestSign failed");
    }
    sig.resize(sig_len);
    return sig;
}

[[nodiscard]] inline bool verify(std::string_view               message,
                                 std::span<const unsigned char> signature,
                                 const PublicKey               &signer) noexcept
{
    if (signer.pkey == nullptr || signature.empty())
        return false;

    EVP_MD_CTX_ptr ctx(EVP_MD_CTX_new());
    if (ctx == nullptr)
        return false;
    if (1 != EVP_DigestVerifyInit(ctx.get(), nullptr, EVP_sha256(), nullptr,
                                  signer.pkey.get()))
    {
        ERR_clear_error();
        return false;
    }
    const auto msg = crypto_detail::as_bytes(message);
    const int  rc  = EVP_DigestVerify(ctx.get(), signature.data(),
                                      signature.size(), msg.data(), msg.size());
    if (rc != 1)
        ERR_clear_error();
    return rc == 1;
}

inline std::vector<unsigned char> mac(std::string_view               message,
                                      std::span<const unsigned char> key)
{
    std::vector<unsigned char> tag(SHA256_LEN);
    unsigned int               tag_len = 0;
    const auto                 msg     = crypto_detail::as_bytes(message);
    if (HMAC(EVP_sha256(), key.data(), static_cast<int>(key.size()),
             msg.data(), msg.size(), tag.data(), &tag_len) == nullptr)
    {
        throw std::runtime_error("HMAC failed");
    }
    tag.resize(tag_len);
    return tag;
}

[[nodiscard]] inline bool verify_mac(std::string_view               message,
                                     std::span<const unsigned char> tag,
                                     std::span<const unsigned char> key)
{
    if (tag.size() != SHA256_LEN)
        return false;
    const auto expected = mac(message, key);
    return CRYPTO_memcmp(expected.data(), tag.data(), SHA256_LEN) == 0;
}

inline secure_vector hkdf(const secure_vector           &key,
                          std::span<const unsigned char> salt,
                          std::string_view info, std::size_t len)
{
    EVP_PKEY_CTX_ptr pctx(EVP_PKEY_CTX_new_id(EVP_PKEY_HKDF, nullptr));
    if (pctx == nullptr)
    {
        throw std::runtime_error("EVP_PKEY_CTX_new_id failed");
    }

    if (1 != EVP_PKEY_derive_init(pctx.get()))
    {
        throw std::runtime_error("EVP_PKEY_derive_init failed");
    }
    if (1 != EVP_PKEY_CTX_set_hkdf_md(pctx.get(), EVP_sha256()))
    {
        throw std::runtime_error("EVP_PKEY_CTX_set_hkdf_md failed");
    }
    if (!salt.empty() &&
        1 != EVP_PKEY_CTX_set1_hkdf_salt(pctx.get(), salt.data(),
                                         static_cast<int>(salt.size())))
    {
        throw std::runtime_error("EVP_PKEY_CTX_set1_hkdf_salt failed");
    }
    if (1 != EVP_PKEY_CTX_set1_hkdf_key(pctx.get(), key.data(),
                                        static_cast<int>(key.size())))
    {
        throw std::runtime_error("EVP_PKEY_CTX_set1_hkdf_key failed");
    }
    const auto info_bytes = crypto_detail::as_bytes(info);
    if (!info.empty() &&
        1 != EVP_PKEY_CTX_add1_hkdf_info(pctx.get(), info_bytes.data(),
                                         static_cast<int>(info_bytes.size())))
    {
        throw std::runtime_error("EVP_PKEY_CTX_add1_hkdf_info failed");
    }

    secure_vector out(len);
    if (1 != EVP_PKEY_derive(pctx.get(), out.data(), &len))
    {
        throw std::runtime_error("EVP_PKEY_derive failed");
    }

    return out;
}

inline std::array<unsigned char, SHA256_LEN>
fingerprint_sha256(std::span<const unsigned char> pk)
{
    if (pk.empty())
    {
        throw std::runtime_error("empty public key for fingerprint");
    }

    std::array<unsigned char, SHA256_LEN> out{};

    EVP_MD_CTX_ptr ctx(EVP_MD_CTX_new());
    if (ctx == nullptr)
    {
        throw std::runtime_error("EVP_MD_CTX_new failed");
    }
    if (1 != EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr))
    {
        throw std::runtime_error("EVP_DigestInit_ex failed");
    }
    if (1 != EVP_DigestUpdate(ctx.get(), pk.data(), pk.size()))
    {
        throw std::runtime_error("EVP_DigestUpdate failed");
    }
    unsigned int out_len = 0;
    if (1 != EVP_DigestFinal_ex(ctx.get(), out.data(), &out_len))
    {
        throw std::runtime_error("EVP_DigestFinal_ex failed");
    }
    return out;
}

inline std::string fingerprint_hex(std::string_view public_pem)
{
    const auto fp = fingerprint_sha256(crypto_detail::as_bytes(public_pem));
    return to_hex(fp.data(), fp.size());
}

#endif
