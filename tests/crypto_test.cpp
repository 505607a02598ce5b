#include <cassert>
#include <string>
#include <variant>
#include <vector>

#include "shared_common_crypto.h"

static secure_vector key_of(unsigned char fill) {
  return secure_vector(KEY_LEN, fill);
}

static void test_symmetric_round_trip() {
  const auto key = generate_symmetric_key();
  assert(key.size() == KEY_LEN);

  const std::vector<std::string> inputs = {
      "", "hello", std::string(16, 'a'), std::string(32, 'b'),
      std::string(1000, 'c'), "caf\xc3\xa9 \xe2\x9c\x93"};
  for (const auto &m : inputs) {
    const std::string ct = symmetric_encrypt(m, key);
    auto pt = symmetric_decrypt(ct, key);
    assert(std::holds_alternative<std::string>(pt));
    assert(std::get<std::string>(pt) == m);

    // iv || ciphertext, where the ciphertext always has at least one pad byte.
    const auto raw = base64_decode(ct);
    assert(raw.has_value());
    assert(raw->size() == IV_LEN + (m.size() / AES_BLOCK + 1) * AES_BLOCK);
  }
}

static void test_iv_freshness() {
  const auto key = key_of(0x11);
  const std::string a = symmetric_encrypt("same message", key);
  const std::string b = symmetric_encrypt("same message", key);
  assert(a != b);
}

static void test_decrypt_failures() {
  const auto key = key_of(0x22);
  const auto other = key_of(0x23);

  auto bad_b64 = symmetric_decrypt("not*base64!", key);
  assert(std::get<CryptoError>(bad_b64) == CryptoError::DecryptionFailed);

  // Only an IV, no ciphertext block.
  const std::string short_input =
      base64_encode(std::vector<unsigned char>(IV_LEN, 0x01));
  auto too_short = symmetric_decrypt(short_input, key);
  assert(std::get<CryptoError>(too_short) == CryptoError::DecryptionFailed);

  // Not block aligned.
  const std::string unaligned =
      base64_encode(std::vector<unsigned char>(IV_LEN + AES_BLOCK + 3, 0x02));
  auto misaligned = symmetric_decrypt(unaligned, key);
  assert(std::get<CryptoError>(misaligned) == CryptoError::DecryptionFailed);

  // Wrong key almost always leaves invalid padding. Try several messages so a
  // chance valid pad byte on one of them cannot make the test flaky.
  int failures = 0;
  for (int i = 0; i < 8; ++i) {
    const std::string ct =
        symmetric_encrypt("message number " + std::to_string(i), key);
    auto r = symmetric_decrypt(ct, other);
    if (std::holds_alternative<CryptoError>(r))
      ++failures;
  }
  assert(failures >= 6);

  // Pad value must be in [1, 16] and repeated.
  secure_vector zero_pad(AES_BLOCK, 0x00);
  assert(!crypto_detail::pkcs7_unpad(zero_pad));
  secure_vector big_pad(AES_BLOCK, 0x11);
  assert(!crypto_detail::pkcs7_unpad(big_pad));
  secure_vector mixed(AES_BLOCK, 0x04);
  mixed[AES_BLOCK - 2] = 0x03;
  assert(!crypto_detail::pkcs7_unpad(mixed));
  secure_vector full(AES_BLOCK, 0x10);
  assert(crypto_detail::pkcs7_unpad(full));
  assert(full.empty());
}

static void test_mac() {
  const auto key = key_of(0x33);
  const std::string msg = "integrity matters";
  auto tag = mac(msg, key);
  assert(tag.size() == SHA256_LEN);
  assert(verify_mac(msg, tag, key));

  std::string altered = msg;
  altered[0] ^= 0x01;
  assert(!verify_mac(altered, tag, key));

  auto bad_tag = tag;
  bad_tag.back() ^= 0x80;
  assert(!verify_mac(msg, bad_tag, key));

  assert(!verify_mac(msg, tag, key_of(0x34)));
  tag.pop_back();
  assert(!verify_mac(msg, tag, key));
}

static void test_keys_wrap_sign() {
  const KeyPair alice = generate_keypair();
  const KeyPair bob = generate_keypair();

  const std::string &pem = export_public(alice);
  assert(pem.find("-----BEGIN PUBLIC KEY-----") != std::string::npos);

  auto imported = import_public(pem);
  assert(std::holds_alternative<PublicKey>(imported));
  const PublicKey alice_pub = std::get<PublicKey>(imported);
  assert(fingerprint_hex(alice_pub.pem) == fingerprint_hex(pem));
  assert(fingerprint_hex(pem).size() == 2 * SHA256_LEN);

  // Missing trailing newline is accepted.
  std::string no_newline = pem;
  while (!no_newline.empty() && no_newline.back() == '\n')
    no_newline.pop_back();
  assert(std::holds_alternative<PublicKey>(import_public(no_newline)));

  auto garbage = import_public("-----BEGIN PUBLIC KEY-----\nAAAA\n");
  assert(std::get<CryptoError>(garbage) == CryptoError::MalformedKey);
  assert(std::get<CryptoError>(import_public("")) == CryptoError::MalformedKey);

  const auto sym = generate_symmetric_key();
  const auto wrapped =
      std::get<std::vector<unsigned char>>(wrap_key(sym, public_of(bob)));
  auto unwrapped = unwrap_key(wrapped, bob);
  assert(std::holds_alternative<secure_vector>(unwrapped));
  assert(std::get<secure_vector>(unwrapped) == sym);

  auto wrong = unwrap_key(wrapped, alice);
  assert(std::get<CryptoError>(wrong) == CryptoError::UnwrapFailed);

  const PublicKeyLookup lookup =
      [&](std::string_view id) -> std::optional<PublicKey> {
    if (id == "bob")
      return public_of(bob);
    return std::nullopt;
  };
  assert(std::holds_alternative<std::vector<unsigned char>>(
      wrap_key_for(sym, "bob", lookup)));
  assert(std::get<CryptoError>(wrap_key_for(sym, "carol", lookup)) ==
         CryptoError::NoKeyForPeer);

  // Undersized RSA keys never import, and cannot carry a wrapped secret.
  const KeyPair small = generate_keypair(1024);
  assert(std::get<CryptoError>(import_public(small.public_pem)) ==
         CryptoError::MalformedKey);
  const KeyPair tiny = generate_keypair(512);
  assert(std::get<CryptoError>(wrap_key(sym, public_of(tiny))) ==
         CryptoError::MalformedKey);
  assert(std::get<CryptoError>(wrap_key(sym, PublicKey{})) ==
         CryptoError::NoKeyForPeer);

  const std::string msg = "signed statement";
  const auto sig = sign(msg, alice);
  assert(verify(msg, sig, alice_pub));
  assert(!verify("signed statemenT", sig, alice_pub));
  assert(!verify(msg, sig, public_of(bob)));
  auto tampered = sig;
  tampered[tampered.size() / 2] ^= 0x01;
  assert(!verify(msg, tampered, alice_pub));
  assert(!verify(msg, {}, alice_pub));
}

static void test_hkdf_and_base64() {
  const secure_vector secret = key_of(0x44);
  const auto k1 = hkdf(secret, {}, "label one", KEY_LEN);
  const auto k2 = hkdf(secret, {}, "label two", KEY_LEN);
  const auto k1_again = hkdf(secret, {}, "label one", KEY_LEN);
  assert(k1.size() == KEY_LEN);
  assert(k1 == k1_again);
  assert(k1 != k2);

  assert(base64_encode(std::string_view("foobar")) == "Zm9vYmFy");
  assert(base64_encode(std::string_view("fo")) == "Zm8=");
  auto d = base64_decode("Zm8=");
  assert(d.has_value() && std::string(d->begin(), d->end()) == "fo");
  assert(!base64_decode("Zm8").has_value());
  assert(!base64_decode("Zm$=").has_value());
  assert(base64_decode("")->empty());
}

int main() {
  crypto_init();
  test_symmetric_round_trip();
  test_iv_freshness();
  test_decrypt_failures();
  test_mac();
  test_keys_wrap_sign();
  test_hkdf_and_base64();
  return 0;
}
