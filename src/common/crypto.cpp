
#include "crypto.hpp"
#include <chrono>
#include <stdexcept>
#include <sodium.h>

namespace dasim {

static_assert(Identity::kPublicKeyBytes == crypto_sign_PUBLICKEYBYTES,
              "ed25519 public key size");
static_assert(Identity::kSecretKeyBytes == crypto_sign_SECRETKEYBYTES,
              "ed25519 secret key size");
static_assert(Identity::kSignatureBytes == crypto_sign_BYTES,
              "ed25519 signature size");

bool crypto_init() { return sodium_init() >= 0; }

std::string sha256_hex(const Bytes &data) {
  unsigned char digest[crypto_hash_sha256_BYTES];
  crypto_hash_sha256(digest, data.data(), data.size());
  char hex[crypto_hash_sha256_BYTES * 2 + 1];
  sodium_bin2hex(hex, sizeof(hex), digest, sizeof(digest));
  return std::string(hex);
}

Identity Identity::generate() {
  Identity id;
  id.public_.resize(crypto_sign_PUBLICKEYBYTES);
  id.secret_.resize(crypto_sign_SECRETKEYBYTES);
  if (crypto_sign_keypair(id.public_.data(), id.secret_.data()) != 0)
    throw std::runtime_error("ed25519 keypair generation failed");
  return id;
}

Identity::~Identity() {
  if (!secret_.empty())
    sodium_memzero(secret_.data(), secret_.size());
}

Bytes Identity::sign(const uint8_t *msg, size_t len) const {
  if (secret_.size() != crypto_sign_SECRETKEYBYTES)
    throw std::logic_error("sign with an empty identity");
  Bytes sig(crypto_sign_BYTES);
  crypto_sign_detached(sig.data(), nullptr, msg, len, secret_.data());
  return sig;
}

uint64_t unix_now() {
  using namespace std::chrono;
  return (uint64_t)duration_cast<seconds>(
             system_clock::now().time_since_epoch())
      .count();
}

static void ts_bytes(uint64_t ts, uint8_t out[8]) {
  for (int i = 0; i < 8; i++)
    out[i] = (uint8_t)(ts >> (56 - 8 * i));
}

Handshake make_handshake(const Identity &id, uint64_t ts) {
  uint8_t msg[8];
  ts_bytes(ts, msg);
  Handshake hs;
  hs.pubkey = id.public_key();
  hs.sig = id.sign(msg, sizeof(msg));
  hs.ts = ts;
  return hs;
}

bool verify_handshake(const Handshake &hs) {
  if (hs.pubkey.size() != crypto_sign_PUBLICKEYBYTES ||
      hs.sig.size() != crypto_sign_BYTES)
    return false;
  uint8_t msg[8];
  ts_bytes(hs.ts, msg);
  return crypto_sign_verify_detached(hs.sig.data(), msg, sizeof(msg),
                                     hs.pubkey.data()) == 0;
}

} // namespace dasim
