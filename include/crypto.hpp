
#pragma once
#include <cstdint>
#include <cstddef>
#include <string>
#include <vector>
#include "protocol.hpp"

namespace dasim {

// Must succeed once before any other call in this header.
bool crypto_init();

// Lower-case hex SHA-256, the checksum carried on the wire.
std::string sha256_hex(const Bytes& data);

// Ed25519 signing identity, generated once per process run.
class Identity {
public:
    static constexpr size_t kPublicKeyBytes = 32;
    static constexpr size_t kSecretKeyBytes = 64;
    static constexpr size_t kSignatureBytes = 64;

    static Identity generate();

    Identity() = default;
    Identity(const Identity&) = default;
    Identity& operator=(const Identity&) = default;
    ~Identity();

    Bytes sign(const uint8_t* msg, size_t len) const;
    const Bytes& public_key() const { return public_; }

private:
    Bytes secret_;
    Bytes public_;
};

uint64_t unix_now();

// Signature covers the 8 big-endian bytes of ts.
Handshake make_handshake(const Identity& id, uint64_t ts);
bool verify_handshake(const Handshake& hs);

// Admission check applied to the counterpart's handshake.
class HandshakeVerifier {
public:
    virtual ~HandshakeVerifier() = default;
    // True if the peer must open with a Handshake that admit() accepts.
    virtual bool requires_handshake() const = 0;
    virtual bool admit(const Handshake& hs) = 0;
    virtual const char* name() const = 0;
};

// Session counts as secured once our own handshake went out; the peer's
// handshake is never inspected.
class PermissiveVerifier : public HandshakeVerifier {
public:
    bool requires_handshake() const override { return false; }
    bool admit(const Handshake&) override { return true; }
    const char* name() const override { return "send-only"; }
};

class Ed25519Verifier : public HandshakeVerifier {
public:
    bool requires_handshake() const override { return true; }
    bool admit(const Handshake& hs) override { return verify_handshake(hs); }
    const char* name() const override { return "ed25519"; }
};

} // namespace dasim
