#pragma once

#include <string>

#include <util/bytes.h>
#include <util/crypto.h>

namespace httpsig { namespace test {

// RFC 8032, section 7.1, test 1.
static const std::string private_key_hex =
    "9d61b19deffd5a60ba844af492ec2cc44449c5697b326919703bac031cae7f60";
static const std::string public_key_hex =
    "d75a980182b10ab7d54bfed3c964073a0ee172f3daa62325af021a68f707511a";

static const std::string fixed_nonce = "4b0f2a3e-1c5d-4e6f-8a7b-9c0d1e2f3a4b";

inline std::string private_key_bytes() {
    return *util::bytes::from_hex(private_key_hex);
}

inline util::Ed25519PrivateKey private_key() {
    util::crypto_init();
    return *util::Ed25519PrivateKey::from_hex(private_key_hex);
}

inline util::Ed25519PublicKey public_key() {
    util::crypto_init();
    return *util::Ed25519PublicKey::from_hex(public_key_hex);
}

struct CryptoFixture {
    CryptoFixture() { util::crypto_init(); }
};

}} // namespaces
