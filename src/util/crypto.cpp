#include "crypto.h"
#include "bytes.h"
#include "str.h"

#include <cstring>
#include <memory>
#include <mutex>
#include <stdexcept>

extern "C" {
#include "gcrypt.h"
}

namespace httpsig {
namespace util {

namespace {

struct SexpDeleter {
    void operator()(::gcry_sexp_t s) const { if (s) ::gcry_sexp_release(s); }
};

using Sexp = std::unique_ptr<gcry_sexp, SexpDeleter>;

std::runtime_error crypto_error(const char* what, ::gcry_error_t err = 0)
{
    if (err) {
        return std::runtime_error(util::str(what, ": ", ::gcry_strerror(err)));
    }
    return std::runtime_error(what);
}

// Copy the data of the `token` element of `sexp` into `out`,
// which must be exactly the size of that data.
template<size_t N>
void copy_token(::gcry_sexp_t sexp, const char* token, uint8_t* out)
{
    Sexp t(::gcry_sexp_find_token(sexp, token, 0));
    if (!t) throw crypto_error("Missing token in S-expression");

    size_t size;
    const char* buffer = ::gcry_sexp_nth_data(t.get(), 1, &size);
    if (!buffer || size != N) throw crypto_error("Malformed token in S-expression");

    std::memcpy(out, buffer, N);
}

::gcry_sexp_t copy_sexp(::gcry_sexp_t other)
{
    if (!other) return nullptr;
    ::gcry_sexp_t ret = nullptr;
    if (auto err = ::gcry_sexp_build(&ret, NULL, "%S", other)) {
        throw crypto_error("Failed to copy key", err);
    }
    return ret;
}

} // anonymous namespace

void crypto_init()
{
    static std::once_flag once;
    std::call_once(once, [] {
        if (!::gcry_check_version(GCRYPT_VERSION)) {
            throw std::runtime_error("Error: Incompatible gcrypt version");
        }
        ::gcry_control(GCRYCTL_INITIALIZATION_FINISHED, 0);
    });
}

//--------------------------------------------------------------------
// Ed25519PublicKey

Ed25519PublicKey::Ed25519PublicKey(Ed25519PublicKey::key_array_t key):
    _public_key(nullptr)
{
    if (auto err = ::gcry_sexp_build(&_public_key, NULL, "(public-key (ecc (curve Ed25519) (flags eddsa) (q %b)))", key.size(), key.data())) {
        throw crypto_error("Failed to build Ed25519 public key", err);
    }
}

Ed25519PublicKey::~Ed25519PublicKey()
{
    if (_public_key) {
        ::gcry_sexp_release(_public_key);
        _public_key = nullptr;
    }
}

Ed25519PublicKey::Ed25519PublicKey(const Ed25519PublicKey& other):
    _public_key(copy_sexp(other._public_key))
{}

Ed25519PublicKey::Ed25519PublicKey(Ed25519PublicKey&& other):
    _public_key(other._public_key)
{
    other._public_key = nullptr;
}

Ed25519PublicKey& Ed25519PublicKey::operator=(const Ed25519PublicKey& other)
{
    if (this != &other) {
        auto copy = copy_sexp(other._public_key);
        if (_public_key) ::gcry_sexp_release(_public_key);
        _public_key = copy;
    }
    return *this;
}

Ed25519PublicKey& Ed25519PublicKey::operator=(Ed25519PublicKey&& other)
{
    if (this != &other) {
        std::swap(_public_key, other._public_key);
    }
    return *this;
}

boost::optional<Ed25519PublicKey>
Ed25519PublicKey::from_bytes(boost::string_view raw)
{
    if (raw.size() != key_size) return boost::none;
    return Ed25519PublicKey(util::bytes::to_array<uint8_t, key_size>(raw));
}

boost::optional<Ed25519PublicKey>
Ed25519PublicKey::from_hex(boost::string_view hex)
{
    if (hex.size() != key_size * 2) return boost::none;

    auto os = util::bytes::from_hex(hex);
    if (!os) return boost::none;

    return from_bytes(*os);
}

Ed25519PublicKey::key_array_t Ed25519PublicKey::serialize() const
{
    key_array_t output;
    copy_token<key_size>(_public_key, "q", output.data());
    return output;
}

bool Ed25519PublicKey::verify(const std::string& data, const Ed25519PublicKey::sig_array_t& signature) const
{
    ::gcry_sexp_t raw = nullptr;

    if (auto err = ::gcry_sexp_build(&raw, NULL, "(sig-val (eddsa (r %b)(s %b)))", key_size, signature.data(), key_size, signature.data() + key_size)) {
        throw crypto_error("Failed to build signature", err);
    }
    Sexp signature_sexp(raw);

    raw = nullptr;
    if (auto err = ::gcry_sexp_build(&raw, NULL, "(data (flags eddsa) (hash-algo sha512) (value %b))", data.size(), data.data())) {
        throw crypto_error("Failed to build signed data", err);
    }
    Sexp data_sexp(raw);

    return ::gcry_pk_verify(signature_sexp.get(), data_sexp.get(), _public_key) == 0;
}

//--------------------------------------------------------------------
// Ed25519PrivateKey

Ed25519PrivateKey::Ed25519PrivateKey(Ed25519PrivateKey::key_array_t key):
    _private_key(nullptr)
{
    if (auto err = ::gcry_sexp_build(&_private_key, NULL, "(private-key (ecc (curve Ed25519) (flags eddsa) (d %b)))", key.size(), key.data())) {
        throw crypto_error("Failed to build Ed25519 private key", err);
    }
}

Ed25519PrivateKey::~Ed25519PrivateKey()
{
    if (_private_key) {
        ::gcry_sexp_release(_private_key);
        _private_key = nullptr;
    }
}

Ed25519PrivateKey::Ed25519PrivateKey(const Ed25519PrivateKey& other):
    _private_key(copy_sexp(other._private_key))
{}

Ed25519PrivateKey::Ed25519PrivateKey(Ed25519PrivateKey&& other):
    _private_key(other._private_key)
{
    other._private_key = nullptr;
}

Ed25519PrivateKey& Ed25519PrivateKey::operator=(const Ed25519PrivateKey& other)
{
    if (this != &other) {
        auto copy = copy_sexp(other._private_key);
        if (_private_key) ::gcry_sexp_release(_private_key);
        _private_key = copy;
    }
    return *this;
}

Ed25519PrivateKey& Ed25519PrivateKey::operator=(Ed25519PrivateKey&& other)
{
    if (this != &other) {
        std::swap(_private_key, other._private_key);
    }
    return *this;
}

Ed25519PrivateKey::key_array_t Ed25519PrivateKey::serialize() const
{
    key_array_t output;
    copy_token<key_size>(_private_key, "d", output.data());
    return output;
}

boost::optional<Ed25519PrivateKey>
Ed25519PrivateKey::from_bytes(boost::string_view raw)
{
    if (raw.size() != key_size) return boost::none;
    return Ed25519PrivateKey(util::bytes::to_array<uint8_t, key_size>(raw));
}

boost::optional<Ed25519PrivateKey>
Ed25519PrivateKey::from_hex(boost::string_view hex)
{
    if (hex.size() != key_size * 2) return boost::none;

    auto os = util::bytes::from_hex(hex);
    if (!os) return boost::none;

    return from_bytes(*os);
}

Ed25519PublicKey Ed25519PrivateKey::public_key() const
{
    /*
     * libgcrypt derives the public point through an EC context
     * built from the private key.
     */
    ::gcry_ctx_t public_key_parameters;
    if (auto err = ::gcry_mpi_ec_new(&public_key_parameters, _private_key, NULL)) {
        throw crypto_error("Failed to derive public key", err);
    }

    ::gcry_sexp_t raw = nullptr;
    auto err = ::gcry_pubkey_get_sexp(&raw, GCRY_PK_GET_PUBKEY, public_key_parameters);
    ::gcry_ctx_release(public_key_parameters);
    if (err) throw crypto_error("Failed to derive public key", err);
    Sexp public_key_sexp(raw);

    Ed25519PublicKey::key_array_t public_key;
    copy_token<Ed25519PublicKey::key_size>(public_key_sexp.get(), "q", public_key.data());
    return Ed25519PublicKey(public_key);
}

Ed25519PrivateKey Ed25519PrivateKey::generate()
{
    ::gcry_sexp_t raw = nullptr;
    if (auto err = ::gcry_sexp_build(&raw, NULL, "(genkey (ecc (curve Ed25519) (flags eddsa)))")) {
        throw crypto_error("Failed to build key generation parameters", err);
    }
    Sexp generation_parameters(raw);

    raw = nullptr;
    if (auto err = ::gcry_pk_genkey(&raw, generation_parameters.get())) {
        throw crypto_error("Failed to generate Ed25519 key", err);
    }
    Sexp private_key_sexp(raw);

    key_array_t private_key;
    copy_token<key_size>(private_key_sexp.get(), "d", private_key.data());
    return Ed25519PrivateKey(private_key);
}

Ed25519PrivateKey::sig_array_t Ed25519PrivateKey::sign(const std::string& data) const
{
    ::gcry_sexp_t raw = nullptr;
    if (auto err = ::gcry_sexp_build(&raw, NULL, "(data (flags eddsa) (hash-algo sha512) (value %b))", data.size(), data.data())) {
        throw crypto_error("Failed to build data to sign", err);
    }
    Sexp data_sexp(raw);

    raw = nullptr;
    if (auto err = ::gcry_pk_sign(&raw, data_sexp.get(), _private_key)) {
        throw crypto_error("Ed25519 signing failed", err);
    }
    Sexp signature_sexp(raw);

    // The signature is the concatenation of `r` and `s`.
    sig_array_t output;
    copy_token<key_size>(signature_sexp.get(), "r", output.data());
    copy_token<key_size>(signature_sexp.get(), "s", output.data() + key_size);
    return output;
}

} // util namespace
} // httpsig namespace
