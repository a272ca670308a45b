#pragma once

#include <cstdint>
#include <string>

#include <boost/optional.hpp>

#include "canonical_message.h"
#include "message.h"
#include "signing_config.h"

namespace httpsig {

// Per-call overrides of the signer configuration.
struct SigningOptions {
    boost::optional<std::string> nonce;
    boost::optional<int64_t> created;
    boost::optional<DigestAlgorithm> digest_algorithm;
    boost::optional<SignatureComponents> components;

    // Whether this call produces the same output as an earlier one
    // with the same message, which is the case only if both nonce
    // and timestamp are fixed.
    bool deterministic() const { return nonce && created; }
};

struct SigningResult {
    std::string signature_input;  // "<label>=<params>"
    std::string signature;        // "<label>=:<hex>:"
    // `signature-input`, `signature` and, when applicable,
    // `content-digest` and a synthesized `content-type`.
    http::fields headers;
    std::string canonical_message;
    SignatureParams params;

    // `message` with `headers` added.
    SignableMessage apply(const SignableMessage& message) const;
};

// Signing should take less than this, otherwise a warning is logged.
static const double signing_time_budget_ms = 10.0;

// `application/json` for a body which looks like a JSON object or array,
// `application/octet-stream` otherwise.
std::string default_content_type(boost::string_view body);

class Signer {
public:
    // Throws `SigningError` if `config` is not valid.
    explicit Signer(SigningConfig config);

    // Throws `SigningError` on invalid options or if a required header
    // is missing.  Does not modify `message`.
    SigningResult sign( const SignableMessage& message
                      , const SigningOptions& options = {}) const;

    const SigningConfig& config() const { return _config; }

    // Throws `SigningError` (and keeps the current configuration)
    // if `config` is not valid.
    void update_config(SigningConfig config);

private:
    SigningConfig _config;
};

} // httpsig namespace
