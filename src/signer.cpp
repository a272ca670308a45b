#include "signer.h"
#include "error.h"
#include "logger.h"
#include "util/bytes.h"
#include "split_string.h"

#include <chrono>
#include <stdexcept>

namespace httpsig {

using Clock = std::chrono::steady_clock;

SignableMessage SigningResult::apply(const SignableMessage& message) const
{
    return message.with_headers(headers);
}

std::string default_content_type(boost::string_view body)
{
    trim_whitespace(body);

    bool json = body.size() >= 2
             && ( (body.front() == '{' && body.back() == '}')
               || (body.front() == '[' && body.back() == ']'));

    return json ? "application/json" : "application/octet-stream";
}

Signer::Signer(SigningConfig config)
{
    util::crypto_init();
    validate_signing_config(config);
    _config = std::move(config);
}

void Signer::update_config(SigningConfig config)
{
    validate_signing_config(config);
    _config = std::move(config);
}

static SignatureParams make_params( const SigningConfig& config
                                  , const SigningOptions& options)
{
    SignatureParams p;

    p.keyid = config.key_id;

    if (options.nonce) {
        p.nonce = *options.nonce;
    } else if (config.nonce_generator) {
        p.nonce = config.nonce_generator();
    } else {
        p.nonce = generate_nonce();
    }

    if (options.created) {
        p.created = *options.created;
    } else if (config.timestamp_generator) {
        p.created = config.timestamp_generator();
    } else {
        p.created = current_timestamp();
    }

    if (!is_valid_nonce(p.nonce)) {
        throw SigningError( signing_error::invalid_nonce
                          , "Nonce must be a version 4 UUID"
                          , {{"nonce", p.nonce}});
    }

    if (!is_valid_timestamp(p.created)) {
        throw SigningError( signing_error::invalid_timestamp
                          , "Timestamp must lie between the years 2000 and 2100"
                          , {{"created", std::to_string(p.created)}});
    }

    return p;
}

SigningResult Signer::sign( const SignableMessage& original
                          , const SigningOptions& options) const
{
    auto start = Clock::now();

    const auto& components = options.components ? *options.components
                                                : _config.components;

    if (components.empty()) {
        throw SigningError( signing_error::invalid_signature_components
                          , "At least one signature component must be enabled");
    }

    auto params = make_params(_config, options);

    SigningResult result;
    SignableMessage message = original;

    if (message.has_body() && !message.content_type()
            && components.covers_header("content-type")) {
        auto ct = default_content_type(*message.body());
        message = message.with_header("content-type", ct);
        result.headers.set("content-type", ct);
    }

    for (const auto& h : _config.required_headers) {
        if (!message.header(h)) {
            throw SigningError( signing_error::missing_required_header
                              , util::str("Required header missing: ", h)
                              , {{"header", h}});
        }
    }

    boost::optional<ContentDigest> digest;

    if (components.content_digest) {
        try {
            digest = calculate_content_digest( message.body()
                                             , options.digest_algorithm
                                               ? *options.digest_algorithm
                                               : _config.digest_algorithm);
        }
        catch (const std::runtime_error& e) {
            throw SigningError( signing_error::digest_calculation_failed
                              , util::str("Failed to calculate content digest: ", e.what()));
        }
        result.headers.set("content-digest", digest->header_value);
    }

    auto canonical = build_canonical_message( message, components, params
                                            , digest, _config.strict_headers);

    result.canonical_message = canonical.to_string();

    std::string hex;

    try {
        hex = util::bytes::to_hex(_config.private_key->sign(result.canonical_message));
    }
    catch (const std::runtime_error& e) {
        throw SigningError( signing_error::crypto_error
                          , util::str("Ed25519 signing failed: ", e.what()));
    }

    if (hex.size() != 2 * util::Ed25519PrivateKey::sig_size) {
        throw SigningError( signing_error::signing_failed
                          , "Unexpected signature length"
                          , {{"length", std::to_string(hex.size())}});
    }

    result.signature_input = util::str(_config.label, '=', canonical.signature_params);
    result.signature = util::str(_config.label, "=:", hex, ':');
    result.params = std::move(params);

    result.headers.set("signature-input", result.signature_input);
    result.headers.set("signature", result.signature);

    std::chrono::duration<double, std::milli> took = Clock::now() - start;

    if (took.count() > signing_time_budget_ms) {
        LOG_WARN("Signing took ", took.count(), "ms, more than "
                , signing_time_budget_ms, "ms");
    } else {
        LOG_DEBUG("Signed ", message.method_string(), " ", message.url()
                 , " in ", took.count(), "ms");
    }

    return result;
}

} // httpsig namespace
