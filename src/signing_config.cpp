#include "signing_config.h"
#include "error.h"
#include "util/str.h"

#include <algorithm>

namespace httpsig {

const char* to_string(SecurityProfile p)
{
    switch (p) {
        case SecurityProfile::minimal:  return "minimal";
        case SecurityProfile::standard: return "standard";
        case SecurityProfile::strict:   return "strict";
    }
    return "unknown";
}

boost::optional<SecurityProfile> parse_security_profile(boost::string_view s)
{
    if (s == "minimal")  return SecurityProfile::minimal;
    if (s == "standard") return SecurityProfile::standard;
    if (s == "strict")   return SecurityProfile::strict;
    return boost::none;
}

SignatureComponents profile_components(SecurityProfile p)
{
    switch (p) {
        case SecurityProfile::minimal:
            return SignatureComponents(true, true, {}, false);
        case SecurityProfile::standard:
            return SignatureComponents(true, true, {"content-type"}, true);
        case SecurityProfile::strict:
            return SignatureComponents(true, true,
                    { "content-type", "content-length"
                    , "user-agent", "authorization"}, true);
    }
    return SignatureComponents();
}

DigestAlgorithm profile_digest_algorithm(SecurityProfile p)
{
    return p == SecurityProfile::strict ? DigestAlgorithm::sha512
                                        : DigestAlgorithm::sha256;
}

static void check_private_key_bytes(boost::string_view raw)
{
    if (raw.size() != util::Ed25519PrivateKey::key_size) {
        throw SigningError( signing_error::invalid_private_key
                          , util::str("Private key must be "
                                     , util::Ed25519PrivateKey::key_size
                                     , " bytes")
                          , {{"length", std::to_string(raw.size())}});
    }

    if (std::all_of(raw.begin(), raw.end(), [] (char c) { return c == 0; })) {
        throw SigningError( signing_error::invalid_private_key
                          , "Private key must not be all zero");
    }
}

void validate_signing_config(const SigningConfig& config)
{
    if (!is_valid_key_id(config.key_id)) {
        throw SigningError( signing_error::invalid_key_id
                          , "Key id must be a non-empty string without whitespace of at most 256 characters"
                          , {{"key_id", config.key_id}});
    }

    if (!config.private_key) {
        throw SigningError(signing_error::invalid_private_key, "Private key is required");
    }

    auto raw = config.private_key->serialize();
    check_private_key_bytes(boost::string_view( reinterpret_cast<const char*>(raw.data())
                                               , raw.size()));

    if (config.components.empty()) {
        throw SigningError( signing_error::invalid_signature_components
                          , "At least one signature component must be enabled");
    }

    auto check_name = [] (const std::string& h) {
        if (!is_valid_header_name(h)) {
            throw SigningError( signing_error::invalid_signature_components
                              , util::str("Invalid header name: ", h)
                              , {{"header", h}});
        }
    };

    for (const auto& h : config.components.headers()) check_name(h);
    for (const auto& h : config.required_headers) check_name(h);

    if (config.label.empty() || config.label.find_first_of("=:;() \t\"") != std::string::npos) {
        throw SigningError( signing_error::invalid_config
                          , "Invalid signature label"
                          , {{"label", config.label}});
    }
}

SigningConfigBuilder::SigningConfigBuilder()
{
    profile(SecurityProfile::standard);
}

SigningConfigBuilder& SigningConfigBuilder::profile(SecurityProfile p)
{
    _config.components = profile_components(p);
    _config.digest_algorithm = profile_digest_algorithm(p);
    return *this;
}

SigningConfigBuilder& SigningConfigBuilder::key_id(std::string id)
{
    _config.key_id = std::move(id);
    return *this;
}

SigningConfigBuilder& SigningConfigBuilder::private_key(boost::string_view raw)
{
    _raw_private_key = std::string(raw);
    _config.private_key = boost::none;
    return *this;
}

SigningConfigBuilder& SigningConfigBuilder::private_key(const util::Ed25519PrivateKey& key)
{
    _raw_private_key = boost::none;
    _config.private_key = key;
    return *this;
}

SigningConfigBuilder& SigningConfigBuilder::method(bool v)
{
    _config.components.method = v;
    return *this;
}

SigningConfigBuilder& SigningConfigBuilder::target_uri(bool v)
{
    _config.components.target_uri = v;
    return *this;
}

SigningConfigBuilder& SigningConfigBuilder::headers(std::vector<std::string> hs)
{
    _config.components.set_headers(std::move(hs));
    return *this;
}

SigningConfigBuilder& SigningConfigBuilder::add_header(boost::string_view h)
{
    _config.components.add_header(h);
    return *this;
}

SigningConfigBuilder& SigningConfigBuilder::content_digest(bool enabled, DigestAlgorithm a)
{
    _config.components.content_digest = enabled;
    _config.digest_algorithm = a;
    return *this;
}

SigningConfigBuilder& SigningConfigBuilder::strict_headers(bool v)
{
    _config.strict_headers = v;
    return *this;
}

SigningConfigBuilder& SigningConfigBuilder::require_header(boost::string_view h)
{
    auto name = normalize_header_name(h);
    auto& r = _config.required_headers;
    if (std::find(r.begin(), r.end(), name) == r.end()) r.push_back(name);
    _config.components.add_header(name);
    return *this;
}

SigningConfigBuilder& SigningConfigBuilder::label(std::string l)
{
    _config.label = std::move(l);
    return *this;
}

SigningConfigBuilder& SigningConfigBuilder::nonce_generator(std::function<std::string()> f)
{
    _config.nonce_generator = std::move(f);
    return *this;
}

SigningConfigBuilder& SigningConfigBuilder::timestamp_generator(std::function<int64_t()> f)
{
    _config.timestamp_generator = std::move(f);
    return *this;
}

SigningConfig SigningConfigBuilder::build() const
{
    SigningConfig config = _config;

    if (_raw_private_key) {
        check_private_key_bytes(*_raw_private_key);
        util::crypto_init();
        config.private_key = util::Ed25519PrivateKey::from_bytes(*_raw_private_key);
    }

    validate_signing_config(config);
    return config;
}

} // httpsig namespace
