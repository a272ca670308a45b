#pragma once

#include <cstdint>
#include <functional>
#include <string>
#include <vector>

#include <boost/optional.hpp>
#include <boost/utility/string_view.hpp>

#include "content_digest.h"
#include "signature_params.h"
#include "util/crypto.h"

namespace httpsig {

enum class SecurityProfile { minimal, standard, strict };

const char* to_string(SecurityProfile);
boost::optional<SecurityProfile> parse_security_profile(boost::string_view);

// Components and digest algorithm of a profile.
//
//   minimal:  @method @target-uri
//   standard: @method @target-uri content-type content-digest (sha-256)
//   strict:   @method @target-uri content-type content-length
//             user-agent authorization content-digest (sha-512)
SignatureComponents profile_components(SecurityProfile);
DigestAlgorithm profile_digest_algorithm(SecurityProfile);

struct SigningConfig {
    std::string key_id;
    boost::optional<util::Ed25519PrivateKey> private_key;

    SignatureComponents components;
    DigestAlgorithm digest_algorithm = DigestAlgorithm::sha256;

    // Fail instead of skipping a covered header absent from the message.
    bool strict_headers = false;
    // Headers which must be present whatever `strict_headers` says.
    std::vector<std::string> required_headers;

    std::string label = default_signature_label;

    // Default to `generate_nonce` and `current_timestamp` when empty.
    std::function<std::string()> nonce_generator;
    std::function<int64_t()> timestamp_generator;
};

// Throws `SigningError` if `config` can not be used for signing.
void validate_signing_config(const SigningConfig& config);

/*
 * SigningConfig config = SigningConfigBuilder()
 *     .profile(SecurityProfile::standard)
 *     .key_id("client-key-1")
 *     .private_key(raw_bytes)
 *     .require_header("authorization")
 *     .build();
 */
class SigningConfigBuilder {
public:
    SigningConfigBuilder();

    // Replaces components and digest algorithm.
    SigningConfigBuilder& profile(SecurityProfile);

    SigningConfigBuilder& key_id(std::string);

    // 32 raw bytes, validated by `build`.
    SigningConfigBuilder& private_key(boost::string_view raw);
    SigningConfigBuilder& private_key(const util::Ed25519PrivateKey&);

    SigningConfigBuilder& method(bool);
    SigningConfigBuilder& target_uri(bool);
    SigningConfigBuilder& headers(std::vector<std::string>);
    SigningConfigBuilder& add_header(boost::string_view);
    SigningConfigBuilder& content_digest(bool enabled, DigestAlgorithm = DigestAlgorithm::sha256);

    SigningConfigBuilder& strict_headers(bool);
    // Also covers the header if not already covered.
    SigningConfigBuilder& require_header(boost::string_view);

    SigningConfigBuilder& label(std::string);
    SigningConfigBuilder& nonce_generator(std::function<std::string()>);
    SigningConfigBuilder& timestamp_generator(std::function<int64_t()>);

    // Returns an independent copy; later changes to the builder do not
    // affect it.  Throws `SigningError`.
    SigningConfig build() const;

private:
    SigningConfig _config;
    boost::optional<std::string> _raw_private_key;
};

} // httpsig namespace
