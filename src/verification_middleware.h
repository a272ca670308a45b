#pragma once

#include <functional>
#include <memory>
#include <string>
#include <vector>

#include <boost/optional.hpp>
#include <boost/regex.hpp>

#include "message.h"
#include "signing_client.h"
#include "verifier.h"

namespace httpsig {

struct ResponseVerifierConfig {
    VerifyOptions options;
    // Responses to URLs matching any of these are not verified.
    std::vector<std::string> skip_patterns;
    // Throw `VerificationError` (RESPONSE_VERIFICATION_FAILED)
    // for a response which does not verify.
    bool throw_on_failure = false;
    std::function<void(const VerificationResult&, const VerifiableResponse&)> on_failure;
};

struct VerifiedResponse {
    VerifiableResponse response;
    // `none` if verification was skipped.
    boost::optional<VerificationResult> verification;
};

// Verifies signed responses.  A response without signature headers is
// passed through unverified.
class ResponseVerifier {
public:
    // Throws `ConfigError` (INVALID_OPTION) for a bad skip pattern.
    ResponseVerifier(std::shared_ptr<Verifier>, ResponseVerifierConfig);

    VerifiedResponse process(const VerifiableResponse&) const;

    // For `SigningClientConfig::response_interceptors`.
    ResponseInterceptor interceptor() const;

private:
    bool skipped(const std::string& url) const;

private:
    std::shared_ptr<Verifier> _verifier;
    ResponseVerifierConfig _config;
    std::vector<boost::regex> _skip;
};

struct RequestVerifierConfig {
    VerifyOptions options;
    // Throw `VerificationError` (REQUEST_VERIFICATION_FAILED)
    // for a request which does not verify.
    bool reject_invalid = false;
    std::function<void(const VerificationResult&, const SignableMessage&)> on_failure;
};

// Verifies inbound signed requests, signature headers included.
class RequestVerifier {
public:
    RequestVerifier(std::shared_ptr<Verifier>, RequestVerifierConfig);

    VerificationResult process(const SignableMessage& request) const;

private:
    std::shared_ptr<Verifier> _verifier;
    RequestVerifierConfig _config;
};

} // httpsig namespace
