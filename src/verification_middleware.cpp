#include "verification_middleware.h"
#include "error.h"
#include "logger.h"
#include "signature_extractor.h"

namespace httpsig {

ResponseVerifier::ResponseVerifier( std::shared_ptr<Verifier> verifier
                                  , ResponseVerifierConfig config)
    : _verifier(std::move(verifier))
    , _config(std::move(config))
{
    for (const auto& p : _config.skip_patterns) {
        try {
            _skip.emplace_back(p);
        }
        catch (const boost::regex_error& e) {
            throw ConfigError( config_error::invalid_option
                             , util::str("Invalid skip pattern: ", e.what())
                             , {{"pattern", p}});
        }
    }
}

bool ResponseVerifier::skipped(const std::string& url) const
{
    for (const auto& rx : _skip) {
        if (boost::regex_search(url, rx)) return true;
    }
    return false;
}

static VerificationError middleware_error(const char* what, const std::exception& e)
{
    return VerificationError( verification_error::middleware_error
                            , util::str(what, ": ", e.what()));
}

VerifiedResponse ResponseVerifier::process(const VerifiableResponse& response) const
{
    if (skipped(response.url)) {
        LOG_DEBUG("Skipping response verification for ", response.url);
        return VerifiedResponse{response, boost::none};
    }

    if (!has_signature_headers(response.headers)) {
        LOG_DEBUG("Response without signature headers: ", response.url);
        return VerifiedResponse{response, boost::none};
    }

    VerificationResult result;

    try {
        result = _verifier->verify_response(response, _config.options);
    }
    catch (const std::exception& e) {
        throw middleware_error("Response verification failed", e);
    }

    if (!result.is_valid()) {
        if (_config.on_failure) _config.on_failure(result, response);

        if (_config.throw_on_failure) {
            throw VerificationError( verification_error::response_verification_failed
                                   , "Response signature verification failed"
                                   , {{"url", response.url}
                                     ,{"status", to_string(result.status)}});
        }

        LOG_WARN("Response signature verification failed for ", response.url
                , " status: ", to_string(result.status));
    }

    return VerifiedResponse{response, std::move(result)};
}

ResponseInterceptor ResponseVerifier::interceptor() const
{
    return [this] (const VerifiableResponse& r) {
        return process(r).response;
    };
}

RequestVerifier::RequestVerifier( std::shared_ptr<Verifier> verifier
                                , RequestVerifierConfig config)
    : _verifier(std::move(verifier))
    , _config(std::move(config))
{}

VerificationResult RequestVerifier::process(const SignableMessage& request) const
{
    VerificationResult result;

    try {
        result = _verifier->verify(request, request.headers(), _config.options);
    }
    catch (const std::exception& e) {
        throw middleware_error("Request verification failed", e);
    }

    if (!result.is_valid()) {
        if (_config.on_failure) _config.on_failure(result, request);

        if (_config.reject_invalid) {
            throw VerificationError( verification_error::request_verification_failed
                                   , "Request signature verification failed"
                                   , {{"url", request.url()}
                                     ,{"status", to_string(result.status)}});
        }
    }

    return result;
}

} // httpsig namespace
