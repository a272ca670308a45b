#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include <boost/optional.hpp>

#include "message.h"
#include "signature_cache.h"
#include "signer.h"

namespace httpsig {

enum class SigningMode {
    automatic,  // sign everything not explicitly disabled
    manual,     // sign only endpoints configured as enabled
    disabled,
};

const char* to_string(SigningMode);
boost::optional<SigningMode> parse_signing_mode(boost::string_view);

struct EndpointSigningConfig {
    bool enabled = true;
    // A signing failure aborts the request instead of sending it unsigned.
    bool required = false;
    SigningOptions options;
};

struct SigningMetrics {
    uint64_t requests_signed = 0;
    uint64_t cache_hits = 0;
    uint64_t cache_misses = 0;
    uint64_t signing_failures = 0;
    double total_signing_time_ms = 0;

    double average_signing_time_ms() const {
        return requests_signed ? total_signing_time_ms / requests_signed : 0;
    }
};

// Sends a request and returns the response; connection handling,
// retries and TLS are up to the caller.
using Transport = std::function<VerifiableResponse(const SignableMessage&)>;

using RequestInterceptor = std::function<SignableMessage(const SignableMessage&)>;
using ResponseInterceptor = std::function<VerifiableResponse(const VerifiableResponse&)>;

struct SigningClientConfig {
    SigningMode mode = SigningMode::automatic;
    // Required unless `mode` is `disabled`.
    boost::optional<SigningConfig> signing;

    // Keyed by URL path prefix; the longest matching prefix applies.
    std::map<std::string, EndpointSigningConfig> endpoints;

    bool cache_signatures = true;
    size_t cache_size = SignatureCache::default_max_entries;
    SignatureCache::Clock::duration cache_ttl = std::chrono::seconds(300);

    std::vector<RequestInterceptor> request_interceptors;
    std::vector<ResponseInterceptor> response_interceptors;
};

/*
 * HTTP client wrapper with a fixed interceptor chain:
 *
 *   request interceptors -> signing -> transport -> response interceptors
 *
 * The chain is set at construction; nothing else is patched.
 */
class SigningClient {
public:
    // Throws `SigningError` for an invalid signing configuration.
    SigningClient(Transport, SigningClientConfig);

    SigningClient(const SigningClient&) = delete;
    SigningClient& operator=(const SigningClient&) = delete;

    // Throws `SigningError` if signing fails for an endpoint
    // which requires it.  Interceptor and transport exceptions
    // are propagated.
    VerifiableResponse send(const SignableMessage& request);

    // The request as it would go to the transport.
    SignableMessage prepare(const SignableMessage& request);

    SigningMetrics metrics() const;
    void reset_metrics();
    void clear_cache();

    const SigningClientConfig& config() const { return _config; }

private:
    boost::optional<EndpointSigningConfig> endpoint_config(const std::string& url) const;
    SignableMessage sign(const SignableMessage&, const EndpointSigningConfig&);

private:
    Transport _transport;
    SigningClientConfig _config;
    std::unique_ptr<Signer> _signer;
    std::unique_ptr<SignatureCache> _cache;

    mutable std::mutex _metrics_mutex;
    SigningMetrics _metrics;
};

} // httpsig namespace
