#include "signing_client.h"
#include "error.h"
#include "logger.h"
#include "util/url.h"

#include <stdexcept>

namespace httpsig {

using Clock = std::chrono::steady_clock;

const char* to_string(SigningMode m)
{
    switch (m) {
        case SigningMode::automatic: return "automatic";
        case SigningMode::manual:    return "manual";
        case SigningMode::disabled:  return "disabled";
    }
    return "unknown";
}

boost::optional<SigningMode> parse_signing_mode(boost::string_view s)
{
    if (s == "automatic") return SigningMode::automatic;
    if (s == "manual")    return SigningMode::manual;
    if (s == "disabled")  return SigningMode::disabled;
    return boost::none;
}

SigningClient::SigningClient(Transport transport, SigningClientConfig config)
    : _transport(std::move(transport))
    , _config(std::move(config))
{
    if (!_transport) {
        throw std::invalid_argument("SigningClient requires a transport");
    }

    if (_config.mode != SigningMode::disabled) {
        if (!_config.signing) {
            throw SigningError( signing_error::invalid_config
                              , "Signing configuration is required unless signing is disabled");
        }
        _signer = std::make_unique<Signer>(*_config.signing);
    }

    if (_config.cache_signatures) {
        _cache = std::make_unique<SignatureCache>(_config.cache_size, _config.cache_ttl);
    }
}

boost::optional<EndpointSigningConfig>
SigningClient::endpoint_config(const std::string& url) const
{
    auto u = util::Url::from(url);
    auto path = u ? (u->path.empty() ? std::string("/") : u->path) : std::string();

    const EndpointSigningConfig* best = nullptr;
    size_t best_len = 0;

    for (const auto& e : _config.endpoints) {
        const auto& prefix = e.first;
        if (path.compare(0, prefix.size(), prefix) == 0 && prefix.size() >= best_len) {
            best = &e.second;
            best_len = prefix.size();
        }
    }

    if (!best) return boost::none;
    return *best;
}

SignableMessage SigningClient::sign( const SignableMessage& request
                                   , const EndpointSigningConfig& endpoint)
{
    bool use_cache = _cache && !endpoint.options.deterministic();

    if (use_cache) {
        if (auto headers = _cache->get(request)) {
            std::lock_guard<std::mutex> lock(_metrics_mutex);
            ++_metrics.cache_hits;
            return request.with_headers(*headers);
        }
        std::lock_guard<std::mutex> lock(_metrics_mutex);
        ++_metrics.cache_misses;
    }

    auto start = Clock::now();

    try {
        auto result = _signer->sign(request, endpoint.options);

        std::chrono::duration<double, std::milli> took = Clock::now() - start;

        {
            std::lock_guard<std::mutex> lock(_metrics_mutex);
            ++_metrics.requests_signed;
            _metrics.total_signing_time_ms += took.count();
        }

        if (use_cache) _cache->put(request, result.headers);

        return result.apply(request);
    }
    catch (const SigningError& e) {
        {
            std::lock_guard<std::mutex> lock(_metrics_mutex);
            ++_metrics.signing_failures;
        }

        if (endpoint.required) throw;

        LOG_WARN("Signing failed, sending request unsigned: "
                , e.name(), " ", e.message());
        return request;
    }
}

SignableMessage SigningClient::prepare(const SignableMessage& original)
{
    SignableMessage request = original;

    for (const auto& interceptor : _config.request_interceptors) {
        try {
            request = interceptor(request);
        }
        catch (const std::exception& e) {
            LOG_WARN("Request interceptor failed: ", e.what());
            throw;
        }
    }

    if (_config.mode == SigningMode::disabled) return request;

    auto endpoint = endpoint_config(request.url());

    if (_config.mode == SigningMode::manual && !endpoint) return request;
    if (endpoint && !endpoint->enabled) return request;

    return sign(request, endpoint ? *endpoint : EndpointSigningConfig());
}

VerifiableResponse SigningClient::send(const SignableMessage& original)
{
    auto request = prepare(original);
    auto response = _transport(request);

    for (const auto& interceptor : _config.response_interceptors) {
        try {
            response = interceptor(response);
        }
        catch (const std::exception& e) {
            LOG_WARN("Response interceptor failed: ", e.what());
            throw;
        }
    }

    return response;
}

SigningMetrics SigningClient::metrics() const
{
    std::lock_guard<std::mutex> lock(_metrics_mutex);
    return _metrics;
}

void SigningClient::reset_metrics()
{
    std::lock_guard<std::mutex> lock(_metrics_mutex);
    _metrics = SigningMetrics();
}

void SigningClient::clear_cache()
{
    if (_cache) _cache->clear();
}

} // httpsig namespace
