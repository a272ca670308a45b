#include "verifier.h"
#include "logger.h"
#include "signature_extractor.h"
#include "util/bytes.h"

#include <algorithm>

#include <boost/asio/io_context.hpp>

namespace httpsig {

using Clock = std::chrono::steady_clock;

namespace {

class StepTimer {
public:
    explicit StepTimer(PerformanceMetrics& m)
        : _metrics(m)
        , _start(Clock::now())
        , _step_start(_start)
    {}

    void step(const char* name) {
        auto now = Clock::now();
        _metrics.step_timings.emplace_back(name, ms(now - _step_start));
        _step_start = now;
    }

    double finish() {
        _metrics.total_time_ms = ms(Clock::now() - _start);
        return _metrics.total_time_ms;
    }

private:
    static double ms(Clock::duration d) {
        return std::chrono::duration<double, std::milli>(d).count();
    }

    PerformanceMetrics& _metrics;
    Clock::time_point _start;
    Clock::time_point _step_start;
};

} // anonymous namespace

Verifier::Verifier(VerifierConfig config)
{
    util::crypto_init();
    check_config(config);
    _config = std::move(config);
}

void Verifier::check_config(const VerifierConfig& config)
{
    if (!config.policies.contains(config.default_policy)) {
        throw ConfigError( config_error::invalid_option
                         , util::str("Default policy is not defined: ", config.default_policy)
                         , {{"policy", config.default_policy}});
    }
}

void Verifier::update_config(VerifierConfig config)
{
    check_config(config);
    std::lock_guard<std::mutex> lock(_mutex);
    _config = std::move(config);
}

VerifierConfig Verifier::config() const
{
    std::lock_guard<std::mutex> lock(_mutex);
    return _config;
}

void Verifier::add_public_key(const std::string& key_id, util::Ed25519PublicKey key)
{
    std::lock_guard<std::mutex> lock(_mutex);
    _config.public_keys[key_id] = std::move(key);
}

bool Verifier::remove_public_key(const std::string& key_id)
{
    std::lock_guard<std::mutex> lock(_mutex);
    return _config.public_keys.erase(key_id) != 0;
}

void Verifier::clear_replay_state()
{
    std::lock_guard<std::mutex> lock(_mutex);
    if (_config.replay_guard) _config.replay_guard->clear();
}

static bool check_format(const ExtractedSignatureData& d, const VerificationPolicy& policy)
{
    const auto& p = d.params;

    if (!is_valid_timestamp(p.created) || p.keyid.empty() || p.alg.empty() || p.nonce.empty()) {
        return false;
    }

    if (!policy.allows_algorithm(p.alg)) return false;

    return !d.covered.empty();
}

static bool check_cryptographic( const SignableMessage& message
                               , const ExtractedSignatureData& d
                               , const util::Ed25519PublicKey& key)
{
    using util::Ed25519PublicKey;

    if (d.params.alg != signature_algorithm) return false;
    if (d.signature.size() != 2 * Ed25519PublicKey::sig_size) return false;

    auto raw = util::bytes::from_hex(d.signature);
    if (!raw) return false;

    try {
        auto canonical = reconstruct(message, d);
        auto sig = util::bytes::to_array<uint8_t, Ed25519PublicKey::sig_size>(*raw);
        return key.verify(canonical.to_string(), sig);
    }
    catch (const std::exception& e) {
        LOG_DEBUG("Cryptographic verification failed: ", e.what());
        return false;
    }
}

static bool check_timestamp(const ExtractedSignatureData& d, const VerificationPolicy& policy)
{
    if (!policy.verify_timestamp) return true;

    auto created = d.params.created;
    if (!is_valid_timestamp(created)) return false;

    auto age = current_timestamp() - created;

    // Up to a minute of clock skew.
    if (age < -60) return false;

    if (policy.max_timestamp_age && age > *policy.max_timestamp_age) {
        return false;
    }

    return true;
}

static bool check_nonce( const ExtractedSignatureData& d
                       , const VerificationPolicy& policy
                       , ReplayGuard* guard)
{
    if (!policy.verify_nonce) return true;
    if (!is_valid_nonce(d.params.nonce)) return false;
    if (guard) return guard->check_and_record(d.params.nonce, d.params.created);
    return true;
}

static bool check_content_digest( const SignableMessage& message
                                , const ExtractedSignatureData& d
                                , const VerificationPolicy& policy)
{
    if (!policy.verify_content_digest) return true;

    if (!d.content_digest) {
        return !policy.requires_component("content-digest")
            && !d.covers("content-digest");
    }

    return verify_content_digest(message.body(), *d.content_digest);
}

static bool check_coverage( const ExtractedSignatureData& d
                          , const VerificationPolicy& policy
                          , PolicyCompliance& compliance)
{
    for (const auto& r : policy.required_components) {
        if (!d.covers(r)) compliance.missing_required_components.push_back(r);
    }

    for (const auto& c : d.covered) {
        if (!policy.requires_component(c)) compliance.extra_components.push_back(c);
    }

    if (!compliance.missing_required_components.empty()) return false;

    return !policy.reject_extra_components || compliance.extra_components.empty();
}

static bool check_custom_rules( const VerificationContext& ctx
                              , PolicyCompliance& compliance
                              , asio::yield_context yield)
{
    bool all_passed = true;

    for (const auto& rule : ctx.policy.custom_rules) {
        auto r = run_rule(rule, ctx, yield);
        if (!r.passed) all_passed = false;
        compliance.rule_results.push_back(RuleOutcome{rule.name, r.passed, r.message, r.details});
    }

    return all_passed;
}

VerificationResult Verifier::verify( const util::AsioExecutor& ex
                                   , const SignableMessage& message
                                   , const http::fields& headers
                                   , const VerifyOptions& options
                                   , Cancel& cancel
                                   , asio::yield_context yield)
{
    PerformanceMetrics perf;
    StepTimer timer(perf);

    auto error_result = [&] (const sys::error_code& ec, std::string msg, ErrorDetails details = {}) {
        timer.finish();
        LOG_DEBUG("Verification error: ", code_name(ec), " ", msg);
        return VerificationResult::create_error(ec, std::move(msg), std::move(details), perf);
    };

    // Extraction
    ExtractedSignatureData data;

    try {
        data = extract_signature_data(headers);
    }
    catch (const Error& e) {
        return error_result(e.code(), e.message(), e.details());
    }
    timer.step("extraction");

    // Policy resolution
    VerificationPolicy policy;
    boost::optional<util::Ed25519PublicKey> key = options.public_key;
    std::vector<std::shared_ptr<KeySource>> sources;
    std::shared_ptr<ReplayGuard> replay_guard;
    Clock::duration key_timeout;

    auto key_id = options.key_id ? *options.key_id : data.params.keyid;

    {
        std::lock_guard<std::mutex> lock(_mutex);

        auto name = options.policy ? *options.policy : _config.default_policy;
        auto p = _config.policies.find(name);

        if (!p) {
            LOG_WARN("Unknown verification policy: ", name);
            return error_result( verification_error::unknown_policy
                               , util::str("Unknown verification policy: ", name)
                               , {{"policy", name}});
        }

        policy = *p;

        if (!key) {
            auto i = _config.public_keys.find(key_id);
            if (i != _config.public_keys.end()) key = i->second;
        }

        sources = _config.key_sources;
        replay_guard = _config.replay_guard;
        key_timeout = _config.key_retrieval_timeout;
    }
    timer.step("policy_retrieval");

    // Key resolution
    if (!key) {
        if (options.skip_key_retrieval || sources.empty()) {
            return error_result( verification_error::public_key_not_found
                               , util::str("Public key not found: ", key_id)
                               , {{"key_id", key_id}});
        }

        KeyResolver resolver(sources, key_timeout);
        sys::error_code ec;
        auto k = resolver.resolve(ex, key_id, cancel, yield[ec]);

        if (ec == make_error_code(verification_error::public_key_not_found)) {
            return error_result( ec
                               , util::str("Public key not found in any key source: ", key_id)
                               , {{"key_id", key_id}});
        }
        if (ec) {
            return error_result( verification_error::key_retrieval_failed
                               , util::str("Key retrieval failed: ", ec.message())
                               , {{"key_id", key_id}});
        }

        key = std::move(k);
    }
    timer.step("key_retrieval");

    VerificationResult result;
    auto& checks = result.checks;
    auto& diag = result.diagnostics;

    checks.format_valid = check_format(data, policy);
    timer.step("format");

    checks.cryptographic_valid = check_cryptographic(message, data, *key);
    timer.step("cryptographic");

    checks.timestamp_valid = check_timestamp(data, policy);
    timer.step("timestamp");

    checks.nonce_valid = check_nonce( data, policy
                                    , checks.cryptographic_valid ? replay_guard.get() : nullptr);
    timer.step("nonce");

    checks.content_digest_valid = check_content_digest(message, data, policy);
    timer.step("content_digest");

    diag.policy_compliance.policy_name = policy.name;
    checks.component_coverage_valid = check_coverage(data, policy, diag.policy_compliance);
    timer.step("component_coverage");

    VerificationContext ctx{message, data, policy, *key, checks.cryptographic_valid};
    checks.custom_rules_valid = check_custom_rules(ctx, diag.policy_compliance, yield);
    timer.step("custom_rules");

    auto& sa = diag.signature_analysis;
    sa.algorithm = data.params.alg;
    sa.key_id = data.params.keyid;
    sa.created = data.params.created;
    if (is_valid_timestamp(data.params.created)) {
        sa.age = current_timestamp() - data.params.created;
    }
    sa.nonce = data.params.nonce;
    sa.covered_components = data.covered;

    auto& ca = diag.content_analysis;
    ca.has_content_digest = bool(data.content_digest);
    if (data.content_digest) ca.digest_algorithm = std::string(to_string(data.content_digest->algorithm));
    ca.content_size = message.content_size();
    ca.content_type = message.content_type();

    diag.security_analysis = analyze_security(checks);
    diag.security_analysis.component_security = assess_component_security(data.covered);

    result.signature_valid = checks.format_valid && checks.cryptographic_valid;
    result.status = checks.all() ? VerificationStatus::valid : VerificationStatus::invalid;

    auto took = timer.finish();
    result.performance = std::move(perf);

    if (took > verification_time_budget_ms) {
        LOG_WARN("Verification took ", took, "ms, more than "
                , verification_time_budget_ms, "ms");
    }

    LOG_DEBUG("Verified signature ", data.label, " keyid: ", data.params.keyid
             , " status: ", to_string(result.status));

    return result;
}

VerificationResult Verifier::verify( const SignableMessage& message
                                   , const http::fields& headers
                                   , const VerifyOptions& options)
{
    asio::io_context ctx;
    Cancel cancel;
    VerificationResult result;

    asio::spawn(ctx, [&] (asio::yield_context yield) {
        result = verify(ctx.get_executor(), message, headers, options, cancel, yield);
    });

    ctx.run();
    return result;
}

VerificationResult Verifier::verify_response( const VerifiableResponse& response
                                            , const VerifyOptions& options)
{
    return verify(response.as_message(), response.headers, options);
}

std::vector<VerificationResult>
Verifier::verify_batch(const std::vector<VerificationRequest>& requests)
{
    std::vector<VerificationResult> results;
    results.reserve(requests.size());

    for (const auto& r : requests) {
        try {
            results.push_back(verify(r.message, r.headers, r.options));
        }
        catch (const std::exception& e) {
            LOG_WARN("Batch verification failed: ", e.what());
            results.push_back(VerificationResult::create_error(
                        verification_error::batch_verification_error,
                        util::str("Batch verification failed: ", e.what())));
        }
    }

    return results;
}

} // httpsig namespace
