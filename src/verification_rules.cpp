#include "verification_rules.h"
#include "signature_params.h"
#include "util/str.h"

#include <algorithm>

#include <boost/algorithm/string/case_conv.hpp>

namespace httpsig { namespace rules {

static RuleResult pass(std::string message)
{
    return RuleResult{true, std::move(message), {}};
}

static RuleResult fail(std::string message, ErrorDetails details = {})
{
    return RuleResult{false, std::move(message), std::move(details)};
}

VerificationRule timestamp_freshness(int64_t max_age)
{
    return VerificationRule{
        "timestamp-freshness",
        util::str("Ensure timestamp is within ", max_age, " seconds"),
        [max_age] (const VerificationContext& ctx) {
            auto now = current_timestamp();
            auto created = ctx.signature.params.created;

            if (!is_valid_timestamp(created)) {
                return fail("Invalid timestamp", {{"created", std::to_string(created)}});
            }

            auto age = now - created;

            ErrorDetails details{ {"age", std::to_string(age)}
                                , {"created", std::to_string(created)}
                                , {"now", std::to_string(now)}};

            if (age > max_age) {
                details["max_age"] = std::to_string(max_age);
                return fail(util::str("Timestamp too old: ", age, "s > ", max_age, "s"), details);
            }
            if (age < -60) {
                return fail(util::str("Timestamp from future: ", age, "s"), details);
            }
            return pass(util::str("Timestamp is fresh: ", age, "s old"));
        },
        nullptr
    };
}

VerificationRule required_headers(std::vector<std::string> headers)
{
    for (auto& h : headers) boost::algorithm::to_lower(h);

    auto description = util::str("Ensure required headers are present: ", util::join(headers, ", "));

    return VerificationRule{
        "required-headers",
        std::move(description),
        [headers] (const VerificationContext& ctx) {
            std::vector<std::string> missing;
            for (const auto& h : headers) {
                if (!ctx.signature.covers(h)) missing.push_back(h);
            }
            if (!missing.empty()) {
                return fail( util::str("Missing required headers: ", util::join(missing, ", "))
                           , {{"missing", util::join(missing, ",")}});
            }
            return pass("All required headers present");
        },
        nullptr
    };
}

VerificationRule key_id_validation(std::vector<std::string> valid_key_ids)
{
    return VerificationRule{
        "key-id-validation",
        "Validate key ID against allowed list",
        [ids = std::move(valid_key_ids)] (const VerificationContext& ctx) {
            const auto& keyid = ctx.signature.params.keyid;
            if (std::find(ids.begin(), ids.end(), keyid) == ids.end()) {
                return fail(util::str("Invalid key ID: ", keyid), {{"key_id", keyid}});
            }
            return pass("Key ID validated");
        },
        nullptr
    };
}

VerificationRule content_type_consistency()
{
    return VerificationRule{
        "content-type-consistency",
        "Ensure content-type is covered when body is present",
        [] (const VerificationContext& ctx) {
            if (ctx.message.body() && !ctx.signature.covers("content-type")) {
                return fail("Content-type should be covered when body is present");
            }
            return pass("Content-type coverage is appropriate");
        },
        nullptr
    };
}

VerificationRule nonce_uniqueness(std::shared_ptr<ReplayGuard> guard)
{
    return VerificationRule{
        "nonce-uniqueness",
        "Ensure nonce has not been used before",
        [guard] (const VerificationContext& ctx) {
            const auto& p = ctx.signature.params;
            if (!ctx.signature_verified) {
                return fail("Nonce not recorded for unverified signature", {{"nonce", p.nonce}});
            }
            if (!guard->check_and_record(p.nonce, p.created)) {
                return fail(util::str("Nonce already used: ", p.nonce), {{"nonce", p.nonce}});
            }
            return pass("Nonce is unique");
        },
        nullptr
    };
}

VerificationRule replay_protection(std::shared_ptr<ReplayGuard> guard)
{
    return VerificationRule{
        "replay-protection",
        "Ensure nonce is fresh and not reused",
        [guard] (const VerificationContext& ctx) {
            const auto& p = ctx.signature.params;
            if (!is_valid_nonce(p.nonce)) {
                return fail("Invalid nonce format", {{"nonce", p.nonce}});
            }
            if (!ctx.signature_verified) {
                return fail("Nonce not recorded for unverified signature", {{"nonce", p.nonce}});
            }
            if (!guard->check_and_record(p.nonce, p.created)) {
                return fail(util::str("Nonce already used: ", p.nonce), {{"nonce", p.nonce}});
            }
            return pass("Nonce validation passed");
        },
        nullptr
    };
}

VerificationRule algorithm_strength()
{
    return VerificationRule{
        "algorithm-strength",
        "Ensure strong cryptographic algorithm",
        [] (const VerificationContext& ctx) {
            const auto& alg = ctx.signature.params.alg;
            if (alg != signature_algorithm) {
                return fail(util::str("Weak algorithm detected: ", alg), {{"algorithm", alg}});
            }
            return pass("Algorithm strength validated");
        },
        nullptr
    };
}

VerificationRule basic_replay_protection()
{
    return VerificationRule{
        "basic-replay-protection",
        "Basic nonce format validation",
        [] (const VerificationContext& ctx) {
            const auto& nonce = ctx.signature.params.nonce;
            if (!is_valid_nonce(nonce)) {
                return fail("Invalid nonce format", {{"nonce", nonce}});
            }
            return pass("Nonce format validated");
        },
        nullptr
    };
}

}} // namespaces

namespace httpsig {

RuleFactory::RuleFactory(std::shared_ptr<ReplayGuard> guard)
    : _guard(guard ? std::move(guard) : std::make_shared<InMemoryReplayGuard>())
{}

const std::vector<std::string>& RuleFactory::rule_names()
{
    static const std::vector<std::string> names = {
        "timestamp-freshness", "required-headers", "key-id-validation",
        "content-type-consistency", "nonce-uniqueness", "replay-protection",
        "algorithm-strength", "basic-replay-protection"
    };
    return names;
}

VerificationRule RuleFactory::make(const nlohmann::json& d) const
{
    if (!d.is_object() || !d.contains("rule") || !d["rule"].is_string()) {
        throw ConfigError( config_error::malformed_source
                         , "Rule descriptor must be an object with a \"rule\" name"
                         , {{"descriptor", d.dump()}});
    }

    auto name = d["rule"].get<std::string>();

    try {
        if (name == "timestamp-freshness") {
            return rules::timestamp_freshness(d.at("max_age").get<int64_t>());
        }
        if (name == "required-headers") {
            return rules::required_headers(d.at("headers").get<std::vector<std::string>>());
        }
        if (name == "key-id-validation") {
            return rules::key_id_validation(d.at("key_ids").get<std::vector<std::string>>());
        }
        if (name == "content-type-consistency") return rules::content_type_consistency();
        if (name == "nonce-uniqueness")         return rules::nonce_uniqueness(_guard);
        if (name == "replay-protection")        return rules::replay_protection(_guard);
        if (name == "algorithm-strength")       return rules::algorithm_strength();
        if (name == "basic-replay-protection")  return rules::basic_replay_protection();
    }
    catch (const nlohmann::json::exception& e) {
        throw ConfigError( config_error::malformed_source
                         , util::str("Invalid arguments for rule ", name, ": ", e.what())
                         , {{"rule", name}});
    }

    throw ConfigError( config_error::unknown_rule
                     , util::str("Unknown verification rule: ", name)
                     , {{"rule", name}});
}

} // httpsig namespace
