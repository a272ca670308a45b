#pragma once

#include <cstdint>
#include <functional>
#include <string>
#include <vector>

#include <boost/asio/spawn.hpp>
#include <boost/optional.hpp>

#include "error.h"
#include "message.h"
#include "namespaces.h"
#include "signature_extractor.h"
#include "util/crypto.h"

namespace httpsig {

struct VerificationPolicy;

// What a verification rule gets to look at.
struct VerificationContext {
    const SignableMessage& message;
    const ExtractedSignatureData& signature;
    const VerificationPolicy& policy;
    const util::Ed25519PublicKey& public_key;
    // Whether the signature verified against `public_key`.  Rules must
    // not record state (e.g. nonces) for signatures which did not.
    bool signature_verified = false;
};

struct RuleResult {
    bool passed = false;
    std::string message;
    ErrorDetails details;
};

// A named predicate attached to a policy.  Exactly one of `validate`
// and `async_validate` is set; the latter runs in the verifier's
// coroutine.
struct VerificationRule {
    using Predicate = std::function<RuleResult(const VerificationContext&)>;
    using AsyncPredicate = std::function<RuleResult(const VerificationContext&, asio::yield_context)>;

    std::string name;
    std::string description;
    Predicate validate;
    AsyncPredicate async_validate;
};

// A named set of checks and thresholds a signature must satisfy.
struct VerificationPolicy {
    std::string name;
    std::string description;

    bool verify_timestamp = true;
    // Seconds; no limit if `none`.
    boost::optional<int64_t> max_timestamp_age;
    bool verify_nonce = true;
    bool verify_content_digest = true;

    std::vector<std::string> required_components;
    std::vector<std::string> allowed_algorithms = {"ed25519"};

    // Covered components not in `required_components` fail coverage.
    bool reject_extra_components = false;

    std::vector<VerificationRule> custom_rules;

    bool requires_component(boost::string_view) const;
    bool allows_algorithm(boost::string_view) const;
};

// Throws `VerificationError` (INVALID_POLICY) if `policy` is not usable.
void validate_policy(const VerificationPolicy& policy);

// `override`'s name, description and flags; `base`'s maximum age unless
// `override` sets one; union of components, algorithms and rules.
VerificationPolicy merge_policies( const VerificationPolicy& base
                                 , const VerificationPolicy& override);

// Run a single rule, turning an exception it throws into a failure.
RuleResult run_rule( const VerificationRule&
                   , const VerificationContext&
                   , asio::yield_context);

} // httpsig namespace
