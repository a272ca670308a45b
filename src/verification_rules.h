#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "replay_guard.h"
#include "verification_policy.h"

namespace httpsig { namespace rules {

// Age of `created` at most `max_age` seconds, at most 60 s in the future.
VerificationRule timestamp_freshness(int64_t max_age);

// Every one of `headers` is covered (case-insensitive).
VerificationRule required_headers(std::vector<std::string> headers);

// `keyid` is one of `valid_key_ids`.
VerificationRule key_id_validation(std::vector<std::string> valid_key_ids);

// A message with a body covers `content-type`.
VerificationRule content_type_consistency();

// The nonce has not been seen by `guard`.
VerificationRule nonce_uniqueness(std::shared_ptr<ReplayGuard> guard);

// Nonce shape and uniqueness.
VerificationRule replay_protection(std::shared_ptr<ReplayGuard> guard);

// Only `ed25519`.
VerificationRule algorithm_strength();

// Nonce shape only.
VerificationRule basic_replay_protection();

}} // namespaces

namespace httpsig {

// Instantiates library rules from their JSON descriptors, e.g.
//
//   {"rule": "timestamp-freshness", "max_age": 300}
//   {"rule": "required-headers", "headers": ["authorization"]}
//   {"rule": "key-id-validation", "key_ids": ["k1", "k2"]}
//   {"rule": "replay-protection"}
//
// Rules which track nonces share the factory's replay guard.
class RuleFactory {
public:
    explicit RuleFactory(std::shared_ptr<ReplayGuard> guard = nullptr);

    // Throws `ConfigError` (UNKNOWN_RULE, MALFORMED_SOURCE).
    VerificationRule make(const nlohmann::json& descriptor) const;

    static const std::vector<std::string>& rule_names();

    const std::shared_ptr<ReplayGuard>& replay_guard() const { return _guard; }

private:
    std::shared_ptr<ReplayGuard> _guard;
};

} // httpsig namespace
