#pragma once

#include <chrono>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include <boost/asio/spawn.hpp>
#include <boost/optional.hpp>

#include "key_source.h"
#include "message.h"
#include "namespaces.h"
#include "policy_registry.h"
#include "replay_guard.h"
#include "util/crypto.h"
#include "util/executor.h"
#include "util/signal.h"
#include "verification_result.h"

namespace httpsig {

struct VerifierConfig {
    std::string default_policy = "standard";
    PolicyRegistry policies;

    // Looked up by `keyid` before any key source.
    std::map<std::string, util::Ed25519PublicKey> public_keys;
    std::vector<std::shared_ptr<KeySource>> key_sources;
    std::chrono::steady_clock::duration key_retrieval_timeout = std::chrono::seconds(5);

    // If set, the nonce check also rejects nonces seen before.
    std::shared_ptr<ReplayGuard> replay_guard;
};

struct VerifyOptions {
    // Name of a policy in the registry; the default policy if `none`.
    boost::optional<std::string> policy;
    boost::optional<util::Ed25519PublicKey> public_key;
    // Look the key up under this id instead of the signature's `keyid`.
    boost::optional<std::string> key_id;
    bool skip_key_retrieval = false;
};

struct VerificationRequest {
    SignableMessage message;
    http::fields headers;
    VerifyOptions options;
};

// Verification should take less than this, otherwise a warning is logged.
static const double verification_time_budget_ms = 50.0;

/*
 * Checks signatures against named policies.
 *
 * Every stage is timed and recorded: extraction, policy lookup, key
 * resolution, then the format, cryptographic, timestamp, nonce, content
 * digest, component coverage and custom rule checks.  The status is
 * `valid` only if every check passes.
 *
 * Only key resolution may suspend.  `verify` never throws for malformed
 * input or failed checks; those end up in the returned result.
 */
class Verifier {
public:
    explicit Verifier(VerifierConfig config);

    Verifier(const Verifier&) = delete;
    Verifier& operator=(const Verifier&) = delete;

    VerificationResult verify( const util::AsioExecutor&
                             , const SignableMessage& message
                             , const http::fields& signature_headers
                             , const VerifyOptions& options
                             , Cancel& cancel
                             , asio::yield_context yield);

    // Runs the above to completion on a private io_context.
    VerificationResult verify( const SignableMessage& message
                             , const http::fields& signature_headers
                             , const VerifyOptions& options = {});

    // Verify a signed response; `@method` and `@target-uri` are those
    // of the originating request.
    VerificationResult verify_response( const VerifiableResponse&
                                      , const VerifyOptions& options = {});

    // One result per request, in order.
    std::vector<VerificationResult> verify_batch(const std::vector<VerificationRequest>&);

    void add_public_key(const std::string& key_id, util::Ed25519PublicKey);
    bool remove_public_key(const std::string& key_id);

    // Throws `ConfigError` (INVALID_OPTION) if the default policy is
    // not in the registry.
    void update_config(VerifierConfig config);

    // Forget nonces recorded by the configured replay guard.
    void clear_replay_state();

    VerifierConfig config() const;

private:
    static void check_config(const VerifierConfig&);

private:
    mutable std::mutex _mutex;
    VerifierConfig _config;
};

} // httpsig namespace
