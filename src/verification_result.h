#pragma once

#include <cstdint>
#include <map>
#include <string>
#include <vector>

#include <boost/optional.hpp>

#include "error.h"

namespace httpsig {

enum class VerificationStatus { valid, invalid, unknown, error };

// "valid", "invalid", "unknown" or "error".
const char* to_string(VerificationStatus);

enum class SecurityLevel { low, medium, high };

const char* to_string(SecurityLevel);

struct VerificationChecks {
    bool format_valid = false;
    bool cryptographic_valid = false;
    bool timestamp_valid = false;
    bool nonce_valid = false;
    bool content_digest_valid = false;
    bool component_coverage_valid = false;
    bool custom_rules_valid = false;

    static const size_t count = 7;

    // Keyed by field name, in declaration order.
    std::vector<std::pair<std::string, bool>> items() const;

    size_t passed() const;
    bool all() const { return passed() == count; }
};

struct SignatureAnalysis {
    std::string algorithm;
    std::string key_id;
    int64_t created = 0;
    int64_t age = 0;
    std::string nonce;
    std::vector<std::string> covered_components;
};

struct ContentAnalysis {
    bool has_content_digest = false;
    boost::optional<std::string> digest_algorithm;
    size_t content_size = 0;
    boost::optional<std::string> content_type;
};

struct RuleOutcome {
    std::string rule_name;
    bool passed = false;
    std::string message;
    ErrorDetails details;
};

struct PolicyCompliance {
    std::string policy_name;
    std::vector<std::string> missing_required_components;
    std::vector<std::string> extra_components;
    std::vector<RuleOutcome> rule_results;
};

// Points contributed by covered components:
// `@method` 20, `@target-uri` 20, `content-digest` 30, two or more
// headers 20 (one header 10), and 5 for each of `authorization`,
// `content-type`, `date` and `host`.  High from 80, medium from 50.
struct ComponentSecurityAssessment {
    SecurityLevel level = SecurityLevel::low;
    unsigned score = 0;  // at most 100
    std::vector<std::string> strengths;
    std::vector<std::string> weaknesses;
};

ComponentSecurityAssessment assess_component_security(const std::vector<std::string>& covered);

struct SecurityAnalysis {
    SecurityLevel security_level = SecurityLevel::medium;
    std::vector<std::string> concerns;
    std::vector<std::string> recommendations;
    ComponentSecurityAssessment component_security;
};

struct VerificationDiagnostics {
    SignatureAnalysis signature_analysis;
    ContentAnalysis content_analysis;
    PolicyCompliance policy_compliance;
    SecurityAnalysis security_analysis;
};

struct PerformanceMetrics {
    double total_time_ms = 0;
    // Step name to milliseconds, in execution order.
    std::vector<std::pair<std::string, double>> step_timings;
};

struct ResultError {
    std::string code;  // e.g. "MISSING_SIGNATURE"
    std::string message;
    ErrorDetails details;
};

struct VerificationResult {
    VerificationStatus status = VerificationStatus::unknown;
    // Well-formed and cryptographically genuine, whatever the policy says.
    bool signature_valid = false;
    VerificationChecks checks;
    VerificationDiagnostics diagnostics;
    PerformanceMetrics performance;
    boost::optional<ResultError> error;

    bool is_valid() const { return status == VerificationStatus::valid; }

    // Status `error` with every check false.
    static VerificationResult create_error( const sys::error_code&
                                          , std::string message
                                          , ErrorDetails details = {}
                                          , PerformanceMetrics = {});

    static VerificationResult create_error(const Error&, PerformanceMetrics = {});
};

// Concerns, recommendations and overall level derived from `checks`:
// high if all pass, medium if at least 70% do, low otherwise.
SecurityAnalysis analyze_security(const VerificationChecks& checks);

} // httpsig namespace
